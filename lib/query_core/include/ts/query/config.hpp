/*
Module Name:
- config.hpp

Abstract:
- Immutable configuration for the sentinel loaded from a single TOML file.
- Surfaces typed sections (server, monitor, query console, media player) and the file path.
- Fails fast with EnvError on invalid or missing configuration.
- Applies the documented floors: server timeout >= 3 s, switch wait >= 500 ms,
  monitor interval >= 1 min.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace env
{

    /// Configuration-loading failure. Prefer specific errors over generic runtime_error.
    class EnvError final : public std::runtime_error
    {
    public:
        explicit EnvError(const std::string& msg) noexcept;
    };

    /// Voice server the client is asked to join, and where to park it.
    struct ServerConfig
    {
        std::string address;
        std::string channel; ///< destination channel name, exact match
        std::optional<std::string> password; ///< applied to the destination channel when set
        std::chrono::seconds timeout{ 3 }; ///< connect wait
        std::chrono::milliseconds switch_wait{ 500 }; ///< pause after moving channels
    };

    /// Presence monitoring behaviour.
    struct MonitorConfig
    {
        bool web_enabled = false; ///< consult the web presence backend before connecting
        std::string username; ///< nickname on connect and user looked up by the backend
        std::string backend; ///< backend URL, required when web_enabled
        std::chrono::minutes interval{ 1 }; ///< wait after the backend reports the user online
        std::chrono::milliseconds tick{ 5 }; ///< spacing of steady-state polls
        std::vector<std::chrono::minutes> backoff{ std::chrono::minutes{ 5 }, std::chrono::minutes{ 30 }, std::chrono::minutes{ 60 } };
    };

    /// host/port (and optional password) of a local control interface.
    struct EndpointConfig
    {
        std::string host;
        std::string port;
        std::string password;
    };

    /// Immutable application configuration (single TOML file).
    class Config
    {
    public:
        /// Load from the file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        /// Load from "./config.toml".
        static Config load();

        [[nodiscard]] const std::string& api_key() const noexcept
        {
            return api_key_;
        }
        /// Persistent database ids whose presence drives the player.
        [[nodiscard]] const std::vector<std::int64_t>& monitor_ids() const noexcept
        {
            return monitor_ids_;
        }
        /// Disconnect and stop as soon as a watched id shows up.
        [[nodiscard]] bool need_disconnect() const noexcept
        {
            return need_disconnect_;
        }
        [[nodiscard]] const ServerConfig& server() const noexcept
        {
            return server_;
        }
        [[nodiscard]] const MonitorConfig& monitor() const noexcept
        {
            return monitor_;
        }
        /// ClientQuery console, default localhost:25639.
        [[nodiscard]] const EndpointConfig& query() const noexcept
        {
            return query_;
        }
        /// VLC remote control, default localhost:4212 with password "1".
        [[nodiscard]] const EndpointConfig& player() const noexcept
        {
            return player_;
        }
        /// Absolute path to the loaded config file.
        [[nodiscard]] const std::filesystem::path& path() const noexcept
        {
            return path_;
        }

    private:
        static Config parse_config(const std::filesystem::path& path);

        Config() = default;

        std::filesystem::path path_;
        std::string api_key_;
        std::vector<std::int64_t> monitor_ids_;
        bool need_disconnect_ = false;
        ServerConfig server_;
        MonitorConfig monitor_;
        EndpointConfig query_;
        EndpointConfig player_;
    };

} // namespace env
