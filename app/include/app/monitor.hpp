/*
Module: monitor.hpp

Purpose:
- Drives QuerySession through the monitor state machine and, once settled, polls presence
  and keeps the media player in the opposite state of the watched clients.

Notes:
- Borrows everything it talks to; main owns the session, the player and the stop signal.
- Every wait races the StopSignal, so a stop request ends the run at the next wait point.
- A non-1794 status from whoami ends the run by rethrowing that StatusError.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Core
#include <ts/query/config.hpp>
#include <ts/query/query_session.hpp>

// App
#include <app/media_controller.hpp>
#include <app/monitor_state.hpp>
#include <app/presence_probe.hpp>
#include <app/stop_signal.hpp>

namespace app
{

    struct MonitorSettings
    {
        std::vector<std::int64_t> watched_ids;
        bool exit_on_detect = false;

        std::string server_address;
        std::string nickname;
        std::string channel;
        std::optional<std::string> channel_password;

        std::chrono::seconds connect_timeout{ 3 };
        std::chrono::milliseconds switch_wait{ 500 };
        std::chrono::milliseconds tick_interval{ 5 };
        BackoffPolicy backoff;

        static MonitorSettings from_config(const env::Config& config);
    };

    class Monitor
    {
    public:
        static constexpr auto k_connect_poll = std::chrono::milliseconds{ 250 };

        /// probe may be null (no web presence check).
        Monitor(MonitorSettings settings,
                ts::query::QuerySession& session,
                MediaController& player,
                StopSignal& stop,
                PresenceProbe* probe = nullptr);

        Monitor(const Monitor&) = delete;
        Monitor& operator=(const Monitor&) = delete;

        /// enter() and, when it settles, monitor_loop() until stopped.
        [[nodiscard]] auto run() -> boost::asio::awaitable<void>;

        /// Entry regime: step the state machine until SteadyMonitoring or a terminal state.
        [[nodiscard]] auto enter() -> boost::asio::awaitable<void>;

        /// Readiness routine. std::nullopt when a stop request interrupted it.
        [[nodiscard]] auto resolve_readiness() -> boost::asio::awaitable<std::optional<Readiness>>;

        /// Steady regime: resolve our database id once, then tick until stopped.
        [[nodiscard]] auto monitor_loop() -> boost::asio::awaitable<void>;

        /// One poll of the steady loop. Returns false when monitoring should stop.
        [[nodiscard]] auto tick(std::int64_t own_database_id) -> boost::asio::awaitable<bool>;

        [[nodiscard]] const MonitorState& state() const noexcept
        {
            return state_;
        }

    private:
        [[nodiscard]] auto step() -> boost::asio::awaitable<Observation>;

        // Poll whoami until connected. False on stop, DomainError(connect_timeout) on timeout.
        [[nodiscard]] auto wait_connected() -> boost::asio::awaitable<bool>;

        [[nodiscard]] bool is_watched(std::int64_t database_id) const;

        void transition(const Observation& observed);

        MonitorSettings settings_;
        ts::query::QuerySession& session_;
        MediaController& player_;
        StopSignal& stop_;
        PresenceProbe* probe_;

        MonitorState state_{ state::Connecting{} };
        std::exception_ptr failure_;
    };

} // namespace app
