/*
Module: media_controller.hpp

Purpose:
- Playback control the monitor drives from presence: query, play, pause.
- VlcController speaks VLC's rc/telnet interface ("status", "play", "pause").

Notes:
- The interface is kept abstract so the monitor can be exercised without a player.
- A status reply carries "( state <token> )"; only "playing" counts as playing.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

// Core
#include <ts/query/frame_stream.hpp>

namespace app
{

    class MediaController
    {
    public:
        virtual ~MediaController() = default;

        [[nodiscard]] virtual auto is_playing() -> boost::asio::awaitable<bool> = 0;
        [[nodiscard]] virtual auto play() -> boost::asio::awaitable<void> = 0;
        [[nodiscard]] virtual auto pause() -> boost::asio::awaitable<void> = 0;
    };

    /// Extract the token of "( state <token> )". std::nullopt when absent.
    [[nodiscard]] std::optional<std::string> parse_vlc_state(std::string_view reply);

    class VlcController final : public MediaController
    {
    public:
        // Attempts to find the state line before giving up on a status reply.
        static constexpr int k_status_reads = 3;

        explicit VlcController(boost::asio::any_io_executor executor);

        /// Connect and answer the password prompt when the banner asks for one.
        [[nodiscard]] auto connect(std::string_view host, std::string_view port, std::string_view password)
            -> boost::asio::awaitable<void>;

        /// Throws DomainError(query_error) when the reply has no state line.
        [[nodiscard]] auto is_playing() -> boost::asio::awaitable<bool> override;
        [[nodiscard]] auto play() -> boost::asio::awaitable<void> override;
        [[nodiscard]] auto pause() -> boost::asio::awaitable<void> override;

        void close() noexcept;

    private:
        [[nodiscard]] auto send(std::string_view command) -> boost::asio::awaitable<void>;

        ts::query::FrameStream stream_;
    };

} // namespace app
