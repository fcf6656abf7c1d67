// VLC rc interface: plain lines in, free-form text plus a "> " prompt out.

// C++ Standard Library
#include <iostream>
#include <utility>

// Core
#include <ts/query/codec.hpp>
#include <ts/query/error.hpp>

// App
#include <app/media_controller.hpp>

namespace app
{

    namespace
    {
        constexpr std::string_view k_state_marker{ "( state " };
        constexpr std::string_view k_playing{ "playing" };
    } // namespace

    std::optional<std::string> parse_vlc_state(std::string_view reply)
    {
        const auto pos = reply.find(k_state_marker);
        if (pos == std::string_view::npos)
        {
            return std::nullopt;
        }
        auto rest = reply.substr(pos + k_state_marker.size());
        const auto end = rest.find_first_of(" )\r\n");
        if (end == std::string_view::npos)
        {
            return std::nullopt; // token not terminated yet
        }
        auto token = rest.substr(0, end);
        if (token.empty())
        {
            return std::nullopt;
        }
        return std::string{ token };
    }

    VlcController::VlcController(boost::asio::any_io_executor executor) :
        stream_{ std::move(executor), "Player" }
    {
    }

    auto VlcController::connect(std::string_view host, std::string_view port, std::string_view password)
        -> boost::asio::awaitable<void>
    {
        co_await stream_.connect(host, port);

        const auto banner = co_await stream_.read();
        if (banner && banner->find("Password") != std::string::npos)
        {
            std::string line{ password };
            line.push_back('\n');
            co_await stream_.write(line);

            const auto greeting = co_await stream_.read();
            if (greeting && greeting->find("Wrong password") != std::string::npos)
            {
                throw ts::query::DomainError(ts::query::errc::query_error, "VLC rejected the password");
            }
        }
        else if (!banner)
        {
            std::cerr << "[Player] no banner from " << host << ":" << port << '\n';
        }
    }

    auto VlcController::send(std::string_view command) -> boost::asio::awaitable<void>
    {
        std::string line{ command };
        line.push_back('\n');
        co_await stream_.write(line);
    }

    auto VlcController::is_playing() -> boost::asio::awaitable<bool>
    {
        co_await send("status");

        std::string reply;
        for (int attempt = 0; attempt < k_status_reads; ++attempt)
        {
            auto chunk = co_await stream_.read();
            if (chunk)
            {
                reply += *chunk;
            }
            if (const auto state = parse_vlc_state(reply))
            {
                co_return *state == k_playing;
            }
        }
        throw ts::query::DomainError(ts::query::errc::query_error,
                                     "no state in VLC status reply: " + std::string{ ts::query::trim(reply) });
    }

    auto VlcController::play() -> boost::asio::awaitable<void>
    {
        co_await send("play");
        // Drain the prompt so it is not mixed into the next status reply.
        (void)co_await stream_.read();
    }

    auto VlcController::pause() -> boost::asio::awaitable<void>
    {
        co_await send("pause");
        (void)co_await stream_.read();
    }

    void VlcController::close() noexcept
    {
        stream_.close();
    }

} // namespace app
