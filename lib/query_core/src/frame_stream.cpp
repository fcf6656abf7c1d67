// Bounded TCP line stream used by the console session and the media player control.

// C++ Standard Library
#include <cstdlib>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// GSL
#include <gsl/gsl>

// Core
#include <ts/query/codec.hpp>
#include <ts/query/error.hpp>
#include <ts/query/frame_stream.hpp>

namespace ts::query
{

    using boost::asio::use_awaitable;
    using error_code = boost::system::error_code;
    namespace asio = boost::asio;

    FrameStream::FrameStream(asio::any_io_executor executor, std::string tag) :
        socket_{ executor }, deadline_{ executor }, tag_{ std::move(tag) }, trace_{ std::getenv("TS_TRACE_PROTOCOL") != nullptr }
    {
    }

    FrameStream::~FrameStream() noexcept
    {
        close();
    }

    void FrameStream::arm_deadline(std::chrono::steady_clock::duration timeout)
    {
        deadline_hit_ = false;
        const auto generation = ++deadline_generation_;
        deadline_.expires_after(timeout);
        deadline_.async_wait([this, generation](const error_code& ec) {
            // Aborted waits must not touch *this: the stream may already be gone.
            if (!ec && generation == deadline_generation_)
            {
                deadline_hit_ = true;
                error_code ignored;
                socket_.cancel(ignored);
            }
        });
    }

    void FrameStream::disarm_deadline() noexcept
    {
        // An expiry already queued for this generation becomes a no-op.
        ++deadline_generation_;
        deadline_.cancel();
    }

    auto FrameStream::connect(std::string_view host, std::string_view port) -> asio::awaitable<void>
    {
        asio::ip::tcp::resolver resolver{ socket_.get_executor() };

        error_code ec;
        const auto endpoints = co_await resolver.async_resolve(host, port, asio::redirect_error(use_awaitable, ec));
        if (ec)
        {
            throw TransportError(errc::transport_failure,
                                 "resolve " + std::string{ host } + ":" + std::string{ port } + " failed: " + ec.message());
        }

        arm_deadline(k_connect_timeout);
        co_await asio::async_connect(socket_, endpoints, asio::redirect_error(use_awaitable, ec));
        disarm_deadline();
        if (ec)
        {
            const auto reason = deadline_hit_ ? std::string{ "timed out" } : ec.message();
            close();
            throw TransportError(errc::transport_failure,
                                 "connect " + std::string{ host } + ":" + std::string{ port } + " failed: " + reason);
        }

        // Console round trips are tiny and latency bound.
        socket_.set_option(asio::ip::tcp::no_delay(true), ec);
        socket_.set_option(asio::socket_base::keep_alive(true), ec);
    }

    auto FrameStream::write(std::string_view payload) -> asio::awaitable<void>
    {
        Expects(!payload.empty() && (payload.back() == '\n' || payload.back() == '\r'));

        if (trace_)
        {
            std::cout << "[" << tag_ << "] >> " << trim(payload) << '\n';
        }

        error_code ec;
        const std::size_t written
            = co_await socket_.async_write_some(asio::buffer(payload.data(), payload.size()),
                                                asio::redirect_error(use_awaitable, ec));
        if (ec)
        {
            throw TransportError(errc::transport_failure, "write failed: " + ec.message());
        }
        if (written != payload.size())
        {
            std::cerr << "[" << tag_ << "] payload size mismatch, expected " << payload.size() << " but "
                      << written << " written: " << trim(payload) << '\n';
        }
    }

    auto FrameStream::read_chunk() -> asio::awaitable<std::optional<std::size_t>>
    {
        arm_deadline(k_read_timeout);

        error_code ec;
        const std::size_t n
            = co_await socket_.async_read_some(asio::buffer(buffer_), asio::redirect_error(use_awaitable, ec));
        disarm_deadline();

        if (ec == asio::error::operation_aborted && deadline_hit_)
        {
            co_return std::nullopt;
        }
        if (ec)
        {
            throw TransportError(errc::transport_failure, "read failed: " + ec.message());
        }
        co_return n;
    }

    auto FrameStream::read() -> asio::awaitable<std::optional<std::string>>
    {
        std::string content;
        for (;;)
        {
            const auto n = co_await read_chunk();
            if (!n)
            {
                // Keep what already arrived; only an empty burst means "no data yet".
                if (content.empty())
                {
                    co_return std::nullopt;
                }
                break;
            }

            content.append(buffer_.data(), *n);
            if (*n < k_read_buffer_size || has_status_line(content))
            {
                break;
            }
        }

        if (trace_)
        {
            std::cout << "[" << tag_ << "] << " << trim(content) << '\n';
        }
        co_return content;
    }

    auto FrameStream::delay_read() -> asio::awaitable<std::string>
    {
        std::string content;
        int idle = 0;
        for (;;)
        {
            auto chunk = co_await read();
            if (!chunk)
            {
                if (++idle >= k_max_idle_reads)
                {
                    throw TransportError(errc::reply_timeout, "no status line after " + std::to_string(idle) + " empty reads");
                }
                continue;
            }

            idle = 0;
            content += *chunk;
            if (has_status_line(content))
            {
                co_return content;
            }
        }
    }

    auto FrameStream::round_trip(std::string_view payload) -> asio::awaitable<std::string>
    {
        co_await write(payload);
        co_return co_await delay_read();
    }

    void FrameStream::close() noexcept
    {
        disarm_deadline();
        error_code ec;
        if (!socket_.is_open())
        {
            return;
        }
        // cancel -> shutdown -> close
        socket_.cancel(ec);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

} // namespace ts::query
