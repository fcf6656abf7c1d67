/*
Module Name:
- frame_stream.hpp

Abstract:
- Owns one TCP connection to a line oriented console.
- Reads are bounded: every read waits at most k_read_timeout and a silent peer yields
  std::nullopt ("no data yet") rather than an error.
- A reply is complete once a received chunk is shorter than the buffer or a line starts with
  "error id=".

Why:
- The console answers every command with exactly one status line, so the stream never needs
  request ids: one write followed by delay_read() collects the whole answer.
- Short writes are logged and not retried. Retrying a partially written command could run it
  twice.

Thread-safety: not thread safe. One coroutine at a time, on the executor given at construction.
*/
#pragma once

// C++ Standard Library
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

namespace ts::query
{

    class FrameStream
    {
    public:
        static constexpr std::size_t k_read_buffer_size = 512;
        static constexpr auto k_read_timeout = std::chrono::seconds{ 2 };
        static constexpr auto k_connect_timeout = std::chrono::seconds{ 10 };

        // delay_read() gives up after this many consecutive empty reads.
        static constexpr int k_max_idle_reads = 15;

        /// tag prefixes log lines, e.g. "Session" or "Player".
        explicit FrameStream(boost::asio::any_io_executor executor, std::string tag = "Stream");

        ~FrameStream() noexcept;

        FrameStream(const FrameStream&) = delete;
        FrameStream& operator=(const FrameStream&) = delete;

        /// Resolve and connect under k_connect_timeout. Throws TransportError.
        [[nodiscard]] auto connect(std::string_view host, std::string_view port) -> boost::asio::awaitable<void>;

        /// Write payload once. Pre: payload ends with its line terminator.
        [[nodiscard]] auto write(std::string_view payload) -> boost::asio::awaitable<void>;

        /// Collect one burst of data. std::nullopt when nothing arrived within k_read_timeout.
        [[nodiscard]] auto read() -> boost::asio::awaitable<std::optional<std::string>>;

        /// Read until a status line is seen, skipping empty reads.
        [[nodiscard]] auto delay_read() -> boost::asio::awaitable<std::string>;

        /// write() then delay_read().
        [[nodiscard]] auto round_trip(std::string_view payload) -> boost::asio::awaitable<std::string>;

        /// Cancel, shutdown and close. Idempotent.
        void close() noexcept;

        [[nodiscard]] bool is_open() const noexcept
        {
            return socket_.is_open();
        }

    private:
        // Start the deadline timer; on expiry the pending socket operation is cancelled.
        void arm_deadline(std::chrono::steady_clock::duration timeout);
        void disarm_deadline() noexcept;

        // One bounded read_some. std::nullopt on timeout.
        [[nodiscard]] auto read_chunk() -> boost::asio::awaitable<std::optional<std::size_t>>;

        boost::asio::ip::tcp::socket socket_;
        boost::asio::steady_timer deadline_;
        std::array<char, k_read_buffer_size> buffer_{};

        std::string tag_;
        bool trace_ = false; // echo traffic when TS_TRACE_PROTOCOL is set

        // Generation guards against a stale expiry cancelling a later operation.
        std::uint64_t deadline_generation_ = 0;
        bool deadline_hit_ = false;
    };

} // namespace ts::query
