/*
Module: stop_signal.hpp

Purpose:
- One-shot cancellation token threaded into every wait of the monitor.
- request_stop() is delivered by the signal watcher; waits observe it immediately.

Notes:
- Single threaded: the watcher and the monitor run on the same io_context, so no locking.
- wait_for() races its own timer against the stop request and reports which one won.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <vector>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace app
{

    class StopSignal
    {
    public:
        explicit StopSignal(boost::asio::any_io_executor executor) noexcept;

        StopSignal(const StopSignal&) = delete;
        StopSignal& operator=(const StopSignal&) = delete;

        /// Latch the stop request and wake every pending wait. Idempotent.
        void request_stop() noexcept;

        [[nodiscard]] bool stop_requested() const noexcept
        {
            return stop_requested_;
        }

        /// Sleep for `duration`. Returns false when stop was requested before or during the wait.
        [[nodiscard]] auto wait_for(std::chrono::steady_clock::duration duration) -> boost::asio::awaitable<bool>;

    private:
        boost::asio::any_io_executor executor_;
        bool stop_requested_ = false;
        std::vector<boost::asio::steady_timer*> waiters_;
    };

} // namespace app
