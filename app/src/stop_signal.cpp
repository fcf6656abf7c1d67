// C++ Standard Library
#include <algorithm>
#include <utility>

// Boost.Asio
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.System
#include <boost/system/error_code.hpp>

// GSL
#include <gsl/gsl>

// App
#include <app/stop_signal.hpp>

namespace app
{

    StopSignal::StopSignal(boost::asio::any_io_executor executor) noexcept :
        executor_{ std::move(executor) }
    {
    }

    void StopSignal::request_stop() noexcept
    {
        if (stop_requested_)
        {
            return;
        }
        stop_requested_ = true;
        for (auto* timer : waiters_)
        {
            timer->cancel();
        }
    }

    auto StopSignal::wait_for(std::chrono::steady_clock::duration duration) -> boost::asio::awaitable<bool>
    {
        if (stop_requested_)
        {
            co_return false;
        }

        boost::asio::steady_timer timer{ executor_ };
        timer.expires_after(duration);

        waiters_.push_back(&timer);
        auto deregister = gsl::finally([this, &timer] {
            waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), &timer), waiters_.end());
        });

        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        co_return !stop_requested_;
    }

} // namespace app
