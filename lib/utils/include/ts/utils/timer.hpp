/*
Module Name:
- timer.hpp

Abstract:
- Monotonic stopwatch built on std::chrono::steady_clock.
- Used to bound polling loops (connect waits) independently of how long each poll takes.
- Uses a GSL postcondition to document the monotonic expectation.
*/
#pragma once

// C++ standard library
#include <chrono>
#include <concepts>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace ts::utils
{

    // D must be a std::chrono::duration (cv/ref-qualified types are accepted)
    template<class D>
    concept ChronoDuration = requires {
        typename std::remove_cvref_t<D>::rep;
        typename std::remove_cvref_t<D>::period;
    } && std::same_as<std::remove_cvref_t<D>, std::chrono::duration<typename std::remove_cvref_t<D>::rep, typename std::remove_cvref_t<D>::period>>;

    class Timer
    {
    public:
        using clock = std::chrono::steady_clock;
        static_assert(clock::is_steady, "Timer requires a steady clock");

        Timer() noexcept = default;

        [[nodiscard]] auto elapsed() const noexcept -> clock::duration
        {
            const auto d = clock::now() - start_;
            Ensures(d >= clock::duration::zero()); // relies on monotonic clock
            return d;
        }

        // True once at least `budget` has passed since construction.
        template<ChronoDuration D>
        [[nodiscard]] bool expired(D budget) const noexcept
        {
            return elapsed() >= budget;
        }

    private:
        clock::time_point start_ = clock::now(); // initialised on construction
    };

} // namespace ts::utils
