/*
Module: monitor_state.hpp

Purpose:
- Pure half of the presence monitor: states, observations and the transition function.
- Entry regime (connect, resolve readiness, back off) and steady regime share one machine.
- Per-tick decisions of the steady loop, also pure.

Notes:
- No I/O here. Monitor performs the effect of a state and feeds back an Observation.
- Stopped and Failed are terminal and absorb every observation.
*/
#pragma once

// C++ Standard Library
#include <array>
#include <chrono>
#include <optional>
#include <string_view>
#include <variant>

namespace app
{

    /// Outcome of the readiness routine.
    enum class Readiness
    {
        online, ///< identity active elsewhere per the presence probe
        target_detected, ///< a watched client is on the server
        duplicate_client, ///< our database id is listed more than once
        not_online, ///< joined the destination channel, ready to monitor
    };

    [[nodiscard]] std::string_view readiness_name(Readiness readiness) noexcept;

    namespace state
    {
        struct Connecting
        {
            int attempt = 0;
            bool operator==(const Connecting&) const = default;
        };

        struct ResolvingReadiness
        {
            int attempt = 0;
            bool operator==(const ResolvingReadiness&) const = default;
        };

        struct BackoffWait
        {
            int attempt = 0;
            std::chrono::seconds remaining{ 0 };
            Readiness reason = Readiness::not_online;
            bool operator==(const BackoffWait&) const = default;
        };

        struct SteadyMonitoring
        {
            bool operator==(const SteadyMonitoring&) const = default;
        };

        struct Stopped
        {
            bool operator==(const Stopped&) const = default;
        };

        struct Failed
        {
            int code = 0; ///< status id reported by the console
            bool operator==(const Failed&) const = default;
        };
    } // namespace state

    using MonitorState = std::variant<state::Connecting,
                                      state::ResolvingReadiness,
                                      state::BackoffWait,
                                      state::SteadyMonitoring,
                                      state::Stopped,
                                      state::Failed>;

    namespace observation
    {
        struct WhoAmIOk
        {
        };

        struct WhoAmIFailed
        {
            int code = 0;
        };

        struct Resolved
        {
            Readiness outcome = Readiness::not_online;
        };

        struct BackoffElapsed
        {
        };

        struct Cancelled
        {
        };
    } // namespace observation

    using Observation = std::variant<observation::WhoAmIOk,
                                     observation::WhoAmIFailed,
                                     observation::Resolved,
                                     observation::BackoffElapsed,
                                     observation::Cancelled>;

    struct BackoffPolicy
    {
        std::array<std::chrono::seconds, 3> tiers{ std::chrono::seconds{ 300 },
                                                   std::chrono::seconds{ 1800 },
                                                   std::chrono::seconds{ 3600 } };
        std::chrono::seconds online_interval{ 60 }; ///< wait after the probe reports online
    };

    /// attempt <= 1 -> first tier, 2 -> second, >= 3 -> last tier.
    [[nodiscard]] std::chrono::seconds backoff_delay(int attempt, const BackoffPolicy& policy) noexcept;

    /// Transition function. Pairs with no defined transition leave the state unchanged.
    [[nodiscard]] MonitorState next_state(const MonitorState& current,
                                          const Observation& observed,
                                          const BackoffPolicy& policy);

    [[nodiscard]] bool is_terminal(const MonitorState& current) noexcept;

    [[nodiscard]] std::string_view state_name(const MonitorState& current) noexcept;

    /// What the steady loop does about presence before looking at the player.
    struct PresenceAction
    {
        bool disconnect = false;
        bool stop = false;
        bool operator==(const PresenceAction&) const = default;
    };

    [[nodiscard]] PresenceAction decide_presence(bool present, int own_sessions, bool exit_on_detect) noexcept;

    /// Target playback state, or std::nullopt when the player is already right.
    /// The player should pause while a watched client is present and play otherwise.
    [[nodiscard]] std::optional<bool> decide_playback(bool present, bool playing) noexcept;

} // namespace app
