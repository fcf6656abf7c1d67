// C++ Standard Library
#include <variant>

// Project
#include <ts/query/error.hpp>
#include <ts/utils/attributes.hpp>

// App
#include <app/monitor_state.hpp>

namespace app
{

    namespace
    {
        template<class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template<class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        MonitorState after_connecting(const state::Connecting& current, const Observation& observed)
        {
            if (std::holds_alternative<observation::WhoAmIOk>(observed))
            {
                return state::SteadyMonitoring{};
            }
            if (const auto* failed = std::get_if<observation::WhoAmIFailed>(&observed))
            {
                if (failed->code == ts::query::k_status_not_connected)
                {
                    return state::ResolvingReadiness{ current.attempt };
                }
                return state::Failed{ failed->code };
            }
            return current;
        }

        MonitorState after_resolving(const state::ResolvingReadiness& current,
                                     const Observation& observed,
                                     const BackoffPolicy& policy)
        {
            const auto* resolved = std::get_if<observation::Resolved>(&observed);
            if (!resolved)
            {
                return current;
            }

            const int attempt = current.attempt + 1;
            switch (resolved->outcome)
            {
            case Readiness::not_online:
                return state::SteadyMonitoring{};
            case Readiness::target_detected:
            case Readiness::duplicate_client:
                return state::BackoffWait{ attempt, backoff_delay(attempt, policy), resolved->outcome };
            case Readiness::online:
                return state::BackoffWait{ attempt, policy.online_interval, resolved->outcome };
            }
            TS_UNREACHABLE();
        }
    } // namespace

    std::string_view readiness_name(Readiness readiness) noexcept
    {
        switch (readiness)
        {
        case Readiness::online:
            return "Online";
        case Readiness::target_detected:
            return "TargetDetected";
        case Readiness::duplicate_client:
            return "DuplicateClient";
        case Readiness::not_online:
            return "NotOnline";
        }
        TS_UNREACHABLE();
    }

    std::chrono::seconds backoff_delay(int attempt, const BackoffPolicy& policy) noexcept
    {
        if (attempt <= 1)
        {
            return policy.tiers[0];
        }
        if (attempt == 2)
        {
            return policy.tiers[1];
        }
        return policy.tiers.back();
    }

    MonitorState next_state(const MonitorState& current, const Observation& observed, const BackoffPolicy& policy)
    {
        if (is_terminal(current))
        {
            return current;
        }
        if (std::holds_alternative<observation::Cancelled>(observed))
        {
            return state::Stopped{};
        }

        return std::visit(
            overloaded{
                [&](const state::Connecting& s) -> MonitorState { return after_connecting(s, observed); },
                [&](const state::ResolvingReadiness& s) -> MonitorState {
                    return after_resolving(s, observed, policy);
                },
                [&](const state::BackoffWait& s) -> MonitorState {
                    if (std::holds_alternative<observation::BackoffElapsed>(observed))
                    {
                        return state::Connecting{ s.attempt };
                    }
                    return s;
                },
                [&](const auto& s) -> MonitorState { return s; },
            },
            current);
    }

    bool is_terminal(const MonitorState& current) noexcept
    {
        return std::holds_alternative<state::Stopped>(current) || std::holds_alternative<state::Failed>(current);
    }

    std::string_view state_name(const MonitorState& current) noexcept
    {
        return std::visit(
            overloaded{
                [](const state::Connecting&) -> std::string_view { return "Connecting"; },
                [](const state::ResolvingReadiness&) -> std::string_view { return "ResolvingReadiness"; },
                [](const state::BackoffWait&) -> std::string_view { return "BackoffWait"; },
                [](const state::SteadyMonitoring&) -> std::string_view { return "SteadyMonitoring"; },
                [](const state::Stopped&) -> std::string_view { return "Stopped"; },
                [](const state::Failed&) -> std::string_view { return "Failed"; },
            },
            current);
    }

    PresenceAction decide_presence(bool present, int own_sessions, bool exit_on_detect) noexcept
    {
        if (present && exit_on_detect)
        {
            return { .disconnect = true, .stop = true };
        }
        if (own_sessions > 1)
        {
            return { .disconnect = true, .stop = false };
        }
        return {};
    }

    std::optional<bool> decide_playback(bool present, bool playing) noexcept
    {
        if (playing == present)
        {
            return !present;
        }
        return std::nullopt;
    }

} // namespace app
