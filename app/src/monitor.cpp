// C++ Standard Library
#include <algorithm>
#include <iostream>
#include <utility>

// Project
#include <ts/query/error.hpp>
#include <ts/utils/timer.hpp>

// App
#include <app/monitor.hpp>

namespace app
{

    MonitorSettings MonitorSettings::from_config(const env::Config& config)
    {
        const auto& server = config.server();
        const auto& monitor = config.monitor();

        MonitorSettings settings;
        settings.watched_ids = config.monitor_ids();
        settings.exit_on_detect = config.need_disconnect();
        settings.server_address = server.address;
        settings.nickname = monitor.username;
        settings.channel = server.channel;
        settings.channel_password = server.password;
        settings.connect_timeout = server.timeout;
        settings.switch_wait = server.switch_wait;
        settings.tick_interval = monitor.tick;

        // Missing tiers repeat the last configured one.
        for (std::size_t i = 0; i < settings.backoff.tiers.size() && !monitor.backoff.empty(); ++i)
        {
            const auto& tier = i < monitor.backoff.size() ? monitor.backoff[i] : monitor.backoff.back();
            settings.backoff.tiers[i] = std::chrono::duration_cast<std::chrono::seconds>(tier);
        }
        settings.backoff.online_interval = std::chrono::duration_cast<std::chrono::seconds>(monitor.interval);
        return settings;
    }

    Monitor::Monitor(MonitorSettings settings,
                     ts::query::QuerySession& session,
                     MediaController& player,
                     StopSignal& stop,
                     PresenceProbe* probe) :
        settings_{ std::move(settings) },
        session_{ session },
        player_{ player },
        stop_{ stop },
        probe_{ probe }
    {
    }

    auto Monitor::run() -> boost::asio::awaitable<void>
    {
        co_await enter();
        if (std::holds_alternative<state::SteadyMonitoring>(state_))
        {
            co_await monitor_loop();
            state_ = state::Stopped{};
        }
        std::cout << "[Monitor] stopped\n";
    }

    auto Monitor::enter() -> boost::asio::awaitable<void>
    {
        state_ = state::Connecting{};
        failure_ = nullptr;

        while (!is_terminal(state_) && !std::holds_alternative<state::SteadyMonitoring>(state_))
        {
            const auto observed = co_await step();
            transition(observed);
        }

        if (std::holds_alternative<state::Failed>(state_) && failure_)
        {
            std::rethrow_exception(failure_);
        }
    }

    void Monitor::transition(const Observation& observed)
    {
        auto next = next_state(state_, observed, settings_.backoff);
        if (next.index() != state_.index())
        {
            std::cout << "[Monitor] " << state_name(state_) << " -> " << state_name(next) << '\n';
        }
        state_ = std::move(next);
    }

    auto Monitor::step() -> boost::asio::awaitable<Observation>
    {
        if (stop_.stop_requested())
        {
            co_return observation::Cancelled{};
        }

        if (std::holds_alternative<state::Connecting>(state_))
        {
            try
            {
                (void)co_await session_.who_am_i();
                co_return observation::WhoAmIOk{};
            }
            catch (const ts::query::StatusError& e)
            {
                failure_ = std::current_exception();
                co_return observation::WhoAmIFailed{ e.id() };
            }
        }

        if (std::holds_alternative<state::ResolvingReadiness>(state_))
        {
            const auto outcome = co_await resolve_readiness();
            if (!outcome)
            {
                co_return observation::Cancelled{};
            }
            std::cout << "[Monitor] readiness: " << readiness_name(*outcome) << '\n';
            co_return observation::Resolved{ *outcome };
        }

        const auto& wait = std::get<state::BackoffWait>(state_);
        std::cout << "[Monitor] attempt " << wait.attempt << ", waiting " << wait.remaining.count() << "s ("
                  << readiness_name(wait.reason) << ")\n";
        if (!co_await stop_.wait_for(wait.remaining))
        {
            co_return observation::Cancelled{};
        }
        co_return observation::BackoffElapsed{};
    }

    auto Monitor::resolve_readiness() -> boost::asio::awaitable<std::optional<Readiness>>
    {
        if (probe_ && co_await probe_->is_online())
        {
            co_return Readiness::online;
        }

        std::cout << "[Monitor] connecting to " << settings_.server_address << " as " << settings_.nickname << '\n';
        co_await session_.connect_server(settings_.server_address, settings_.nickname);
        if (!co_await wait_connected())
        {
            co_return std::nullopt;
        }

        if (!probe_ && co_await session_.check_self_duplicate())
        {
            std::cout << "[Monitor] another session uses our identity, leaving\n";
            co_await session_.disconnect();
            co_return Readiness::duplicate_client;
        }

        const auto clients = co_await session_.list_clients();
        const bool target = std::any_of(clients.begin(), clients.end(), [this](const ts::query::Client& c) {
            return is_watched(c.database_id);
        });
        if (target)
        {
            std::cout << "[Monitor] watched client on the server, leaving\n";
            co_await session_.disconnect();
            co_return Readiness::target_detected;
        }

        co_await session_.switch_channel_by_name(settings_.channel);
        if (!co_await stop_.wait_for(settings_.switch_wait))
        {
            co_return std::nullopt;
        }

        if (settings_.channel_password)
        {
            try
            {
                co_await session_.set_current_channel_password(*settings_.channel_password);
            }
            catch (const ts::query::QueryError& e)
            {
                std::cerr << "[Monitor] channel password not applied: " << e.what() << '\n';
            }
        }
        co_return Readiness::not_online;
    }

    auto Monitor::wait_connected() -> boost::asio::awaitable<bool>
    {
        const ts::utils::Timer timer;
        for (;;)
        {
            if (stop_.stop_requested())
            {
                co_return false;
            }

            try
            {
                (void)co_await session_.who_am_i();
                co_return true;
            }
            catch (const ts::query::StatusError& e)
            {
                if (e.id() != ts::query::k_status_not_connected)
                {
                    throw;
                }
            }

            if (timer.expired(settings_.connect_timeout))
            {
                throw ts::query::DomainError(ts::query::errc::connect_timeout,
                                             "not connected to " + settings_.server_address + " after "
                                                 + std::to_string(settings_.connect_timeout.count()) + "s");
            }
            if (!co_await stop_.wait_for(k_connect_poll))
            {
                co_return false;
            }
        }
    }

    auto Monitor::monitor_loop() -> boost::asio::awaitable<void>
    {
        const auto own_database_id = co_await session_.query_database_id();
        std::cout << "[Monitor] monitoring as cldbid=" << own_database_id << '\n';

        while (!stop_.stop_requested())
        {
            if (!co_await tick(own_database_id))
            {
                break;
            }
            if (!co_await stop_.wait_for(settings_.tick_interval))
            {
                break;
            }
        }
    }

    auto Monitor::tick(std::int64_t own_database_id) -> boost::asio::awaitable<bool>
    {
        const auto clients = co_await session_.list_clients();

        bool present = false;
        int own_sessions = 0;
        for (const auto& client : clients)
        {
            present = present || is_watched(client.database_id);
            if (client.database_id == own_database_id)
            {
                ++own_sessions;
            }
        }

        const auto action = decide_presence(present, own_sessions, settings_.exit_on_detect);
        if (action.disconnect)
        {
            std::cout << "[Monitor] " << (action.stop ? "watched client detected" : "duplicate session")
                      << ", disconnecting\n";
            co_await session_.disconnect();
        }
        if (action.stop)
        {
            co_return false;
        }

        const bool playing = co_await player_.is_playing();
        if (const auto target = decide_playback(present, playing))
        {
            std::cout << "[Monitor] Toggle to " << (*target ? "play" : "pause") << '\n';
            if (*target)
            {
                co_await player_.play();
            }
            else
            {
                co_await player_.pause();
            }
        }
        co_return true;
    }

    bool Monitor::is_watched(std::int64_t database_id) const
    {
        const auto& ids = settings_.watched_ids;
        return std::find(ids.begin(), ids.end(), database_id) != ids.end();
    }

} // namespace app
