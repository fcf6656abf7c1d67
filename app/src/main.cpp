/*
Module: main.cpp

Purpose:
- Entry point: load configuration, connect the query console and the player,
  then hand control to the Monitor until it stops.

Notes:
- Config path is argv[1], else ./config.toml (see env::Config). Fails fast with EnvError.
- Everything runs on one io_context and one thread.
- First SIGINT/SIGTERM requests a graceful stop; a second one exits with 137 immediately.
*/

// C++ Standard Library
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

// Core
#include <ts/query/config.hpp>
#include <ts/query/query_session.hpp>

// App
#include <app/media_controller.hpp>
#include <app/monitor.hpp>
#include <app/presence_probe.hpp>
#include <app/stop_signal.hpp>

namespace
{
    constexpr int k_forced_exit_status = 137;

    boost::asio::awaitable<void> watch_signals(boost::asio::signal_set& signals, app::StopSignal& stop)
    {
        int received = 0;
        for (;;)
        {
            boost::system::error_code ec;
            const int signal = co_await signals.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
            {
                co_return; // cancelled on shutdown
            }
            if (++received > 1)
            {
                std::cerr << "[Main] second signal, exiting now\n";
                std::_Exit(k_forced_exit_status);
            }
            std::cout << "[Main] signal " << signal << ", stopping\n";
            stop.request_stop();
        }
    }

    boost::asio::awaitable<void> run_sentinel(const env::Config& cfg, app::StopSignal& stop)
    {
        const auto executor = co_await boost::asio::this_coro::executor;

        ts::query::QuerySession session{ executor };
        co_await session.connect(cfg.query().host, cfg.query().port);
        co_await session.login(cfg.api_key());
        std::cout << "[Main] logged in to " << cfg.query().host << ":" << cfg.query().port << '\n';

        app::VlcController player{ executor };
        co_await player.connect(cfg.player().host, cfg.player().port, cfg.player().password);

        boost::asio::ssl::context ssl_ctx{ boost::asio::ssl::context::tlsv12_client };
        ssl_ctx.set_default_verify_paths();

        std::unique_ptr<app::PresenceProbe> probe;
        if (cfg.monitor().web_enabled)
        {
            probe = std::make_unique<app::WebPresenceProbe>(executor, ssl_ctx, cfg.monitor().backend,
                                                            cfg.monitor().username);
        }

        app::Monitor monitor{ app::MonitorSettings::from_config(cfg), session, player, stop, probe.get() };
        co_await monitor.run();

        co_await session.logout();
        player.close();
        session.close();
    }
} // namespace

int main(int argc, char* argv[])
{
    try
    {
        // 1) Load immutable configuration.
        const auto cfg = argc > 1 ? env::Config::load_file(argv[1]) : env::Config::load();

        // 2) One context for the monitor and the signal watcher.
        boost::asio::io_context io;
        app::StopSignal stop{ io.get_executor() };

        boost::asio::signal_set signals{ io, SIGINT, SIGTERM };
        boost::asio::co_spawn(io, watch_signals(signals, stop), boost::asio::detached);

        // 3) Run until the monitor finishes, then release the signal watcher.
        std::exception_ptr failure;
        boost::asio::co_spawn(io, run_sentinel(cfg, stop), [&](std::exception_ptr e) {
            failure = e;
            signals.cancel();
        });
        io.run();

        if (failure)
        {
            std::rethrow_exception(failure);
        }
    }
    catch (const env::EnvError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
