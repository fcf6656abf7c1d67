// ClientQuery session: one command, one reply, one status line.

// C++ Standard Library
#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <utility>

// Boost.Asio
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

// GSL
#include <gsl/gsl>

// Core
#include <ts/query/error.hpp>
#include <ts/query/query_session.hpp>

namespace ts::query
{

    using boost::asio::use_awaitable;
    namespace asio = boost::asio;

    namespace
    {
        // "<verb> <arg> <arg>\n\r". Arguments must already be escaped.
        std::string command(std::string_view verb, std::initializer_list<std::string_view> args = {})
        {
            std::string line{ verb };
            for (const auto arg : args)
            {
                line.push_back(' ');
                line.append(arg);
            }
            line.append(k_terminator);
            return line;
        }

        std::string param(std::string_view key, std::string_view raw_value)
        {
            std::string p{ key };
            p.push_back('=');
            p.append(escape(raw_value));
            return p;
        }

        std::string param(std::string_view key, std::int64_t value)
        {
            std::string p{ key };
            p.push_back('=');
            p.append(std::to_string(value));
            return p;
        }
    } // namespace

    QuerySession::QuerySession(asio::any_io_executor executor) :
        stream_{ std::move(executor), "Session" }
    {
    }

    auto QuerySession::connect(std::string_view host, std::string_view port) -> asio::awaitable<void>
    {
        co_await stream_.connect(host, port);

        // Give the banner a moment to arrive so it is not mistaken for the first reply.
        asio::steady_timer settle{ co_await asio::this_coro::executor };
        settle.expires_after(k_banner_delay);
        co_await settle.async_wait(use_awaitable);

        const auto banner = co_await stream_.read();
        if (!banner)
        {
            std::cerr << "[Session] no welcome banner from " << host << ":" << port << '\n';
        }
    }

    auto QuerySession::execute(std::string_view payload) -> asio::awaitable<std::string>
    {
        Expects(!request_inflight_);
        request_inflight_ = true;
        auto release = gsl::finally([this] { request_inflight_ = false; });

        co_return decode_status(co_await stream_.round_trip(payload));
    }

    template<FromRecordRow T>
    auto QuerySession::query_optional(std::string_view payload) -> asio::awaitable<std::optional<std::vector<T>>>
    {
        co_return decode_rows<T>(co_await execute(payload));
    }

    template<FromRecordRow T>
    auto QuerySession::query_required(std::string_view payload) -> asio::awaitable<std::vector<T>>
    {
        std::optional<std::vector<T>> rows;
        bool retry = false;
        try
        {
            rows = co_await query_optional<T>(payload);
        }
        catch (const ProtocolError& e)
        {
            if (e.code() != errc::malformed_record)
            {
                throw;
            }
            std::cerr << "[Session] " << e.what() << ", retrying once: " << trim(payload) << '\n';
            retry = true;
        }

        if (retry)
        {
            rows = co_await query_optional<T>(payload);
        }

        if (!rows)
        {
            throw DomainError(errc::result_not_found, "expected result but none found: " + std::string{ trim(payload) });
        }
        co_return std::move(*rows);
    }

    auto QuerySession::login(std::string_view api_key) -> asio::awaitable<void>
    {
        try
        {
            const auto line = command("auth", { param("apikey", api_key) });
            (void)co_await execute(line);
        }
        catch (const StatusError& e)
        {
            throw AuthError(e.id(), e.message());
        }
    }

    auto QuerySession::who_am_i() -> asio::awaitable<WhoAmI>
    {
        const auto line = command("whoami");
        auto rows = co_await query_required<WhoAmI>(line);
        co_return rows.front();
    }

    auto QuerySession::list_clients() -> asio::awaitable<std::vector<Client>>
    {
        const auto line = command("clientlist");
        co_return co_await query_required<Client>(line);
    }

    auto QuerySession::list_channels() -> asio::awaitable<std::vector<Channel>>
    {
        const auto line = command("channellist");
        co_return co_await query_required<Channel>(line);
    }

    auto QuerySession::server_connect_info() -> asio::awaitable<ConnectInfo>
    {
        const auto line = command("serverconnectinfo");
        auto rows = co_await query_required<ConnectInfo>(line);
        co_return rows.front();
    }

    auto QuerySession::connect_server(std::string_view address, std::string_view nickname) -> asio::awaitable<void>
    {
        const auto line = command("connect", { param("address", address), param("nickname", nickname) });
        (void)co_await execute(line);
    }

    auto QuerySession::switch_channel(std::int64_t channel_id) -> asio::awaitable<void>
    {
        const auto me = co_await who_am_i();
        const auto line = command("clientmove", { param("cid", channel_id), param("clid", me.client_id) });
        (void)co_await execute(line);
    }

    auto QuerySession::switch_channel_by_name(std::string_view name) -> asio::awaitable<void>
    {
        const auto channels = co_await list_channels();
        const auto it = std::find_if(channels.begin(), channels.end(), [name](const Channel& c) { return c.name == name; });
        if (it == channels.end())
        {
            throw DomainError(errc::channel_not_found, "channel not found: " + std::string{ name });
        }
        co_await switch_channel(it->channel_id);
    }

    auto QuerySession::set_channel_password(std::int64_t channel_id, std::string_view password) -> asio::awaitable<void>
    {
        const auto line = command("channeledit", { param("cid", channel_id), param("channel_password", password) });
        (void)co_await execute(line);
    }

    auto QuerySession::set_current_channel_password(std::string_view password) -> asio::awaitable<void>
    {
        const auto me = co_await who_am_i();
        co_await set_channel_password(me.channel_id, password);
    }

    auto QuerySession::update_client_description(std::int64_t database_id, std::string_view description)
        -> asio::awaitable<void>
    {
        const auto line
            = command("clientdbedit", { param("cldbid", database_id), param("client_description", description) });
        (void)co_await execute(line);
    }

    auto QuerySession::query_client_description(std::int64_t client_id) -> asio::awaitable<ClientVariable>
    {
        const auto line = command("clientvariable", { param("clid", client_id), "client_description" });
        auto rows = co_await query_optional<ClientVariable>(line);
        if (!rows)
        {
            throw DomainError(errc::query_error, "no client_description for clid=" + std::to_string(client_id));
        }
        co_return rows->front();
    }

    auto QuerySession::query_database_id() -> asio::awaitable<std::int64_t>
    {
        const auto me = co_await who_am_i();
        const auto clients = co_await list_clients();

        std::int64_t database_id = 0;
        for (const auto& client : clients)
        {
            if (client.client_id == me.client_id)
            {
                database_id = client.database_id;
            }
        }
        if (database_id == 0)
        {
            throw DomainError(errc::database_id_error, "no clientlist entry for clid=" + std::to_string(me.client_id));
        }
        co_return database_id;
    }

    auto QuerySession::check_self_duplicate() -> asio::awaitable<bool>
    {
        const auto database_id = co_await query_database_id();
        const auto clients = co_await list_clients();
        const auto sessions = std::count_if(clients.begin(), clients.end(), [database_id](const Client& c) {
            return c.database_id == database_id;
        });
        co_return sessions > 1;
    }

    auto QuerySession::disconnect() noexcept -> asio::awaitable<void>
    {
        try
        {
            const auto line = command("disconnect");
            (void)co_await execute(line);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[Session] disconnect failed: " << e.what() << '\n';
        }
    }

    auto QuerySession::logout() noexcept -> asio::awaitable<void>
    {
        try
        {
            const auto line = command("quit");
            (void)co_await execute(line);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[Session] quit failed: " << e.what() << '\n';
        }
    }

    void QuerySession::close() noexcept
    {
        stream_.close();
    }

} // namespace ts::query
