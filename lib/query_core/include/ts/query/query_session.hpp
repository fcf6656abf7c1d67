/*
Module Name:
- query_session.hpp

Abstract:
- ClientQuery protocol client built on FrameStream and the codec.
- One method per console command used by the sentinel: auth, whoami, clientlist,
  channellist, serverconnectinfo, connect, clientmove, channeledit, clientdbedit,
  clientvariable, disconnect, quit.
- Exactly one request is in flight at a time. Every write is answered by one status line.

Why:
- Record-returning queries that must succeed go through query_required(), which repeats the
  whole write and read once when a record fails to parse. This absorbs an unrelated
  notification line arriving just ahead of the expected data line. Every other failure
  propagates immediately.
- disconnect() and logout() never throw: the caller is leaving anyway, failures are logged.
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

// Core
#include <ts/query/codec.hpp>
#include <ts/query/frame_stream.hpp>
#include <ts/query/records.hpp>

namespace ts::query
{

    class QuerySession
    {
    public:
        static constexpr auto k_banner_delay = std::chrono::milliseconds{ 10 };

        explicit QuerySession(boost::asio::any_io_executor executor);

        QuerySession(const QuerySession&) = delete;
        QuerySession& operator=(const QuerySession&) = delete;

        /// Connect to the console and swallow its welcome banner.
        [[nodiscard]] auto connect(std::string_view host, std::string_view port) -> boost::asio::awaitable<void>;

        /// auth apikey=<key>. Throws AuthError on a non-zero status.
        [[nodiscard]] auto login(std::string_view api_key) -> boost::asio::awaitable<void>;

        /// Throws StatusError with id k_status_not_connected while not on a server.
        [[nodiscard]] auto who_am_i() -> boost::asio::awaitable<WhoAmI>;

        [[nodiscard]] auto list_clients() -> boost::asio::awaitable<std::vector<Client>>;
        [[nodiscard]] auto list_channels() -> boost::asio::awaitable<std::vector<Channel>>;
        [[nodiscard]] auto server_connect_info() -> boost::asio::awaitable<ConnectInfo>;

        /// Ask the client to connect to a voice server. Completion is observed through who_am_i().
        [[nodiscard]] auto connect_server(std::string_view address, std::string_view nickname)
            -> boost::asio::awaitable<void>;

        /// Move self into the channel.
        [[nodiscard]] auto switch_channel(std::int64_t channel_id) -> boost::asio::awaitable<void>;

        /// Exact name match against channellist, first match wins. DomainError(channel_not_found).
        [[nodiscard]] auto switch_channel_by_name(std::string_view name) -> boost::asio::awaitable<void>;

        [[nodiscard]] auto set_channel_password(std::int64_t channel_id, std::string_view password)
            -> boost::asio::awaitable<void>;

        /// set_channel_password() on the channel reported by who_am_i().
        [[nodiscard]] auto set_current_channel_password(std::string_view password) -> boost::asio::awaitable<void>;

        [[nodiscard]] auto update_client_description(std::int64_t database_id, std::string_view description)
            -> boost::asio::awaitable<void>;

        [[nodiscard]] auto query_client_description(std::int64_t client_id) -> boost::asio::awaitable<ClientVariable>;

        /// Persistent id of this connection: who_am_i().client_id matched against clientlist.
        /// DomainError(database_id_error) when no entry matches.
        [[nodiscard]] auto query_database_id() -> boost::asio::awaitable<std::int64_t>;

        /// True when more than one listed client carries our database id.
        [[nodiscard]] auto check_self_duplicate() -> boost::asio::awaitable<bool>;

        /// Leave the voice server. No-throw, failures are logged.
        [[nodiscard]] auto disconnect() noexcept -> boost::asio::awaitable<void>;

        /// End the console session. No-throw, failures are logged.
        [[nodiscard]] auto logout() noexcept -> boost::asio::awaitable<void>;

        /// Close the socket. Idempotent.
        void close() noexcept;

    private:
        // One write and one read cycle, status checked. Returns the raw reply.
        [[nodiscard]] auto execute(std::string_view payload) -> boost::asio::awaitable<std::string>;

        template<FromRecordRow T>
        [[nodiscard]] auto query_optional(std::string_view payload)
            -> boost::asio::awaitable<std::optional<std::vector<T>>>;

        template<FromRecordRow T>
        [[nodiscard]] auto query_required(std::string_view payload) -> boost::asio::awaitable<std::vector<T>>;

        FrameStream stream_;
        bool request_inflight_ = false;
    };

} // namespace ts::query
