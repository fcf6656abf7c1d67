/*
Module: presence_probe.hpp

Purpose:
- Optional out-of-band check whether our identity is already online elsewhere.
- WebPresenceProbe posts a user search form and reads the first result row.

Notes:
- The backend answers with HTML. Only the first <tr> of the first <tbody> is inspected;
  a row with more than two cells whose second cell reads "online" means online.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <string_view>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

// Project
#include <ts/net/http_client.hpp>
#include <ts/net/url.hpp>

namespace app
{

    class PresenceProbe
    {
    public:
        virtual ~PresenceProbe() = default;

        [[nodiscard]] virtual auto is_online() -> boost::asio::awaitable<bool> = 0;
    };

    /// True when the first result row of the first table body has more than two cells and the
    /// second one reads "online". Throws DomainError{query_error} when the page has no table body or no row.
    [[nodiscard]] bool scan_presence_table(std::string_view html);

    class WebPresenceProbe final : public PresenceProbe
    {
    public:
        /// Throws std::invalid_argument when backend is not an http(s) URL.
        WebPresenceProbe(boost::asio::any_io_executor executor,
                         boost::asio::ssl::context& ssl_context,
                         std::string_view backend,
                         std::string username);

        [[nodiscard]] auto is_online() -> boost::asio::awaitable<bool> override;

    private:
        ts::net::HttpClient http_;
        ts::net::Url backend_;
        std::string username_;
    };

} // namespace app
