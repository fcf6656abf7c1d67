/*
Module Name:
- http_client.hpp

Abstract:
- Single-shot HTTP/1.1 client over Boost.Beast for form posts.
- Plain http and https (TLS with SNI and peer verification) share one request path.
- Every phase runs under its own deadline so a stalled backend cannot hang the caller.
- Non-2xx responses throw std::runtime_error naming host, target and status.
*/
#pragma once

// C++ standard library
#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

// Project
#include <ts/net/url.hpp>

namespace ts::net {

// HTTP header and form field types
using http_header = std::pair<std::string_view, std::string_view>;
using http_headers = std::span<const http_header>;
using form_field = std::pair<std::string_view, std::string_view>;

// HTTP constants
inline constexpr int k_http_version = 11;
inline constexpr auto k_tcp_connect_timeout = std::chrono::seconds{30};
inline constexpr auto k_handshake_timeout = std::chrono::seconds{10};
inline constexpr auto k_http_write_timeout = std::chrono::seconds{10};
inline constexpr auto k_http_read_timeout = std::chrono::seconds{30};

/// application/x-www-form-urlencoded body: RFC 3986 unreserved bytes kept, space as '+'.
[[nodiscard]] std::string form_encode(std::span<const form_field> fields);

class HttpClient
{
public:
    HttpClient(boost::asio::any_io_executor executor, boost::asio::ssl::context& ssl_context) noexcept;

    /// POST an urlencoded form and return the response body.
    [[nodiscard]]
    boost::asio::awaitable<std::string>
    post_form(const Url& url, std::span<const form_field> fields, http_headers headers = {});

private:
    [[nodiscard]]
    boost::asio::awaitable<std::string>
    perform(const Url& url, std::string body, std::string_view content_type, http_headers headers);

    boost::asio::any_io_executor executor_;
    boost::asio::ssl::context* ssl_context_; // Expects non-null (checked in ctor)
};

} // namespace ts::net
