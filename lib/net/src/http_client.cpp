// C++ standard library
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

// Boost.Asio
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream_base.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// GSL
#include <gsl/gsl>

// Project
#include <ts/net/http_client.hpp>

namespace ts::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

namespace {

    // Build an error message with host, target and status code.
    std::string make_error_msg(std::string_view host, std::string_view target, int status)
    {
        std::string msg;
        msg.reserve(host.size() + target.size() + 32);
        msg.append(host).append(target).append(" returned ").append(std::to_string(status));
        return msg;
    }

    bool is_unreserved(unsigned char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-'
            || c == '.' || c == '_' || c == '~';
    }

    void append_encoded(std::string& out, std::string_view s)
    {
        static constexpr char hex[] = "0123456789ABCDEF";
        for (const char ch : s) {
            const auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c)) {
                out.push_back(ch);
            } else if (c == ' ') {
                out.push_back('+');
            } else {
                out.push_back('%');
                out.push_back(hex[c >> 4]);
                out.push_back(hex[c & 0x0F]);
            }
        }
    }

    // Write the request and read the full response on an established stream.
    template <typename Stream>
    asio::awaitable<http::response<http::string_body>>
    exchange(Stream& stream, beast::flat_buffer& buffer, const http::request<http::string_body>& req)
    {
        beast::get_lowest_layer(stream).expires_after(k_http_write_timeout);
        co_await http::async_write(stream, req, asio::use_awaitable);

        http::response<http::string_body> res;
        beast::get_lowest_layer(stream).expires_after(k_http_read_timeout);
        co_await http::async_read(stream, buffer, res, asio::use_awaitable);
        beast::get_lowest_layer(stream).expires_never();
        co_return res;
    }

} // namespace

std::string form_encode(std::span<const form_field> fields)
{
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty())
            body.push_back('&');
        append_encoded(body, key);
        body.push_back('=');
        append_encoded(body, value);
    }
    return body;
}

HttpClient::HttpClient(asio::any_io_executor executor, asio::ssl::context& ssl_context) noexcept
    : executor_{std::move(executor)}
    , ssl_context_{&ssl_context}
{
    Expects(ssl_context_ != nullptr);
}

asio::awaitable<std::string>
HttpClient::post_form(const Url& url, std::span<const form_field> fields, http_headers headers)
{
    co_return co_await perform(url, form_encode(fields), "application/x-www-form-urlencoded", headers);
}

asio::awaitable<std::string>
HttpClient::perform(const Url& url, std::string body, std::string_view content_type, http_headers headers)
{
    // Resolve DNS
    asio::ip::tcp::resolver resolver{executor_};
    auto endpoints = co_await resolver.async_resolve(url.host, url.port, asio::use_awaitable);

    // Establish TCP connection
    beast::tcp_stream tcp{executor_};
    tcp.expires_after(k_tcp_connect_timeout);
    co_await tcp.async_connect(endpoints, asio::use_awaitable);
    tcp.socket().set_option(asio::ip::tcp::no_delay{true});

    // Build request
    const auto target = url.target();
    http::request<http::string_body> req{http::verb::post, target, k_http_version};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, content_type);
    req.body() = std::move(body);
    req.prepare_payload();
    for (auto& h : headers)
        req.set(h.first, h.second);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    if (url.is_tls()) {
        beast::ssl_stream<beast::tcp_stream> ssl{std::move(tcp), *ssl_context_};
        // SNI requires NUL-terminated host
        if (!::SSL_set_tlsext_host_name(ssl.native_handle(), url.host.c_str())) {
            throw std::system_error{static_cast<int>(::ERR_get_error()),
                                    asio::error::get_ssl_category(), "SNI failure"};
        }
        // Hostname verification against the certificate
        if (::SSL_set1_host(ssl.native_handle(), url.host.c_str()) != 1) {
            throw std::system_error{static_cast<int>(::ERR_get_error()),
                                    asio::error::get_ssl_category(), "hostname verification setup failed"};
        }
        ssl.set_verify_mode(asio::ssl::verify_peer);

        beast::get_lowest_layer(ssl).expires_after(k_handshake_timeout);
        co_await ssl.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);

        res = co_await exchange(ssl, buffer, req);

        // Peers often drop the connection without close_notify; that is not a failure here.
        beast::error_code ec;
        beast::get_lowest_layer(ssl).socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    } else {
        res = co_await exchange(tcp, buffer, req);

        beast::error_code ec;
        tcp.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    }

    const int status = res.result_int();
    if (status < 200 || status >= 300) {
        throw std::runtime_error(make_error_msg(url.host, target, status));
    }
    co_return std::move(res.body());
}

} // namespace ts::net
