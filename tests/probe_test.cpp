// C++ Standard Library
#include <array>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

// Boost.Asio
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/this_coro.hpp>

// GoogleTest
#include <gtest/gtest.h>

// App
#include <app/presence_probe.hpp>

// Project
#include <ts/net/http_client.hpp>
#include <ts/net/url.hpp>
#include <ts/query/error.hpp>

// Test support
#include "support/line_server.hpp"

namespace asio = boost::asio;
using app::scan_presence_table;
using ts::test::LineServer;

namespace
{
    // Plain HTTP backend answering every POST with a fixed page.
    std::string http_page(std::string_view body)
    {
        return "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\nContent-Length: " + std::to_string(body.size())
               + "\r\nConnection: close\r\n\r\n" + std::string{ body };
    }

    class WebPresenceTest : public ::testing::Test
    {
    protected:
        template<typename F>
        void run(F&& coroutine)
        {
            ts::test::run_until_done(io_, std::forward<F>(coroutine));
        }

        asio::io_context io_;
        asio::ssl::context ssl_{ asio::ssl::context::tls_client };
    };
} // namespace

TEST(PresenceTable, SecondCellOnline)
{
    EXPECT_TRUE(scan_presence_table(R"(
<html><body><table>
<thead><tr><th>Name</th><th>Status</th><th>Server</th></tr></thead>
<tbody>
  <tr><td>sentinel</td><td class="state"> <b>Online</b> </td><td>voice.example.org</td></tr>
  <tr><td>other</td><td>offline</td><td>-</td></tr>
</tbody></table></body></html>)"));
}

TEST(PresenceTable, OnlyFirstRowCounts)
{
    EXPECT_FALSE(scan_presence_table(R"(
<table><tbody>
  <tr><td>sentinel</td><td>offline</td><td>-</td></tr>
  <tr><td>sentinel</td><td>online</td><td>-</td></tr>
</tbody></table>)"));
}

TEST(PresenceTable, NeedsMoreThanTwoCells)
{
    EXPECT_FALSE(scan_presence_table("<table><tbody><tr><td>sentinel</td><td>online</td></tr></tbody></table>"));
}

TEST(PresenceTable, UppercaseTagsAndAttributes)
{
    EXPECT_TRUE(scan_presence_table(
        "<TABLE><TBODY class=\"r\"><TR id=\"1\"><TD>a</TD><TD>ONLINE</TD><TD>b</TD></TR></TBODY></TABLE>"));
}

TEST(PresenceTable, MissingTableBodyOrRowIsQueryError)
{
    EXPECT_THROW((void)scan_presence_table(""), ts::query::DomainError);
    EXPECT_THROW((void)scan_presence_table("<p>no results</p>"), ts::query::DomainError);
    EXPECT_THROW((void)scan_presence_table("<table><tbody></tbody></table>"), ts::query::DomainError);
    EXPECT_THROW((void)scan_presence_table("<table><thead><tr><td>a</td><td>online</td><td>b</td></tr></thead></table>"),
                 ts::query::DomainError);

    try
    {
        (void)scan_presence_table("<table><tbody></tbody></table>");
        FAIL() << "expected DomainError";
    }
    catch (const ts::query::DomainError& e)
    {
        EXPECT_EQ(e.code(), ts::query::errc::query_error);
    }
}

TEST(PresenceTable, SimilarTagNamesAreIgnored)
{
    // <track> and <tdx> are not rows or cells.
    EXPECT_THROW((void)scan_presence_table("<tbody><track><tdx>a</tdx><tdx>online</tdx><tdx>b</tdx></track></tbody>"),
                 ts::query::DomainError);
    EXPECT_FALSE(scan_presence_table(
        "<tbody><tr><tdx>a</tdx><tdx>online</tdx><tdx>b</tdx></tr></tbody>"));
}

TEST(PresenceTable, SimilarClosingTagsDoNotEndElements)
{
    // "</track>" inside the row and "</tdx>" inside a cell must not close the row or cell early.
    EXPECT_TRUE(scan_presence_table(
        "<tbody><tr><td><video><track src=\"a\"></track></video>a</td>"
        "<td>online</td><td><tdx>x</tdx>b</td></tr></tbody>"));
    EXPECT_TRUE(scan_presence_table(
        "<tbody><tr><td>a</td><td>online</tdx></td><td>b</td></tr ></tbody>"));
}

TEST(BackendUrl, ParsesSchemePortAndTarget)
{
    const auto url = ts::net::parse_url("https://example.org/users/search?lang=en");
    EXPECT_TRUE(url.is_tls());
    EXPECT_EQ(url.host, "example.org");
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.target(), "/users/search?lang=en");

    const auto plain = ts::net::parse_url("http://127.0.0.1:8080");
    EXPECT_FALSE(plain.is_tls());
    EXPECT_EQ(plain.port, "8080");
    EXPECT_EQ(plain.target(), "/");
}

TEST(BackendUrl, RejectsOtherSchemes)
{
    EXPECT_THROW((void)ts::net::parse_url("ftp://example.org/"), std::invalid_argument);
    EXPECT_THROW((void)ts::net::parse_url("example.org/users"), std::invalid_argument);
    EXPECT_THROW((void)ts::net::parse_url("https:///users"), std::invalid_argument);
}

TEST(BackendForm, EncodesUserSearch)
{
    const std::array<ts::net::form_field, 2> fields{ {
        { "usersuche", "Jane Doe&co" },
        { "username", "" },
    } };
    EXPECT_EQ(ts::net::form_encode(fields), "usersuche=Jane+Doe%26co&username=");
}

TEST_F(WebPresenceTest, OnlineRowOverHttp)
{
    LineServer backend{ io_, "", [](std::string_view line) {
                           return ts::query::detail::starts_with(line, "POST")
                                      ? http_page("<table><tbody><tr><td>sentinel</td><td>online</td><td>x</td></tr></tbody></table>")
                                      : std::string{};
                       } };

    bool online = false;
    run([&]() -> asio::awaitable<void> {
        app::WebPresenceProbe probe{ co_await asio::this_coro::executor, ssl_, "http://127.0.0.1:" + backend.port() + "/",
                                     "sentinel" };
        online = co_await probe.is_online();
    });
    EXPECT_TRUE(online);
    ASSERT_FALSE(backend.received().empty());
    EXPECT_EQ(backend.received().front(), "POST / HTTP/1.1");
}

TEST_F(WebPresenceTest, PageWithoutResultTableEndsTheCheck)
{
    LineServer backend{ io_, "", [](std::string_view line) {
                           return ts::query::detail::starts_with(line, "POST") ? http_page("<p>maintenance</p>")
                                                                               : std::string{};
                       } };

    std::optional<std::error_code> code;
    run([&]() -> asio::awaitable<void> {
        app::WebPresenceProbe probe{ co_await asio::this_coro::executor, ssl_, "http://127.0.0.1:" + backend.port() + "/",
                                     "sentinel" };
        try
        {
            (void)co_await probe.is_online();
        }
        catch (const ts::query::DomainError& e)
        {
            code = e.code();
        }
    });
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, ts::query::errc::query_error);
}

TEST_F(WebPresenceTest, TlsSetupFailureIsReported)
{
    // A plain-text peer on an https URL: the TLS branch (SNI, hostname check, handshake) must throw.
    LineServer backend{ io_, "HTTP/1.1 400 Bad Request\r\n\r\n", [](std::string_view) { return std::string{}; } };

    bool failed = false;
    bool scanned = false;
    run([&]() -> asio::awaitable<void> {
        app::WebPresenceProbe probe{ co_await asio::this_coro::executor, ssl_, "https://127.0.0.1:" + backend.port() + "/",
                                     "sentinel" };
        try
        {
            (void)co_await probe.is_online();
        }
        catch (const ts::query::DomainError&)
        {
            scanned = true;
        }
        catch (const std::exception&)
        {
            failed = true;
        }
    });
    EXPECT_TRUE(failed);
    EXPECT_FALSE(scanned);
}
