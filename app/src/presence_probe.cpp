// C++ Standard Library
#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <optional>
#include <utility>

// Core
#include <ts/query/codec.hpp>
#include <ts/query/error.hpp>

// App
#include <app/presence_probe.hpp>

namespace app
{

    namespace
    {
        char ascii_lower(char c) noexcept
        {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        // A tag name ends at '>', '/' or whitespace; "<track" is not "<tr".
        bool is_name_end(std::string_view html, std::size_t pos) noexcept
        {
            return pos < html.size()
                   && (html[pos] == '>' || html[pos] == '/' || std::isspace(static_cast<unsigned char>(html[pos])) != 0);
        }

        // Case-insensitive search for an opening tag ("<td" followed by '>' or whitespace).
        std::size_t find_tag(std::string_view html, std::string_view name, std::size_t from)
        {
            while (from < html.size())
            {
                const auto lt = html.find('<', from);
                if (lt == std::string_view::npos || lt + 1 + name.size() > html.size())
                {
                    return std::string_view::npos;
                }
                const auto candidate = html.substr(lt + 1, name.size());
                const bool same = std::equal(candidate.begin(), candidate.end(), name.begin(),
                                             [](char a, char b) { return ascii_lower(a) == b; });
                if (same && is_name_end(html, lt + 1 + name.size()))
                {
                    return lt;
                }
                from = lt + 1;
            }
            return std::string_view::npos;
        }

        // Span between the end of the opening tag at `open` and the matching "</name>".
        std::optional<std::string_view> element_body(std::string_view html, std::string_view name, std::size_t open)
        {
            const auto start = html.find('>', open);
            if (start == std::string_view::npos)
            {
                return std::nullopt;
            }
            const auto content = html.substr(start + 1);

            std::string closing{ "</" };
            closing.append(name);
            auto lowered = std::string{ content };
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), ascii_lower);
            for (auto end = lowered.find(closing); end != std::string::npos; end = lowered.find(closing, end + 1))
            {
                if (is_name_end(lowered, end + closing.size()))
                {
                    return content.substr(0, end);
                }
            }
            return content;
        }

        std::string strip_tags(std::string_view html)
        {
            std::string text;
            bool in_tag = false;
            for (char c : html)
            {
                if (c == '<')
                {
                    in_tag = true;
                }
                else if (c == '>')
                {
                    in_tag = false;
                }
                else if (!in_tag)
                {
                    text.push_back(ascii_lower(c));
                }
            }
            return text;
        }
    } // namespace

    bool scan_presence_table(std::string_view html)
    {
        const auto tbody_at = find_tag(html, "tbody", 0);
        const auto tbody = tbody_at == std::string_view::npos ? std::nullopt : element_body(html, "tbody", tbody_at);
        if (!tbody)
        {
            throw ts::query::DomainError(ts::query::errc::query_error, "presence page has no result table");
        }

        const auto tr_at = find_tag(*tbody, "tr", 0);
        const auto row = tr_at == std::string_view::npos ? std::nullopt : element_body(*tbody, "tr", tr_at);
        if (!row)
        {
            throw ts::query::DomainError(ts::query::errc::query_error, "presence table has no result row");
        }

        std::array<std::string, 2> cells;
        std::size_t count = 0;
        for (auto pos = find_tag(*row, "td", 0); pos != std::string_view::npos; pos = find_tag(*row, "td", pos + 1))
        {
            if (count < cells.size())
            {
                if (const auto body = element_body(*row, "td", pos))
                {
                    cells[count] = strip_tags(*body);
                }
            }
            ++count;
        }
        return count > 2 && ts::query::trim(cells[1]) == "online";
    }

    WebPresenceProbe::WebPresenceProbe(boost::asio::any_io_executor executor,
                                       boost::asio::ssl::context& ssl_context,
                                       std::string_view backend,
                                       std::string username) :
        http_{ std::move(executor), ssl_context },
        backend_{ ts::net::parse_url(backend) },
        username_{ std::move(username) }
    {
    }

    auto WebPresenceProbe::is_online() -> boost::asio::awaitable<bool>
    {
        const std::array<ts::net::form_field, 2> fields{ {
            { "usersuche", username_ },
            { "username", "" },
        } };
        const auto html = co_await http_.post_form(backend_, fields);
        const bool online = scan_presence_table(html);
        std::cout << "[Probe] " << username_ << (online ? " is online" : " is not online") << '\n';
        co_return online;
    }

} // namespace app
