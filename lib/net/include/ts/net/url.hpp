/*
Module Name:
- url.hpp

Abstract:
- Minimal absolute URL parsing for the HTTP client.
- Only http and https are accepted; the port defaults from the scheme.
- Query is stored with a leading '?' so target() can concatenate cheaply.
*/
#pragma once

// C++ Standard Library
#include <stdexcept>
#include <string>
#include <string_view>

namespace ts::net
{

    struct Url
    {
        std::string scheme;
        std::string host;
        std::string port;
        std::string path;
        std::string query; // includes leading '?' when present

        [[nodiscard]] bool is_tls() const noexcept
        {
            return scheme == "https";
        }

        [[nodiscard]] std::string target() const
        {
            std::string out = path.empty() ? std::string{ "/" } : path;
            out += query; // query already has leading '?'
            return out;
        }
    };

    /// Parse "scheme://host[:port]/path?query". Throws std::invalid_argument.
    inline Url parse_url(std::string_view s)
    {
        Url u;

        const auto pos = s.find("://");
        if (pos == std::string_view::npos)
        {
            throw std::invalid_argument("URL has no scheme: " + std::string{ s });
        }
        u.scheme.assign(s.substr(0, pos));
        s.remove_prefix(pos + 3);
        if (u.scheme != "http" && u.scheme != "https")
        {
            throw std::invalid_argument("unsupported URL scheme: " + u.scheme);
        }

        // authority
        const auto slash = s.find_first_of("/?");
        std::string_view auth = (slash == std::string_view::npos) ? s : s.substr(0, slash);
        s = (slash == std::string_view::npos) ? std::string_view{} : s.substr(slash);

        // split host[:port] using last ':'
        const auto colon = auth.rfind(':');
        if (colon != std::string_view::npos)
        {
            u.host.assign(auth.substr(0, colon));
            u.port.assign(auth.substr(colon + 1));
        }
        else
        {
            u.host.assign(auth);
        }
        if (u.host.empty())
        {
            throw std::invalid_argument("URL has no host");
        }
        if (u.port.empty())
        {
            u.port = u.is_tls() ? "443" : "80";
        }

        // path and optional query (query kept with leading '?')
        const auto q = s.find('?');
        if (q == std::string_view::npos)
        {
            u.path.assign(s.empty() ? std::string_view{ "/" } : s);
        }
        else
        {
            u.path.assign(s.substr(0, q));
            u.query.assign(s.substr(q));
        }

        if (u.path.empty() || u.path.front() != '/')
        {
            u.path.insert(u.path.begin(), '/');
        }
        return u;
    }

} // namespace ts::net
