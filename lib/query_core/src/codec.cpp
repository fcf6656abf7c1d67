// ClientQuery text codec.

// C++ Standard Library
#include <charconv>
#include <system_error>

// Core
#include <ts/query/codec.hpp>

namespace ts::query
{

    namespace
    {
        bool is_space(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
        }

        // Map the character after a backslash back to its raw form.
        char unescape_char(char c) noexcept
        {
            switch (c)
            {
            case 's':
                return ' ';
            case 'p':
                return '|';
            case 'n':
                return '\n';
            case 'r':
                return '\r';
            case 't':
                return '\t';
            case 'a':
                return '\a';
            case 'b':
                return '\b';
            case 'f':
                return '\f';
            case 'v':
                return '\v';
            default:
                return c; // covers '\\' and '/'
            }
        }
    } // namespace

    std::string escape(std::string_view s)
    {
        std::string out;
        out.reserve(s.size() + s.size() / 4);
        for (const char c : s)
        {
            if (c == '\\')
            {
                out.append("\\\\");
            }
            else if (c == ' ')
            {
                out.append("\\s");
            }
            else if (c == '/')
            {
                out.append("\\/");
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    std::string unescape(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '\\' && i + 1 < s.size())
            {
                out.push_back(unescape_char(s[++i]));
            }
            else
            {
                out.push_back(s[i]);
            }
        }
        return out;
    }

    std::string_view trim(std::string_view s) noexcept
    {
        while (!s.empty() && is_space(s.front()))
        {
            s.remove_prefix(1);
        }
        while (!s.empty() && is_space(s.back()))
        {
            s.remove_suffix(1);
        }
        return s;
    }

    bool has_status_line(std::string_view content) noexcept
    {
        bool found = false;
        for_each_line(content, [&found](std::string_view line) {
            found = detail::starts_with(line, k_status_marker);
            return !found;
        });
        return found;
    }

    StatusLine parse_status_line(std::string_view line)
    {
        line = trim(line);
        if (!detail::starts_with(line, k_status_prefix))
        {
            throw ProtocolError(errc::malformed_status, "not a status line: " + std::string{ line });
        }

        const auto row = parse_row(line.substr(k_status_prefix.size()));
        const auto id = row.find("id");
        if (id == row.end())
        {
            throw ProtocolError(errc::malformed_status, "status line without id: " + std::string{ line });
        }

        StatusLine status;
        const auto& text = id->second;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), status.code);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            throw ProtocolError(errc::malformed_status, "status id is not an integer: " + std::string{ line });
        }

        if (const auto msg = row.find("msg"); msg != row.end())
        {
            status.message = msg->second;
        }
        return status;
    }

    std::string decode_status(std::string content)
    {
        std::optional<std::string_view> status_line;
        for_each_line(content, [&status_line](std::string_view line) {
            if (detail::starts_with(line, k_status_prefix))
            {
                status_line = line;
                return false;
            }
            return true;
        });

        if (TS_UNLIKELY(!status_line))
        {
            throw ProtocolError(errc::status_not_found, "reply has no status line: " + content);
        }

        auto status = parse_status_line(*status_line);
        if (!status.ok())
        {
            throw StatusError(status.code, std::move(status.message));
        }
        return content;
    }

    RecordRow parse_row(std::string_view segment)
    {
        RecordRow row;
        segment = trim(segment);
        while (!segment.empty())
        {
            const auto sp = segment.find(' ');
            const auto token = segment.substr(0, sp);
            if (!token.empty())
            {
                const auto eq = token.find('=');
                if (eq == std::string_view::npos)
                {
                    row.insert_or_assign(std::string{ token }, std::string{});
                }
                else
                {
                    row.insert_or_assign(std::string{ token.substr(0, eq) }, unescape(token.substr(eq + 1)));
                }
            }
            if (sp == std::string_view::npos)
            {
                break;
            }
            segment.remove_prefix(sp + 1);
        }
        return row;
    }

    std::optional<std::string_view> find_data_line(std::string_view content) noexcept
    {
        std::optional<std::string_view> data;
        for_each_line(content, [&data](std::string_view line) {
            if (detail::starts_with(line, k_status_prefix))
            {
                return true;
            }
            data = line;
            return false;
        });
        return data;
    }

} // namespace ts::query
