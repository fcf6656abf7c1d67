/*
Module Name:
- codec.hpp

Abstract:
- Text codec for the ClientQuery console.
- Encodes string parameters (escape) and decodes replies into a status line plus record rows.
- A reply is zero or more data lines followed by one "error id=<n> msg=<text>" line.
  A data line holds one or more records separated by '|', each record is space separated
  key=value tokens with escaped values.

Why:
- decode_rows distinguishes "no data line" (std::nullopt) from a data line, because callers
  treat a missing result line as a harder failure than an empty list.
- Escaping replaces backslash first so that backslashes inserted for later sequences are
  never escaped twice.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Core
#include <ts/query/error.hpp>
#include <ts/utils/attributes.hpp>

namespace ts::query
{

    /// Command line terminator expected by the console.
    inline constexpr std::string_view k_terminator{ "\n\r" };

    /// Prefix of the terminal status line, after trimming.
    inline constexpr std::string_view k_status_prefix{ "error " };
    inline constexpr std::string_view k_status_marker{ "error id=" };

    struct StatusLine
    {
        int code = 0;
        std::string message;

        [[nodiscard]] bool ok() const noexcept
        {
            return code == 0;
        }
    };

    /// One parsed record. Values are already unescaped.
    using RecordRow = std::unordered_map<std::string, std::string>;

    /// Record types built from a row: must provide `static T from_row(const RecordRow&)`.
    template<typename T>
    concept FromRecordRow = requires(const RecordRow& row) {
        { T::from_row(row) } -> std::same_as<T>;
    };

    [[nodiscard]] std::string escape(std::string_view s);
    [[nodiscard]] std::string unescape(std::string_view s);

    /// Strip ASCII whitespace including CR and LF on both ends.
    [[nodiscard]] std::string_view trim(std::string_view s) noexcept;

    /// Call fn(line) for each '\n' separated line of content, trimmed, skipping empty lines.
    template<typename Fn>
    void for_each_line(std::string_view content, Fn&& fn)
    {
        while (!content.empty())
        {
            const auto nl = content.find('\n');
            const auto raw = content.substr(0, nl);
            if (const auto line = trim(raw); !line.empty())
            {
                if (!fn(line))
                {
                    return;
                }
            }
            if (nl == std::string_view::npos)
            {
                return;
            }
            content.remove_prefix(nl + 1);
        }
    }

    /// True when any line of content starts with "error id=" (the reply is complete).
    [[nodiscard]] bool has_status_line(std::string_view content) noexcept;

    /// Parse "error id=<n> msg=<text>". Throws ProtocolError(malformed_status).
    [[nodiscard]] StatusLine parse_status_line(std::string_view line);

    /// Locate the status line. Returns content unchanged when id == 0.
    /// Throws ProtocolError(status_not_found) when absent, StatusError when id != 0.
    [[nodiscard]] std::string decode_status(std::string content);

    /// Parse one '|' segment into key/value pairs. Bare keys map to an empty value.
    [[nodiscard]] RecordRow parse_row(std::string_view segment);

    /// First non-empty line that is not a status line.
    [[nodiscard]] std::optional<std::string_view> find_data_line(std::string_view content) noexcept;

    /// Decode status and rows. std::nullopt when the reply has no data line.
    template<FromRecordRow T>
    [[nodiscard]] std::optional<std::vector<T>> decode_rows(std::string content)
    {
        const auto checked = decode_status(std::move(content));
        const auto line = find_data_line(checked);
        if (!line)
        {
            return std::nullopt;
        }

        std::vector<T> rows;
        std::string_view rest = *line;
        for (;;)
        {
            const auto bar = rest.find('|');
            rows.push_back(T::from_row(parse_row(rest.substr(0, bar))));
            if (bar == std::string_view::npos)
            {
                break;
            }
            rest.remove_prefix(bar + 1);
        }
        return rows;
    }

    namespace detail
    {
        TS_FORCE_INLINE bool starts_with(std::string_view s, std::string_view prefix) noexcept
        {
            return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
        }
    } // namespace detail

} // namespace ts::query
