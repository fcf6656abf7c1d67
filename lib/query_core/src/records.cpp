// C++ Standard Library
#include <charconv>
#include <limits>
#include <string_view>
#include <system_error>

// GSL
#include <gsl/gsl>

// Core
#include <ts/query/records.hpp>

namespace ts::query
{

    namespace
    {
        const std::string& require(const RecordRow& row, std::string_view key)
        {
            const auto it = row.find(std::string{ key });
            if (it == row.end())
            {
                throw ProtocolError(errc::malformed_record, "record is missing '" + std::string{ key } + "'");
            }
            return it->second;
        }

        std::int64_t to_int(const std::string& text, std::string_view key)
        {
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty())
            {
                throw ProtocolError(errc::malformed_record,
                                    "field '" + std::string{ key } + "' is not an integer: '" + text + "'");
            }
            return value;
        }

        std::int64_t require_int(const RecordRow& row, std::string_view key)
        {
            return to_int(require(row, key), key);
        }

        std::int64_t optional_int(const RecordRow& row, std::string_view key)
        {
            const auto it = row.find(std::string{ key });
            return it == row.end() ? 0 : to_int(it->second, key);
        }
    } // namespace

    WhoAmI WhoAmI::from_row(const RecordRow& row)
    {
        return WhoAmI{
            .client_id = require_int(row, "clid"),
            .channel_id = require_int(row, "cid"),
        };
    }

    Client Client::from_row(const RecordRow& row)
    {
        return Client{
            .client_id = require_int(row, "clid"),
            .channel_id = require_int(row, "cid"),
            .database_id = require_int(row, "client_database_id"),
            .type = require_int(row, "client_type"),
            .nickname = require(row, "client_nickname"),
        };
    }

    Channel Channel::from_row(const RecordRow& row)
    {
        return Channel{
            .channel_id = require_int(row, "cid"),
            .parent_id = require_int(row, "pid"),
            .order = optional_int(row, "channel_order"),
            .name = require(row, "channel_name"),
            .total_clients = require_int(row, "total_clients"),
        };
    }

    ClientVariable ClientVariable::from_row(const RecordRow& row)
    {
        return ClientVariable{
            .client_id = require_int(row, "clid"),
            .description = require(row, "client_description"),
        };
    }

    ConnectInfo ConnectInfo::from_row(const RecordRow& row)
    {
        const auto port = require_int(row, "port");
        if (port < 0 || port > std::numeric_limits<std::uint16_t>::max())
        {
            throw ProtocolError(errc::malformed_record, "port out of range: " + std::to_string(port));
        }
        return ConnectInfo{
            .ip = require(row, "ip"),
            .port = gsl::narrow_cast<std::uint16_t>(port),
        };
    }

} // namespace ts::query
