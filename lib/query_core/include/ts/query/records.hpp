/*
Module Name:
- records.hpp

Abstract:
- Plain records decoded from ClientQuery rows (whoami, clientlist, channellist,
  clientvariable, serverconnectinfo).
- Each record maps the console's keys to typed fields; unknown keys are ignored.
- A missing required key or a non-numeric id raises ProtocolError(malformed_record).
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <string>

// Core
#include <ts/query/codec.hpp>

namespace ts::query
{

    /// Reply of `whoami`: own connection id and current channel.
    struct WhoAmI
    {
        std::int64_t client_id = 0; // clid
        std::int64_t channel_id = 0; // cid

        static WhoAmI from_row(const RecordRow& row);
    };

    /// One entry of `clientlist`.
    struct Client
    {
        std::int64_t client_id = 0; // clid
        std::int64_t channel_id = 0; // cid
        std::int64_t database_id = 0; // client_database_id, persistent across sessions
        std::int64_t type = 0; // client_type, 1 for query clients
        std::string nickname; // client_nickname

        static Client from_row(const RecordRow& row);
    };

    /// One entry of `channellist`.
    struct Channel
    {
        std::int64_t channel_id = 0; // cid
        std::int64_t parent_id = 0; // pid
        std::int64_t order = 0; // channel_order
        std::string name; // channel_name
        std::int64_t total_clients = 0;

        static Channel from_row(const RecordRow& row);
    };

    /// Reply of `clientvariable clid=<n> client_description`.
    struct ClientVariable
    {
        std::int64_t client_id = 0;
        std::string description;

        static ClientVariable from_row(const RecordRow& row);
    };

    /// Reply of `serverconnectinfo`.
    struct ConnectInfo
    {
        std::string ip;
        std::uint16_t port = 0;

        static ConnectInfo from_row(const RecordRow& row);
    };

} // namespace ts::query
