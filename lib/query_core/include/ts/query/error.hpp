/*
Module Name:
- error.hpp

Abstract:
- Error taxonomy of the ClientQuery client.
- Local failures map to ts::query::errc in query_category(); peer-reported status ids
  live in status_category() so callers can compare std::error_code values directly.
- Every failure is thrown as a QueryError (a std::system_error) subclass:
  TransportError, ProtocolError, StatusError (and AuthError), DomainError.
- A bounded read timing out is not an error and never produces one of these.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>

namespace ts::query
{

    enum class errc
    {
        transport_failure = 1,
        reply_timeout,
        status_not_found,
        malformed_status,
        malformed_record,
        result_not_found,
        channel_not_found,
        database_id_error,
        query_error,
        connect_timeout,
    };

    /// Status id the console answers with while the client is not connected to any server.
    inline constexpr int k_status_not_connected = 1794;

    // Category for locally detected failures.
    [[nodiscard]] const std::error_category& query_category() noexcept;

    // Category for ids reported by the console in "error id=<n> msg=<text>".
    [[nodiscard]] const std::error_category& status_category() noexcept;

    [[nodiscard]] std::error_code make_error_code(errc e) noexcept;

    class QueryError : public std::system_error
    {
    public:
        QueryError(std::error_code code, const std::string& what) :
            std::system_error{ code, what }
        {
        }
    };

    /// Socket failure, peer EOF, or a reply that never completed.
    class TransportError final : public QueryError
    {
    public:
        TransportError(errc e, const std::string& what);
    };

    /// Reply without a status line, malformed status line, or malformed record.
    class ProtocolError final : public QueryError
    {
    public:
        ProtocolError(errc e, const std::string& what);
    };

    /// Non-zero id reported by the console.
    class StatusError : public QueryError
    {
    public:
        StatusError(int id, std::string message);

        [[nodiscard]] int id() const noexcept
        {
            return code().value();
        }

        /// Unescaped msg= text from the status line.
        [[nodiscard]] const std::string& message() const noexcept
        {
            return message_;
        }

    private:
        std::string message_;
    };

    /// Login rejected by the console.
    class AuthError final : public StatusError
    {
    public:
        using StatusError::StatusError;
    };

    /// Well-formed reply whose content does not satisfy the operation.
    class DomainError final : public QueryError
    {
    public:
        DomainError(errc e, const std::string& what);
    };

} // namespace ts::query

// Enable implicit conversion to std::error_code for ts::query::errc.
namespace std
{
    template<>
    struct is_error_code_enum<ts::query::errc> : true_type
    {
    };
} // namespace std
