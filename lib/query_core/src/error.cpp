// C++ Standard Library
#include <utility>

// Core
#include <ts/query/error.hpp>

namespace ts::query
{

    namespace
    {
        struct query_category_impl final : std::error_category
        {
            const char* name() const noexcept override
            {
                return "ts.query";
            }
            std::string message(int ev) const override
            {
                switch (static_cast<errc>(ev))
                {
                case errc::transport_failure:
                    return "transport failure";
                case errc::reply_timeout:
                    return "reply did not complete";
                case errc::status_not_found:
                    return "status line not found in reply";
                case errc::malformed_status:
                    return "malformed status line";
                case errc::malformed_record:
                    return "malformed record";
                case errc::result_not_found:
                    return "expected result but none found";
                case errc::channel_not_found:
                    return "channel not found";
                case errc::database_id_error:
                    return "cannot resolve own database id";
                case errc::query_error:
                    return "query returned no usable result";
                case errc::connect_timeout:
                    return "timed out waiting for server connection";
                }
                return "unknown ts.query error";
            }
        };

        struct status_category_impl final : std::error_category
        {
            const char* name() const noexcept override
            {
                return "ts.status";
            }
            std::string message(int ev) const override
            {
                if (ev == k_status_not_connected)
                {
                    return "not connected";
                }
                return "console status " + std::to_string(ev);
            }
        };
    } // namespace

    const std::error_category& query_category() noexcept
    {
        static query_category_impl cat;
        return cat;
    }

    const std::error_category& status_category() noexcept
    {
        static status_category_impl cat;
        return cat;
    }

    std::error_code make_error_code(errc e) noexcept
    {
        return { static_cast<int>(e), query_category() };
    }

    TransportError::TransportError(errc e, const std::string& what) :
        QueryError{ make_error_code(e), what }
    {
    }

    ProtocolError::ProtocolError(errc e, const std::string& what) :
        QueryError{ make_error_code(e), what }
    {
    }

    StatusError::StatusError(int id, std::string message) :
        QueryError{ std::error_code{ id, status_category() }, message },
        message_{ std::move(message) }
    {
    }

    DomainError::DomainError(errc e, const std::string& what) :
        QueryError{ make_error_code(e), what }
    {
    }

} // namespace ts::query
