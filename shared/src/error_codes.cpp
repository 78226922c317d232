#include "coursesync/error_codes.hpp"

#include <array>

namespace coursesync
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::MissingCredential, "missing_credential"},
            {ErrorCode::HttpFailure, "http_failure"},
            {ErrorCode::AccessDenied, "access_denied"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::NetworkFailure, "network_failure"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::PaginationFailed, "pagination_failed"},
            {ErrorCode::ItemUnresolved, "item_unresolved"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::InvalidSelection, "invalid_selection"},
            {ErrorCode::EmptySelection, "empty_selection"},
            {ErrorCode::NoContainers, "no_containers"},
            {ErrorCode::InvalidUsage, "invalid_usage"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    ErrorCode error_code_from_status(long status) noexcept
    {
        if (status == 0)
        {
            return ErrorCode::NetworkFailure;
        }
        if (status == 403)
        {
            return ErrorCode::AccessDenied;
        }
        if (status == 404)
        {
            return ErrorCode::NotFound;
        }
        return ErrorCode::HttpFailure;
    }

} // namespace coursesync
