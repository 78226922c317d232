/**
 * coursesync - Error codes shared by the sync core and the command line front end.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace coursesync
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        MissingCredential = 1,
        HttpFailure = 2,
        AccessDenied = 3,
        NotFound = 4,
        NetworkFailure = 5,
        InvalidPayload = 6,
        PaginationFailed = 7,
        ItemUnresolved = 8,
        FileIo = 9,
        InvalidSelection = 10,
        EmptySelection = 11,
        NoContainers = 12,
        InvalidUsage = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Maps an HTTP status to the code used when a request fails; 0 means no response arrived.
    ErrorCode error_code_from_status(long status) noexcept;

} // namespace coursesync
