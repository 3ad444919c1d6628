/**
 * Uplink - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace uplink
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        NotFound = 3,
        SessionUnknown = 4,
        ChecksumMismatch = 5,
        ChunkConflict = 6,
        Incomplete = 7,
        Rejected = 8,
        Busy = 9,
        Timeout = 10,
        Unreachable = 11,
        StorageFailure = 12,
        SourceUnreadable = 13,
        Cancelled = 14,
        InternalError = 15
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace uplink
