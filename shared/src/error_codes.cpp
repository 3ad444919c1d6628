#include "uplink/error_codes.hpp"

#include <array>

namespace uplink
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::SessionUnknown, "session_unknown"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::ChunkConflict, "chunk_conflict"},
            {ErrorCode::Incomplete, "incomplete"},
            {ErrorCode::Rejected, "rejected"},
            {ErrorCode::Busy, "busy"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::Unreachable, "unreachable"},
            {ErrorCode::StorageFailure, "storage_failure"},
            {ErrorCode::SourceUnreadable, "source_unreadable"},
            {ErrorCode::Cancelled, "cancelled"},
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

} // namespace uplink
