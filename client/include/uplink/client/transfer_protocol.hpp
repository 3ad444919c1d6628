#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "uplink/client/task.hpp"
#include "uplink/error_codes.hpp"
#include "uplink/protocol.hpp"

namespace uplink::client
{

    /// Failure of one protocol operation. Retryable errors are worth repeating after a
    /// backoff; the rest end the task.
    class TransferError : public std::runtime_error
    {
    public:
        TransferError(uplink::ErrorCode code, const std::string &message, bool retryable);

        uplink::ErrorCode code() const noexcept { return code_; }
        bool retryable() const noexcept { return retryable_; }

    private:
        uplink::ErrorCode code_;
        bool retryable_;
    };

    /// Finalize refused because chunks are missing or no longer match what was stored.
    class IncompleteTransferError : public TransferError
    {
    public:
        IncompleteTransferError(const std::string &message, std::vector<std::uint64_t> missing,
                                std::vector<std::uint64_t> mismatched);

        const std::vector<std::uint64_t> &missing() const noexcept { return missing_; }
        const std::vector<std::uint64_t> &mismatched() const noexcept { return mismatched_; }

        /// missing and mismatched together, ascending.
        std::vector<std::uint64_t> affected() const;

    private:
        std::vector<std::uint64_t> missing_;
        std::vector<std::uint64_t> mismatched_;
    };

    /// Client side of the upload protocol. One instance serves one worker; only
    /// cancel() may be called from another thread.
    class TransferProtocol
    {
    public:
        virtual ~TransferProtocol() = default;

        virtual uplink::protocol::OpenSessionResponse open_session(const uplink::protocol::OpenSessionRequest &request) = 0;

        virtual uplink::protocol::SendChunkResponse send_chunk(const std::string &session_id, const std::string &task_id,
                                                               const ChunkDescriptor &chunk,
                                                               std::span<const std::byte> data,
                                                               const std::string &checksum) = 0;

        virtual uplink::protocol::FinalizeResponse finalize(const std::string &session_id, const std::string &task_id,
                                                            const std::string &file_checksum) = 0;

        virtual uplink::protocol::StatusQueryResponse query_status(const std::string &task_id) = 0;

        virtual void ping() = 0;

        virtual std::vector<uplink::protocol::CompletedUpload> list_uploads() = 0;

        /// Aborts the operation in flight, if any. Later operations fail until reconnect.
        virtual void cancel() = 0;
    };

} // namespace uplink::client
