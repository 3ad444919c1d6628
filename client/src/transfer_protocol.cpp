#include "uplink/client/transfer_protocol.hpp"

#include <algorithm>

namespace uplink::client
{

    TransferError::TransferError(uplink::ErrorCode code, const std::string &message, bool retryable)
        : std::runtime_error(message), code_(code), retryable_(retryable) {}

    IncompleteTransferError::IncompleteTransferError(const std::string &message, std::vector<std::uint64_t> missing,
                                                     std::vector<std::uint64_t> mismatched)
        : TransferError(uplink::ErrorCode::Incomplete, message, true),
          missing_(std::move(missing)),
          mismatched_(std::move(mismatched)) {}

    std::vector<std::uint64_t> IncompleteTransferError::affected() const
    {
        std::vector<std::uint64_t> indices = missing_;
        indices.insert(indices.end(), mismatched_.begin(), mismatched_.end());
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
        return indices;
    }

} // namespace uplink::client
