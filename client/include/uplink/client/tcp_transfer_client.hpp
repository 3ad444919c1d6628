#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "uplink/client/logger.hpp"
#include "uplink/client/transfer_protocol.hpp"
#include "uplink/protocol.hpp"

namespace uplink::client
{

    /// TransferProtocol over one TCP connection using length-prefixed JSON frames.
    /// Connects lazily and reconnects after any failure; every operation, connect
    /// included, must complete within `timeout`.
    class TcpTransferClient : public TransferProtocol
    {
    public:
        TcpTransferClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout,
                          Logger logger = Logger());
        ~TcpTransferClient() override;

        TcpTransferClient(const TcpTransferClient &) = delete;
        TcpTransferClient &operator=(const TcpTransferClient &) = delete;

        uplink::protocol::OpenSessionResponse open_session(const uplink::protocol::OpenSessionRequest &request) override;

        uplink::protocol::SendChunkResponse send_chunk(const std::string &session_id, const std::string &task_id,
                                                       const ChunkDescriptor &chunk, std::span<const std::byte> data,
                                                       const std::string &checksum) override;

        uplink::protocol::FinalizeResponse finalize(const std::string &session_id, const std::string &task_id,
                                                    const std::string &file_checksum) override;

        uplink::protocol::StatusQueryResponse query_status(const std::string &task_id) override;

        void ping() override;

        std::vector<uplink::protocol::CompletedUpload> list_uploads() override;

        void cancel() override;

    private:
        using Deadline = std::chrono::steady_clock::time_point;

        uplink::protocol::ResponseEnvelope rpc(uplink::protocol::Command command, const nlohmann::json &payload);
        void ensure_connected(Deadline deadline);
        void disconnect();
        void run_until(Deadline deadline, const std::error_code &result, std::string_view stage);
        [[noreturn]] void raise(uplink::protocol::Command command, const uplink::protocol::ResponseEnvelope &response);
        std::string next_request_id();

        template <typename T>
        T decode(const uplink::protocol::ResponseEnvelope &response);

        std::string host_;
        std::uint16_t port_;
        std::chrono::milliseconds timeout_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::atomic<bool> cancelled_{false};
        std::uint64_t request_counter_{0};
    };

} // namespace uplink::client
