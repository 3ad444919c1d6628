#include "uplink/client/tcp_transfer_client.hpp"

#include <asio/connect.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <sstream>
#include <vector>

#include "uplink/encoding/base64.hpp"
#include "uplink/framing.hpp"

namespace uplink::client
{

    TcpTransferClient::TcpTransferClient(std::string host, std::uint16_t port, std::chrono::milliseconds timeout,
                                         Logger logger)
        : host_(std::move(host)),
          port_(port),
          timeout_(timeout),
          logger_(std::move(logger)),
          socket_(io_context_) {}

    TcpTransferClient::~TcpTransferClient()
    {
        disconnect();
    }

    template <typename T>
    T TcpTransferClient::decode(const uplink::protocol::ResponseEnvelope &response)
    {
        try
        {
            return response.payload.get<T>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransferError(uplink::ErrorCode::InternalError, std::string("Malformed response payload: ") + ex.what(),
                                true);
        }
    }

    uplink::protocol::OpenSessionResponse TcpTransferClient::open_session(
        const uplink::protocol::OpenSessionRequest &request)
    {
        const auto response = rpc(uplink::protocol::Command::OpenSession, request);
        return decode<uplink::protocol::OpenSessionResponse>(response);
    }

    uplink::protocol::SendChunkResponse TcpTransferClient::send_chunk(const std::string &session_id,
                                                                      const std::string &task_id,
                                                                      const ChunkDescriptor &chunk,
                                                                      std::span<const std::byte> data,
                                                                      const std::string &checksum)
    {
        uplink::protocol::SendChunkRequest request{
            .session_id = session_id,
            .task_id = task_id,
            .index = chunk.index,
            .offset = chunk.offset,
            .length = static_cast<std::uint64_t>(data.size()),
            .checksum = checksum,
            .data_base64 = uplink::encoding::encode_base64(data),
        };
        const auto response = rpc(uplink::protocol::Command::SendChunk, request);
        return decode<uplink::protocol::SendChunkResponse>(response);
    }

    uplink::protocol::FinalizeResponse TcpTransferClient::finalize(const std::string &session_id,
                                                                   const std::string &task_id,
                                                                   const std::string &file_checksum)
    {
        uplink::protocol::FinalizeRequest request{
            .session_id = session_id,
            .task_id = task_id,
            .file_checksum = file_checksum,
        };
        const auto response = rpc(uplink::protocol::Command::Finalize, request);
        return decode<uplink::protocol::FinalizeResponse>(response);
    }

    uplink::protocol::StatusQueryResponse TcpTransferClient::query_status(const std::string &task_id)
    {
        const auto response = rpc(uplink::protocol::Command::QueryStatus,
                                  uplink::protocol::StatusQueryRequest{.task_id = task_id});
        return decode<uplink::protocol::StatusQueryResponse>(response);
    }

    void TcpTransferClient::ping()
    {
        rpc(uplink::protocol::Command::Ping, nlohmann::json::object());
    }

    std::vector<uplink::protocol::CompletedUpload> TcpTransferClient::list_uploads()
    {
        const auto response = rpc(uplink::protocol::Command::ListUploads, nlohmann::json::object());
        try
        {
            return response.payload.at("uploads").get<std::vector<uplink::protocol::CompletedUpload>>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw TransferError(uplink::ErrorCode::InternalError,
                                std::string("Malformed LIST_UPLOADS payload: ") + ex.what(), true);
        }
    }

    void TcpTransferClient::cancel()
    {
        cancelled_ = true;
        asio::post(io_context_, [this]
                   {
            std::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec); });
    }

    uplink::protocol::ResponseEnvelope TcpTransferClient::rpc(uplink::protocol::Command command,
                                                              const nlohmann::json &payload)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        ensure_connected(deadline);

        uplink::protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();
        const auto frame = uplink::protocol::encode_frame(nlohmann::json(envelope));

        std::error_code result = asio::error::would_block;
        asio::async_write(socket_, asio::buffer(frame), [&](const std::error_code &ec, std::size_t /*bytes*/)
                          { result = ec; });
        run_until(deadline, result, "send");

        std::array<std::uint8_t, uplink::protocol::kFrameHeaderSize> header{};
        result = asio::error::would_block;
        asio::async_read(socket_, asio::buffer(header), [&](const std::error_code &ec, std::size_t /*bytes*/)
                         { result = ec; });
        run_until(deadline, result, "receive");

        std::uint32_t size = 0;
        try
        {
            size = uplink::protocol::decode_frame_header(header);
        }
        catch (const std::length_error &ex)
        {
            disconnect();
            throw TransferError(uplink::ErrorCode::InternalError, ex.what(), true);
        }

        std::vector<std::uint8_t> body(size);
        if (size > 0)
        {
            result = asio::error::would_block;
            asio::async_read(socket_, asio::buffer(body), [&](const std::error_code &ec, std::size_t /*bytes*/)
                             { result = ec; });
            run_until(deadline, result, "receive");
        }

        uplink::protocol::ResponseEnvelope response;
        try
        {
            response = nlohmann::json::parse(body.begin(), body.end()).get<uplink::protocol::ResponseEnvelope>();
        }
        catch (const std::exception &ex)
        {
            logger_.warn("rpc", "parse_error size=", size, " msg=", ex.what());
            disconnect();
            throw TransferError(uplink::ErrorCode::InternalError, "Failed to decode server response", true);
        }
        if (response.request_id && *response.request_id != *envelope.request_id)
        {
            disconnect();
            throw TransferError(uplink::ErrorCode::InternalError,
                                "Response " + *response.request_id + " does not answer " + *envelope.request_id, true);
        }
        if (response.kind != uplink::protocol::ResponseKind::Ok)
        {
            raise(command, response);
        }
        return response;
    }

    void TcpTransferClient::ensure_connected(Deadline deadline)
    {
        if (cancelled_)
        {
            throw TransferError(uplink::ErrorCode::Cancelled, "Transfer client was cancelled", false);
        }
        if (socket_.is_open())
        {
            return;
        }

        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
        if (ec)
        {
            throw TransferError(uplink::ErrorCode::Unreachable, "Cannot resolve " + host_ + ": " + ec.message(), true);
        }

        std::error_code result = asio::error::would_block;
        asio::async_connect(socket_, endpoints, [&](const std::error_code &connect_ec, const asio::ip::tcp::endpoint &)
                            { result = connect_ec; });
        run_until(deadline, result, "connect");
        socket_.set_option(asio::ip::tcp::no_delay(true), ec);
        logger_.log("net", "connected to ", host_, ':', port_);
    }

    void TcpTransferClient::disconnect()
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void TcpTransferClient::run_until(Deadline deadline, const std::error_code &result, std::string_view stage)
    {
        io_context_.restart();
        io_context_.run_until(deadline);
        if (!io_context_.stopped())
        {
            // Deadline passed with the operation outstanding; closing the socket aborts it.
            disconnect();
            io_context_.run();
            throw TransferError(uplink::ErrorCode::Timeout,
                                std::string(stage) + " to " + host_ + ':' + std::to_string(port_) + " timed out after " +
                                    std::to_string(timeout_.count()) + " ms",
                                true);
        }
        if (result)
        {
            disconnect();
            if (cancelled_)
            {
                throw TransferError(uplink::ErrorCode::Cancelled, "Transfer client was cancelled", false);
            }
            throw TransferError(uplink::ErrorCode::Unreachable,
                                std::string(stage) + " to " + host_ + ':' + std::to_string(port_) + " failed: " +
                                    result.message(),
                                true);
        }
    }

    void TcpTransferClient::raise(uplink::protocol::Command command, const uplink::protocol::ResponseEnvelope &response)
    {
        const auto retryable = response.kind == uplink::protocol::ResponseKind::Retry;
        logger_.warn("rpc", uplink::protocol::to_string(command), " -> ", uplink::protocol::to_string(response.kind), ' ',
                     uplink::to_string(response.error), ": ", response.message);
        if (response.error == uplink::ErrorCode::Incomplete)
        {
            uplink::protocol::FinalizeGaps gaps;
            try
            {
                gaps = response.payload.get<uplink::protocol::FinalizeGaps>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw TransferError(uplink::ErrorCode::InternalError,
                                    std::string("Malformed incomplete report: ") + ex.what(), true);
            }
            throw IncompleteTransferError(response.message, std::move(gaps.missing), std::move(gaps.mismatched));
        }
        throw TransferError(response.error, response.message, retryable);
    }

    std::string TcpTransferClient::next_request_id()
    {
        std::ostringstream oss;
        oss << "req-" << (++request_counter_);
        return oss.str();
    }

} // namespace uplink::client
