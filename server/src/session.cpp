#include "uplink/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <chrono>
#include <string>

#include <spdlog/spdlog.h>

#include "uplink/encoding/base64.hpp"

namespace uplink::server
{

    namespace
    {

        uplink::protocol::ResponseEnvelope make_ok_response(nlohmann::json payload,
                                                            const std::optional<std::string> &request_id)
        {
            uplink::protocol::ResponseEnvelope envelope;
            envelope.kind = uplink::protocol::ResponseKind::Ok;
            envelope.payload = std::move(payload);
            envelope.message = "";
            envelope.error = uplink::ErrorCode::Ok;
            envelope.request_id = request_id;
            return envelope;
        }

    } // namespace

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services)
    {
        peer_ = remote_endpoint();
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", peer_);
        read_frame_header();
    }

    void Session::stop()
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ec;
        spdlog::info("Closing connection for {}", peer_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = uplink::protocol::decode_frame_header(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("{} sent an oversized frame: {}", peer_, ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             nlohmann::json json;
                             try
                             {
                                 json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                             }
                             catch (const nlohmann::json::exception &ex)
                             {
                                 send_error(uplink::ErrorCode::InvalidPayload, ex.what());
                                 return;
                             }
                             process_message(json);
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        uplink::protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<uplink::protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(uplink::ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", peer_, uplink::protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case uplink::protocol::Command::OpenSession:
            respond(envelope, [&]
                    { return handle_open_session(envelope); });
            break;
        case uplink::protocol::Command::SendChunk:
            respond(envelope, [&]
                    { return handle_send_chunk(envelope); });
            break;
        case uplink::protocol::Command::Finalize:
            respond(envelope, [&]
                    { return handle_finalize(envelope); });
            break;
        case uplink::protocol::Command::QueryStatus:
            respond(envelope, [&]
                    { return handle_query_status(envelope); });
            break;
        case uplink::protocol::Command::Ping:
            respond(envelope, [&]
                    { return handle_ping(envelope); });
            break;
        case uplink::protocol::Command::ListUploads:
            respond(envelope, [&]
                    { return handle_list_uploads(envelope); });
            break;
        default:
            send_error(uplink::ErrorCode::InvalidCommand, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::respond(const uplink::protocol::RequestEnvelope &envelope,
                          const std::function<nlohmann::json()> &handler)
    {
        nlohmann::json payload;
        try
        {
            payload = handler();
        }
        catch (const RegistryError &ex)
        {
            send_error(ex.code(), ex.kind(), ex.what(), ex.details(), envelope.request_id);
            return;
        }
        catch (const FilesystemError &fs)
        {
            send_error(fs.code(), fs.what(), envelope.request_id);
            return;
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(uplink::ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
            return;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed for {}: {}", uplink::protocol::to_string(envelope.command), peer_, ex.what());
            send_error(uplink::ErrorCode::InternalError, ex.what(), envelope.request_id);
            return;
        }
        send_response(make_ok_response(std::move(payload), envelope.request_id));
    }

    void Session::send_response(const uplink::protocol::ResponseEnvelope &envelope)
    {
        std::shared_ptr<std::vector<std::uint8_t>> frame;
        try
        {
            frame = std::make_shared<std::vector<std::uint8_t>>(uplink::protocol::encode_frame(nlohmann::json(envelope)));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", peer_, ex.what());
            stop();
            return;
        }
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              read_frame_header();
                          });
    }

    void Session::send_error(uplink::ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        send_error(code, uplink::protocol::classify(code), std::move(message), nlohmann::json::object(),
                   std::move(request_id));
    }

    void Session::send_error(uplink::ErrorCode code, uplink::protocol::ResponseKind kind, std::string message,
                             nlohmann::json details, std::optional<std::string> request_id)
    {
        spdlog::debug("{} <- {} {}: {}", peer_, uplink::protocol::to_string(kind), uplink::to_string(code), message);
        uplink::protocol::ResponseEnvelope envelope;
        envelope.kind = kind;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.payload = std::move(details);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    nlohmann::json Session::handle_open_session(const uplink::protocol::RequestEnvelope &envelope)
    {
        services_.transfer_registry.cleanup_expired(services_.session_timeout);
        const auto request = envelope.payload.get<uplink::protocol::OpenSessionRequest>();
        const auto target = services_.filesystem.resolve_destination(request.destination);
        services_.filesystem.check_size_policy(request.total_size);
        const auto info = services_.transfer_registry.open_session(request, target);

        uplink::protocol::OpenSessionResponse response{
            .session_id = info.state.session_id,
            .resumed = info.resumed,
            .contiguous_chunks = info.state.contiguous_chunks(),
            .stored_beyond = info.state.stored_beyond(),
            .received_bytes = info.state.received_bytes(),
            .complete = info.state.complete,
        };
        if (info.resumed)
        {
            spdlog::info("Task {} resumed at chunk {}/{} from {}", request.task_id, response.contiguous_chunks,
                         info.state.chunk_count, peer_);
        }
        return response;
    }

    nlohmann::json Session::handle_send_chunk(const uplink::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<uplink::protocol::SendChunkRequest>();
        const auto data = uplink::encoding::decode_base64(request.data_base64);
        if (!data)
        {
            throw RegistryError(uplink::ErrorCode::ChecksumMismatch, "Chunk payload is not valid base64");
        }
        if (data->size() != request.length)
        {
            throw RegistryError(uplink::ErrorCode::ChecksumMismatch, "Chunk payload length differs from header");
        }
        const auto stored = services_.transfer_registry.store_chunk(request.session_id, request.index, request.offset,
                                                                    *data, request.checksum);
        uplink::protocol::SendChunkResponse response{
            .index = request.index,
            .duplicate = stored.duplicate,
            .contiguous_chunks = stored.contiguous_chunks,
        };
        return response;
    }

    nlohmann::json Session::handle_finalize(const uplink::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<uplink::protocol::FinalizeRequest>();
        const auto state = services_.transfer_registry.finalize(request.session_id, request.file_checksum);

        uplink::protocol::CompletedUpload upload{
            .destination = state.destination,
            .size = state.total_size,
            .checksum = state.final_checksum.value_or(state.file_checksum),
            .completed_at = static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::seconds>(state.last_update.time_since_epoch()).count()),
            .metadata = state.metadata,
        };
        services_.filesystem.write_metadata(state.final_path, upload);

        uplink::protocol::FinalizeResponse response{
            .path = state.final_path.lexically_relative(services_.filesystem.completed_root()).generic_string(),
            .checksum = upload.checksum,
        };
        return response;
    }

    nlohmann::json Session::handle_query_status(const uplink::protocol::RequestEnvelope &envelope)
    {
        const auto request = envelope.payload.get<uplink::protocol::StatusQueryRequest>();
        return services_.transfer_registry.status(request.task_id);
    }

    nlohmann::json Session::handle_ping(const uplink::protocol::RequestEnvelope & /*envelope*/)
    {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return {
            {"status", "ok"},
            {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(now).count()},
        };
    }

    nlohmann::json Session::handle_list_uploads(const uplink::protocol::RequestEnvelope & /*envelope*/)
    {
        nlohmann::json payload;
        payload["uploads"] = services_.filesystem.list_completed();
        return payload;
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string(ec) + ":" + std::to_string(endpoint.port());
    }

} // namespace uplink::server
