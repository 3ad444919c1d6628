#include "uplink/protocol.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace uplink::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 6> kCommandMappings{{
            {Command::OpenSession, "OPEN_SESSION"},
            {Command::SendChunk, "SEND_CHUNK"},
            {Command::Finalize, "FINALIZE"},
            {Command::QueryStatus, "QUERY_STATUS"},
            {Command::Ping, "PING"},
            {Command::ListUploads, "LIST_UPLOADS"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Retry, "RETRY"},
            {ResponseKind::Fatal, "FATAL"},
        }};

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.label == value)
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    ResponseKind classify(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::Ok:
            return ResponseKind::Ok;
        case ErrorCode::InvalidCommand:
        case ErrorCode::InvalidPayload:
        case ErrorCode::Rejected:
        case ErrorCode::SourceUnreadable:
        case ErrorCode::Cancelled:
            return ResponseKind::Fatal;
        default:
            return ResponseKind::Retry;
        }
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        if (auto it = json.find("id"); it != json.end())
        {
            envelope.request_id = it->get<std::string>();
        }
        else
        {
            envelope.request_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const OpenSessionRequest &request)
    {
        json = {
            {"task_id", request.task_id},
            {"destination", request.destination},
            {"total_size", request.total_size},
            {"chunk_size", request.chunk_size},
            {"chunk_count", request.chunk_count},
            {"file_checksum", request.file_checksum},
            {"metadata", request.metadata},
        };
    }

    void from_json(const nlohmann::json &json, OpenSessionRequest &request)
    {
        request.task_id = json.at("task_id").get<std::string>();
        request.destination = json.at("destination").get<std::string>();
        request.total_size = json.at("total_size").get<std::uint64_t>();
        request.chunk_size = json.at("chunk_size").get<std::uint64_t>();
        request.chunk_count = json.at("chunk_count").get<std::uint64_t>();
        request.file_checksum = json.at("file_checksum").get<std::string>();
        request.metadata = json.value("metadata", nlohmann::json::object());
    }

    void to_json(nlohmann::json &json, const OpenSessionResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"resumed", response.resumed},
            {"contiguous_chunks", response.contiguous_chunks},
            {"stored_beyond", response.stored_beyond},
            {"received_bytes", response.received_bytes},
            {"complete", response.complete},
        };
    }

    void from_json(const nlohmann::json &json, OpenSessionResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.resumed = json.value("resumed", false);
        response.contiguous_chunks = json.value("contiguous_chunks", 0ULL);
        response.stored_beyond = json.value("stored_beyond", std::vector<std::uint64_t>{});
        response.received_bytes = json.value("received_bytes", 0ULL);
        response.complete = json.value("complete", false);
    }

    void to_json(nlohmann::json &json, const SendChunkRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"task_id", request.task_id},
            {"index", request.index},
            {"offset", request.offset},
            {"length", request.length},
            {"checksum", request.checksum},
            {"data", request.data_base64},
        };
    }

    void from_json(const nlohmann::json &json, SendChunkRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.task_id = json.value("task_id", std::string{});
        request.index = json.at("index").get<std::uint64_t>();
        request.offset = json.at("offset").get<std::uint64_t>();
        request.length = json.at("length").get<std::uint64_t>();
        request.checksum = json.at("checksum").get<std::string>();
        request.data_base64 = json.at("data").get<std::string>();
    }

    void to_json(nlohmann::json &json, const SendChunkResponse &response)
    {
        json = {
            {"index", response.index},
            {"duplicate", response.duplicate},
            {"contiguous_chunks", response.contiguous_chunks},
        };
    }

    void from_json(const nlohmann::json &json, SendChunkResponse &response)
    {
        response.index = json.at("index").get<std::uint64_t>();
        response.duplicate = json.value("duplicate", false);
        response.contiguous_chunks = json.value("contiguous_chunks", 0ULL);
    }

    void to_json(nlohmann::json &json, const FinalizeRequest &request)
    {
        json = {
            {"session_id", request.session_id},
            {"task_id", request.task_id},
            {"file_checksum", request.file_checksum},
        };
    }

    void from_json(const nlohmann::json &json, FinalizeRequest &request)
    {
        request.session_id = json.at("session_id").get<std::string>();
        request.task_id = json.value("task_id", std::string{});
        request.file_checksum = json.at("file_checksum").get<std::string>();
    }

    void to_json(nlohmann::json &json, const FinalizeResponse &response)
    {
        json = {
            {"path", response.path},
            {"checksum", response.checksum},
        };
    }

    void from_json(const nlohmann::json &json, FinalizeResponse &response)
    {
        response.path = json.value("path", std::string{});
        response.checksum = json.value("checksum", std::string{});
    }

    void to_json(nlohmann::json &json, const FinalizeGaps &gaps)
    {
        json = {
            {"missing", gaps.missing},
            {"mismatched", gaps.mismatched},
        };
    }

    void from_json(const nlohmann::json &json, FinalizeGaps &gaps)
    {
        gaps.missing = json.value("missing", std::vector<std::uint64_t>{});
        gaps.mismatched = json.value("mismatched", std::vector<std::uint64_t>{});
    }

    void to_json(nlohmann::json &json, const StatusQueryRequest &request)
    {
        json = {{"task_id", request.task_id}};
    }

    void from_json(const nlohmann::json &json, StatusQueryRequest &request)
    {
        request.task_id = json.at("task_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const StatusQueryResponse &response)
    {
        json = {
            {"known", response.known},
            {"session_id", response.session_id},
            {"total_chunks", response.total_chunks},
            {"received_chunks", response.received_chunks},
            {"contiguous_chunks", response.contiguous_chunks},
            {"received_bytes", response.received_bytes},
            {"complete", response.complete},
        };
    }

    void from_json(const nlohmann::json &json, StatusQueryResponse &response)
    {
        response.known = json.value("known", false);
        response.session_id = json.value("session_id", std::string{});
        response.total_chunks = json.value("total_chunks", 0ULL);
        response.received_chunks = json.value("received_chunks", 0ULL);
        response.contiguous_chunks = json.value("contiguous_chunks", 0ULL);
        response.received_bytes = json.value("received_bytes", 0ULL);
        response.complete = json.value("complete", false);
    }

    void to_json(nlohmann::json &json, const CompletedUpload &upload)
    {
        json = {
            {"destination", upload.destination},
            {"size", upload.size},
            {"checksum", upload.checksum},
            {"completed_at", upload.completed_at},
            {"metadata", upload.metadata},
        };
    }

    void from_json(const nlohmann::json &json, CompletedUpload &upload)
    {
        upload.destination = json.at("destination").get<std::string>();
        upload.size = json.value("size", 0ULL);
        upload.checksum = json.value("checksum", std::string{});
        upload.completed_at = json.value("completed_at", 0ULL);
        upload.metadata = json.value("metadata", nlohmann::json::object());
    }

} // namespace uplink::protocol
