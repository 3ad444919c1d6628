/**
 * Uplink - Shared protocol schema and serialization helpers.
 *
 * Every request is a RequestEnvelope carrying one of the commands below; the server
 * answers with a ResponseEnvelope whose kind tells the client whether the operation
 * succeeded, may be retried as-is, or must abort the task.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplink/error_codes.hpp"

namespace uplink::protocol
{

    inline constexpr std::uint64_t kMaxChunkSize = 64ull * 1024 * 1024;

    enum class Command : std::uint8_t
    {
        OpenSession,
        SendChunk,
        Finalize,
        QueryStatus,
        Ping,
        ListUploads
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Retry = 1,
        Fatal = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    /// Outcome class the server reports for a given error code.
    ResponseKind classify(ErrorCode code) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct OpenSessionRequest
    {
        std::string task_id;
        std::string destination;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t chunk_count{};
        std::string file_checksum;
        nlohmann::json metadata{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const OpenSessionRequest &request);
    void from_json(const nlohmann::json &json, OpenSessionRequest &request);

    struct OpenSessionResponse
    {
        std::string session_id;
        bool resumed{};
        // Number of chunks, counted from index 0, the server holds without a gap.
        std::uint64_t contiguous_chunks{};
        // Indices past the frontier that are also stored.
        std::vector<std::uint64_t> stored_beyond;
        std::uint64_t received_bytes{};
        bool complete{};
    };

    void to_json(nlohmann::json &json, const OpenSessionResponse &response);
    void from_json(const nlohmann::json &json, OpenSessionResponse &response);

    struct SendChunkRequest
    {
        std::string session_id;
        std::string task_id;
        std::uint64_t index{};
        std::uint64_t offset{};
        std::uint64_t length{};
        std::string checksum;
        std::string data_base64;
    };

    void to_json(nlohmann::json &json, const SendChunkRequest &request);
    void from_json(const nlohmann::json &json, SendChunkRequest &request);

    struct SendChunkResponse
    {
        std::uint64_t index{};
        bool duplicate{};
        std::uint64_t contiguous_chunks{};
    };

    void to_json(nlohmann::json &json, const SendChunkResponse &response);
    void from_json(const nlohmann::json &json, SendChunkResponse &response);

    struct FinalizeRequest
    {
        std::string session_id;
        std::string task_id;
        std::string file_checksum;
    };

    void to_json(nlohmann::json &json, const FinalizeRequest &request);
    void from_json(const nlohmann::json &json, FinalizeRequest &request);

    struct FinalizeResponse
    {
        std::string path;
        std::string checksum;
    };

    void to_json(nlohmann::json &json, const FinalizeResponse &response);
    void from_json(const nlohmann::json &json, FinalizeResponse &response);

    // Payload of an `incomplete` finalize error.
    struct FinalizeGaps
    {
        std::vector<std::uint64_t> missing;
        std::vector<std::uint64_t> mismatched;
    };

    void to_json(nlohmann::json &json, const FinalizeGaps &gaps);
    void from_json(const nlohmann::json &json, FinalizeGaps &gaps);

    struct StatusQueryRequest
    {
        std::string task_id;
    };

    void to_json(nlohmann::json &json, const StatusQueryRequest &request);
    void from_json(const nlohmann::json &json, StatusQueryRequest &request);

    struct StatusQueryResponse
    {
        bool known{};
        std::string session_id;
        std::uint64_t total_chunks{};
        std::uint64_t received_chunks{};
        std::uint64_t contiguous_chunks{};
        std::uint64_t received_bytes{};
        bool complete{};
    };

    void to_json(nlohmann::json &json, const StatusQueryResponse &response);
    void from_json(const nlohmann::json &json, StatusQueryResponse &response);

    struct CompletedUpload
    {
        std::string destination;
        std::uint64_t size{};
        std::string checksum;
        std::uint64_t completed_at{};
        nlohmann::json metadata{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const CompletedUpload &upload);
    void from_json(const nlohmann::json &json, CompletedUpload &upload);

} // namespace uplink::protocol
