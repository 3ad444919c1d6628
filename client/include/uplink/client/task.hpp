#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace uplink::client
{

    enum class TaskStatus : std::uint8_t
    {
        Pending,
        Uploading,
        Paused,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(TaskStatus status) noexcept;
    std::optional<TaskStatus> task_status_from_string(std::string_view value) noexcept;

    /// COMPLETED, FAILED and CANCELLED. Terminal tasks are never dispatched again
    /// unless explicitly retried.
    bool is_terminal(TaskStatus status) noexcept;

    enum class ChunkState : std::uint8_t
    {
        Pending,
        Sent,
        Acked
    };

    std::string_view to_string(ChunkState state) noexcept;

    struct ChunkDescriptor
    {
        std::uint64_t index{};
        std::uint64_t offset{};
        std::uint64_t length{};
        // Digest of the bytes the server acknowledged; empty until then.
        std::string checksum;
        ChunkState state{ChunkState::Pending};
    };

    struct UploadTask
    {
        std::string id;
        std::filesystem::path source_path;
        std::string destination;
        int priority{5};
        std::uint64_t created_at{};
        std::uint64_t total_bytes{};
        std::uint64_t bytes_acked{};
        std::uint64_t chunk_size{};
        std::uint32_t retry_count{};
        std::string last_error;
        TaskStatus status{TaskStatus::Pending};
        std::string file_checksum;
        std::string session_id;
        std::uint64_t started_at{};
        std::uint64_t finished_at{};
        nlohmann::json metadata{nlohmann::json::object()};
        std::vector<ChunkDescriptor> chunks;

        /// Sum of the lengths of ACKED chunks.
        std::uint64_t acked_bytes() const;
        /// Chunks ACKED from index 0 without a gap.
        std::uint64_t contiguous_acked() const;
    };

    inline constexpr int kMinPriority = 1;
    inline constexpr int kMaxPriority = 10;

    bool valid_priority(int priority) noexcept;

    /// Milliseconds since the Unix epoch.
    std::uint64_t now_ms();

    /// Time-ordered identifier: 12 hex digits of milliseconds followed by 8 random hex digits.
    std::string generate_task_id(std::uint64_t created_at);

    void to_json(nlohmann::json &json, const ChunkDescriptor &chunk);
    void from_json(const nlohmann::json &json, ChunkDescriptor &chunk);

    void to_json(nlohmann::json &json, const UploadTask &task);
    void from_json(const nlohmann::json &json, UploadTask &task);

} // namespace uplink::client
