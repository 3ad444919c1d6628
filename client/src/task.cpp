#include "uplink/client/task.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <stdexcept>

#include "uplink/crypto.hpp"

namespace uplink::client
{

    namespace
    {

        struct StatusMapping
        {
            TaskStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 6> kStatusMappings{{
            {TaskStatus::Pending, "PENDING"},
            {TaskStatus::Uploading, "UPLOADING"},
            {TaskStatus::Paused, "PAUSED"},
            {TaskStatus::Completed, "COMPLETED"},
            {TaskStatus::Failed, "FAILED"},
            {TaskStatus::Cancelled, "CANCELLED"},
        }};

        ChunkState chunk_state_from_string(const std::string &value)
        {
            if (value == "ACKED")
            {
                return ChunkState::Acked;
            }
            if (value == "SENT")
            {
                return ChunkState::Sent;
            }
            if (value == "PENDING")
            {
                return ChunkState::Pending;
            }
            throw std::invalid_argument("Unknown chunk state: " + value);
        }

    } // namespace

    std::string_view to_string(TaskStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<TaskStatus> task_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_terminal(TaskStatus status) noexcept
    {
        return status == TaskStatus::Completed || status == TaskStatus::Failed || status == TaskStatus::Cancelled;
    }

    std::string_view to_string(ChunkState state) noexcept
    {
        switch (state)
        {
        case ChunkState::Pending:
            return "PENDING";
        case ChunkState::Sent:
            return "SENT";
        case ChunkState::Acked:
            return "ACKED";
        }
        return "PENDING";
    }

    std::uint64_t UploadTask::acked_bytes() const
    {
        std::uint64_t total = 0;
        for (const auto &chunk : chunks)
        {
            if (chunk.state == ChunkState::Acked)
            {
                total += chunk.length;
            }
        }
        return total;
    }

    std::uint64_t UploadTask::contiguous_acked() const
    {
        std::uint64_t count = 0;
        for (const auto &chunk : chunks)
        {
            if (chunk.state != ChunkState::Acked)
            {
                break;
            }
            ++count;
        }
        return count;
    }

    bool valid_priority(int priority) noexcept
    {
        return priority >= kMinPriority && priority <= kMaxPriority;
    }

    std::uint64_t now_ms()
    {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    }

    std::string generate_task_id(std::uint64_t created_at)
    {
        char prefix[13];
        std::snprintf(prefix, sizeof(prefix), "%012llx",
                      static_cast<unsigned long long>(created_at & 0xFFFFFFFFFFFFull));
        return std::string(prefix) + uplink::crypto::random_hex(4);
    }

    void to_json(nlohmann::json &json, const ChunkDescriptor &chunk)
    {
        json = nlohmann::json{
            {"index", chunk.index},
            {"offset", chunk.offset},
            {"length", chunk.length},
            {"checksum", chunk.checksum},
            {"state", to_string(chunk.state)},
        };
    }

    void from_json(const nlohmann::json &json, ChunkDescriptor &chunk)
    {
        json.at("index").get_to(chunk.index);
        json.at("offset").get_to(chunk.offset);
        json.at("length").get_to(chunk.length);
        chunk.checksum = json.value("checksum", std::string{});
        chunk.state = chunk_state_from_string(json.value("state", std::string{"PENDING"}));
    }

    void to_json(nlohmann::json &json, const UploadTask &task)
    {
        json = nlohmann::json{
            {"id", task.id},
            {"source_path", task.source_path.string()},
            {"destination", task.destination},
            {"priority", task.priority},
            {"created_at", task.created_at},
            {"total_bytes", task.total_bytes},
            {"bytes_acked", task.bytes_acked},
            {"chunk_size", task.chunk_size},
            {"retry_count", task.retry_count},
            {"last_error", task.last_error},
            {"status", to_string(task.status)},
            {"file_checksum", task.file_checksum},
            {"session_id", task.session_id},
            {"started_at", task.started_at},
            {"finished_at", task.finished_at},
            {"metadata", task.metadata},
            {"chunks", task.chunks},
        };
    }

    void from_json(const nlohmann::json &json, UploadTask &task)
    {
        json.at("id").get_to(task.id);
        task.source_path = std::filesystem::path(json.at("source_path").get<std::string>());
        json.at("destination").get_to(task.destination);
        json.at("priority").get_to(task.priority);
        json.at("created_at").get_to(task.created_at);
        json.at("total_bytes").get_to(task.total_bytes);
        json.at("bytes_acked").get_to(task.bytes_acked);
        json.at("chunk_size").get_to(task.chunk_size);
        task.retry_count = json.value("retry_count", 0u);
        task.last_error = json.value("last_error", std::string{});
        const auto status_label = json.at("status").get<std::string>();
        const auto status = task_status_from_string(status_label);
        if (!status)
        {
            throw std::invalid_argument("Unknown task status: " + status_label);
        }
        task.status = *status;
        task.file_checksum = json.value("file_checksum", std::string{});
        task.session_id = json.value("session_id", std::string{});
        task.started_at = json.value("started_at", std::uint64_t{0});
        task.finished_at = json.value("finished_at", std::uint64_t{0});
        task.metadata = json.value("metadata", nlohmann::json::object());
        task.chunks = json.value("chunks", std::vector<ChunkDescriptor>{});
    }

} // namespace uplink::client
