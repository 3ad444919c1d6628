#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplink/error_codes.hpp"
#include "uplink/protocol.hpp"

namespace uplink::server
{

    /// Server-side view of one upload: what has landed, and what it must assemble into.
    struct ServerFile
    {
        std::string session_id;
        std::string task_id;
        std::string destination;
        std::filesystem::path final_path;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t chunk_count{};
        std::string file_checksum;
        std::optional<std::string> final_checksum;
        std::map<std::uint64_t, std::string> received;
        nlohmann::json metadata{nlohmann::json::object()};
        bool complete{};
        std::chrono::system_clock::time_point last_update{};

        std::uint64_t chunk_length(std::uint64_t index) const;
        std::uint64_t contiguous_chunks() const;
        std::vector<std::uint64_t> stored_beyond() const;
        std::uint64_t received_bytes() const;
    };

    struct ResumeInfo
    {
        ServerFile state;
        bool resumed{};
    };

    struct StoredChunk
    {
        bool duplicate{};
        std::uint64_t contiguous_chunks{};
    };

    class RegistryError : public std::runtime_error
    {
    public:
        RegistryError(uplink::ErrorCode code, std::string message,
                      nlohmann::json details = nlohmann::json::object());
        RegistryError(uplink::ErrorCode code, uplink::protocol::ResponseKind kind, std::string message,
                      nlohmann::json details = nlohmann::json::object());

        uplink::ErrorCode code() const noexcept { return code_; }
        uplink::protocol::ResponseKind kind() const noexcept { return kind_; }
        const nlohmann::json &details() const noexcept { return details_; }

    private:
        uplink::ErrorCode code_;
        uplink::protocol::ResponseKind kind_;
        nlohmann::json details_;
    };

    class TransferRegistry
    {
    public:
        explicit TransferRegistry(std::filesystem::path storage_root);

        /// Resumes the session of `request.task_id` when its parameters are unchanged,
        /// otherwise discards it and starts empty.
        ResumeInfo open_session(const uplink::protocol::OpenSessionRequest &request,
                                const std::filesystem::path &final_path);

        StoredChunk store_chunk(const std::string &session_id, std::uint64_t index, std::uint64_t offset,
                                std::span<const std::byte> data, const std::string &checksum);

        /// Verifies every chunk, assembles the file beside its destination and renames it
        /// into place. Gaps raise RegistryError(Incomplete) with `missing`/`mismatched`.
        ServerFile finalize(const std::string &session_id, const std::string &file_checksum);

        uplink::protocol::StatusQueryResponse status(const std::string &task_id) const;

        std::optional<ServerFile> find(const std::string &session_id) const;

        void cleanup_expired(std::chrono::seconds max_age);

        /// Chunk payloads written to disk since construction; duplicates are not counted.
        std::uint64_t chunks_written() const;

    private:
        // `mutex_` guards the session table and every ServerFile in it and is only held
        // for bookkeeping. Disk work for one session runs under its `io_mutex`, which is
        // always taken before `mutex_`. A session leaves the table only while its
        // `io_mutex` is held.
        struct SessionEntry
        {
            std::mutex io_mutex;
            ServerFile state;
        };
        using EntryPtr = std::shared_ptr<SessionEntry>;

        std::filesystem::path registry_dir_;
        std::filesystem::path sessions_dir_;
        std::filesystem::path chunks_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, EntryPtr> sessions_;
        std::uint64_t chunks_written_{0};

        std::filesystem::path metadata_path(const std::string &session_id) const;
        std::filesystem::path chunk_dir(const std::string &session_id) const;
        std::filesystem::path chunk_path(const std::string &session_id, std::uint64_t index) const;

        void load_existing();
        void persist_state(const ServerFile &state) const;
        EntryPtr find_by_task_locked(const std::string &task_id) const;
        EntryPtr lookup(const std::string &session_id) const;
        // Throws SessionUnknown when `entry` was discarded while the caller waited for it.
        ServerFile &registered_locked(const EntryPtr &entry);
        // Caller holds `entry->io_mutex`.
        void discard(const EntryPtr &entry);
    };

} // namespace uplink::server
