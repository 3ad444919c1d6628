#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "uplink/client/logger.hpp"
#include "uplink/client/task.hpp"
#include "uplink/error_codes.hpp"

namespace uplink::client
{

    class StateStoreError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;

        uplink::ErrorCode code() const noexcept { return uplink::ErrorCode::StorageFailure; }
    };

    /// Durable task records, one JSON document per task under `<state_dir>/tasks/`.
    /// Every mutation reaches disk before the in-memory copy changes, so a failed write
    /// leaves both views at the previous state.
    class StateStore
    {
    public:
        /// Returns false to leave the record untouched.
        using Mutator = std::function<bool(UploadTask &)>;

        explicit StateStore(std::filesystem::path state_dir, Logger logger = Logger());

        void put(const UploadTask &task);

        std::optional<UploadTask> get(const std::string &id) const;

        std::optional<TaskStatus> status_of(const std::string &id) const;

        std::vector<UploadTask> list_by_status(TaskStatus status) const;

        /// All records ordered by creation time.
        std::vector<UploadTask> list_all() const;

        /// Marks `chunk_index` ACKED with `checksum` and recomputes bytes_acked.
        UploadTask update_progress(const std::string &id, std::uint64_t chunk_index, const std::string &checksum);

        /// Returns the listed chunks to PENDING so they are sent again.
        UploadTask reset_chunks(const std::string &id, const std::vector<std::uint64_t> &indices);

        /// Atomic read-modify-write of one record. Empty when the id is unknown or the
        /// mutator declined.
        std::optional<UploadTask> modify(const std::string &id, const Mutator &mutator);

        bool remove(const std::string &id);

        /// Moves tasks left UPLOADING by a previous run back to PENDING. Returns how many.
        std::size_t recover_interrupted();

        /// Records moved aside as `*.corrupt` while loading.
        std::size_t quarantined() const;

        const std::filesystem::path &directory() const noexcept { return tasks_dir_; }

    private:
        void load();
        void persist(const UploadTask &task) const;
        std::filesystem::path record_path(const std::string &id) const;
        UploadTask &require(const std::string &id);

        std::filesystem::path tasks_dir_;
        Logger logger_;
        mutable std::mutex mutex_;
        std::map<std::string, UploadTask> tasks_;
        std::size_t quarantined_{0};
    };

} // namespace uplink::client
