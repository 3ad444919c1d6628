#include "uplink/client/state_store.hpp"

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>

#include "uplink/file_io.hpp"

namespace uplink::client
{

    namespace
    {

        constexpr auto kTasksDir = "tasks";
        constexpr auto kRecordExtension = ".json";

        bool is_temp_file(const std::filesystem::path &path)
        {
            return path.filename().string().find(".tmp-") != std::string::npos;
        }

    } // namespace

    StateStore::StateStore(std::filesystem::path state_dir, Logger logger)
        : tasks_dir_(std::move(state_dir) / kTasksDir), logger_(std::move(logger))
    {
        std::error_code ec;
        std::filesystem::create_directories(tasks_dir_, ec);
        if (ec)
        {
            throw StateStoreError("Cannot create state directory " + tasks_dir_.string() + ": " + ec.message());
        }
        load();
    }

    void StateStore::put(const UploadTask &task)
    {
        std::lock_guard lock(mutex_);
        persist(task);
        tasks_[task.id] = task;
    }

    std::optional<UploadTask> StateStore::get(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = tasks_.find(id);
        if (it == tasks_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TaskStatus> StateStore::status_of(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        const auto it = tasks_.find(id);
        if (it == tasks_.end())
        {
            return std::nullopt;
        }
        return it->second.status;
    }

    std::vector<UploadTask> StateStore::list_by_status(TaskStatus status) const
    {
        auto tasks = list_all();
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [status](const UploadTask &task)
                                   { return task.status != status; }),
                    tasks.end());
        return tasks;
    }

    std::vector<UploadTask> StateStore::list_all() const
    {
        std::vector<UploadTask> tasks;
        {
            std::lock_guard lock(mutex_);
            tasks.reserve(tasks_.size());
            for (const auto &[id, task] : tasks_)
            {
                tasks.push_back(task);
            }
        }
        std::sort(tasks.begin(), tasks.end(), [](const UploadTask &lhs, const UploadTask &rhs)
                  { return lhs.created_at < rhs.created_at; });
        return tasks;
    }

    UploadTask StateStore::update_progress(const std::string &id, std::uint64_t chunk_index,
                                           const std::string &checksum)
    {
        std::lock_guard lock(mutex_);
        auto updated = require(id);
        if (chunk_index >= updated.chunks.size())
        {
            throw StateStoreError("Chunk " + std::to_string(chunk_index) + " out of range for task " + id);
        }
        auto &chunk = updated.chunks[chunk_index];
        chunk.state = ChunkState::Acked;
        chunk.checksum = checksum;
        updated.bytes_acked = updated.acked_bytes();
        persist(updated);
        tasks_[id] = updated;
        return updated;
    }

    UploadTask StateStore::reset_chunks(const std::string &id, const std::vector<std::uint64_t> &indices)
    {
        std::lock_guard lock(mutex_);
        auto updated = require(id);
        const std::set<std::uint64_t> targets(indices.begin(), indices.end());
        for (auto &chunk : updated.chunks)
        {
            if (targets.contains(chunk.index))
            {
                chunk.state = ChunkState::Pending;
                chunk.checksum.clear();
            }
        }
        updated.bytes_acked = updated.acked_bytes();
        persist(updated);
        tasks_[id] = updated;
        return updated;
    }

    std::optional<UploadTask> StateStore::modify(const std::string &id, const Mutator &mutator)
    {
        std::lock_guard lock(mutex_);
        const auto it = tasks_.find(id);
        if (it == tasks_.end())
        {
            return std::nullopt;
        }
        auto updated = it->second;
        if (!mutator(updated))
        {
            return std::nullopt;
        }
        updated.id = id;
        persist(updated);
        it->second = updated;
        return updated;
    }

    bool StateStore::remove(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        const auto it = tasks_.find(id);
        if (it == tasks_.end())
        {
            return false;
        }
        std::error_code ec;
        std::filesystem::remove(record_path(id), ec);
        if (ec)
        {
            throw StateStoreError("Cannot remove record of task " + id + ": " + ec.message());
        }
        tasks_.erase(it);
        return true;
    }

    std::size_t StateStore::recover_interrupted()
    {
        std::lock_guard lock(mutex_);
        std::size_t recovered = 0;
        for (auto &[id, task] : tasks_)
        {
            if (task.status != TaskStatus::Uploading)
            {
                continue;
            }
            auto updated = task;
            updated.status = TaskStatus::Pending;
            for (auto &chunk : updated.chunks)
            {
                if (chunk.state == ChunkState::Sent)
                {
                    chunk.state = ChunkState::Pending;
                }
            }
            persist(updated);
            task = updated;
            ++recovered;
            logger_.log("store", "recovered interrupted task ", id, " at ", task.bytes_acked, "/", task.total_bytes,
                        " bytes");
        }
        return recovered;
    }

    std::size_t StateStore::quarantined() const
    {
        std::lock_guard lock(mutex_);
        return quarantined_;
    }

    void StateStore::load()
    {
        std::error_code ec;
        for (const auto &entry : std::filesystem::directory_iterator(tasks_dir_, ec))
        {
            const auto &path = entry.path();
            if (is_temp_file(path))
            {
                // Left behind by a write that never reached its rename.
                std::error_code remove_ec;
                if (!std::filesystem::remove(path, remove_ec) && remove_ec)
                {
                    logger_.warn("store", "cannot remove leftover ", path.string(), ": ", remove_ec.message());
                }
                continue;
            }
            if (!entry.is_regular_file())
            {
                continue;
            }
            if (path.extension() != kRecordExtension)
            {
                continue;
            }
            try
            {
                auto task = nlohmann::json::parse(uplink::file_io::read_text_file(path)).get<UploadTask>();
                if (task.id != path.stem().string())
                {
                    throw std::invalid_argument("record id does not match file name");
                }
                task.bytes_acked = task.acked_bytes();
                tasks_.emplace(task.id, std::move(task));
            }
            catch (const std::exception &ex)
            {
                auto quarantine = path;
                quarantine += ".corrupt";
                std::error_code rename_ec;
                std::filesystem::rename(path, quarantine, rename_ec);
                ++quarantined_;
                logger_.error("store", "unreadable record ", path.string(), " moved to ", quarantine.string(), ": ",
                              ex.what(), rename_ec ? " (rename failed: " + rename_ec.message() + ")" : "");
            }
        }
        if (ec)
        {
            throw StateStoreError("Cannot scan " + tasks_dir_.string() + ": " + ec.message());
        }
        logger_.log("store", "loaded ", tasks_.size(), " task record(s) from ", tasks_dir_.string());
    }

    void StateStore::persist(const UploadTask &task) const
    {
        try
        {
            const nlohmann::json json = task;
            uplink::file_io::write_file_atomically(record_path(task.id), json.dump());
        }
        catch (const std::exception &ex)
        {
            throw StateStoreError("Cannot persist task " + task.id + ": " + ex.what());
        }
    }

    std::filesystem::path StateStore::record_path(const std::string &id) const
    {
        return tasks_dir_ / (id + kRecordExtension);
    }

    UploadTask &StateStore::require(const std::string &id)
    {
        const auto it = tasks_.find(id);
        if (it == tasks_.end())
        {
            throw StateStoreError("Unknown task " + id);
        }
        return it->second;
    }

} // namespace uplink::client
