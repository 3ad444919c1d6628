#include "uplink/server/transfer_registry.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "uplink/crypto.hpp"
#include "uplink/file_io.hpp"

namespace uplink::server
{

    namespace
    {
        constexpr auto kRegistryDir = ".uplink";
        constexpr auto kSessionsDir = "sessions";
        constexpr auto kChunksDir = "chunks";

        nlohmann::json to_json(const ServerFile &state)
        {
            nlohmann::json received = nlohmann::json::array();
            for (const auto &[index, checksum] : state.received)
            {
                received.push_back({{"index", index}, {"checksum", checksum}});
            }
            nlohmann::json json = {
                {"session_id", state.session_id},
                {"task_id", state.task_id},
                {"destination", state.destination},
                {"final_path", state.final_path.generic_string()},
                {"total_size", state.total_size},
                {"chunk_size", state.chunk_size},
                {"chunk_count", state.chunk_count},
                {"file_checksum", state.file_checksum},
                {"received", received},
                {"metadata", state.metadata},
                {"complete", state.complete},
                {"last_update", std::chrono::duration_cast<std::chrono::seconds>(state.last_update.time_since_epoch()).count()},
            };
            if (state.final_checksum)
            {
                json["final_checksum"] = *state.final_checksum;
            }
            return json;
        }

        ServerFile state_from_json(const nlohmann::json &json)
        {
            ServerFile state{};
            state.session_id = json.at("session_id").get<std::string>();
            state.task_id = json.at("task_id").get<std::string>();
            state.destination = json.value("destination", std::string{});
            state.final_path = json.at("final_path").get<std::string>();
            state.total_size = json.value("total_size", 0ULL);
            state.chunk_size = json.value("chunk_size", 0ULL);
            state.chunk_count = json.value("chunk_count", 0ULL);
            state.file_checksum = json.value("file_checksum", std::string{});
            for (const auto &item : json.value("received", nlohmann::json::array()))
            {
                state.received[item.at("index").get<std::uint64_t>()] = item.at("checksum").get<std::string>();
            }
            state.metadata = json.value("metadata", nlohmann::json::object());
            state.complete = json.value("complete", false);
            if (auto it = json.find("final_checksum"); it != json.end())
            {
                state.final_checksum = it->get<std::string>();
            }
            const auto seconds = json.value("last_update", 0LL);
            state.last_update = std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
            return state;
        }

        std::uint64_t expected_chunk_count(std::uint64_t total_size, std::uint64_t chunk_size)
        {
            return (total_size + chunk_size - 1) / chunk_size;
        }

        bool same_upload(const ServerFile &state, const uplink::protocol::OpenSessionRequest &request,
                         const std::filesystem::path &final_path)
        {
            return state.final_path == final_path && state.total_size == request.total_size &&
                   state.chunk_size == request.chunk_size && state.chunk_count == request.chunk_count &&
                   state.file_checksum == request.file_checksum;
        }

    } // namespace

    std::uint64_t ServerFile::chunk_length(std::uint64_t index) const
    {
        const auto offset = index * chunk_size;
        return std::min(chunk_size, total_size - offset);
    }

    std::uint64_t ServerFile::contiguous_chunks() const
    {
        if (complete)
        {
            return chunk_count;
        }
        std::uint64_t next = 0;
        for (const auto &[index, checksum] : received)
        {
            if (index != next)
            {
                break;
            }
            ++next;
        }
        return next;
    }

    std::vector<std::uint64_t> ServerFile::stored_beyond() const
    {
        std::vector<std::uint64_t> indices;
        if (complete)
        {
            return indices;
        }
        const auto frontier = contiguous_chunks();
        for (const auto &[index, checksum] : received)
        {
            if (index > frontier)
            {
                indices.push_back(index);
            }
        }
        return indices;
    }

    std::uint64_t ServerFile::received_bytes() const
    {
        if (complete)
        {
            return total_size;
        }
        std::uint64_t bytes = 0;
        for (const auto &[index, checksum] : received)
        {
            bytes += chunk_length(index);
        }
        return bytes;
    }

    RegistryError::RegistryError(uplink::ErrorCode code, std::string message, nlohmann::json details)
        : RegistryError(code, uplink::protocol::classify(code), std::move(message), std::move(details))
    {
    }

    RegistryError::RegistryError(uplink::ErrorCode code, uplink::protocol::ResponseKind kind, std::string message,
                                 nlohmann::json details)
        : std::runtime_error(std::move(message)), code_(code), kind_(kind), details_(std::move(details))
    {
    }

    TransferRegistry::TransferRegistry(std::filesystem::path storage_root)
        : registry_dir_(std::move(storage_root) / kRegistryDir),
          sessions_dir_(registry_dir_ / kSessionsDir),
          chunks_dir_(registry_dir_ / kChunksDir)
    {
        std::filesystem::create_directories(sessions_dir_);
        std::filesystem::create_directories(chunks_dir_);
        load_existing();
    }

    ResumeInfo TransferRegistry::open_session(const uplink::protocol::OpenSessionRequest &request,
                                              const std::filesystem::path &final_path)
    {
        if (request.task_id.empty())
        {
            throw RegistryError(uplink::ErrorCode::InvalidPayload, "task_id is required");
        }
        if (request.chunk_size == 0 || request.chunk_size > uplink::protocol::kMaxChunkSize)
        {
            throw RegistryError(uplink::ErrorCode::InvalidPayload, "Unsupported chunk size");
        }
        if (request.chunk_count != expected_chunk_count(request.total_size, request.chunk_size))
        {
            throw RegistryError(uplink::ErrorCode::InvalidPayload, "Chunk count does not match file size");
        }

        while (true)
        {
            EntryPtr existing;
            {
                std::lock_guard lock(mutex_);
                existing = find_by_task_locked(request.task_id);
            }
            if (existing)
            {
                std::lock_guard io(existing->io_mutex);
                std::unique_lock lock(mutex_);
                const auto it = sessions_.find(existing->state.session_id);
                if (it == sessions_.end() || it->second != existing)
                {
                    continue;
                }
                auto &state = existing->state;
                if (same_upload(state, request, final_path))
                {
                    state.last_update = std::chrono::system_clock::now();
                    const auto snapshot = state;
                    lock.unlock();
                    persist_state(snapshot);
                    return {.state = snapshot, .resumed = true};
                }
                spdlog::info("Task {} changed parameters, discarding session {}", request.task_id, state.session_id);
                lock.unlock();
                discard(existing);
                continue;
            }

            auto entry = std::make_shared<SessionEntry>();
            auto &state = entry->state;
            state.session_id = crypto::random_hex(16);
            state.task_id = request.task_id;
            state.destination = request.destination;
            state.final_path = final_path;
            state.total_size = request.total_size;
            state.chunk_size = request.chunk_size;
            state.chunk_count = request.chunk_count;
            state.file_checksum = request.file_checksum;
            state.metadata = request.metadata.is_object() ? request.metadata : nlohmann::json::object();
            state.last_update = std::chrono::system_clock::now();

            std::filesystem::create_directories(chunk_dir(state.session_id));
            persist_state(state);
            {
                std::lock_guard lock(mutex_);
                if (!find_by_task_locked(request.task_id))
                {
                    sessions_[state.session_id] = entry;
                    spdlog::info("Session {} created for task {} ({} bytes, {} chunks)", state.session_id,
                                 state.task_id, state.total_size, state.chunk_count);
                    return {.state = state, .resumed = false};
                }
            }
            // A concurrent open of the same task registered first.
            std::error_code ec;
            std::filesystem::remove_all(chunk_dir(state.session_id), ec);
            std::filesystem::remove(metadata_path(state.session_id), ec);
        }
    }

    StoredChunk TransferRegistry::store_chunk(const std::string &session_id, std::uint64_t index, std::uint64_t offset,
                                              std::span<const std::byte> data, const std::string &checksum)
    {
        const auto computed = crypto::hash_bytes(data);
        if (computed != checksum)
        {
            throw RegistryError(uplink::ErrorCode::ChecksumMismatch,
                                "Chunk " + std::to_string(index) + " does not match its checksum");
        }

        const auto entry = lookup(session_id);
        std::lock_guard io(entry->io_mutex);
        {
            std::lock_guard lock(mutex_);
            const auto &state = registered_locked(entry);
            if (index >= state.chunk_count)
            {
                throw RegistryError(uplink::ErrorCode::InvalidPayload, "Chunk index out of range");
            }
            if (offset != index * state.chunk_size || data.size() != state.chunk_length(index))
            {
                throw RegistryError(uplink::ErrorCode::InvalidPayload, "Chunk boundaries do not match the session");
            }
            if (state.complete)
            {
                return {.duplicate = true, .contiguous_chunks = state.contiguous_chunks()};
            }
            if (auto it = state.received.find(index); it != state.received.end())
            {
                if (it->second == checksum)
                {
                    return {.duplicate = true, .contiguous_chunks = state.contiguous_chunks()};
                }
                throw RegistryError(uplink::ErrorCode::ChunkConflict,
                                    "Chunk " + std::to_string(index) + " already stored with different content");
            }
        }

        file_io::write_file_atomically(chunk_path(session_id, index), data);
        ServerFile snapshot;
        {
            std::lock_guard lock(mutex_);
            entry->state.received[index] = checksum;
            entry->state.last_update = std::chrono::system_clock::now();
            snapshot = entry->state;
        }
        try
        {
            persist_state(snapshot);
        }
        catch (...)
        {
            std::lock_guard lock(mutex_);
            entry->state.received.erase(index);
            throw;
        }
        std::lock_guard lock(mutex_);
        ++chunks_written_;
        return {.duplicate = false, .contiguous_chunks = entry->state.contiguous_chunks()};
    }

    ServerFile TransferRegistry::finalize(const std::string &session_id, const std::string &file_checksum)
    {
        const auto entry = lookup(session_id);
        std::lock_guard io(entry->io_mutex);
        ServerFile snapshot;
        {
            std::lock_guard lock(mutex_);
            const auto &state = registered_locked(entry);
            if (file_checksum != state.file_checksum)
            {
                throw RegistryError(uplink::ErrorCode::InvalidPayload,
                                    "Checksum differs from the one the session was opened with");
            }
            snapshot = state;
        }
        if (snapshot.complete)
        {
            return snapshot;
        }

        uplink::protocol::FinalizeGaps gaps;
        for (std::uint64_t index = 0; index < snapshot.chunk_count; ++index)
        {
            auto it = snapshot.received.find(index);
            if (it == snapshot.received.end())
            {
                gaps.missing.push_back(index);
                continue;
            }
            const auto path = chunk_path(session_id, index);
            std::string stored_hash;
            try
            {
                stored_hash = crypto::hash_bytes(file_io::read_range(path, 0, snapshot.chunk_length(index)));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Chunk {} of session {} unreadable: {}", index, session_id, ex.what());
            }
            if (stored_hash != it->second)
            {
                gaps.mismatched.push_back(index);
                std::error_code ec;
                std::filesystem::remove(path, ec);
            }
        }
        if (!gaps.missing.empty() || !gaps.mismatched.empty())
        {
            if (!gaps.mismatched.empty())
            {
                {
                    std::lock_guard lock(mutex_);
                    for (const auto index : gaps.mismatched)
                    {
                        entry->state.received.erase(index);
                    }
                    snapshot = entry->state;
                }
                persist_state(snapshot);
            }
            throw RegistryError(uplink::ErrorCode::Incomplete,
                                std::to_string(gaps.missing.size()) + " missing and " +
                                    std::to_string(gaps.mismatched.size()) + " damaged chunks",
                                nlohmann::json(gaps));
        }

        const auto parent = snapshot.final_path.parent_path();
        std::error_code dir_ec;
        std::filesystem::create_directories(parent, dir_ec);
        if (dir_ec == std::errc::not_a_directory || dir_ec == std::errc::file_exists)
        {
            throw RegistryError(uplink::ErrorCode::Rejected, "Destination " + snapshot.destination +
                                                                 " runs through an existing file");
        }
        if (dir_ec)
        {
            throw std::filesystem::filesystem_error("create_directories", parent, dir_ec);
        }

        auto temp_path = snapshot.final_path;
        temp_path += ".part-" + session_id;
        std::string digest;
        try
        {
            crypto::Hasher hasher;
            file_io::FileWriter writer(temp_path);
            for (std::uint64_t index = 0; index < snapshot.chunk_count; ++index)
            {
                const auto bytes =
                    file_io::read_range(chunk_path(session_id, index), 0, snapshot.chunk_length(index));
                hasher.update(bytes);
                writer.write(bytes);
            }
            writer.sync();
            writer.close();
            digest = hasher.finish();
            if (digest == snapshot.file_checksum)
            {
                file_io::rename_durably(temp_path, snapshot.final_path);
            }
        }
        catch (const std::system_error &ex)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            if (ex.code() == std::errc::is_a_directory || ex.code() == std::errc::not_a_directory)
            {
                throw RegistryError(uplink::ErrorCode::Rejected,
                                    "Cannot publish " + snapshot.destination + ": " + ex.what());
            }
            throw;
        }
        catch (...)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw;
        }

        if (digest != snapshot.file_checksum)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            spdlog::warn("Session {} assembled to {} but {} was declared, discarding", session_id, digest,
                         snapshot.file_checksum);
            discard(entry);
            throw RegistryError(uplink::ErrorCode::ChecksumMismatch, uplink::protocol::ResponseKind::Fatal,
                                "Assembled file does not match the declared checksum");
        }

        {
            std::lock_guard lock(mutex_);
            auto &state = entry->state;
            state.complete = true;
            state.final_checksum = digest;
            state.received.clear();
            state.last_update = std::chrono::system_clock::now();
            snapshot = state;
        }
        persist_state(snapshot);

        std::error_code ec;
        std::filesystem::remove_all(chunk_dir(session_id), ec);
        spdlog::info("Session {} published {}", session_id, snapshot.final_path.string());
        return snapshot;
    }

    uplink::protocol::StatusQueryResponse TransferRegistry::status(const std::string &task_id) const
    {
        std::lock_guard lock(mutex_);
        uplink::protocol::StatusQueryResponse response{};
        const auto entry = find_by_task_locked(task_id);
        if (!entry)
        {
            return response;
        }
        const auto &state = entry->state;
        response.known = true;
        response.session_id = state.session_id;
        response.total_chunks = state.chunk_count;
        response.received_chunks = state.complete ? state.chunk_count : state.received.size();
        response.contiguous_chunks = state.contiguous_chunks();
        response.received_bytes = state.received_bytes();
        response.complete = state.complete;
        return response;
    }

    std::optional<ServerFile> TransferRegistry::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end())
        {
            return it->second->state;
        }
        return std::nullopt;
    }

    void TransferRegistry::cleanup_expired(std::chrono::seconds max_age)
    {
        const auto now = std::chrono::system_clock::now();
        std::vector<EntryPtr> expired;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[session_id, entry] : sessions_)
            {
                if (now - entry->state.last_update > max_age)
                {
                    expired.push_back(entry);
                }
            }
        }
        for (const auto &entry : expired)
        {
            // A session busy with disk work is in use, not idle.
            std::unique_lock io(entry->io_mutex, std::try_to_lock);
            if (!io)
            {
                continue;
            }
            {
                std::lock_guard lock(mutex_);
                const auto it = sessions_.find(entry->state.session_id);
                if (it == sessions_.end() || it->second != entry || now - entry->state.last_update <= max_age)
                {
                    continue;
                }
            }
            spdlog::info("Session {} expired", entry->state.session_id);
            discard(entry);
        }
    }

    std::uint64_t TransferRegistry::chunks_written() const
    {
        std::lock_guard lock(mutex_);
        return chunks_written_;
    }

    std::filesystem::path TransferRegistry::metadata_path(const std::string &session_id) const
    {
        return sessions_dir_ / (session_id + ".json");
    }

    std::filesystem::path TransferRegistry::chunk_dir(const std::string &session_id) const
    {
        return chunks_dir_ / session_id;
    }

    std::filesystem::path TransferRegistry::chunk_path(const std::string &session_id, std::uint64_t index) const
    {
        return chunk_dir(session_id) / ("chunk_" + std::to_string(index));
    }

    void TransferRegistry::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(sessions_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            try
            {
                auto loaded = std::make_shared<SessionEntry>();
                loaded->state = state_from_json(nlohmann::json::parse(file_io::read_text_file(entry.path())));
                sessions_[loaded->state.session_id] = std::move(loaded);
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping unreadable session record {}: {}", entry.path().string(), ex.what());
            }
        }
        spdlog::info("Loaded {} upload sessions", sessions_.size());
    }

    void TransferRegistry::persist_state(const ServerFile &state) const
    {
        file_io::write_file_atomically(metadata_path(state.session_id), to_json(state).dump(2));
    }

    TransferRegistry::EntryPtr TransferRegistry::find_by_task_locked(const std::string &task_id) const
    {
        const auto it = std::find_if(sessions_.begin(), sessions_.end(), [&](const auto &item)
                                     { return item.second->state.task_id == task_id; });
        return it == sessions_.end() ? nullptr : it->second;
    }

    TransferRegistry::EntryPtr TransferRegistry::lookup(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw RegistryError(uplink::ErrorCode::SessionUnknown, "Unknown session");
        }
        return it->second;
    }

    ServerFile &TransferRegistry::registered_locked(const EntryPtr &entry)
    {
        const auto it = sessions_.find(entry->state.session_id);
        if (it == sessions_.end() || it->second != entry)
        {
            throw RegistryError(uplink::ErrorCode::SessionUnknown, "Session was discarded");
        }
        return entry->state;
    }

    void TransferRegistry::discard(const EntryPtr &entry)
    {
        std::string session_id;
        {
            std::lock_guard lock(mutex_);
            session_id = entry->state.session_id;
            const auto it = sessions_.find(session_id);
            if (it != sessions_.end() && it->second == entry)
            {
                sessions_.erase(it);
            }
        }
        std::error_code ec;
        std::filesystem::remove_all(chunk_dir(session_id), ec);
        std::filesystem::remove(metadata_path(session_id), ec);
    }

} // namespace uplink::server
