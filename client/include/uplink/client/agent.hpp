#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplink/client/config.hpp"
#include "uplink/client/event_channel.hpp"
#include "uplink/client/logger.hpp"
#include "uplink/client/network_monitor.hpp"
#include "uplink/client/scheduler.hpp"
#include "uplink/client/state_store.hpp"
#include "uplink/client/task.hpp"
#include "uplink/client/transfer_protocol.hpp"
#include "uplink/client/worker_pool.hpp"
#include "uplink/protocol.hpp"

namespace uplink::client
{

    struct TaskFilter
    {
        std::optional<TaskStatus> status;
        // Substring match against the destination.
        std::optional<std::string> destination;
    };

    struct HistoryEntry
    {
        UploadTask task;
        std::chrono::milliseconds duration{0};
    };

    struct AgentStats
    {
        std::size_t pending{};
        std::size_t uploading{};
        std::size_t paused{};
        std::size_t completed{};
        std::size_t failed{};
        std::size_t cancelled{};
        std::uint64_t bytes_uploaded{};
        std::uint64_t events_dropped{};
        bool online{true};
    };

    /// Producer-facing surface of the upload subsystem. Enqueue only touches local
    /// disk, so files can be queued while the collector is unreachable.
    class UploadAgent
    {
    public:
        using TransportFactory = WorkerPool::TransportFactory;

        UploadAgent(ClientConfig config, Logger logger);
        UploadAgent(ClientConfig config, Logger logger, TransportFactory factory);
        ~UploadAgent();

        UploadAgent(const UploadAgent &) = delete;
        UploadAgent &operator=(const UploadAgent &) = delete;

        void start();
        void stop();

        /// Validates and hashes `file`, plans its chunks and persists the task before
        /// returning its id. Throws chunking::SourceReadError for a missing or unreadable
        /// file, std::invalid_argument for a bad priority or destination, and
        /// StateStoreError when the record cannot be written.
        std::string enqueue(const std::filesystem::path &file, const std::string &destination, int priority = 5,
                            nlohmann::json metadata = nlohmann::json::object());

        bool cancel(const std::string &id);
        bool reprioritize(const std::string &id, int priority);
        bool pause(const std::string &id);
        bool resume(const std::string &id);
        bool retry(const std::string &id);
        std::size_t retry_all_failed();

        std::optional<UploadTask> get_status(const std::string &id) const;
        std::vector<UploadTask> list_tasks(const TaskFilter &filter = {}) const;

        /// Terminal tasks, most recently finished first.
        std::vector<HistoryEntry> history(std::size_t limit) const;
        AgentStats stats() const;

        std::size_t clear_finished();

        std::uint64_t subscribe(EventChannel::Observer observer);
        void unsubscribe(std::uint64_t id);

        /// Files the collector has published. Throws TransferError.
        std::vector<uplink::protocol::CompletedUpload> remote_uploads();

        bool online() const;

        EventChannel &events() { return events_; }
        UploadScheduler &scheduler() { return scheduler_; }

    private:
        bool probe();

        ClientConfig config_;
        Logger logger_;
        TransportFactory factory_;
        StateStore store_;
        EventChannel events_;
        UploadScheduler scheduler_;
        WorkerPool pool_;
        std::unique_ptr<TransferProtocol> probe_transport_;
        NetworkMonitor monitor_;
        std::mutex lifecycle_mutex_;
        bool started_{false};
    };

} // namespace uplink::client
