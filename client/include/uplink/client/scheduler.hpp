#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "uplink/client/event_channel.hpp"
#include "uplink/client/state_store.hpp"
#include "uplink/client/task.hpp"

namespace uplink::client
{

    /// How a worker gives a task back.
    enum class TaskOutcome : std::uint8_t
    {
        Completed,
        Failed,
        // Ownership returned without a verdict (shutdown); the task becomes PENDING again.
        Released
    };

    /// Owns dispatch order and the UPLOADING population. Every status change goes
    /// through here (or through the worker that owns the task) and is published on
    /// the event channel.
    class UploadScheduler
    {
    public:
        UploadScheduler(StateStore &store, EventChannel &events, std::size_t concurrency_limit);

        /// Indexes PENDING records already in the store.
        void load();

        /// Assigns id (when empty) and creation time, persists the task as PENDING and
        /// queues it. Throws StateStoreError when the record cannot be written.
        UploadTask enqueue(UploadTask task);

        /// Highest-priority, oldest PENDING task, now UPLOADING and owned by the caller.
        /// Never blocks.
        std::optional<UploadTask> dequeue_next();

        /// Throws std::invalid_argument for a priority outside 1..10.
        bool reprioritize(const std::string &id, int priority);
        bool pause(const std::string &id);
        bool cancel(const std::string &id);
        bool resume(const std::string &id);
        bool retry(const std::string &id);
        std::size_t retry_all_failed();

        void set_dispatch_enabled(bool enabled);
        bool dispatch_enabled() const;

        /// Releases ownership. The verdict only applies while the task is still
        /// UPLOADING, so a cancel or pause issued meanwhile wins.
        void finish(const std::string &id, TaskOutcome outcome, const std::string &error = {});

        /// Persists one more failed attempt with its cause. Returns the new count.
        std::uint32_t record_retry(const std::string &id, const std::string &error);

        /// Deletes terminal records. Returns how many were removed.
        std::size_t remove_finished();

        std::size_t active_count() const;
        std::size_t queued_count() const;
        std::size_t concurrency_limit() const noexcept { return concurrency_limit_; }

        /// Waits until a dequeue could succeed or `timeout` passes.
        bool wait_for_work(std::chrono::milliseconds timeout);
        void notify_all();

    private:
        struct QueueKey
        {
            int priority{};
            std::uint64_t created_at{};
            std::string id;

            bool operator<(const QueueKey &other) const
            {
                if (priority != other.priority)
                {
                    return priority > other.priority;
                }
                if (created_at != other.created_at)
                {
                    return created_at < other.created_at;
                }
                return id < other.id;
            }
        };

        bool work_available_locked() const;
        void queue_locked(const UploadTask &task);
        void unqueue_locked(const std::string &id);
        std::optional<UploadTask> transition_locked(const std::string &id, const StateStore::Mutator &mutator);

        StateStore &store_;
        EventChannel &events_;
        std::size_t concurrency_limit_;

        mutable std::mutex mutex_;
        std::condition_variable work_cv_;
        std::set<QueueKey> queue_;
        std::unordered_map<std::string, QueueKey> queued_;
        std::unordered_set<std::string> active_;
        std::uint64_t last_created_at_{0};
        bool dispatch_enabled_{true};
    };

} // namespace uplink::client
