#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "uplink/client/logger.hpp"
#include "uplink/client/task.hpp"

namespace uplink::client
{

    /// Status transition of one task. A progress update carries the same old and new status.
    struct TaskEvent
    {
        std::string task_id;
        TaskStatus old_status{TaskStatus::Pending};
        TaskStatus new_status{TaskStatus::Pending};
        std::uint64_t bytes_acked{};
        std::uint64_t total_bytes{};
        std::optional<std::string> error;

        bool is_progress() const noexcept { return old_status == new_status; }
    };

    TaskEvent make_event(const UploadTask &task, TaskStatus old_status);

    /// Bounded fan-out queue. publish() never waits for observers; when the queue is
    /// full the oldest undelivered event is dropped. Observers run on one dispatcher thread.
    class EventChannel
    {
    public:
        using Observer = std::function<void(const TaskEvent &)>;

        explicit EventChannel(std::size_t capacity = 1024, Logger logger = Logger());
        ~EventChannel();

        EventChannel(const EventChannel &) = delete;
        EventChannel &operator=(const EventChannel &) = delete;

        std::uint64_t subscribe(Observer observer);
        void unsubscribe(std::uint64_t id);

        void publish(TaskEvent event);

        /// Blocks until every event published so far has been delivered.
        void flush();

        std::uint64_t dropped() const;

    private:
        void run();

        std::size_t capacity_;
        Logger logger_;

        mutable std::mutex mutex_;
        std::condition_variable queue_cv_;
        std::condition_variable idle_cv_;
        std::deque<TaskEvent> queue_;
        std::map<std::uint64_t, Observer> observers_;
        std::uint64_t next_observer_id_{1};
        std::uint64_t dropped_{0};
        bool delivering_{false};
        bool stopping_{false};

        std::thread dispatcher_;
    };

} // namespace uplink::client
