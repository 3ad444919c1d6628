#include "uplink/client/scheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace uplink::client
{

    UploadScheduler::UploadScheduler(StateStore &store, EventChannel &events, std::size_t concurrency_limit)
        : store_(store), events_(events), concurrency_limit_(concurrency_limit == 0 ? 1 : concurrency_limit)
    {
    }

    void UploadScheduler::load()
    {
        std::lock_guard lock(mutex_);
        for (const auto &task : store_.list_all())
        {
            last_created_at_ = std::max(last_created_at_, task.created_at);
            if (task.status == TaskStatus::Pending)
            {
                queue_locked(task);
            }
        }
        work_cv_.notify_all();
    }

    UploadTask UploadScheduler::enqueue(UploadTask task)
    {
        if (!valid_priority(task.priority))
        {
            throw std::invalid_argument("priority must be between 1 and 10");
        }
        {
            std::lock_guard lock(mutex_);
            task.created_at = std::max(now_ms(), last_created_at_ + 1);
            if (task.id.empty())
            {
                task.id = generate_task_id(task.created_at);
            }
            task.status = TaskStatus::Pending;
            task.bytes_acked = task.acked_bytes();
            store_.put(task);
            last_created_at_ = task.created_at;
            queue_locked(task);
        }
        events_.publish(make_event(task, TaskStatus::Pending));
        work_cv_.notify_one();
        return task;
    }

    std::optional<UploadTask> UploadScheduler::dequeue_next()
    {
        std::lock_guard lock(mutex_);
        if (!dispatch_enabled_ || active_.size() >= concurrency_limit_)
        {
            return std::nullopt;
        }
        for (auto it = queue_.begin(); it != queue_.end();)
        {
            const auto id = it->id;
            if (active_.contains(id))
            {
                // Still held by the worker that paused or was cancelled on it.
                ++it;
                continue;
            }
            auto claimed = store_.modify(id, [](UploadTask &task)
                                         {
                if (task.status != TaskStatus::Pending) {
                    return false;
                }
                task.status = TaskStatus::Uploading;
                if (task.started_at == 0) {
                    task.started_at = now_ms();
                }
                return true; });
            it = queue_.erase(it);
            queued_.erase(id);
            if (!claimed)
            {
                continue;
            }
            active_.insert(id);
            events_.publish(make_event(*claimed, TaskStatus::Pending));
            return claimed;
        }
        return std::nullopt;
    }

    bool UploadScheduler::reprioritize(const std::string &id, int priority)
    {
        if (!valid_priority(priority))
        {
            throw std::invalid_argument("priority must be between 1 and 10");
        }
        std::lock_guard lock(mutex_);
        const auto updated = store_.modify(id, [priority](UploadTask &task)
                                           {
            if (is_terminal(task.status)) {
                return false;
            }
            task.priority = priority;
            return true; });
        if (!updated)
        {
            return false;
        }
        if (queued_.contains(id))
        {
            unqueue_locked(id);
            queue_locked(*updated);
        }
        return true;
    }

    bool UploadScheduler::pause(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        const auto updated = transition_locked(id, [](UploadTask &task)
                                               {
            if (task.status != TaskStatus::Pending && task.status != TaskStatus::Uploading) {
                return false;
            }
            task.status = TaskStatus::Paused;
            return true; });
        if (!updated)
        {
            return false;
        }
        unqueue_locked(id);
        return true;
    }

    bool UploadScheduler::cancel(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        const auto updated = transition_locked(id, [](UploadTask &task)
                                               {
            if (is_terminal(task.status)) {
                return false;
            }
            task.status = TaskStatus::Cancelled;
            task.finished_at = now_ms();
            return true; });
        if (!updated)
        {
            return false;
        }
        unqueue_locked(id);
        return true;
    }

    bool UploadScheduler::resume(const std::string &id)
    {
        std::unique_lock lock(mutex_);
        const auto updated = transition_locked(id, [](UploadTask &task)
                                               {
            if (task.status != TaskStatus::Paused) {
                return false;
            }
            task.status = TaskStatus::Pending;
            return true; });
        if (!updated)
        {
            return false;
        }
        queue_locked(*updated);
        lock.unlock();
        work_cv_.notify_one();
        return true;
    }

    bool UploadScheduler::retry(const std::string &id)
    {
        std::unique_lock lock(mutex_);
        const auto updated = transition_locked(id, [](UploadTask &task)
                                               {
            if (task.status != TaskStatus::Failed) {
                return false;
            }
            task.status = TaskStatus::Pending;
            task.retry_count = 0;
            task.last_error.clear();
            task.finished_at = 0;
            return true; });
        if (!updated)
        {
            return false;
        }
        queue_locked(*updated);
        lock.unlock();
        work_cv_.notify_one();
        return true;
    }

    std::size_t UploadScheduler::retry_all_failed()
    {
        std::size_t count = 0;
        for (const auto &task : store_.list_by_status(TaskStatus::Failed))
        {
            if (retry(task.id))
            {
                ++count;
            }
        }
        return count;
    }

    void UploadScheduler::set_dispatch_enabled(bool enabled)
    {
        {
            std::lock_guard lock(mutex_);
            dispatch_enabled_ = enabled;
        }
        work_cv_.notify_all();
    }

    bool UploadScheduler::dispatch_enabled() const
    {
        std::lock_guard lock(mutex_);
        return dispatch_enabled_;
    }

    void UploadScheduler::finish(const std::string &id, TaskOutcome outcome, const std::string &error)
    {
        {
            std::lock_guard lock(mutex_);
            active_.erase(id);
            const auto updated = transition_locked(id, [&](UploadTask &task)
                                                   {
                if (task.status != TaskStatus::Uploading) {
                    return false;
                }
                switch (outcome) {
                case TaskOutcome::Completed:
                    task.status = TaskStatus::Completed;
                    task.last_error.clear();
                    task.finished_at = now_ms();
                    break;
                case TaskOutcome::Failed:
                    task.status = TaskStatus::Failed;
                    task.last_error = error;
                    task.finished_at = now_ms();
                    break;
                case TaskOutcome::Released:
                    task.status = TaskStatus::Pending;
                    for (auto &chunk : task.chunks) {
                        if (chunk.state == ChunkState::Sent) {
                            chunk.state = ChunkState::Pending;
                        }
                    }
                    break;
                }
                return true; });
            if (updated && updated->status == TaskStatus::Pending)
            {
                queue_locked(*updated);
            }
        }
        // A slot is free again, and a task skipped while still owned may now be eligible.
        work_cv_.notify_all();
    }

    std::uint32_t UploadScheduler::record_retry(const std::string &id, const std::string &error)
    {
        std::uint32_t attempts = 0;
        const auto updated = store_.modify(id, [&](UploadTask &task)
                                           {
            task.retry_count += 1;
            task.last_error = error;
            attempts = task.retry_count;
            return true; });
        if (updated)
        {
            events_.publish(make_event(*updated, updated->status));
        }
        return attempts;
    }

    std::size_t UploadScheduler::remove_finished()
    {
        std::lock_guard lock(mutex_);
        std::size_t removed = 0;
        for (const auto &task : store_.list_all())
        {
            if (is_terminal(task.status) && !active_.contains(task.id) && store_.remove(task.id))
            {
                ++removed;
            }
        }
        return removed;
    }

    std::size_t UploadScheduler::active_count() const
    {
        std::lock_guard lock(mutex_);
        return active_.size();
    }

    std::size_t UploadScheduler::queued_count() const
    {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    bool UploadScheduler::wait_for_work(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        return work_cv_.wait_for(lock, timeout, [this]
                                 { return work_available_locked(); });
    }

    void UploadScheduler::notify_all()
    {
        work_cv_.notify_all();
    }

    bool UploadScheduler::work_available_locked() const
    {
        if (!dispatch_enabled_ || active_.size() >= concurrency_limit_)
        {
            return false;
        }
        return std::any_of(queue_.begin(), queue_.end(), [this](const QueueKey &key)
                           { return !active_.contains(key.id); });
    }

    void UploadScheduler::queue_locked(const UploadTask &task)
    {
        unqueue_locked(task.id);
        QueueKey key{task.priority, task.created_at, task.id};
        queue_.insert(key);
        queued_.emplace(task.id, std::move(key));
    }

    void UploadScheduler::unqueue_locked(const std::string &id)
    {
        const auto it = queued_.find(id);
        if (it == queued_.end())
        {
            return;
        }
        queue_.erase(it->second);
        queued_.erase(it);
    }

    std::optional<UploadTask> UploadScheduler::transition_locked(const std::string &id,
                                                                 const StateStore::Mutator &mutator)
    {
        std::optional<TaskStatus> old_status;
        const auto updated = store_.modify(id, [&](UploadTask &task)
                                           {
            old_status = task.status;
            return mutator(task); });
        if (updated)
        {
            events_.publish(make_event(*updated, *old_status));
        }
        return updated;
    }

} // namespace uplink::client
