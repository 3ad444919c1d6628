#include "uplink/client/event_channel.hpp"

#include <vector>

namespace uplink::client
{

    TaskEvent make_event(const UploadTask &task, TaskStatus old_status)
    {
        TaskEvent event;
        event.task_id = task.id;
        event.old_status = old_status;
        event.new_status = task.status;
        event.bytes_acked = task.bytes_acked;
        event.total_bytes = task.total_bytes;
        if (!task.last_error.empty())
        {
            event.error = task.last_error;
        }
        return event;
    }

    EventChannel::EventChannel(std::size_t capacity, Logger logger)
        : capacity_(capacity == 0 ? 1 : capacity), logger_(std::move(logger))
    {
        dispatcher_ = std::thread([this]
                                  { run(); });
    }

    EventChannel::~EventChannel()
    {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();
        if (dispatcher_.joinable())
        {
            dispatcher_.join();
        }
    }

    std::uint64_t EventChannel::subscribe(Observer observer)
    {
        std::lock_guard lock(mutex_);
        const auto id = next_observer_id_++;
        observers_.emplace(id, std::move(observer));
        return id;
    }

    void EventChannel::unsubscribe(std::uint64_t id)
    {
        std::lock_guard lock(mutex_);
        observers_.erase(id);
    }

    void EventChannel::publish(TaskEvent event)
    {
        {
            std::lock_guard lock(mutex_);
            if (queue_.size() >= capacity_)
            {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(event));
        }
        queue_cv_.notify_one();
    }

    void EventChannel::flush()
    {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this]
                      { return (queue_.empty() && !delivering_) || stopping_; });
    }

    std::uint64_t EventChannel::dropped() const
    {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

    void EventChannel::run()
    {
        std::unique_lock lock(mutex_);
        while (true)
        {
            queue_cv_.wait(lock, [this]
                           { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
            {
                // Only reached when stopping; pending events are delivered first.
                break;
            }
            auto event = std::move(queue_.front());
            queue_.pop_front();
            std::vector<Observer> observers;
            observers.reserve(observers_.size());
            for (const auto &[id, observer] : observers_)
            {
                observers.push_back(observer);
            }
            delivering_ = true;
            lock.unlock();

            const TaskEvent &view = event;
            for (const auto &observer : observers)
            {
                try
                {
                    observer(view);
                }
                catch (const std::exception &ex)
                {
                    logger_.warn("events", "observer failed on ", view.task_id, ": ", ex.what());
                }
            }

            lock.lock();
            delivering_ = false;
            if (queue_.empty())
            {
                idle_cv_.notify_all();
            }
        }
        idle_cv_.notify_all();
    }

} // namespace uplink::client
