#include "uplink/client/network_monitor.hpp"

namespace uplink::client
{

    NetworkMonitor::NetworkMonitor(Probe probe, Listener listener, std::chrono::milliseconds interval, Logger logger)
        : probe_(std::move(probe)), listener_(std::move(listener)), interval_(interval), logger_(std::move(logger))
    {
    }

    NetworkMonitor::~NetworkMonitor()
    {
        stop();
    }

    void NetworkMonitor::start()
    {
        std::lock_guard lock(mutex_);
        if (thread_.joinable())
        {
            return;
        }
        stopping_ = false;
        {
            // A restart forgets what the previous run concluded.
            std::lock_guard probe_lock(probe_mutex_);
            if (!reachable_.exchange(true))
            {
                logger_.log("net", "monitor restarted, assuming collector reachable");
                if (listener_)
                {
                    listener_(true);
                }
            }
        }
        thread_ = std::thread([this]
                              { run(); });
    }

    void NetworkMonitor::stop()
    {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    bool NetworkMonitor::probe_now()
    {
        std::lock_guard probe_lock(probe_mutex_);
        bool now_reachable = false;
        try
        {
            now_reachable = probe_();
        }
        catch (const std::exception &ex)
        {
            logger_.warn("net", "probe failed: ", ex.what());
        }
        const bool was_reachable = reachable_.exchange(now_reachable);
        if (now_reachable != was_reachable)
        {
            if (now_reachable)
            {
                logger_.log("net", "collector reachable again, resuming dispatch");
            }
            else
            {
                logger_.warn("net", "collector unreachable, holding new dispatches");
            }
            if (listener_)
            {
                listener_(now_reachable);
            }
        }
        return now_reachable;
    }

    void NetworkMonitor::run()
    {
        std::unique_lock lock(mutex_);
        while (!stopping_)
        {
            if (cv_.wait_for(lock, interval_, [this]
                             { return stopping_; }))
            {
                break;
            }
            lock.unlock();
            probe_now();
            lock.lock();
        }
    }

} // namespace uplink::client
