#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "uplink/client/logger.hpp"

namespace uplink::client
{

    /// Periodically probes the collector and reports reachability transitions. Starts
    /// out reachable, and every start() returns to reachable; a listener is only
    /// called when the classification changes.
    class NetworkMonitor
    {
    public:
        /// Returns true when the collector answered within its timeout.
        using Probe = std::function<bool()>;
        using Listener = std::function<void(bool reachable)>;

        NetworkMonitor(Probe probe, Listener listener, std::chrono::milliseconds interval, Logger logger = Logger());
        ~NetworkMonitor();

        NetworkMonitor(const NetworkMonitor &) = delete;
        NetworkMonitor &operator=(const NetworkMonitor &) = delete;

        void start();
        void stop();

        bool reachable() const noexcept { return reachable_; }

        /// Runs one probe on the calling thread and applies the result.
        bool probe_now();

    private:
        void run();

        Probe probe_;
        Listener listener_;
        std::chrono::milliseconds interval_;
        Logger logger_;

        std::atomic<bool> reachable_{true};
        std::mutex mutex_;
        std::mutex probe_mutex_;
        std::condition_variable cv_;
        bool stopping_{false};
        std::thread thread_;
    };

} // namespace uplink::client
