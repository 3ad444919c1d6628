#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "uplink/client/config.hpp"
#include "uplink/client/event_channel.hpp"
#include "uplink/client/logger.hpp"
#include "uplink/client/scheduler.hpp"
#include "uplink/client/state_store.hpp"
#include "uplink/client/transfer_protocol.hpp"

namespace uplink::client
{

    /// Delay before retry number `attempt` (1-based): min(cap, base * 2^(attempt-1)).
    std::chrono::milliseconds backoff_delay(std::uint32_t attempt, std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap);

    class WorkerPool
    {
    public:
        /// Builds the protocol client of one worker; the argument is its per-operation timeout.
        using TransportFactory = std::function<std::unique_ptr<TransferProtocol>(std::chrono::milliseconds)>;

        WorkerPool(UploadScheduler &scheduler, StateStore &store, EventChannel &events, TransferConfig config,
                   TransportFactory factory, Logger logger);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void start();

        /// Lets workers reach a chunk boundary for up to shutdown_grace, then aborts the
        /// remaining network operations. Interrupted tasks go back to PENDING.
        void stop();

        bool running() const;
        std::size_t busy_workers() const;

    private:
        struct Worker
        {
            std::size_t index{};
            std::unique_ptr<TransferProtocol> transport;
            std::thread thread;
        };

        void run(Worker &worker);
        void process(Worker &worker, const UploadTask &task);
        void upload(Worker &worker, const std::string &id);
        void checkpoint(const std::string &id) const;
        bool sleep_interruptible(const std::string &id, std::chrono::milliseconds delay);
        bool should_abort(const std::string &id) const;

        UploadScheduler &scheduler_;
        StateStore &store_;
        EventChannel &events_;
        TransferConfig config_;
        TransportFactory factory_;
        Logger logger_;

        std::vector<std::unique_ptr<Worker>> workers_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::atomic<bool> stopping_{false};
        bool running_{false};
        std::size_t busy_{0};
    };

} // namespace uplink::client
