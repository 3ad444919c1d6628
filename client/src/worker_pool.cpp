#include "uplink/client/worker_pool.hpp"

#include <algorithm>
#include <set>

#include "uplink/client/chunker.hpp"

namespace uplink::client
{

    namespace
    {

        constexpr std::chrono::milliseconds kIdlePoll{100};
        constexpr std::chrono::milliseconds kBackoffSlice{50};

        // Thrown at a chunk boundary when the task was paused, cancelled or the pool is stopping.
        class TransferAborted : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

    } // namespace

    std::chrono::milliseconds backoff_delay(std::uint32_t attempt, std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap)
    {
        if (attempt == 0)
        {
            return std::chrono::milliseconds{0};
        }
        auto delay = base;
        for (std::uint32_t i = 1; i < attempt && delay < cap; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, cap);
    }

    WorkerPool::WorkerPool(UploadScheduler &scheduler, StateStore &store, EventChannel &events, TransferConfig config,
                           TransportFactory factory, Logger logger)
        : scheduler_(scheduler),
          store_(store),
          events_(events),
          config_(config),
          factory_(std::move(factory)),
          logger_(std::move(logger))
    {
    }

    WorkerPool::~WorkerPool()
    {
        stop();
    }

    void WorkerPool::start()
    {
        std::lock_guard lock(mutex_);
        if (running_)
        {
            return;
        }
        stopping_ = false;
        running_ = true;
        workers_.clear();
        const auto count = std::max<std::size_t>(config_.concurrency, 1);
        for (std::size_t i = 0; i < count; ++i)
        {
            auto worker = std::make_unique<Worker>();
            worker->index = i;
            worker->transport = factory_(config_.operation_timeout);
            workers_.push_back(std::move(worker));
        }
        for (auto &worker : workers_)
        {
            worker->thread = std::thread([this, raw = worker.get()]
                                         { run(*raw); });
        }
        logger_.log("pool", "started ", count, " worker(s)");
    }

    void WorkerPool::stop()
    {
        {
            std::unique_lock lock(mutex_);
            if (!running_)
            {
                return;
            }
            stopping_ = true;
            cv_.notify_all();
            scheduler_.notify_all();
            if (!cv_.wait_for(lock, config_.shutdown_grace, [this]
                              { return busy_ == 0; }))
            {
                logger_.warn("pool", busy_, " worker(s) still busy after grace period, aborting transfers");
                for (auto &worker : workers_)
                {
                    worker->transport->cancel();
                }
            }
        }
        for (auto &worker : workers_)
        {
            if (worker->thread.joinable())
            {
                worker->thread.join();
            }
        }
        std::lock_guard lock(mutex_);
        workers_.clear();
        running_ = false;
        logger_.log("pool", "stopped");
    }

    bool WorkerPool::running() const
    {
        std::lock_guard lock(mutex_);
        return running_ && !stopping_;
    }

    std::size_t WorkerPool::busy_workers() const
    {
        std::lock_guard lock(mutex_);
        return busy_;
    }

    void WorkerPool::run(Worker &worker)
    {
        while (!stopping_)
        {
            std::optional<UploadTask> task;
            try
            {
                task = scheduler_.dequeue_next();
            }
            catch (const StateStoreError &ex)
            {
                logger_.error("worker", "dequeue failed: ", ex.what());
            }
            if (!task)
            {
                scheduler_.wait_for_work(kIdlePoll);
                continue;
            }

            {
                std::lock_guard lock(mutex_);
                ++busy_;
            }
            process(worker, *task);
            {
                std::lock_guard lock(mutex_);
                --busy_;
            }
            cv_.notify_all();
        }
    }

    void WorkerPool::process(Worker &worker, const UploadTask &task)
    {
        const auto &id = task.id;
        logger_.log("worker", "#", worker.index, " picked ", id, " (", task.source_path.string(), " -> ",
                    task.destination, ", priority ", task.priority, ")");

        auto release = [&](TaskOutcome outcome, const std::string &error)
        {
            try
            {
                scheduler_.finish(id, outcome, error);
            }
            catch (const StateStoreError &ex)
            {
                logger_.error("worker", "cannot record outcome of ", id, ": ", ex.what());
            }
        };

        while (true)
        {
            if (should_abort(id))
            {
                release(TaskOutcome::Released, {});
                return;
            }
            std::string failure;
            try
            {
                upload(worker, id);
                logger_.log("worker", "completed ", id);
                release(TaskOutcome::Completed, {});
                return;
            }
            catch (const TransferAborted &ex)
            {
                logger_.log("worker", "released ", id, ": ", ex.what());
                release(TaskOutcome::Released, {});
                return;
            }
            catch (const chunking::SourceReadError &ex)
            {
                logger_.error("worker", id, " failed: ", ex.what());
                release(TaskOutcome::Failed, ex.what());
                return;
            }
            catch (const StateStoreError &ex)
            {
                logger_.error("worker", id, " failed: ", ex.what());
                release(TaskOutcome::Failed, ex.what());
                return;
            }
            catch (const IncompleteTransferError &ex)
            {
                try
                {
                    const auto updated = store_.reset_chunks(id, ex.affected());
                    events_.publish(make_event(updated, updated.status));
                }
                catch (const StateStoreError &store_ex)
                {
                    release(TaskOutcome::Failed, store_ex.what());
                    return;
                }
                failure = std::string(uplink::to_string(ex.code())) + ": " + ex.what();
            }
            catch (const TransferError &ex)
            {
                if (stopping_)
                {
                    release(TaskOutcome::Released, {});
                    return;
                }
                if (!ex.retryable())
                {
                    const auto reason = std::string(uplink::to_string(ex.code())) + ": " + ex.what();
                    logger_.error("worker", id, " failed permanently: ", reason);
                    release(TaskOutcome::Failed, reason);
                    return;
                }
                failure = std::string(uplink::to_string(ex.code())) + ": " + ex.what();
            }
            catch (const std::exception &ex)
            {
                logger_.error("worker", id, " failed unexpectedly: ", ex.what());
                release(TaskOutcome::Failed, std::string("internal_error: ") + ex.what());
                return;
            }

            std::uint32_t attempts = 0;
            try
            {
                attempts = scheduler_.record_retry(id, failure);
            }
            catch (const StateStoreError &ex)
            {
                release(TaskOutcome::Failed, ex.what());
                return;
            }
            if (attempts >= config_.max_attempts)
            {
                logger_.error("worker", id, " failed after ", attempts, " attempt(s): ", failure);
                release(TaskOutcome::Failed, failure);
                return;
            }
            const auto delay = backoff_delay(attempts, config_.retry_base_delay, config_.retry_max_delay);
            logger_.warn("worker", id, " attempt ", attempts, " failed (", failure, "), retrying in ", delay.count(),
                         " ms");
            if (!sleep_interruptible(id, delay))
            {
                release(TaskOutcome::Released, {});
                return;
            }
        }
    }

    void WorkerPool::upload(Worker &worker, const std::string &id)
    {
        auto &transport = *worker.transport;
        auto task = store_.get(id);
        if (!task)
        {
            throw TransferAborted("task record disappeared");
        }

        uplink::protocol::OpenSessionRequest request{
            .task_id = task->id,
            .destination = task->destination,
            .total_size = task->total_bytes,
            .chunk_size = task->chunk_size,
            .chunk_count = static_cast<std::uint64_t>(task->chunks.size()),
            .file_checksum = task->file_checksum,
            .metadata = task->metadata,
        };
        const auto session = transport.open_session(request);

        // The server's view is authoritative in both directions: everything below its
        // contiguous frontier is stored, and a local ACK past it survives only if the
        // server lists that chunk too.
        const auto frontier = std::min<std::uint64_t>(session.contiguous_chunks, task->chunks.size());
        const std::set<std::uint64_t> stored_beyond(session.stored_beyond.begin(), session.stored_beyond.end());
        std::uint64_t rewound = 0;
        const auto synced = store_.modify(id, [&](UploadTask &record)
                                          {
            record.session_id = session.session_id;
            for (auto &chunk : record.chunks) {
                if (chunk.index < frontier) {
                    chunk.state = ChunkState::Acked;
                } else if (chunk.state == ChunkState::Acked && stored_beyond.contains(chunk.index)) {
                    continue;
                } else if (chunk.state != ChunkState::Pending) {
                    if (chunk.state == ChunkState::Acked) {
                        ++rewound;
                    }
                    chunk.state = ChunkState::Pending;
                    chunk.checksum.clear();
                }
            }
            record.bytes_acked = record.acked_bytes();
            return true; });
        if (!synced)
        {
            throw TransferAborted("task record disappeared");
        }
        task = *synced;
        if (rewound > 0)
        {
            logger_.warn("worker", id, " server holds only ", frontier, " chunk(s); re-sending ", rewound,
                         " chunk(s) acknowledged earlier");
        }
        if (session.resumed)
        {
            logger_.log("worker", id, " resumed session ", session.session_id, " at chunk ", frontier, "/",
                        task->chunks.size());
        }
        events_.publish(make_event(*task, task->status));

        if (!session.complete)
        {
            for (const auto &chunk : task->chunks)
            {
                if (chunk.state == ChunkState::Acked)
                {
                    continue;
                }
                checkpoint(id);
                const auto data = chunking::read_chunk(task->source_path, chunk);
                const auto checksum = chunking::checksum(data);
                store_.modify(id, [&](UploadTask &record)
                              {
                    record.chunks[chunk.index].state = ChunkState::Sent;
                    return true; });
                transport.send_chunk(session.session_id, id, chunk, data, checksum);
                const auto updated = store_.update_progress(id, chunk.index, checksum);
                events_.publish(make_event(updated, updated.status));
            }
        }

        checkpoint(id);
        const auto published = transport.finalize(session.session_id, id, task->file_checksum);
        logger_.log("worker", id, " published as ", published.path, " (", published.checksum, ")");
    }

    void WorkerPool::checkpoint(const std::string &id) const
    {
        if (stopping_)
        {
            throw TransferAborted("shutting down");
        }
        const auto status = store_.status_of(id);
        if (!status || *status != TaskStatus::Uploading)
        {
            throw TransferAborted(status ? std::string("task is ") + std::string(to_string(*status))
                                         : std::string("task record disappeared"));
        }
    }

    bool WorkerPool::sleep_interruptible(const std::string &id, std::chrono::milliseconds delay)
    {
        const auto until = std::chrono::steady_clock::now() + delay;
        std::unique_lock lock(mutex_);
        while (std::chrono::steady_clock::now() < until)
        {
            const auto slice = std::min<std::chrono::steady_clock::duration>(
                kBackoffSlice, until - std::chrono::steady_clock::now());
            if (cv_.wait_for(lock, slice, [this]
                             { return stopping_.load(); }))
            {
                return false;
            }
            lock.unlock();
            const auto abort = should_abort(id);
            lock.lock();
            if (abort)
            {
                return false;
            }
        }
        return true;
    }

    bool WorkerPool::should_abort(const std::string &id) const
    {
        if (stopping_)
        {
            return true;
        }
        const auto status = store_.status_of(id);
        return !status || *status != TaskStatus::Uploading;
    }

} // namespace uplink::client
