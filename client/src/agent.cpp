#include "uplink/client/agent.hpp"

#include <algorithm>
#include <stdexcept>

#include "uplink/client/chunker.hpp"
#include "uplink/client/tcp_transfer_client.hpp"
#include "uplink/crypto.hpp"

namespace uplink::client
{

    namespace
    {

        WorkerPool::TransportFactory tcp_factory(const ClientConfig &config, const Logger &logger)
        {
            return [host = config.host, port = config.port, logger](std::chrono::milliseconds timeout)
            {
                return std::make_unique<TcpTransferClient>(host, port, timeout, logger);
            };
        }

    } // namespace

    UploadAgent::UploadAgent(ClientConfig config, Logger logger)
        : UploadAgent(config, logger, tcp_factory(config, logger))
    {
    }

    UploadAgent::UploadAgent(ClientConfig config, Logger logger, TransportFactory factory)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          factory_(std::move(factory)),
          store_(config_.state_dir, logger_),
          events_(1024, logger_),
          scheduler_(store_, events_, config_.transfer.concurrency),
          pool_(scheduler_, store_, events_, config_.transfer, factory_, logger_),
          probe_transport_(factory_(config_.transfer.probe_timeout)),
          monitor_([this]
                   { return probe(); },
                   [this](bool reachable)
                   { scheduler_.set_dispatch_enabled(reachable); },
                   config_.transfer.probe_interval, logger_)
    {
        const auto recovered = store_.recover_interrupted();
        if (recovered > 0)
        {
            logger_.log("agent", "re-queued ", recovered, " interrupted task(s)");
        }
        scheduler_.load();
    }

    UploadAgent::~UploadAgent()
    {
        stop();
    }

    void UploadAgent::start()
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (started_)
        {
            return;
        }
        pool_.start();
        monitor_.start();
        started_ = true;
        logger_.log("agent", "started against ", config_.host, ':', config_.port);
    }

    void UploadAgent::stop()
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (!started_)
        {
            return;
        }
        monitor_.stop();
        pool_.stop();
        events_.flush();
        started_ = false;
        logger_.log("agent", "stopped");
    }

    std::string UploadAgent::enqueue(const std::filesystem::path &file, const std::string &destination, int priority,
                                     nlohmann::json metadata)
    {
        if (destination.empty())
        {
            throw std::invalid_argument("destination must not be empty");
        }
        if (!valid_priority(priority))
        {
            throw std::invalid_argument("priority must be between 1 and 10");
        }
        if (!metadata.is_object())
        {
            throw std::invalid_argument("metadata must be a JSON object");
        }

        std::error_code ec;
        const auto status = std::filesystem::status(file, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw chunking::SourceReadError(file, "no such file");
        }
        if (!std::filesystem::is_regular_file(status))
        {
            throw chunking::SourceReadError(file, "not a regular file");
        }

        UploadTask task;
        try
        {
            task.source_path = std::filesystem::absolute(file);
            task.total_bytes = std::filesystem::file_size(file);
            task.file_checksum = uplink::crypto::hash_file(file);
            if (std::filesystem::file_size(file) != task.total_bytes)
            {
                throw std::runtime_error("file changed while it was being hashed");
            }
        }
        catch (const std::runtime_error &ex)
        {
            throw chunking::SourceReadError(file, ex.what());
        }
        task.destination = destination;
        task.priority = priority;
        task.chunk_size = config_.transfer.chunk_size;
        task.metadata = std::move(metadata);
        task.chunks = chunking::plan(task.total_bytes, task.chunk_size);

        const auto queued = scheduler_.enqueue(std::move(task));
        logger_.log("agent", "enqueued ", queued.id, ' ', queued.source_path.string(), " -> ", queued.destination, " (",
                    queued.total_bytes, " bytes, ", queued.chunks.size(), " chunks, priority ", queued.priority, ")");
        return queued.id;
    }

    bool UploadAgent::cancel(const std::string &id)
    {
        return scheduler_.cancel(id);
    }

    bool UploadAgent::reprioritize(const std::string &id, int priority)
    {
        return scheduler_.reprioritize(id, priority);
    }

    bool UploadAgent::pause(const std::string &id)
    {
        return scheduler_.pause(id);
    }

    bool UploadAgent::resume(const std::string &id)
    {
        return scheduler_.resume(id);
    }

    bool UploadAgent::retry(const std::string &id)
    {
        return scheduler_.retry(id);
    }

    std::size_t UploadAgent::retry_all_failed()
    {
        return scheduler_.retry_all_failed();
    }

    std::optional<UploadTask> UploadAgent::get_status(const std::string &id) const
    {
        return store_.get(id);
    }

    std::vector<UploadTask> UploadAgent::list_tasks(const TaskFilter &filter) const
    {
        auto tasks = store_.list_all();
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(), [&](const UploadTask &task)
                                   {
            if (filter.status && task.status != *filter.status) {
                return true;
            }
            return filter.destination && task.destination.find(*filter.destination) == std::string::npos; }),
                    tasks.end());
        return tasks;
    }

    std::vector<HistoryEntry> UploadAgent::history(std::size_t limit) const
    {
        std::vector<HistoryEntry> entries;
        for (auto &task : store_.list_all())
        {
            if (!is_terminal(task.status))
            {
                continue;
            }
            HistoryEntry entry;
            if (task.started_at != 0 && task.finished_at >= task.started_at)
            {
                entry.duration = std::chrono::milliseconds(task.finished_at - task.started_at);
            }
            entry.task = std::move(task);
            entries.push_back(std::move(entry));
        }
        std::sort(entries.begin(), entries.end(), [](const HistoryEntry &lhs, const HistoryEntry &rhs)
                  { return lhs.task.finished_at > rhs.task.finished_at; });
        if (entries.size() > limit)
        {
            entries.resize(limit);
        }
        return entries;
    }

    AgentStats UploadAgent::stats() const
    {
        AgentStats stats;
        for (const auto &task : store_.list_all())
        {
            switch (task.status)
            {
            case TaskStatus::Pending:
                ++stats.pending;
                break;
            case TaskStatus::Uploading:
                ++stats.uploading;
                break;
            case TaskStatus::Paused:
                ++stats.paused;
                break;
            case TaskStatus::Completed:
                ++stats.completed;
                break;
            case TaskStatus::Failed:
                ++stats.failed;
                break;
            case TaskStatus::Cancelled:
                ++stats.cancelled;
                break;
            }
            stats.bytes_uploaded += task.bytes_acked;
        }
        stats.events_dropped = events_.dropped();
        stats.online = monitor_.reachable();
        return stats;
    }

    std::size_t UploadAgent::clear_finished()
    {
        const auto removed = scheduler_.remove_finished();
        logger_.log("agent", "cleared ", removed, " finished task(s)");
        return removed;
    }

    std::uint64_t UploadAgent::subscribe(EventChannel::Observer observer)
    {
        return events_.subscribe(std::move(observer));
    }

    void UploadAgent::unsubscribe(std::uint64_t id)
    {
        events_.unsubscribe(id);
    }

    std::vector<uplink::protocol::CompletedUpload> UploadAgent::remote_uploads()
    {
        auto transport = factory_(config_.transfer.operation_timeout);
        return transport->list_uploads();
    }

    bool UploadAgent::online() const
    {
        return monitor_.reachable();
    }

    bool UploadAgent::probe()
    {
        try
        {
            probe_transport_->ping();
            return true;
        }
        catch (const TransferError &ex)
        {
            logger_.log("net", "probe: ", ex.what());
            return false;
        }
    }

} // namespace uplink::client
