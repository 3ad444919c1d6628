#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplink/client/agent.hpp"
#include "uplink/client/chunker.hpp"
#include "uplink/client/shell.hpp"
#include "uplink/client/state_store.hpp"
#include "uplink/crypto.hpp"
#include "uplink/file_io.hpp"
#include "test_support.hpp"

using namespace uplink;
using namespace uplink::client;
using uplink::testing::FakeNetwork;
using uplink::testing::FakeTransport;
using uplink::testing::TempDir;
using uplink::testing::wait_until;

namespace
{

    ClientConfig make_config(const std::filesystem::path &state_dir, std::uint64_t chunk_size, std::size_t workers = 1)
    {
        ClientConfig config;
        config.host = "collector.test";
        config.port = 9;
        config.state_dir = state_dir;
        config.transfer.chunk_size = chunk_size;
        config.transfer.concurrency = workers;
        config.transfer.retry_base_delay = std::chrono::milliseconds(20);
        config.transfer.retry_max_delay = std::chrono::milliseconds(80);
        config.transfer.max_attempts = 4;
        config.transfer.probe_interval = std::chrono::hours(1);
        config.transfer.probe_timeout = std::chrono::milliseconds(200);
        config.transfer.operation_timeout = std::chrono::seconds(2);
        config.transfer.shutdown_grace = std::chrono::seconds(2);
        return config;
    }

    class EventLog
    {
    public:
        EventChannel::Observer observer()
        {
            return [this](const TaskEvent &event)
            {
                std::lock_guard lock(mutex_);
                events_.push_back(event);
            };
        }

        std::vector<TaskEvent> for_task(const std::string &id) const
        {
            std::lock_guard lock(mutex_);
            std::vector<TaskEvent> matching;
            std::copy_if(events_.begin(), events_.end(), std::back_inserter(matching), [&](const TaskEvent &event)
                         { return event.task_id == id; });
            return matching;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<TaskEvent> events_;
    };

    bool reaches(const UploadAgent &agent, const std::string &id, TaskStatus status)
    {
        return wait_until([&]
                          {
            const auto task = agent.get_status(id);
            return task && task->status == status; });
    }

    std::size_t count_index(FakeNetwork &network, std::uint64_t index)
    {
        std::lock_guard lock(network.mutex);
        return static_cast<std::size_t>(std::count(network.sent_indices.begin(), network.sent_indices.end(), index));
    }

    void reset_counters(FakeNetwork &network)
    {
        network.opens = 0;
        network.sends = 0;
        network.finalizes = 0;
        std::lock_guard lock(network.mutex);
        network.sent_indices.clear();
        network.rejected_indices.clear();
    }

    void test_upload_completes()
    {
        TempDir dir("worker_complete");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "clip.bin", 10 * 1024 + 100);
        const auto empty = uplink::testing::write_pattern_file(dir / "empty.bin", 0);

        EventLog log;
        UploadAgent agent(make_config(dir / "state", 1024), Logger(), uplink::testing::fake_factory(network));
        agent.subscribe(log.observer());
        const auto id = agent.enqueue(source, "cam/clip.bin", 5, {{"camera", "front"}});
        const auto empty_id = agent.enqueue(empty, "cam/empty.bin");

        const auto queued = agent.get_status(id);
        assert(queued->status == TaskStatus::Pending);
        assert(queued->chunks.size() == 11);
        assert(queued->file_checksum == crypto::hash_file(source));

        agent.start();
        assert(reaches(agent, id, TaskStatus::Completed));
        assert(reaches(agent, empty_id, TaskStatus::Completed));
        agent.stop();

        const auto done = agent.get_status(id);
        assert(done->bytes_acked == done->total_bytes);
        assert(std::all_of(done->chunks.begin(), done->chunks.end(), [](const ChunkDescriptor &chunk)
                           { return chunk.state == ChunkState::Acked && !chunk.checksum.empty(); }));
        assert(done->finished_at >= done->started_at);
        assert(network.sends == 11);
        assert(network.finalizes == 2);

        const auto published = network.filesystem.completed_root() / "cam" / "clip.bin";
        assert(crypto::hash_file(published) == done->file_checksum);
        assert(std::filesystem::file_size(network.filesystem.completed_root() / "cam" / "empty.bin") == 0);
        const auto sidecar = nlohmann::json::parse(
            file_io::read_text_file(server::Filesystem::metadata_path(published)));
        assert(sidecar.at("metadata").at("camera") == "front");

        const auto events = log.for_task(id);
        assert(!events.empty());
        const auto dispatched = std::find_if(events.begin(), events.end(), [](const TaskEvent &event)
                                             { return !event.is_progress(); });
        assert(dispatched != events.end());
        assert(dispatched->old_status == TaskStatus::Pending);
        assert(dispatched->new_status == TaskStatus::Uploading);
        assert(events.back().new_status == TaskStatus::Completed);
        for (std::size_t i = 1; i < events.size(); ++i)
        {
            assert(events[i].bytes_acked >= events[i - 1].bytes_acked);
        }

        const auto history = agent.history(10);
        assert(history.size() == 2);
        const auto stats = agent.stats();
        assert(stats.completed == 2);
        assert(stats.bytes_uploaded == done->total_bytes);
        assert(agent.remote_uploads().size() == 2);
        assert(agent.clear_finished() == 2);
        assert(agent.list_tasks().empty());
    }

    void test_enqueue_validation()
    {
        TempDir dir("worker_enqueue");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "a.bin", 16);
        UploadAgent agent(make_config(dir / "state", 1024), Logger(), uplink::testing::fake_factory(network));

        bool threw = false;
        try
        {
            agent.enqueue(dir / "missing.bin", "x.bin");
        }
        catch (const chunking::SourceReadError &ex)
        {
            threw = ex.code() == ErrorCode::SourceUnreadable;
        }
        assert(threw);

        threw = false;
        try
        {
            agent.enqueue(dir.path(), "x.bin");
        }
        catch (const chunking::SourceReadError &)
        {
            threw = true;
        }
        assert(threw);

        for (const auto priority : {0, 11})
        {
            threw = false;
            try
            {
                agent.enqueue(source, "x.bin", priority);
            }
            catch (const std::invalid_argument &)
            {
                threw = true;
            }
            assert(threw);
        }

        threw = false;
        try
        {
            agent.enqueue(source, "");
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
        assert(agent.list_tasks().empty());

        // Queuing works without any collector contact.
        network.unreachable = true;
        const auto id = agent.enqueue(source, "a.bin", 7);
        assert(agent.get_status(id)->priority == 7);
        assert(network.opens == 0);

        TaskFilter filter;
        filter.status = TaskStatus::Pending;
        filter.destination = "a.b";
        assert(agent.list_tasks(filter).size() == 1);
        filter.destination = "zzz";
        assert(agent.list_tasks(filter).empty());
    }

    // Leaves a task as a crashed run would: UPLOADING, `local_acked` chunks ACKED in the
    // store, the next one SENT, and `server_chunks` chunks stored by the collector.
    std::string prepare_interrupted(const std::filesystem::path &state_dir, FakeNetwork &network,
                                    const std::filesystem::path &source, std::uint64_t chunk_size,
                                    std::uint64_t server_chunks, std::uint64_t local_acked)
    {
        std::string id;
        {
            UploadAgent agent(make_config(state_dir, chunk_size), Logger(), uplink::testing::fake_factory(network));
            id = agent.enqueue(source, "resume/" + source.filename().string());
        }

        StateStore store(state_dir);
        const auto task = *store.get(id);
        FakeTransport transport(network);
        const auto session = transport.open_session(protocol::OpenSessionRequest{
            .task_id = task.id,
            .destination = task.destination,
            .total_size = task.total_bytes,
            .chunk_size = task.chunk_size,
            .chunk_count = task.chunks.size(),
            .file_checksum = task.file_checksum,
            .metadata = task.metadata,
        });
        for (std::uint64_t index = 0; index < server_chunks; ++index)
        {
            const auto data = chunking::read_chunk(source, task.chunks[index]);
            transport.send_chunk(session.session_id, id, task.chunks[index], data, chunking::checksum(data));
        }
        store.modify(id, [&](UploadTask &record)
                     {
            record.status = TaskStatus::Uploading;
            record.session_id = session.session_id;
            if (local_acked < record.chunks.size()) {
                record.chunks[local_acked].state = ChunkState::Sent;
            }
            return true; });
        for (std::uint64_t index = 0; index < local_acked; ++index)
        {
            const auto data = chunking::read_chunk(source, task.chunks[index]);
            store.update_progress(id, index, chunking::checksum(data));
        }
        reset_counters(network);
        return id;
    }

    void test_resume_after_interruption()
    {
        TempDir dir("worker_resume");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "big.bin", 8000);
        const auto id = prepare_interrupted(dir / "state", network, source, 1024, 3, 3);

        UploadAgent agent(make_config(dir / "state", 1024), Logger(), uplink::testing::fake_factory(network));
        const auto recovered = agent.get_status(id);
        assert(recovered->status == TaskStatus::Pending);
        assert(recovered->bytes_acked == 3 * 1024);
        assert(recovered->chunks[3].state == ChunkState::Pending);

        agent.start();
        assert(reaches(agent, id, TaskStatus::Completed));
        agent.stop();

        // Eight chunks, three already delivered.
        assert(network.sends == 5);
        {
            std::lock_guard lock(network.mutex);
            assert((network.sent_indices == std::vector<std::uint64_t>{3, 4, 5, 6, 7}));
        }
        assert(network.registry.chunks_written() == 8);
        assert(crypto::hash_file(network.filesystem.completed_root() / "resume" / "big.bin") == crypto::hash_file(source));
    }

    void test_resume_trusts_server_frontier()
    {
        {
            // The collector stored one chunk the crashed client never recorded.
            TempDir dir("worker_frontier_ahead");
            FakeNetwork network(dir / "server");
            const auto source = uplink::testing::write_pattern_file(dir / "ahead.bin", 6 * 512);
            const auto id = prepare_interrupted(dir / "state", network, source, 512, 4, 3);

            UploadAgent agent(make_config(dir / "state", 512), Logger(), uplink::testing::fake_factory(network));
            agent.start();
            assert(reaches(agent, id, TaskStatus::Completed));
            agent.stop();
            assert(network.sends == 2);
        }
        {
            // The collector lost chunks the client believed delivered.
            TempDir dir("worker_frontier_behind");
            FakeNetwork network(dir / "server");
            const auto source = uplink::testing::write_pattern_file(dir / "behind.bin", 6 * 512);
            const auto id = prepare_interrupted(dir / "state", network, source, 512, 2, 4);

            EventLog log;
            UploadAgent agent(make_config(dir / "state", 512), Logger(), uplink::testing::fake_factory(network));
            agent.subscribe(log.observer());
            agent.start();
            assert(reaches(agent, id, TaskStatus::Completed));
            agent.stop();
            assert(network.sends == 4);
            assert(count_index(network, 0) == 0);
            assert(count_index(network, 2) == 1);

            const auto events = log.for_task(id);
            const auto sync = std::find_if(events.begin(), events.end(), [](const TaskEvent &event)
                                           { return event.is_progress(); });
            assert(sync != events.end());
            assert(sync->bytes_acked == 2 * 512);
        }
    }

    void test_corrupted_chunk_is_resent()
    {
        TempDir dir("worker_corrupt");
        FakeNetwork network(dir / "server");
        network.corrupt_index = 2;
        network.corrupt_times = 1;
        const auto source = uplink::testing::write_pattern_file(dir / "clip.bin", 6 * 256);

        UploadAgent agent(make_config(dir / "state", 256), Logger(), uplink::testing::fake_factory(network));
        const auto id = agent.enqueue(source, "clip.bin");
        agent.start();
        assert(reaches(agent, id, TaskStatus::Completed));
        agent.stop();

        {
            std::lock_guard lock(network.mutex);
            assert((network.rejected_indices == std::vector<std::uint64_t>{2}));
        }
        assert(network.sends == 7);
        assert(count_index(network, 2) == 2);
        assert(count_index(network, 1) == 1);
        assert(count_index(network, 3) == 1);
        assert(network.finalizes == 1);
        const auto done = agent.get_status(id);
        assert(done->retry_count == 1);
        assert(crypto::hash_file(network.filesystem.completed_root() / "clip.bin") == done->file_checksum);
    }

    void test_damaged_chunk_found_at_finalize()
    {
        TempDir dir("worker_finalize_gap");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "clip.bin", 6 * 256);
        const auto server_root = dir / "server";
        std::atomic<bool> damaged{false};
        network.on_send = [&](const std::string &task_id, std::uint64_t index)
        {
            // Just before the last chunk lands, chunk 1 rots on the collector's disk.
            if (index == 5 && !damaged.exchange(true))
            {
                const auto session_id = network.registry.status(task_id).session_id;
                uplink::testing::write_bytes(server_root / ".uplink" / "chunks" / session_id / "chunk_1",
                                             uplink::testing::pattern_bytes(256, 99));
            }
        };

        UploadAgent agent(make_config(dir / "state", 256), Logger(), uplink::testing::fake_factory(network));
        const auto id = agent.enqueue(source, "clip.bin");
        agent.start();
        assert(reaches(agent, id, TaskStatus::Completed));
        agent.stop();

        // Only the damaged chunk travels twice.
        assert(network.sends == 7);
        assert(count_index(network, 1) == 2);
        assert(count_index(network, 4) == 1);
        assert(network.finalizes == 2);
        assert(agent.get_status(id)->retry_count == 1);
        assert(crypto::hash_file(network.filesystem.completed_root() / "clip.bin") == crypto::hash_file(source));
    }

    void test_unreachable_collector()
    {
        TempDir dir("worker_unreachable");
        FakeNetwork network(dir / "server");
        network.unreachable = true;
        const auto source = uplink::testing::write_pattern_file(dir / "clip.bin", 3000);

        auto config = make_config(dir / "state", 1024);
        config.transfer.max_attempts = 3;
        EventLog log;
        UploadAgent agent(config, Logger(), uplink::testing::fake_factory(network));
        agent.subscribe(log.observer());
        const auto id = agent.enqueue(source, "clip.bin");
        const auto started = std::chrono::steady_clock::now();
        agent.start();

        // While retrying, the task remains UPLOADING rather than failing.
        assert(wait_until([&]
                          { return agent.get_status(id)->retry_count >= 1; }));
        const auto midway = agent.get_status(id);
        assert(midway->status == TaskStatus::Uploading || midway->status == TaskStatus::Failed);

        assert(reaches(agent, id, TaskStatus::Failed));
        const auto elapsed = std::chrono::steady_clock::now() - started;
        agent.stop();

        const auto failed = agent.get_status(id);
        assert(failed->retry_count == 3);
        assert(failed->last_error.find("unreachable") != std::string::npos);
        assert(failed->bytes_acked == 0);
        // Two backoff waits: 20 ms then 40 ms.
        assert(elapsed >= std::chrono::milliseconds(60));

        const auto events = log.for_task(id);
        const auto failed_at = std::find_if(events.begin(), events.end(), [](const TaskEvent &event)
                                            { return event.new_status == TaskStatus::Failed; });
        assert(failed_at != events.end());
        assert(std::next(failed_at) == events.end());
        const auto retries = std::count_if(events.begin(), failed_at, [](const TaskEvent &event)
                                           { return event.error.has_value(); });
        assert(retries == 3);
        assert(failed_at->error.has_value());

        // An explicit retry brings it back once the collector returns.
        network.unreachable = false;
        agent.start();
        assert(agent.retry(id));
        assert(reaches(agent, id, TaskStatus::Completed));
        assert(agent.get_status(id)->retry_count == 0);
        agent.stop();
    }

    void test_permanent_rejections()
    {
        TempDir dir("worker_rejected");
        FakeNetwork network(dir / "server", 2048);
        const auto small = uplink::testing::write_pattern_file(dir / "small.bin", 100);
        const auto large = uplink::testing::write_pattern_file(dir / "large.bin", 4096);
        const auto changing = uplink::testing::write_pattern_file(dir / "changing.bin", 1000);

        UploadAgent agent(make_config(dir / "state", 256), Logger(), uplink::testing::fake_factory(network));
        const auto escape = agent.enqueue(small, "../escape.bin");
        const auto too_large = agent.enqueue(large, "large.bin");
        const auto altered = agent.enqueue(changing, "changing.bin");
        // Same size, different bytes: every chunk is accepted but the whole file no longer matches.
        uplink::testing::write_pattern_file(changing, 1000, 55);

        agent.start();
        assert(reaches(agent, escape, TaskStatus::Failed));
        assert(reaches(agent, too_large, TaskStatus::Failed));
        assert(reaches(agent, altered, TaskStatus::Failed));
        agent.stop();

        assert(agent.get_status(escape)->retry_count == 0);
        assert(agent.get_status(escape)->last_error.find("rejected") != std::string::npos);
        assert(agent.get_status(too_large)->retry_count == 0);
        assert(agent.get_status(altered)->retry_count == 0);
        assert(agent.get_status(altered)->last_error.find("checksum_mismatch") != std::string::npos);
        assert(!std::filesystem::exists(network.filesystem.completed_root() / "changing.bin"));
        assert(network.filesystem.list_completed().empty());
        assert(agent.stats().failed == 3);
    }

    void test_destination_taken_by_directory()
    {
        TempDir dir("worker_directory");
        FakeNetwork network(dir / "server");
        const auto first = uplink::testing::write_pattern_file(dir / "first.bin", 1000);
        const auto second = uplink::testing::write_pattern_file(dir / "second.bin", 1000, 11);
        uplink::testing::write_pattern_file(network.filesystem.completed_root() / "clips" / "a.bin", 16);

        UploadAgent agent(make_config(dir / "state", 256), Logger(), uplink::testing::fake_factory(network));
        const auto occupied = agent.enqueue(first, "clips");
        const auto raced = agent.enqueue(second, "late");
        // Another upload turns "late" into a directory after the session was opened.
        network.on_send = [&](const std::string &task_id, std::uint64_t index)
        {
            if (task_id == raced && index == 3)
            {
                std::filesystem::create_directories(network.filesystem.completed_root() / "late" / "sub");
            }
        };

        agent.start();
        assert(reaches(agent, occupied, TaskStatus::Failed));
        assert(reaches(agent, raced, TaskStatus::Failed));
        agent.stop();

        for (const auto &id : {occupied, raced})
        {
            const auto task = agent.get_status(id);
            assert(task->retry_count == 0);
            assert(task->last_error.find("rejected") != std::string::npos);
        }
        assert(network.finalizes == 1);
        for (const auto &entry : std::filesystem::recursive_directory_iterator(network.filesystem.completed_root()))
        {
            assert(entry.path().filename().string().find(".part-") == std::string::npos);
        }
    }

    void test_source_disappears()
    {
        TempDir dir("worker_source");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "gone.bin", 1000);
        UploadAgent agent(make_config(dir / "state", 256), Logger(), uplink::testing::fake_factory(network));
        const auto id = agent.enqueue(source, "gone.bin");
        std::filesystem::remove(source);

        agent.start();
        assert(reaches(agent, id, TaskStatus::Failed));
        agent.stop();
        const auto failed = agent.get_status(id);
        assert(failed->retry_count == 0);
        assert(failed->last_error.find("gone.bin") != std::string::npos);
        assert(network.finalizes == 0);
    }

    void test_cancel_mid_transfer()
    {
        TempDir dir("worker_cancel");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "long.bin", 10 * 256);
        UploadAgent agent(make_config(dir / "state", 256), Logger(), uplink::testing::fake_factory(network));
        const auto id = agent.enqueue(source, "long.bin");
        network.on_send = [&](const std::string &task_id, std::uint64_t index)
        {
            if (index == 2)
            {
                agent.cancel(task_id);
            }
        };

        agent.start();
        assert(reaches(agent, id, TaskStatus::Cancelled));
        assert(wait_until([&]
                          { return agent.scheduler().active_count() == 0; }));
        agent.stop();

        // The chunk in flight completes; nothing after it is sent and nothing is published.
        assert(network.sends == 3);
        assert(network.finalizes == 0);
        assert(agent.get_status(id)->status == TaskStatus::Cancelled);
        assert(!agent.resume(id));
        assert(!std::filesystem::exists(network.filesystem.completed_root() / "long.bin"));
    }

    void test_pause_keeps_progress()
    {
        TempDir dir("worker_pause");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "paused.bin", 8 * 256);
        UploadAgent agent(make_config(dir / "state", 256), Logger(), uplink::testing::fake_factory(network));
        const auto id = agent.enqueue(source, "paused.bin");
        std::atomic<bool> paused_once{false};
        network.on_send = [&](const std::string &task_id, std::uint64_t index)
        {
            if (index == 3 && !paused_once.exchange(true))
            {
                agent.pause(task_id);
            }
        };

        agent.start();
        assert(reaches(agent, id, TaskStatus::Paused));
        assert(wait_until([&]
                          { return agent.scheduler().active_count() == 0; }));
        const auto paused = agent.get_status(id);
        assert(paused->bytes_acked == 4 * 256);
        assert(network.finalizes == 0);

        assert(agent.resume(id));
        assert(reaches(agent, id, TaskStatus::Completed));
        agent.stop();
        assert(network.sends == 8);
        assert(network.opens == 2);
    }

    void test_concurrency_bound_and_priority()
    {
        TempDir dir("worker_concurrency");
        FakeNetwork network(dir / "server");
        network.send_delay = std::chrono::milliseconds(3);
        std::atomic<std::size_t> peak{0};
        std::mutex order_mutex;
        std::vector<std::string> first_sends;

        auto config = make_config(dir / "state", 256, 2);
        UploadAgent agent(config, Logger(), uplink::testing::fake_factory(network));
        network.on_send = [&](const std::string &task_id, std::uint64_t index)
        {
            TaskFilter filter;
            filter.status = TaskStatus::Uploading;
            const auto active = agent.list_tasks(filter).size();
            auto seen = peak.load();
            while (active > seen && !peak.compare_exchange_weak(seen, active))
            {
            }
            if (index == 0)
            {
                std::lock_guard lock(order_mutex);
                first_sends.push_back(task_id);
            }
        };

        std::vector<std::string> ids;
        for (int i = 0; i < 6; ++i)
        {
            const auto path = uplink::testing::write_pattern_file(dir / ("f" + std::to_string(i) + ".bin"), 4 * 256,
                                                                  static_cast<unsigned>(i));
            ids.push_back(agent.enqueue(path, "batch/f" + std::to_string(i) + ".bin", i == 5 ? 10 : 3));
        }

        agent.start();
        for (const auto &id : ids)
        {
            assert(reaches(agent, id, TaskStatus::Completed));
        }
        agent.stop();

        assert(peak.load() <= 2);
        assert(peak.load() >= 1);
        assert(network.sends == 24);
        std::lock_guard lock(order_mutex);
        assert(first_sends.size() == 6);
        // The high-priority task was queued last but is among the first two dispatched.
        assert(first_sends[0] == ids[5] || first_sends[1] == ids[5]);
        assert(agent.list_tasks(TaskFilter{.status = TaskStatus::Completed, .destination = std::nullopt}).size() == 6);
    }

    void test_shutdown_releases_task()
    {
        TempDir dir("worker_shutdown");
        FakeNetwork network(dir / "server");
        network.send_delay = std::chrono::milliseconds(20);
        const auto source = uplink::testing::write_pattern_file(dir / "slow.bin", 40 * 128);
        std::string id;
        {
            UploadAgent agent(make_config(dir / "state", 128), Logger(), uplink::testing::fake_factory(network));
            id = agent.enqueue(source, "slow.bin");
            agent.start();
            assert(wait_until([&]
                              { return agent.get_status(id)->bytes_acked >= 2 * 128; }));
            agent.stop();

            const auto released = agent.get_status(id);
            assert(released->status == TaskStatus::Pending);
            assert(released->bytes_acked > 0);
            assert(released->bytes_acked < released->total_bytes);
            assert(std::none_of(released->chunks.begin(), released->chunks.end(), [](const ChunkDescriptor &chunk)
                                { return chunk.state == ChunkState::Sent; }));
        }

        // A later run picks it up where the collector left off.
        network.send_delay = std::chrono::milliseconds(0);
        const auto delivered = network.registry.chunks_written();
        UploadAgent agent(make_config(dir / "state", 128), Logger(), uplink::testing::fake_factory(network));
        agent.start();
        assert(reaches(agent, id, TaskStatus::Completed));
        agent.stop();
        assert(network.registry.chunks_written() == 40);
        assert(delivered > 0);
        assert(crypto::hash_file(network.filesystem.completed_root() / "slow.bin") == crypto::hash_file(source));
    }

    void test_offline_holds_dispatch()
    {
        TempDir dir("worker_offline");
        FakeNetwork network(dir / "server");
        network.unreachable = true;
        const auto source = uplink::testing::write_pattern_file(dir / "wait.bin", 512);

        auto config = make_config(dir / "state", 256);
        config.transfer.probe_interval = std::chrono::milliseconds(20);
        UploadAgent agent(config, Logger(), uplink::testing::fake_factory(network));
        agent.scheduler().set_dispatch_enabled(false);
        agent.start();
        assert(wait_until([&]
                          { return !agent.online(); }));
        const auto id = agent.enqueue(source, "wait.bin");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(agent.get_status(id)->status == TaskStatus::Pending);
        assert(network.opens == 0);

        network.unreachable = false;
        assert(wait_until([&]
                          { return agent.online(); }));
        assert(reaches(agent, id, TaskStatus::Completed));
        assert(agent.stats().online);
        agent.stop();
    }

    void test_restart_clears_offline_hold()
    {
        TempDir dir("worker_restart_offline");
        FakeNetwork network(dir / "server");
        network.unreachable = true;
        const auto source = uplink::testing::write_pattern_file(dir / "later.bin", 600);

        auto config = make_config(dir / "state", 256);
        config.transfer.probe_interval = std::chrono::milliseconds(20);
        UploadAgent agent(config, Logger(), uplink::testing::fake_factory(network));
        agent.start();
        assert(wait_until([&]
                          { return !agent.online(); }));
        agent.stop();
        assert(!agent.scheduler().dispatch_enabled());

        network.unreachable = false;
        const auto id = agent.enqueue(source, "later.bin");
        agent.start();
        assert(agent.online());
        assert(agent.scheduler().dispatch_enabled());
        assert(reaches(agent, id, TaskStatus::Completed));
        agent.stop();
    }

    void test_shell_commands()
    {
        TempDir dir("worker_shell");
        FakeNetwork network(dir / "server");
        const auto source = uplink::testing::write_pattern_file(dir / "shell.bin", 3000);

        UploadAgent agent(make_config(dir / "state", 1024), Logger(), uplink::testing::fake_factory(network));
        std::istringstream input;
        std::ostringstream output;
        std::string id;
        {
            Shell shell(agent, input, output, Logger());
            assert(shell.execute("enqueue \"" + source.string() + "\" cam/shell.bin 3"));
            const auto tasks = agent.list_tasks();
            assert(tasks.size() == 1);
            id = tasks.front().id;
            assert(tasks.front().priority == 3);

            assert(shell.execute("PRIORITY " + id + " 9"));
            assert(agent.get_status(id)->priority == 9);
            assert(shell.execute("PRIORITY " + id + " eleven"));
            assert(shell.execute("STATUS " + id));
            assert(shell.execute("STATUS missing"));
            assert(shell.execute("LIST pending"));
            assert(shell.execute("LIST bogus"));
            assert(shell.execute("ENQUEUE " + (dir / "absent.bin").string() + " x.bin"));
            assert(shell.execute("RESUME " + id));
            assert(shell.execute("CANCEL " + id));
            assert(agent.get_status(id)->status == TaskStatus::Cancelled);
            assert(shell.execute("RETRY ALL"));
            assert(shell.execute("CLEAR"));
            assert(shell.execute("FROB"));
            assert(shell.execute("   "));
            assert(!shell.execute("exit"));
        }

        const auto text = output.str();
        assert(text.find("OK " + id) != std::string::npos);
        assert(text.find("  status:      PENDING") != std::string::npos);
        assert(text.find("ERROR: not_found") != std::string::npos);
        assert(text.find("OK 1 task(s)") != std::string::npos);
        assert(text.find("unknown status bogus") != std::string::npos);
        assert(text.find("ERROR: invalid_argument") != std::string::npos);
        assert(text.find("ERROR: not_applicable") != std::string::npos);
        assert(text.find("OK 0 task(s) re-queued") != std::string::npos);
        assert(text.find("OK 1 task(s) removed") != std::string::npos);
        assert(text.find("ERROR: unsupported_command") != std::string::npos);
        assert(text.find("[event] " + id + " PENDING -> CANCELLED") != std::string::npos);
        assert(!agent.get_status(id));
        assert(network.opens == 0);
    }

} // namespace

void run_transfer_worker_tests()
{
    test_upload_completes();
    test_enqueue_validation();
    test_resume_after_interruption();
    test_resume_trusts_server_frontier();
    test_corrupted_chunk_is_resent();
    test_damaged_chunk_found_at_finalize();
    test_unreachable_collector();
    test_permanent_rejections();
    test_destination_taken_by_directory();
    test_source_disappears();
    test_cancel_mid_transfer();
    test_pause_keeps_progress();
    test_concurrency_bound_and_priority();
    test_shutdown_releases_task();
    test_offline_holds_dispatch();
    test_restart_clears_offline_hold();
    test_shell_commands();
}
