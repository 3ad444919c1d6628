#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplink/client/chunker.hpp"
#include "uplink/client/config.hpp"
#include "uplink/client/event_channel.hpp"
#include "uplink/client/logger.hpp"
#include "uplink/client/network_monitor.hpp"
#include "uplink/client/scheduler.hpp"
#include "uplink/client/state_store.hpp"
#include "uplink/client/task.hpp"
#include "uplink/client/worker_pool.hpp"
#include "uplink/file_io.hpp"
#include "test_support.hpp"

using namespace uplink;
using namespace uplink::client;
using uplink::testing::TempDir;

namespace
{

    constexpr std::uint64_t kMiB = 1024 * 1024;

    UploadTask make_task(const std::string &destination, int priority, std::uint64_t size = 10,
                         std::uint64_t chunk_size = 4)
    {
        UploadTask task;
        task.source_path = "/nonexistent/" + destination;
        task.destination = destination;
        task.priority = priority;
        task.total_bytes = size;
        task.chunk_size = chunk_size;
        task.file_checksum = "digest-" + destination;
        task.chunks = chunking::plan(size, chunk_size);
        return task;
    }

    TaskStatus status_of(const StateStore &store, const std::string &id)
    {
        const auto status = store.status_of(id);
        assert(status.has_value());
        return *status;
    }

    ClientConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "uplink_client");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_chunk_plan()
    {
        const auto chunks = chunking::plan(12 * kMiB, 5 * kMiB);
        assert(chunks.size() == 3);
        assert(chunks[0].length == 5 * kMiB);
        assert(chunks[1].offset == 5 * kMiB);
        assert(chunks[2].offset == 10 * kMiB);
        assert(chunks[2].length == 2 * kMiB);
        for (std::size_t i = 0; i < chunks.size(); ++i)
        {
            assert(chunks[i].index == i);
            assert(chunks[i].state == ChunkState::Pending);
            assert(chunks[i].checksum.empty());
        }

        assert(chunking::plan(0, 5 * kMiB).empty());
        assert(chunking::plan(10, 10).size() == 1);
        assert(chunking::plan(11, 10).size() == 2);
        assert(chunking::plan(11, 10)[1].length == 1);

        bool threw = false;
        try
        {
            chunking::plan(10, 0);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_chunk_reads()
    {
        TempDir dir("chunker");
        const auto bytes = uplink::testing::pattern_bytes(10);
        const auto path = dir / "source.bin";
        uplink::testing::write_bytes(path, bytes);

        const auto chunks = chunking::plan(bytes.size(), 4);
        const auto middle = chunking::read_chunk(path, chunks[1]);
        assert((middle == std::vector<std::byte>(bytes.begin() + 4, bytes.begin() + 8)));
        assert(chunking::checksum(middle) == chunking::checksum(chunking::read_chunk(path, chunks[1])));
        assert(chunking::checksum(middle) != chunking::checksum(chunking::read_chunk(path, chunks[0])));

        // The source shrank after planning.
        std::filesystem::resize_file(path, 5);
        bool threw = false;
        try
        {
            chunking::read_chunk(path, chunks[2]);
        }
        catch (const chunking::SourceReadError &ex)
        {
            threw = true;
            assert(ex.code() == ErrorCode::SourceUnreadable);
            assert(ex.path() == path);
        }
        assert(threw);

        threw = false;
        try
        {
            chunking::read_chunk(dir / "missing.bin", chunks[0]);
        }
        catch (const chunking::SourceReadError &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_task_model()
    {
        auto task = make_task("cam/a.bin", 5, 10, 4);
        task.chunks[0].state = ChunkState::Acked;
        task.chunks[2].state = ChunkState::Acked;
        task.chunks[1].state = ChunkState::Sent;
        assert(task.acked_bytes() == 6);
        assert(task.contiguous_acked() == 1);

        assert(to_string(TaskStatus::Uploading) == "UPLOADING");
        assert(task_status_from_string("CANCELLED") == TaskStatus::Cancelled);
        assert(!task_status_from_string("DONE").has_value());
        assert(is_terminal(TaskStatus::Completed));
        assert(is_terminal(TaskStatus::Failed));
        assert(is_terminal(TaskStatus::Cancelled));
        assert(!is_terminal(TaskStatus::Paused));
        assert(!valid_priority(0));
        assert(valid_priority(1));
        assert(valid_priority(10));
        assert(!valid_priority(11));

        const auto early = generate_task_id(1700000000000);
        const auto late = generate_task_id(1700000000001);
        assert(early.size() == 20);
        assert(early < late);

        task.id = early;
        task.metadata = {{"camera", "a"}};
        const auto restored = nlohmann::json(task).get<UploadTask>();
        assert(restored.chunks.size() == 3);
        assert(restored.chunks[1].state == ChunkState::Sent);
        assert(restored.metadata.at("camera") == "a");
    }

    void test_state_store()
    {
        TempDir dir("state_store");
        auto task = make_task("cam/b.bin", 4, 10, 4);
        task.id = "task-one";
        task.status = TaskStatus::Uploading;
        task.created_at = 20;
        {
            StateStore store(dir.path());
            store.put(task);
            const auto updated = store.update_progress("task-one", 0, "h0");
            assert(updated.bytes_acked == 4);
            assert(store.modify("task-one", [](UploadTask &record)
                                {
                record.chunks[1].state = ChunkState::Sent;
                return true; }));

            auto older = make_task("cam/c.bin", 4);
            older.id = "task-two";
            older.created_at = 10;
            older.status = TaskStatus::Completed;
            store.put(older);

            bool threw = false;
            try
            {
                store.update_progress("task-one", 9, "h9");
            }
            catch (const StateStoreError &ex)
            {
                threw = true;
                assert(ex.code() == ErrorCode::StorageFailure);
            }
            assert(threw);
        }

        uplink::testing::write_bytes(dir.path() / "tasks" / "broken.json", {std::byte{'{'}, std::byte{'x'}});
        uplink::file_io::write_file_atomically(dir.path() / "tasks" / "left.json.tmp-1234", std::string_view("{}"));
        // Not empty, so it cannot be removed; loading must go on regardless.
        uplink::testing::write_bytes(dir.path() / "tasks" / "stuck.json.tmp-5678" / "inner", {std::byte{'x'}});

        StateStore store(dir.path());
        assert(store.quarantined() == 1);
        assert(std::filesystem::exists(dir.path() / "tasks" / "broken.json.corrupt"));
        assert(!std::filesystem::exists(dir.path() / "tasks" / "left.json.tmp-1234"));
        assert(std::filesystem::exists(dir.path() / "tasks" / "stuck.json.tmp-5678"));

        const auto reloaded = store.get("task-one");
        assert(reloaded.has_value());
        assert(reloaded->bytes_acked == 4);
        assert(reloaded->chunks[0].state == ChunkState::Acked);
        assert(reloaded->chunks[0].checksum == "h0");

        const auto all = store.list_all();
        assert(all.size() == 2);
        assert(all[0].id == "task-two");
        assert(store.list_by_status(TaskStatus::Completed).size() == 1);

        assert(store.recover_interrupted() == 1);
        const auto recovered = store.get("task-one");
        assert(recovered->status == TaskStatus::Pending);
        assert(recovered->chunks[0].state == ChunkState::Acked);
        assert(recovered->chunks[1].state == ChunkState::Pending);
        assert(recovered->bytes_acked == 4);
        assert(store.recover_interrupted() == 0);

        assert(!store.modify("task-one", [](UploadTask &)
                             { return false; }));
        assert(!store.modify("unknown", [](UploadTask &)
                             { return true; }));
        assert(store.reset_chunks("task-one", {0}).bytes_acked == 0);

        assert(store.remove("task-one"));
        assert(!store.remove("task-one"));
        assert(!store.get("task-one").has_value());
        assert(!std::filesystem::exists(store.directory() / "task-one.json"));
    }

    void test_scheduler_priority_order()
    {
        TempDir dir("scheduler_order");
        StateStore store(dir.path());
        EventChannel events;
        UploadScheduler scheduler(store, events, 2);

        const auto a = scheduler.enqueue(make_task("a", 3));
        const auto b = scheduler.enqueue(make_task("b", 8));
        const auto c = scheduler.enqueue(make_task("c", 8));
        assert(a.created_at < b.created_at);
        assert(b.created_at < c.created_at);
        assert(!a.id.empty());
        assert(status_of(store, a.id) == TaskStatus::Pending);
        assert(scheduler.queued_count() == 3);

        // Higher priority first, then the older of two equal priorities.
        const auto first = scheduler.dequeue_next();
        const auto second = scheduler.dequeue_next();
        assert(first && first->id == b.id);
        assert(second && second->id == c.id);
        assert(first->status == TaskStatus::Uploading);
        assert(first->started_at != 0);
        assert(!scheduler.dequeue_next().has_value());
        assert(scheduler.active_count() == 2);

        scheduler.finish(b.id, TaskOutcome::Completed);
        assert(status_of(store, b.id) == TaskStatus::Completed);
        const auto third = scheduler.dequeue_next();
        assert(third && third->id == a.id);

        scheduler.finish(a.id, TaskOutcome::Completed);
        scheduler.finish(c.id, TaskOutcome::Completed);

        const auto d = scheduler.enqueue(make_task("d", 1));
        const auto e = scheduler.enqueue(make_task("e", 2));
        assert(scheduler.reprioritize(d.id, 9));
        assert(scheduler.dequeue_next()->id == d.id);
        assert(scheduler.dequeue_next()->id == e.id);
        assert(!scheduler.reprioritize(b.id, 4));

        bool threw = false;
        try
        {
            scheduler.reprioritize(e.id, 11);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            scheduler.enqueue(make_task("f", 0));
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_scheduler_transitions()
    {
        TempDir dir("scheduler_transitions");
        StateStore store(dir.path());
        EventChannel events;
        UploadScheduler scheduler(store, events, 1);

        const auto t = scheduler.enqueue(make_task("t", 5));
        assert(scheduler.pause(t.id));
        assert(status_of(store, t.id) == TaskStatus::Paused);
        assert(!scheduler.dequeue_next().has_value());
        assert(!scheduler.pause(t.id));
        assert(scheduler.resume(t.id));
        assert(status_of(store, t.id) == TaskStatus::Pending);
        assert(scheduler.dequeue_next()->id == t.id);

        // A pause issued while a worker owns the task wins over the worker's release.
        assert(scheduler.pause(t.id));
        scheduler.finish(t.id, TaskOutcome::Released);
        assert(status_of(store, t.id) == TaskStatus::Paused);
        assert(scheduler.active_count() == 0);

        assert(scheduler.resume(t.id));
        assert(scheduler.dequeue_next()->id == t.id);
        assert(scheduler.record_retry(t.id, "timeout: no answer") == 1);
        assert(scheduler.record_retry(t.id, "timeout: no answer") == 2);
        scheduler.finish(t.id, TaskOutcome::Failed, "unreachable: connection refused");
        auto failed = store.get(t.id);
        assert(failed->status == TaskStatus::Failed);
        assert(failed->last_error == "unreachable: connection refused");
        assert(failed->retry_count == 2);
        assert(failed->finished_at != 0);
        assert(!scheduler.resume(t.id));

        assert(scheduler.retry(t.id));
        auto retried = store.get(t.id);
        assert(retried->status == TaskStatus::Pending);
        assert(retried->retry_count == 0);
        assert(retried->last_error.empty());
        assert(!scheduler.retry(t.id));

        const auto u = scheduler.enqueue(make_task("u", 9));
        assert(scheduler.cancel(u.id));
        assert(status_of(store, u.id) == TaskStatus::Cancelled);
        assert(!scheduler.cancel(u.id));
        assert(!scheduler.retry(u.id));
        assert(!scheduler.resume(u.id));

        // u would outrank t, but it is cancelled.
        assert(scheduler.dequeue_next()->id == t.id);
        assert(scheduler.cancel(t.id));
        scheduler.finish(t.id, TaskOutcome::Completed);
        assert(status_of(store, t.id) == TaskStatus::Cancelled);

        scheduler.set_dispatch_enabled(false);
        const auto v = scheduler.enqueue(make_task("v", 5));
        assert(!scheduler.dequeue_next().has_value());
        assert(!scheduler.wait_for_work(std::chrono::milliseconds(10)));
        scheduler.set_dispatch_enabled(true);
        assert(scheduler.wait_for_work(std::chrono::milliseconds(10)));
        assert(scheduler.dequeue_next()->id == v.id);

        store.modify(v.id, [](UploadTask &record)
                     {
            record.chunks[0].state = ChunkState::Acked;
            record.chunks[1].state = ChunkState::Sent;
            return true; });
        scheduler.finish(v.id, TaskOutcome::Released);
        const auto released = store.get(v.id);
        assert(released->status == TaskStatus::Pending);
        assert(released->chunks[0].state == ChunkState::Acked);
        assert(released->chunks[1].state == ChunkState::Pending);
        assert(scheduler.queued_count() == 1);

        assert(scheduler.remove_finished() == 2);
        assert(!store.get(t.id).has_value());
        assert(!store.get(u.id).has_value());
        assert(store.get(v.id).has_value());
    }

    void test_scheduler_reload()
    {
        TempDir dir("scheduler_reload");
        std::string pending_id;
        std::uint64_t last_created = 0;
        {
            StateStore store(dir.path());
            EventChannel events;
            UploadScheduler scheduler(store, events, 1);
            const auto paused = scheduler.enqueue(make_task("p", 9));
            scheduler.pause(paused.id);
            const auto pending = scheduler.enqueue(make_task("q", 2));
            pending_id = pending.id;
            last_created = pending.created_at;
        }

        StateStore store(dir.path());
        EventChannel events;
        UploadScheduler scheduler(store, events, 1);
        scheduler.load();
        assert(scheduler.queued_count() == 1);
        const auto next = scheduler.enqueue(make_task("r", 1));
        assert(next.created_at > last_created);
        assert(scheduler.dequeue_next()->id == pending_id);
    }

    void test_event_channel()
    {
        EventChannel channel(2);
        std::mutex mutex;
        std::vector<std::string> received;
        std::promise<void> started;
        std::promise<void> release;
        auto release_future = release.get_future().share();
        bool first = true;

        const auto observer = channel.subscribe([&](const TaskEvent &event)
                                                {
            bool block = false;
            {
                std::lock_guard lock(mutex);
                received.push_back(event.task_id);
                block = first;
                first = false;
            }
            if (block) {
                started.set_value();
                release_future.wait();
            } });

        channel.publish(TaskEvent{.task_id = "e0"});
        started.get_future().wait();
        for (const auto *id : {"e1", "e2", "e3", "e4"})
        {
            channel.publish(TaskEvent{.task_id = id});
        }
        assert(channel.dropped() == 2);
        release.set_value();
        channel.flush();
        {
            std::lock_guard lock(mutex);
            assert((received == std::vector<std::string>{"e0", "e3", "e4"}));
        }

        // A failing observer does not starve the others.
        const auto failing = channel.subscribe([](const TaskEvent &)
                                               { throw std::runtime_error("observer bug"); });
        channel.publish(TaskEvent{.task_id = "e5"});
        channel.flush();
        channel.unsubscribe(failing);
        channel.unsubscribe(observer);
        channel.publish(TaskEvent{.task_id = "e6"});
        channel.flush();
        {
            std::lock_guard lock(mutex);
            assert(received.size() == 4);
            assert(received.back() == "e5");
        }

        auto task = make_task("x", 5, 10, 4);
        task.id = "task-x";
        task.status = TaskStatus::Failed;
        task.bytes_acked = 4;
        task.last_error = "rejected: too large";
        const auto event = make_event(task, TaskStatus::Uploading);
        assert(event.old_status == TaskStatus::Uploading);
        assert(event.new_status == TaskStatus::Failed);
        assert(event.total_bytes == 10);
        assert(event.error == std::string("rejected: too large"));
        assert(!event.is_progress());
    }

    void test_backoff_delay()
    {
        using std::chrono::milliseconds;
        assert(backoff_delay(0, milliseconds(500), milliseconds(30000)) == milliseconds(0));
        assert(backoff_delay(1, milliseconds(500), milliseconds(30000)) == milliseconds(500));
        assert(backoff_delay(2, milliseconds(500), milliseconds(30000)) == milliseconds(1000));
        assert(backoff_delay(3, milliseconds(500), milliseconds(30000)) == milliseconds(2000));
        assert(backoff_delay(7, milliseconds(500), milliseconds(30000)) == milliseconds(30000));
        assert(backoff_delay(200, milliseconds(500), milliseconds(30000)) == milliseconds(30000));
    }

    void test_config_parsing()
    {
        const auto config = parse({"collector.local:9000", "--workers", "4", "--chunk-size", "1048576",
                                   "--retry-base-ms", "100", "--retry-max-ms", "1000", "--max-attempts", "3",
                                   "--state-dir", "/var/lib/uplink", "--log", "client.log", "--verbose"});
        assert(config.host == "collector.local");
        assert(config.port == 9000);
        assert(config.transfer.concurrency == 4);
        assert(config.transfer.chunk_size == kMiB);
        assert(config.transfer.retry_base_delay == std::chrono::milliseconds(100));
        assert(config.transfer.retry_max_delay == std::chrono::milliseconds(1000));
        assert(config.transfer.max_attempts == 3);
        assert(config.state_dir == std::filesystem::path("/var/lib/uplink"));
        assert(config.log_path == std::filesystem::path("client.log"));
        assert(config.verbose);

        const auto defaults = parse({"127.0.0.1:8080"});
        assert(defaults.transfer.chunk_size == 5 * kMiB);
        assert(defaults.transfer.concurrency == 2);
        assert(!defaults.log_path.has_value());

        assert(parse_fails({}));
        assert(parse_fails({"collector"}));
        assert(parse_fails({"collector:0"}));
        assert(parse_fails({"collector:70000"}));
        assert(parse_fails({"collector:80", "--workers", "0"}));
        assert(parse_fails({"collector:80", "--workers"}));
        assert(parse_fails({"collector:80", "--workers", "-2"}));
        assert(parse_fails({"collector:80", "--bogus", "1"}));
        assert(parse_fails({"collector:80", "--retry-max-ms", "10"}));
        assert(parse_fails({"collector:80", "--chunk-size", std::to_string(128 * kMiB)}));
    }

    void test_network_monitor()
    {
        std::atomic<bool> up{true};
        std::atomic<bool> broken{false};
        std::mutex mutex;
        std::vector<bool> transitions;
        NetworkMonitor monitor(
            [&]
            {
                if (broken)
                {
                    throw std::runtime_error("probe exploded");
                }
                return up.load();
            },
            [&](bool reachable)
            {
                std::lock_guard lock(mutex);
                transitions.push_back(reachable);
            },
            std::chrono::hours(1));

        assert(monitor.reachable());
        assert(monitor.probe_now());
        up = false;
        assert(!monitor.probe_now());
        assert(!monitor.probe_now());
        up = true;
        broken = true;
        assert(!monitor.probe_now());
        broken = false;
        assert(monitor.probe_now());
        {
            std::lock_guard lock(mutex);
            assert((transitions == std::vector<bool>{false, true}));
        }

        up = false;
        assert(!monitor.probe_now());
        monitor.start();
        assert(monitor.reachable());
        monitor.stop();
        {
            std::lock_guard lock(mutex);
            assert((transitions == std::vector<bool>{false, true, false, true}));
        }
        up = true;

        NetworkMonitor periodic([&]
                                { return up.load(); },
                                nullptr, std::chrono::milliseconds(10));
        up = false;
        periodic.start();
        assert(uplink::testing::wait_until([&]
                                           { return !periodic.reachable(); }));
        up = true;
        assert(uplink::testing::wait_until([&]
                                           { return periodic.reachable(); }));
        periodic.stop();
    }

    void test_logger_file_sink()
    {
        TempDir dir("logger");
        const auto path = dir / "client.log";
        Logger logger(path);
        logger.log("store", "loaded ", 3, " task record(s)");
        logger.warn("net", "collector unreachable");
        const auto text = uplink::file_io::read_text_file(path);
        assert(text.find("[store] loaded 3 task record(s)") != std::string::npos);
        assert(text.find("[net] collector unreachable") != std::string::npos);

        Logger silent;
        silent.error("worker", "dropped");
    }

} // namespace

void run_client_component_tests()
{
    test_chunk_plan();
    test_chunk_reads();
    test_task_model();
    test_state_store();
    test_scheduler_priority_order();
    test_scheduler_transitions();
    test_scheduler_reload();
    test_event_channel();
    test_backoff_delay();
    test_config_parsing();
    test_network_monitor();
    test_logger_file_sink();
}
