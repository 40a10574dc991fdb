// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/resume_store.hpp>
#include <surge/core/scheduler.hpp>
#include <surge/disk/error.hpp>
#include "mock_transport.hpp"
#include "test_support.hpp"
#include <atomic>
#include <filesystem>
#include <mutex>

using namespace surge::core;
using namespace std::chrono_literals;
using surge::test::MockTransport;
using surge::test::RecordingSink;
using surge::test::TempDir;

namespace fs = std::filesystem;

namespace {

bool has_status(const Scheduler& scheduler, const std::string& id, TaskStatus status) {
    auto state = scheduler.status(id);
    return state && state->status == status;
}

bool file_matches(const std::string& path, std::uint64_t size) {
    return surge::test::read_file(path) == surge::test::expected_content(size);
}

} // namespace

TEST_CASE("Scheduler - downloads submitted tasks", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 300 * 1024;
    MockTransport transport(size);
    RecordingSink sink;
    Scheduler scheduler(surge::test::fast_settings(dir.path().string()), transport, sink, make_null_logger());

    auto a = scheduler.submit("https://example.com/files/a.bin");
    auto b = scheduler.submit("https://example.com/files/b.bin", "sub/b-copy.bin");
    REQUIRE(a);
    REQUIRE(b);
    CHECK(*a != *b);

    REQUIRE(scheduler.wait_idle(20s));

    auto state_a = scheduler.status(*a);
    auto state_b = scheduler.status(*b);
    REQUIRE(state_a);
    REQUIRE(state_b);
    CHECK(state_a->status == TaskStatus::completed);
    CHECK(state_b->status == TaskStatus::completed);
    CHECK(state_a->destination_path == (dir.path() / "a.bin").string());
    CHECK(state_b->destination_path == (dir.path() / "sub" / "b-copy.bin").string());
    CHECK(file_matches(state_a->destination_path, size));
    CHECK(file_matches(state_b->destination_path, size));

    CHECK(sink.statuses(*a) == std::vector<TaskStatus>{
        TaskStatus::probing, TaskStatus::downloading, TaskStatus::completed});

    auto all = scheduler.tasks();
    REQUIRE(all.size() == 2);
    CHECK(all[0].id == *a);
    CHECK(all[1].id == *b);
}

TEST_CASE("Scheduler - bounded number of active tasks", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 128 * 1024;
    MockTransport transport(size);
    transport.close_gate_at(0);
    RecordingSink sink;
    auto settings = surge::test::fast_settings(dir.path().string());
    settings.max_concurrent_downloads = 2;
    Scheduler scheduler(settings, transport, sink, make_null_logger());

    auto a = scheduler.submit("https://example.com/a.bin");
    auto b = scheduler.submit("https://example.com/b.bin");
    auto c = scheduler.submit("https://example.com/c.bin");
    REQUIRE((a && b && c));

    REQUIRE(surge::test::wait_until([&] {
        return has_status(scheduler, *a, TaskStatus::downloading)
            && has_status(scheduler, *b, TaskStatus::downloading);
    }));
    std::this_thread::sleep_for(50ms);
    CHECK(has_status(scheduler, *c, TaskStatus::queued));

    // Freeing a slot admits the next task
    REQUIRE_FALSE(scheduler.cancel(*a));
    REQUIRE(surge::test::wait_until([&] { return has_status(scheduler, *c, TaskStatus::downloading); }));

    transport.open_gate();
    REQUIRE(scheduler.wait_idle(20s));
    CHECK(has_status(scheduler, *a, TaskStatus::cancelled));
    CHECK(has_status(scheduler, *b, TaskStatus::completed));
    CHECK(has_status(scheduler, *c, TaskStatus::completed));
    CHECK_FALSE(fs::exists(dir.path() / "a.bin"));
}

TEST_CASE("Scheduler - pause, resume and cancel", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 512 * 1024;
    MockTransport transport(size);
    transport.close_gate_at(64 * 1024);
    RecordingSink sink;
    Scheduler scheduler(surge::test::fast_settings(dir.path().string()), transport, sink, make_null_logger());
    const auto path = dir.file("big.bin");

    auto id = scheduler.submit("https://example.com/big.bin");
    REQUIRE(id);
    REQUIRE(surge::test::wait_until([&] { return transport.served() >= 64 * 1024; }));

    REQUIRE_FALSE(scheduler.pause(*id));
    REQUIRE(surge::test::wait_until([&] { return has_status(scheduler, *id, TaskStatus::paused); }));
    CHECK(scheduler.wait_idle(5s));
    CHECK(fs::exists(path));
    CHECK(resume_store::exists(path));
    CHECK_FALSE(scheduler.pause(*id));   // Already paused

    SECTION("Resume finishes the download") {
        transport.open_gate();
        REQUIRE_FALSE(scheduler.resume(*id));
        REQUIRE(scheduler.wait_idle(20s));

        CHECK(has_status(scheduler, *id, TaskStatus::completed));
        CHECK(file_matches(path, size));
        CHECK_FALSE(resume_store::exists(path));
        CHECK(transport.served() == size);

        // Terminal tasks stay terminal
        CHECK(scheduler.resume(*id) == DownloadErrc::invalid_state);
        CHECK(scheduler.cancel(*id) == DownloadErrc::invalid_state);
        CHECK(scheduler.pause(*id) == DownloadErrc::invalid_state);
    }

    SECTION("Cancel removes file and resume state") {
        REQUIRE_FALSE(scheduler.cancel(*id));
        CHECK(has_status(scheduler, *id, TaskStatus::cancelled));
        CHECK_FALSE(fs::exists(path));
        CHECK_FALSE(resume_store::exists(path));
        CHECK_FALSE(scheduler.cancel(*id));   // Idempotent
        CHECK(scheduler.resume(*id) == DownloadErrc::invalid_state);
    }
}

TEST_CASE("Scheduler - failed task can be retried", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 32 * 1024;
    MockTransport transport(size);
    transport.fail_fetches(3, DownloadErrc::timeout);
    RecordingSink sink;
    Scheduler scheduler(surge::test::fast_settings(dir.path().string()), transport, sink, make_null_logger());

    auto id = scheduler.submit("https://example.com/flaky.bin");
    REQUIRE(id);
    REQUIRE(scheduler.wait_idle(20s));

    auto failed = scheduler.status(*id);
    REQUIRE(failed);
    REQUIRE(failed->status == TaskStatus::failed);
    CHECK_FALSE(failed->failure_reason.empty());
    CHECK(resume_store::exists(dir.file("flaky.bin")));

    REQUIRE_FALSE(scheduler.resume(*id));
    REQUIRE(scheduler.wait_idle(20s));

    auto done = scheduler.status(*id);
    REQUIRE(done);
    CHECK(done->status == TaskStatus::completed);
    CHECK(done->failure_reason.empty());
    CHECK(file_matches(dir.file("flaky.bin"), size));
}

TEST_CASE("Scheduler - rejects bad submissions", "[scheduler]") {
    TempDir dir;
    MockTransport transport(1024);
    RecordingSink sink;
    Scheduler scheduler(surge::test::fast_settings(dir.path().string()), transport, sink, make_null_logger());

    SECTION("Malformed URL") {
        auto result = scheduler.submit("not a url");
        REQUIRE_FALSE(result);
        CHECK(result.error() == DownloadErrc::invalid_url);
    }

    SECTION("Unsupported scheme") {
        auto result = scheduler.submit("ftp://example.com/file.bin");
        REQUIRE_FALSE(result);
        CHECK(result.error() == DownloadErrc::unsupported_protocol);
    }

    SECTION("Invalid overrides") {
        TaskOverrides overrides;
        overrides.max_chunks_per_file = 0;
        auto result = scheduler.submit("https://example.com/file.bin", {}, overrides);
        REQUIRE_FALSE(result);
        CHECK(result.error() == DownloadErrc::invalid_config);
    }

    SECTION("Unknown task id") {
        CHECK(scheduler.pause("nope") == DownloadErrc::unknown_task);
        CHECK(scheduler.resume("nope") == DownloadErrc::unknown_task);
        CHECK(scheduler.cancel("nope") == DownloadErrc::unknown_task);
        auto state = scheduler.status("nope");
        REQUIRE_FALSE(state);
        CHECK(state.error() == DownloadErrc::unknown_task);
    }

    CHECK(scheduler.tasks().empty());
    CHECK(transport.probe_calls() == 0);
}

TEST_CASE("Scheduler - existing destination", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 16 * 1024;
    MockTransport transport(size);
    RecordingSink sink;
    auto settings = surge::test::fast_settings(dir.path().string());
    surge::test::write_file(dir.file("x.bin"), "keep me");

    SECTION("Auto rename picks a free name") {
        surge::test::write_file(dir.file("x (1).bin"), "taken");
        Scheduler scheduler(settings, transport, sink, make_null_logger());

        auto id = scheduler.submit("https://example.com/x.bin");
        REQUIRE(id);
        REQUIRE(scheduler.wait_idle(20s));

        auto state = scheduler.status(*id);
        REQUIRE(state);
        CHECK(state->destination_path == dir.file("x (2).bin"));
        CHECK(file_matches(dir.file("x (2).bin"), size));
    }

    SECTION("Refused without rename or overwrite") {
        settings.auto_rename = false;
        Scheduler scheduler(settings, transport, sink, make_null_logger());

        auto id = scheduler.submit("https://example.com/x.bin");
        REQUIRE_FALSE(id);
        CHECK(id.error() == surge::disk::DiskErrc::file_exists);
    }

    SECTION("Overwrite replaces the file") {
        settings.overwrite_existing = true;
        Scheduler scheduler(settings, transport, sink, make_null_logger());

        auto id = scheduler.submit("https://example.com/x.bin");
        REQUIRE(id);
        REQUIRE(scheduler.wait_idle(20s));
        CHECK(has_status(scheduler, *id, TaskStatus::completed));
        CHECK(file_matches(dir.file("x.bin"), size));
    }
}

TEST_CASE("Scheduler - duplicate submission", "[scheduler]") {
    TempDir dir;
    MockTransport transport(128 * 1024);
    transport.close_gate_at(0);
    RecordingSink sink;
    Scheduler scheduler(surge::test::fast_settings(dir.path().string()), transport, sink, make_null_logger());

    auto first = scheduler.submit("https://example.com/same.bin");
    auto second = scheduler.submit("https://example.com/same.bin");
    REQUIRE(first);
    REQUIRE(second);
    CHECK(*first == *second);
    CHECK(scheduler.tasks().size() == 1);

    transport.open_gate();
    REQUIRE(scheduler.wait_idle(20s));
    CHECK(has_status(scheduler, *first, TaskStatus::completed));
}

TEST_CASE("Scheduler - shutdown and restore", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 512 * 1024;
    MockTransport transport(size);
    transport.close_gate_at(64 * 1024);
    RecordingSink sink;
    auto settings = surge::test::fast_settings(dir.path().string());
    const auto path = dir.file("long.bin");

    std::string id;
    {
        Scheduler scheduler(settings, transport, sink, make_null_logger());
        auto submitted = scheduler.submit("https://example.com/long.bin");
        REQUIRE(submitted);
        id = *submitted;
        REQUIRE(surge::test::wait_until([&] { return transport.served() >= 64 * 1024; }));

        scheduler.shutdown();
        CHECK(has_status(scheduler, id, TaskStatus::paused));
        CHECK(sink.flushes() == 1);
        scheduler.shutdown();
        CHECK(sink.flushes() == 1);

        auto rejected = scheduler.submit("https://example.com/other.bin");
        REQUIRE_FALSE(rejected);
        CHECK(rejected.error() == DownloadErrc::invalid_state);
    }

    auto saved = resume_store::load(path);
    REQUIRE(saved);
    CHECK(saved->id == id);
    CHECK(saved->status == TaskStatus::paused);

    // A failed task from the earlier run is listed but left alone
    TaskState broken;
    broken.id = generate_task_id();
    broken.source = "https://example.com/broken.bin";
    broken.destination_path = dir.file("broken.bin");
    broken.total_size = 1000;
    broken.supports_range = true;
    broken.chunks = make_chunks(std::vector<ByteRange>{ByteRange{0, 1000}});
    broken.chunks[0].status = ChunkStatus::failed;
    broken.status = TaskStatus::failed;
    broken.failure_reason = "chunk 0 failed";
    REQUIRE_FALSE(resume_store::save(broken));

    transport.open_gate();
    transport.clear_requests();

    SECTION("Restore re-admits the paused task") {
        Scheduler scheduler(settings, transport, sink, make_null_logger());
        CHECK(scheduler.restore_persisted() == 1);
        REQUIRE(scheduler.wait_idle(20s));

        CHECK(scheduler.tasks().size() == 2);
        CHECK(has_status(scheduler, id, TaskStatus::completed));
        CHECK(has_status(scheduler, broken.id, TaskStatus::failed));
        CHECK(file_matches(path, size));
        CHECK(transport.served() == size);
        for (const auto& request : transport.requests()) {
            CHECK(request.url != broken.source);
        }
    }

    SECTION("Submitting the same download adopts the saved progress") {
        Scheduler scheduler(settings, transport, sink, make_null_logger());
        auto again = scheduler.submit("https://example.com/long.bin");
        REQUIRE(again);
        CHECK(*again == id);
        REQUIRE(scheduler.wait_idle(20s));
        CHECK(has_status(scheduler, id, TaskStatus::completed));
        CHECK(file_matches(path, size));
    }

    SECTION("Disabled auto resume restores nothing") {
        settings.auto_resume = false;
        Scheduler scheduler(settings, transport, sink, make_null_logger());
        CHECK(scheduler.restore_persisted() == 0);
        CHECK(scheduler.tasks().empty());
    }
}

namespace {

// Sink that calls back into the scheduler: looks every task up and
// resumes any task that reports Paused
class CallbackSink final : public ProgressSink {
public:
    void attach(Scheduler* scheduler) { scheduler_.store(scheduler); }

    void on_progress(const ProgressEvent&) override {}

    void on_status(const StatusEvent& event) override {
        auto* scheduler = scheduler_.load();
        if (!scheduler) return;

        const bool found = scheduler->status(event.task_id).has_value();
        std::error_code resumed;
        if (event.to == TaskStatus::paused) {
            resumed = scheduler->resume(event.task_id);
        }

        std::lock_guard lock(mutex_);
        seen_.push_back(event);
        if (!found) ++missed_;
        if (event.to == TaskStatus::paused) resume_results_.push_back(resumed);
    }

    [[nodiscard]] std::vector<TaskStatus> statuses(const std::string& task_id) const {
        std::lock_guard lock(mutex_);
        std::vector<TaskStatus> out;
        for (const auto& event : seen_) {
            if (event.task_id == task_id) out.push_back(event.to);
        }
        return out;
    }

    [[nodiscard]] int missed() const {
        std::lock_guard lock(mutex_);
        return missed_;
    }

    [[nodiscard]] std::vector<std::error_code> resume_results() const {
        std::lock_guard lock(mutex_);
        return resume_results_;
    }

private:
    std::atomic<Scheduler*> scheduler_{nullptr};
    mutable std::mutex mutex_;
    std::vector<StatusEvent> seen_;
    std::vector<std::error_code> resume_results_;
    int missed_{0};
};

} // namespace

TEST_CASE("Scheduler - sink may call back into the scheduler", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 64 * 1024;
    MockTransport transport(size);
    transport.close_gate_at(0);
    CallbackSink sink;
    auto settings = surge::test::fast_settings(dir.path().string());
    settings.max_concurrent_downloads = 1;
    Scheduler scheduler(settings, transport, sink, make_null_logger());
    sink.attach(&scheduler);

    auto a = scheduler.submit("https://example.com/a.bin");
    auto b = scheduler.submit("https://example.com/b.bin");
    REQUIRE((a && b));
    REQUIRE(has_status(scheduler, *b, TaskStatus::queued));

    // The Paused event reaches the sink on this thread, which resumes b
    REQUIRE_FALSE(scheduler.pause(*b));
    CHECK(has_status(scheduler, *b, TaskStatus::queued));
    REQUIRE(sink.resume_results().size() == 1);
    CHECK_FALSE(sink.resume_results().front());

    transport.open_gate();
    REQUIRE(scheduler.wait_idle(20s));

    CHECK(has_status(scheduler, *a, TaskStatus::completed));
    CHECK(has_status(scheduler, *b, TaskStatus::completed));
    CHECK(sink.missed() == 0);
    CHECK(sink.statuses(*a) == std::vector<TaskStatus>{
        TaskStatus::probing, TaskStatus::downloading, TaskStatus::completed});
    CHECK(sink.statuses(*b) == std::vector<TaskStatus>{
        TaskStatus::paused, TaskStatus::queued, TaskStatus::probing,
        TaskStatus::downloading, TaskStatus::completed});

    scheduler.shutdown();
    sink.attach(nullptr);
}

TEST_CASE("Scheduler - finished tasks can be cleared", "[scheduler]") {
    TempDir dir;
    const std::uint64_t size = 32 * 1024;
    MockTransport transport(size);
    RecordingSink sink;
    auto settings = surge::test::fast_settings(dir.path().string());
    settings.max_concurrent_downloads = 1;
    Scheduler scheduler(settings, transport, sink, make_null_logger());

    auto done = scheduler.submit("https://example.com/done.bin");
    REQUIRE(done);
    REQUIRE(scheduler.wait_idle(20s));
    REQUIRE(has_status(scheduler, *done, TaskStatus::completed));

    transport.fail_fetches(3, DownloadErrc::timeout);
    auto failed = scheduler.submit("https://example.com/failed.bin");
    REQUIRE(failed);
    REQUIRE(scheduler.wait_idle(20s));
    REQUIRE(has_status(scheduler, *failed, TaskStatus::failed));

    transport.close_gate_at(transport.served());
    auto running = scheduler.submit("https://example.com/running.bin");
    auto dropped = scheduler.submit("https://example.com/dropped.bin");
    REQUIRE((running && dropped));
    REQUIRE_FALSE(scheduler.cancel(*dropped));
    REQUIRE(has_status(scheduler, *dropped, TaskStatus::cancelled));

    CHECK(scheduler.clear_finished() == 2);
    CHECK(scheduler.status(*done).error() == DownloadErrc::unknown_task);
    CHECK(scheduler.status(*dropped).error() == DownloadErrc::unknown_task);
    CHECK(has_status(scheduler, *failed, TaskStatus::failed));
    CHECK(scheduler.status(*running).has_value());
    CHECK(scheduler.tasks().size() == 2);
    CHECK(scheduler.clear_finished() == 0);

    transport.open_gate();
    REQUIRE(scheduler.wait_idle(20s));
    CHECK(has_status(scheduler, *running, TaskStatus::completed));
    CHECK(scheduler.clear_finished() == 1);
    CHECK(scheduler.tasks().size() == 1);
}
