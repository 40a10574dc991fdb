// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/chunk_worker.hpp>
#include <surge/core/config.hpp>
#include <surge/core/logging.hpp>
#include <surge/core/mailbox.hpp>
#include <surge/core/progress.hpp>
#include <surge/core/speed_limiter.hpp>
#include <surge/core/task_state.hpp>
#include <surge/core/throughput.hpp>
#include <surge/core/transport.hpp>
#include <surge/disk/file_writer.hpp>
#include <atomic>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stop_token>
#include <string>
#include <thread>

namespace surge::core {

// Sole owner of one TaskState while the task is active.
//
// Runs Probing -> Downloading -> Completed | Failed | Paused | Cancelled on
// its own thread. Workers talk to it only through its mailbox, so every
// merge and status transition happens on the runner thread.
class TaskRunner {
public:
    using FinishCallback = std::function<void(const std::string& task_id, TaskStatus status)>;

    TaskRunner(TaskState state,
               Settings settings,
               Transport& transport,
               ProgressSink& sink,
               Logger logger,
               FinishCallback on_finish = {});
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    void start();

    // Asynchronous requests; the runner settles in Paused / Cancelled
    void pause() noexcept;
    void cancel() noexcept;

    void join();

    // Read-only copy of the task as of the last merge
    [[nodiscard]] TaskState snapshot() const;
    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }

private:
    enum class StopIntent : std::uint8_t { none, pause, cancel };

    void run(std::stop_token stop);

    // Phases
    [[nodiscard]] std::expected<ProbeInfo, std::error_code> probe(std::stop_token stop);
    // Returns true when recorded progress is kept
    bool prepare_plan(const ProbeInfo& info, std::string& reason);
    [[nodiscard]] std::string check_resume(const ProbeInfo& info) const;
    [[nodiscard]] TaskStatus download(std::stop_token stop);

    // Worker management
    void spawn_workers(std::uint32_t target);
    void merge(const ChunkReport& report);
    void stop_all_workers();
    void shrink_one();
    void watch_stalls(ChunkWorker::Clock::time_point now);

    // Terminal handling
    [[nodiscard]] TaskStatus settle_stop();
    [[nodiscard]] TaskStatus finalize();
    [[nodiscard]] TaskStatus fail(std::error_code ec, const std::string& reason);

    void transition(TaskStatus to, std::string reason = {});
    void emit_progress(std::uint32_t chunk_id, std::uint64_t delta);
    void persist();
    void publish();

    TaskState state_;
    const std::string id_;
    Settings settings_;
    Transport& transport_;
    ProgressSink& sink_;
    Logger logger_;
    FinishCallback on_finish_;

    disk::FileWriter writer_;
    std::unique_ptr<SpeedLimiter> limiter_;
    Mailbox<ChunkReport> mailbox_;
    std::map<std::uint32_t, std::unique_ptr<ChunkWorker>> workers_;
    std::set<std::uint32_t> shrinking_;   // Stopped to lower concurrency
    std::mt19937_64 seeds_{std::random_device{}()};

    std::uint64_t speed_bps_{0};
    std::error_code chunk_failure_;
    std::string chunk_failure_reason_;

    std::atomic<StopIntent> intent_{StopIntent::none};
    std::atomic<bool> finished_{false};

    mutable std::mutex snapshot_mutex_;
    TaskState published_;

    std::jthread thread_;
};

} // namespace surge::core
