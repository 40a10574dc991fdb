// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/logging.hpp>
#include <surge/core/progress.hpp>
#include <surge/core/task_runner.hpp>
#include <surge/core/task_state.hpp>
#include <surge/core/transport.hpp>
#include <surge/core/url.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace surge::core {

// Task-level scheduler: a submission queue plus a bounded set of active
// TaskRunners (max_concurrent_downloads). A slot frees when a runner ends in
// Completed, Failed, Cancelled or Paused; the next queued task is admitted.
//
// All public methods are thread-safe.
class Scheduler {
public:
    Scheduler(Settings settings, Transport& transport, ProgressSink& sink, Logger logger);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Validate and queue a download. An empty destination means
    // output_dir/<filename from URL>; a relative one is placed under output_dir.
    [[nodiscard]] std::expected<std::string, std::error_code>
    submit(std::string_view url, std::string_view destination = {}, const TaskOverrides& overrides = {});

    [[nodiscard]] std::error_code pause(const std::string& task_id);
    [[nodiscard]] std::error_code resume(const std::string& task_id);
    [[nodiscard]] std::error_code cancel(const std::string& task_id);

    void pause_all();
    void resume_all();
    void cancel_all();

    [[nodiscard]] std::expected<TaskState, std::error_code> status(const std::string& task_id) const;
    [[nodiscard]] std::vector<TaskState> tasks() const;

    // Forget Completed and Cancelled tasks; returns how many were dropped
    std::size_t clear_finished();

    // Re-admit non-terminal tasks persisted under output_dir by an earlier
    // run (auto_resume). Failed tasks are listed but not queued.
    // Returns the number of tasks queued.
    std::size_t restore_persisted();

    // Block until nothing is queued or running; false on timeout
    [[nodiscard]] bool wait_idle(std::chrono::milliseconds timeout);

    // Pause every active task, join all threads and flush the sink.
    // Called by the destructor; safe to call twice.
    void shutdown();

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

private:
    struct Entry {
        TaskState state;                       // Authoritative while no runner exists
        Settings settings;                     // Effective settings for this task
        std::unique_ptr<TaskRunner> runner;
        bool resume_requested{false};          // Resume arrived while a pause was settling
        bool cancel_requested{false};          // Cancel arrived while the runner was stopping
    };

    // Sends the status events queued under mutex_ once it is released.
    // Declared ahead of the lock in each operation so it runs after unlock.
    struct EventFlush {
        Scheduler& owner;
        ~EventFlush() { owner.deliver_events(); }
    };

    // Sink handed to runners: their status events go out after any the
    // scheduler queued earlier, so each task's transitions arrive in order.
    class OrderedSink final : public ProgressSink {
    public:
        explicit OrderedSink(Scheduler& owner) : owner_(owner) {}
        void on_progress(const ProgressEvent& event) override { owner_.sink_.on_progress(event); }
        void on_status(const StatusEvent& event) override { owner_.deliver_events(&event); }

    private:
        Scheduler& owner_;
    };

    void dispatch(std::stop_token stop);
    void deliver_events(const StatusEvent* trailing = nullptr);

    // Helpers below expect mutex_ to be held
    void admit_locked();
    [[nodiscard]] std::vector<std::unique_ptr<TaskRunner>> reap_locked();
    [[nodiscard]] std::size_t active_locked() const;
    [[nodiscard]] bool idle_locked() const;
    void enqueue_locked(Entry& entry, std::string reason = {});
    void set_status_locked(Entry& entry, TaskStatus to, std::string reason = {});
    void discard_files_locked(const Entry& entry);
    [[nodiscard]] std::error_code pause_locked(Entry& entry);
    [[nodiscard]] std::error_code resume_locked(Entry& entry);
    [[nodiscard]] std::error_code cancel_locked(Entry& entry);
    [[nodiscard]] Entry* find_by_destination_locked(const std::string& path);
    [[nodiscard]] bool destination_taken_locked(const std::string& path);
    [[nodiscard]] std::expected<std::string, std::error_code>
    resolve_destination(const Url& url, std::string_view destination) const;

    Settings settings_;
    Transport& transport_;
    ProgressSink& sink_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<std::string, Entry> tasks_;
    std::deque<std::string> queue_;
    std::vector<StatusEvent> outbox_;
    std::recursive_mutex delivery_mutex_;   // Serializes sink status calls; taken before mutex_
    OrderedSink relay_{*this};
    bool reap_pending_{false};
    bool shut_down_{false};

    std::jthread dispatcher_;   // Last member: started once the rest exists
};

} // namespace surge::core
