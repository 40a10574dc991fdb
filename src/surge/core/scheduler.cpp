// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/scheduler.hpp>
#include <surge/core/resume_store.hpp>
#include <surge/disk/error.hpp>
#include <surge/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <filesystem>

namespace surge::core {

namespace fs = std::filesystem;

namespace {

constexpr int MAX_RENAME_ATTEMPTS = 9999;

// Failed chunks get a fresh retry budget; completed work is kept
void reset_failed_chunks(TaskState& state) {
    for (auto& chunk : state.chunks) {
        if (chunk.status == ChunkStatus::failed) {
            chunk.status = ChunkStatus::pending;
            chunk.attempt_count = 0;
            chunk.last_error.clear();
        }
    }
    state.failure_reason.clear();
}

// "name.ext" -> "name (n).ext" in the same directory
std::string numbered_path(const fs::path& path, int n) {
    auto name = fmt::format("{} ({}){}", path.stem().string(), n, path.extension().string());
    return (path.parent_path() / name).string();
}

} // namespace

//=============================================================================
// Scheduler
//=============================================================================

Scheduler::Scheduler(Settings settings, Transport& transport, ProgressSink& sink, Logger logger)
    : settings_(std::move(settings))
    , transport_(transport)
    , sink_(sink)
    , logger_(std::move(logger)) {
    dispatcher_ = std::jthread([this](std::stop_token stop) { dispatch(std::move(stop)); });
}

Scheduler::~Scheduler() {
    shutdown();
}

std::expected<std::string, std::error_code>
Scheduler::submit(std::string_view url, std::string_view destination, const TaskOverrides& overrides) {
    auto parsed = Url::parse(url);
    if (!parsed) {
        logger_->warn("rejected '{}': {}", url, parsed.error().message());
        return std::unexpected(parsed.error());
    }

    auto effective = apply_overrides(settings_, overrides);
    if (!effective) {
        logger_->warn("rejected '{}': {}", url, effective.error().message());
        return std::unexpected(effective.error());
    }

    auto resolved = resolve_destination(*parsed, destination);
    if (!resolved) {
        logger_->warn("rejected '{}': {}", url, resolved.error().message());
        return std::unexpected(resolved.error());
    }

    const std::string source(url);
    std::string path = *resolved;

    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::string task_id;
    {
        std::lock_guard lock(mutex_);
        if (shut_down_) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_state));
        }
        done = reap_locked();

        // Same download submitted twice
        if (auto* existing = find_by_destination_locked(path); existing && existing->state.source == source) {
            if (auto ec = resume_locked(*existing)) {
                return std::unexpected(ec);
            }
            admit_locked();
            return existing->state.id;
        }

        // Unfinished download left on disk by an earlier run
        if (!find_by_destination_locked(path) && resume_store::exists(path)) {
            auto saved = resume_store::load(path);
            if (!saved) {
                logger_->warn("discarding unreadable resume state for {}: {}", path, saved.error().message());
                if (auto ec = resume_store::remove(path)) {
                    logger_->warn("could not delete resume state for {}: {}", path, ec.message());
                }
            } else if (saved->source == source
                       && saved->status != TaskStatus::completed
                       && saved->status != TaskStatus::cancelled) {
                task_id = saved->id;
                tasks_.erase(task_id);
                auto& entry = tasks_[task_id];
                entry.state = std::move(*saved);
                entry.settings = *effective;
                reset_failed_chunks(entry.state);
                logger_->info("[{}] found saved progress for {} ({} bytes)", task_id, path,
                              entry.state.bytes_completed());
                enqueue_locked(entry, "resuming saved progress");
                admit_locked();
                return task_id;
            }
        }

        if (destination_taken_locked(path)) {
            if (settings_.overwrite_existing && !find_by_destination_locked(path)) {
                logger_->info("overwriting {}", path);
                if (auto ec = resume_store::remove(path)) {
                    logger_->warn("could not delete resume state for {}: {}", path, ec.message());
                }
            } else if (settings_.auto_rename) {
                const fs::path original(path);
                bool found = false;
                for (int n = 1; n <= MAX_RENAME_ATTEMPTS && !found; ++n) {
                    path = numbered_path(original, n);
                    found = !destination_taken_locked(path);
                }
                if (!found) {
                    return std::unexpected(make_error_code(disk::DiskErrc::file_exists));
                }
            } else {
                logger_->warn("rejected '{}': {} already exists", url, path);
                return std::unexpected(make_error_code(disk::DiskErrc::file_exists));
            }
        }

        task_id = generate_task_id();
        auto& entry = tasks_[task_id];
        entry.state.id = task_id;
        entry.state.source = source;
        entry.state.destination_path = path;
        entry.state.status = TaskStatus::queued;
        entry.state.created_at = TaskState::Clock::now();
        entry.state.updated_at = entry.state.created_at;
        entry.settings = *effective;

        logger_->info("[{}] queued {} -> {}", task_id, source, path);
        enqueue_locked(entry);
        admit_locked();
    }
    return task_id;
}

std::error_code Scheduler::pause(const std::string& task_id) {
    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::lock_guard lock(mutex_);
    done = reap_locked();

    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error_code(DownloadErrc::unknown_task);
    }
    auto ec = pause_locked(it->second);
    admit_locked();
    return ec;
}

std::error_code Scheduler::resume(const std::string& task_id) {
    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::lock_guard lock(mutex_);
    done = reap_locked();

    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error_code(DownloadErrc::unknown_task);
    }
    auto ec = resume_locked(it->second);
    admit_locked();
    return ec;
}

std::error_code Scheduler::cancel(const std::string& task_id) {
    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::lock_guard lock(mutex_);
    done = reap_locked();

    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return make_error_code(DownloadErrc::unknown_task);
    }
    auto ec = cancel_locked(it->second);
    admit_locked();
    return ec;
}

void Scheduler::pause_all() {
    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::lock_guard lock(mutex_);
    done = reap_locked();

    for (auto& [id, entry] : tasks_) {
        if (entry.runner || !entry.state.is_terminal()) {
            if (auto ec = pause_locked(entry)) {
                logger_->debug("[{}] pause: {}", id, ec.message());
            }
        }
    }
}

void Scheduler::resume_all() {
    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::lock_guard lock(mutex_);
    done = reap_locked();

    for (auto& [id, entry] : tasks_) {
        if (entry.state.status == TaskStatus::paused) {
            if (auto ec = resume_locked(entry)) {
                logger_->debug("[{}] resume: {}", id, ec.message());
            }
        }
    }
    admit_locked();
}

void Scheduler::cancel_all() {
    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::lock_guard lock(mutex_);
    done = reap_locked();

    // Drop the queue first so nothing is admitted in between
    queue_.clear();
    for (auto& [id, entry] : tasks_) {
        if (entry.runner || !entry.state.is_terminal()) {
            if (auto ec = cancel_locked(entry)) {
                logger_->debug("[{}] cancel: {}", id, ec.message());
            }
        }
    }
}

std::expected<TaskState, std::error_code> Scheduler::status(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::unexpected(make_error_code(DownloadErrc::unknown_task));
    }
    if (it->second.runner) {
        return it->second.runner->snapshot();
    }
    return it->second.state;
}

std::size_t Scheduler::clear_finished() {
    std::lock_guard lock(mutex_);
    return std::erase_if(tasks_, [](const auto& item) {
        const auto& entry = item.second;
        return !entry.runner && (entry.state.status == TaskStatus::completed ||
                                 entry.state.status == TaskStatus::cancelled);
    });
}

std::vector<TaskState> Scheduler::tasks() const {
    std::vector<TaskState> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(tasks_.size());
        for (const auto& [id, entry] : tasks_) {
            result.push_back(entry.runner ? entry.runner->snapshot() : entry.state);
        }
    }
    std::ranges::sort(result, [](const TaskState& a, const TaskState& b) {
        return a.created_at != b.created_at ? a.created_at < b.created_at : a.id < b.id;
    });
    return result;
}

std::size_t Scheduler::restore_persisted() {
    if (!settings_.auto_resume) {
        return 0;
    }

    const auto found = resume_store::scan(settings_.output_dir);
    std::size_t queued = 0;

    EventFlush flush{*this};
    std::vector<std::unique_ptr<TaskRunner>> done;
    std::lock_guard lock(mutex_);
    if (shut_down_) {
        return 0;
    }
    done = reap_locked();

    for (const auto& path : found) {
        auto saved = resume_store::load(path);
        if (!saved) {
            logger_->warn("ignoring unreadable resume state for {}: {}", path, saved.error().message());
            continue;
        }
        if (tasks_.contains(saved->id) || find_by_destination_locked(saved->destination_path)) {
            continue;
        }
        if (saved->status == TaskStatus::completed || saved->status == TaskStatus::cancelled) {
            continue;
        }

        const std::string task_id = saved->id;
        auto& entry = tasks_[task_id];
        entry.state = std::move(*saved);
        entry.settings = settings_;

        if (entry.state.status == TaskStatus::failed) {
            logger_->info("[{}] restored failed task {}: {}", task_id,
                          entry.state.destination_path, entry.state.failure_reason);
            continue;
        }

        logger_->info("[{}] restoring {} at {} bytes", task_id, entry.state.destination_path,
                      entry.state.bytes_completed());
        enqueue_locked(entry, "restored from previous run");
        ++queued;
    }
    admit_locked();
    return queued;
}

bool Scheduler::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return idle_locked(); });
}

void Scheduler::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
    }

    dispatcher_.request_stop();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    std::vector<std::pair<std::string, std::unique_ptr<TaskRunner>>> live;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : tasks_) {
            if (entry.runner) {
                live.emplace_back(id, std::move(entry.runner));
            }
        }
        queue_.clear();
    }

    // Runners take the lock in their finish callback; join without it
    for (auto& [id, runner] : live) {
        runner->pause();
    }
    for (auto& [id, runner] : live) {
        runner->join();
    }

    {
        std::lock_guard lock(mutex_);
        for (auto& [id, runner] : live) {
            tasks_[id].state = runner->snapshot();
        }
    }
    live.clear();
    deliver_events();

    try {
        sink_.flush();
    } catch (const std::exception& e) {
        logger_->warn("progress sink: {}", e.what());
    }
    logger_->flush();
    cv_.notify_all();
}

void Scheduler::dispatch(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::vector<std::unique_ptr<TaskRunner>> done;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [this] { return reap_pending_; });
            if (stop.stop_requested()) break;
            done = reap_locked();
            admit_locked();
        }
        // Finished runners are joined outside the lock
        done.clear();
        deliver_events();
        cv_.notify_all();
    }
}

void Scheduler::admit_locked() {
    while (!shut_down_ && !queue_.empty() && active_locked() < settings_.max_concurrent_downloads) {
        const std::string task_id = queue_.front();
        queue_.pop_front();

        auto it = tasks_.find(task_id);
        if (it == tasks_.end() || it->second.runner || it->second.state.status != TaskStatus::queued) {
            continue;
        }

        auto& entry = it->second;
        entry.resume_requested = false;
        entry.cancel_requested = false;
        entry.runner = std::make_unique<TaskRunner>(
            entry.state, entry.settings, transport_, relay_, logger_,
            [this](const std::string&, TaskStatus) {
                {
                    std::lock_guard lock(mutex_);
                    reap_pending_ = true;
                }
                cv_.notify_all();
            });
        logger_->debug("[{}] admitted ({} active)", task_id, active_locked());
        entry.runner->start();
    }
}

std::vector<std::unique_ptr<TaskRunner>> Scheduler::reap_locked() {
    std::vector<std::unique_ptr<TaskRunner>> done;

    for (auto& [id, entry] : tasks_) {
        if (!entry.runner || !entry.runner->finished()) continue;

        entry.state = entry.runner->snapshot();
        done.push_back(std::move(entry.runner));

        if (entry.cancel_requested) {
            if (auto ec = cancel_locked(entry)) {
                logger_->debug("[{}] cancel after stop: {}", id, ec.message());
            }
        } else if (entry.resume_requested && entry.state.status == TaskStatus::paused) {
            enqueue_locked(entry);
        }
        entry.resume_requested = false;
        entry.cancel_requested = false;
    }
    reap_pending_ = false;
    return done;
}

std::size_t Scheduler::active_locked() const {
    return static_cast<std::size_t>(std::ranges::count_if(tasks_, [](const auto& item) {
        return item.second.runner && !item.second.runner->finished();
    }));
}

bool Scheduler::idle_locked() const {
    if (!queue_.empty()) return false;
    return std::ranges::none_of(tasks_, [](const auto& item) { return item.second.runner != nullptr; });
}

void Scheduler::enqueue_locked(Entry& entry, std::string reason) {
    if (entry.state.status != TaskStatus::queued) {
        set_status_locked(entry, TaskStatus::queued, std::move(reason));
    }
    if (std::ranges::find(queue_, entry.state.id) == queue_.end()) {
        queue_.push_back(entry.state.id);
    }
}

void Scheduler::set_status_locked(Entry& entry, TaskStatus to, std::string reason) {
    StatusEvent event;
    event.task_id = entry.state.id;
    event.from = entry.state.status;
    event.to = to;
    event.reason = std::move(reason);
    event.timestamp = std::chrono::steady_clock::now();

    entry.state.status = to;
    entry.state.touch();
    outbox_.push_back(std::move(event));
}

void Scheduler::deliver_events(const StatusEvent* trailing) {
    std::lock_guard order(delivery_mutex_);
    std::vector<StatusEvent> events;
    {
        std::lock_guard lock(mutex_);
        events.swap(outbox_);
    }
    if (trailing) {
        events.push_back(*trailing);
    }
    for (const auto& event : events) {
        try {
            sink_.on_status(event);
        } catch (const std::exception& e) {
            logger_->warn("[{}] progress sink: {}", event.task_id, e.what());
        }
    }
}

void Scheduler::discard_files_locked(const Entry& entry) {
    const auto& path = entry.state.destination_path;
    // A task that never planned chunks has not written the file
    if (!entry.state.chunks.empty()) {
        if (auto ec = disk::remove_file(path)) {
            logger_->warn("[{}] could not delete {}: {}", entry.state.id, path, ec.message());
        }
    }
    if (auto ec = resume_store::remove(path)) {
        logger_->warn("[{}] could not delete resume state: {}", entry.state.id, ec.message());
    }
}

std::error_code Scheduler::pause_locked(Entry& entry) {
    if (entry.runner) {
        entry.resume_requested = false;
        entry.runner->pause();
        return {};
    }

    switch (entry.state.status) {
        case TaskStatus::queued: {
            std::erase(queue_, entry.state.id);
            set_status_locked(entry, TaskStatus::paused);
            if (auto ec = resume_store::save(entry.state)) {
                logger_->warn("[{}] could not save resume state: {}", entry.state.id, ec.message());
            }
            return {};
        }
        case TaskStatus::paused:
            return {};
        default:
            return make_error_code(DownloadErrc::invalid_state);
    }
}

std::error_code Scheduler::resume_locked(Entry& entry) {
    if (entry.runner) {
        // Takes effect if the runner settles in Paused
        entry.resume_requested = true;
        return {};
    }

    switch (entry.state.status) {
        case TaskStatus::queued:
        case TaskStatus::probing:
        case TaskStatus::downloading:
            enqueue_locked(entry);
            return {};
        case TaskStatus::paused:
            enqueue_locked(entry);
            return {};
        case TaskStatus::failed:
            reset_failed_chunks(entry.state);
            logger_->info("[{}] retrying failed task", entry.state.id);
            enqueue_locked(entry, "retrying after failure");
            return {};
        case TaskStatus::completed:
        case TaskStatus::cancelled:
            break;
    }
    return make_error_code(DownloadErrc::invalid_state);
}

std::error_code Scheduler::cancel_locked(Entry& entry) {
    if (entry.runner) {
        entry.cancel_requested = true;
        entry.runner->cancel();
        return {};
    }

    switch (entry.state.status) {
        case TaskStatus::completed:
            return make_error_code(DownloadErrc::invalid_state);
        case TaskStatus::cancelled:
            return {};
        default:
            std::erase(queue_, entry.state.id);
            discard_files_locked(entry);
            logger_->info("[{}] cancelled", entry.state.id);
            set_status_locked(entry, TaskStatus::cancelled);
            return {};
    }
}

Scheduler::Entry* Scheduler::find_by_destination_locked(const std::string& path) {
    for (auto& [id, entry] : tasks_) {
        if (entry.state.destination_path != path) continue;
        if (entry.runner
            || (entry.state.status != TaskStatus::completed && entry.state.status != TaskStatus::cancelled)) {
            return &entry;
        }
    }
    return nullptr;
}

bool Scheduler::destination_taken_locked(const std::string& path) {
    return find_by_destination_locked(path)
        || disk::file_size(path).has_value()
        || resume_store::exists(path);
}

std::expected<std::string, std::error_code>
Scheduler::resolve_destination(const Url& url, std::string_view destination) const {
    try {
        fs::path path;
        if (destination.empty()) {
            path = fs::path(settings_.output_dir) / url.filename();
        } else {
            path = fs::path(std::string(destination));
            if (path.is_relative()) {
                path = fs::path(settings_.output_dir) / path;
            }
            std::error_code ec;
            if (!path.has_filename() || fs::is_directory(path, ec)) {
                path /= url.filename();
            }
        }
        path = path.lexically_normal();

        const auto parent = path.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            if (!fs::is_directory(parent, ec)) {
                if (!settings_.create_directories) {
                    return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
                }
                fs::create_directories(parent, ec);
                if (ec) {
                    return std::unexpected(disk::errno_to_error_code(ec.value()));
                }
            }
        }
        return path.string();
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
    }
}

} // namespace surge::core
