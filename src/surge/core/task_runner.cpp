// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/task_runner.hpp>
#include <surge/core/chunk_plan.hpp>
#include <surge/core/resume_store.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <condition_variable>

namespace surge::core {

namespace {

using Clock = std::chrono::steady_clock;

// Sleep that a stop request cuts short
void interruptible_wait(std::stop_token stop, std::chrono::milliseconds delay) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, delay, [] { return false; });
}

} // namespace

//=============================================================================
// TaskRunner
//=============================================================================

TaskRunner::TaskRunner(TaskState state,
                       Settings settings,
                       Transport& transport,
                       ProgressSink& sink,
                       Logger logger,
                       FinishCallback on_finish)
    : state_(std::move(state))
    , id_(state_.id)
    , settings_(std::move(settings))
    , transport_(transport)
    , sink_(sink)
    , logger_(std::move(logger))
    , on_finish_(std::move(on_finish))
    , published_(state_) {
    if (settings_.speed_limit_bps > 0) {
        limiter_ = std::make_unique<SpeedLimiter>(settings_.speed_limit_bps);
    }
}

TaskRunner::~TaskRunner() {
    // An owner going away keeps the work: pause, never discard
    if (thread_.joinable()) {
        pause();
        thread_.join();
    }
}

void TaskRunner::start() {
    thread_ = std::jthread([this](std::stop_token stop) { run(std::move(stop)); });
}

void TaskRunner::pause() noexcept {
    auto expected = StopIntent::none;
    intent_.compare_exchange_strong(expected, StopIntent::pause, std::memory_order_acq_rel);
    thread_.request_stop();
    mailbox_.notify();
}

void TaskRunner::cancel() noexcept {
    intent_.store(StopIntent::cancel, std::memory_order_release);
    thread_.request_stop();
    mailbox_.notify();
}

void TaskRunner::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

TaskState TaskRunner::snapshot() const {
    std::lock_guard lock(snapshot_mutex_);
    return published_;
}

void TaskRunner::run(std::stop_token stop) {
    TaskStatus final_status = TaskStatus::failed;

    try {
        transition(TaskStatus::probing);

        auto info = probe(stop);
        if (!info) {
            if (stop.stop_requested()) {
                final_status = settle_stop();
            } else {
                final_status = fail(info.error(), fmt::format("probe failed: {}", info.error().message()));
            }
        } else {
            std::string reason;
            const bool resuming = prepare_plan(*info, reason);
            const auto mode = resuming ? disk::OpenMode::resume : disk::OpenMode::create;

            if (auto ec = writer_.open(state_.destination_path, state_.total_size, mode)) {
                final_status = fail(ec, fmt::format("cannot open {}: {}", state_.destination_path, ec.message()));
            } else if (stop.stop_requested()) {
                final_status = settle_stop();
            } else {
                transition(TaskStatus::downloading, reason);
                persist();
                final_status = download(stop);
            }
        }
    } catch (const std::exception& e) {
        final_status = fail(make_error_code(DownloadErrc::invalid_state),
                            fmt::format("internal error: {}", e.what()));
    }

    publish();
    finished_.store(true, std::memory_order_release);
    if (on_finish_) {
        on_finish_(id_, final_status);
    }
}

std::expected<ProbeInfo, std::error_code> TaskRunner::probe(std::stop_token stop) {
    RetrySettings retry = settings_.retry;
    retry.max_retries = settings_.probe_retries;
    RetryPolicy policy(retry, seeds_());

    std::uint32_t attempts = 0;
    while (true) {
        auto info = transport_.probe(state_.source, stop);
        if (info) {
            logger_->debug("[{}] probe: size={} range={} etag='{}'", id_,
                           info->size ? std::to_string(*info->size) : std::string("unknown"),
                           info->supports_range, info->etag);
            return info;
        }
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        }

        ++attempts;
        auto delay = policy.next_delay(info.error(), attempts);
        if (!delay) {
            return std::unexpected(info.error());
        }
        logger_->warn("[{}] probe: {}, retry {}/{} in {} ms", id_, info.error().message(),
                      attempts, policy.max_retries(), delay->count());
        interruptible_wait(stop, *delay);
    }
}

std::string TaskRunner::check_resume(const ProbeInfo& info) const {
    if (state_.validate()) {
        return "chunk table is inconsistent";
    }
    if (state_.total_size != info.size) {
        return "remote size changed";
    }
    if (!state_.etag.empty() && !info.etag.empty() && state_.etag != info.etag) {
        return "ETag changed";
    }
    if (!state_.last_modified.empty() && !info.last_modified.empty()
        && state_.last_modified != info.last_modified) {
        return "Last-Modified changed";
    }

    auto on_disk = disk::file_size(state_.destination_path);
    if (!on_disk) {
        return "partial file is missing";
    }
    if (state_.total_size ? *on_disk != *state_.total_size : *on_disk < state_.bytes_completed()) {
        return "partial file does not match recorded progress";
    }
    return {};
}

bool TaskRunner::prepare_plan(const ProbeInfo& info, std::string& reason) {
    if (!state_.chunks.empty()) {
        auto problem = check_resume(info);
        if (problem.empty() && !(state_.supports_range && info.supports_range)
            && state_.bytes_completed() > 0 && !state_.all_chunks_completed()) {
            // A body that cannot be ranged has to start over
            problem = "server does not support byte ranges";
        }
        if (problem.empty()) {
            for (auto& chunk : state_.chunks) {
                if (chunk.status == ChunkStatus::completed) continue;
                chunk.status = ChunkStatus::pending;
                // Recorded under a larger retry budget, or at the moment of failure
                if (chunk.attempt_count >= settings_.retry.max_retries) {
                    chunk.attempt_count = 0;
                    chunk.last_error.clear();
                }
            }
            logger_->info("[{}] resuming at {} bytes", id_, state_.bytes_completed());
            return true;
        }

        reason = fmt::format("resume state discarded: {}", problem);
        logger_->warn("[{}] {}", id_, reason);
    }

    state_.total_size = info.size;
    state_.supports_range = info.supports_range;
    state_.etag = info.etag;
    state_.last_modified = info.last_modified;

    std::vector<ByteRange> ranges;
    if (info.size) {
        ranges = plan_chunks(*info.size, settings_.min_chunk_size, settings_.max_chunks_per_file,
                             settings_.target_chunk_count, info.supports_range);
    } else {
        ranges.push_back({0, OPEN_END});
    }
    state_.chunks = make_chunks(ranges);
    logger_->debug("[{}] planned {} chunk(s)", id_, state_.chunks.size());
    return false;
}

TaskStatus TaskRunner::download(std::stop_token stop) {
    ConcurrencyController controller(settings_.min_chunks_per_file,
                                     settings_.max_chunks_per_file,
                                     settings_.initial_chunks_per_file,
                                     settings_.throughput_window,
                                     settings_.adjust_cooldown);

    const auto tick = std::min(settings_.progress_interval, settings_.sample_interval);
    auto now = Clock::now();
    auto last_sample = now;
    auto last_persist = now;
    std::uint64_t sample_bytes = state_.bytes_completed();

    while (true) {
        if (stop.stop_requested()) {
            return settle_stop();
        }
        if (chunk_failure_) {
            return fail(chunk_failure_, chunk_failure_reason_);
        }
        if (workers_.empty() && state_.all_chunks_completed()) {
            return finalize();
        }

        spawn_workers(controller.target());

        for (const auto& report : mailbox_.wait_drain(tick)) {
            merge(report);
        }

        now = Clock::now();
        if (now - last_sample >= settings_.sample_interval) {
            const std::uint64_t bytes = state_.bytes_completed();
            const double seconds = std::chrono::duration<double>(now - last_sample).count();
            const double bps = bytes > sample_bytes ? static_cast<double>(bytes - sample_bytes) / seconds : 0.0;
            speed_bps_ = static_cast<std::uint64_t>(bps);
            sample_bytes = bytes;
            last_sample = now;

            const auto before = controller.target();
            const auto target = controller.observe(bps, now);
            if (target != before) {
                logger_->debug("[{}] chunk concurrency {} -> {} at {:.0f} B/s", id_, before, target, bps);
            }
            if (workers_.size() - shrinking_.size() > target) {
                shrink_one();
            }
        }

        watch_stalls(now);

        if (now - last_persist >= settings_.persist_interval) {
            persist();
            last_persist = now;
        }
        publish();
    }
}

void TaskRunner::spawn_workers(std::uint32_t target) {
    std::size_t active = workers_.size() - shrinking_.size();

    for (auto& chunk : state_.chunks) {
        if (active >= target) break;
        if (chunk.status != ChunkStatus::pending && chunk.status != ChunkStatus::paused) continue;
        // A stopping worker still owns this range until it reports
        if (workers_.contains(chunk.id)) continue;

        WorkerContext ctx;
        ctx.transport = &transport_;
        ctx.writer = &writer_;
        ctx.limiter = limiter_.get();
        ctx.mailbox = &mailbox_;
        ctx.logger = logger_;
        ctx.url = state_.source;
        ctx.task_id = id_;
        ctx.supports_range = state_.supports_range;
        ctx.progress_interval = settings_.progress_interval;

        auto worker = std::make_unique<ChunkWorker>(std::move(ctx), chunk,
                                                    RetryPolicy(settings_.retry, seeds_()));
        chunk.status = ChunkStatus::active;
        worker->start();
        workers_.emplace(chunk.id, std::move(worker));
        ++active;
    }
}

void TaskRunner::merge(const ChunkReport& report) {
    if (report.chunk_id >= state_.chunks.size()) {
        return;
    }
    auto& chunk = state_.chunks[report.chunk_id];

    auto advance = [&](std::uint64_t bytes) {
        if (bytes > chunk.bytes_downloaded) {
            const auto delta = bytes - chunk.bytes_downloaded;
            chunk.bytes_downloaded = bytes;
            emit_progress(chunk.id, delta);
        }
    };

    auto retire = [&] {
        if (auto it = workers_.find(report.chunk_id); it != workers_.end()) {
            it->second->join();
            workers_.erase(it);
        }
        shrinking_.erase(report.chunk_id);
    };

    switch (report.kind) {
        case ReportKind::progress:
            advance(report.bytes_downloaded);
            break;

        case ReportKind::retrying:
            if (report.bytes_downloaded < chunk.bytes_downloaded) {
                // Worker restarted an unrangeable body from byte 0
                chunk.bytes_downloaded = report.bytes_downloaded;
            } else {
                advance(report.bytes_downloaded);
            }
            chunk.attempt_count = report.attempt_count;
            chunk.last_error = report.error.message();
            break;

        case ReportKind::completed:
            advance(report.bytes_downloaded);
            if (chunk.range.open_ended()) {
                // Size learned at end of stream
                chunk.range.end = chunk.range.start + report.bytes_downloaded;
                state_.total_size = chunk.range.end;
            }
            chunk.status = ChunkStatus::completed;
            chunk.attempt_count = report.attempt_count;
            chunk.last_error.clear();
            retire();
            persist();
            break;

        case ReportKind::failed:
            advance(report.bytes_downloaded);
            chunk.status = ChunkStatus::failed;
            chunk.attempt_count = report.attempt_count;
            chunk.last_error = report.error.message();
            retire();
            if (!chunk_failure_) {
                chunk_failure_ = report.error;
                chunk_failure_reason_ = fmt::format("chunk {} failed at offset {} after {} attempt(s): {}",
                                                    chunk.id, chunk.resume_offset(),
                                                    chunk.attempt_count, chunk.last_error);
            }
            break;

        case ReportKind::stopped:
            advance(report.bytes_downloaded);
            chunk.status = ChunkStatus::pending;
            retire();
            break;
    }
}

void TaskRunner::stop_all_workers() {
    for (auto& [id, worker] : workers_) {
        worker->request_stop();
    }
    for (auto& [id, worker] : workers_) {
        worker->join();
    }
    // Every final report was posted before its thread exited
    for (const auto& report : mailbox_.drain()) {
        merge(report);
    }
    workers_.clear();
    shrinking_.clear();
}

void TaskRunner::shrink_one() {
    if (workers_.size() - shrinking_.size() <= 1) return;

    ChunkWorker* victim = nullptr;
    for (auto& [id, worker] : workers_) {
        if (shrinking_.contains(id)) continue;
        if (!victim || worker->remaining() > victim->remaining()) {
            victim = worker.get();
        }
    }
    if (victim) {
        logger_->debug("[{}] stopping chunk {} to lower concurrency", id_, victim->chunk_id());
        victim->request_stop();
        shrinking_.insert(victim->chunk_id());
    }
}

void TaskRunner::watch_stalls(ChunkWorker::Clock::time_point now) {
    const std::chrono::milliseconds timeout = settings_.chunk_timeout;
    for (auto& [id, worker] : workers_) {
        if (shrinking_.contains(id)) continue;
        if (worker->is_stalled(timeout, now)) {
            logger_->warn("[{}] chunk {}: no data for {} s, aborting attempt",
                          id_, id, settings_.chunk_timeout.count());
            worker->expire_attempt();
        }
    }
}

TaskStatus TaskRunner::settle_stop() {
    const auto intent = intent_.load(std::memory_order_acquire);
    stop_all_workers();

    if (intent == StopIntent::cancel) {
        writer_.close();
        if (auto ec = disk::remove_file(state_.destination_path)) {
            logger_->warn("[{}] could not delete {}: {}", id_, state_.destination_path, ec.message());
        }
        if (auto ec = resume_store::remove(state_.destination_path)) {
            logger_->warn("[{}] could not delete resume state: {}", id_, ec.message());
        }
        transition(TaskStatus::cancelled);
        return TaskStatus::cancelled;
    }

    for (auto& chunk : state_.chunks) {
        if (chunk.status != ChunkStatus::completed) {
            chunk.status = ChunkStatus::paused;
        }
    }
    if (writer_.is_open()) {
        if (auto ec = writer_.flush()) {
            logger_->warn("[{}] flush on pause: {}", id_, ec.message());
        }
        writer_.close();
    }
    transition(TaskStatus::paused);
    persist();
    logger_->info("[{}] paused at {} bytes", id_, state_.bytes_completed());
    return TaskStatus::paused;
}

TaskStatus TaskRunner::finalize() {
    if (auto ec = writer_.flush()) {
        return fail(ec, fmt::format("flush failed: {}", ec.message()));
    }

    auto realized = writer_.size();
    if (!realized) {
        return fail(realized.error(), fmt::format("cannot stat {}: {}",
                                                  state_.destination_path, realized.error().message()));
    }
    if (!state_.total_size || *realized != *state_.total_size) {
        return fail(make_error_code(DownloadErrc::size_mismatch),
                    fmt::format("file is {} bytes, expected {}", *realized,
                                state_.total_size ? std::to_string(*state_.total_size) : std::string("unknown")));
    }

    writer_.close();
    if (auto ec = resume_store::remove(state_.destination_path)) {
        logger_->warn("[{}] could not delete resume state: {}", id_, ec.message());
    }
    state_.failure_reason.clear();
    transition(TaskStatus::completed);
    logger_->info("[{}] completed {} ({} bytes)", id_, state_.destination_path, *state_.total_size);
    return TaskStatus::completed;
}

TaskStatus TaskRunner::fail(std::error_code ec, const std::string& reason) {
    stop_all_workers();

    for (auto& chunk : state_.chunks) {
        if (chunk.status == ChunkStatus::active) {
            chunk.status = ChunkStatus::pending;
        }
    }
    if (writer_.is_open()) {
        if (auto flush_ec = writer_.flush()) {
            logger_->warn("[{}] flush on failure: {}", id_, flush_ec.message());
        }
        writer_.close();
    }

    state_.failure_reason = reason;
    logger_->error("[{}] failed ({}): {}", id_, ec.message(), reason);
    transition(TaskStatus::failed, reason);
    persist();
    return TaskStatus::failed;
}

void TaskRunner::transition(TaskStatus to, std::string reason) {
    StatusEvent event;
    event.task_id = id_;
    event.from = state_.status;
    event.to = to;
    event.reason = std::move(reason);
    event.timestamp = Clock::now();

    state_.status = to;
    state_.touch();
    publish();

    try {
        sink_.on_status(event);
    } catch (const std::exception& e) {
        logger_->warn("[{}] progress sink: {}", id_, e.what());
    }
}

void TaskRunner::emit_progress(std::uint32_t chunk_id, std::uint64_t delta) {
    ProgressEvent event;
    event.task_id = id_;
    event.chunk_id = chunk_id;
    event.bytes_delta = delta;
    event.bytes_completed = state_.bytes_completed();
    event.total_size = state_.total_size;
    event.speed_bps = speed_bps_;
    event.timestamp = Clock::now();

    try {
        sink_.on_progress(event);
    } catch (const std::exception& e) {
        logger_->warn("[{}] progress sink: {}", id_, e.what());
    }
}

void TaskRunner::persist() {
    state_.touch();
    if (auto ec = resume_store::save(state_)) {
        logger_->warn("[{}] could not save resume state: {}", id_, ec.message());
    }
}

void TaskRunner::publish() {
    std::lock_guard lock(snapshot_mutex_);
    published_ = state_;
}

} // namespace surge::core
