// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/chunk_worker.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>

namespace surge::core {

ChunkWorker::ChunkWorker(WorkerContext context, const ChunkState& chunk, RetryPolicy policy)
    : ctx_(std::move(context))
    , chunk_id_(chunk.id)
    , range_(chunk.range)
    // A budget spent under other settings starts over
    , initial_attempts_(chunk.attempt_count < policy.max_retries() ? chunk.attempt_count : 0)
    , initial_bytes_(chunk.bytes_downloaded)
    , policy_(std::move(policy))
    , bytes_downloaded_(chunk.bytes_downloaded) {}

ChunkWorker::~ChunkWorker() {
    request_stop();
    join();
}

void ChunkWorker::start() {
    thread_ = std::jthread([this](std::stop_token stop) { run(std::move(stop)); });
}

void ChunkWorker::request_stop() noexcept {
    thread_.request_stop();
}

void ChunkWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ChunkWorker::expire_attempt() noexcept {
    std::lock_guard lock(attempt_mutex_);
    if (attempt_stop_.stop_possible()) {
        timed_out_ = true;
        attempt_stop_.request_stop();
    }
}

std::uint64_t ChunkWorker::remaining() const noexcept {
    if (range_.open_ended()) return OPEN_END;
    auto done = bytes_downloaded();
    auto len = range_.length();
    return done >= len ? 0 : len - done;
}

bool ChunkWorker::is_stalled(std::chrono::milliseconds timeout, Clock::time_point now) const noexcept {
    if (!in_attempt_.load(std::memory_order_acquire)) return false;
    Clock::time_point last{Clock::duration{last_activity_.load(std::memory_order_relaxed)}};
    return now - last >= timeout;
}

void ChunkWorker::post(ReportKind kind, std::uint64_t bytes, std::uint32_t attempts,
                       std::error_code ec, std::chrono::milliseconds delay) {
    ChunkReport report;
    report.kind = kind;
    report.chunk_id = chunk_id_;
    report.bytes_downloaded = bytes;
    report.attempt_count = attempts;
    report.error = ec;
    report.retry_delay = delay;
    ctx_.mailbox->post(std::move(report));
}

void ChunkWorker::run(std::stop_token stop) {
    std::uint64_t bytes = initial_bytes_;
    std::uint32_t attempts = initial_attempts_;
    auto& log = *ctx_.logger;

    // Guarantees the runner always hears a final report
    struct FinishGuard {
        std::atomic<bool>& flag;
        ~FinishGuard() { flag.store(true, std::memory_order_release); }
    } guard{finished_};

    while (true) {
        if (stop.stop_requested()) {
            post(ReportKind::stopped, bytes, attempts);
            return;
        }
        if (!range_.open_ended() && bytes >= range_.length()) {
            post(ReportKind::completed, bytes, attempts);
            return;
        }

        std::stop_source attempt;
        {
            std::lock_guard lock(attempt_mutex_);
            attempt_stop_ = attempt;
            timed_out_ = false;
        }
        std::stop_callback forward(stop, [&attempt] { attempt.request_stop(); });
        std::stop_token attempt_token = attempt.get_token();

        FetchRequest request;
        request.url = ctx_.url;
        request.offset = range_.start + bytes;
        if (!range_.open_ended()) {
            request.end = range_.end;
        }
        request.resume = bytes > 0;

        log.debug("[{}] chunk {}: fetching from offset {} (attempt {})",
                  ctx_.task_id, chunk_id_, request.offset, attempts + 1);

        auto last_report = Clock::now();
        last_activity_.store(last_report.time_since_epoch().count(), std::memory_order_relaxed);
        in_attempt_.store(true, std::memory_order_release);

        const ChunkConsumer consumer = [&](const std::byte* data, std::size_t size) -> std::error_code {
            if (attempt_token.stop_requested()) {
                return make_error_code(DownloadErrc::cancelled);
            }

            std::size_t n = size;
            if (!range_.open_ended()) {
                // Bytes past the range end belong to the next chunk
                n = static_cast<std::size_t>(std::min<std::uint64_t>(size, range_.length() - bytes));
                if (n == 0) return {};
            }

            // Throttled writes go in slices so a long wait never looks like a stall
            const std::size_t slice = ctx_.limiter ? ctx_.limiter->slice() : n;
            for (std::size_t done = 0; done < n;) {
                const std::size_t piece = std::min(slice, n - done);
                if (ctx_.limiter && !ctx_.limiter->acquire(piece, attempt_token)) {
                    return make_error_code(DownloadErrc::cancelled);
                }
                if (auto ec = ctx_.writer->write(range_.start + bytes, data + done, piece)) {
                    return ec;
                }
                done += piece;
                bytes += piece;
                bytes_downloaded_.store(bytes, std::memory_order_relaxed);
                last_activity_.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
            }

            auto now = Clock::now();
            if (now - last_report >= ctx_.progress_interval) {
                last_report = now;
                post(ReportKind::progress, bytes, attempts);
            }
            return {};
        };

        std::error_code ec = ctx_.transport->fetch(request, consumer, attempt_token);
        in_attempt_.store(false, std::memory_order_release);

        bool timed_out = false;
        {
            std::lock_guard lock(attempt_mutex_);
            timed_out = timed_out_;
            attempt_stop_ = std::stop_source{std::nostopstate};
        }

        if (ec == DownloadErrc::cancelled && !stop.stop_requested() && timed_out) {
            ec = make_error_code(DownloadErrc::timeout);
        }

        if (!ec) {
            if (range_.open_ended() || bytes >= range_.length()) {
                post(ReportKind::completed, bytes, attempts);
                return;
            }
            // Server closed the body early
            ec = make_error_code(DownloadErrc::truncated_transfer);
        }

        if (ec == DownloadErrc::cancelled && stop.stop_requested()) {
            post(ReportKind::stopped, bytes, attempts);
            return;
        }

        ++attempts;
        auto delay = policy_.next_delay(ec, attempts);
        if (!delay) {
            log.error("[{}] chunk {}: {} after {} attempt(s) at offset {}",
                      ctx_.task_id, chunk_id_, ec.message(), attempts, range_.start + bytes);
            post(ReportKind::failed, bytes, attempts, ec);
            return;
        }

        // Without range support the next attempt starts the body over
        if (!ctx_.supports_range && bytes > 0) {
            bytes = 0;
            bytes_downloaded_.store(0, std::memory_order_relaxed);
        }

        log.warn("[{}] chunk {}: {}, retry {}/{} in {} ms",
                 ctx_.task_id, chunk_id_, ec.message(), attempts, policy_.max_retries(), delay->count());
        post(ReportKind::retrying, bytes, attempts, ec, *delay);

        // Interruptible backoff
        std::mutex wait_mutex;
        std::condition_variable_any wait_cv;
        std::unique_lock lock(wait_mutex);
        wait_cv.wait_for(lock, stop, *delay, [] { return false; });
    }
}

} // namespace surge::core
