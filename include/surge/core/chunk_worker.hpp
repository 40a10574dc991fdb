// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/logging.hpp>
#include <surge/core/mailbox.hpp>
#include <surge/core/retry_policy.hpp>
#include <surge/core/speed_limiter.hpp>
#include <surge/core/task_state.hpp>
#include <surge/core/transport.hpp>
#include <surge/disk/file_writer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace surge::core {

enum class ReportKind : std::uint8_t {
    progress,    // More bytes are on disk
    retrying,    // Attempt failed, waiting delay before the next one
    completed,   // Whole range on disk
    failed,      // Retries exhausted or fatal error
    stopped      // Stop requested; progress up to bytes_downloaded is valid
};

// Message from a worker to its TaskRunner
struct ChunkReport {
    ReportKind kind{ReportKind::progress};
    std::uint32_t chunk_id{0};
    std::uint64_t bytes_downloaded{0};   // Confirmed on disk, absolute for the chunk
    std::uint32_t attempt_count{0};
    std::error_code error;
    std::chrono::milliseconds retry_delay{0};
};

// Task-wide collaborators shared by every worker of one task.
// The TaskRunner keeps all of them alive until its workers are joined.
struct WorkerContext {
    Transport* transport{nullptr};
    disk::FileWriter* writer{nullptr};
    SpeedLimiter* limiter{nullptr};      // Null when unlimited
    Mailbox<ChunkReport>* mailbox{nullptr};
    Logger logger;
    std::string url;
    std::string task_id;
    bool supports_range{true};
    std::chrono::milliseconds progress_interval{250};
};

// Drives one chunk's byte range to completion on its own thread
class ChunkWorker {
public:
    using Clock = std::chrono::steady_clock;

    ChunkWorker(WorkerContext context, const ChunkState& chunk, RetryPolicy policy);
    ~ChunkWorker();

    ChunkWorker(const ChunkWorker&) = delete;
    ChunkWorker& operator=(const ChunkWorker&) = delete;

    void start();

    // Cooperative stop; the current write completes first
    void request_stop() noexcept;
    void join();

    // Abort the in-flight attempt as a timeout (stall watchdog)
    void expire_attempt() noexcept;

    [[nodiscard]] std::uint32_t chunk_id() const noexcept { return chunk_id_; }
    [[nodiscard]] std::uint64_t bytes_downloaded() const noexcept {
        return bytes_downloaded_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t remaining() const noexcept;

    // Time of the last received byte while an attempt is running
    [[nodiscard]] bool is_stalled(std::chrono::milliseconds timeout, Clock::time_point now) const noexcept;
    [[nodiscard]] bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }

private:
    void run(std::stop_token stop);
    void post(ReportKind kind, std::uint64_t bytes, std::uint32_t attempts,
              std::error_code ec = {}, std::chrono::milliseconds delay = {});

    WorkerContext ctx_;
    std::uint32_t chunk_id_;
    ByteRange range_;
    std::uint32_t initial_attempts_;
    std::uint64_t initial_bytes_;
    RetryPolicy policy_;

    std::atomic<std::uint64_t> bytes_downloaded_{0};
    std::atomic<Clock::rep> last_activity_{0};
    std::atomic<bool> in_attempt_{false};
    std::atomic<bool> finished_{false};

    std::mutex attempt_mutex_;
    std::stop_source attempt_stop_{std::nostopstate};
    bool timed_out_{false};

    std::jthread thread_;   // Last member: joined before the rest is destroyed
};

} // namespace surge::core
