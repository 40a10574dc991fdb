// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/transport.hpp>
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace surge::test {

// Content served for every URL: byte i of the resource
inline std::byte content_byte(std::uint64_t i) noexcept {
    return static_cast<std::byte>((i * 131 + (i >> 9) * 7 + 17) & 0xFF);
}

inline std::vector<std::byte> expected_content(std::uint64_t size) {
    std::vector<std::byte> out(size);
    for (std::uint64_t i = 0; i < size; ++i) {
        out[i] = content_byte(i);
    }
    return out;
}

// Deterministic in-memory Transport.
//
// Every URL serves the same `size` bytes. Failures are scripted per call
// (first N fetches fail, first N fetches are cut short), and a gate can
// hold every fetch once a byte budget has been served so tests can
// interrupt a download at a known point.
class MockTransport final : public core::Transport {
public:
    explicit MockTransport(std::uint64_t size) : size_(size) {}

    // Static behaviour, set before use
    bool supports_range{true};
    bool report_size{true};
    std::string etag{"\"v1\""};
    std::string last_modified{"Tue, 01 Sep 2026 10:00:00 GMT"};
    std::size_t block_size{8 * 1024};

    void fail_fetches(std::uint32_t count, core::DownloadErrc errc) {
        std::lock_guard lock(mutex_);
        fetch_failures_ = count;
        fetch_error_ = errc;
    }

    void fail_probes(std::uint32_t count, core::DownloadErrc errc) {
        std::lock_guard lock(mutex_);
        probe_failures_ = count;
        probe_error_ = errc;
    }

    // The next `count` fetches end cleanly after `after_bytes` body bytes
    void truncate_fetches(std::uint32_t count, std::uint64_t after_bytes) {
        std::lock_guard lock(mutex_);
        truncations_ = count;
        truncate_after_ = after_bytes;
    }

    // Hold every fetch once `bytes` bytes have been served in total
    void close_gate_at(std::uint64_t bytes) {
        std::lock_guard lock(mutex_);
        gate_at_ = bytes;
    }

    void open_gate() {
        {
            std::lock_guard lock(mutex_);
            gate_at_.reset();
        }
        gate_cv_.notify_all();
    }

    // Sleep between blocks, for controllable throughput
    void set_block_delay(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        block_delay_ = delay;
    }

    // The next fetch to reach `bytes` bytes of its own body stops sending
    // and waits until it is stopped
    void stall_once_at(std::uint64_t bytes) {
        std::lock_guard lock(mutex_);
        stall_at_ = bytes;
    }

    [[nodiscard]] std::expected<core::ProbeInfo, std::error_code>
    probe(const std::string&, std::stop_token stop) override {
        std::lock_guard lock(mutex_);
        ++probe_calls_;
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
        }
        if (probe_failures_ > 0) {
            --probe_failures_;
            return std::unexpected(make_error_code(probe_error_));
        }

        core::ProbeInfo info;
        if (report_size) {
            info.size = size_;
        }
        info.supports_range = supports_range && report_size;
        info.etag = etag;
        info.last_modified = last_modified;
        return info;
    }

    [[nodiscard]] std::error_code
    fetch(const core::FetchRequest& request, const core::ChunkConsumer& consumer, std::stop_token stop) override {
        std::optional<std::uint64_t> cut;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard lock(mutex_);
            ++fetch_calls_;
            requests_.push_back(request);
            if (fetch_failures_ > 0) {
                --fetch_failures_;
                return make_error_code(fetch_error_);
            }
            if (truncations_ > 0) {
                --truncations_;
                cut = truncate_after_;
            }
        }

        ActiveFetch active(*this);

        // A server without range support answers 200 from byte 0
        if (!supports_range && request.offset > 0) {
            return make_error_code(core::DownloadErrc::range_not_supported);
        }

        const std::uint64_t end = std::min(request.end.value_or(size_), size_);
        std::uint64_t sent = 0;
        std::vector<std::byte> block(block_size);

        for (std::uint64_t pos = request.offset; pos < end;) {
            {
                std::unique_lock lock(mutex_);
                if (stall_at_ && sent >= *stall_at_) {
                    stall_at_.reset();
                    gate_cv_.wait(lock, stop, [] { return false; });
                    return make_error_code(core::DownloadErrc::cancelled);
                }
                const bool open = gate_cv_.wait(lock, stop, [this] {
                    return !gate_at_ || served_ < *gate_at_;
                });
                if (!open) {
                    return make_error_code(core::DownloadErrc::cancelled);
                }
                delay = block_delay_;
            }
            if (stop.stop_requested()) {
                return make_error_code(core::DownloadErrc::cancelled);
            }
            if (cut && sent >= *cut) {
                return {};
            }

            std::uint64_t n = std::min<std::uint64_t>(block_size, end - pos);
            if (cut) {
                n = std::min(n, *cut - sent);
            }
            for (std::uint64_t i = 0; i < n; ++i) {
                block[i] = content_byte(pos + i);
            }
            if (auto ec = consumer(block.data(), static_cast<std::size_t>(n))) {
                return ec;
            }
            pos += n;
            sent += n;
            {
                std::lock_guard lock(mutex_);
                served_ += n;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
        }
        return {};
    }

    [[nodiscard]] std::uint32_t fetch_calls() const {
        std::lock_guard lock(mutex_);
        return fetch_calls_;
    }

    [[nodiscard]] std::uint32_t probe_calls() const {
        std::lock_guard lock(mutex_);
        return probe_calls_;
    }

    // Most fetches that were sending at the same time
    [[nodiscard]] std::uint32_t max_active_fetches() const {
        std::lock_guard lock(mutex_);
        return max_active_;
    }

    [[nodiscard]] std::uint64_t served() const {
        std::lock_guard lock(mutex_);
        return served_;
    }

    [[nodiscard]] std::vector<core::FetchRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    void clear_requests() {
        std::lock_guard lock(mutex_);
        requests_.clear();
    }

private:
    class ActiveFetch {
    public:
        explicit ActiveFetch(MockTransport& owner) : owner_(owner) {
            std::lock_guard lock(owner_.mutex_);
            owner_.max_active_ = std::max(owner_.max_active_, ++owner_.active_);
        }
        ~ActiveFetch() {
            std::lock_guard lock(owner_.mutex_);
            --owner_.active_;
        }
        ActiveFetch(const ActiveFetch&) = delete;
        ActiveFetch& operator=(const ActiveFetch&) = delete;

    private:
        MockTransport& owner_;
    };

    const std::uint64_t size_;

    mutable std::mutex mutex_;
    std::condition_variable_any gate_cv_;
    std::optional<std::uint64_t> gate_at_;
    std::uint64_t served_{0};

    std::uint32_t fetch_failures_{0};
    core::DownloadErrc fetch_error_{core::DownloadErrc::network_error};
    std::uint32_t probe_failures_{0};
    core::DownloadErrc probe_error_{core::DownloadErrc::network_error};
    std::uint32_t truncations_{0};
    std::uint64_t truncate_after_{0};
    std::chrono::milliseconds block_delay_{0};
    std::optional<std::uint64_t> stall_at_;
    std::uint32_t active_{0};
    std::uint32_t max_active_{0};

    std::uint32_t fetch_calls_{0};
    std::uint32_t probe_calls_{0};
    std::vector<core::FetchRequest> requests_;
};

} // namespace surge::test
