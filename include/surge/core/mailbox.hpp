// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace surge::core {

// Multi-producer, single-consumer message queue
template<typename T>
class Mailbox {
public:
    void post(T message) {
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
    }

    // Wake a waiting consumer without a message
    void notify() {
        {
            std::lock_guard lock(mutex_);
            woken_ = true;
        }
        cv_.notify_one();
    }

    // Wait up to timeout for messages, then take everything queued
    [[nodiscard]] std::vector<T> wait_drain(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || woken_; });
        woken_ = false;

        std::vector<T> out;
        out.reserve(queue_.size());
        while (!queue_.empty()) {
            out.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        return out;
    }

    [[nodiscard]] std::vector<T> drain() {
        return wait_drain(std::chrono::milliseconds{0});
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool woken_{false};
};

} // namespace surge::core
