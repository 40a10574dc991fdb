// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/speed_limiter.hpp>
#include <thread>

using namespace surge::core;
using namespace std::chrono_literals;

TEST_CASE("SpeedLimiter - burst up to one second of tokens", "[speed_limiter]") {
    SpeedLimiter limiter(1000);
    auto now = SpeedLimiter::Clock::now();

    CHECK(limiter.reserve(600, now) == 0us);
    CHECK(limiter.reserve(400, now) == 0us);
    // Bucket empty: 500 bytes owe half a second
    CHECK(limiter.reserve(500, now) == 500000us);
}

TEST_CASE("SpeedLimiter - refills with time", "[speed_limiter]") {
    SpeedLimiter limiter(1000);
    auto now = SpeedLimiter::Clock::now();

    CHECK(limiter.reserve(1000, now) == 0us);
    now += 250ms;
    CHECK(limiter.reserve(250, now) == 0us);
    CHECK(limiter.reserve(100, now) == 100000us);

    // Never holds more than a second of tokens
    now += 10s;
    CHECK(limiter.reserve(1000, now) == 0us);
    CHECK(limiter.reserve(1, now) > 0us);
}

TEST_CASE("SpeedLimiter - unlimited never waits", "[speed_limiter]") {
    SpeedLimiter limiter(0);
    CHECK(limiter.unlimited());
    CHECK(limiter.reserve(1'000'000'000, SpeedLimiter::Clock::now()) == 0us);

    std::stop_source stop;
    CHECK(limiter.acquire(1'000'000'000, stop.get_token()));
}

TEST_CASE("SpeedLimiter - stop interrupts a long wait", "[speed_limiter]") {
    SpeedLimiter limiter(10);
    std::stop_source stop;

    // Owes roughly 100 seconds
    auto started = std::chrono::steady_clock::now();
    std::thread stopper([&] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });
    bool granted = limiter.acquire(1000, stop.get_token());
    stopper.join();

    CHECK_FALSE(granted);
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}
