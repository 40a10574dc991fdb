// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace surge::core {

constexpr std::uint64_t DEFAULT_MIN_CHUNK_SIZE = 1024 * 1024;          // 1 MB
constexpr std::uint32_t DEFAULT_MAX_CHUNKS = 8;
constexpr std::uint32_t DEFAULT_MIN_CHUNKS = 1;
constexpr std::uint32_t DEFAULT_INITIAL_CHUNKS = 4;
constexpr std::uint32_t DEFAULT_MAX_CONCURRENT_DOWNLOADS = 3;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t CHUNK_TIMEOUT_SEC = 60;                       // No data for this long = timeout
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::uint32_t PROBE_RETRY_COUNT = 3;

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};
constexpr std::chrono::milliseconds SAMPLE_INTERVAL{500};
constexpr std::chrono::milliseconds PERSIST_INTERVAL{2000};
constexpr std::chrono::milliseconds ADJUST_COOLDOWN{3000};
constexpr std::uint32_t THROUGHPUT_WINDOW = 6;                          // Samples per decision

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;                   // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;

struct RetrySettings {
    std::uint32_t max_retries{RETRY_COUNT};
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60'000};
    double backoff_multiplier{2.0};
    double jitter_factor{0.1};
    std::set<DownloadErrc> retryable{
        DownloadErrc::network_error,
        DownloadErrc::timeout,
        DownloadErrc::connection_refused,
        DownloadErrc::connection_reset,
        DownloadErrc::truncated_transfer,
        DownloadErrc::dns_error,
        DownloadErrc::ssl_error,
        DownloadErrc::bad_gateway,
        DownloadErrc::service_unavailable,
        DownloadErrc::gateway_timeout,
    };
};

// Validated engine settings
struct Settings {
    // Concurrency
    std::uint32_t max_concurrent_downloads{DEFAULT_MAX_CONCURRENT_DOWNLOADS};
    std::uint32_t max_chunks_per_file{DEFAULT_MAX_CHUNKS};
    std::uint32_t min_chunks_per_file{DEFAULT_MIN_CHUNKS};
    std::uint32_t initial_chunks_per_file{DEFAULT_INITIAL_CHUNKS};
    std::uint32_t target_chunk_count{DEFAULT_MAX_CHUNKS};
    std::uint64_t min_chunk_size{DEFAULT_MIN_CHUNK_SIZE};
    std::uint64_t speed_limit_bps{0};     // 0 = unlimited, per task

    // Timeouts and retries
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds chunk_timeout{CHUNK_TIMEOUT_SEC};
    std::uint32_t probe_retries{PROBE_RETRY_COUNT};
    RetrySettings retry;

    // Files
    std::string output_dir{"./downloads"};
    bool overwrite_existing{false};
    bool auto_rename{true};
    bool create_directories{true};
    bool auto_resume{true};

    // Network
    std::string user_agent{"surge/0.1"};
    std::optional<std::string> proxy;
    bool verify_ssl{true};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    std::map<std::string, std::string> custom_headers;

    // Engine cadence
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
    std::chrono::milliseconds sample_interval{SAMPLE_INTERVAL};
    std::chrono::milliseconds persist_interval{PERSIST_INTERVAL};
    std::chrono::milliseconds adjust_cooldown{ADJUST_COOLDOWN};
    std::uint32_t throughput_window{THROUGHPUT_WINDOW};

    std::string log_level{"info"};
};

// Per-submission overrides on top of Settings
struct TaskOverrides {
    std::optional<std::uint32_t> max_chunks_per_file;
    std::optional<std::uint32_t> initial_chunks_per_file;
    std::optional<std::uint64_t> min_chunk_size;
    std::optional<std::uint32_t> max_retries;
    std::optional<std::uint64_t> speed_limit_bps;
};

// Check every value; returns invalid_config on the first bad one
[[nodiscard]] std::error_code validate(const Settings& settings) noexcept;

// Apply overrides and re-validate
[[nodiscard]] std::expected<Settings, std::error_code>
apply_overrides(const Settings& base, const TaskOverrides& overrides) noexcept;

// Parse settings from a JSON document; missing keys keep their defaults
[[nodiscard]] std::expected<Settings, std::error_code>
parse_settings(std::string_view json) noexcept;

// Load settings from a JSON file
[[nodiscard]] std::expected<Settings, std::error_code>
load_settings(std::string_view path) noexcept;

} // namespace surge::core
