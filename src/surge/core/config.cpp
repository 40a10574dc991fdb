// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/config.hpp>
#include <surge/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

namespace surge::core {

namespace {

using json = nlohmann::json;

constexpr std::array<std::string_view, 7> LOG_LEVELS{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

// Copy j[key] into out when present; wrong types throw json::type_error
template<typename T>
void read(const json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

template<typename Duration>
void read_duration(const json& j, const char* key, Duration& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = Duration{it->get<typename Duration::rep>()};
    }
}

std::error_code read_retry(const json& j, RetrySettings& retry) {
    read(j, "max_retries", retry.max_retries);
    read_duration(j, "base_delay_ms", retry.base_delay);
    read_duration(j, "max_delay_ms", retry.max_delay);
    read(j, "backoff_multiplier", retry.backoff_multiplier);
    read(j, "jitter_factor", retry.jitter_factor);

    if (auto it = j.find("retryable"); it != j.end()) {
        if (!it->is_array()) {
            return make_error_code(DownloadErrc::invalid_config);
        }
        retry.retryable.clear();
        for (const auto& name : *it) {
            auto code = errc_from_name(name.get<std::string>());
            if (!code) {
                return make_error_code(DownloadErrc::invalid_config);
            }
            retry.retryable.insert(*code);
        }
    }
    return {};
}

} // namespace

std::error_code validate(const Settings& s) noexcept {
    const auto bad = make_error_code(DownloadErrc::invalid_config);

    if (s.max_concurrent_downloads == 0) return bad;
    if (s.max_chunks_per_file == 0 || s.min_chunks_per_file == 0) return bad;
    if (s.min_chunks_per_file > s.max_chunks_per_file) return bad;
    if (s.initial_chunks_per_file < s.min_chunks_per_file
        || s.initial_chunks_per_file > s.max_chunks_per_file) return bad;
    if (s.target_chunk_count == 0) return bad;
    if (s.min_chunk_size == 0) return bad;

    if (s.connect_timeout.count() <= 0 || s.chunk_timeout.count() <= 0) return bad;
    // The first failure already charges one attempt
    if (s.retry.max_retries == 0) return bad;
    if (s.retry.base_delay.count() < 0 || s.retry.max_delay < s.retry.base_delay) return bad;
    if (s.retry.backoff_multiplier < 1.0) return bad;
    if (s.retry.jitter_factor < 0.0 || s.retry.jitter_factor > 1.0) return bad;

    if (s.output_dir.empty()) return bad;

    if (s.progress_interval.count() <= 0 || s.sample_interval.count() <= 0
        || s.persist_interval.count() <= 0 || s.adjust_cooldown.count() < 0) return bad;
    if (s.throughput_window < 2) return bad;

    bool level_ok = false;
    for (auto level : LOG_LEVELS) {
        if (level == s.log_level) level_ok = true;
    }
    if (!level_ok) return bad;

    return {};
}

std::expected<Settings, std::error_code>
apply_overrides(const Settings& base, const TaskOverrides& o) noexcept {
    Settings s = base;
    if (o.max_chunks_per_file) {
        s.max_chunks_per_file = *o.max_chunks_per_file;
        s.target_chunk_count = *o.max_chunks_per_file;
        s.initial_chunks_per_file = std::min(s.initial_chunks_per_file, *o.max_chunks_per_file);
        s.min_chunks_per_file = std::min(s.min_chunks_per_file, *o.max_chunks_per_file);
    }
    if (o.initial_chunks_per_file) s.initial_chunks_per_file = *o.initial_chunks_per_file;
    if (o.min_chunk_size) s.min_chunk_size = *o.min_chunk_size;
    if (o.max_retries) s.retry.max_retries = *o.max_retries;
    if (o.speed_limit_bps) s.speed_limit_bps = *o.speed_limit_bps;

    if (auto ec = validate(s)) {
        return std::unexpected(ec);
    }
    return s;
}

std::expected<Settings, std::error_code> parse_settings(std::string_view text) noexcept {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        Settings s;
        read(j, "max_concurrent_downloads", s.max_concurrent_downloads);
        read(j, "max_chunks_per_file", s.max_chunks_per_file);
        read(j, "min_chunks_per_file", s.min_chunks_per_file);
        read(j, "initial_chunks_per_file", s.initial_chunks_per_file);
        read(j, "target_chunk_count", s.target_chunk_count);
        read(j, "min_chunk_size", s.min_chunk_size);
        read(j, "speed_limit_bps", s.speed_limit_bps);

        read_duration(j, "connect_timeout_sec", s.connect_timeout);
        read_duration(j, "chunk_timeout_sec", s.chunk_timeout);
        read(j, "probe_retries", s.probe_retries);
        if (auto it = j.find("retry"); it != j.end()) {
            if (auto ec = read_retry(*it, s.retry)) {
                return std::unexpected(ec);
            }
        }

        read(j, "output_dir", s.output_dir);
        read(j, "overwrite_existing", s.overwrite_existing);
        read(j, "auto_rename", s.auto_rename);
        read(j, "create_directories", s.create_directories);
        read(j, "auto_resume", s.auto_resume);

        read(j, "user_agent", s.user_agent);
        if (auto it = j.find("proxy"); it != j.end() && it->is_string()) {
            s.proxy = it->get<std::string>();
        }
        read(j, "verify_ssl", s.verify_ssl);
        read(j, "max_redirects", s.max_redirects);
        read(j, "headers", s.custom_headers);

        read_duration(j, "progress_interval_ms", s.progress_interval);
        read_duration(j, "sample_interval_ms", s.sample_interval);
        read_duration(j, "persist_interval_ms", s.persist_interval);
        read_duration(j, "adjust_cooldown_ms", s.adjust_cooldown);
        read(j, "throughput_window", s.throughput_window);
        read(j, "log_level", s.log_level);

        if (auto ec = validate(s)) {
            return std::unexpected(ec);
        }
        return s;
    } catch (const json::exception&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::expected<Settings, std::error_code> load_settings(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return parse_settings(buffer.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace surge::core
