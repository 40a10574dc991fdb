// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/resume_store.hpp>
#include <surge/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace surge::core::resume_store {

namespace {

using json = nlohmann::json;
namespace fs = std::filesystem;

constexpr std::string_view FORMAT_NAME = "surge-resume";

std::int64_t to_unix_ms(TaskState::Clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TaskState::Clock::time_point from_unix_ms(std::int64_t ms) noexcept {
    return TaskState::Clock::time_point{std::chrono::milliseconds{ms}};
}

json chunk_to_json(const ChunkState& chunk) {
    json j;
    j["id"] = chunk.id;
    j["start"] = chunk.range.start;
    if (chunk.range.open_ended()) {
        j["end"] = nullptr;
    } else {
        j["end"] = chunk.range.end;
    }
    j["bytes_downloaded"] = chunk.bytes_downloaded;
    j["status"] = std::string(to_string(chunk.status));
    j["attempt_count"] = chunk.attempt_count;
    j["last_error"] = chunk.last_error;
    return j;
}

std::expected<ChunkState, std::error_code> chunk_from_json(const json& j) {
    const auto corrupt = std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    if (!j.is_object()) return corrupt;

    ChunkState chunk;
    chunk.id = j.at("id").get<std::uint32_t>();
    chunk.range.start = j.at("start").get<std::uint64_t>();
    const auto& end = j.at("end");
    chunk.range.end = end.is_null() ? OPEN_END : end.get<std::uint64_t>();
    chunk.bytes_downloaded = j.at("bytes_downloaded").get<std::uint64_t>();
    chunk.attempt_count = j.value("attempt_count", 0u);
    chunk.last_error = j.value("last_error", std::string{});

    auto status = parse_chunk_status(j.at("status").get<std::string>());
    if (!status) return corrupt;
    // A chunk that was mid-flight when the process died is simply incomplete
    chunk.status = *status == ChunkStatus::active ? ChunkStatus::pending : *status;
    return chunk;
}

} // namespace

std::string meta_path(std::string_view destination_path) {
    std::string path(destination_path);
    path += META_SUFFIX;
    return path;
}

std::string to_json(const TaskState& state) {
    json j;
    j["format"] = FORMAT_NAME;
    j["version"] = META_FORMAT_VERSION;
    j["id"] = state.id;
    j["source"] = state.source;
    j["destination"] = state.destination_path;
    if (state.total_size) {
        j["total_size"] = *state.total_size;
    } else {
        j["total_size"] = nullptr;
    }
    j["supports_range"] = state.supports_range;
    j["etag"] = state.etag;
    j["last_modified"] = state.last_modified;
    j["status"] = std::string(to_string(state.status));
    j["failure_reason"] = state.failure_reason;
    j["created_at"] = to_unix_ms(state.created_at);
    j["updated_at"] = to_unix_ms(state.updated_at);

    auto chunks = json::array();
    for (const auto& chunk : state.chunks) {
        chunks.push_back(chunk_to_json(chunk));
    }
    j["chunks"] = std::move(chunks);
    return j.dump(2);
}

std::expected<TaskState, std::error_code> from_json(std::string_view text) noexcept {
    const auto corrupt = std::unexpected(make_error_code(DownloadErrc::corrupt_state));
    try {
        auto j = json::parse(text);
        if (!j.is_object()) return corrupt;
        if (j.value("format", std::string{}) != FORMAT_NAME) return corrupt;
        if (j.value("version", 0) != META_FORMAT_VERSION) return corrupt;

        TaskState state;
        state.id = j.at("id").get<std::string>();
        state.source = j.at("source").get<std::string>();
        state.destination_path = j.at("destination").get<std::string>();
        if (const auto& size = j.at("total_size"); !size.is_null()) {
            state.total_size = size.get<std::uint64_t>();
        }
        state.supports_range = j.at("supports_range").get<bool>();
        state.etag = j.value("etag", std::string{});
        state.last_modified = j.value("last_modified", std::string{});
        state.failure_reason = j.value("failure_reason", std::string{});
        state.created_at = from_unix_ms(j.at("created_at").get<std::int64_t>());
        state.updated_at = from_unix_ms(j.at("updated_at").get<std::int64_t>());

        auto status = parse_task_status(j.at("status").get<std::string>());
        if (!status) return corrupt;
        state.status = *status;

        const auto& chunks = j.at("chunks");
        if (!chunks.is_array()) return corrupt;
        for (const auto& item : chunks) {
            auto chunk = chunk_from_json(item);
            if (!chunk) return std::unexpected(chunk.error());
            state.chunks.push_back(std::move(*chunk));
        }

        if (auto ec = state.validate()) {
            return std::unexpected(ec);
        }
        return state;
    } catch (const json::exception&) {
        return corrupt;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::error_code save(const TaskState& state) noexcept {
    try {
        const std::string target = meta_path(state.destination_path);
        const std::string temp = target + ".tmp";

        fs::path parent = fs::path(target).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) return make_error_code(disk::DiskErrc::invalid_path);
        }

        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::access_denied);
            }
            file << to_json(state);
            file.flush();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::error_code ec;
        fs::rename(temp, target, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<TaskState, std::error_code> load(std::string_view destination_path) noexcept {
    try {
        std::ifstream file(meta_path(destination_path), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return from_json(buffer.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

bool exists(std::string_view destination_path) noexcept {
    try {
        std::error_code ec;
        return fs::exists(meta_path(destination_path), ec);
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::error_code remove(std::string_view destination_path) noexcept {
    try {
        std::error_code ec;
        fs::remove(meta_path(destination_path), ec);
        if (ec) {
            return make_error_code(disk::DiskErrc::access_denied);
        }
        return {};
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

std::vector<std::string> scan(std::string_view directory) noexcept {
    std::vector<std::string> found;
    try {
        std::error_code ec;
        for (fs::directory_iterator it(fs::path(directory), ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            auto name = it->path().string();
            if (name.size() > META_SUFFIX.size() && name.ends_with(META_SUFFIX)) {
                found.push_back(name.substr(0, name.size() - META_SUFFIX.size()));
            }
        }
        std::sort(found.begin(), found.end());
    } catch (const std::exception&) {
        found.clear();
    }
    return found;
}

} // namespace surge::core::resume_store
