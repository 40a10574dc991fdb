// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/resume_store.hpp>
#include <surge/disk/error.hpp>
#include "test_support.hpp"

using namespace surge::core;
using surge::test::TempDir;

namespace {

TaskState sample_task(const std::string& destination) {
    TaskState state;
    state.id = "feedfacefeedfacefeedfacefeedface";
    state.source = "https://example.com/data.bin";
    state.destination_path = destination;
    state.total_size = 4000;
    state.supports_range = true;
    state.etag = "\"abc\"";
    state.last_modified = "Tue, 01 Sep 2026 10:00:00 GMT";
    state.status = TaskStatus::paused;
    state.created_at = TaskState::Clock::time_point{std::chrono::milliseconds{1'790'000'000'000}};
    state.updated_at = TaskState::Clock::time_point{std::chrono::milliseconds{1'790'000'500'000}};
    state.chunks = make_chunks({{0, 1000}, {1000, 2000}, {2000, 3000}, {3000, 4000}});
    state.chunks[0].bytes_downloaded = 1000;
    state.chunks[0].status = ChunkStatus::completed;
    state.chunks[1].bytes_downloaded = 400;
    state.chunks[1].status = ChunkStatus::paused;
    state.chunks[1].attempt_count = 2;
    state.chunks[1].last_error = "Operation timed out";
    state.chunks[2].status = ChunkStatus::paused;
    state.chunks[3].status = ChunkStatus::paused;
    return state;
}

} // namespace

TEST_CASE("resume_store - sidecar path", "[resume_store]") {
    CHECK(resume_store::meta_path("/data/file.iso") == "/data/file.iso.surgemeta");
}

TEST_CASE("resume_store - save and load reconstruct the task", "[resume_store]") {
    TempDir dir;
    auto original = sample_task(dir.file("data.bin"));

    REQUIRE_FALSE(resume_store::save(original));
    REQUIRE(resume_store::exists(original.destination_path));

    auto loaded = resume_store::load(original.destination_path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->id == original.id);
    CHECK(loaded->source == original.source);
    CHECK(loaded->destination_path == original.destination_path);
    CHECK(loaded->total_size == original.total_size);
    CHECK(loaded->supports_range);
    CHECK(loaded->etag == original.etag);
    CHECK(loaded->last_modified == original.last_modified);
    CHECK(loaded->status == TaskStatus::paused);
    CHECK(loaded->created_at == original.created_at);
    CHECK(loaded->updated_at == original.updated_at);
    REQUIRE(loaded->chunks.size() == 4);
    for (std::size_t i = 0; i < 4; ++i) {
        CHECK(loaded->chunks[i].range == original.chunks[i].range);
        CHECK(loaded->chunks[i].bytes_downloaded == original.chunks[i].bytes_downloaded);
        CHECK(loaded->chunks[i].status == original.chunks[i].status);
        CHECK(loaded->chunks[i].attempt_count == original.chunks[i].attempt_count);
        CHECK(loaded->chunks[i].last_error == original.chunks[i].last_error);
    }
    CHECK(loaded->bytes_completed() == 1400);

    // No temp file left behind
    CHECK_FALSE(std::filesystem::exists(resume_store::meta_path(original.destination_path) + ".tmp"));
}

TEST_CASE("resume_store - chunks saved as active reload as pending", "[resume_store]") {
    auto state = sample_task("/tmp/x.bin");
    state.status = TaskStatus::downloading;
    state.chunks[2].status = ChunkStatus::active;
    state.chunks[2].bytes_downloaded = 10;

    auto loaded = resume_store::from_json(resume_store::to_json(state));
    REQUIRE(loaded.has_value());
    CHECK(loaded->chunks[2].status == ChunkStatus::pending);
    CHECK(loaded->chunks[2].bytes_downloaded == 10);
}

TEST_CASE("resume_store - unknown size keeps an open end", "[resume_store]") {
    auto state = sample_task("/tmp/stream.bin");
    state.total_size.reset();
    state.supports_range = false;
    state.chunks = make_chunks({{0, OPEN_END}});
    state.chunks[0].bytes_downloaded = 777;

    auto text = resume_store::to_json(state);
    CHECK(text.find("\"end\": null") != std::string::npos);

    auto loaded = resume_store::from_json(text);
    REQUIRE(loaded.has_value());
    CHECK_FALSE(loaded->total_size.has_value());
    CHECK(loaded->chunks[0].range.open_ended());
    CHECK(loaded->chunks[0].bytes_downloaded == 777);
}

TEST_CASE("resume_store - corrupt documents are rejected", "[resume_store]") {
    auto good = resume_store::to_json(sample_task("/tmp/y.bin"));

    SECTION("Not JSON") {
        CHECK(resume_store::from_json("{ not json").error() == DownloadErrc::corrupt_state);
    }

    SECTION("Wrong version") {
        auto text = good;
        text.replace(text.find("\"version\": 1"), 12, "\"version\": 9");
        CHECK(resume_store::from_json(text).error() == DownloadErrc::corrupt_state);
    }

    SECTION("Wrong format tag") {
        auto text = good;
        text.replace(text.find("surge-resume"), 12, "other-format");
        CHECK(resume_store::from_json(text).error() == DownloadErrc::corrupt_state);
    }

    SECTION("Inconsistent chunk table") {
        auto state = sample_task("/tmp/y.bin");
        state.chunks[1].bytes_downloaded = 5000;
        CHECK(resume_store::from_json(resume_store::to_json(state)).error() == DownloadErrc::corrupt_state);
    }

    SECTION("Missing field") {
        CHECK(resume_store::from_json(R"({"format":"surge-resume","version":1})").error()
              == DownloadErrc::corrupt_state);
    }
}

TEST_CASE("resume_store - load of a missing sidecar", "[resume_store]") {
    TempDir dir;
    auto loaded = resume_store::load(dir.file("absent.bin"));
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error() == surge::disk::DiskErrc::file_not_found);
    CHECK_FALSE(resume_store::exists(dir.file("absent.bin")));
}

TEST_CASE("resume_store - remove and scan", "[resume_store]") {
    TempDir dir;
    REQUIRE_FALSE(resume_store::save(sample_task(dir.file("b.bin"))));
    auto other = sample_task(dir.file("a.bin"));
    other.id = "00000000000000000000000000000001";
    REQUIRE_FALSE(resume_store::save(other));
    surge::test::write_file(dir.file("unrelated.txt"), "x");

    auto found = resume_store::scan(dir.path().string());
    REQUIRE(found.size() == 2);
    CHECK(found[0] == dir.file("a.bin"));
    CHECK(found[1] == dir.file("b.bin"));

    CHECK_FALSE(resume_store::remove(dir.file("a.bin")));
    CHECK_FALSE(resume_store::exists(dir.file("a.bin")));
    // Removing twice is fine
    CHECK_FALSE(resume_store::remove(dir.file("a.bin")));
    CHECK(resume_store::scan(dir.path().string()).size() == 1);
}
