// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/commands.hpp>
#include <surge/cli/progress_log.hpp>
#include <surge/core/http_transport.hpp>
#include <surge/core/logging.hpp>
#include <surge/core/scheduler.hpp>
#include <surge/version.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

using namespace surge::core;

namespace surge::cli {

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{200};
constexpr std::chrono::seconds PAUSE_GRACE{30};
constexpr std::chrono::seconds LOG_INTERVAL{1};

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_sigint(int) {
    g_interrupted = 1;
}

bool parse_count(const char* text, std::uint32_t& out) {
    char* end = nullptr;
    const unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value == 0 || value > 1024) {
        return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto take_value = [&](int& i, const std::string& arg) -> const char* {
        if (i + 1 < argc) {
            return argv[++i];
        }
        args.error = arg + " needs a value";
        return nullptr;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--no-resume") {
            args.no_resume = true;
        } else if (arg == "-c" || arg == "--config") {
            if (auto value = take_value(i, arg)) args.config_path = value;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto value = take_value(i, arg)) args.output_dir = value;
        } else if (arg == "-n" || arg == "--chunks") {
            if (auto value = take_value(i, arg); value && !parse_count(value, args.chunks)) {
                args.error = "invalid chunk count: " + std::string(value);
            }
        } else if (arg == "-j" || arg == "--jobs") {
            if (auto value = take_value(i, arg); value && !parse_count(value, args.jobs)) {
                args.error = "invalid job count: " + std::string(value);
            }
        } else if (arg.starts_with("-")) {
            args.error = "unknown option: " + arg;
        } else {
            args.urls.push_back(arg);
        }
    }

    return args;
}

std::expected<Settings, std::error_code> build_settings(const CliArgs& args) {
    Settings settings;
    if (!args.config_path.empty()) {
        auto loaded = load_settings(args.config_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        settings = std::move(*loaded);
    }

    if (!args.output_dir.empty()) {
        settings.output_dir = args.output_dir;
    }
    if (args.jobs > 0) {
        settings.max_concurrent_downloads = args.jobs;
    }
    if (args.chunks > 0) {
        settings.max_chunks_per_file = args.chunks;
        settings.target_chunk_count = args.chunks;
        settings.min_chunks_per_file = std::min(settings.min_chunks_per_file, args.chunks);
        settings.initial_chunks_per_file = std::min(settings.initial_chunks_per_file, args.chunks);
    }
    if (args.no_resume) {
        settings.auto_resume = false;
    }
    if (args.verbose) {
        settings.log_level = "debug";
    } else if (args.quiet) {
        settings.log_level = "warn";
    }

    if (auto ec = validate(settings)) {
        return std::unexpected(ec);
    }
    return settings;
}

//=============================================================================
// Commands
//=============================================================================

CliResult run(const CliArgs& args) {
    auto settings = build_settings(args);
    if (!settings) {
        std::cerr << "Error: " << settings.error().message() << std::endl;
        return std::unexpected(settings.error());
    }

    auto logger = make_logger("surge", settings->log_level);
    CurlTransport::global_init();

    int exit_code = 0;
    {
        CurlTransport transport(*settings);
        LogProgressSink sink(logger, LOG_INTERVAL);
        Scheduler scheduler(*settings, transport, sink, logger);

        if (auto restored = scheduler.restore_persisted(); restored > 0) {
            logger->info("resuming {} unfinished download(s)", restored);
        }

        for (const auto& url : args.urls) {
            auto id = scheduler.submit(url);
            if (!id) {
                logger->error("{}: {}", url, id.error().message());
                exit_code = 1;
            }
        }

        g_interrupted = 0;
        std::signal(SIGINT, on_sigint);

        while (!scheduler.wait_idle(POLL_INTERVAL)) {
            if (g_interrupted) {
                logger->warn("interrupted, pausing all downloads");
                scheduler.pause_all();
                if (!scheduler.wait_idle(PAUSE_GRACE)) {
                    logger->error("downloads did not pause within {} s", PAUSE_GRACE.count());
                }
                exit_code = 130;
                break;
            }
        }
        std::signal(SIGINT, SIG_DFL);

        for (const auto& task : scheduler.tasks()) {
            if (task.status == TaskStatus::failed) {
                logger->error("{}: {}", task.destination_path, task.failure_reason);
                for (const auto& chunk : task.chunks) {
                    if (chunk.status != ChunkStatus::completed) {
                        logger->error("  chunk {} stopped at offset {}", chunk.id, chunk.resume_offset());
                    }
                }
                if (exit_code == 0) exit_code = 1;
            } else if (task.status == TaskStatus::paused) {
                logger->info("{}: paused at {}", task.destination_path, format_bytes(task.bytes_completed()));
            }
        }

        scheduler.shutdown();
    }

    CurlTransport::global_cleanup();
    return exit_code;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "surge " << surge::version.to_string() << " - multi-connection download engine\n\n"
              << "Usage: " << program_name << " [options] URL...\n\n"
              << "Options:\n"
              << "  -c, --config FILE      Load settings from a JSON file\n"
              << "  -d, --directory DIR    Output directory\n"
              << "  -n, --chunks N         Maximum connections per file\n"
              << "  -j, --jobs N           Maximum simultaneous downloads\n"
              << "      --no-resume        Do not resume unfinished downloads found in DIR\n"
              << "  -q, --quiet            Only log warnings and errors\n"
              << "  -V, --verbose          Debug logging\n"
              << "  -h, --help             Show this help\n"
              << "  -v, --version          Show version\n\n"
              << "Ctrl+C pauses every download; run again to resume.\n";
}

void print_version() noexcept {
    std::cout << "surge " << surge::version.to_string()
              << " (built " << surge::BUILD_DATE << " " << surge::BUILD_TIME << ")\n";
}

} // namespace surge::cli
