// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace surge::cli {

// CLI result: process exit code, or the error that stopped the run
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string config_path;
    std::string output_dir;
    std::uint32_t chunks{0};      // 0 = from settings
    std::uint32_t jobs{0};        // 0 = from settings
    bool no_resume{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;            // Set when an option is malformed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Settings from the config file (or defaults) with command line options applied
[[nodiscard]] std::expected<core::Settings, std::error_code> build_settings(const CliArgs& args);

// Download every URL through one scheduler; waits until the queue drains
// or SIGINT pauses everything
[[nodiscard]] CliResult run(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace surge::cli
