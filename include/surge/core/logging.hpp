// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

namespace surge::core {

using Logger = std::shared_ptr<spdlog::logger>;

// Colour stderr logger owned by the caller (not registered globally)
[[nodiscard]] Logger make_logger(std::string_view name, std::string_view level = "info");

// Logger that discards everything (tests, embedding)
[[nodiscard]] Logger make_null_logger(std::string_view name = "surge");

} // namespace surge::core
