// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace surge::core {

// What a HEAD-equivalent request learned about a resource
struct ProbeInfo {
    std::optional<std::uint64_t> size;   // Unknown without Content-Length
    bool supports_range{false};
    std::string etag;
    std::string last_modified;
};

struct FetchRequest {
    std::string url;
    std::uint64_t offset{0};
    std::optional<std::uint64_t> end;    // Exclusive; nullopt = to end of resource
    bool resume{false};                  // offset > 0 continues earlier progress
};

// Receives body bytes in arrival order. A non-zero return aborts the fetch
// and is handed back unchanged by Transport::fetch.
using ChunkConsumer = std::function<std::error_code(const std::byte* data, std::size_t size)>;

// Injected wire capability. Implementations must be callable from many
// threads at once and return cancelled promptly once stop is requested.
class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<ProbeInfo, std::error_code>
    probe(const std::string& url, std::stop_token stop) = 0;

    // Stream [offset, end) into the consumer. Returns success once the
    // server finished the body, even if it sent fewer bytes than asked for.
    [[nodiscard]] virtual std::error_code
    fetch(const FetchRequest& request, const ChunkConsumer& consumer, std::stop_token stop) = 0;
};

} // namespace surge::core
