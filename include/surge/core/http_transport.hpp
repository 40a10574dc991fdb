// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <surge/core/transport.hpp>
#include <map>
#include <string>

namespace surge::core {

// libcurl-backed Transport for http and https.
// Every call uses its own easy handle so one instance serves all workers.
class CurlTransport final : public Transport {
public:
    explicit CurlTransport(const Settings& settings);

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    [[nodiscard]] std::expected<ProbeInfo, std::error_code>
    probe(const std::string& url, std::stop_token stop) override;

    [[nodiscard]] std::error_code
    fetch(const FetchRequest& request, const ChunkConsumer& consumer, std::stop_token stop) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::string user_agent_;
    std::string proxy_;
    bool verify_ssl_;
    long max_redirects_;
    long connect_timeout_sec_;
    long stall_timeout_sec_;
    std::map<std::string, std::string> headers_;
};

// Map an HTTP status to an engine error (0 = success)
[[nodiscard]] std::error_code http_status_to_error(long status) noexcept;

} // namespace surge::core
