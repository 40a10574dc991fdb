// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace surge::core {

enum class DownloadErrc {
    success = 0,
    // Transport (retryable by default unless noted)
    network_error,
    timeout,
    connection_refused,
    connection_reset,
    truncated_transfer,
    dns_error,
    ssl_error,
    bad_gateway,           // 502
    service_unavailable,   // 503
    gateway_timeout,       // 504
    server_error,          // other 5xx, not retried by default
    // Protocol
    not_found,
    client_error,
    invalid_range,
    malformed_response,
    range_not_supported,
    too_many_redirects,
    size_mismatch,
    // Validation
    invalid_url,
    unsupported_protocol,
    invalid_config,
    // State
    corrupt_state,
    unknown_task,
    invalid_state,
    // Control
    cancelled,
};

// Taxonomy used by retry and propagation decisions
enum class ErrorClass : std::uint8_t {
    none,
    transport,
    protocol,
    storage,
    validation,
    state_corruption,
    control,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "surge::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:             return "Success";
            case DownloadErrc::network_error:       return "Network error";
            case DownloadErrc::timeout:             return "Operation timed out";
            case DownloadErrc::connection_refused:  return "Connection refused";
            case DownloadErrc::connection_reset:    return "Connection reset";
            case DownloadErrc::truncated_transfer:  return "Transfer ended before range end";
            case DownloadErrc::dns_error:           return "DNS resolution failed";
            case DownloadErrc::ssl_error:           return "SSL/TLS error";
            case DownloadErrc::bad_gateway:         return "Bad gateway (502)";
            case DownloadErrc::service_unavailable: return "Service unavailable (503)";
            case DownloadErrc::gateway_timeout:     return "Gateway timeout (504)";
            case DownloadErrc::server_error:        return "Server error (5xx)";
            case DownloadErrc::not_found:           return "Resource not found (404)";
            case DownloadErrc::client_error:        return "Client error (4xx)";
            case DownloadErrc::invalid_range:       return "Invalid byte range (416)";
            case DownloadErrc::malformed_response:  return "Malformed response";
            case DownloadErrc::range_not_supported: return "Server ignored range request";
            case DownloadErrc::too_many_redirects:  return "Too many redirects";
            case DownloadErrc::size_mismatch:       return "File size mismatch";
            case DownloadErrc::invalid_url:         return "Invalid URL";
            case DownloadErrc::unsupported_protocol: return "Unsupported protocol";
            case DownloadErrc::invalid_config:      return "Invalid configuration value";
            case DownloadErrc::corrupt_state:       return "Resume state unreadable or inconsistent";
            case DownloadErrc::unknown_task:        return "Unknown task id";
            case DownloadErrc::invalid_state:       return "Operation not valid in current task state";
            case DownloadErrc::cancelled:           return "Download cancelled";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Classify any error produced by the engine or its collaborators
[[nodiscard]] ErrorClass error_class(std::error_code ec) noexcept;

// Stable names used in configuration files ("timeout", "bad_gateway", ...)
[[nodiscard]] std::string_view errc_name(DownloadErrc e) noexcept;
[[nodiscard]] std::optional<DownloadErrc> errc_from_name(std::string_view name) noexcept;

} // namespace surge::core

namespace std {

template<>
struct is_error_code_enum<surge::core::DownloadErrc> : true_type {};

} // namespace std
