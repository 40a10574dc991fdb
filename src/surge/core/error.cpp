// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/error.hpp>
#include <surge/disk/error.hpp>
#include <array>
#include <utility>

namespace surge::core {

namespace {

constexpr std::array<std::pair<DownloadErrc, std::string_view>, 25> ERRC_NAMES{{
    {DownloadErrc::network_error,       "network_error"},
    {DownloadErrc::timeout,             "timeout"},
    {DownloadErrc::connection_refused,  "connection_refused"},
    {DownloadErrc::connection_reset,    "connection_reset"},
    {DownloadErrc::truncated_transfer,  "truncated_transfer"},
    {DownloadErrc::dns_error,           "dns_error"},
    {DownloadErrc::ssl_error,           "ssl_error"},
    {DownloadErrc::bad_gateway,         "bad_gateway"},
    {DownloadErrc::service_unavailable, "service_unavailable"},
    {DownloadErrc::gateway_timeout,     "gateway_timeout"},
    {DownloadErrc::server_error,        "server_error"},
    {DownloadErrc::not_found,           "not_found"},
    {DownloadErrc::client_error,        "client_error"},
    {DownloadErrc::invalid_range,       "invalid_range"},
    {DownloadErrc::malformed_response,  "malformed_response"},
    {DownloadErrc::range_not_supported, "range_not_supported"},
    {DownloadErrc::too_many_redirects,  "too_many_redirects"},
    {DownloadErrc::size_mismatch,       "size_mismatch"},
    {DownloadErrc::invalid_url,         "invalid_url"},
    {DownloadErrc::unsupported_protocol, "unsupported_protocol"},
    {DownloadErrc::invalid_config,      "invalid_config"},
    {DownloadErrc::corrupt_state,       "corrupt_state"},
    {DownloadErrc::unknown_task,        "unknown_task"},
    {DownloadErrc::invalid_state,       "invalid_state"},
    {DownloadErrc::cancelled,           "cancelled"},
}};

} // namespace

ErrorClass error_class(std::error_code ec) noexcept {
    if (!ec) return ErrorClass::none;

    if (ec.category() == disk::disk_errc_category()
        || ec.category() == std::generic_category()
        || ec.category() == std::system_category()) {
        return ErrorClass::storage;
    }

    if (ec.category() != download_errc_category()) {
        return ErrorClass::transport;
    }

    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::connection_refused:
        case DownloadErrc::connection_reset:
        case DownloadErrc::truncated_transfer:
        case DownloadErrc::dns_error:
        case DownloadErrc::ssl_error:
        case DownloadErrc::bad_gateway:
        case DownloadErrc::service_unavailable:
        case DownloadErrc::gateway_timeout:
        case DownloadErrc::server_error:
            return ErrorClass::transport;
        case DownloadErrc::not_found:
        case DownloadErrc::client_error:
        case DownloadErrc::invalid_range:
        case DownloadErrc::malformed_response:
        case DownloadErrc::range_not_supported:
        case DownloadErrc::too_many_redirects:
        case DownloadErrc::size_mismatch:
            return ErrorClass::protocol;
        case DownloadErrc::invalid_url:
        case DownloadErrc::unsupported_protocol:
        case DownloadErrc::invalid_config:
            return ErrorClass::validation;
        case DownloadErrc::corrupt_state:
            return ErrorClass::state_corruption;
        case DownloadErrc::unknown_task:
        case DownloadErrc::invalid_state:
        case DownloadErrc::cancelled:
            return ErrorClass::control;
        case DownloadErrc::success:
            return ErrorClass::none;
    }
    return ErrorClass::protocol;
}

std::string_view errc_name(DownloadErrc e) noexcept {
    for (const auto& [code, name] : ERRC_NAMES) {
        if (code == e) return name;
    }
    return "success";
}

std::optional<DownloadErrc> errc_from_name(std::string_view name) noexcept {
    for (const auto& [code, n] : ERRC_NAMES) {
        if (n == name) return code;
    }
    return std::nullopt;
}

} // namespace surge::core
