// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace surge::core {

// Parsed absolute URL. Components are owned copies of the input.
class Url {
public:
    // Fails with invalid_url on a missing scheme or host,
    // unsupported_protocol for anything other than http and https
    [[nodiscard]] static std::expected<Url, std::error_code> parse(std::string_view text) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }
    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, percent-decoded; "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

[[nodiscard]] bool is_supported_scheme(std::string_view scheme) noexcept;

} // namespace surge::core
