// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/http_transport.hpp>
#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <string_view>

namespace surge::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct SlistHandle {
    curl_slist* ptr = nullptr;

    SlistHandle() = default;
    ~SlistHandle() { if (ptr) curl_slist_free_all(ptr); }

    SlistHandle(const SlistHandle&) = delete;
    SlistHandle& operator=(const SlistHandle&) = delete;

    void append(const std::string& line) {
        if (auto* next = curl_slist_append(ptr, line.c_str())) {
            ptr = next;
        }
    }
};

using HeaderMap = std::map<std::string, std::string>;

// Header callback; keeps only the final response's headers across redirects
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<HeaderMap*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

// Total length from "bytes 0-0/12345"
std::optional<std::uint64_t> content_range_total(std::string_view value) noexcept {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos) return std::nullopt;
    return parse_u64(value.substr(slash + 1));
}

std::error_code curl_to_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::connection_refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ENGINE_NOTFOUND:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            return make_error_code(DownloadErrc::connection_reset);
        case CURLE_PARTIAL_FILE:
            return make_error_code(DownloadErrc::truncated_transfer);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::unsupported_protocol);
        case CURLE_URL_MALFORMAT:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_RANGE_ERROR:
            return make_error_code(DownloadErrc::range_not_supported);
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_WEIRD_SERVER_REPLY:
            return make_error_code(DownloadErrc::malformed_response);
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return make_error_code(DownloadErrc::not_found);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

// Per-transfer state shared with the libcurl callbacks
struct FetchContext {
    CURL* curl{nullptr};
    const FetchRequest* request{nullptr};
    const ChunkConsumer* consumer{nullptr};
    std::stop_token stop;
    std::error_code error;
    bool checked_status{false};
};

std::size_t fetch_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<FetchContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->stop.stop_requested()) {
        ctx->error = make_error_code(DownloadErrc::cancelled);
        return 0;
    }

    if (!ctx->checked_status) {
        ctx->checked_status = true;
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        // A full 200 body starting at byte 0 would land at the wrong offset
        if (ctx->request->offset > 0 && status == 200) {
            ctx->error = make_error_code(DownloadErrc::range_not_supported);
            return 0;
        }
    }

    try {
        ctx->error = (*ctx->consumer)(reinterpret_cast<const std::byte*>(ptr), bytes);
    } catch (const std::exception&) {
        ctx->error = make_error_code(DownloadErrc::network_error);
    }
    return ctx->error ? 0 : bytes;
}

int fetch_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<FetchContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

int probe_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

// Headers are all a probe needs; stop at the first body byte
std::size_t refuse_callback(char*, std::size_t, std::size_t, void*) {
    return 0;
}

} // namespace

std::error_code http_status_to_error(long status) noexcept {
    if (status < 400) return {};
    switch (status) {
        case 404:
        case 410: return make_error_code(DownloadErrc::not_found);
        case 408: return make_error_code(DownloadErrc::timeout);
        case 416: return make_error_code(DownloadErrc::invalid_range);
        case 429: return make_error_code(DownloadErrc::service_unavailable);
        case 502: return make_error_code(DownloadErrc::bad_gateway);
        case 503: return make_error_code(DownloadErrc::service_unavailable);
        case 504: return make_error_code(DownloadErrc::gateway_timeout);
        default:
            return make_error_code(status >= 500 ? DownloadErrc::server_error
                                                 : DownloadErrc::client_error);
    }
}

//=============================================================================
// CurlTransport
//=============================================================================

CurlTransport::CurlTransport(const Settings& settings)
    : user_agent_(settings.user_agent)
    , proxy_(settings.proxy.value_or(std::string{}))
    , verify_ssl_(settings.verify_ssl)
    , max_redirects_(static_cast<long>(settings.max_redirects))
    , connect_timeout_sec_(static_cast<long>(settings.connect_timeout.count()))
    , stall_timeout_sec_(static_cast<long>(settings.chunk_timeout.count()))
    , headers_(settings.custom_headers) {}

namespace {

void apply_common(CURL* curl, const std::string& url, const std::string& user_agent,
                  const std::string& proxy, bool verify_ssl, long max_redirects,
                  long connect_timeout, curl_slist* headers) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, max_redirects > 0 ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, max_redirects);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify_ssl ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    if (!proxy.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }
}

} // namespace

std::expected<ProbeInfo, std::error_code>
CurlTransport::probe(const std::string& url, std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(DownloadErrc::cancelled));
    }

    SlistHandle headers;
    for (const auto& [name, value] : headers_) {
        headers.append(name + ": " + value);
    }

    // HEAD first; some servers reject it, then fall back to GET Range: 0-0
    for (int pass = 0; pass < 2; ++pass) {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        const bool ranged_get = pass == 1;
        HeaderMap response_headers;
        apply_common(curl.ptr, url, user_agent_, proxy_, verify_ssl_, max_redirects_,
                     connect_timeout_sec_, headers.ptr);
        curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, connect_timeout_sec_ * 2);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response_headers);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, probe_progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);
        if (ranged_get) {
            curl_easy_setopt(curl.ptr, CURLOPT_RANGE, "0-0");
            curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, refuse_callback);
        } else {
            curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        }

        CURLcode result = curl_easy_perform(curl.ptr);

        long status = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);

        if (ranged_get && result == CURLE_WRITE_ERROR) {
            result = CURLE_OK;  // Body cut short on purpose
        }
        if (result != CURLE_OK) {
            return std::unexpected(curl_to_error(result));
        }

        if (!ranged_get && (status == 405 || status == 501)) {
            continue;
        }
        if (auto ec = http_status_to_error(status)) {
            return std::unexpected(ec);
        }

        ProbeInfo info;
        if (ranged_get && status == 206) {
            if (auto it = response_headers.find("content-range"); it != response_headers.end()) {
                info.size = content_range_total(it->second);
            }
            info.supports_range = true;
        } else {
            if (auto it = response_headers.find("content-length"); it != response_headers.end()) {
                info.size = parse_u64(it->second);
            }
            if (!info.size) {
                curl_off_t length = -1;
                if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK
                    && length >= 0) {
                    info.size = static_cast<std::uint64_t>(length);
                }
            }
            auto it = response_headers.find("accept-ranges");
            info.supports_range = it != response_headers.end()
                && it->second.find("bytes") != std::string::npos;
        }

        if (auto it = response_headers.find("etag"); it != response_headers.end()) {
            info.etag = it->second;
        }
        if (auto it = response_headers.find("last-modified"); it != response_headers.end()) {
            info.last_modified = it->second;
        }

        // Range support without a size is useless for splitting
        if (!info.size) {
            info.supports_range = false;
        }
        return info;
    }

    return std::unexpected(make_error_code(DownloadErrc::malformed_response));
}

std::error_code
CurlTransport::fetch(const FetchRequest& request, const ChunkConsumer& consumer, std::stop_token stop) {
    if (stop.stop_requested()) {
        return make_error_code(DownloadErrc::cancelled);
    }
    if (request.end && *request.end <= request.offset) {
        return {};
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(DownloadErrc::network_error);
    }

    SlistHandle headers;
    for (const auto& [name, value] : headers_) {
        headers.append(name + ": " + value);
    }
    apply_common(curl.ptr, request.url, user_agent_, proxy_, verify_ssl_, max_redirects_,
                 connect_timeout_sec_, headers.ptr);

    std::string range;
    if (request.end) {
        range = std::to_string(request.offset) + "-" + std::to_string(*request.end - 1);
    } else if (request.offset > 0) {
        range = std::to_string(request.offset) + "-";
    }
    if (!range.empty()) {
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
    }

    FetchContext ctx;
    ctx.curl = curl.ptr;
    ctx.request = &request;
    ctx.consumer = &consumer;
    ctx.stop = stop;

    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, fetch_write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, fetch_progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    // No data for chunk_timeout seconds = stalled
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, stall_timeout_sec_);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.error) {
        return ctx.error;
    }
    if (result == CURLE_ABORTED_BY_CALLBACK) {
        return make_error_code(DownloadErrc::cancelled);
    }
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);
        return http_status_to_error(status);
    }
    if (result != CURLE_OK) {
        return curl_to_error(result);
    }

    if (request.offset > 0) {
        long status = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);
        if (status == 200) {
            return make_error_code(DownloadErrc::range_not_supported);
        }
    }
    return {};
}

void CurlTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace surge::core
