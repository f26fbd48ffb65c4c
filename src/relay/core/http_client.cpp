// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/core/http_client.hpp>
#include <relay/core/config.hpp>
#include <relay/core/log.hpp>
#include <relay/version.hpp>
#include <curl/curl.h>

namespace relay::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct Transfer {
    std::string* body{nullptr};
    std::stop_token stop;
    bool overflow{false};
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    if (!transfer || !transfer->body) return 0;

    std::size_t total = size * nitems;
    if (transfer->body->size() + total > MAX_SOURCE_BYTES) {
        transfer->overflow = true;
        return 0;  // Makes curl fail with CURLE_WRITE_ERROR
    }
    transfer->body->append(ptr, total);
    return total;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(userdata);
    return (transfer && transfer->stop.stop_requested()) ? 1 : 0;
}

std::error_code map_curl_error(CURLcode result, const Transfer& transfer) noexcept {
    switch (result) {
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(IngestErrc::cancelled);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(IngestErrc::timeout);
        case CURLE_WRITE_ERROR:
            return transfer.overflow
                ? make_error_code(IngestErrc::source_unavailable)
                : make_error_code(IngestErrc::network_error);
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_LOGIN_DENIED:
            return make_error_code(IngestErrc::permission_denied);
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return make_error_code(IngestErrc::not_found);
        default:
            return make_error_code(IngestErrc::network_error);
    }
}

std::error_code map_http_status(long http_code) noexcept {
    if (http_code < 400) return {};
    if (http_code == 404 || http_code == 410) return make_error_code(IngestErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(IngestErrc::permission_denied);
    if (http_code >= 500) return make_error_code(IngestErrc::server_error);
    return make_error_code(IngestErrc::network_error);
}

} // namespace

//=============================================================================
// HttpClient
//=============================================================================

std::expected<HttpResponse, std::error_code>
HttpClient::get(const std::string& url, std::stop_token stop) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(IngestErrc::network_error));
    }

    HttpResponse response{};
    Transfer transfer{&response.body, stop, false};
    const std::string user_agent = "RelayIPTV/" + relay::version.to_string();

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    // Many XMLTV providers serve gzip; let curl decode whatever it supports
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        logger()->warn("GET {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result, transfer));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    char* ct = nullptr;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }

    char* effective = nullptr;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effective_url = effective;
    }

    if (auto ec = map_http_status(http_code)) {
        logger()->warn("GET {} returned HTTP {}", url, http_code);
        return std::unexpected(ec);
    }

    logger()->debug("GET {} -> {} bytes ({})", url, response.body.size(), response.content_type);
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace relay::core
