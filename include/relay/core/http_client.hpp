// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/error.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>

namespace relay::core {

struct HttpResponse {
    std::int32_t status_code{0};
    std::string content_type;
    std::string effective_url;    // After redirects
    std::string body;
};

// Whole-document HTTP fetcher for playlists and XMLTV feeds
class HttpClient {
public:
    HttpClient() = default;
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // GET the whole body. Aborts with IngestErrc::cancelled once stop is requested.
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url, std::stop_token stop = {}) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace relay::core
