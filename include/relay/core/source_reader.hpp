// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/http_client.hpp>
#include <relay/core/source.hpp>
#include <expected>
#include <stop_token>
#include <string>

namespace relay::core {

// Retrieves the raw bytes of a playlist or EPG source
class SourceReader {
public:
    virtual ~SourceReader() = default;

    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    read(const SourceRef& source, std::stop_token stop) = 0;
};

// Local files from disk, remote sources over HTTP(S)
class DefaultSourceReader final : public SourceReader {
public:
    [[nodiscard]] std::expected<std::string, std::error_code>
    read(const SourceRef& source, std::stop_token stop) override;

    [[nodiscard]] static std::expected<std::string, std::error_code>
    read_file(const std::string& path) noexcept;

private:
    HttpClient http_;
};

} // namespace relay::core
