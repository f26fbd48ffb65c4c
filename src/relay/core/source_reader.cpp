// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/core/source_reader.hpp>
#include <relay/core/config.hpp>
#include <relay/core/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace relay::core {

std::expected<std::string, std::error_code>
DefaultSourceReader::read(const SourceRef& source, std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(IngestErrc::cancelled));
    }

    if (!source.is_remote()) {
        return read_file(source.location());
    }

    auto response = http_.get(source.location(), stop);
    if (!response) {
        return std::unexpected(response.error());
    }
    return std::move(response->body);
}

std::expected<std::string, std::error_code>
DefaultSourceReader::read_file(const std::string& path) noexcept {
    try {
        std::error_code fs_ec;
        std::filesystem::path p(path);

        if (!std::filesystem::exists(p, fs_ec)) {
            logger()->warn("Source file not found: {}", path);
            return std::unexpected(make_error_code(IngestErrc::not_found));
        }

        auto size = std::filesystem::file_size(p, fs_ec);
        if (!fs_ec && size > MAX_SOURCE_BYTES) {
            logger()->warn("Source file too large: {} ({} bytes)", path, size);
            return std::unexpected(make_error_code(IngestErrc::source_unavailable));
        }

        std::ifstream file(p, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(IngestErrc::permission_denied));
        }

        std::ostringstream content;
        content << file.rdbuf();
        if (file.bad()) {
            return std::unexpected(make_error_code(IngestErrc::source_unavailable));
        }
        return std::move(content).str();
    } catch (const std::exception& e) {
        logger()->error("Reading {} failed: {}", path, e.what());
        return std::unexpected(make_error_code(IngestErrc::source_unavailable));
    }
}

} // namespace relay::core
