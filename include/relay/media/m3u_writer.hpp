// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/model/channel.hpp>
#include <string>
#include <system_error>

namespace relay::media {

// Serializes a playlist back to extended M3U
class M3UWriter {
public:
    [[nodiscard]] static std::string write(const model::Playlist& playlist);

    // Write to a file, replacing it
    [[nodiscard]] static std::error_code save(const model::Playlist& playlist, const std::string& path) noexcept;
};

} // namespace relay::media
