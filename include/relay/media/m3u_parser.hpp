// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/error.hpp>
#include <relay/model/channel.hpp>
#include <cstddef>
#include <expected>
#include <string_view>

namespace relay::media {

struct PlaylistParseResult {
    model::Playlist playlist;
    std::size_t malformed_entries{0};   // #EXTINF lines that never got a URL
    std::size_t degraded_lines{0};      // #EXTINF lines whose attributes could not be read
    std::size_t orphan_urls{0};         // URL lines without a preceding #EXTINF
};

// Extended M3U / M3U8 channel playlist parser
class M3UParser {
public:
    // Parse playlist text. Empty input yields an empty playlist.
    // Fails only with IngestErrc::format_unrecognized.
    [[nodiscard]] static std::expected<PlaylistParseResult, core::IngestFailure>
    parse(std::string_view content);

    // Check if a path or URL names an M3U playlist
    [[nodiscard]] static bool is_playlist_path(std::string_view path) noexcept;
};

} // namespace relay::media
