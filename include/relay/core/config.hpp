// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace relay::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;                     // Abort fetch below 1 B/s for this long
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr std::size_t MAX_SOURCE_BYTES = 512 * 1024 * 1024;         // 512 MB, large XMLTV feeds included

constexpr std::chrono::seconds EPG_REFRESH_INTERVAL{60};
constexpr std::chrono::milliseconds SEARCH_DEBOUNCE{300};
constexpr std::size_t UPCOMING_PROGRAMS = 5;

constexpr std::array<std::string_view, 2> PLAYLIST_EXTENSIONS{".m3u", ".m3u8"};
constexpr std::array<std::string_view, 2> EPG_EXTENSIONS{".xml", ".xmltv"};

// Library store setting keys
constexpr std::string_view SETTING_LAST_PLAYLIST = "last_playlist";
constexpr std::string_view SETTING_LAST_PLAYLIST_IS_URL = "last_playlist_is_url";
constexpr std::string_view SETTING_LAST_EPG = "last_epg";
constexpr std::string_view SETTING_EPG_URL = "epg_url";

} // namespace relay::core
