// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/media/m3u_parser.hpp>
#include <relay/media/m3u_attributes.hpp>
#include <relay/core/config.hpp>
#include <relay/core/log.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace relay::media {

namespace {

constexpr std::string_view TAG_HEADER = "#EXTM3U";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_EXTGRP = "#EXTGRP:";
constexpr std::string_view TAG_VLCOPT = "#EXTVLCOPT:";
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

constexpr std::string_view ATTR_TVG_ID = "tvg-id";
constexpr std::string_view ATTR_TVG_NAME = "tvg-name";
constexpr std::string_view ATTR_TVG_LOGO = "tvg-logo";
constexpr std::string_view ATTR_GROUP = "group-title";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool starts_with_tag(std::string_view line, std::string_view tag) noexcept {
    if (line.size() < tag.size()) return false;
    for (std::size_t i = 0; i < tag.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(line[i])) != static_cast<unsigned char>(tag[i])) {
            return false;
        }
    }
    return true;
}

// Entry between its #EXTINF line and its URL line
struct PendingEntry {
    model::Channel channel;
    std::size_t line_number{0};
};

// "#EXTINF:<duration> <attributes>,<name>"
PendingEntry parse_extinf(std::string_view line, std::size_t line_number, std::size_t& degraded) {
    PendingEntry entry;
    entry.line_number = line_number;
    auto& channel = entry.channel;

    auto body = line.substr(TAG_EXTINF.size());
    auto token_end = std::min(body.find_first_of(" \t,"), body.size());
    auto duration = trim(body.substr(0, token_end));
    auto rest = body.substr(token_end);

    std::int32_t value = -1;
    const auto* end = duration.data() + duration.size();
    auto [ptr, ec] = std::from_chars(duration.data(), end, value);
    if (ec == std::errc{} && ptr == end) {
        channel.duration = value;
    } else if (!duration.empty()) {
        // Not a whole number; the writer emits the token unchanged
        channel.duration_token = std::string(duration);
        if (ec == std::errc{} && *ptr == '.') {
            channel.duration = value;
        }
    }

    auto scan = is_valid_utf8(rest) ? scan_attributes(rest) : std::nullopt;
    if (!scan) {
        // Unreadable attribute list: everything after the duration is the name
        ++degraded;
        auto name = trim(rest);
        if (!name.empty() && name.front() == ',') {
            name = trim(name.substr(1));
        }
        channel.name = std::string(name);
        core::logger()->debug("Line {}: unreadable #EXTINF attributes, using '{}' as name", line_number, channel.name);
        return entry;
    }

    for (auto& [key, val] : scan->attributes) {
        std::string lower_key = key;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower_key == ATTR_TVG_ID) {
            channel.tvg_id = std::move(val);
        } else if (lower_key == ATTR_TVG_NAME) {
            channel.tvg_name = std::move(val);
        } else if (lower_key == ATTR_TVG_LOGO) {
            channel.logo = std::move(val);
        } else if (lower_key == ATTR_GROUP) {
            channel.group = std::move(val);
        } else {
            channel.attributes.insert_or_assign(std::move(key), std::move(val));
        }
    }

    if (scan->name_pos != std::string_view::npos) {
        channel.name = std::string(trim(rest.substr(scan->name_pos)));
    }
    return entry;
}

} // namespace

std::expected<PlaylistParseResult, core::IngestFailure>
M3UParser::parse(std::string_view content) {
    PlaylistParseResult result;

    if (content.starts_with(UTF8_BOM)) {
        content.remove_prefix(UTF8_BOM.size());
    }

    std::optional<PendingEntry> pending;
    bool header_seen = false;
    bool any_content = false;
    std::size_t extinf_count = 0;
    std::size_t line_number = 0;

    auto flush_malformed = [&]() {
        if (pending) {
            ++result.malformed_entries;
            core::logger()->debug("Line {}: #EXTINF without stream URL skipped", pending->line_number);
            pending.reset();
        }
    };

    std::size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        auto line = trim(content.substr(pos, end - pos));
        pos = end + 1;
        ++line_number;

        if (line.empty()) continue;
        any_content = true;

        if (starts_with_tag(line, TAG_HEADER)) {
            header_seen = true;
            if (auto scan = scan_attributes(line.substr(TAG_HEADER.size()))) {
                for (auto& [key, value] : scan->attributes) {
                    result.playlist.header_attribute(std::move(key), std::move(value));
                }
            }
            continue;
        }

        if (starts_with_tag(line, TAG_EXTINF)) {
            flush_malformed();
            ++extinf_count;
            pending = parse_extinf(line, line_number, result.degraded_lines);
            continue;
        }

        if (starts_with_tag(line, TAG_EXTGRP)) {
            if (pending && pending->channel.group.empty()) {
                pending->channel.group = std::string(trim(line.substr(TAG_EXTGRP.size())));
            }
            continue;
        }

        if (starts_with_tag(line, TAG_VLCOPT)) {
            if (pending) {
                pending->channel.options.emplace_back(trim(line.substr(TAG_VLCOPT.size())));
            }
            continue;
        }

        if (line.front() == '#') {
            continue;  // Other directives and comments
        }

        // Stream URL line
        if (!pending) {
            ++result.orphan_urls;
            continue;
        }

        auto& channel = pending->channel;
        channel.url = std::string(line);
        if (channel.name.empty()) {
            channel.name = !channel.tvg_name.empty() ? channel.tvg_name : channel.url;
        }
        result.playlist.add(std::move(channel));
        pending.reset();
    }
    flush_malformed();

    if (any_content && !header_seen && extinf_count == 0) {
        return std::unexpected(core::make_failure(core::IngestErrc::format_unrecognized,
            "Not an M3U playlist: no #EXTM3U header and no #EXTINF entries"));
    }
    if (!header_seen && extinf_count > 0) {
        core::logger()->warn("Playlist has no #EXTM3U header; parsing entries anyway");
    }

    core::logger()->info("Playlist parsed: {} channels, {} malformed, {} degraded, {} orphan URLs",
                         result.playlist.size(), result.malformed_entries,
                         result.degraded_lines, result.orphan_urls);
    return result;
}

bool M3UParser::is_playlist_path(std::string_view path) noexcept {
    auto cut = std::min(path.find('?'), path.find('#'));
    if (cut != std::string_view::npos) {
        path = path.substr(0, cut);
    }

    std::string lower;
    lower.reserve(path.size());
    for (char c : path) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return std::any_of(core::PLAYLIST_EXTENSIONS.begin(), core::PLAYLIST_EXTENSIONS.end(),
        [&](std::string_view ext) { return lower.ends_with(ext); });
}

} // namespace relay::media
