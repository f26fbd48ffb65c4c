// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/media/m3u_writer.hpp>
#include <relay/core/error.hpp>
#include <relay/core/log.hpp>
#include <filesystem>
#include <fstream>

namespace relay::media {

namespace {

void append_attribute(std::string& out, std::string_view key, std::string_view value) {
    // Values holding a double quote fall back to single quotes
    char quote = value.find('"') == std::string_view::npos ? '"' : '\'';
    out += ' ';
    out += key;
    out += '=';
    out += quote;
    out += value;
    out += quote;
}

} // namespace

std::string M3UWriter::write(const model::Playlist& playlist) {
    std::string out = "#EXTM3U";
    for (const auto& [key, value] : playlist.header_attributes()) {
        append_attribute(out, key, value);
    }
    out += '\n';

    for (const auto& channel : playlist.channels()) {
        out += "#EXTINF:";
        out += channel.duration_token.empty() ? std::to_string(channel.duration) : channel.duration_token;

        if (!channel.tvg_id.empty()) append_attribute(out, "tvg-id", channel.tvg_id);
        if (!channel.tvg_name.empty()) append_attribute(out, "tvg-name", channel.tvg_name);
        if (!channel.logo.empty()) append_attribute(out, "tvg-logo", channel.logo);
        if (!channel.group.empty()) append_attribute(out, "group-title", channel.group);
        for (const auto& [key, value] : channel.attributes) {
            append_attribute(out, key, value);
        }

        out += ',';
        out += channel.name;
        out += '\n';

        for (const auto& option : channel.options) {
            out += "#EXTVLCOPT:";
            out += option;
            out += '\n';
        }

        out += channel.url;
        out += '\n';
    }
    return out;
}

std::error_code M3UWriter::save(const model::Playlist& playlist, const std::string& path) noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        std::ofstream file(p, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(core::IngestErrc::permission_denied);
        }
        file << write(playlist);
        if (!file) {
            return make_error_code(core::IngestErrc::source_unavailable);
        }
        core::logger()->info("Exported {} channels to {}", playlist.size(), path);
        return {};
    } catch (const std::exception& e) {
        core::logger()->error("Exporting playlist to {} failed: {}", path, e.what());
        return make_error_code(core::IngestErrc::source_unavailable);
    }
}

} // namespace relay::media
