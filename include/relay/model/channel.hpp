// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace relay::model {

// One playable entry of an M3U playlist
struct Channel {
    std::string identifier;        // Unique within its playlist, never empty
    std::string name;              // Display name, never empty
    std::string tvg_id;            // Declared EPG channel id (may be empty)
    std::string tvg_name;
    std::string logo;
    std::string group;
    std::string url;               // Stream URL, never empty
    std::int32_t duration{-1};
    std::string duration_token;    // #EXTINF duration as written when not a whole number, e.g. "10.5"

    // Attributes without a promoted field above, kept verbatim
    std::map<std::string, std::string> attributes;

    // #EXTVLCOPT lines that belonged to this entry, without the tag
    std::vector<std::string> options;

    bool operator==(const Channel&) const = default;
};

// Case-folded, whitespace-collapsed, trimmed form used for name matching
[[nodiscard]] std::string normalize_name(std::string_view name);

class Playlist {
public:
    Playlist() = default;

    // Appends the channel, assigning a unique identifier if needed
    void add(Channel channel);

    [[nodiscard]] const std::vector<Channel>& channels() const noexcept { return channels_; }
    [[nodiscard]] std::size_t size() const noexcept { return channels_.size(); }
    [[nodiscard]] bool empty() const noexcept { return channels_.empty(); }

    // Sorted distinct non-empty group titles
    [[nodiscard]] std::vector<std::string> categories() const;

    [[nodiscard]] std::vector<const Channel*> channels_in(std::string_view group) const;

    // Case-insensitive substring match on the display name, playlist order
    [[nodiscard]] std::vector<const Channel*> search(std::string_view query) const;

    [[nodiscard]] const Channel* find(std::string_view identifier) const noexcept;
    [[nodiscard]] const Channel* find_by_url(std::string_view url) const noexcept;

    // #EXTM3U header attributes
    [[nodiscard]] const std::map<std::string, std::string>& header_attributes() const noexcept {
        return header_attributes_;
    }
    void header_attribute(std::string key, std::string value) {
        header_attributes_[std::move(key)] = std::move(value);
    }

    // EPG location advertised by the header (url-tvg / x-tvg-url), or empty
    [[nodiscard]] std::string epg_url() const;

    bool operator==(const Playlist& other) const {
        return channels_ == other.channels_ && header_attributes_ == other.header_attributes_;
    }

private:
    [[nodiscard]] std::string unique_identifier(const Channel& channel) const;

    std::vector<Channel> channels_;
    std::map<std::string, std::string> header_attributes_;
    // std::less<> so find() takes a string_view as is
    std::map<std::string, std::size_t, std::less<>> by_identifier_;
    std::map<std::string, std::size_t, std::less<>> by_url_;
};

} // namespace relay::model
