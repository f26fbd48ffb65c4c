// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/model/channel.hpp>
#include <algorithm>
#include <cctype>
#include <set>

namespace relay::model {

namespace {

std::string to_lower(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

} // namespace

std::string normalize_name(std::string_view name) {
    std::string normalized;
    normalized.reserve(name.size());

    bool pending_space = false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized += ' ';
            pending_space = false;
        }
        normalized += static_cast<char>(std::tolower(uc));
    }
    return normalized;
}

//=============================================================================
// Playlist
//=============================================================================

std::string Playlist::unique_identifier(const Channel& channel) const {
    if (!channel.tvg_id.empty() && !by_identifier_.contains(channel.tvg_id)) {
        return channel.tvg_id;
    }
    if (!by_identifier_.contains(channel.url)) {
        return channel.url;
    }

    for (std::size_t n = 2;; ++n) {
        std::string candidate = channel.url + "#" + std::to_string(n);
        if (!by_identifier_.contains(candidate)) {
            return candidate;
        }
    }
}

void Playlist::add(Channel channel) {
    if (channel.identifier.empty() || by_identifier_.contains(channel.identifier)) {
        channel.identifier = unique_identifier(channel);
    }

    const auto index = channels_.size();
    by_identifier_.emplace(channel.identifier, index);
    by_url_.emplace(channel.url, index);  // First entry wins for duplicate URLs
    channels_.push_back(std::move(channel));
}

std::vector<std::string> Playlist::categories() const {
    std::set<std::string> groups;
    for (const auto& channel : channels_) {
        if (!channel.group.empty()) {
            groups.insert(channel.group);
        }
    }
    return {groups.begin(), groups.end()};
}

std::vector<const Channel*> Playlist::channels_in(std::string_view group) const {
    std::vector<const Channel*> result;
    for (const auto& channel : channels_) {
        if (channel.group == group) {
            result.push_back(&channel);
        }
    }
    return result;
}

std::vector<const Channel*> Playlist::search(std::string_view query) const {
    std::vector<const Channel*> result;
    const auto needle = to_lower(query);
    for (const auto& channel : channels_) {
        if (needle.empty() || to_lower(channel.name).find(needle) != std::string::npos) {
            result.push_back(&channel);
        }
    }
    return result;
}

const Channel* Playlist::find(std::string_view identifier) const noexcept {
    auto it = by_identifier_.find(identifier);
    return it != by_identifier_.end() ? &channels_[it->second] : nullptr;
}

const Channel* Playlist::find_by_url(std::string_view url) const noexcept {
    auto it = by_url_.find(url);
    return it != by_url_.end() ? &channels_[it->second] : nullptr;
}

std::string Playlist::epg_url() const {
    for (const char* key : {"url-tvg", "x-tvg-url", "tvg-url"}) {
        auto it = header_attributes_.find(key);
        if (it != header_attributes_.end() && !it->second.empty()) {
            // Some providers list several feeds separated by commas; take the first
            auto comma = it->second.find(',');
            return it->second.substr(0, comma);
        }
    }
    return {};
}

} // namespace relay::model
