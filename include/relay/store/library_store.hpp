// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/model/channel.hpp>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace relay::store {

// Favorited channel, kept independently of any loaded playlist
struct Favorite {
    std::string identifier;
    std::string name;
    std::string url;
    std::string group;
    std::string logo;
    std::string epg_id;

    [[nodiscard]] static Favorite from_channel(const model::Channel& channel);

    bool operator==(const Favorite&) const = default;
};

// Named playlist source remembered across runs
struct SavedPlaylist {
    std::string name;
    std::string path;
    bool is_url{false};

    bool operator==(const SavedPlaylist&) const = default;
};

// Favorites, settings and saved playlists in one JSON document
class LibraryStore {
public:
    LibraryStore() = default;
    explicit LibraryStore(std::string path);

    // $XDG_CONFIG_HOME/relay-iptv/library.json, or ~/.config/relay-iptv/library.json
    [[nodiscard]] static std::string default_path();

    // Load a store. A missing file yields an empty store bound to path;
    // unreadable or corrupt JSON is IngestErrc::store_error.
    [[nodiscard]] static std::expected<LibraryStore, std::error_code> open(std::string path) noexcept;

    // Move an unusable library file to "<path>.bad", replacing an older one,
    // so a fresh store can be saved without losing it. Returns the new path.
    [[nodiscard]] static std::expected<std::string, std::error_code> set_aside(const std::string& path) noexcept;

    // Write to path() via a temporary file
    [[nodiscard]] std::error_code save() const noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    // Favorites (identifier is the key; adding an existing one replaces it)
    void add_favorite(Favorite favorite);
    bool remove_favorite(std::string_view identifier);
    [[nodiscard]] bool is_favorite(std::string_view identifier) const noexcept;
    [[nodiscard]] bool is_favorite(const model::Channel& channel) const noexcept;
    [[nodiscard]] const std::vector<Favorite>& favorites() const noexcept { return favorites_; }

    // Favorited channels present in the playlist, in playlist order.
    // Matches by identifier first, then by stream URL.
    [[nodiscard]] std::vector<const model::Channel*> resolve(const model::Playlist& playlist) const;

    // Settings
    [[nodiscard]] std::string setting(std::string_view key, std::string_view fallback = {}) const;
    void set_setting(std::string_view key, std::string value);
    bool remove_setting(std::string_view key);

    // Saved playlists (name is the key)
    void add_playlist(SavedPlaylist playlist);
    bool remove_playlist(std::string_view name);
    [[nodiscard]] const std::vector<SavedPlaylist>& playlists() const noexcept { return playlists_; }

private:
    std::string path_;
    std::vector<Favorite> favorites_;
    std::map<std::string, std::string, std::less<>> settings_;
    std::vector<SavedPlaylist> playlists_;
};

} // namespace relay::store
