// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/store/library_store.hpp>
#include <relay/core/error.hpp>
#include <relay/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace relay::store {

namespace {

constexpr int STORE_VERSION = 1;

nlohmann::json favorite_to_json(const Favorite& f) {
    return {
        {"identifier", f.identifier},
        {"name", f.name},
        {"url", f.url},
        {"group", f.group},
        {"logo", f.logo},
        {"epg_id", f.epg_id},
    };
}

Favorite favorite_from_json(const nlohmann::json& j) {
    Favorite f;
    f.identifier = j.value("identifier", "");
    f.name = j.value("name", "");
    f.url = j.value("url", "");
    f.group = j.value("group", "");
    f.logo = j.value("logo", "");
    f.epg_id = j.value("epg_id", "");
    return f;
}

} // namespace

Favorite Favorite::from_channel(const model::Channel& channel) {
    return Favorite{channel.identifier, channel.name, channel.url,
                    channel.group, channel.logo, channel.tvg_id};
}

LibraryStore::LibraryStore(std::string path)
    : path_(std::move(path)) {}

std::string LibraryStore::default_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = std::filesystem::current_path();
    }
    return (base / "relay-iptv" / "library.json").string();
}

std::expected<LibraryStore, std::error_code> LibraryStore::open(std::string path) noexcept {
    try {
        LibraryStore store(std::move(path));

        std::error_code fs_ec;
        if (!std::filesystem::exists(store.path_, fs_ec)) {
            core::logger()->debug("No library at {}, starting empty", store.path_);
            return store;
        }

        std::ifstream file(store.path_, std::ios::binary);
        if (!file) {
            core::logger()->error("Cannot open library {}", store.path_);
            return std::unexpected(make_error_code(core::IngestErrc::store_error));
        }
        std::ostringstream content;
        content << file.rdbuf();

        auto j = nlohmann::json::parse(content.str());
        if (!j.is_object()) {
            core::logger()->error("Library {} is not a JSON object", store.path_);
            return std::unexpected(make_error_code(core::IngestErrc::store_error));
        }

        if (auto it = j.find("favorites"); it != j.end() && it->is_array()) {
            for (const auto& entry : *it) {
                auto favorite = favorite_from_json(entry);
                if (!favorite.identifier.empty()) {
                    store.add_favorite(std::move(favorite));
                }
            }
        }

        if (auto it = j.find("settings"); it != j.end() && it->is_object()) {
            for (const auto& [key, value] : it->items()) {
                if (value.is_string()) {
                    store.settings_[key] = value.get<std::string>();
                }
            }
        }

        if (auto it = j.find("playlists"); it != j.end() && it->is_array()) {
            for (const auto& entry : *it) {
                SavedPlaylist playlist{entry.value("name", ""), entry.value("path", ""),
                                       entry.value("is_url", false)};
                if (!playlist.name.empty() && !playlist.path.empty()) {
                    store.add_playlist(std::move(playlist));
                }
            }
        }

        return store;
    } catch (const nlohmann::json::exception& e) {
        core::logger()->error("Corrupt library file: {}", e.what());
        return std::unexpected(make_error_code(core::IngestErrc::store_error));
    } catch (const std::exception& e) {
        core::logger()->error("Loading library failed: {}", e.what());
        return std::unexpected(make_error_code(core::IngestErrc::store_error));
    }
}

std::expected<std::string, std::error_code> LibraryStore::set_aside(const std::string& path) noexcept {
    try {
        std::string target = path + ".bad";
        std::error_code ec;
        std::filesystem::rename(path, target, ec);
        if (ec) {
            core::logger()->error("Cannot move library {} aside: {}", path, ec.message());
            return std::unexpected(make_error_code(core::IngestErrc::store_error));
        }
        core::logger()->warn("Moved unreadable library {} to {}", path, target);
        return target;
    } catch (const std::exception& e) {
        core::logger()->error("Cannot move library {} aside: {}", path, e.what());
        return std::unexpected(make_error_code(core::IngestErrc::store_error));
    }
}

std::error_code LibraryStore::save() const noexcept {
    try {
        nlohmann::json j;
        j["version"] = STORE_VERSION;

        auto favorites = nlohmann::json::array();
        for (const auto& favorite : favorites_) {
            favorites.push_back(favorite_to_json(favorite));
        }
        j["favorites"] = std::move(favorites);

        auto settings = nlohmann::json::object();
        for (const auto& [key, value] : settings_) {
            settings[key] = value;
        }
        j["settings"] = std::move(settings);

        auto playlists = nlohmann::json::array();
        for (const auto& playlist : playlists_) {
            playlists.push_back(nlohmann::json{
                {"name", playlist.name}, {"path", playlist.path}, {"is_url", playlist.is_url}});
        }
        j["playlists"] = std::move(playlists);

        std::filesystem::path target(path_);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        auto temp = target;
        temp += ".tmp";
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                core::logger()->error("Cannot write library {}", temp.string());
                return make_error_code(core::IngestErrc::store_error);
            }
            file << j.dump(2) << '\n';
            if (!file) {
                return make_error_code(core::IngestErrc::store_error);
            }
        }

        std::filesystem::rename(temp, target);
        return {};
    } catch (const std::exception& e) {
        core::logger()->error("Saving library to {} failed: {}", path_, e.what());
        return make_error_code(core::IngestErrc::store_error);
    }
}

//=============================================================================
// Favorites
//=============================================================================

void LibraryStore::add_favorite(Favorite favorite) {
    auto it = std::find_if(favorites_.begin(), favorites_.end(),
        [&](const Favorite& f) { return f.identifier == favorite.identifier; });
    if (it != favorites_.end()) {
        *it = std::move(favorite);
    } else {
        favorites_.push_back(std::move(favorite));
    }
}

bool LibraryStore::remove_favorite(std::string_view identifier) {
    return std::erase_if(favorites_, [&](const Favorite& f) { return f.identifier == identifier; }) > 0;
}

bool LibraryStore::is_favorite(std::string_view identifier) const noexcept {
    return std::any_of(favorites_.begin(), favorites_.end(),
        [&](const Favorite& f) { return f.identifier == identifier; });
}

bool LibraryStore::is_favorite(const model::Channel& channel) const noexcept {
    return std::any_of(favorites_.begin(), favorites_.end(), [&](const Favorite& f) {
        return f.identifier == channel.identifier || (!f.url.empty() && f.url == channel.url);
    });
}

std::vector<const model::Channel*> LibraryStore::resolve(const model::Playlist& playlist) const {
    std::unordered_set<const model::Channel*> matched;
    for (const auto& favorite : favorites_) {
        const auto* channel = playlist.find(favorite.identifier);
        if (channel == nullptr && !favorite.url.empty()) {
            channel = playlist.find_by_url(favorite.url);
        }
        if (channel != nullptr) {
            matched.insert(channel);
        }
    }

    std::vector<const model::Channel*> result;
    for (const auto& channel : playlist.channels()) {
        if (matched.contains(&channel)) {
            result.push_back(&channel);
        }
    }
    return result;
}

//=============================================================================
// Settings
//=============================================================================

std::string LibraryStore::setting(std::string_view key, std::string_view fallback) const {
    auto it = settings_.find(key);
    return it != settings_.end() ? it->second : std::string(fallback);
}

void LibraryStore::set_setting(std::string_view key, std::string value) {
    if (auto it = settings_.find(key); it != settings_.end()) {
        it->second = std::move(value);
    } else {
        settings_.emplace(std::string(key), std::move(value));
    }
}

bool LibraryStore::remove_setting(std::string_view key) {
    auto it = settings_.find(key);
    if (it == settings_.end()) return false;
    settings_.erase(it);
    return true;
}

//=============================================================================
// Saved playlists
//=============================================================================

void LibraryStore::add_playlist(SavedPlaylist playlist) {
    auto it = std::find_if(playlists_.begin(), playlists_.end(),
        [&](const SavedPlaylist& p) { return p.name == playlist.name; });
    if (it != playlists_.end()) {
        *it = std::move(playlist);
    } else {
        playlists_.push_back(std::move(playlist));
    }
}

bool LibraryStore::remove_playlist(std::string_view name) {
    return std::erase_if(playlists_, [&](const SavedPlaylist& p) { return p.name == name; }) > 0;
}

} // namespace relay::store
