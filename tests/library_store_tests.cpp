// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <relay/core/error.hpp>
#include <relay/store/library_store.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace relay::store;
using relay::core::IngestErrc;
using relay::model::Channel;
using relay::model::Playlist;

namespace fs = std::filesystem;

namespace {

// Fresh directory per test case, removed on scope exit
class TempDir {
public:
    explicit TempDir(std::string_view name)
        : path_(fs::temp_directory_path() / name) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    [[nodiscard]] std::string file(std::string_view name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

Channel make_channel(std::string tvg_id, std::string name, std::string url) {
    Channel channel;
    channel.tvg_id = std::move(tvg_id);
    channel.name = std::move(name);
    channel.url = std::move(url);
    return channel;
}

} // namespace

TEST_CASE("LibraryStore - opening", "[store]") {
    TempDir dir("relay_store_open");

    SECTION("Missing file is an empty store") {
        auto store = LibraryStore::open(dir.file("absent.json"));
        REQUIRE(store.has_value());
        CHECK(store->favorites().empty());
        CHECK(store->playlists().empty());
        CHECK(store->path() == dir.file("absent.json"));
    }

    SECTION("Corrupt JSON is a store error") {
        {
            std::ofstream out(dir.file("corrupt.json"));
            out << "{ \"favorites\": [ ";
        }
        auto store = LibraryStore::open(dir.file("corrupt.json"));
        REQUIRE_FALSE(store.has_value());
        CHECK(store.error() == IngestErrc::store_error);
    }

    SECTION("JSON that is not an object is a store error") {
        {
            std::ofstream out(dir.file("array.json"));
            out << "[1, 2, 3]";
        }
        auto store = LibraryStore::open(dir.file("array.json"));
        REQUIRE_FALSE(store.has_value());
        CHECK(store.error() == IngestErrc::store_error);
    }

    SECTION("Unknown and incomplete entries are ignored") {
        {
            std::ofstream out(dir.file("partial.json"));
            out << R"({"version": 1, "extra": true,
                       "favorites": [{"name": "no id"}, {"identifier": "a", "name": "A"}],
                       "settings": {"theme": "dark", "count": 3},
                       "playlists": [{"name": "", "path": "x"}]})";
        }
        auto store = LibraryStore::open(dir.file("partial.json"));
        REQUIRE(store.has_value());
        REQUIRE(store->favorites().size() == 1);
        CHECK(store->favorites()[0].identifier == "a");
        CHECK(store->setting("theme") == "dark");
        CHECK(store->setting("count", "none") == "none");
        CHECK(store->playlists().empty());
    }
}

TEST_CASE("LibraryStore - an unreadable library is kept, never overwritten", "[store]") {
    TempDir dir("relay_store_corrupt");
    const auto path = dir.file("library.json");
    const std::string corrupt = "{ \"favorites\": [ {\"identifier\": \"a\"";
    {
        std::ofstream out(path, std::ios::binary);
        out << corrupt;
    }
    REQUIRE_FALSE(LibraryStore::open(path).has_value());

    auto moved = LibraryStore::set_aside(path);
    REQUIRE(moved.has_value());
    CHECK(*moved == path + ".bad");
    CHECK_FALSE(fs::exists(path));

    // A fresh store saved afterwards leaves the old content intact
    LibraryStore fresh(path);
    fresh.set_setting("theme", "dark");
    REQUIRE_FALSE(fresh.save());

    std::ifstream in(*moved, std::ios::binary);
    std::stringstream kept;
    kept << in.rdbuf();
    CHECK(kept.str() == corrupt);

    auto reopened = LibraryStore::open(path);
    REQUIRE(reopened.has_value());
    CHECK(reopened->setting("theme") == "dark");

    SECTION("Nothing to move") {
        auto missing = LibraryStore::set_aside(dir.file("absent.json"));
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error() == IngestErrc::store_error);
    }
}

TEST_CASE("LibraryStore - save and reopen", "[store]") {
    TempDir dir("relay_store_save");
    const auto path = dir.file("nested/library.json");

    LibraryStore store(path);
    store.add_favorite(Favorite::from_channel(make_channel("news.uk", "News", "http://example.com/news")));
    store.set_setting("last_playlist", "/home/user/tv.m3u");
    store.add_playlist(SavedPlaylist{"Home", "http://example.com/home.m3u", true});
    REQUIRE_FALSE(store.save());
    CHECK_FALSE(fs::exists(path + ".tmp"));

    auto reopened = LibraryStore::open(path);
    REQUIRE(reopened.has_value());
    CHECK(reopened->favorites() == store.favorites());
    CHECK(reopened->playlists() == store.playlists());
    CHECK(reopened->setting("last_playlist") == "/home/user/tv.m3u");
}

TEST_CASE("LibraryStore - favorites", "[store]") {
    LibraryStore store;

    Playlist playlist;
    playlist.add(make_channel("a.tv", "A", "http://example.com/a"));
    playlist.add(make_channel("", "B", "http://example.com/b"));
    playlist.add(make_channel("c.tv", "C", "http://example.com/c"));
    const auto& channels = playlist.channels();

    SECTION("Adding the same identifier replaces the entry") {
        store.add_favorite(Favorite::from_channel(channels[0]));
        auto renamed = Favorite::from_channel(channels[0]);
        renamed.name = "A renamed";
        store.add_favorite(renamed);
        REQUIRE(store.favorites().size() == 1);
        CHECK(store.favorites()[0].name == "A renamed");
    }

    SECTION("Removal") {
        store.add_favorite(Favorite::from_channel(channels[0]));
        CHECK(store.is_favorite("a.tv"));
        CHECK(store.remove_favorite("a.tv"));
        CHECK_FALSE(store.remove_favorite("a.tv"));
        CHECK_FALSE(store.is_favorite(channels[0]));
    }

    SECTION("Resolution follows playlist order") {
        store.add_favorite(Favorite::from_channel(channels[2]));
        store.add_favorite(Favorite::from_channel(channels[0]));
        store.add_favorite(Favorite{"gone", "Gone", "http://example.com/gone", {}, {}, {}});

        auto resolved = store.resolve(playlist);
        REQUIRE(resolved.size() == 2);
        CHECK(resolved[0] == &channels[0]);
        CHECK(resolved[1] == &channels[2]);
    }

    SECTION("Stream URL matches when the identifier changed") {
        store.add_favorite(Favorite{"old-id", "B", "http://example.com/b", {}, {}, {}});
        CHECK(store.is_favorite(channels[1]));

        auto resolved = store.resolve(playlist);
        REQUIRE(resolved.size() == 1);
        CHECK(resolved[0] == &channels[1]);
    }
}

TEST_CASE("LibraryStore - settings and saved playlists", "[store]") {
    LibraryStore store;

    CHECK(store.setting("missing").empty());
    CHECK(store.setting("missing", "fallback") == "fallback");

    store.set_setting("epg_url", "http://example.com/a.xml");
    store.set_setting("epg_url", "http://example.com/b.xml");
    CHECK(store.setting("epg_url") == "http://example.com/b.xml");
    CHECK(store.remove_setting("epg_url"));
    CHECK_FALSE(store.remove_setting("epg_url"));

    store.add_playlist(SavedPlaylist{"Home", "/tv/home.m3u", false});
    store.add_playlist(SavedPlaylist{"Home", "http://example.com/home.m3u", true});
    REQUIRE(store.playlists().size() == 1);
    CHECK(store.playlists()[0].is_url);
    CHECK(store.remove_playlist("Home"));
    CHECK(store.playlists().empty());
}

TEST_CASE("LibraryStore::default_path", "[store]") {
    auto path = LibraryStore::default_path();
    CHECK(path.ends_with("library.json"));
    CHECK(path.find("relay-iptv") != std::string::npos);
}
