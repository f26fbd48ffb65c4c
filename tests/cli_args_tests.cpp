// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <relay/cli/commands.hpp>
#include <relay/media/m3u_parser.hpp>
#include <relay/store/library_store.hpp>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>

using namespace relay::cli;

namespace fs = std::filesystem;

namespace {

// Owns argv storage for parse_args
class Argv {
public:
    Argv(std::initializer_list<std::string> args)
        : storage_(args) {
        storage_.insert(storage_.begin(), "relay-cli");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] int argc() const { return static_cast<int>(storage_.size()); }
    [[nodiscard]] char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

CliArgs parse(std::initializer_list<std::string> args) {
    Argv argv(args);
    return parse_args(argv.argc(), argv.argv());
}

constexpr std::string_view PLAYLIST =
    "#EXTM3U\n"
    "#EXTINF:-1 tvg-id=\"news\" group-title=\"News\",News 24\n"
    "http://example.com/news\n"
    "#EXTINF:-1 tvg-id=\"film\" group-title=\"Movies\",Film Four\n"
    "http://example.com/film\n";

} // namespace

TEST_CASE("parse_args - commands and operands", "[cli]") {
    SECTION("No arguments") {
        auto args = parse({});
        CHECK(args.command == Command::none);
        CHECK(args.error.empty());
    }

    SECTION("Command with operands and options in any order") {
        auto args = parse({"-g", "News", "channels", "tv.m3u", "-s", "bbc", "-q"});
        CHECK(args.command == Command::channels);
        REQUIRE(args.operands.size() == 1);
        CHECK(args.operands[0] == "tv.m3u");
        CHECK(args.group == "News");
        CHECK(args.query == "bbc");
        CHECK(args.quiet);
        CHECK(args.error.empty());
    }

    SECTION("Every command name") {
        CHECK(parse({"groups"}).command == Command::groups);
        CHECK(parse({"guide"}).command == Command::guide);
        CHECK(parse({"schedule"}).command == Command::schedule);
        CHECK(parse({"export"}).command == Command::export_playlist);
        CHECK(parse({"url"}).command == Command::url);
        CHECK(parse({"fav"}).command == Command::favorites);
        CHECK(parse({"playlists"}).command == Command::playlists);
    }

    SECTION("Schedule options") {
        auto args = parse({"schedule", "tv.m3u", "epg.xml", "ch1", "-t", "2024-01-01T12:30:00Z",
                           "--limit", "3", "--store", "/tmp/lib.json", "-V"});
        CHECK(args.command == Command::schedule);
        CHECK(args.operands.size() == 3);
        CHECK(args.at == "2024-01-01T12:30:00Z");
        CHECK(args.limit == 3);
        CHECK(args.store_path == "/tmp/lib.json");
        CHECK(args.verbose);
    }
}

TEST_CASE("parse_args - help and version stop parsing", "[cli]") {
    CHECK(parse({"--help", "--bogus"}).help);
    CHECK(parse({"channels", "-v"}).version);
    CHECK(parse({"-h"}).error.empty());
}

TEST_CASE("parse_args - errors", "[cli]") {
    CHECK(parse({"frobnicate"}).error == "Unknown command: frobnicate");
    CHECK(parse({"channels", "--bogus"}).error == "Unknown option: --bogus");
    CHECK(parse({"channels", "-g"}).error == "Option -g requires a value");
    CHECK(parse({"schedule", "-n", "0"}).error == "Invalid limit: 0");
    CHECK(parse({"schedule", "-n", "5x"}).error == "Invalid limit: 5x");

    // The first problem is the one reported
    CHECK(parse({"--bogus", "frobnicate"}).error == "Unknown option: --bogus");
}

TEST_CASE("run - usage errors", "[cli]") {
    auto result = run(parse({}));
    REQUIRE(result.has_value());
    CHECK(*result == 2);

    auto missing = run(parse({"url", "tv.m3u"}));
    REQUIRE(missing.has_value());
    CHECK(*missing == 2);

    auto bad_time = run(parse({"guide", "tv.m3u", "epg.xml", "-t", "noon"}));
    REQUIRE(bad_time.has_value());
    CHECK(*bad_time == 2);
}

TEST_CASE("run - playlist commands", "[cli]") {
    const auto dir = fs::temp_directory_path() / "relay_cli_tests";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const auto playlist = (dir / "tv.m3u").string();
    const auto store = (dir / "library.json").string();
    {
        std::ofstream out(playlist, std::ios::binary);
        out << PLAYLIST;
    }

    SECTION("Export writes a playlist the parser reads back") {
        const auto exported = (dir / "out" / "copy.m3u").string();
        auto result = run(parse({"export", playlist, "-o", exported, "-q"}));
        REQUIRE(result.has_value());
        CHECK(*result == 0);

        std::ifstream in(exported, std::ios::binary);
        std::stringstream content;
        content << in.rdbuf();
        auto reparsed = relay::media::M3UParser::parse(content.str());
        REQUIRE(reparsed.has_value());
        CHECK(reparsed->playlist.size() == 2);
    }

    SECTION("Unknown identifier") {
        auto result = run(parse({"url", playlist, "nope", "-q"}));
        REQUIRE(result.has_value());
        CHECK(*result == 1);
    }

    SECTION("Missing playlist reports the load failure") {
        auto result = run(parse({"channels", (dir / "absent.m3u").string(), "-q"}));
        CHECK_FALSE(result.has_value());
    }

    SECTION("Favorites are stored in the library file") {
        auto added = run(parse({"fav", "add", playlist, "film", "--store", store, "-q"}));
        REQUIRE(added.has_value());
        CHECK(*added == 0);

        auto library = relay::store::LibraryStore::open(store);
        REQUIRE(library.has_value());
        REQUIRE(library->favorites().size() == 1);
        CHECK(library->favorites()[0].name == "Film Four");
        CHECK(library->favorites()[0].url == "http://example.com/film");

        auto removed = run(parse({"fav", "remove", "film", "--store", store}));
        REQUIRE(removed.has_value());
        CHECK(*removed == 0);
        CHECK(relay::store::LibraryStore::open(store)->favorites().empty());

        auto again = run(parse({"fav", "remove", "film", "--store", store}));
        REQUIRE(again.has_value());
        CHECK(*again == 1);
    }

    SECTION("Saved playlists can be added, used by name and removed") {
        auto added = run(parse({"playlists", "add", "Home", playlist, "--store", store, "-q"}));
        REQUIRE(added.has_value());
        CHECK(*added == 0);

        auto library = relay::store::LibraryStore::open(store);
        REQUIRE(library.has_value());
        REQUIRE(library->playlists().size() == 1);
        CHECK(library->playlists()[0].name == "Home");
        CHECK(fs::path(library->playlists()[0].path).is_absolute());
        CHECK_FALSE(library->playlists()[0].is_url);

        auto listed = run(parse({"playlists", "list", "--store", store}));
        REQUIRE(listed.has_value());
        CHECK(*listed == 0);

        auto by_name = run(parse({"url", "@Home", "film", "--store", store, "-q"}));
        REQUIRE(by_name.has_value());
        CHECK(*by_name == 0);

        auto removed = run(parse({"playlists", "remove", "Home", "--store", store}));
        REQUIRE(removed.has_value());
        CHECK(*removed == 0);
        CHECK(relay::store::LibraryStore::open(store)->playlists().empty());

        auto again = run(parse({"playlists", "remove", "Home", "--store", store}));
        REQUIRE(again.has_value());
        CHECK(*again == 1);
    }

    SECTION("Remote playlists are saved as URLs") {
        auto added = run(parse({"playlists", "add", "Remote", "https://example.com/tv.m3u",
                                "--store", store, "-q"}));
        REQUIRE(added.has_value());
        auto library = relay::store::LibraryStore::open(store);
        REQUIRE(library.has_value());
        REQUIRE(library->playlists().size() == 1);
        CHECK(library->playlists()[0].path == "https://example.com/tv.m3u");
        CHECK(library->playlists()[0].is_url);
    }

    SECTION("Saved playlist usage errors") {
        auto missing = run(parse({"playlists", "add", "Home", "--store", store}));
        REQUIRE(missing.has_value());
        CHECK(*missing == 2);

        auto unknown = run(parse({"playlists", "rename", "--store", store}));
        REQUIRE(unknown.has_value());
        CHECK(*unknown == 2);

        auto bad_source = run(parse({"playlists", "add", "Ftp", "ftp://example.com/tv.m3u", "--store", store}));
        CHECK_FALSE(bad_source.has_value());
    }

    SECTION("A corrupt library is left untouched") {
        {
            std::ofstream out(store, std::ios::binary);
            out << "{ not json";
        }
        auto result = run(parse({"playlists", "add", "Home", playlist, "--store", store, "-q"}));
        CHECK_FALSE(result.has_value());

        std::ifstream in(store, std::ios::binary);
        std::stringstream content;
        content << in.rdbuf();
        CHECK(content.str() == "{ not json");
    }

    fs::remove_all(dir);
}
