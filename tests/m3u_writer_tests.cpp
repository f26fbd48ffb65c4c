// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <relay/media/m3u_parser.hpp>
#include <relay/media/m3u_writer.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace relay::media;
using relay::model::Channel;
using relay::model::Playlist;

namespace fs = std::filesystem;

namespace {

Playlist sample_playlist() {
    Playlist playlist;
    playlist.header_attribute("url-tvg", "http://example.com/guide.xml");

    Channel news;
    news.tvg_id = "news.uk";
    news.tvg_name = "News UK";
    news.logo = "http://logo/news.png";
    news.group = "News";
    news.name = "News, 24h";
    news.url = "http://example.com/news";
    news.attributes["catchup-days"] = "7";
    news.options.push_back("http-user-agent=Relay");
    playlist.add(news);

    Channel quoted;
    quoted.name = "Quoted";
    quoted.group = "Say \"hi\"";
    quoted.url = "http://example.com/quoted";
    quoted.duration = 30;
    playlist.add(quoted);

    return playlist;
}

} // namespace

TEST_CASE("M3UWriter - output is readable by the parser", "[m3u][writer]") {
    auto playlist = sample_playlist();
    auto text = M3UWriter::write(playlist);

    CHECK(text.starts_with("#EXTM3U url-tvg=\"http://example.com/guide.xml\"\n"));
    CHECK(text.find("group-title='Say \"hi\"'") != std::string::npos);

    auto reparsed = M3UParser::parse(text);
    REQUIRE(reparsed.has_value());
    CHECK(reparsed->degraded_lines == 0);
    CHECK(reparsed->malformed_entries == 0);
    CHECK(reparsed->playlist == playlist);
}

TEST_CASE("M3UWriter - durations are written as they were read", "[m3u][writer]") {
    const std::string text =
        "#EXTM3U\n"
        "#EXTINF:10.5,Clip\n"
        "http://example.com/clip\n"
        "#EXTINF:-1,Live\n"
        "http://example.com/live\n";

    auto parsed = M3UParser::parse(text);
    REQUIRE(parsed.has_value());
    CHECK(M3UWriter::write(parsed->playlist) == text);
}

TEST_CASE("M3UWriter - empty playlist", "[m3u][writer]") {
    CHECK(M3UWriter::write(Playlist{}) == "#EXTM3U\n");
}

TEST_CASE("M3UWriter::save", "[m3u][writer]") {
    const auto dir = fs::temp_directory_path() / "relay_writer_tests";
    fs::remove_all(dir);
    const auto path = dir / "nested" / "export.m3u";

    auto playlist = sample_playlist();
    REQUIRE_FALSE(M3UWriter::save(playlist, path.string()));
    REQUIRE(fs::exists(path));

    std::ifstream in(path, std::ios::binary);
    std::stringstream content;
    content << in.rdbuf();
    CHECK(content.str() == M3UWriter::write(playlist));

    fs::remove_all(dir);
}
