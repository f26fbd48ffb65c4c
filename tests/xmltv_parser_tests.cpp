// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <relay/media/xmltv_parser.hpp>

using namespace relay::media;
using namespace std::chrono;
using relay::core::IngestErrc;

namespace {

sys_seconds utc(int y, unsigned mo, unsigned d, int h, int mi) {
    return sys_days{year{y} / month{mo} / day{d}} + hours{h} + minutes{mi};
}

constexpr std::string_view NEWS_GUIDE = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE tv SYSTEM "xmltv.dtd">
<tv generator-info-name="test">
  <channel id="ch1">
    <display-name>Channel One</display-name>
    <display-name>C1</display-name>
    <icon src="http://logo/ch1.png"/>
  </channel>
  <programme channel="ch1" start="20240101130000 +0000" stop="20240101140000 +0000">
    <title lang="en">Weather</title>
  </programme>
  <programme channel="ch1" start="20240101120000 +0000" stop="20240101130000 +0000">
    <title lang="en">News</title>
    <title lang="fr">Nouvelles</title>
    <sub-title>Midday edition</sub-title>
    <desc>Headlines from around the world.</desc>
    <category>News</category>
    <category>Current affairs</category>
    <icon src="http://img/news.jpg"/>
    <rating system="VCHIP"><value>TV-G</value></rating>
  </programme>
</tv>
)";

} // namespace

TEST_CASE("XmltvParser - channels and programmes", "[xmltv]") {
    auto result = XmltvParser::parse(NEWS_GUIDE);
    REQUIRE(result.has_value());
    CHECK(result->skipped_entries() == 0);

    const auto& guide = result->guide;
    CHECK(guide.channel_count() == 1);
    CHECK(guide.program_count() == 2);

    SECTION("Channel declaration") {
        const auto* channel = guide.channel("ch1");
        REQUIRE(channel != nullptr);
        REQUIRE(channel->display_names.size() == 2);
        CHECK(channel->display_names[0] == "Channel One");
        CHECK(channel->icon == "http://logo/ch1.png");
    }

    SECTION("Programme details") {
        const auto* schedule = guide.schedule("ch1");
        REQUIRE(schedule != nullptr);
        const auto& news = schedule->programs().front();
        CHECK(news.title == "News");
        CHECK(news.subtitle == "Midday edition");
        CHECK(news.description == "Headlines from around the world.");
        REQUIRE(news.categories.size() == 2);
        CHECK(news.categories[1] == "Current affairs");
        CHECK(news.icon == "http://img/news.jpg");
        CHECK(news.duration() == minutes{60});
    }

    SECTION("Schedule is in start order") {
        const auto& programs = guide.schedule("ch1")->programs();
        CHECK(programs[0].title == "News");
        CHECK(programs[1].title == "Weather");
    }

    SECTION("Current program at and after a boundary") {
        const auto* schedule = guide.schedule("ch1");
        REQUIRE(schedule != nullptr);

        const auto* at_half_past = schedule->current_at(utc(2024, 1, 1, 12, 30));
        REQUIRE(at_half_past != nullptr);
        CHECK(at_half_past->title == "News");

        const auto* at_one = schedule->current_at(utc(2024, 1, 1, 13, 0));
        REQUIRE(at_one != nullptr);
        CHECK(at_one->title == "Weather");
    }

    SECTION("Lookup by display name") {
        CHECK(guide.find_by_name("  channel   ONE ") == "ch1");
        CHECK(guide.find_by_name("c1") == "ch1");
        CHECK_FALSE(guide.find_by_name("Channel Two").has_value());
    }
}

TEST_CASE("XmltvParser - invalid entries are skipped", "[xmltv]") {
    auto result = XmltvParser::parse(R"(<tv>
  <channel><display-name>No id</display-name></channel>
  <channel id="ok"><display-name>Ok</display-name></channel>
  <programme start="20240101120000 +0000" stop="20240101130000 +0000"><title>No channel</title></programme>
  <programme channel="ok" start="garbage" stop="20240101130000 +0000"><title>Bad start</title></programme>
  <programme channel="ok" start="20240101130000 +0000" stop="20240101120000 +0000"><title>Backwards</title></programme>
  <programme channel="ok" start="20240101120000 +0000" stop="20240101120000 +0000"><title>Empty</title></programme>
  <programme channel="ok" start="20240101120000 +0000" stop="20240101130000 +0000"><title>Kept</title></programme>
</tv>)");

    REQUIRE(result.has_value());
    CHECK(result->skipped_channels == 1);
    CHECK(result->skipped_programs == 4);
    CHECK(result->skipped_entries() == 5);
    CHECK(result->guide.program_count() == 1);
    CHECK(result->guide.schedule("ok")->programs().front().title == "Kept");
}

TEST_CASE("XmltvParser - programmes for undeclared channels", "[xmltv]") {
    auto result = XmltvParser::parse(R"(<tv>
  <programme channel="implicit.tv" start="202401011200 +0000" stop="202401011300 +0000"><title>Orphan</title></programme>
</tv>)");

    REQUIRE(result.has_value());
    const auto* channel = result->guide.channel("implicit.tv");
    REQUIRE(channel != nullptr);
    CHECK(channel->display_names.empty());
    CHECK(result->guide.find_by_name("IMPLICIT.TV") == "implicit.tv");
}

TEST_CASE("XmltvParser - documents that are not XMLTV", "[xmltv]") {
    SECTION("Empty input") {
        auto result = XmltvParser::parse("  \n ");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == IngestErrc::format_unrecognized);
    }

    SECTION("Plain text") {
        auto result = XmltvParser::parse("#EXTM3U\n#EXTINF:-1,One\nhttp://example.com/one\n");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == IngestErrc::format_unrecognized);
    }

    SECTION("Wrong root element") {
        auto result = XmltvParser::parse("<html><body/></html>");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == IngestErrc::format_unrecognized);
        CHECK(result.error().reason.find("<html>") != std::string::npos);
    }

    SECTION("Truncated document reports what was skipped") {
        auto result = XmltvParser::parse(R"(<tv>
  <programme channel="a" start="bad" stop="bad"><title>X</title></programme>
  <channel id="b"><display-name>B)");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == IngestErrc::format_unrecognized);
        CHECK(result.error().skipped_entries == 1);
    }
}

TEST_CASE("XmltvParser::is_epg_path", "[xmltv]") {
    CHECK(XmltvParser::is_epg_path("/srv/guide.xml"));
    CHECK(XmltvParser::is_epg_path("https://example.com/epg.XMLTV?day=1"));
    CHECK_FALSE(XmltvParser::is_epg_path("/srv/list.m3u"));
}
