// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <relay/core/error.hpp>
#include <relay/session/session.hpp>

using namespace relay::session;
using relay::core::IngestErrc;
using relay::model::Channel;
using relay::model::EpgChannel;
using relay::model::EpgGuide;
using relay::model::Playlist;

namespace {

Playlist playlist_of(std::string_view name) {
    Playlist playlist;
    Channel channel;
    channel.name = std::string(name);
    channel.url = "http://example.com/" + std::string(name);
    playlist.add(channel);
    return playlist;
}

} // namespace

TEST_CASE("Session - initial state", "[session]") {
    Session session;
    auto snapshot = session.snapshot();

    REQUIRE(snapshot != nullptr);
    REQUIRE(snapshot->playlist != nullptr);
    REQUIRE(snapshot->guide != nullptr);
    CHECK(snapshot->playlist->empty());
    CHECK(snapshot->guide->channel_count() == 0);
    CHECK(snapshot->generation == 0);
    CHECK(snapshot->playlist_source.empty());
    CHECK(snapshot->epg_source.empty());
    CHECK(session.generation() == 0);
}

TEST_CASE("Session - the dataset records where each part was read from", "[session]") {
    Session session;

    auto playlist_ticket = session.begin_reload(ReloadTarget::playlist);
    REQUIRE(session.commit_playlist(playlist_ticket, playlist_of("one"), "tv.m3u").has_value());
    auto epg_ticket = session.begin_reload(ReloadTarget::epg);
    REQUIRE(session.commit_epg(epg_ticket, EpgGuide{}, "guide.xml").has_value());

    CHECK(session.snapshot()->playlist_source == "tv.m3u");
    CHECK(session.snapshot()->epg_source == "guide.xml");

    // A stale commit leaves both sources as they were
    auto stale = session.begin_reload(ReloadTarget::playlist);
    auto newer = session.begin_reload(ReloadTarget::playlist);
    CHECK_FALSE(session.commit_playlist(stale, playlist_of("two"), "other.m3u").has_value());
    CHECK(session.snapshot()->playlist_source == "tv.m3u");

    REQUIRE(session.commit_playlist(newer, playlist_of("three"), "new.m3u").has_value());
    CHECK(session.snapshot()->playlist_source == "new.m3u");
    CHECK(session.snapshot()->epg_source == "guide.xml");
}

TEST_CASE("Session - commits replace the dataset", "[session]") {
    Session session;

    auto ticket = session.begin_reload(ReloadTarget::playlist);
    auto committed = session.commit_playlist(ticket, playlist_of("one"));
    REQUIRE(committed.has_value());
    CHECK(*committed == 1);

    auto first = session.snapshot();
    CHECK(first->playlist->size() == 1);

    SECTION("Earlier snapshots are not modified") {
        auto second_ticket = session.begin_reload(ReloadTarget::playlist);
        REQUIRE(session.commit_playlist(second_ticket, Playlist{}).has_value());

        CHECK(first->playlist->size() == 1);
        CHECK(first->generation == 1);
        CHECK(session.snapshot()->playlist->empty());
        CHECK(session.generation() == 2);
    }

    SECTION("An EPG commit keeps the playlist") {
        EpgGuide guide;
        guide.add_channel(EpgChannel{"one.tv", {"One"}, {}});
        guide.finalize();

        auto epg_ticket = session.begin_reload(ReloadTarget::epg);
        auto generation = session.commit_epg(epg_ticket, std::move(guide));
        REQUIRE(generation.has_value());
        CHECK(*generation == 2);

        auto snapshot = session.snapshot();
        CHECK(snapshot->playlist == first->playlist);
        CHECK(snapshot->guide->channel("one.tv") != nullptr);
    }
}

TEST_CASE("Session - stale tickets are rejected", "[session]") {
    Session session;

    SECTION("A newer reload of the same target supersedes the older") {
        auto older = session.begin_reload(ReloadTarget::playlist);
        auto newer = session.begin_reload(ReloadTarget::playlist);

        CHECK_FALSE(session.is_current(older));
        CHECK(session.is_current(newer));

        auto rejected = session.commit_playlist(older, playlist_of("old"));
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error() == IngestErrc::superseded);
        CHECK(session.generation() == 0);

        REQUIRE(session.commit_playlist(newer, playlist_of("new")).has_value());
        CHECK(session.snapshot()->playlist->channels()[0].name == "new");
    }

    SECTION("Targets have independent sequences") {
        auto playlist_ticket = session.begin_reload(ReloadTarget::playlist);
        auto epg_ticket = session.begin_reload(ReloadTarget::epg);

        CHECK(session.is_current(playlist_ticket));
        CHECK(session.is_current(epg_ticket));
        CHECK(session.commit_epg(epg_ticket, EpgGuide{}).has_value());
        CHECK(session.commit_playlist(playlist_ticket, playlist_of("x")).has_value());
        CHECK(session.generation() == 2);
    }

    SECTION("A ticket cannot commit to the other target") {
        auto epg_ticket = session.begin_reload(ReloadTarget::epg);
        auto rejected = session.commit_playlist(epg_ticket, playlist_of("x"));
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error() == IngestErrc::superseded);
    }

    SECTION("A default ticket is never current") {
        CHECK_FALSE(session.is_current(ReloadTicket{}));
    }
}

TEST_CASE("ReloadTarget names", "[session]") {
    CHECK(to_string(ReloadTarget::playlist) == "playlist");
    CHECK(to_string(ReloadTarget::epg) == "EPG");
}
