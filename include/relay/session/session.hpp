// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/model/channel.hpp>
#include <relay/model/program.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

namespace relay::session {

// Immutable snapshot of everything the presentation layer reads.
// playlist and guide are never null; a fresh session holds empty ones.
struct Dataset {
    std::shared_ptr<const model::Playlist> playlist;
    std::shared_ptr<const model::EpgGuide> guide;
    std::uint64_t generation{0};

    // Where the committed playlist and guide were read from; empty until committed
    std::string playlist_source;
    std::string epg_source;
};

enum class ReloadTarget : std::uint8_t {
    playlist = 0,
    epg = 1,
};

[[nodiscard]] std::string_view to_string(ReloadTarget target) noexcept;

// Issued when a reload starts; only the newest ticket of a target may commit
struct ReloadTicket {
    ReloadTarget target{ReloadTarget::playlist};
    std::uint64_t sequence{0};
};

// The single active playlist + EPG pair. Readers take snapshots, the loader
// commits whole replacements. Each successful commit bumps the generation.
class Session {
public:
    Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] std::shared_ptr<const Dataset> snapshot() const;
    [[nodiscard]] std::uint64_t generation() const;

    [[nodiscard]] ReloadTicket begin_reload(ReloadTarget target);

    // False once a newer reload of the same target has begun
    [[nodiscard]] bool is_current(const ReloadTicket& ticket) const;

    // Swap in a new playlist/guide read from source. Returns the new generation,
    // or IngestErrc::superseded (dataset untouched) for a stale ticket.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    commit_playlist(const ReloadTicket& ticket, model::Playlist playlist, std::string source = {});

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    commit_epg(const ReloadTicket& ticket, model::EpgGuide guide, std::string source = {});

private:
    [[nodiscard]] bool is_current_locked(const ReloadTicket& ticket) const noexcept;

    mutable std::mutex mutex_;
    std::shared_ptr<const Dataset> current_;
    std::array<std::uint64_t, 2> latest_{};
};

} // namespace relay::session
