// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/session/session.hpp>
#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

namespace relay::session {

std::string_view to_string(ReloadTarget target) noexcept {
    return target == ReloadTarget::playlist ? "playlist" : "EPG";
}

Session::Session()
    : current_(std::make_shared<const Dataset>(Dataset{
          std::make_shared<const model::Playlist>(),
          std::make_shared<const model::EpgGuide>(),
          0,
          {},
          {}})) {}

std::shared_ptr<const Dataset> Session::snapshot() const {
    std::lock_guard lock(mutex_);
    return current_;
}

std::uint64_t Session::generation() const {
    std::lock_guard lock(mutex_);
    return current_->generation;
}

ReloadTicket Session::begin_reload(ReloadTarget target) {
    std::lock_guard lock(mutex_);
    auto& latest = latest_[static_cast<std::size_t>(target)];
    return ReloadTicket{target, ++latest};
}

bool Session::is_current(const ReloadTicket& ticket) const {
    std::lock_guard lock(mutex_);
    return is_current_locked(ticket);
}

bool Session::is_current_locked(const ReloadTicket& ticket) const noexcept {
    return ticket.sequence != 0 && latest_[static_cast<std::size_t>(ticket.target)] == ticket.sequence;
}

std::expected<std::uint64_t, std::error_code>
Session::commit_playlist(const ReloadTicket& ticket, model::Playlist playlist, std::string source) {
    auto next = std::make_shared<const model::Playlist>(std::move(playlist));

    std::lock_guard lock(mutex_);
    if (ticket.target != ReloadTarget::playlist || !is_current_locked(ticket)) {
        core::logger()->debug("Discarding stale playlist reload #{}", ticket.sequence);
        return std::unexpected(make_error_code(core::IngestErrc::superseded));
    }

    current_ = std::make_shared<const Dataset>(Dataset{
        std::move(next), current_->guide, current_->generation + 1,
        std::move(source), current_->epg_source});
    return current_->generation;
}

std::expected<std::uint64_t, std::error_code>
Session::commit_epg(const ReloadTicket& ticket, model::EpgGuide guide, std::string source) {
    auto next = std::make_shared<const model::EpgGuide>(std::move(guide));

    std::lock_guard lock(mutex_);
    if (ticket.target != ReloadTarget::epg || !is_current_locked(ticket)) {
        core::logger()->debug("Discarding stale EPG reload #{}", ticket.sequence);
        return std::unexpected(make_error_code(core::IngestErrc::superseded));
    }

    current_ = std::make_shared<const Dataset>(Dataset{
        current_->playlist, std::move(next), current_->generation + 1,
        current_->playlist_source, std::move(source)});
    return current_->generation;
}

} // namespace relay::session
