// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/session/source_loader.hpp>
#include <relay/core/log.hpp>
#include <relay/core/source.hpp>
#include <relay/media/m3u_parser.hpp>
#include <relay/media/xmltv_parser.hpp>
#include <algorithm>

namespace relay::session {

SourceLoader::SourceLoader(Session& session, core::SourceReader& reader)
    : session_(session)
    , reader_(reader) {}

SourceLoader::~SourceLoader() {
    cancel_all();
    wait();
}

void SourceLoader::reload_playlist(std::string source, ReloadCallback callback) {
    start(ReloadTarget::playlist, std::move(source), std::move(callback));
}

void SourceLoader::reload_epg(std::string source, ReloadCallback callback) {
    start(ReloadTarget::epg, std::move(source), std::move(callback));
}

void SourceLoader::start(ReloadTarget target, std::string source, ReloadCallback callback) {
    std::lock_guard lock(mutex_);
    reap_finished_locked();

    for (auto& worker : workers_) {
        if (worker.target == target) {
            worker.thread.request_stop();
        }
    }

    auto ticket = session_.begin_reload(target);
    auto done = std::make_shared<std::atomic<bool>>(false);
    core::logger()->info("Reloading {} #{} from {}", to_string(target), ticket.sequence, source);

    std::jthread thread([this, ticket, done, source = std::move(source),
                         callback = std::move(callback)](std::stop_token stop) {
        run(stop, ticket, source, callback);
        done->store(true, std::memory_order_release);
    });
    workers_.push_back(Worker{target, std::move(thread), std::move(done)});
}

void SourceLoader::run(std::stop_token stop, ReloadTicket ticket, const std::string& source,
                       const ReloadCallback& callback) {
    ReloadOutcome outcome;
    try {
        outcome = ticket.target == ReloadTarget::playlist ? load_playlist(stop, ticket, source)
                                                          : load_epg(stop, ticket, source);
    } catch (const std::exception& e) {
        outcome = interrupted(ticket, source,
            core::make_failure(core::IngestErrc::source_unavailable, e.what()));
    }

    switch (outcome.status) {
        case ReloadStatus::applied:
            core::logger()->info("{} reload #{} applied: {} items, {} skipped, generation {}",
                to_string(ticket.target), ticket.sequence, outcome.item_count,
                outcome.skipped_entries, outcome.generation);
            break;
        case ReloadStatus::superseded:
            core::logger()->info("{} reload #{} superseded", to_string(ticket.target), ticket.sequence);
            break;
        case ReloadStatus::failed:
            core::logger()->warn("{} reload #{} failed: {}", to_string(ticket.target), ticket.sequence,
                outcome.failure ? outcome.failure->describe() : std::string("unknown error"));
            break;
    }

    if (callback) {
        callback(outcome);
    }
}

ReloadOutcome SourceLoader::load_playlist(std::stop_token stop, const ReloadTicket& ticket,
                                          const std::string& source) {
    auto ref = core::SourceRef::parse(source);
    if (!ref) {
        return interrupted(ticket, source, core::IngestFailure{ref.error(), "Invalid source: " + source});
    }

    auto bytes = reader_.read(*ref, stop);
    if (!bytes) {
        return interrupted(ticket, source, core::IngestFailure{bytes.error(), bytes.error().message()});
    }
    if (stop.stop_requested()) {
        return interrupted(ticket, source, core::make_failure(core::IngestErrc::cancelled, {}));
    }

    auto parsed = media::M3UParser::parse(*bytes);
    if (!parsed) {
        return interrupted(ticket, source, std::move(parsed.error()));
    }

    ReloadOutcome outcome;
    outcome.target = ticket.target;
    outcome.source = source;
    outcome.skipped_entries = parsed->malformed_entries;
    outcome.item_count = parsed->playlist.size();

    if (stop.stop_requested()) {
        return interrupted(ticket, source, core::make_failure(core::IngestErrc::cancelled, {}));
    }

    auto generation = session_.commit_playlist(ticket, std::move(parsed->playlist), source);
    if (!generation) {
        return interrupted(ticket, source, core::IngestFailure{generation.error(), {}});
    }
    outcome.status = ReloadStatus::applied;
    outcome.generation = *generation;
    return outcome;
}

ReloadOutcome SourceLoader::load_epg(std::stop_token stop, const ReloadTicket& ticket,
                                     const std::string& source) {
    auto ref = core::SourceRef::parse(source);
    if (!ref) {
        return interrupted(ticket, source, core::IngestFailure{ref.error(), "Invalid source: " + source});
    }

    auto bytes = reader_.read(*ref, stop);
    if (!bytes) {
        return interrupted(ticket, source, core::IngestFailure{bytes.error(), bytes.error().message()});
    }
    if (stop.stop_requested()) {
        return interrupted(ticket, source, core::make_failure(core::IngestErrc::cancelled, {}));
    }

    auto parsed = media::XmltvParser::parse(*bytes);
    if (!parsed) {
        return interrupted(ticket, source, std::move(parsed.error()));
    }

    ReloadOutcome outcome;
    outcome.target = ticket.target;
    outcome.source = source;
    outcome.skipped_entries = parsed->skipped_entries();
    outcome.item_count = parsed->guide.program_count();

    if (stop.stop_requested()) {
        return interrupted(ticket, source, core::make_failure(core::IngestErrc::cancelled, {}));
    }

    auto generation = session_.commit_epg(ticket, std::move(parsed->guide), source);
    if (!generation) {
        return interrupted(ticket, source, core::IngestFailure{generation.error(), {}});
    }
    outcome.status = ReloadStatus::applied;
    outcome.generation = *generation;
    return outcome;
}

ReloadOutcome SourceLoader::interrupted(const ReloadTicket& ticket, const std::string& source,
                                        core::IngestFailure failure) const {
    ReloadOutcome outcome;
    outcome.target = ticket.target;
    outcome.source = source;
    outcome.skipped_entries = failure.skipped_entries;

    // A newer reload of the same target turns any error into a supersede
    if (!session_.is_current(ticket)) {
        outcome.status = ReloadStatus::superseded;
        outcome.failure = core::make_failure(core::IngestErrc::superseded, {}, failure.skipped_entries);
        return outcome;
    }

    outcome.status = ReloadStatus::failed;
    outcome.failure = std::move(failure);
    return outcome;
}

void SourceLoader::cancel_all() {
    std::lock_guard lock(mutex_);
    for (auto& worker : workers_) {
        worker.thread.request_stop();
    }
}

void SourceLoader::wait() {
    std::vector<Worker> workers;
    {
        std::lock_guard lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void SourceLoader::reap_finished_locked() {
    std::erase_if(workers_, [](Worker& worker) {
        if (!worker.done->load(std::memory_order_acquire)) {
            return false;
        }
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
        return true;
    });
}

} // namespace relay::session
