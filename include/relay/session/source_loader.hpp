// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/error.hpp>
#include <relay/core/source_reader.hpp>
#include <relay/session/session.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace relay::session {

enum class ReloadStatus : std::uint8_t {
    applied,       // Committed; the session generation advanced
    superseded,    // A newer reload of the same target began first
    failed,        // Fetch or parse failed; dataset unchanged
};

struct ReloadOutcome {
    ReloadTarget target{ReloadTarget::playlist};
    ReloadStatus status{ReloadStatus::failed};
    std::string source;
    std::optional<core::IngestFailure> failure;   // Set when status is failed
    std::size_t skipped_entries{0};
    std::size_t item_count{0};                    // Channels or programs parsed
    std::uint64_t generation{0};                  // Session generation after an applied commit
};

// Invoked on the worker thread
using ReloadCallback = std::function<void(const ReloadOutcome&)>;

// Runs fetch + parse + commit in the background. A new reload of a target
// stops the previous one of that target; its result is never applied.
class SourceLoader {
public:
    SourceLoader(Session& session, core::SourceReader& reader);
    ~SourceLoader();

    SourceLoader(const SourceLoader&) = delete;
    SourceLoader& operator=(const SourceLoader&) = delete;

    void reload_playlist(std::string source, ReloadCallback callback);
    void reload_epg(std::string source, ReloadCallback callback);

    // Request stop on every running reload
    void cancel_all();

    // Block until every started reload has reported
    void wait();

private:
    struct Worker {
        ReloadTarget target;
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void start(ReloadTarget target, std::string source, ReloadCallback callback);
    void run(std::stop_token stop, ReloadTicket ticket, const std::string& source,
             const ReloadCallback& callback);

    [[nodiscard]] ReloadOutcome load_playlist(std::stop_token stop, const ReloadTicket& ticket,
                                              const std::string& source);
    [[nodiscard]] ReloadOutcome load_epg(std::stop_token stop, const ReloadTicket& ticket,
                                         const std::string& source);

    // Outcome for a fetch or commit error
    [[nodiscard]] ReloadOutcome interrupted(const ReloadTicket& ticket, const std::string& source,
                                            core::IngestFailure failure) const;

    void reap_finished_locked();

    Session& session_;
    core::SourceReader& reader_;

    std::mutex mutex_;
    std::vector<Worker> workers_;
};

} // namespace relay::session
