// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relay::model {

using Instant = std::chrono::sys_seconds;

// One EPG broadcast. Invariant: start < stop (both UTC).
struct Program {
    std::string channel_id;        // EPG channel id, not a playlist identifier
    std::string title;
    Instant start;
    Instant stop;
    std::string subtitle;
    std::string description;
    std::vector<std::string> categories;
    std::string icon;

    [[nodiscard]] std::chrono::minutes duration() const noexcept {
        return std::chrono::duration_cast<std::chrono::minutes>(stop - start);
    }

    [[nodiscard]] bool airs_at(Instant t) const noexcept { return start <= t && t < stop; }

    bool operator==(const Program&) const = default;
};

// <channel> declaration of an XMLTV document
struct EpgChannel {
    std::string id;
    std::vector<std::string> display_names;
    std::string icon;

    bool operator==(const EpgChannel&) const = default;
};

// Programs of one EPG channel in chronological order
class ProgramSchedule {
public:
    ProgramSchedule() = default;
    explicit ProgramSchedule(std::vector<Program> programs);

    [[nodiscard]] const std::vector<Program>& programs() const noexcept { return programs_; }
    [[nodiscard]] std::size_t size() const noexcept { return programs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return programs_.empty(); }

    // Program airing at t; with overlapping entries the latest start wins
    [[nodiscard]] const Program* current_at(Instant t) const noexcept;

    // First program starting strictly after t
    [[nodiscard]] const Program* next_after(Instant t) const noexcept;

    // Programs still running or yet to start at t, in start order
    [[nodiscard]] std::vector<Program> upcoming(Instant t, std::size_t limit) const;

    bool operator==(const ProgramSchedule& other) const { return programs_ == other.programs_; }

private:
    // Index of the first program with start > t
    [[nodiscard]] std::size_t first_after(Instant t) const noexcept;

    std::vector<Program> programs_;
    std::vector<Instant> max_stop_;    // max_stop_[i] = max(stop) over programs_[0..i]
};

// Parsed XMLTV guide
class EpgGuide {
public:
    EpgGuide() = default;

    void add_channel(EpgChannel channel);
    void add_program(Program program);

    // Sorts every schedule and builds the name index. Call once after the last add.
    void finalize();

    [[nodiscard]] const EpgChannel* channel(std::string_view id) const noexcept;
    [[nodiscard]] const ProgramSchedule* schedule(std::string_view id) const noexcept;

    // EPG channel id whose display name (or id) normalizes to the same text
    [[nodiscard]] std::optional<std::string> find_by_name(std::string_view name) const;

    [[nodiscard]] const std::map<std::string, EpgChannel, std::less<>>& channels() const noexcept {
        return channels_;
    }
    [[nodiscard]] std::size_t channel_count() const noexcept { return channels_.size(); }
    [[nodiscard]] std::size_t program_count() const noexcept;

    bool operator==(const EpgGuide& other) const {
        return channels_ == other.channels_ && schedules_ == other.schedules_;
    }

private:
    std::map<std::string, EpgChannel, std::less<>> channels_;
    std::map<std::string, ProgramSchedule, std::less<>> schedules_;
    std::map<std::string, std::vector<Program>, std::less<>> pending_;
    std::unordered_map<std::string, std::string> name_index_;
};

} // namespace relay::model
