// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/model/program.hpp>
#include <relay/model/channel.hpp>
#include <algorithm>

namespace relay::model {

//=============================================================================
// ProgramSchedule
//=============================================================================

ProgramSchedule::ProgramSchedule(std::vector<Program> programs)
    : programs_(std::move(programs)) {
    std::stable_sort(programs_.begin(), programs_.end(),
        [](const Program& a, const Program& b) { return a.start < b.start; });

    max_stop_.reserve(programs_.size());
    for (const auto& program : programs_) {
        max_stop_.push_back(max_stop_.empty() ? program.stop : std::max(max_stop_.back(), program.stop));
    }
}

std::size_t ProgramSchedule::first_after(Instant t) const noexcept {
    auto it = std::upper_bound(programs_.begin(), programs_.end(), t,
        [](Instant value, const Program& p) { return value < p.start; });
    return static_cast<std::size_t>(it - programs_.begin());
}

const Program* ProgramSchedule::current_at(Instant t) const noexcept {
    // Walk back from the last program starting at or before t. Once no earlier
    // program can still be running (running max of stop <= t) the search ends.
    for (std::size_t i = first_after(t); i > 0; --i) {
        const auto& candidate = programs_[i - 1];
        if (max_stop_[i - 1] <= t) {
            break;
        }
        if (candidate.stop > t) {
            return &candidate;
        }
    }
    return nullptr;
}

const Program* ProgramSchedule::next_after(Instant t) const noexcept {
    auto index = first_after(t);
    return index < programs_.size() ? &programs_[index] : nullptr;
}

std::vector<Program> ProgramSchedule::upcoming(Instant t, std::size_t limit) const {
    std::vector<Program> result;
    if (limit == 0) return result;

    // Everything before the first program whose running max passes t has ended
    auto begin = std::upper_bound(max_stop_.begin(), max_stop_.end(), t);
    for (auto i = static_cast<std::size_t>(begin - max_stop_.begin()); i < programs_.size(); ++i) {
        if (programs_[i].stop > t) {
            result.push_back(programs_[i]);
            if (result.size() == limit) break;
        }
    }
    return result;
}

//=============================================================================
// EpgGuide
//=============================================================================

void EpgGuide::add_channel(EpgChannel channel) {
    for (const auto& name : channel.display_names) {
        name_index_.try_emplace(normalize_name(name), channel.id);
    }

    auto it = channels_.find(channel.id);
    if (it == channels_.end()) {
        channels_.emplace(channel.id, std::move(channel));
        return;
    }

    // Repeated declaration: merge names, keep the first icon
    auto& existing = it->second;
    for (auto& name : channel.display_names) {
        if (std::find(existing.display_names.begin(), existing.display_names.end(), name)
            == existing.display_names.end()) {
            existing.display_names.push_back(std::move(name));
        }
    }
    if (existing.icon.empty()) {
        existing.icon = std::move(channel.icon);
    }
}

void EpgGuide::add_program(Program program) {
    auto key = program.channel_id;
    pending_[key].push_back(std::move(program));
}

void EpgGuide::finalize() {
    for (auto& [id, programs] : pending_) {
        if (!channels_.contains(id)) {
            channels_.emplace(id, EpgChannel{id, {}, {}});
        }

        auto it = schedules_.find(id);
        if (it != schedules_.end()) {
            auto merged = it->second.programs();
            merged.insert(merged.end(),
                          std::make_move_iterator(programs.begin()),
                          std::make_move_iterator(programs.end()));
            it->second = ProgramSchedule(std::move(merged));
        } else {
            schedules_.emplace(id, ProgramSchedule(std::move(programs)));
        }
    }
    pending_.clear();

    // Ids are matchable names too; display names declared earlier take precedence
    for (const auto& [id, channel] : channels_) {
        name_index_.try_emplace(normalize_name(id), id);
    }
}

const EpgChannel* EpgGuide::channel(std::string_view id) const noexcept {
    auto it = channels_.find(id);
    return it != channels_.end() ? &it->second : nullptr;
}

const ProgramSchedule* EpgGuide::schedule(std::string_view id) const noexcept {
    auto it = schedules_.find(id);
    return it != schedules_.end() ? &it->second : nullptr;
}

std::optional<std::string> EpgGuide::find_by_name(std::string_view name) const {
    auto key = normalize_name(name);
    if (key.empty()) return std::nullopt;

    auto it = name_index_.find(key);
    if (it == name_index_.end()) return std::nullopt;
    return it->second;
}

std::size_t EpgGuide::program_count() const noexcept {
    std::size_t total = 0;
    for (const auto& [id, schedule] : schedules_) {
        total += schedule.size();
    }
    return total;
}

} // namespace relay::model
