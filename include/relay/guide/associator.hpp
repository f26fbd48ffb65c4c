// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/config.hpp>
#include <relay/model/channel.hpp>
#include <relay/model/program.hpp>
#include <relay/session/session.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relay::guide {

enum class MatchConfidence : std::uint8_t {
    none,      // No EPG channel found
    exact,     // tvg-id equals an EPG channel id
    name,      // Normalized display name matched
};

[[nodiscard]] std::string_view to_string(MatchConfidence confidence) noexcept;

struct ChannelEpgBinding {
    std::string channel_identifier;
    std::string epg_channel_id;          // Empty when confidence is none
    MatchConfidence confidence{MatchConfidence::none};
    std::uint64_t generation{0};         // Dataset generation it was resolved against

    [[nodiscard]] bool bound() const noexcept { return confidence != MatchConfidence::none; }
};

struct NowNext {
    std::optional<model::Program> current;
    std::optional<model::Program> next;
    MatchConfidence confidence{MatchConfidence::none};
};

// Joins playlist channels to EPG schedules. Bindings are cached per channel
// identifier for one dataset generation; a query against any other generation
// drops the whole cache first. Thread-safe.
class Associator {
public:
    Associator() = default;

    Associator(const Associator&) = delete;
    Associator& operator=(const Associator&) = delete;

    [[nodiscard]] ChannelEpgBinding bind(const session::Dataset& dataset, const model::Channel& channel);

    // Program airing at t (start <= t < stop) and the first one starting after t
    [[nodiscard]] NowNext now_next(const session::Dataset& dataset, const model::Channel& channel,
                                   model::Instant t);

    // Programs with stop > t in start order, current one included
    [[nodiscard]] std::vector<model::Program> upcoming(const session::Dataset& dataset,
                                                       const model::Channel& channel,
                                                       model::Instant t,
                                                       std::size_t limit = core::UPCOMING_PROGRAMS);

    // Full schedule of the bound EPG channel; points into dataset.guide
    [[nodiscard]] const model::ProgramSchedule* schedule(const session::Dataset& dataset,
                                                         const model::Channel& channel);

    void invalidate();

    [[nodiscard]] std::size_t cached_bindings() const;

private:
    [[nodiscard]] static ChannelEpgBinding resolve(const model::EpgGuide& guide,
                                                   const model::Channel& channel,
                                                   std::uint64_t generation);

    mutable std::mutex mutex_;
    std::uint64_t generation_{0};
    std::unordered_map<std::string, ChannelEpgBinding> cache_;
};

} // namespace relay::guide
