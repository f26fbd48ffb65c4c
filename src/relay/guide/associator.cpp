// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/guide/associator.hpp>
#include <relay/core/log.hpp>

namespace relay::guide {

std::string_view to_string(MatchConfidence confidence) noexcept {
    switch (confidence) {
        case MatchConfidence::exact: return "exact";
        case MatchConfidence::name:  return "name";
        default:                     return "none";
    }
}

ChannelEpgBinding Associator::resolve(const model::EpgGuide& guide,
                                      const model::Channel& channel,
                                      std::uint64_t generation) {
    ChannelEpgBinding binding{channel.identifier, {}, MatchConfidence::none, generation};

    if (!channel.tvg_id.empty() && guide.channel(channel.tvg_id) != nullptr) {
        binding.epg_channel_id = channel.tvg_id;
        binding.confidence = MatchConfidence::exact;
        return binding;
    }

    for (const auto* candidate : {&channel.name, &channel.tvg_name}) {
        if (auto id = guide.find_by_name(*candidate)) {
            binding.epg_channel_id = std::move(*id);
            binding.confidence = MatchConfidence::name;
            core::logger()->debug("Channel '{}' matched EPG '{}' by name",
                channel.identifier, binding.epg_channel_id);
            return binding;
        }
    }
    return binding;
}

ChannelEpgBinding Associator::bind(const session::Dataset& dataset, const model::Channel& channel) {
    std::lock_guard lock(mutex_);

    if (dataset.generation != generation_) {
        cache_.clear();
        generation_ = dataset.generation;
    }

    if (auto it = cache_.find(channel.identifier); it != cache_.end()) {
        return it->second;
    }

    auto binding = dataset.guide ? resolve(*dataset.guide, channel, dataset.generation)
                                 : ChannelEpgBinding{channel.identifier, {}, MatchConfidence::none,
                                                     dataset.generation};
    cache_.emplace(channel.identifier, binding);
    return binding;
}

const model::ProgramSchedule* Associator::schedule(const session::Dataset& dataset,
                                                   const model::Channel& channel) {
    auto binding = bind(dataset, channel);
    if (!binding.bound() || !dataset.guide) {
        return nullptr;
    }
    return dataset.guide->schedule(binding.epg_channel_id);
}

NowNext Associator::now_next(const session::Dataset& dataset, const model::Channel& channel,
                             model::Instant t) {
    NowNext result;
    result.confidence = bind(dataset, channel).confidence;

    const auto* programs = schedule(dataset, channel);
    if (programs == nullptr) {
        return result;
    }

    if (const auto* current = programs->current_at(t)) {
        result.current = *current;
    }
    if (const auto* next = programs->next_after(t)) {
        result.next = *next;
    }
    return result;
}

std::vector<model::Program> Associator::upcoming(const session::Dataset& dataset,
                                                 const model::Channel& channel,
                                                 model::Instant t,
                                                 std::size_t limit) {
    const auto* programs = schedule(dataset, channel);
    if (programs == nullptr) {
        return {};
    }
    return programs->upcoming(t, limit);
}

void Associator::invalidate() {
    std::lock_guard lock(mutex_);
    cache_.clear();
}

std::size_t Associator::cached_bindings() const {
    std::lock_guard lock(mutex_);
    return cache_.size();
}

} // namespace relay::guide
