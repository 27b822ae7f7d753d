#pragma once

#include <cstdint>

#include "errors.hpp"
#include "stats.hpp"
#include "train_seed.hpp"

namespace ChainBattles {

namespace advancement_details {

template<mixer::SeedMixerLike Mixer>
constexpr bool AddRoll(std::uint64_t & stat, const Mixer & mixer, const TrainSeed & seed, std::uint64_t bound) {
    const auto delta = mixer.roll(seed, bound);
    if (!delta || *delta >= bound) {
        return false;
    }
    stat += *delta;
    return true;
}

} // namespace advancement_details

/// One train step: level goes up by one and, for combat records, health,
/// strength and speed each grow by a roll below their GrowthBounds. The mixer
/// is consulted once per stat with the same seed.
template<StatRecord S, mixer::SeedMixerLike Mixer>
constexpr RegistryResult<S> AdvanceStats(const S & before, const TrainSeed & seed, const Mixer & mixer) {
    S after = before;
    after.level += 1;

    if constexpr (CombatStatRecord<S>) {
        using advancement_details::AddRoll;
        if (!AddRoll(after.health, mixer, seed, GrowthBounds::health)
            || !AddRoll(after.strength, mixer, seed, GrowthBounds::strength)
            || !AddRoll(after.speed, mixer, seed, GrowthBounds::speed)) {
            return RegistryError::SEED_DERIVATION_FAILED;
        }
    }
    return after;
}

} // namespace ChainBattles
