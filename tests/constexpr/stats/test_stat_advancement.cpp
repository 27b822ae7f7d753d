#include "../test_helpers.hpp"
#include <ChainBattles/stat_advancement.hpp>
#include <ChainBattles/stats.hpp>

using namespace ChainBattles;
using namespace TestHelpers;

namespace {

constexpr TrainSeed some_seed{1700000000, Address{}, 1};

}

// ============================================================================
// Baselines
// ============================================================================

static_assert(BaselineStats<FullStats>() == FullStats{0, 10, 6, 3});
static_assert(BaselineStats<LevelStats>() == LevelStats{0});

// ============================================================================
// One train step
// ============================================================================

constexpr bool test_zero_roll_only_levels_up() {
    auto after = AdvanceStats(FullStats{}, some_seed, ConstantMixer{0});
    return after && after.value() == FullStats{1, 10, 6, 3};
}
static_assert(test_zero_roll_only_levels_up());

// A single roll value is reduced separately for each bound
constexpr bool test_same_roll_per_bound() {
    auto after = AdvanceStats(FullStats{}, some_seed, ConstantMixer{7});
    return after && after.value() == FullStats{1, 10 + 7, 6 + 1, 3 + 1};
}
static_assert(test_same_roll_per_bound());

constexpr bool test_largest_growth() {
    auto after = AdvanceStats(FullStats{4, 20, 10, 5}, some_seed, MaxMixer{});
    return after && after.value() == FullStats{5, 29, 15, 7};
}
static_assert(test_largest_growth());

constexpr bool test_level_only_ignores_mixer() {
    auto after = AdvanceStats(LevelStats{41}, some_seed, FailingMixer{});
    return after && after.value() == LevelStats{42};
}
static_assert(test_level_only_ignores_mixer());

constexpr bool test_failing_mixer() {
    auto after = AdvanceStats(FullStats{}, some_seed, FailingMixer{});
    return !after && after.error() == RegistryError::SEED_DERIVATION_FAILED;
}
static_assert(test_failing_mixer());

// A mixer that returns bound or more breaks its contract
struct OutOfRangeMixer {
    constexpr std::optional<std::uint64_t> roll(const TrainSeed&, std::uint64_t bound) const {
        return bound;
    }
};

constexpr bool test_out_of_range_roll_rejected() {
    auto after = AdvanceStats(FullStats{}, some_seed, OutOfRangeMixer{});
    return !after && after.error() == RegistryError::SEED_DERIVATION_FAILED;
}
static_assert(test_out_of_range_roll_rejected());

// ============================================================================
// Determinism and bounds over many steps
// ============================================================================

constexpr bool test_repeatable() {
    const TrainSeed seed{1700000123, Address{}, 77};
    auto a = AdvanceStats(FullStats{3, 30, 12, 6}, seed, ByteSumMixer{});
    auto b = AdvanceStats(FullStats{3, 30, 12, 6}, seed, ByteSumMixer{});
    return a && b && a.value() == b.value();
}
static_assert(test_repeatable());

constexpr bool test_bounded_deltas_over_many_trains() {
    FullStats s{};
    for (std::uint64_t t = 0; t < 200; ++t) {
        const TrainSeed seed{1700000000 + t * 13, Address{}, t % 5 + 1};
        auto next = AdvanceStats(s, seed, ByteSumMixer{});
        if (!next) return false;
        const auto & n = next.value();
        if (n.level != s.level + 1) return false;
        if (n.health < s.health || n.health - s.health > 9) return false;
        if (n.strength < s.strength || n.strength - s.strength > 5) return false;
        if (n.speed < s.speed || n.speed - s.speed > 2) return false;
        s = n;
    }
    return s.level == 200;
}
static_assert(test_bounded_deltas_over_many_trains());
