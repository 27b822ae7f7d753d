#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>

namespace ChainBattles {

// Default member initializers are the baseline a freshly minted token gets.
struct FullStats {
    std::uint64_t level    = 0;
    std::uint64_t health   = 10;
    std::uint64_t strength = 6;
    std::uint64_t speed    = 3;

    constexpr bool operator==(const FullStats&) const = default;
};

struct LevelStats {
    std::uint64_t level = 0;

    constexpr bool operator==(const LevelStats&) const = default;
};

/// Anything with a level that can be value-initialized to its baseline.
template<class S>
concept StatRecord =
    std::is_aggregate_v<S> &&
    std::regular<S> &&
    requires(S s) {
        { s.level } -> std::convertible_to<std::uint64_t>;
    };

/// Records that additionally carry health, strength and speed.
template<class S>
concept CombatStatRecord =
    StatRecord<S> &&
    requires(S s) {
        { s.health }   -> std::convertible_to<std::uint64_t>;
        { s.strength } -> std::convertible_to<std::uint64_t>;
        { s.speed }    -> std::convertible_to<std::uint64_t>;
    };

template<StatRecord S>
constexpr S BaselineStats() {
    return S{};
}

// Exclusive upper bounds of the per-train growth of each combat stat.
struct GrowthBounds {
    static constexpr std::uint64_t health   = 10;
    static constexpr std::uint64_t strength = 6;
    static constexpr std::uint64_t speed    = 3;
};

static_assert(StatRecord<LevelStats> && !CombatStatRecord<LevelStats>);
static_assert(CombatStatRecord<FullStats>);

} // namespace ChainBattles
