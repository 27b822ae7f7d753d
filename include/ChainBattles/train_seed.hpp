#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "address.hpp"
#include "decimal.hpp"

namespace ChainBattles {

/// Ambient facts about the train call, passed in explicitly.
struct TrainContext {
    std::uint64_t timestamp = 0;
    // Account that originated the transaction. Recorded for callers; the
    // stat derivation uses the direct caller instead.
    Address origin{};
};

/// Material a train roll is derived from.
struct TrainSeed {
    std::uint64_t timestamp = 0;
    Address caller{};
    TokenId token_id = 0;

    // timestamp as a 32-byte big-endian word, the 20 caller bytes, then the
    // decimal text of the token id.
    constexpr std::vector<std::uint8_t> packed() const {
        std::vector<std::uint8_t> bytes(32, 0);
        for (std::size_t i = 0; i < 8; ++i) {
            bytes[31 - i] = static_cast<std::uint8_t>((timestamp >> (8 * i)) & 0xFF);
        }
        bytes.insert(bytes.end(), caller.bytes.begin(), caller.bytes.end());

        char buf[NumberBufSize];
        char* end = format_decimal_integer(token_id, buf, buf + sizeof(buf));
        for (char* it = buf; it != end; ++it) {
            bytes.push_back(static_cast<std::uint8_t>(*it));
        }
        return bytes;
    }

    constexpr bool operator==(const TrainSeed&) const = default;
};

// Largest bound ReduceDigest accepts without intermediate overflow.
inline constexpr std::uint64_t MaxRollBound = std::uint64_t(1) << 48;

/// Reads digest as a big-endian unsigned integer and returns it modulo bound.
template<std::size_t N>
constexpr std::uint64_t ReduceDigest(const std::array<std::uint8_t, N> & digest, std::uint64_t bound) {
    std::uint64_t r = 0;
    for (auto b : digest) {
        r = (r * 256 + b) % bound;
    }
    return r;
}

namespace mixer {

/// Deterministic function of (seed, bound) into [0, bound). nullopt when the
/// value cannot be derived.
template<typename M>
concept SeedMixerLike = requires(const M& m, const TrainSeed& seed, std::uint64_t bound) {
    { m.roll(seed, bound) } -> std::same_as<std::optional<std::uint64_t>>;
};

} // namespace mixer

} // namespace ChainBattles
