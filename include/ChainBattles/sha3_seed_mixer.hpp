#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include <openssl/evp.h>

#include "train_seed.hpp"

namespace ChainBattles {

/// SHA3-256 over the packed seed, reduced modulo the bound. Every roll hashes
/// the seed again, so rolls with the same seed are correlated.
class Sha3SeedMixer {
public:
    static constexpr std::size_t DigestSize = 32;

    std::optional<std::array<std::uint8_t, DigestSize>> digest(const TrainSeed & seed) const {
        const auto bytes = seed.packed();
        std::array<std::uint8_t, DigestSize> out{};
        unsigned int len = 0;
        if (EVP_Digest(bytes.data(), bytes.size(), out.data(), &len, EVP_sha3_256(), nullptr) != 1
            || len != DigestSize) {
            return std::nullopt;
        }
        return out;
    }

    std::optional<std::uint64_t> roll(const TrainSeed & seed, std::uint64_t bound) const {
        if (bound == 0 || bound > MaxRollBound) {
            return std::nullopt;
        }
        const auto d = digest(seed);
        if (!d) {
            return std::nullopt;
        }
        return ReduceDigest(*d, bound);
    }
};

static_assert(mixer::SeedMixerLike<Sha3SeedMixer>);

} // namespace ChainBattles
