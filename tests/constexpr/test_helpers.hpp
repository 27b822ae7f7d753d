#pragma once

#include <ChainBattles/base64.hpp>
#include <ChainBattles/data_uri.hpp>
#include <ChainBattles/serializer.hpp>
#include <ChainBattles/train_seed.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TestHelpers {

// ============================================================================
// Serialize Helpers
// ============================================================================

/// One-line serialize test: TestSerialize(obj, expected_json)
template<typename T>
constexpr bool TestSerialize(const T& obj, std::string_view expected_json) {
    std::string result;
    if (!ChainBattles::Serialize(obj, result)) {
        return false;
    }
    return result == expected_json;
}

/// Serialize into a fixed buffer of Size bytes and expect the writer to run out
template<std::size_t Size, typename T>
constexpr bool SerializeOverflows(const T& obj) {
    char buf[Size + 1] = {};
    auto result = ChainBattles::Serialize(obj, buf, buf + Size);
    return !result
        && result.error() == ChainBattles::SerializeError::WRITER_ERROR
        && result.writerError() == ChainBattles::JsonWriterError::OUTPUT_OVERFLOW;
}

// ============================================================================
// Base64 Helpers
// ============================================================================

constexpr bool TestBase64Encode(std::string_view raw, std::string_view expected) {
    return ChainBattles::EncodeBase64(raw) == expected;
}

constexpr bool TestBase64Decode(std::string_view encoded, std::string_view expected) {
    std::string out;
    if (!ChainBattles::DecodeBase64(encoded, out)) {
        return false;
    }
    return out == expected;
}

constexpr bool TestBase64DecodeError(std::string_view encoded, ChainBattles::Base64Error expected) {
    std::string out;
    auto res = ChainBattles::DecodeBase64(encoded, out);
    return !res && res.error() == expected;
}

// ============================================================================
// Data URI Helpers
// ============================================================================

/// Decode uri with envelope Uri and compare the payload
template<class Uri>
constexpr bool TestDataUriDecode(std::string_view uri, std::string_view expected_payload) {
    std::string payload;
    if (!Uri::Decode(uri, payload)) {
        return false;
    }
    return payload == expected_payload;
}

template<class Uri>
constexpr bool TestDataUriError(std::string_view uri, ChainBattles::DataUriError expected) {
    std::string payload = "untouched";
    auto res = Uri::Decode(uri, payload);
    return !res && res.error() == expected && payload.empty();
}

// ============================================================================
// Mixers
// ============================================================================

/// Returns a fixed value reduced modulo the bound, whatever the seed.
struct ConstantMixer {
    std::uint64_t value = 0;
    constexpr std::optional<std::uint64_t> roll(const ChainBattles::TrainSeed&, std::uint64_t bound) const {
        return value % bound;
    }
};

/// Uses the largest allowed roll: bound - 1.
struct MaxMixer {
    constexpr std::optional<std::uint64_t> roll(const ChainBattles::TrainSeed&, std::uint64_t bound) const {
        return bound - 1;
    }
};

/// Cannot derive anything.
struct FailingMixer {
    constexpr std::optional<std::uint64_t> roll(const ChainBattles::TrainSeed&, std::uint64_t) const {
        return std::nullopt;
    }
};

/// Sum of the packed seed bytes, so the roll depends on every seed field.
struct ByteSumMixer {
    constexpr std::optional<std::uint64_t> roll(const ChainBattles::TrainSeed& seed, std::uint64_t bound) const {
        std::uint64_t sum = 0;
        for (auto b : seed.packed()) {
            sum += b;
        }
        return sum % bound;
    }
};

static_assert(ChainBattles::mixer::SeedMixerLike<ConstantMixer>);
static_assert(ChainBattles::mixer::SeedMixerLike<MaxMixer>);
static_assert(ChainBattles::mixer::SeedMixerLike<FailingMixer>);
static_assert(ChainBattles::mixer::SeedMixerLike<ByteSumMixer>);

} // namespace TestHelpers
