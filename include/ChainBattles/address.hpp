#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ChainBattles {

using TokenId = std::uint64_t;

// 20-byte account identity of a caller or owner.
struct Address {
    static constexpr std::size_t Size = 20;
    std::array<std::uint8_t, Size> bytes{};

    constexpr bool isZero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr auto operator<=>(const Address&) const = default;
    constexpr bool operator==(const Address&) const = default;
};

namespace address_details {

constexpr int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace address_details

/// Parses "0x" followed by exactly 40 hex digits, any case.
constexpr std::optional<Address> ParseAddress(std::string_view text) {
    if (text.size() != 2 + 2 * Address::Size || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }
    text.remove_prefix(2);

    Address a;
    for (std::size_t i = 0; i < Address::Size; ++i) {
        const int hi = address_details::hex_value(text[2 * i]);
        const int lo = address_details::hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        a.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return a;
}

/// Lowercase "0x"-prefixed form.
constexpr std::string ToHex(const Address & a) {
    constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + 2 * Address::Size);
    for (auto b : a.bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0xF]);
    }
    return out;
}

} // namespace ChainBattles
