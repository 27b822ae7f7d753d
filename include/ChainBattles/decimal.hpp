#pragma once

#include <cstddef>
#include <string>
#include <type_traits>

namespace ChainBattles {

// Enough for any 64-bit integer with sign.
inline constexpr std::size_t NumberBufSize = 24;

// -------------------------
//  Format decimal integer
// -------------------------
// Writes the base-10 representation of value into [first, last): no leading
// zeros, no grouping. Returns pointer one past the last written char.
// Caller guarantees the buffer holds NumberBufSize chars.
template <class Int>
constexpr char* format_decimal_integer(Int value, char* first, char* last) noexcept {
    static_assert(std::is_integral_v<Int>, "[[[ ChainBattles ]]] Int must be an integral type");

    char* p = last;

    using Unsigned = std::make_unsigned_t<Int>;
    Unsigned u;
    bool negative = false;

    if constexpr (std::is_signed_v<Int>) {
        if (value < 0) {
            negative = true;
            // avoids UB for min()
            u = Unsigned(-(value + 1)) + 1u;
        } else {
            u = static_cast<Unsigned>(value);
        }
    } else {
        u = static_cast<Unsigned>(value);
    }

    do {
        *--p = static_cast<char>('0' + static_cast<unsigned>(u % 10u));
        u /= 10u;
    } while (u != 0 && p != first);

    if (negative && p != first) {
        *--p = '-';
    }

    const std::size_t len = static_cast<std::size_t>(last - p);
    for (std::size_t i = 0; i < len; ++i)
        first[i] = p[i];
    return first + len;
}

template <class Int>
constexpr std::string ToDecimalString(Int value) {
    char buf[NumberBufSize];
    char* end = format_decimal_integer(value, buf, buf + sizeof(buf));
    return std::string(buf, end);
}

} // namespace ChainBattles
