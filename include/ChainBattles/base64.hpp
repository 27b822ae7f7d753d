#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

#include "io.hpp"

namespace ChainBattles {

enum class Base64Error {
    NO_ERROR,
    OUTPUT_OVERFLOW,
    INVALID_CHARACTER,
    INVALID_LENGTH,
    INVALID_PADDING
};

constexpr std::string_view error_to_string(Base64Error e) {
    switch(e) {
    case Base64Error::NO_ERROR: return "NO_ERROR"; break;
    case Base64Error::OUTPUT_OVERFLOW: return "OUTPUT_OVERFLOW"; break;
    case Base64Error::INVALID_CHARACTER: return "INVALID_CHARACTER"; break;
    case Base64Error::INVALID_LENGTH: return "INVALID_LENGTH"; break;
    case Base64Error::INVALID_PADDING: return "INVALID_PADDING"; break;
    }
    return "N/A";
}

template <CharOutputIterator OutIter>
class Base64Result {
    Base64Error m_error = Base64Error::NO_ERROR;
    OutIter m_pos;
    std::size_t m_inputOffset = 0;
public:
    constexpr Base64Result(Base64Error err, OutIter pos, std::size_t inputOffset):
        m_error(err), m_pos(pos), m_inputOffset(inputOffset)
    {}
    constexpr operator bool() const {
        return m_error == Base64Error::NO_ERROR;
    }
    constexpr Base64Error error() const {
        return m_error;
    }
    constexpr OutIter pos() const {
        return m_pos;
    }
    // Offset into the input where processing stopped.
    constexpr std::size_t inputOffset() const {
        return m_inputOffset;
    }
};

constexpr std::size_t EncodedBase64Size(std::size_t inputSize) {
    return (inputSize + 2) / 3 * 4;
}

namespace base64_details {

inline constexpr std::string_view alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline constexpr std::uint8_t invalid_sextet = 0xFF;

constexpr std::array<std::uint8_t, 256> make_reverse_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto & v : table) v = invalid_sextet;
    for (std::size_t i = 0; i < alphabet.size(); ++i) {
        table[static_cast<unsigned char>(alphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

inline constexpr std::array<std::uint8_t, 256> reverse_table = make_reverse_table();

template <class It, class Sent>
struct Emitter {
    It m_current;
    Sent m_end;

    constexpr bool put(char c) {
        if (m_current == m_end) return false;
        *m_current = c;
        ++m_current;
        return true;
    }
};

// Encodes the group of up to three bytes starting at input[i] into four chars,
// padding with '=' when the group is short.
constexpr std::array<char, 4> encode_group(std::string_view input, std::size_t i) {
    const std::size_t n = input.size() - i < 3 ? input.size() - i : 3;
    std::uint32_t triple = std::uint32_t(static_cast<unsigned char>(input[i])) << 16;
    if (n > 1) triple |= std::uint32_t(static_cast<unsigned char>(input[i + 1])) << 8;
    if (n > 2) triple |= std::uint32_t(static_cast<unsigned char>(input[i + 2]));
    return {
        alphabet[(triple >> 18) & 0x3F],
        alphabet[(triple >> 12) & 0x3F],
        n > 1 ? alphabet[(triple >> 6) & 0x3F] : '=',
        n > 2 ? alphabet[triple & 0x3F] : '='
    };
}

} // namespace base64_details

// RFC 4648 base64 with '=' padding.
template <CharOutputIterator It, CharSentinelForOut<It> Sent>
constexpr Base64Result<It> EncodeBase64(std::string_view input, It out, const Sent & end) {
    base64_details::Emitter<It, Sent> em{out, end};

    for (std::size_t i = 0; i < input.size(); i += 3) {
        for (char c : base64_details::encode_group(input, i)) {
            if (!em.put(c)) {
                return Base64Result<It>(Base64Error::OUTPUT_OVERFLOW, em.m_current, i);
            }
        }
    }
    return Base64Result<It>(Base64Error::NO_ERROR, em.m_current, input.size());
}

// Unbounded variant: appends to out.
constexpr void AppendBase64(std::string_view input, std::string & out) {
    out.reserve(out.size() + EncodedBase64Size(input.size()));
    for (std::size_t i = 0; i < input.size(); i += 3) {
        const auto group = base64_details::encode_group(input, i);
        out.append(group.data(), group.size());
    }
}

constexpr std::string EncodeBase64(std::string_view input) {
    std::string out;
    AppendBase64(input, out);
    return out;
}

// Strict decoder: length must be a multiple of four, padding only at the end,
// unused trailing bits must be zero.
template <CharOutputIterator It, CharSentinelForOut<It> Sent>
constexpr Base64Result<It> DecodeBase64(std::string_view input, It out, const Sent & end) {
    using base64_details::reverse_table;
    using base64_details::invalid_sextet;
    base64_details::Emitter<It, Sent> em{out, end};

    if (input.size() % 4 != 0) {
        return Base64Result<It>(Base64Error::INVALID_LENGTH, em.m_current, 0);
    }

    for (std::size_t i = 0; i < input.size(); i += 4) {
        const bool last = i + 4 == input.size();
        std::size_t padding = 0;
        std::uint32_t quad = 0;

        for (std::size_t k = 0; k < 4; ++k) {
            const char c = input[i + k];
            if (c == '=') {
                // only the last two slots of the final quartet may be padding
                if (!last || k < 2) {
                    return Base64Result<It>(Base64Error::INVALID_PADDING, em.m_current, i + k);
                }
                ++padding;
                quad <<= 6;
                continue;
            }
            if (padding != 0) {
                return Base64Result<It>(Base64Error::INVALID_PADDING, em.m_current, i + k);
            }
            const std::uint8_t sextet = reverse_table[static_cast<unsigned char>(c)];
            if (sextet == invalid_sextet) {
                return Base64Result<It>(Base64Error::INVALID_CHARACTER, em.m_current, i + k);
            }
            quad = (quad << 6) | sextet;
        }

        if ((padding == 1 && (quad & 0xFF) != 0) ||
            (padding == 2 && (quad & 0xFFFF) != 0)) {
            return Base64Result<It>(Base64Error::INVALID_PADDING, em.m_current, i);
        }

        bool ok = em.put(static_cast<char>((quad >> 16) & 0xFF));
        if (ok && padding < 2) ok = em.put(static_cast<char>((quad >> 8) & 0xFF));
        if (ok && padding < 1) ok = em.put(static_cast<char>(quad & 0xFF));
        if (!ok) {
            return Base64Result<It>(Base64Error::OUTPUT_OVERFLOW, em.m_current, i);
        }
    }
    return Base64Result<It>(Base64Error::NO_ERROR, em.m_current, input.size());
}

constexpr auto DecodeBase64(std::string_view input, std::string & out) {
    return DecodeBase64(input, std::back_inserter(out), io_details::limitless_sentinel{});
}

} // namespace ChainBattles
