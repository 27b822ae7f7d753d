#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ChainBattles {

// Literal usable as a non-type template parameter: JSON keys, media types.
template <typename CharT, std::size_t N> struct ConstString
{
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;

    constexpr ConstString(const CharT (&literal)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = literal[i];
        }
    }

    // printable ASCII only, no quotes or backslashes
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            const auto c = std::uint8_t(m_data[i]);
            if(c < 0x20 || c > 0x7e || c == '"' || c == '\\') return false;
        }
        return true;
    }

    constexpr std::string_view toStringView() const {
        return {&m_data[0], N};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

} // namespace ChainBattles
