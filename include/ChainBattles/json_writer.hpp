#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

#include "decimal.hpp"
#include "io.hpp"
#include "writer_concept.hpp"

namespace ChainBattles {

enum class JsonWriterError {
    NO_ERROR,
    OUTPUT_OVERFLOW
};

constexpr std::string_view error_to_string(JsonWriterError e) {
    switch(e) {
    case JsonWriterError::NO_ERROR: return "NO_ERROR"; break;
    case JsonWriterError::OUTPUT_OVERFLOW: return "OUTPUT_OVERFLOW"; break;
    }
    return "N/A";
}

// Compact JSON emitter over an output iterator: no whitespace between tokens,
// so equal models always produce byte-identical documents.
template<class It, class Sent>
class JsonIteratorWriter {
public:
    using iterator_type = It;
    using error_type = JsonWriterError;
    struct ArrayFrame {};
    struct MapFrame {};

    constexpr JsonIteratorWriter(It first, Sent last)
        : m_current(first), m_end(last) {}

    constexpr JsonWriterError getError() const {
        return m_error;
    }
    constexpr It current() const {
        return m_current;
    }

    constexpr bool write_array_begin(ArrayFrame&) {
        return put('[');
    }
    constexpr bool write_map_begin(MapFrame&) {
        return put('{');
    }
    constexpr bool advance_after_value(ArrayFrame&) {
        return put(',');
    }
    constexpr bool advance_after_value(MapFrame&) {
        return put(',');
    }
    constexpr bool move_to_value(MapFrame&) {
        return put(':');
    }
    constexpr bool write_array_end(ArrayFrame&) {
        return put(']');
    }
    constexpr bool write_map_end(MapFrame&) {
        return put('}');
    }

    constexpr bool write_null() {
        return write_literal("null");
    }
    constexpr bool write_bool(const bool & v) {
        return write_literal(v ? "true" : "false");
    }

    template<class NumberT>
        requires std::is_integral_v<NumberT>
    constexpr bool write_number(const NumberT & v) {
        char buf[NumberBufSize];
        char* p = format_decimal_integer<NumberT>(v, buf, buf + sizeof(buf));
        for (char* it = buf; it != p; ++it) {
            if (!put(*it)) return false;
        }
        return true;
    }

    constexpr bool write_string(const char* data, std::size_t size) {
        constexpr char hex[] = "0123456789abcdef";
        if (!put('"')) return false;
        for (std::size_t i = 0; i < size; ++i) {
            const char c = data[i];
            const auto uc = static_cast<unsigned char>(c);
            bool ok = true;
            switch (c) {
            case '"':  ok = put('\\') && put('"');  break;
            case '\\': ok = put('\\') && put('\\'); break;
            case '\b': ok = put('\\') && put('b');  break;
            case '\f': ok = put('\\') && put('f');  break;
            case '\n': ok = put('\\') && put('n');  break;
            case '\r': ok = put('\\') && put('r');  break;
            case '\t': ok = put('\\') && put('t');  break;
            default:
                if (uc < 0x20) {
                    ok = put('\\') && put('u') && put('0') && put('0')
                         && put(hex[(uc >> 4) & 0xF]) && put(hex[uc & 0xF]);
                } else {
                    ok = put(c);
                }
                break;
            }
            if (!ok) return false;
        }
        return put('"');
    }

    constexpr bool write_literal(std::string_view lit) {
        for (char c : lit) {
            if (!put(c)) return false;
        }
        return true;
    }

private:
    constexpr bool put(char c) {
        if (m_current == m_end) {
            m_error = JsonWriterError::OUTPUT_OVERFLOW;
            return false;
        }
        *m_current = c;
        ++m_current;
        return true;
    }

    JsonWriterError m_error = JsonWriterError::NO_ERROR;
    It m_current;
    Sent m_end;
};

static_assert(ChainBattles::writer::WriterLike<JsonIteratorWriter<char*, char*>>);

} // namespace ChainBattles
