#include "../test_helpers.hpp"
#include <ChainBattles/base64.hpp>
#include <string>
#include <string_view>

using namespace ChainBattles;
using namespace TestHelpers;

// ============================================================================
// Encoding: RFC 4648 test vectors
// ============================================================================

static_assert(TestBase64Encode("", ""));
static_assert(TestBase64Encode("f", "Zg=="));
static_assert(TestBase64Encode("fo", "Zm8="));
static_assert(TestBase64Encode("foo", "Zm9v"));
static_assert(TestBase64Encode("foob", "Zm9vYg=="));
static_assert(TestBase64Encode("fooba", "Zm9vYmE="));
static_assert(TestBase64Encode("foobar", "Zm9vYmFy"));

// High bytes and both extra alphabet characters
static_assert(TestBase64Encode(std::string_view("\xfb\xff\xbf", 3), "+/+/"));
static_assert(TestBase64Encode(std::string_view("\0\0\0", 3), "AAAA"));

static_assert(EncodedBase64Size(0) == 0);
static_assert(EncodedBase64Size(1) == 4);
static_assert(EncodedBase64Size(3) == 4);
static_assert(EncodedBase64Size(4) == 8);

constexpr bool test_append_keeps_prefix() {
    std::string out = "data:";
    AppendBase64("foo", out);
    return out == "data:Zm9v";
}
static_assert(test_append_keeps_prefix());

constexpr bool test_encode_into_bounded_buffer() {
    char buf[8] = {};
    auto res = EncodeBase64("foobar", buf, buf + 8);
    return res && res.pos() == buf + 8 && std::string_view(buf, 8) == "Zm9vYmFy";
}
static_assert(test_encode_into_bounded_buffer());

constexpr bool test_encode_overflow() {
    char buf[6] = {};
    auto res = EncodeBase64("foobar", buf, buf + 6);
    return !res && res.error() == Base64Error::OUTPUT_OVERFLOW && res.inputOffset() == 3;
}
static_assert(test_encode_overflow());

// ============================================================================
// Decoding
// ============================================================================

static_assert(TestBase64Decode("", ""));
static_assert(TestBase64Decode("Zg==", "f"));
static_assert(TestBase64Decode("Zm8=", "fo"));
static_assert(TestBase64Decode("Zm9vYmFy", "foobar"));
static_assert(TestBase64Decode("+/+/", std::string_view("\xfb\xff\xbf", 3)));

static_assert(TestBase64DecodeError("Zg=", Base64Error::INVALID_LENGTH));
static_assert(TestBase64DecodeError("Zm9vY", Base64Error::INVALID_LENGTH));
static_assert(TestBase64DecodeError("Zm9v!mFy", Base64Error::INVALID_CHARACTER));
static_assert(TestBase64DecodeError("Zm9 YmFy", Base64Error::INVALID_CHARACTER));
// URL-safe alphabet is not accepted
static_assert(TestBase64DecodeError("-_-_", Base64Error::INVALID_CHARACTER));
// padding in the middle of the input
static_assert(TestBase64DecodeError("Zg==Zm9v", Base64Error::INVALID_PADDING));
// '=' in the first two slots of a quartet
static_assert(TestBase64DecodeError("Z===", Base64Error::INVALID_PADDING));
// data after padding inside the last quartet
static_assert(TestBase64DecodeError("Zg=a", Base64Error::INVALID_PADDING));
// non-zero unused bits: "Zh==" would decode to 'f' as well
static_assert(TestBase64DecodeError("Zh==", Base64Error::INVALID_PADDING));

constexpr bool test_decode_reports_offset() {
    std::string out;
    auto res = DecodeBase64("Zm9vYm*y", out);
    return !res && res.inputOffset() == 6;
}
static_assert(test_decode_reports_offset());

constexpr bool test_decode_overflow() {
    char buf[4] = {};
    auto res = DecodeBase64("Zm9vYmFy", buf, buf + 4);
    return !res && res.error() == Base64Error::OUTPUT_OVERFLOW;
}
static_assert(test_decode_overflow());

constexpr bool test_every_byte_value_survives() {
    std::string raw;
    for (int i = 0; i < 256; ++i) {
        raw.push_back(static_cast<char>(i));
    }
    std::string decoded;
    return DecodeBase64(EncodeBase64(raw), decoded) && decoded == raw;
}
static_assert(test_every_byte_value_survives());

static_assert(error_to_string(Base64Error::INVALID_PADDING) == "INVALID_PADDING");
