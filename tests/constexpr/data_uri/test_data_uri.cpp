#include "../test_helpers.hpp"
#include <ChainBattles/data_uri.hpp>
#include <string>

using namespace ChainBattles;
using namespace TestHelpers;

// ============================================================================
// Encoding
// ============================================================================

static_assert(SvgDataUri::media_type == "image/svg+xml");
static_assert(JsonDataUri::media_type == "application/json");

constexpr bool test_prefixes() {
    return SvgDataUri::prefix() == "data:image/svg+xml;base64,"
        && JsonDataUri::prefix() == "data:application/json;base64,";
}
static_assert(test_prefixes());

constexpr bool test_encode_json() {
    return JsonDataUri::Encode("{}") == "data:application/json;base64,e30=";
}
static_assert(test_encode_json());

constexpr bool test_encode_empty_payload() {
    return SvgDataUri::Encode("") == "data:image/svg+xml;base64,";
}
static_assert(test_encode_empty_payload());

// Envelope never contains characters that would need escaping in JSON
constexpr bool test_encoded_is_json_safe() {
    const std::string uri = SvgDataUri::Encode("<text>\"quoted\" & \\ </text>");
    for (char c : uri) {
        if (c == '"' || c == '\\' || c == '<' || c == '>' || c == '&') return false;
    }
    return true;
}
static_assert(test_encoded_is_json_safe());

using PlainText = DataUri<"text/plain">;
static_assert(TestDataUriDecode<PlainText>(PlainText::Encode("hello"), "hello"));

// ============================================================================
// Decoding
// ============================================================================

static_assert(TestDataUriDecode<JsonDataUri>("data:application/json;base64,e30=", "{}"));
static_assert(TestDataUriDecode<SvgDataUri>("data:image/svg+xml;base64,", ""));

static_assert(TestDataUriError<JsonDataUri>("application/json;base64,e30=", DataUriError::MISSING_SCHEME));
static_assert(TestDataUriError<JsonDataUri>("DATA:application/json;base64,e30=", DataUriError::MISSING_SCHEME));
static_assert(TestDataUriError<JsonDataUri>("data:image/svg+xml;base64,e30=", DataUriError::MEDIA_TYPE_MISMATCH));
static_assert(TestDataUriError<JsonDataUri>("data:application/jsonp;base64,e30=", DataUriError::MEDIA_TYPE_MISMATCH));
static_assert(TestDataUriError<JsonDataUri>("data:application/json,{}", DataUriError::MISSING_BASE64_MARKER));
static_assert(TestDataUriError<JsonDataUri>("data:application/json;utf8,{}", DataUriError::MISSING_BASE64_MARKER));
static_assert(TestDataUriError<JsonDataUri>("data:application/json", DataUriError::MISSING_BASE64_MARKER));

constexpr bool test_payload_error_carries_base64_error() {
    std::string payload;
    auto res = JsonDataUri::Decode("data:application/json;base64,e30", payload);
    return !res
        && res.error() == DataUriError::PAYLOAD_ERROR
        && res.payloadError() == Base64Error::INVALID_LENGTH
        && payload.empty();
}
static_assert(test_payload_error_carries_base64_error());

constexpr bool test_decode_replaces_payload() {
    std::string payload = "stale";
    return JsonDataUri::Decode("data:application/json;base64,e30=", payload) && payload == "{}";
}
static_assert(test_decode_replaces_payload());

static_assert(error_to_string(DataUriError::MEDIA_TYPE_MISMATCH) == "MEDIA_TYPE_MISMATCH");
