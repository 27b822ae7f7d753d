#pragma once

#include <string>
#include <string_view>

#include "base64.hpp"
#include "const_string.hpp"

namespace ChainBattles {

enum class DataUriError {
    NO_ERROR,
    MISSING_SCHEME,
    MEDIA_TYPE_MISMATCH,
    MISSING_BASE64_MARKER,
    PAYLOAD_ERROR
};

constexpr std::string_view error_to_string(DataUriError e) {
    switch(e) {
    case DataUriError::NO_ERROR: return "NO_ERROR"; break;
    case DataUriError::MISSING_SCHEME: return "MISSING_SCHEME"; break;
    case DataUriError::MEDIA_TYPE_MISMATCH: return "MEDIA_TYPE_MISMATCH"; break;
    case DataUriError::MISSING_BASE64_MARKER: return "MISSING_BASE64_MARKER"; break;
    case DataUriError::PAYLOAD_ERROR: return "PAYLOAD_ERROR"; break;
    }
    return "N/A";
}

class DataUriResult {
    DataUriError m_error = DataUriError::NO_ERROR;
    Base64Error m_payloadError = Base64Error::NO_ERROR;
public:
    constexpr DataUriResult(DataUriError err, Base64Error payloadErr = Base64Error::NO_ERROR):
        m_error(err), m_payloadError(payloadErr)
    {}
    constexpr operator bool() const {
        return m_error == DataUriError::NO_ERROR;
    }
    constexpr DataUriError error() const {
        return m_error;
    }
    constexpr Base64Error payloadError() const {
        return m_payloadError;
    }
};

/// Envelope `data:<MediaType>;base64,<payload>` used to embed one document
/// inside another. The base64 alphabet contains no quote, angle bracket or
/// backslash, so the envelope is safe inside JSON strings and XML attributes.
template<ConstString MediaType>
struct DataUri {
    static_assert(MediaType.check(), "[[[ ChainBattles ]]] media type contains characters that need escaping");

    static constexpr std::string_view scheme = "data:";
    static constexpr std::string_view marker = ";base64,";
    static constexpr std::string_view media_type = MediaType.toStringView();

    static constexpr std::string prefix() {
        std::string p;
        p.reserve(scheme.size() + media_type.size() + marker.size());
        p.append(scheme);
        p.append(media_type);
        p.append(marker);
        return p;
    }

    static constexpr std::string Encode(std::string_view payload) {
        std::string uri = prefix();
        AppendBase64(payload, uri);
        return uri;
    }

    static constexpr DataUriResult Decode(std::string_view uri, std::string & payload) {
        payload.clear();
        if (!uri.starts_with(scheme)) {
            return DataUriResult(DataUriError::MISSING_SCHEME);
        }
        uri.remove_prefix(scheme.size());

        if (!uri.starts_with(media_type)) {
            return DataUriError::MEDIA_TYPE_MISMATCH;
        }
        uri.remove_prefix(media_type.size());

        if (!uri.starts_with(marker)) {
            // a different media type sharing our prefix, e.g. "image/svg+xmlfoo"
            if (!uri.empty() && uri.front() != ';' && uri.front() != ',') {
                return DataUriError::MEDIA_TYPE_MISMATCH;
            }
            return DataUriError::MISSING_BASE64_MARKER;
        }
        uri.remove_prefix(marker.size());

        auto res = DecodeBase64(uri, payload);
        if (!res) {
            payload.clear();
            return DataUriResult(DataUriError::PAYLOAD_ERROR, res.error());
        }
        return DataUriError::NO_ERROR;
    }
};

using SvgDataUri  = DataUri<"image/svg+xml">;
using JsonDataUri = DataUri<"application/json">;

} // namespace ChainBattles
