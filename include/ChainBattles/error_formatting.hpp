#pragma once

#include <format>
#include <string>
#include <string_view>

#include "address.hpp"
#include "base64.hpp"
#include "data_uri.hpp"
#include "errors.hpp"

namespace ChainBattles {

// One-line description of a registry call, e.g.
// "When training token 7, registry error 'NOT_OWNER'".
template <class T>
std::string RegistryResultToString(const RegistryResult<T> & res, std::string_view operation, TokenId id) {
    if (res) {
        return std::format("When {} token {}, no error", operation, id);
    }
    return std::format("When {} token {}, registry error '{}'", operation, id, error_to_string(res.error()));
}

inline std::string DataUriResultToString(const DataUriResult & res) {
    if (res.error() != DataUriError::PAYLOAD_ERROR) {
        return std::format("data URI error '{}'", error_to_string(res.error()));
    }
    return std::format("data URI error '{}', payload error '{}'",
                       error_to_string(res.error()), error_to_string(res.payloadError()));
}

} // namespace ChainBattles
