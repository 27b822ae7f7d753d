#pragma once

#include <string_view>
#include <utility>

namespace ChainBattles {

enum class RegistryError {
    NO_ERROR,

    NOT_FOUND,
    NOT_OWNER,

    ISSUER_EXHAUSTED,
    ALREADY_EXISTS,
    INVALID_OWNER,
    LEDGER_REJECTED,

    SEED_DERIVATION_FAILED,
    ENCODING_ERROR
};

constexpr std::string_view error_to_string(RegistryError e) {
    switch(e) {
    case RegistryError::NO_ERROR: return "NO_ERROR"; break;
    case RegistryError::NOT_FOUND: return "NOT_FOUND"; break;
    case RegistryError::NOT_OWNER: return "NOT_OWNER"; break;
    case RegistryError::ISSUER_EXHAUSTED: return "ISSUER_EXHAUSTED"; break;
    case RegistryError::ALREADY_EXISTS: return "ALREADY_EXISTS"; break;
    case RegistryError::INVALID_OWNER: return "INVALID_OWNER"; break;
    case RegistryError::LEDGER_REJECTED: return "LEDGER_REJECTED"; break;
    case RegistryError::SEED_DERIVATION_FAILED: return "SEED_DERIVATION_FAILED"; break;
    case RegistryError::ENCODING_ERROR: return "ENCODING_ERROR"; break;
    }
    return "N/A";
}

template <class T>
class RegistryResult {
    RegistryError m_error = RegistryError::NO_ERROR;
    T m_value{};
public:
    constexpr RegistryResult(T value): m_value(std::move(value)) {}
    constexpr RegistryResult(RegistryError err): m_error(err) {}

    constexpr operator bool() const {
        return m_error == RegistryError::NO_ERROR;
    }
    constexpr RegistryError error() const {
        return m_error;
    }
    // Meaningful only when the result converts to true.
    constexpr const T & value() const {
        return m_value;
    }
};

} // namespace ChainBattles
