#pragma once

#include <cstddef>
#include <map>
#include <optional>

#include "address.hpp"
#include "errors.hpp"
#include "stats.hpp"

namespace ChainBattles {

/// Token id -> stat record table. Records are created at baseline and are
/// never removed. No locking: the registry serializes access.
template<StatRecord S>
class StatStore {
    std::map<TokenId, S> m_records;

public:
    using record_type = S;

    RegistryError create(TokenId id) {
        const auto [it, inserted] = m_records.try_emplace(id, BaselineStats<S>());
        return inserted ? RegistryError::NO_ERROR : RegistryError::ALREADY_EXISTS;
    }

    std::optional<S> get(TokenId id) const {
        const auto it = m_records.find(id);
        if (it == m_records.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Overwrites the whole record of an existing token.
    RegistryError set(TokenId id, const S & record) {
        const auto it = m_records.find(id);
        if (it == m_records.end()) {
            return RegistryError::NOT_FOUND;
        }
        it->second = record;
        return RegistryError::NO_ERROR;
    }

    bool contains(TokenId id) const {
        return m_records.contains(id);
    }

    std::size_t size() const {
        return m_records.size();
    }
};

} // namespace ChainBattles
