#pragma once

#include <concepts>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "address.hpp"

namespace ChainBattles {

namespace ledger {

/// The only view the registry has of token ownership: existence, current
/// owner, first assignment, and the per-token URI slot.
template<typename L>
concept OwnershipLedgerLike = requires(L& ledger,
                                       const L& const_ledger,
                                       TokenId id,
                                       const Address& owner,
                                       std::string uri) {
    { const_ledger.exists(id) } -> std::same_as<bool>;
    { const_ledger.owner_of(id) } -> std::same_as<std::optional<Address>>;
    { ledger.assign(id, owner) } -> std::same_as<bool>;
    { ledger.set_uri(id, std::move(uri)) } -> std::same_as<bool>;
    { const_ledger.get_uri(id) } -> std::same_as<std::optional<std::string>>;
};

} // namespace ledger

/// Reference ledger kept in memory.
class InMemoryLedger {
    struct Entry {
        Address owner;
        std::string uri;
    };
    std::map<TokenId, Entry> m_entries;
    std::map<Address, std::size_t> m_balances;

public:
    bool exists(TokenId id) const {
        return m_entries.contains(id);
    }

    std::optional<Address> owner_of(TokenId id) const {
        const auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second.owner;
    }

    // Refuses the zero address and ids that already have an owner.
    bool assign(TokenId id, const Address & owner) {
        if (owner.isZero()) {
            return false;
        }
        if (!m_entries.try_emplace(id, Entry{owner, {}}).second) {
            return false;
        }
        ++m_balances[owner];
        return true;
    }

    bool set_uri(TokenId id, std::string uri) {
        const auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return false;
        }
        it->second.uri = std::move(uri);
        return true;
    }

    std::optional<std::string> get_uri(TokenId id) const {
        const auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second.uri;
    }

    std::size_t balance_of(const Address & owner) const {
        const auto it = m_balances.find(owner);
        return it == m_balances.end() ? 0 : it->second;
    }

    std::size_t size() const {
        return m_entries.size();
    }
};

static_assert(ledger::OwnershipLedgerLike<InMemoryLedger>);

} // namespace ChainBattles
