#pragma once

#include "address.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "stat_store.hpp"

namespace ChainBattles {

/// Decides whether caller may mutate token id. Side-effect free; must pass
/// before anything about the token is written.
template<ledger::OwnershipLedgerLike Ledger, StatRecord S>
RegistryError AuthorizeMutation(const Ledger & ledger, const StatStore<S> & store, TokenId id, const Address & caller) {
    if (!store.contains(id) || !ledger.exists(id)) {
        return RegistryError::NOT_FOUND;
    }
    const auto owner = ledger.owner_of(id);
    if (!owner || *owner != caller) {
        return RegistryError::NOT_OWNER;
    }
    return RegistryError::NO_ERROR;
}

} // namespace ChainBattles
