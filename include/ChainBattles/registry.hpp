#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>

#include "access_guard.hpp"
#include "address.hpp"
#include "collection_config.hpp"
#include "errors.hpp"
#include "issuer.hpp"
#include "ledger.hpp"
#include "metadata.hpp"
#include "sha3_seed_mixer.hpp"
#include "stat_advancement.hpp"
#include "stat_store.hpp"
#include "stats.hpp"
#include "train_seed.hpp"

namespace ChainBattles {

/// Stat registry: owns the id counter, the stat table, the ownership ledger
/// and the mixer. mint() and train() run under an exclusive lock; a rejected
/// train leaves every table as it was. Readers take a shared lock.
template<StatRecord S = FullStats,
         ledger::OwnershipLedgerLike Ledger = InMemoryLedger,
         mixer::SeedMixerLike Mixer = Sha3SeedMixer>
class Registry {
    mutable std::shared_mutex m_mutex;
    TokenIdIssuer m_issuer;
    StatStore<S> m_store;
    Ledger m_ledger;
    Mixer m_mixer;
    CollectionTexts m_texts;

public:
    using record_type = S;
    using ledger_type = Ledger;
    using mixer_type  = Mixer;

    Registry() = default;

    explicit Registry(Ledger ledger, Mixer mixer = Mixer{}, CollectionConfig config = DefaultCollection):
        m_ledger(std::move(ledger)), m_mixer(std::move(mixer)), m_texts(config)
    {}

    explicit Registry(const CollectionConfig & config): m_texts(config) {}

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // New token at baseline stats, owned by caller, with its URI slot filled.
    RegistryResult<TokenId> mint(const Address & caller) {
        if (caller.isZero()) {
            return RegistryError::INVALID_OWNER;
        }
        std::unique_lock lock(m_mutex);

        const auto id = m_issuer.next_id();
        if (!id) {
            return RegistryError::ISSUER_EXHAUSTED;
        }
        if (m_store.contains(*id) || m_ledger.exists(*id)) {
            return RegistryError::ALREADY_EXISTS;
        }
        auto uri = BuildTokenUri(*id, BaselineStats<S>(), m_texts.view());
        if (!uri) {
            return uri.error();
        }

        if (!m_ledger.assign(*id, caller)) {
            return RegistryError::LEDGER_REJECTED;
        }
        // The ledger has no way to undo assign(). If the URI is refused the id
        // stays owned but gets no stat record, so the guard reports NOT_FOUND
        // for it and it can never be trained.
        if (!m_ledger.set_uri(*id, uri.value())) {
            return RegistryError::LEDGER_REJECTED;
        }
        // cannot fail: the id was checked to be free under the lock
        if (auto err = m_store.create(*id); err != RegistryError::NO_ERROR) {
            return err;
        }
        return *id;
    }

    // Advances the stats of a token the caller owns and replaces its URI.
    RegistryResult<S> train(TokenId id, const Address & caller, const TrainContext & context) {
        std::unique_lock lock(m_mutex);

        if (auto err = AuthorizeMutation(m_ledger, m_store, id, caller); err != RegistryError::NO_ERROR) {
            return err;
        }
        const auto before = m_store.get(id);
        if (!before) {
            return RegistryError::NOT_FOUND;
        }

        const TrainSeed seed{context.timestamp, caller, id};
        auto after = AdvanceStats(*before, seed, m_mixer);
        if (!after) {
            return after.error();
        }
        auto uri = BuildTokenUri(id, after.value(), m_texts.view());
        if (!uri) {
            return uri.error();
        }

        // URI first: once the ledger accepts it, set() cannot fail for an id
        // the guard let through.
        if (!m_ledger.set_uri(id, uri.value())) {
            return RegistryError::LEDGER_REJECTED;
        }
        if (auto err = m_store.set(id, after.value()); err != RegistryError::NO_ERROR) {
            return err;
        }
        return after;
    }

    // The URI stored by the last mint or train of id.
    RegistryResult<std::string> token_uri(TokenId id) const {
        std::shared_lock lock(m_mutex);
        auto uri = m_ledger.get_uri(id);
        if (!uri) {
            return RegistryError::NOT_FOUND;
        }
        return std::move(*uri);
    }

    std::optional<Address> owner_of(TokenId id) const {
        std::shared_lock lock(m_mutex);
        return m_ledger.owner_of(id);
    }

    std::optional<S> stats(TokenId id) const {
        std::shared_lock lock(m_mutex);
        return m_store.get(id);
    }

    // Per-stat accessors read 0 for ids that were never minted.
    std::uint64_t level(TokenId id) const {
        const auto s = stats(id);
        return s ? s->level : 0;
    }

    std::uint64_t health(TokenId id) const requires CombatStatRecord<S> {
        const auto s = stats(id);
        return s ? s->health : 0;
    }

    std::uint64_t strength(TokenId id) const requires CombatStatRecord<S> {
        const auto s = stats(id);
        return s ? s->strength : 0;
    }

    std::uint64_t speed(TokenId id) const requires CombatStatRecord<S> {
        const auto s = stats(id);
        return s ? s->speed : 0;
    }

    TokenId total_minted() const {
        return m_issuer.last_issued();
    }

    std::size_t balance_of(const Address & owner) const
        requires requires(const Ledger & l, const Address & a) {
            { l.balance_of(a) } -> std::convertible_to<std::size_t>;
        }
    {
        std::shared_lock lock(m_mutex);
        return m_ledger.balance_of(owner);
    }

    // Views into texts owned by the registry.
    CollectionConfig config() const {
        return m_texts.view();
    }
};

using ChainBattlesRegistry = Registry<FullStats>;
using LevelOnlyRegistry    = Registry<LevelStats>;

} // namespace ChainBattles
