#pragma once

#include <atomic>
#include <limits>
#include <optional>

#include "address.hpp"

namespace ChainBattles {

/// Hands out token ids 1, 2, 3, ... Safe to call from several threads: two
/// callers never receive the same id.
class TokenIdIssuer {
    std::atomic<TokenId> m_last{0};

public:
    TokenIdIssuer() = default;
    // Resumes after a previously persisted counter value.
    explicit TokenIdIssuer(TokenId lastIssued): m_last(lastIssued) {}

    TokenIdIssuer(const TokenIdIssuer&) = delete;
    TokenIdIssuer& operator=(const TokenIdIssuer&) = delete;

    // nullopt once the id space is used up; the counter is left untouched.
    std::optional<TokenId> next_id() {
        TokenId last = m_last.load(std::memory_order_relaxed);
        do {
            if (last == std::numeric_limits<TokenId>::max()) {
                return std::nullopt;
            }
        } while (!m_last.compare_exchange_weak(last, last + 1, std::memory_order_acq_rel, std::memory_order_relaxed));
        return last + 1;
    }

    TokenId last_issued() const {
        return m_last.load(std::memory_order_acquire);
    }
};

} // namespace ChainBattles
