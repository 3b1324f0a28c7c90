#pragma once

#include "catalog/badge_catalog.h"
#include "common/types.h"
#include "ledger/reputation_ledger.h"
#include <memory>
#include <vector>

namespace repute {
namespace mint {

using namespace repute::common;

/**
 * Soulbound token record. Nothing in the registry rewrites owner once the
 * record exists.
 */
struct MintedToken {
    TokenId id = NO_TOKEN;
    BadgeIndex badge_index = 0;
    Address owner;
    Timestamp minted_at = 0;
};

/**
 * Registry of minted badge tokens
 *
 * Maps (user, badge) to the token minted for it and token id to its record.
 * Token ids are allocated sequentially from 1 and never reused. The registry
 * intentionally offers no way to change a token's owner.
 */
class BadgeMintRegistry {
public:
    BadgeMintRegistry();
    ~BadgeMintRegistry();

    BadgeMintRegistry(const BadgeMintRegistry&) = delete;
    BadgeMintRegistry& operator=(const BadgeMintRegistry&) = delete;

    /**
     * Mint the user's token for an unlocked badge
     *
     * @return new token id, or OUT_OF_RANGE / BADGE_LOCKED / ALREADY_MINTED
     */
    Result<TokenId> mint(const Address& user, BadgeIndex badge_index,
                         const catalog::BadgeCatalog& catalog,
                         const ledger::ReputationLedger& ledger,
                         Timestamp now);

    // Token queries; NOT_FOUND for ids that were never minted
    Result<MintedToken> token(TokenId id) const;
    Result<Address> owner_of(TokenId id) const;

    // Owner queries
    TokenId minted_token_for(const Address& user, BadgeIndex badge_index) const;
    bool has_minted(const Address& user, BadgeIndex badge_index) const;
    std::vector<TokenId> tokens_of(const Address& user) const;
    size_t balance_of(const Address& user) const;

    size_t total_minted() const;
    TokenId next_token_id() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mint
} // namespace repute
