#include "mint/badge_mint_registry.h"
#include "common/logging.h"
#include <map>
#include <unordered_map>
#include <utility>

namespace repute {
namespace mint {

class BadgeMintRegistry::Impl {
public:
    TokenId next_token_id_ = 1;
    std::vector<MintedToken> tokens_;   // tokens_[id - 1]
    std::unordered_map<Address, std::map<BadgeIndex, TokenId>> by_owner_badge_;
    std::unordered_map<Address, std::vector<TokenId>> by_owner_;

    const MintedToken* find(TokenId id) const {
        if (id == NO_TOKEN || id > tokens_.size()) {
            return nullptr;
        }
        return &tokens_[id - 1];
    }
};

BadgeMintRegistry::BadgeMintRegistry() : impl_(std::make_unique<Impl>()) {}

BadgeMintRegistry::~BadgeMintRegistry() = default;

Result<TokenId> BadgeMintRegistry::mint(const Address &user,
                                        BadgeIndex badge_index,
                                        const catalog::BadgeCatalog &catalog,
                                        const ledger::ReputationLedger &ledger,
                                        Timestamp now) {
  if (badge_index >= catalog.size()) {
    return Result<TokenId>(ErrorCode::OUT_OF_RANGE,
                           "Badge index " + std::to_string(badge_index) +
                               " is beyond catalog size " +
                               std::to_string(catalog.size()));
  }

  if (!ledger.get(user).has_unlocked(badge_index)) {
    return Result<TokenId>(ErrorCode::BADGE_LOCKED,
                           "Badge " + std::to_string(badge_index) +
                               " is not unlocked for " + user);
  }

  if (has_minted(user, badge_index)) {
    return Result<TokenId>(ErrorCode::ALREADY_MINTED,
                           "Badge " + std::to_string(badge_index) +
                               " already minted for " + user);
  }

  MintedToken token;
  token.id = impl_->next_token_id_++;
  token.badge_index = badge_index;
  token.owner = user;
  token.minted_at = now;

  impl_->by_owner_badge_[user][badge_index] = token.id;
  impl_->by_owner_[user].push_back(token.id);
  impl_->tokens_.push_back(std::move(token));

  TokenId id = impl_->tokens_.back().id;
  LOG_DEBUG("mint", "Minted token ", id, " for badge ", badge_index, " to ",
            user);
  return Result<TokenId>(id);
}

Result<MintedToken> BadgeMintRegistry::token(TokenId id) const {
  const MintedToken *token = impl_->find(id);
  if (!token) {
    return Result<MintedToken>(ErrorCode::NOT_FOUND,
                               "Token " + std::to_string(id) + " does not exist");
  }
  return Result<MintedToken>(*token);
}

Result<Address> BadgeMintRegistry::owner_of(TokenId id) const {
  const MintedToken *token = impl_->find(id);
  if (!token) {
    return Result<Address>(ErrorCode::NOT_FOUND,
                           "Token " + std::to_string(id) + " does not exist");
  }
  return Result<Address>(token->owner);
}

TokenId BadgeMintRegistry::minted_token_for(const Address &user,
                                            BadgeIndex badge_index) const {
  auto owner_it = impl_->by_owner_badge_.find(user);
  if (owner_it == impl_->by_owner_badge_.end()) {
    return NO_TOKEN;
  }
  auto badge_it = owner_it->second.find(badge_index);
  return badge_it == owner_it->second.end() ? NO_TOKEN : badge_it->second;
}

bool BadgeMintRegistry::has_minted(const Address &user,
                                   BadgeIndex badge_index) const {
  return minted_token_for(user, badge_index) != NO_TOKEN;
}

std::vector<TokenId> BadgeMintRegistry::tokens_of(const Address &user) const {
  // Ids are appended in allocation order, so the list is already ascending
  auto it = impl_->by_owner_.find(user);
  if (it == impl_->by_owner_.end()) {
    return {};
  }
  return it->second;
}

size_t BadgeMintRegistry::balance_of(const Address &user) const {
  auto it = impl_->by_owner_.find(user);
  return it == impl_->by_owner_.end() ? 0 : it->second.size();
}

size_t BadgeMintRegistry::total_minted() const { return impl_->tokens_.size(); }

TokenId BadgeMintRegistry::next_token_id() const {
  return impl_->next_token_id_;
}

} // namespace mint
} // namespace repute
