#pragma once

#include "catalog/badge_catalog.h"
#include "common/config.h"
#include "common/types.h"
#include "engine/clock.h"
#include "events/event.h"
#include "ledger/endorsement_graph.h"
#include "ledger/reputation_ledger.h"
#include "mint/badge_mint_registry.h"
#include <memory>
#include <string>
#include <vector>

namespace repute {
namespace engine {

using namespace repute::common;

/**
 * Read-only summary of one account
 */
struct UserProfile {
    Points points = 0;
    Level level = 0;
    uint64_t streak_days = 0;
    Day last_action_day = 0;
    size_t unlocked_badges = 0;
    size_t minted_badges = 0;
    size_t endorsements_received = 0;
};

/**
 * Orchestrates the reputation ledger, badge catalog, endorsement graph and
 * mint registry.
 *
 * Every action validates all of its preconditions before touching state, so
 * it either applies completely or fails with nothing changed. Events are
 * published to the registered sinks only after the action succeeded.
 *
 * Not thread-safe: the host must run one action at a time.
 */
class RewardEngine {
public:
    /// config must pass ConfigManager::validate_config(); nullptr clock means SystemClock
    RewardEngine(EngineConfig config, std::shared_ptr<IClock> clock);
    ~RewardEngine();

    RewardEngine(const RewardEngine&) = delete;
    RewardEngine& operator=(const RewardEngine&) = delete;

    /// Validate config first; CONFIG_ERROR instead of constructing a broken engine
    static Result<std::shared_ptr<RewardEngine>> create(EngineConfig config,
                                                        std::shared_ptr<IClock> clock);

    void add_event_sink(std::shared_ptr<events::IEventSink> sink);

    // Point-awarding actions; each returns the points credited
    Result<Points> check_in(const Address& caller);
    Result<Points> perform_action(const Address& caller, const std::string& label);
    Result<Points> endorse_user(const Address& caller, const Address& target);

    // Minting
    Result<TokenId> mint_badge(const Address& caller, BadgeIndex badge_index);

    // Administration
    Result<catalog::AdminCapability> authorize_admin(const Address& caller) const;
    Result<BadgeIndex> add_custom_badge(const Address& caller,
                                        const std::string& name,
                                        const std::string& description,
                                        Points required_points,
                                        const std::string& metadata_ref);
    Result<bool> update_badge_uri(const Address& caller, BadgeIndex badge_index,
                                  const std::string& new_ref);

    // Queries
    Result<std::string> token_metadata_ref(TokenId token_id) const;
    Result<Address> owner_of(TokenId token_id) const;
    size_t balance_of(const Address& account) const;
    std::vector<TokenId> get_user_badge_tokens(const Address& account) const;
    UserProfile get_user_profile(const Address& account) const;
    Result<catalog::Badge> get_badge_info(BadgeIndex badge_index) const;
    bool has_user_unlocked_badge(const Address& account, BadgeIndex badge_index) const;
    bool has_user_minted_badge(const Address& account, BadgeIndex badge_index) const;
    size_t badge_count() const { return catalog_.size(); }
    size_t total_users() const { return ledger_.registered_users(); }

    const EngineConfig& config() const { return config_; }
    const catalog::BadgeCatalog& catalog() const { return catalog_; }
    const ledger::ReputationLedger& ledger() const { return ledger_; }
    const ledger::EndorsementGraph& endorsements() const { return endorsements_; }
    const mint::BadgeMintRegistry& registry() const { return registry_; }

private:
    EngineConfig config_;
    std::shared_ptr<IClock> clock_;
    catalog::BadgeCatalog catalog_;
    ledger::ReputationLedger ledger_;
    ledger::EndorsementGraph endorsements_;
    mint::BadgeMintRegistry registry_;
    std::vector<std::shared_ptr<events::IEventSink>> sinks_;

    void publish(const std::vector<events::Event>& pending);

    /// Apply an award the caller has already checked for overflow
    Result<ledger::AwardOutcome> credit(const Address& account, Points amount,
                                        const std::string& reason, Timestamp now,
                                        std::vector<events::Event>& pending);

    template <typename T>
    Result<T> reject(const char* operation, const Address& caller,
                     ErrorCode code, const std::string& message) const;
};

} // namespace engine
} // namespace repute
