#pragma once

#include "catalog/badge_catalog.h"
#include "common/types.h"
#include <set>
#include <unordered_map>
#include <vector>

namespace repute {
namespace ledger {

using namespace repute::common;

/**
 * Per-user reputation state. Every field starts at zero; a user who never
 * earned a point reads as level 0 with nothing unlocked.
 */
struct UserState {
    Points points = 0;
    Level level = 0;
    Day last_action_day = 0;
    uint64_t streak_days = 0;           // 0 until the first check-in
    std::set<BadgeIndex> unlocked_badges;
    bool registered = false;            // set by the first point award

    bool has_checked_in() const { return streak_days > 0; }
    bool has_unlocked(BadgeIndex index) const {
        return unlocked_badges.count(index) > 0;
    }
};

/**
 * Effects of one point award, in the order they happened
 */
struct AwardOutcome {
    Points awarded = 0;
    Points new_balance = 0;
    Level previous_level = 0;
    Level new_level = 0;
    bool first_award = false;
    std::vector<BadgeIndex> unlocked;   // ascending catalog order

    bool leveled_up() const { return new_level > previous_level; }
};

/**
 * Mutable per-user point balances, levels, streaks and unlock flags
 */
class ReputationLedger {
public:
    ReputationLedger() = default;

    // Queries
    const UserState& get(const Address& user) const;
    bool is_registered(const Address& user) const;
    size_t registered_users() const { return registered_users_; }

    /// True if adding amount to the user's balance would wrap
    bool would_overflow(const Address& user, Points amount) const;

    static Level level_for(Points points, Points points_per_level);

    /**
     * Add points, raise the level if warranted and unlock every badge of the
     * current catalog whose threshold is now met. Fails only with
     * POINTS_OVERFLOW, in which case nothing changes.
     */
    Result<AwardOutcome> award_points(const Address& user, Points amount,
                                      Points points_per_level,
                                      const catalog::BadgeCatalog& catalog);

    /// Store the outcome of a check-in that the caller already validated
    void record_check_in(const Address& user, Day day, uint64_t streak_days);

private:
    std::unordered_map<Address, UserState> users_;
    size_t registered_users_ = 0;
};

} // namespace ledger
} // namespace repute
