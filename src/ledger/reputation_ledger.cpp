#include "ledger/reputation_ledger.h"
#include "common/logging.h"
#include <limits>

namespace repute {
namespace ledger {

namespace {
const UserState EMPTY_USER{};
}

const UserState &ReputationLedger::get(const Address &user) const {
  auto it = users_.find(user);
  if (it == users_.end()) {
    return EMPTY_USER;
  }
  return it->second;
}

bool ReputationLedger::is_registered(const Address &user) const {
  return get(user).registered;
}

bool ReputationLedger::would_overflow(const Address &user,
                                      Points amount) const {
  return get(user).points > std::numeric_limits<Points>::max() - amount;
}

Level ReputationLedger::level_for(Points points, Points points_per_level) {
  return points / points_per_level + 1;
}

Result<AwardOutcome>
ReputationLedger::award_points(const Address &user, Points amount,
                               Points points_per_level,
                               const catalog::BadgeCatalog &catalog) {
  if (would_overflow(user, amount)) {
    return Result<AwardOutcome>(ErrorCode::POINTS_OVERFLOW,
                                "Point balance of " + user + " would overflow");
  }

  UserState &state = users_[user];

  AwardOutcome outcome;
  outcome.awarded = amount;
  outcome.previous_level = state.level;
  outcome.first_award = !state.registered;

  if (!state.registered) {
    state.registered = true;
    ++registered_users_;
  }

  state.points += amount;
  outcome.new_balance = state.points;

  // Levels only ever go up
  Level level = level_for(state.points, points_per_level);
  if (level > state.level) {
    state.level = level;
  }
  outcome.new_level = state.level;

  const auto &badges = catalog.badges();
  for (BadgeIndex index = 0; index < badges.size(); ++index) {
    if (state.has_unlocked(index)) {
      continue;
    }
    if (badges[index].required_points <= state.points) {
      state.unlocked_badges.insert(index);
      outcome.unlocked.push_back(index);
    }
  }

  LOG_TRACE("ledger", user, " +", amount, " -> ", state.points, " (level ",
            state.level, ")");
  return Result<AwardOutcome>(std::move(outcome));
}

void ReputationLedger::record_check_in(const Address &user, Day day,
                                       uint64_t streak_days) {
  UserState &state = users_[user];
  state.last_action_day = day;
  state.streak_days = streak_days;
}

} // namespace ledger
} // namespace repute
