#include "engine/reward_engine.h"
#include "common/logging.h"
#include <utility>

namespace repute {
namespace engine {

using events::Event;
using events::EventKind;

RewardEngine::RewardEngine(EngineConfig config, std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      catalog_(config_.seed_badges) {
  LOG_INFO("engine", "Reward engine ready with ", catalog_.size(),
           " badges, admin ", config_.admin_address);
}

RewardEngine::~RewardEngine() = default;

Result<std::shared_ptr<RewardEngine>>
RewardEngine::create(EngineConfig config, std::shared_ptr<IClock> clock) {
  std::string error = ConfigManager::validate_config(config);
  if (!error.empty()) {
    return Result<std::shared_ptr<RewardEngine>>(ErrorCode::CONFIG_ERROR, error);
  }
  return Result<std::shared_ptr<RewardEngine>>(
      std::make_shared<RewardEngine>(std::move(config), std::move(clock)));
}

void RewardEngine::add_event_sink(std::shared_ptr<events::IEventSink> sink) {
  if (sink) {
    LOG_DEBUG("engine", "Registered event sink '", sink->get_name(), "'");
    sinks_.push_back(std::move(sink));
  }
}

template <typename T>
Result<T> RewardEngine::reject(const char *operation, const Address &caller,
                               ErrorCode code,
                               const std::string &message) const {
  Logger::instance().log_structured(LogLevel::WARN, "engine",
                                    std::string("Rejected ") + operation,
                                    error_code_to_string(code),
                                    {{"caller", caller}, {"reason", message}});
  return Result<T>(code, message);
}

void RewardEngine::publish(const std::vector<Event> &pending) {
  for (const auto &event : pending) {
    for (const auto &sink : sinks_) {
      sink->on_event(event);
    }
  }
}

Result<ledger::AwardOutcome>
RewardEngine::credit(const Address &account, Points amount,
                     const std::string &reason, Timestamp now,
                     std::vector<Event> &pending) {
  auto result =
      ledger_.award_points(account, amount, config_.points_per_level, catalog_);
  if (result.is_err()) {
    return result;
  }

  const auto &outcome = result.value();

  Event earned;
  earned.kind = EventKind::POINTS_EARNED;
  earned.account = account;
  earned.amount = outcome.awarded;
  earned.detail = reason;
  earned.timestamp = now;
  pending.push_back(earned);

  if (outcome.leveled_up()) {
    Event level_up;
    level_up.kind = EventKind::LEVEL_UP;
    level_up.account = account;
    level_up.level = outcome.new_level;
    level_up.timestamp = now;
    pending.push_back(level_up);
  }

  for (BadgeIndex index : outcome.unlocked) {
    Event unlocked;
    unlocked.kind = EventKind::BADGE_UNLOCKED;
    unlocked.account = account;
    unlocked.badge_index = index;
    unlocked.detail = catalog_.badges()[index].name;
    unlocked.timestamp = now;
    pending.push_back(unlocked);
  }

  return result;
}

Result<Points> RewardEngine::check_in(const Address &caller) {
  if (caller.empty()) {
    return reject<Points>("check_in", caller, ErrorCode::INVALID_INPUT,
                          "Caller address cannot be empty");
  }

  const Timestamp now = clock_->now();
  const Day today = now / config_.seconds_per_day;
  const ledger::UserState &state = ledger_.get(caller);

  if (state.has_checked_in() && today <= state.last_action_day) {
    return reject<Points>("check_in", caller, ErrorCode::ALREADY_ACTIONED,
                          "Already checked in on day " + std::to_string(today));
  }

  uint64_t streak = 1;
  Points award = config_.checkin_base_points;
  if (state.has_checked_in() && today == state.last_action_day + 1) {
    streak = state.streak_days + 1;
    award = config_.checkin_base_points + streak * config_.streak_bonus_per_day;
  }

  if (ledger_.would_overflow(caller, award)) {
    return reject<Points>("check_in", caller, ErrorCode::POINTS_OVERFLOW,
                          "Point balance would overflow");
  }

  std::vector<Event> pending;
  auto credited = credit(caller, award, "daily_check_in", now, pending);
  if (credited.is_err()) {
    return credited.propagate<Points>();
  }
  ledger_.record_check_in(caller, today, streak);

  LOG_DEBUG("engine", caller, " checked in on day ", today, " (streak ",
            streak, ", +", award, ")");
  publish(pending);
  return Result<Points>(award);
}

Result<Points> RewardEngine::perform_action(const Address &caller,
                                            const std::string &label) {
  if (caller.empty()) {
    return reject<Points>("perform_action", caller, ErrorCode::INVALID_INPUT,
                          "Caller address cannot be empty");
  }

  if (label.empty()) {
    return reject<Points>("perform_action", caller, ErrorCode::INVALID_INPUT,
                          "Action label cannot be empty");
  }

  if (label.size() > config_.max_label_length) {
    return reject<Points>("perform_action", caller, ErrorCode::INVALID_INPUT,
                          "Action label exceeds " +
                              std::to_string(config_.max_label_length) +
                              " bytes");
  }

  if (ledger_.would_overflow(caller, config_.action_points)) {
    return reject<Points>("perform_action", caller, ErrorCode::POINTS_OVERFLOW,
                          "Point balance would overflow");
  }

  const Timestamp now = clock_->now();
  std::vector<Event> pending;
  auto credited =
      credit(caller, config_.action_points, "action:" + label, now, pending);
  if (credited.is_err()) {
    return credited.propagate<Points>();
  }

  LOG_DEBUG("engine", caller, " performed '", label, "'");
  publish(pending);
  return Result<Points>(config_.action_points);
}

Result<Points> RewardEngine::endorse_user(const Address &caller,
                                          const Address &target) {
  if (caller.empty() || target.empty()) {
    return reject<Points>("endorse_user", caller, ErrorCode::INVALID_INPUT,
                          "Endorser and target addresses cannot be empty");
  }

  if (caller == target) {
    return reject<Points>("endorse_user", caller, ErrorCode::SELF_ENDORSEMENT,
                          "Cannot endorse yourself");
  }

  if (endorsements_.has_endorsed(caller, target)) {
    return reject<Points>("endorse_user", caller,
                          ErrorCode::DUPLICATE_ENDORSEMENT,
                          "Already endorsed " + target);
  }

  const Points endorser_points = ledger_.get(caller).points;
  if (endorser_points < config_.endorsement_min_reputation) {
    return reject<Points>("endorse_user", caller,
                          ErrorCode::INSUFFICIENT_REPUTATION,
                          "Endorsing requires " +
                              std::to_string(config_.endorsement_min_reputation) +
                              " points, have " + std::to_string(endorser_points));
  }

  if (ledger_.would_overflow(target, config_.endorsement_points)) {
    return reject<Points>("endorse_user", caller, ErrorCode::POINTS_OVERFLOW,
                          "Point balance of " + target + " would overflow");
  }

  const Timestamp now = clock_->now();
  auto recorded = endorsements_.record(caller, target);
  if (recorded.is_err()) {
    return recorded.propagate<Points>();
  }

  std::vector<Event> pending;
  Event endorsed;
  endorsed.kind = EventKind::ENDORSED;
  endorsed.account = target;
  endorsed.counterparty = caller;
  endorsed.timestamp = now;
  pending.push_back(endorsed);

  auto credited =
      credit(target, config_.endorsement_points, "endorsement", now, pending);
  if (credited.is_err()) {
    return credited.propagate<Points>();
  }

  LOG_DEBUG("engine", caller, " endorsed ", target);
  publish(pending);
  return Result<Points>(config_.endorsement_points);
}

Result<TokenId> RewardEngine::mint_badge(const Address &caller,
                                         BadgeIndex badge_index) {
  if (caller.empty()) {
    return reject<TokenId>("mint_badge", caller, ErrorCode::INVALID_INPUT,
                           "Caller address cannot be empty");
  }

  const Timestamp now = clock_->now();
  auto minted = registry_.mint(caller, badge_index, catalog_, ledger_, now);
  if (minted.is_err()) {
    return reject<TokenId>("mint_badge", caller, minted.code(), minted.error());
  }

  const TokenId token_id = minted.value();
  std::vector<Event> pending;

  Event badge_minted;
  badge_minted.kind = EventKind::BADGE_MINTED;
  badge_minted.account = caller;
  badge_minted.badge_index = badge_index;
  badge_minted.token_id = token_id;
  badge_minted.timestamp = now;
  pending.push_back(badge_minted);

  // Minted from nothing: the empty counterparty is the conventional zero address
  Event creation;
  creation.kind = EventKind::TRANSFER;
  creation.account = caller;
  creation.badge_index = badge_index;
  creation.token_id = token_id;
  creation.timestamp = now;
  pending.push_back(creation);

  publish(pending);
  return minted;
}

Result<catalog::AdminCapability>
RewardEngine::authorize_admin(const Address &caller) const {
  if (caller.empty() || caller != config_.admin_address) {
    return reject<catalog::AdminCapability>(
        "authorize_admin", caller, ErrorCode::UNAUTHORIZED,
        "Only the administrator may modify the badge catalog");
  }
  return Result<catalog::AdminCapability>(catalog::AdminCapability(caller));
}

Result<BadgeIndex> RewardEngine::add_custom_badge(
    const Address &caller, const std::string &name,
    const std::string &description, Points required_points,
    const std::string &metadata_ref) {
  auto cap = authorize_admin(caller);
  if (cap.is_err()) {
    return cap.propagate<BadgeIndex>();
  }

  auto created = catalog_.create_badge(cap.value(), name, description,
                                       required_points, metadata_ref);
  if (created.is_err()) {
    return reject<BadgeIndex>("add_custom_badge", caller, created.code(),
                              created.error());
  }

  Event event;
  event.kind = EventKind::BADGE_CREATED;
  event.account = caller;
  event.badge_index = created.value();
  event.amount = required_points;
  event.detail = metadata_ref;
  event.timestamp = clock_->now();
  publish({event});

  LOG_INFO("engine", "Badge ", created.value(), " '", name,
           "' added with threshold ", required_points);
  return created;
}

Result<bool> RewardEngine::update_badge_uri(const Address &caller,
                                            BadgeIndex badge_index,
                                            const std::string &new_ref) {
  auto cap = authorize_admin(caller);
  if (cap.is_err()) {
    return cap.propagate<bool>();
  }

  auto updated = catalog_.update_metadata_ref(cap.value(), badge_index, new_ref);
  if (updated.is_err()) {
    return reject<bool>("update_badge_uri", caller, updated.code(),
                        updated.error());
  }

  Event event;
  event.kind = EventKind::BADGE_METADATA_UPDATED;
  event.account = caller;
  event.badge_index = badge_index;
  event.detail = new_ref;
  event.timestamp = clock_->now();
  publish({event});

  return updated;
}

Result<std::string> RewardEngine::token_metadata_ref(TokenId token_id) const {
  auto token = registry_.token(token_id);
  if (token.is_err()) {
    return token.propagate<std::string>();
  }

  auto badge = catalog_.get(token.value().badge_index);
  if (badge.is_err()) {
    return badge.propagate<std::string>();
  }
  return Result<std::string>(badge.value().metadata_ref);
}

Result<Address> RewardEngine::owner_of(TokenId token_id) const {
  return registry_.owner_of(token_id);
}

size_t RewardEngine::balance_of(const Address &account) const {
  return registry_.balance_of(account);
}

std::vector<TokenId>
RewardEngine::get_user_badge_tokens(const Address &account) const {
  return registry_.tokens_of(account);
}

UserProfile RewardEngine::get_user_profile(const Address &account) const {
  const ledger::UserState &state = ledger_.get(account);

  UserProfile profile;
  profile.points = state.points;
  profile.level = state.level;
  profile.streak_days = state.streak_days;
  profile.last_action_day = state.last_action_day;
  profile.unlocked_badges = state.unlocked_badges.size();
  profile.minted_badges = registry_.balance_of(account);
  profile.endorsements_received = endorsements_.endorsements_received(account);
  return profile;
}

Result<catalog::Badge> RewardEngine::get_badge_info(BadgeIndex badge_index) const {
  return catalog_.get(badge_index);
}

bool RewardEngine::has_user_unlocked_badge(const Address &account,
                                           BadgeIndex badge_index) const {
  return ledger_.get(account).has_unlocked(badge_index);
}

bool RewardEngine::has_user_minted_badge(const Address &account,
                                         BadgeIndex badge_index) const {
  return registry_.has_minted(account, badge_index);
}

} // namespace engine
} // namespace repute
