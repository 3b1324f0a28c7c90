#include "engine/command_dispatcher.h"
#include "common/logging.h"
#include <algorithm>
#include <stdexcept>

namespace repute {
namespace engine {

using json = nlohmann::json;

namespace {

std::string require_string(const json &request, const char *key) {
  // at() throws json::out_of_range / json::type_error, mapped to INVALID_INPUT
  return request.at(key).get<std::string>();
}

uint64_t require_u64(const json &request, const char *key) {
  const json &value = request.at(key);
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  // Values built in code rather than parsed are stored as signed integers
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return static_cast<uint64_t>(value.get<int64_t>());
  }
  throw std::invalid_argument(std::string("Field '") + key +
                              "' must be a non-negative integer");
}

json badge_to_json(BadgeIndex index, const catalog::Badge &badge) {
  return {{"index", index},
          {"name", badge.name},
          {"description", badge.description},
          {"required_points", badge.required_points},
          {"metadata_ref", badge.metadata_ref},
          {"exists", badge.exists}};
}

json profile_to_json(const Address &account, const UserProfile &profile) {
  return {{"account", account},
          {"points", profile.points},
          {"level", profile.level},
          {"streak_days", profile.streak_days},
          {"last_action_day", profile.last_action_day},
          {"unlocked_badges", profile.unlocked_badges},
          {"minted_badges", profile.minted_badges},
          {"endorsements_received", profile.endorsements_received}};
}

} // namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<RewardEngine> engine)
    : engine_(std::move(engine)) {
  register_handlers();
}

json CommandDispatcher::ok(json result) {
  return {{"ok", true}, {"result", std::move(result)}};
}

json CommandDispatcher::error(ErrorCode code, const std::string &message) {
  return {{"ok", false},
          {"error", error_code_to_string(code)},
          {"message", message}};
}

template <typename T>
json CommandDispatcher::respond(const Result<T> &result) {
  if (result.is_err()) {
    return error(result.code(), result.error());
  }
  return ok(result.value());
}

void CommandDispatcher::register_handlers() {
  auto &engine = *engine_;

  // Actions
  handlers_["check_in"] = [&engine](const json &req) {
    return respond(engine.check_in(require_string(req, "caller")));
  };
  handlers_["perform_action"] = [&engine](const json &req) {
    return respond(engine.perform_action(require_string(req, "caller"),
                                         require_string(req, "label")));
  };
  handlers_["endorse_user"] = [&engine](const json &req) {
    return respond(engine.endorse_user(require_string(req, "caller"),
                                       require_string(req, "target")));
  };
  handlers_["mint_badge"] = [&engine](const json &req) {
    return respond(engine.mint_badge(require_string(req, "caller"),
                                     require_u64(req, "badge_index")));
  };

  // Administration
  handlers_["add_custom_badge"] = [&engine](const json &req) {
    return respond(engine.add_custom_badge(
        require_string(req, "caller"), require_string(req, "name"),
        req.value("description", ""), require_u64(req, "required_points"),
        req.value("metadata_ref", "")));
  };
  handlers_["update_badge_uri"] = [&engine](const json &req) {
    return respond(engine.update_badge_uri(require_string(req, "caller"),
                                           require_u64(req, "badge_index"),
                                           require_string(req, "metadata_ref")));
  };

  // Queries
  handlers_["token_metadata_ref"] = [&engine](const json &req) {
    return respond(engine.token_metadata_ref(require_u64(req, "token_id")));
  };
  handlers_["owner_of"] = [&engine](const json &req) {
    return respond(engine.owner_of(require_u64(req, "token_id")));
  };
  handlers_["balance_of"] = [&engine](const json &req) {
    return ok(engine.balance_of(require_string(req, "account")));
  };
  handlers_["get_user_badge_tokens"] = [&engine](const json &req) {
    return ok(engine.get_user_badge_tokens(require_string(req, "account")));
  };
  handlers_["get_user_profile"] = [&engine](const json &req) {
    const Address account = require_string(req, "account");
    return ok(profile_to_json(account, engine.get_user_profile(account)));
  };
  handlers_["get_badge_info"] = [&engine](const json &req) {
    const BadgeIndex index = require_u64(req, "badge_index");
    auto badge = engine.get_badge_info(index);
    if (badge.is_err()) {
      return error(badge.code(), badge.error());
    }
    return ok(badge_to_json(index, badge.value()));
  };
  handlers_["has_user_unlocked_badge"] = [&engine](const json &req) {
    return ok(engine.has_user_unlocked_badge(require_string(req, "account"),
                                             require_u64(req, "badge_index")));
  };
  handlers_["has_user_minted_badge"] = [&engine](const json &req) {
    return ok(engine.has_user_minted_badge(require_string(req, "account"),
                                           require_u64(req, "badge_index")));
  };
  handlers_["badge_count"] = [&engine](const json &) {
    return ok(engine.badge_count());
  };
  handlers_["total_users"] = [&engine](const json &) {
    return ok(engine.total_users());
  };

  // Soulbound tokens: refused whatever the caller, token or recipient
  auto refuse_transfer = [](const json &) {
    return error(ErrorCode::NON_TRANSFERABLE,
                 "Badge tokens are soulbound and cannot be transferred");
  };
  handlers_["transfer"] = refuse_transfer;
  handlers_["safe_transfer"] = refuse_transfer;
}

std::vector<std::string> CommandDispatcher::operations() const {
  std::vector<std::string> names;
  names.reserve(handlers_.size());
  for (const auto &entry : handlers_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

json CommandDispatcher::dispatch(const json &request) {
  if (!request.is_object() || !request.contains("op") ||
      !request["op"].is_string()) {
    return error(ErrorCode::INVALID_INPUT,
                 "Request must be an object with a string 'op'");
  }

  const std::string op = request["op"].get<std::string>();
  auto it = handlers_.find(op);
  if (it == handlers_.end()) {
    LOG_WARN("dispatcher", "Unknown operation '", op, "'");
    return error(ErrorCode::INVALID_INPUT, "Unknown operation: " + op);
  }

  try {
    return it->second(request);
  } catch (const json::exception &e) {
    LOG_WARN("dispatcher", "Malformed '", op, "' request: ", e.what());
    return error(ErrorCode::INVALID_INPUT,
                 "Malformed request: " + std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    LOG_WARN("dispatcher", "Malformed '", op, "' request: ", e.what());
    return error(ErrorCode::INVALID_INPUT, e.what());
  }
}

} // namespace engine
} // namespace repute
