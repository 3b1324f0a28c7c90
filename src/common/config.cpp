#include "common/config.h"
#include "common/logging.h"
#include <fstream>
#include <sstream>

namespace repute {
namespace common {

using json = nlohmann::json;

std::vector<SeedBadge> EngineConfig::default_seed_badges() {
  return {
      {"Newcomer", "Earned your first reputation points", 0,
       "metadata/newcomer.json"},
      {"Active Member", "Reached 100 reputation points", 100,
       "metadata/active-member.json"},
      {"Contributor", "Reached 500 reputation points", 500,
       "metadata/contributor.json"},
      {"Expert", "Reached 1000 reputation points", 1000,
       "metadata/expert.json"},
      {"Legend", "Reached 5000 reputation points", 5000,
       "metadata/legend.json"},
  };
}

EngineConfig ConfigManager::create_default() { return EngineConfig{}; }

std::string ConfigManager::validate_config(const EngineConfig &config) {
  if (config.admin_address.empty()) {
    return "Admin address cannot be empty";
  }

  if (config.seconds_per_day == 0) {
    return "seconds_per_day must be positive";
  }

  if (config.points_per_level == 0) {
    return "points_per_level must be positive";
  }

  if (config.max_label_length == 0) {
    return "max_label_length must be positive";
  }

  LogLevel level;
  if (!Logger::parse_level(config.log_level, level)) {
    return "Unknown log level: " + config.log_level;
  }

  for (size_t i = 0; i < config.seed_badges.size(); ++i) {
    if (config.seed_badges[i].name.empty()) {
      return "Seed badge " + std::to_string(i) + " has an empty name";
    }
  }

  return "";
}

Result<EngineConfig> ConfigManager::load_from_json(const json &j) {
  try {
    if (!j.is_object()) {
      return Result<EngineConfig>(ErrorCode::CONFIG_ERROR,
                                  "Configuration root must be an object");
    }

    EngineConfig config = create_default();

    config.admin_address = j.value("admin_address", config.admin_address);
    config.log_level = j.value("log_level", config.log_level);
    config.json_logging = j.value("json_logging", config.json_logging);
    config.seconds_per_day = j.value("seconds_per_day", config.seconds_per_day);

    if (j.contains("rewards")) {
      const auto &rewards = j["rewards"];
      config.checkin_base_points =
          rewards.value("checkin_base_points", config.checkin_base_points);
      config.streak_bonus_per_day =
          rewards.value("streak_bonus_per_day", config.streak_bonus_per_day);
      config.action_points = rewards.value("action_points", config.action_points);
      config.endorsement_points =
          rewards.value("endorsement_points", config.endorsement_points);
      config.endorsement_min_reputation = rewards.value(
          "endorsement_min_reputation", config.endorsement_min_reputation);
      config.points_per_level =
          rewards.value("points_per_level", config.points_per_level);
      config.max_label_length =
          rewards.value("max_label_length", config.max_label_length);
    }

    if (j.contains("seed_badges")) {
      config.seed_badges.clear();
      for (const auto &badge_json : j["seed_badges"]) {
        SeedBadge badge;
        badge.name = badge_json.value("name", "");
        badge.description = badge_json.value("description", "");
        badge.required_points =
            badge_json.value("required_points", static_cast<Points>(0));
        badge.metadata_ref = badge_json.value("metadata_ref", "");
        config.seed_badges.push_back(std::move(badge));
      }
    }

    std::string error = validate_config(config);
    if (!error.empty()) {
      return Result<EngineConfig>(ErrorCode::CONFIG_ERROR, error);
    }

    return Result<EngineConfig>(std::move(config));
  } catch (const json::exception &e) {
    return Result<EngineConfig>(ErrorCode::CONFIG_ERROR,
                                "JSON parsing error: " + std::string(e.what()));
  }
}

Result<EngineConfig> ConfigManager::load_from_file(const std::string &config_path) {
  std::ifstream file(config_path);
  if (!file) {
    return Result<EngineConfig>(ErrorCode::CONFIG_ERROR,
                                "Config file not found: " + config_path);
  }

  std::ostringstream json_stream;
  json_stream << file.rdbuf();

  json j = json::parse(json_stream.str(), nullptr, false);
  if (j.is_discarded()) {
    return Result<EngineConfig>(ErrorCode::CONFIG_ERROR,
                                "Config file is not valid JSON: " + config_path);
  }

  LOG_INFO("config", "Loaded configuration from ", config_path);
  return load_from_json(j);
}

json ConfigManager::to_json(const EngineConfig &config) {
  json j;
  j["admin_address"] = config.admin_address;
  j["log_level"] = config.log_level;
  j["json_logging"] = config.json_logging;
  j["seconds_per_day"] = config.seconds_per_day;

  json rewards;
  rewards["checkin_base_points"] = config.checkin_base_points;
  rewards["streak_bonus_per_day"] = config.streak_bonus_per_day;
  rewards["action_points"] = config.action_points;
  rewards["endorsement_points"] = config.endorsement_points;
  rewards["endorsement_min_reputation"] = config.endorsement_min_reputation;
  rewards["points_per_level"] = config.points_per_level;
  rewards["max_label_length"] = config.max_label_length;
  j["rewards"] = rewards;

  json badges = json::array();
  for (const auto &badge : config.seed_badges) {
    badges.push_back({{"name", badge.name},
                      {"description", badge.description},
                      {"required_points", badge.required_points},
                      {"metadata_ref", badge.metadata_ref}});
  }
  j["seed_badges"] = badges;

  return j;
}

bool ConfigManager::save_to_file(const EngineConfig &config,
                                 const std::string &config_path) {
  std::ofstream file(config_path);
  if (!file) {
    LOG_ERROR("config", "Failed to open ", config_path, " for writing");
    return false;
  }

  file << to_json(config).dump(2);
  return static_cast<bool>(file);
}

} // namespace common
} // namespace repute
