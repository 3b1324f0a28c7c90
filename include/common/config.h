#pragma once

#include "common/types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace repute {
namespace common {

/**
 * @brief Badge definition installed into the catalog at startup
 */
struct SeedBadge {
    std::string name;
    std::string description;
    Points required_points = 0;
    std::string metadata_ref;
};

/**
 * @brief Reward policy and runtime settings for one engine instance
 *
 * Defaults reproduce the standard reward rules; a JSON file can override
 * any field.
 */
struct EngineConfig {
    // Authority
    Address admin_address = "admin";            ///< Only account allowed to edit the catalog

    // Logging
    std::string log_level = "info";              ///< trace/debug/info/warn/error/critical
    bool json_logging = false;                   ///< Emit log lines as JSON objects

    // Time
    uint64_t seconds_per_day = 86400;            ///< Length of one check-in day

    // Reward rules
    Points checkin_base_points = 10;             ///< Award for any successful check-in
    Points streak_bonus_per_day = 2;             ///< Extra points per streak day on consecutive check-ins
    Points action_points = 5;                    ///< Flat award for a labelled action
    Points endorsement_points = 25;              ///< Award credited to the endorsed account
    Points endorsement_min_reputation = 50;      ///< Endorser must hold at least this many points
    Points points_per_level = 100;               ///< level = points / points_per_level + 1
    size_t max_label_length = 256;               ///< Longest accepted action label

    std::vector<SeedBadge> seed_badges = default_seed_badges();

    static std::vector<SeedBadge> default_seed_badges();
};

/**
 * @brief Engine configuration loader and validator
 */
class ConfigManager {
public:
    /**
     * @brief Load configuration from a JSON file
     * @param config_path path to configuration file
     * @return loaded and validated configuration, or CONFIG_ERROR
     */
    static Result<EngineConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Load configuration from a JSON object; absent keys keep defaults
     */
    static Result<EngineConfig> load_from_json(const nlohmann::json& json);

    static nlohmann::json to_json(const EngineConfig& config);

    /**
     * @brief Save configuration to a JSON file
     * @return true if save successful
     */
    static bool save_to_file(const EngineConfig& config, const std::string& config_path);

    static EngineConfig create_default();

    /**
     * @brief Validate configuration
     * @return validation error message, or empty string if valid
     */
    static std::string validate_config(const EngineConfig& config);
};

} // namespace common
} // namespace repute
