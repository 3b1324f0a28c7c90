#include "common/config.h"
#include "common/logging.h"
#include "common/types.h"
#include "test_framework.h"
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace repute::common;

namespace {

// Restores the logger after a test redirected it
struct LoggerCapture {
  std::ostringstream stream;
  LogLevel saved_level;

  explicit LoggerCapture(LogLevel level)
      : saved_level(Logger::instance().get_level()) {
    Logger::instance().set_output(&stream);
    Logger::instance().set_level(level);
  }

  ~LoggerCapture() {
    Logger::instance().set_output(nullptr);
    Logger::instance().set_level(saved_level);
    Logger::instance().set_json_format(false);
  }
};

std::string temp_path(const std::string &name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

void test_result_type() {
  Result<int> success_result(42);
  ASSERT_TRUE(success_result.is_ok());
  ASSERT_FALSE(success_result.is_err());
  ASSERT_EQ(42, success_result.value());
  ASSERT_TRUE(success_result.code() == ErrorCode::NONE);
  ASSERT_TRUE(success_result.error().empty());

  Result<int> error_result(ErrorCode::NOT_FOUND, "Something went missing");
  ASSERT_FALSE(error_result.is_ok());
  ASSERT_TRUE(error_result.is_err());
  ASSERT_TRUE(error_result.code() == ErrorCode::NOT_FOUND);
  ASSERT_EQ(std::string("Something went missing"), error_result.error());
  ASSERT_EQ(7, error_result.value_or(7));
}

void test_result_type_move_semantics() {
  Result<std::string> result(std::string("payload"));
  ASSERT_TRUE(result.is_ok());

  std::string moved_value = std::move(result).value();
  ASSERT_EQ(std::string("payload"), moved_value);
}

void test_result_error_propagation() {
  Result<bool> failed(ErrorCode::UNAUTHORIZED, "not the admin");
  Result<uint64_t> propagated = failed.propagate<uint64_t>();

  ASSERT_TRUE(propagated.is_err());
  ASSERT_TRUE(propagated.code() == ErrorCode::UNAUTHORIZED);
  ASSERT_EQ(std::string("not the admin"), propagated.error());
  ASSERT_FALSE(static_cast<bool>(propagated));
}

void test_error_code_names() {
  ASSERT_EQ(std::string("ALREADY_ACTIONED"),
            error_code_to_string(ErrorCode::ALREADY_ACTIONED));
  ASSERT_EQ(std::string("NON_TRANSFERABLE"),
            error_code_to_string(ErrorCode::NON_TRANSFERABLE));
  ASSERT_EQ(std::string("INSUFFICIENT_REPUTATION"),
            error_code_to_string(ErrorCode::INSUFFICIENT_REPUTATION));
  ASSERT_EQ(std::string("POINTS_OVERFLOW"),
            error_code_to_string(ErrorCode::POINTS_OVERFLOW));
  ASSERT_EQ(std::string("CONFIG_ERROR"),
            error_code_to_string(ErrorCode::CONFIG_ERROR));
}

void test_engine_config_default_values() {
  EngineConfig config = ConfigManager::create_default();

  ASSERT_EQ(std::string("admin"), config.admin_address);
  ASSERT_EQ(static_cast<uint64_t>(86400), config.seconds_per_day);
  ASSERT_EQ(static_cast<Points>(10), config.checkin_base_points);
  ASSERT_EQ(static_cast<Points>(2), config.streak_bonus_per_day);
  ASSERT_EQ(static_cast<Points>(5), config.action_points);
  ASSERT_EQ(static_cast<Points>(25), config.endorsement_points);
  ASSERT_EQ(static_cast<Points>(50), config.endorsement_min_reputation);
  ASSERT_EQ(static_cast<Points>(100), config.points_per_level);
  ASSERT_EQ(static_cast<size_t>(5), config.seed_badges.size());

  ASSERT_EQ(std::string("Newcomer"), config.seed_badges[0].name);
  ASSERT_EQ(static_cast<Points>(0), config.seed_badges[0].required_points);
  ASSERT_EQ(std::string("Active Member"), config.seed_badges[1].name);
  ASSERT_EQ(static_cast<Points>(100), config.seed_badges[1].required_points);
  ASSERT_EQ(static_cast<Points>(500), config.seed_badges[2].required_points);
  ASSERT_EQ(static_cast<Points>(1000), config.seed_badges[3].required_points);
  ASSERT_EQ(std::string("Legend"), config.seed_badges[4].name);
  ASSERT_EQ(static_cast<Points>(5000), config.seed_badges[4].required_points);

  ASSERT_EQ(std::string(""), ConfigManager::validate_config(config));
}

void test_config_validation() {
  EngineConfig config;
  config.admin_address = "";
  ASSERT_CONTAINS(ConfigManager::validate_config(config), "Admin");

  config = EngineConfig{};
  config.seconds_per_day = 0;
  ASSERT_CONTAINS(ConfigManager::validate_config(config), "seconds_per_day");

  config = EngineConfig{};
  config.points_per_level = 0;
  ASSERT_CONTAINS(ConfigManager::validate_config(config), "points_per_level");

  config = EngineConfig{};
  config.log_level = "loud";
  ASSERT_CONTAINS(ConfigManager::validate_config(config), "loud");

  config = EngineConfig{};
  config.seed_badges.push_back(SeedBadge{"", "nameless", 10, ""});
  ASSERT_CONTAINS(ConfigManager::validate_config(config), "empty name");
}

void test_config_load_from_json() {
  nlohmann::json j = {
      {"admin_address", "root"},
      {"seconds_per_day", 60},
      {"rewards", {{"action_points", 7}, {"points_per_level", 50}}},
      {"seed_badges",
       {{{"name", "First"}, {"required_points", 0}},
        {{"name", "Second"},
         {"description", "Fifty points"},
         {"required_points", 50},
         {"metadata_ref", "ipfs://second"}}}}};

  auto result = ConfigManager::load_from_json(j);
  ASSERT_OK(result);

  const EngineConfig &config = result.value();
  ASSERT_EQ(std::string("root"), config.admin_address);
  ASSERT_EQ(static_cast<uint64_t>(60), config.seconds_per_day);
  ASSERT_EQ(static_cast<Points>(7), config.action_points);
  ASSERT_EQ(static_cast<Points>(50), config.points_per_level);
  // Keys absent from the file keep their defaults
  ASSERT_EQ(static_cast<Points>(25), config.endorsement_points);
  ASSERT_EQ(static_cast<size_t>(2), config.seed_badges.size());
  ASSERT_EQ(std::string("ipfs://second"), config.seed_badges[1].metadata_ref);
}

void test_config_load_rejects_bad_input() {
  ASSERT_ERR_CODE(ErrorCode::CONFIG_ERROR,
                  ConfigManager::load_from_json(nlohmann::json::array()));

  nlohmann::json wrong_type = {{"seconds_per_day", "a day"}};
  ASSERT_ERR_CODE(ErrorCode::CONFIG_ERROR,
                  ConfigManager::load_from_json(wrong_type));

  nlohmann::json invalid = {{"rewards", {{"points_per_level", 0}}}};
  ASSERT_ERR_CODE(ErrorCode::CONFIG_ERROR,
                  ConfigManager::load_from_json(invalid));

  ASSERT_ERR_CODE(ErrorCode::CONFIG_ERROR,
                  ConfigManager::load_from_file(
                      temp_path("repute_config_that_does_not_exist.json")));
}

void test_config_file_round_trip() {
  const std::string path = temp_path("repute_test_config.json");

  EngineConfig config;
  config.admin_address = "council";
  config.endorsement_min_reputation = 75;
  config.seed_badges.push_back(
      SeedBadge{"Mentor", "Helped others", 250, "metadata/mentor.json"});

  ASSERT_TRUE(ConfigManager::save_to_file(config, path));

  auto loaded = ConfigManager::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_OK(loaded);

  ASSERT_EQ(std::string("council"), loaded.value().admin_address);
  ASSERT_EQ(static_cast<Points>(75), loaded.value().endorsement_min_reputation);
  ASSERT_EQ(static_cast<size_t>(6), loaded.value().seed_badges.size());
  ASSERT_EQ(std::string("Mentor"), loaded.value().seed_badges[5].name);
}

void test_config_file_invalid_json() {
  const std::string path = temp_path("repute_test_broken_config.json");
  {
    std::ofstream out(path);
    out << "{ \"admin_address\": ";
  }

  auto loaded = ConfigManager::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_ERR_CODE(ErrorCode::CONFIG_ERROR, loaded);
}

void test_log_level_parsing() {
  LogLevel level = LogLevel::INFO;
  ASSERT_TRUE(Logger::parse_level("debug", level));
  ASSERT_TRUE(level == LogLevel::DEBUG);
  ASSERT_TRUE(Logger::parse_level("WARNING", level));
  ASSERT_TRUE(level == LogLevel::WARN);
  ASSERT_FALSE(Logger::parse_level("verbose", level));
  ASSERT_TRUE(level == LogLevel::WARN);
}

void test_logger_level_filtering() {
  LoggerCapture capture(LogLevel::WARN);

  LOG_INFO("test", "hidden message");
  LOG_WARN("test", "visible message ", 42);

  std::string output = capture.stream.str();
  ASSERT_TRUE(output.find("hidden message") == std::string::npos);
  ASSERT_CONTAINS(output, "[WARN] [test] visible message 42");
}

void test_logger_json_format() {
  LoggerCapture capture(LogLevel::INFO);
  Logger::instance().set_json_format(true);

  Logger::instance().log_structured(LogLevel::WARN, "engine",
                                    "Rejected \"check_in\"", "ALREADY_ACTIONED",
                                    {{"caller", "alice"}});

  std::string output = capture.stream.str();
  ASSERT_CONTAINS(output, "\"level\":\"WARN\"");
  ASSERT_CONTAINS(output, "\"module\":\"engine\"");
  ASSERT_CONTAINS(output, "\"message\":\"Rejected \\\"check_in\\\"\"");
  ASSERT_CONTAINS(output, "\"error_code\":\"ALREADY_ACTIONED\"");
  ASSERT_CONTAINS(output, "\"context\":{\"caller\":\"alice\"}");
}

void run_common_tests(TestRunner &runner) {
  std::cout << "\n=== Common Types Tests ===" << std::endl;

  runner.run_test("Result Type Basic", test_result_type);
  runner.run_test("Result Type Move Semantics",
                  test_result_type_move_semantics);
  runner.run_test("Result Error Propagation", test_result_error_propagation);
  runner.run_test("Error Code Names", test_error_code_names);
  runner.run_test("Engine Config Default Values",
                  test_engine_config_default_values);
  runner.run_test("Config Validation", test_config_validation);
  runner.run_test("Config Load From JSON", test_config_load_from_json);
  runner.run_test("Config Load Rejects Bad Input",
                  test_config_load_rejects_bad_input);
  runner.run_test("Config File Round Trip", test_config_file_round_trip);
  runner.run_test("Config File Invalid JSON", test_config_file_invalid_json);
  runner.run_test("Log Level Parsing", test_log_level_parsing);
  runner.run_test("Logger Level Filtering", test_logger_level_filtering);
  runner.run_test("Logger JSON Format", test_logger_json_format);
}

// Standalone test main for common tests
#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Common Types Test Suite ===" << std::endl;
  TestRunner runner;
  run_common_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
