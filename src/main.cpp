#include "common/config.h"
#include "common/logging.h"
#include "engine/clock.h"
#include "engine/command_dispatcher.h"
#include "engine/reward_engine.h"
#include "events/event_journal.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

struct CliOptions {
  std::string command = "run";
  std::string config_path;
  std::string script_path;
  std::string journal_out;
  std::string log_level;
  std::string admin_address;
  bool json_logs = false;
  bool log_events = false;
  bool fail_fast = false;
};

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [command] [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  run                        Replay a JSON request script "
               "(default)"
            << std::endl;
  std::cout << "  print-config               Print the effective configuration"
            << std::endl;
  std::cout << "  operations                 List accepted request operations"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config FILE              Path to JSON configuration file"
            << std::endl;
  std::cout << "  --script FILE              JSON array of requests, '-' for "
               "stdin"
            << std::endl;
  std::cout << "  --journal-out FILE         Write the hash-chained event "
               "journal to FILE"
            << std::endl;
  std::cout << "  --admin ADDRESS            Override the administrator "
               "address"
            << std::endl;
  std::cout
      << "  --log-level LEVEL          Log level (trace, debug, info, warn, "
         "error)"
      << std::endl;
  std::cout << "  --json-logs                Emit log lines as JSON"
            << std::endl;
  std::cout << "  --log-events               Log every published event"
            << std::endl;
  std::cout << "  --fail-fast                Stop at the first rejected request"
            << std::endl;
  std::cout << "  --help                     Show this help message"
            << std::endl;
}

// Returns -1 to continue, otherwise the process exit code
int parse_arguments(int argc, char *argv[], CliOptions &options) {
  int first = 1;
  if (argc > 1 && argv[1][0] != '-') {
    options.command = argv[1];
    first = 2;
  }

  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--script" && i + 1 < argc) {
      options.script_path = argv[++i];
    } else if (arg == "--journal-out" && i + 1 < argc) {
      options.journal_out = argv[++i];
    } else if (arg == "--admin" && i + 1 < argc) {
      options.admin_address = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      options.log_level = argv[++i];
    } else if (arg == "--json-logs") {
      options.json_logs = true;
    } else if (arg == "--log-events") {
      options.log_events = true;
    } else if (arg == "--fail-fast") {
      options.fail_fast = true;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }
  return -1;
}

repute::common::Result<repute::common::EngineConfig>
load_config(const CliOptions &options) {
  using namespace repute::common;

  EngineConfig config = ConfigManager::create_default();
  if (!options.config_path.empty()) {
    auto loaded = ConfigManager::load_from_file(options.config_path);
    if (loaded.is_err()) {
      return loaded;
    }
    config = loaded.value();
  }

  // Command line overrides file values
  if (!options.admin_address.empty()) {
    config.admin_address = options.admin_address;
  }
  if (!options.log_level.empty()) {
    config.log_level = options.log_level;
  }
  if (options.json_logs) {
    config.json_logging = true;
  }

  std::string error = ConfigManager::validate_config(config);
  if (!error.empty()) {
    return Result<EngineConfig>(ErrorCode::CONFIG_ERROR, error);
  }
  return Result<EngineConfig>(std::move(config));
}

bool read_script(const std::string &path, nlohmann::json &script) {
  std::stringstream buffer;
  if (path == "-") {
    buffer << std::cin.rdbuf();
  } else {
    std::ifstream file(path);
    if (!file) {
      LOG_ERROR("cli", "Cannot open script ", path);
      return false;
    }
    buffer << file.rdbuf();
  }

  script = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (script.is_discarded() || !script.is_array()) {
    LOG_ERROR("cli", "Script ", path, " must be a JSON array of requests");
    return false;
  }
  return true;
}

int run_script(const CliOptions &options,
               const repute::common::EngineConfig &config) {
  using namespace repute;

  if (options.script_path.empty()) {
    std::cerr << "run requires --script FILE" << std::endl;
    return 1;
  }

  nlohmann::json script;
  if (!read_script(options.script_path, script)) {
    return 1;
  }

  // Requests carry their own "time"; without one the wall clock is used
  auto clock =
      std::make_shared<engine::ManualClock>(engine::SystemClock().now());
  auto created = engine::RewardEngine::create(config, clock);
  if (created.is_err()) {
    LOG_ERROR("cli", "Cannot start engine: ", created.error());
    return 1;
  }
  auto reward_engine = created.value();

  auto journal = std::make_shared<events::EventJournal>();
  reward_engine->add_event_sink(journal);
  if (options.log_events) {
    reward_engine->add_event_sink(std::make_shared<events::LoggingEventSink>());
  }

  engine::CommandDispatcher dispatcher(reward_engine);

  size_t rejected = 0;
  for (const auto &request : script) {
    if (request.is_object() && request.contains("time")) {
      if (!request["time"].is_number_unsigned()) {
        std::cout << engine::CommandDispatcher::error(
                         common::ErrorCode::INVALID_INPUT,
                         "'time' must be a non-negative integer")
                         .dump()
                  << std::endl;
        ++rejected;
        if (options.fail_fast) {
          break;
        }
        continue;
      }
      clock->set(request["time"].get<common::Timestamp>());
    }

    nlohmann::json response = dispatcher.dispatch(request);
    std::cout << response.dump() << std::endl;

    if (!response.value("ok", false)) {
      ++rejected;
      if (options.fail_fast) {
        break;
      }
    }
  }

  LOG_INFO("cli", "Replayed ", script.size(), " requests, ", rejected,
           " rejected, ", journal->size(), " events journaled");

  if (!options.journal_out.empty()) {
    std::ofstream out(options.journal_out);
    if (!out) {
      LOG_ERROR("cli", "Cannot write journal to ", options.journal_out);
      return 1;
    }
    nlohmann::json document = {{"head", events::EventJournal::to_hex(
                                            journal->head_digest())},
                               {"verified", journal->verify_chain()},
                               {"records", journal->to_json()}};
    out << document.dump(2) << std::endl;
  }

  return (options.fail_fast && rejected > 0) ? 2 : 0;
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace repute;

  CliOptions options;
  int parsed = parse_arguments(argc, argv, options);
  if (parsed >= 0) {
    return parsed;
  }

  // Responses go to stdout, logs to stderr
  common::Logger::instance().set_output(&std::cerr);

  auto config = load_config(options);
  if (config.is_err()) {
    std::cerr << "Configuration error: " << config.error() << std::endl;
    return 1;
  }

  common::LogLevel level = common::LogLevel::INFO;
  common::Logger::parse_level(config.value().log_level, level);
  common::Logger::instance().set_level(level);
  common::Logger::instance().set_json_format(config.value().json_logging);

  if (options.command == "run") {
    return run_script(options, config.value());
  } else if (options.command == "print-config") {
    std::cout << common::ConfigManager::to_json(config.value()).dump(2)
              << std::endl;
    return 0;
  } else if (options.command == "operations") {
    auto reward_engine = std::make_shared<engine::RewardEngine>(
        config.value(), std::make_shared<engine::SystemClock>());
    engine::CommandDispatcher dispatcher(reward_engine);
    for (const auto &op : dispatcher.operations()) {
      std::cout << op << std::endl;
    }
    return 0;
  }

  std::cerr << "Unknown command: " << options.command << std::endl;
  print_usage(argv[0]);
  return 1;
}
