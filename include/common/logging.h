#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace repute {
namespace common {

/**
 * @brief Logging levels for conditional output
 *
 * Debug logging should stay disabled in production configurations; every
 * successful ledger mutation logs at DEBUG.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief Structured log entry, rendered as a text line or a JSON object
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Global logging configuration
 *
 * Level and format can be adjusted at runtime. Callers on hot paths should
 * check is_enabled() before formatting, which the LOG_* macros do.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Redirect output; nullptr restores std::cout
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        out_ = out ? out : &std::cout;
    }

    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            oss.str(),
            "",
            {}
        };

        output_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            message,
            error_code,
            context
        };

        output_log_entry(entry);
    }

    /// Parse trace/debug/info/warn/error/critical; false leaves the level untouched
    static bool parse_level(const std::string& name, LogLevel& level);
    static std::string level_to_string(LogLevel level);

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), out_(&std::cout) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::ostream* out_;
    std::mutex output_mutex_;

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *out_ << line << std::endl;
    }

    static std::string escape_json_string(const std::string& input);
};

} // namespace common
} // namespace repute

/**
 * @brief Module-tagged logging macros
 *
 * The first argument is the module name, the rest are streamed into the
 * message. Formatting is skipped when the level is disabled.
 */
#define LOG_AT(level, module, ...) \
    do { \
        if (repute::common::Logger::instance().is_enabled(level)) { \
            repute::common::Logger::instance().log(level, module, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_TRACE(module, ...) LOG_AT(repute::common::LogLevel::TRACE, module, __VA_ARGS__)
#define LOG_DEBUG(module, ...) LOG_AT(repute::common::LogLevel::DEBUG, module, __VA_ARGS__)
#define LOG_INFO(module, ...) LOG_AT(repute::common::LogLevel::INFO, module, __VA_ARGS__)
#define LOG_WARN(module, ...) LOG_AT(repute::common::LogLevel::WARN, module, __VA_ARGS__)
#define LOG_ERROR(module, ...) LOG_AT(repute::common::LogLevel::ERROR, module, __VA_ARGS__)
#define LOG_CRITICAL(module, ...) LOG_AT(repute::common::LogLevel::CRITICAL, module, __VA_ARGS__)
