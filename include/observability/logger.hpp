#ifndef SENTINEL_LOGGER_HPP_
#define SENTINEL_LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace sentinel {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/**
 * Parse "DEBUG", "INFO", "WARN", "ERROR" or "FATAL" (case-insensitive).
 */
std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * Structured logger emitting one JSON object per line.
 * Thread-safe; enrichment workers may log concurrently.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cerr, stdout is reserved for reports)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, flushed on destruction
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, size_t value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    nlohmann::json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const nlohmann::json& fields = nlohmann::json::object());

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define SENTINEL_LOG_DEBUG(msg) sentinel::observability::Logger::getInstance().debug(msg, __func__)
#define SENTINEL_LOG_INFO(msg) sentinel::observability::Logger::getInstance().info(msg, __func__)
#define SENTINEL_LOG_WARN(msg) sentinel::observability::Logger::getInstance().warn(msg, __func__)
#define SENTINEL_LOG_ERROR(msg) sentinel::observability::Logger::getInstance().error(msg, __func__)
#define SENTINEL_LOG_FATAL(msg) sentinel::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define SENTINEL_LOG_BUILDER(level, msg) \
  sentinel::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace sentinel

#endif  // SENTINEL_LOGGER_HPP_
