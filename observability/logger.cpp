#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace sentinel {
namespace observability {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "INFO") return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;
  return std::nullopt;
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::cerr) {}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::debug(const std::string& message, const std::string& component) {
  log(LogLevel::DEBUG, message, component);
}

void Logger::info(const std::string& message, const std::string& component) {
  log(LogLevel::INFO, message, component);
}

void Logger::warn(const std::string& message, const std::string& component) {
  log(LogLevel::WARN, message, component);
}

void Logger::error(const std::string& message, const std::string& component) {
  log(LogLevel::ERROR, message, component);
}

void Logger::fatal(const std::string& message, const std::string& component) {
  log(LogLevel::FATAL, message, component);
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component)
    : level_(level), message_(message), component_(component),
      fields_(nlohmann::json::object()) {}

Logger::LogBuilder::~LogBuilder() {
  // Runs at the end of a full expression, so nothing may escape
  try {
    Logger::getInstance().log(level_, message_, component_, fields_);
  } catch (const std::exception& e) {
    std::cerr << "log entry dropped: " << e.what() << std::endl;
  }
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const std::string& value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const char* value) {
  fields_[key] = std::string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, size_t value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, double value) {
  // JSON has no NaN or infinity
  if (std::isfinite(value)) {
    fields_[key] = value;
  } else {
    fields_[key] = nullptr;
  }
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, bool value) {
  fields_[key] = value;
  return *this;
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& component, const nlohmann::json& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;

  nlohmann::json entry;
  entry["timestamp"] = getCurrentTimestamp();
  entry["level"] = levelToString(level);
  entry["thread"] = getThreadId();
  entry["message"] = message;

  if (!component.empty()) {
    entry["component"] = component;
  }

  for (auto it = fields.begin(); it != fields.end(); ++it) {
    entry[it.key()] = it.value();
  }

  // Field values come straight from input files and need not be UTF-8
  *output_stream_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  output_stream_->flush();
}

std::string Logger::levelToString(LogLevel level) const {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    default: return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string Logger::getThreadId() const {
  std::stringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace observability
}  // namespace sentinel
