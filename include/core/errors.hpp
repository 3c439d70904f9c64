#ifndef SENTINEL_ERRORS_HPP_
#define SENTINEL_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace sentinel {

/**
 * Structurally invalid input: unreadable source, missing header or
 * missing required column. Raised before any enrichment runs.
 */
class IngestError : public std::runtime_error {
 public:
  explicit IngestError(const std::string& message)
      : std::runtime_error("ingest error: " + message) {}
};

/**
 * Unreadable or invalid configuration file.
 */
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error("config error: " + message) {}
};

}  // namespace sentinel

#endif  // SENTINEL_ERRORS_HPP_
