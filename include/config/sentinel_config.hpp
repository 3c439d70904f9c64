#ifndef SENTINEL_CONFIG_HPP_
#define SENTINEL_CONFIG_HPP_

#include "../observability/logger.hpp"
#include "../pipeline/risk_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace sentinel {

/**
 * Settings for one sentinel_report run.
 * Defaults reproduce the reference scoring exactly.
 */
struct SentinelConfig {
  struct Logging {
    observability::LogLevel level = observability::LogLevel::INFO;
  };

  struct Filter {
    // Empty means every category present in the batch
    std::set<std::string> categories;
    bool anomalies_only = false;
  };

  struct Report {
    size_t top_alerts = 20;
    bool include_transactions = false;
  };

  Logging logging{};
  pipeline::PipelineConfig pipeline{};
  Filter filter{};
  Report report{};
  // Absent means "now" at the start of the run
  std::optional<EpochSeconds> evaluation_instant;

  /**
   * Throws ConfigError when a known key has the wrong type or an invalid
   * value. Unknown keys are ignored.
   */
  static SentinelConfig fromJson(const nlohmann::json& document);
  static SentinelConfig fromFile(const std::string& path);
};

}  // namespace sentinel

#endif  // SENTINEL_CONFIG_HPP_
