#include "config/sentinel_config.hpp"

#include "core/errors.hpp"
#include "ingest/date_parser.hpp"

#include <cmath>
#include <fstream>

namespace sentinel {

namespace {

const nlohmann::json* section(const nlohmann::json& document, const char* name) {
  auto it = document.find(name);
  if (it == document.end() || it->is_null()) return nullptr;
  if (!it->is_object()) {
    throw ConfigError(std::string("section '") + name + "' must be an object");
  }
  return &*it;
}

template <typename T>
void readValue(const nlohmann::json& object, const char* key, T& target) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) return;
  target = it->get<T>();
}

size_t readCount(const nlohmann::json& object, const char* key, size_t fallback) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) return fallback;
  if (!it->is_number_integer()) {
    throw ConfigError(std::string("'") + key + "' must be an integer");
  }
  long long value = it->get<long long>();
  if (value < 0) {
    throw ConfigError(std::string("'") + key + "' must not be negative");
  }
  return static_cast<size_t>(value);
}

void requireFinite(double value, const char* key) {
  if (!std::isfinite(value)) {
    throw ConfigError(std::string("'") + key + "' must be finite");
  }
}

}  // namespace

SentinelConfig SentinelConfig::fromJson(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("configuration root must be an object");
  }

  SentinelConfig config;
  try {
    if (const auto* logging = section(document, "logging")) {
      std::string level;
      readValue(*logging, "level", level);
      if (!level.empty()) {
        auto parsed = observability::parseLogLevel(level);
        if (!parsed) {
          throw ConfigError("unknown log level '" + level + "'");
        }
        config.logging.level = *parsed;
      }
    }

    if (const auto* ingest = section(document, "ingest")) {
      readValue(*ingest, "day_first", config.pipeline.ingest.day_first);
      config.pipeline.ingest.max_logged_warnings =
          readCount(*ingest, "max_logged_warnings", config.pipeline.ingest.max_logged_warnings);
    }

    if (const auto* enrichment = section(document, "enrichment")) {
      config.pipeline.enrichment_workers =
          readCount(*enrichment, "worker_threads", config.pipeline.enrichment_workers);
      if (config.pipeline.enrichment_workers == 0) {
        throw ConfigError("'worker_threads' must be at least 1");
      }
    }

    if (const auto* scoring = section(document, "scoring")) {
      auto& target = config.pipeline.scoring;
      readValue(*scoring, "epsilon", target.epsilon);
      readValue(*scoring, "amount_z_threshold", target.amount_z_threshold);
      readValue(*scoring, "distance_sigma_multiplier", target.distance_sigma_multiplier);
      requireFinite(target.epsilon, "epsilon");
      requireFinite(target.amount_z_threshold, "amount_z_threshold");
      requireFinite(target.distance_sigma_multiplier, "distance_sigma_multiplier");
      if (target.epsilon <= 0.0) {
        throw ConfigError("'epsilon' must be positive");
      }

      std::string stddev;
      readValue(*scoring, "stddev", stddev);
      if (stddev == "population") {
        target.stddev_kind = StddevKind::POPULATION;
      } else if (stddev == "sample") {
        target.stddev_kind = StddevKind::SAMPLE;
      } else if (!stddev.empty()) {
        throw ConfigError("'stddev' must be \"population\" or \"sample\"");
      }
    }

    if (const auto* filter = section(document, "filter")) {
      readValue(*filter, "categories", config.filter.categories);
      readValue(*filter, "anomalies_only", config.filter.anomalies_only);
    }

    if (const auto* report = section(document, "report")) {
      config.report.top_alerts = readCount(*report, "top_alerts", config.report.top_alerts);
      readValue(*report, "include_transactions", config.report.include_transactions);
    }

    std::string evaluation_date;
    readValue(document, "evaluation_date", evaluation_date);
    if (!evaluation_date.empty()) {
      config.evaluation_instant = ingest::parseDateTime(evaluation_date, false);
      if (!config.evaluation_instant) {
        throw ConfigError("unparsable 'evaluation_date' " + evaluation_date);
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(e.what());
  }

  return config;
}

SentinelConfig SentinelConfig::fromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ConfigError("unable to open " + path);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return fromJson(document);
}

}  // namespace sentinel
