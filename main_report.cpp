#include "analytics/view_summary.hpp"
#include "config/sentinel_config.hpp"
#include "core/errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "pipeline/filter.hpp"
#include "pipeline/risk_pipeline.hpp"
#include "report/report_json.hpp"

#include <iostream>
#include <string>

using namespace sentinel;

int main(int argc, char* argv[]) {
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: " << argv[0] << " <transactions.csv> [config.json]" << std::endl;
    return 2;
  }

  const std::string data_path = argv[1];
  auto& logger = observability::Logger::getInstance();

  try {
    SentinelConfig config;
    if (argc >= 3) config = SentinelConfig::fromFile(argv[2]);
    logger.setLogLevel(config.logging.level);

    SENTINEL_LOG_BUILDER(observability::LogLevel::INFO, "Starting fraud sentinel report")
        .field("input", data_path)
        .field("enrichment_workers", config.pipeline.enrichment_workers)
        .field("amount_z_threshold", config.pipeline.scoring.amount_z_threshold)
        .field("distance_sigma_multiplier", config.pipeline.scoring.distance_sigma_multiplier);

    const EpochSeconds evaluation_instant =
        config.evaluation_instant.value_or(pipeline::currentEpochSeconds());

    pipeline::RiskPipeline risk_pipeline(config.pipeline);
    auto snapshot = risk_pipeline.runFile(data_path, evaluation_instant);

    FilterCriteria criteria;
    criteria.selected_categories = config.filter.categories;
    if (criteria.selected_categories.empty()) {
      criteria = pipeline::selectAll(snapshot->transactions());
    }
    criteria.anomalies_only = config.filter.anomalies_only;

    auto view = pipeline::filterTransactions(snapshot->transactions(), criteria);
    auto summary = analytics::summarizeView(view);

    nlohmann::json output;
    output["summary"] = report::summaryToJson(summary);
    output["top_alerts"] = report::viewToJson(analytics::topAlerts(view, config.report.top_alerts));
    output["risk_matrix"] = report::riskMatrixToJson(analytics::riskMatrix(view));

    auto statistics = report::snapshotStatisticsToJson(*snapshot);
    for (auto it = statistics.begin(); it != statistics.end(); ++it) {
      output[it.key()] = it.value();
    }
    if (config.report.include_transactions) {
      output["transactions"] = report::viewToJson(view);
    }

    std::cout << report::renderJson(output) << std::endl;

    SENTINEL_LOG_DEBUG(observability::getGlobalMetrics().exportMetrics());
  } catch (const ConfigError& e) {
    SENTINEL_LOG_ERROR(e.what());
    return 1;
  } catch (const IngestError& e) {
    SENTINEL_LOG_ERROR(e.what());
    return 1;
  } catch (const std::exception& e) {
    SENTINEL_LOG_FATAL(std::string("Unexpected failure: ") + e.what());
    return 1;
  }

  return 0;
}
