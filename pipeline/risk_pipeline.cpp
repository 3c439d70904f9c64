#include "pipeline/risk_pipeline.hpp"

#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "pipeline/filter.hpp"

#include <chrono>
#include <utility>

namespace sentinel {
namespace pipeline {

using observability::LogLevel;
using observability::MetricsCollector;

namespace {

void describeMetrics(MetricsCollector& metrics) {
  metrics.describe("sentinel_rows_ingested_total", "Rows read from CSV sources");
  metrics.describe("sentinel_malformed_fields_total", "Fields left undefined during ingest");
  metrics.describe("sentinel_rows_enriched_total", "Rows passed through enrichment");
  metrics.describe("sentinel_amount_anomalies", "Amount anomalies in the latest snapshot");
  metrics.describe("sentinel_distance_anomalies", "Distance anomalies in the latest snapshot");
  metrics.describe("sentinel_categories", "Categories in the latest snapshot");
  metrics.describe("sentinel_ingest_duration_seconds", "CSV ingest duration");
  metrics.describe("sentinel_enrichment_duration_seconds", "Enrichment stage duration");
  metrics.describe("sentinel_scoring_duration_seconds", "Scoring stage duration");
}

}  // namespace

RiskSnapshot::RiskSnapshot(ScoringResult scoring, EpochSeconds evaluation_instant,
                           ingest::IngestReport ingest_report)
    : transactions_(std::move(scoring.transactions)),
      category_statistics_(std::move(scoring.category_statistics)),
      distance_statistic_(std::move(scoring.distance_statistic)),
      evaluation_instant_(evaluation_instant),
      ingest_report_(std::move(ingest_report)) {
}

const CategoryStatistic* RiskSnapshot::findCategory(const std::string& category) const {
  for (const auto& stat : category_statistics_) {
    if (stat.category == category) {
      return &stat;
    }
  }
  return nullptr;
}

std::vector<std::string> RiskSnapshot::categories() const {
  return allCategories(transactions_);
}

RiskPipeline::RiskPipeline(PipelineConfig config)
    : config_(std::move(config)),
      enrichment_(config_.enrichment_workers),
      scorer_(config_.scoring) {
}

std::shared_ptr<const RiskSnapshot> RiskPipeline::run(const std::vector<RawTransaction>& batch,
                                                      EpochSeconds evaluation_instant) const {
  ingest::IngestReport report;
  report.source = "<memory>";
  report.rows_read = batch.size();
  return runStages(batch, evaluation_instant, std::move(report));
}

std::shared_ptr<const RiskSnapshot> RiskPipeline::runFile(const std::string& path,
                                                          EpochSeconds evaluation_instant) const {
  auto& metrics = observability::getGlobalMetrics();
  describeMetrics(metrics);
  ingest::IngestResult ingested;
  {
    MetricsCollector::Timer timer(metrics, "sentinel_ingest_duration_seconds");
    ingest::CsvReader reader(config_.ingest);
    ingested = reader.readFile(path);
  }
  return runStages(ingested.transactions, evaluation_instant, std::move(ingested.report));
}

std::shared_ptr<const RiskSnapshot> RiskPipeline::runStages(
    const std::vector<RawTransaction>& batch, EpochSeconds evaluation_instant,
    ingest::IngestReport report) const {
  auto& metrics = observability::getGlobalMetrics();
  describeMetrics(metrics);

  std::vector<EnrichedTransaction> enriched;
  {
    MetricsCollector::Timer timer(metrics, "sentinel_enrichment_duration_seconds");
    enriched = enrichment_.enrich(batch, evaluation_instant);
  }
  metrics.incrementCounter("sentinel_rows_enriched_total", static_cast<double>(enriched.size()));

  ScoringResult scoring;
  {
    MetricsCollector::Timer timer(metrics, "sentinel_scoring_duration_seconds");
    scoring = scorer_.score(enriched);
  }

  size_t amount_anomalies = 0;
  size_t distance_anomalies = 0;
  for (const auto& tx : scoring.transactions) {
    if (tx.is_amount_anomaly) amount_anomalies += 1;
    if (tx.is_distance_anomaly) distance_anomalies += 1;
  }
  metrics.setGauge("sentinel_amount_anomalies", static_cast<double>(amount_anomalies));
  metrics.setGauge("sentinel_distance_anomalies", static_cast<double>(distance_anomalies));
  metrics.setGauge("sentinel_categories", static_cast<double>(scoring.category_statistics.size()));

  SENTINEL_LOG_BUILDER(LogLevel::INFO, "Risk snapshot computed")
      .field("source", report.source)
      .field("rows", scoring.transactions.size())
      .field("categories", scoring.category_statistics.size())
      .field("amount_anomalies", amount_anomalies)
      .field("distance_anomalies", distance_anomalies);

  return std::make_shared<const RiskSnapshot>(std::move(scoring), evaluation_instant,
                                              std::move(report));
}

EpochSeconds currentEpochSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace pipeline
}  // namespace sentinel
