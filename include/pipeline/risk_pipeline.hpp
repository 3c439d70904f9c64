#ifndef SENTINEL_RISK_PIPELINE_HPP_
#define SENTINEL_RISK_PIPELINE_HPP_

#include "../core/transaction.hpp"
#include "../ingest/csv_reader.hpp"
#include "enrichment.hpp"
#include "scoring.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {
namespace pipeline {

/**
 * Immutable result of one enrichment + scoring run.
 * Built once and shared read-only with every consumer.
 */
class RiskSnapshot {
 public:
  RiskSnapshot(ScoringResult scoring, EpochSeconds evaluation_instant,
               ingest::IngestReport ingest_report);

  const std::vector<ScoredTransaction>& transactions() const { return transactions_; }
  const std::vector<CategoryStatistic>& categoryStatistics() const { return category_statistics_; }
  const std::optional<GlobalDistanceStatistic>& distanceStatistic() const {
    return distance_statistic_;
  }
  EpochSeconds evaluationInstant() const { return evaluation_instant_; }
  const ingest::IngestReport& ingestReport() const { return ingest_report_; }

  // nullptr when the category has no rows
  const CategoryStatistic* findCategory(const std::string& category) const;

  // Distinct categories in first-appearance order
  std::vector<std::string> categories() const;

  size_t size() const { return transactions_.size(); }
  bool empty() const { return transactions_.empty(); }

 private:
  std::vector<ScoredTransaction> transactions_;
  std::vector<CategoryStatistic> category_statistics_;
  std::optional<GlobalDistanceStatistic> distance_statistic_;
  EpochSeconds evaluation_instant_;
  ingest::IngestReport ingest_report_;
};

struct PipelineConfig {
  ingest::IngestOptions ingest{};
  size_t enrichment_workers = 1;
  ScoringConfig scoring{};
};

/**
 * Runs ingestion, enrichment and scoring in order. Nothing is cached
 * between runs; call run() again for an updated batch.
 */
class RiskPipeline {
 public:
  explicit RiskPipeline(PipelineConfig config = PipelineConfig{});

  std::shared_ptr<const RiskSnapshot> run(const std::vector<RawTransaction>& batch,
                                          EpochSeconds evaluation_instant) const;

  /**
   * Reads the CSV first; structural input errors throw IngestError before
   * enrichment starts.
   */
  std::shared_ptr<const RiskSnapshot> runFile(const std::string& path,
                                              EpochSeconds evaluation_instant) const;

  const PipelineConfig& config() const { return config_; }

 private:
  std::shared_ptr<const RiskSnapshot> runStages(const std::vector<RawTransaction>& batch,
                                                EpochSeconds evaluation_instant,
                                                ingest::IngestReport report) const;

  PipelineConfig config_;
  EnrichmentStage enrichment_;
  AnomalyScorer scorer_;
};

/**
 * Current wall-clock time as epoch seconds.
 */
EpochSeconds currentEpochSeconds();

}  // namespace pipeline
}  // namespace sentinel

#endif  // SENTINEL_RISK_PIPELINE_HPP_
