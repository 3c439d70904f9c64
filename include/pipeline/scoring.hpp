#ifndef SENTINEL_SCORING_HPP_
#define SENTINEL_SCORING_HPP_

#include "../core/transaction.hpp"

#include <optional>
#include <vector>

namespace sentinel {
namespace pipeline {

/**
 * Thresholds and numeric policy for the anomaly signals.
 */
struct ScoringConfig {
  // Added to every category stddev so single-member and zero-variance
  // categories still produce a finite z-score
  double epsilon = 1e-9;
  double amount_z_threshold = 2.0;
  double distance_sigma_multiplier = 2.0;
  StddevKind stddev_kind = StddevKind::POPULATION;
};

/**
 * Output of one scoring pass. Statistics are recomputed on every pass.
 */
struct ScoringResult {
  std::vector<ScoredTransaction> transactions;
  std::vector<CategoryStatistic> category_statistics;  // sorted by category
  std::optional<GlobalDistanceStatistic> distance_statistic;
};

/**
 * Per-category mean and stddev of amount, two passes: accumulate count,
 * sum and sum of squares per key, then derive mean and stddev per key.
 * NaN amounts do not contribute.
 */
std::vector<CategoryStatistic> computeCategoryStatistics(
    const std::vector<EnrichedTransaction>& batch, StddevKind kind);

/**
 * Mean and stddev of distance_km over the whole batch, NaN skipped.
 * Absent when no row has a finite distance.
 */
std::optional<GlobalDistanceStatistic> computeDistanceStatistic(
    const std::vector<EnrichedTransaction>& batch, StddevKind kind);

double amountZScore(double amount, const CategoryStatistic& statistic, double epsilon);

bool isAmountAnomaly(double z_score, double threshold);

// Strict: a distance exactly on the threshold is not an anomaly.
bool isDistanceAnomaly(double distance_km, const GlobalDistanceStatistic& statistic,
                       double sigma_multiplier);

/**
 * Scores a fully enriched batch. Stateless apart from its configuration.
 */
class AnomalyScorer {
 public:
  explicit AnomalyScorer(ScoringConfig config = ScoringConfig{});

  ScoringResult score(const std::vector<EnrichedTransaction>& batch) const;

  const ScoringConfig& config() const { return config_; }

 private:
  ScoringConfig config_;
};

}  // namespace pipeline
}  // namespace sentinel

#endif  // SENTINEL_SCORING_HPP_
