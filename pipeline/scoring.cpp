#include "pipeline/scoring.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>

namespace sentinel {
namespace pipeline {

namespace {

struct MomentAccumulator {
  size_t count = 0;
  double sum = 0.0;
  double sum_of_squares = 0.0;

  void add(double value) {
    if (std::isnan(value)) return;
    count += 1;
    sum += value;
    sum_of_squares += value * value;
  }
};

struct Moments {
  double mean;
  double stddev;
};

Moments finalize(const MomentAccumulator& acc, StddevKind kind) {
  if (acc.count == 0) {
    return {std::numeric_limits<double>::quiet_NaN(), 0.0};
  }

  const double n = static_cast<double>(acc.count);
  const double mean = acc.sum / n;

  // Undefined sample deviation of a single value counts as zero
  const double denominator = kind == StddevKind::SAMPLE ? n - 1.0 : n;
  if (denominator <= 0.0) {
    return {mean, 0.0};
  }

  // Rounding can push the squared deviation sum slightly negative
  double squared_deviations = acc.sum_of_squares - acc.sum * mean;
  if (squared_deviations < 0.0) {
    squared_deviations = 0.0;
  }
  return {mean, std::sqrt(squared_deviations / denominator)};
}

}  // namespace

std::vector<CategoryStatistic> computeCategoryStatistics(
    const std::vector<EnrichedTransaction>& batch, StddevKind kind) {
  std::map<std::string, MomentAccumulator> accumulators;
  for (const auto& tx : batch) {
    accumulators[tx.category].add(tx.amount);
  }

  std::vector<CategoryStatistic> statistics;
  statistics.reserve(accumulators.size());
  for (const auto& [category, acc] : accumulators) {
    Moments moments = finalize(acc, kind);
    CategoryStatistic stat;
    stat.category = category;
    stat.mean_amount = moments.mean;
    stat.stddev_amount = moments.stddev;
    stat.count = acc.count;
    statistics.push_back(std::move(stat));
  }
  return statistics;
}

std::optional<GlobalDistanceStatistic> computeDistanceStatistic(
    const std::vector<EnrichedTransaction>& batch, StddevKind kind) {
  MomentAccumulator acc;
  for (const auto& tx : batch) {
    acc.add(tx.distance_km);
  }
  if (acc.count == 0) {
    return std::nullopt;
  }

  Moments moments = finalize(acc, kind);
  GlobalDistanceStatistic stat;
  stat.mean_distance_km = moments.mean;
  stat.stddev_distance_km = moments.stddev;
  stat.count = acc.count;
  return stat;
}

double amountZScore(double amount, const CategoryStatistic& statistic, double epsilon) {
  return (amount - statistic.mean_amount) / (statistic.stddev_amount + epsilon);
}

bool isAmountAnomaly(double z_score, double threshold) {
  return z_score > threshold;
}

bool isDistanceAnomaly(double distance_km, const GlobalDistanceStatistic& statistic,
                       double sigma_multiplier) {
  return distance_km > statistic.mean_distance_km +
                           sigma_multiplier * statistic.stddev_distance_km;
}

AnomalyScorer::AnomalyScorer(ScoringConfig config) : config_(config) {}

ScoringResult AnomalyScorer::score(const std::vector<EnrichedTransaction>& batch) const {
  ScoringResult result;
  if (batch.empty()) {
    return result;
  }

  // Both aggregates are complete before any row is scored
  result.category_statistics = computeCategoryStatistics(batch, config_.stddev_kind);
  result.distance_statistic = computeDistanceStatistic(batch, config_.stddev_kind);

  std::unordered_map<std::string, const CategoryStatistic*> by_category;
  for (const auto& stat : result.category_statistics) {
    by_category.emplace(stat.category, &stat);
  }

  result.transactions.reserve(batch.size());
  for (const auto& tx : batch) {
    ScoredTransaction scored;
    static_cast<EnrichedTransaction&>(scored) = tx;

    const CategoryStatistic& stat = *by_category.at(tx.category);
    scored.amount_z_score = amountZScore(tx.amount, stat, config_.epsilon);
    scored.is_amount_anomaly = isAmountAnomaly(scored.amount_z_score,
                                               config_.amount_z_threshold);
    scored.is_distance_anomaly =
        result.distance_statistic.has_value() &&
        isDistanceAnomaly(tx.distance_km, *result.distance_statistic,
                          config_.distance_sigma_multiplier);

    result.transactions.push_back(std::move(scored));
  }

  return result;
}

}  // namespace pipeline
}  // namespace sentinel
