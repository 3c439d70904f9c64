#ifndef SENTINEL_VIEW_SUMMARY_HPP_
#define SENTINEL_VIEW_SUMMARY_HPP_

#include "../core/transaction.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace sentinel {
namespace analytics {

/**
 * Headline figures over a filtered view.
 */
struct ViewSummary {
  size_t row_count = 0;
  double total_amount = 0.0;           // NaN amounts skipped
  std::optional<double> fraud_rate;    // over labelled rows only
  std::optional<double> mean_distance_km;
  size_t amount_anomalies = 0;
  size_t distance_anomalies = 0;
};

ViewSummary summarizeView(const ScoredView& view);

/**
 * The view sorted by amount z-score, highest first, NaN scores last.
 * Ties keep their view order.
 */
ScoredView topAlerts(const ScoredView& view, size_t limit);

enum class AgeGroup {
  YOUTH,    // (0, 25]
  ADULT,    // (25, 40]
  SENIOR,   // (40, 60]
  ELDERLY   // (60, 100]
};

constexpr size_t kAgeGroupCount = 4;
constexpr size_t kHoursPerDay = 24;

std::optional<AgeGroup> ageGroupFor(int age);
std::string ageGroupLabel(AgeGroup group);

/**
 * Confirmed-fraud counts per age group and hour of day.
 */
struct RiskMatrix {
  std::array<std::array<size_t, kHoursPerDay>, kAgeGroupCount> fraud_counts{};

  size_t at(AgeGroup group, int hour) const {
    return fraud_counts[static_cast<size_t>(group)][static_cast<size_t>(hour)];
  }
};

RiskMatrix riskMatrix(const ScoredView& view);

}  // namespace analytics
}  // namespace sentinel

#endif  // SENTINEL_VIEW_SUMMARY_HPP_
