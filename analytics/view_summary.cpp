#include "analytics/view_summary.hpp"

#include <algorithm>
#include <cmath>

namespace sentinel {
namespace analytics {

ViewSummary summarizeView(const ScoredView& view) {
  ViewSummary summary;
  summary.row_count = view.size();

  size_t labelled = 0;
  size_t frauds = 0;
  size_t distances = 0;
  double distance_sum = 0.0;

  for (const ScoredTransaction* tx : view) {
    if (!std::isnan(tx->amount)) {
      summary.total_amount += tx->amount;
    }
    if (tx->fraud_label.has_value()) {
      labelled += 1;
      if (*tx->fraud_label) frauds += 1;
    }
    if (!std::isnan(tx->distance_km)) {
      distances += 1;
      distance_sum += tx->distance_km;
    }
    if (tx->is_amount_anomaly) summary.amount_anomalies += 1;
    if (tx->is_distance_anomaly) summary.distance_anomalies += 1;
  }

  if (labelled > 0) {
    summary.fraud_rate = static_cast<double>(frauds) / static_cast<double>(labelled);
  }
  if (distances > 0) {
    summary.mean_distance_km = distance_sum / static_cast<double>(distances);
  }
  return summary;
}

ScoredView topAlerts(const ScoredView& view, size_t limit) {
  ScoredView sorted = view;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const ScoredTransaction* a, const ScoredTransaction* b) {
                     const bool a_nan = std::isnan(a->amount_z_score);
                     const bool b_nan = std::isnan(b->amount_z_score);
                     if (a_nan || b_nan) return !a_nan && b_nan;
                     return a->amount_z_score > b->amount_z_score;
                   });
  if (sorted.size() > limit) {
    sorted.resize(limit);
  }
  return sorted;
}

std::optional<AgeGroup> ageGroupFor(int age) {
  if (age <= 0 || age > 100) return std::nullopt;
  if (age <= 25) return AgeGroup::YOUTH;
  if (age <= 40) return AgeGroup::ADULT;
  if (age <= 60) return AgeGroup::SENIOR;
  return AgeGroup::ELDERLY;
}

std::string ageGroupLabel(AgeGroup group) {
  switch (group) {
    case AgeGroup::YOUTH: return "Youth (0-25)";
    case AgeGroup::ADULT: return "Adult (26-40)";
    case AgeGroup::SENIOR: return "Senior (41-60)";
    case AgeGroup::ELDERLY: return "Elderly (60+)";
    default: return "Unknown";
  }
}

RiskMatrix riskMatrix(const ScoredView& view) {
  RiskMatrix matrix;
  for (const ScoredTransaction* tx : view) {
    if (!tx->age || !tx->hour_of_day || !tx->fraud_label || !*tx->fraud_label) {
      continue;
    }
    auto group = ageGroupFor(*tx->age);
    if (!group) continue;
    matrix.fraud_counts[static_cast<size_t>(*group)][static_cast<size_t>(*tx->hour_of_day)] += 1;
  }
  return matrix;
}

}  // namespace analytics
}  // namespace sentinel
