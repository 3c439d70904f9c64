#ifndef SENTINEL_TRANSACTION_HPP_
#define SENTINEL_TRANSACTION_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sentinel {

// Seconds since 1970-01-01T00:00:00 of a naive civil time read as UTC.
using EpochSeconds = std::int64_t;

/**
 * One row of the input batch, as read from the source file.
 * Unparsable numeric fields hold NaN, unparsable dates are absent.
 */
struct RawTransaction {
  std::optional<EpochSeconds> transaction_time;
  std::string category;
  double amount = 0.0;
  double cardholder_latitude = 0.0;
  double cardholder_longitude = 0.0;
  double merchant_latitude = 0.0;
  double merchant_longitude = 0.0;
  std::optional<EpochSeconds> date_of_birth;
  std::optional<bool> fraud_label;
  std::string merchant_name;
};

/**
 * Row-local features derived from a RawTransaction.
 */
struct EnrichedTransaction : RawTransaction {
  std::optional<int> age;          // approximate years, not a legal age
  std::optional<int> hour_of_day;  // 0-23
  double distance_km = 0.0;
};

/**
 * Enriched row plus the anomaly signals computed against batch statistics.
 */
struct ScoredTransaction : EnrichedTransaction {
  double amount_z_score = 0.0;
  bool is_amount_anomaly = false;
  bool is_distance_anomaly = false;

  bool isAnomalous() const { return is_amount_anomaly || is_distance_anomaly; }
};

enum class StddevKind {
  POPULATION,  // divide by n
  SAMPLE       // divide by n - 1, undefined below two members (treated as 0)
};

struct CategoryStatistic {
  std::string category;
  double mean_amount = 0.0;
  double stddev_amount = 0.0;
  size_t count = 0;
};

struct GlobalDistanceStatistic {
  double mean_distance_km = 0.0;
  double stddev_distance_km = 0.0;
  size_t count = 0;
};

/**
 * Caller-supplied selection. An empty category set selects nothing.
 */
struct FilterCriteria {
  std::set<std::string> selected_categories;
  bool anomalies_only = false;
};

// Read-only selection over a scored batch. Pointers stay valid as long as
// the owning collection is alive and unmodified.
using ScoredView = std::vector<const ScoredTransaction*>;

}  // namespace sentinel

#endif  // SENTINEL_TRANSACTION_HPP_
