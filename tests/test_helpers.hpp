#ifndef SENTINEL_TEST_HELPERS_HPP_
#define SENTINEL_TEST_HELPERS_HPP_

#include "core/transaction.hpp"

#include <string>

namespace sentinel {
namespace testing {

// 2020-06-21T00:00:00Z
constexpr EpochSeconds kEvaluationInstant = 1592697600;

inline RawTransaction makeRaw(const std::string& category, double amount,
                              double lat = 40.0, double lon = -75.0,
                              double merch_lat = 40.0, double merch_lon = -75.0) {
  RawTransaction tx;
  tx.category = category;
  tx.amount = amount;
  tx.cardholder_latitude = lat;
  tx.cardholder_longitude = lon;
  tx.merchant_latitude = merch_lat;
  tx.merchant_longitude = merch_lon;
  tx.fraud_label = false;
  tx.merchant_name = "merchant_" + category;
  return tx;
}

inline EnrichedTransaction makeEnriched(const std::string& category, double amount,
                                        double distance_km = 0.0) {
  EnrichedTransaction tx;
  static_cast<RawTransaction&>(tx) = makeRaw(category, amount);
  tx.distance_km = distance_km;
  return tx;
}

inline ScoredTransaction makeScored(const std::string& category, double amount,
                                    bool amount_anomaly = false,
                                    bool distance_anomaly = false) {
  ScoredTransaction tx;
  static_cast<EnrichedTransaction&>(tx) = makeEnriched(category, amount);
  tx.is_amount_anomaly = amount_anomaly;
  tx.is_distance_anomaly = distance_anomaly;
  return tx;
}

}  // namespace testing
}  // namespace sentinel

#endif  // SENTINEL_TEST_HELPERS_HPP_
