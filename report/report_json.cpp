#include "report/report_json.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace sentinel {
namespace report {

namespace {

nlohmann::json number(double value) {
  if (!std::isfinite(value)) return nullptr;
  return value;
}

template <typename T>
nlohmann::json optionalValue(const std::optional<T>& value) {
  if (!value) return nullptr;
  return *value;
}

nlohmann::json optionalNumber(const std::optional<double>& value) {
  if (!value) return nullptr;
  return number(*value);
}

nlohmann::json optionalTime(const std::optional<EpochSeconds>& value) {
  if (!value) return nullptr;
  return formatEpochSeconds(*value);
}

// Inverse of ingest::daysFromCivil.
void civilFromDays(std::int64_t days, int& year, unsigned& month, unsigned& day) {
  days += 719468;
  const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  day = doy - (153 * mp + 2) / 5 + 1;
  month = mp < 10 ? mp + 3 : mp - 9;
  year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
}

}  // namespace

std::string formatEpochSeconds(EpochSeconds seconds) {
  std::int64_t days = seconds / 86400;
  std::int64_t remainder = seconds % 86400;
  if (remainder < 0) {
    remainder += 86400;
    days -= 1;
  }

  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civilFromDays(days, year, month, day);

  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-"
     << std::setw(2) << day << " " << std::setw(2) << remainder / 3600 << ":"
     << std::setw(2) << (remainder % 3600) / 60 << ":" << std::setw(2) << remainder % 60;
  return ss.str();
}

std::string renderJson(const nlohmann::json& document, int indent) {
  return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json transactionToJson(const ScoredTransaction& tx) {
  nlohmann::json j;
  j["trans_date_trans_time"] = optionalTime(tx.transaction_time);
  j["category"] = tx.category;
  j["amt"] = number(tx.amount);
  j["lat"] = number(tx.cardholder_latitude);
  j["long"] = number(tx.cardholder_longitude);
  j["merch_lat"] = number(tx.merchant_latitude);
  j["merch_long"] = number(tx.merchant_longitude);
  j["dob"] = optionalTime(tx.date_of_birth);
  j["is_fraud"] = optionalValue(tx.fraud_label);
  j["merchant"] = tx.merchant_name;
  j["age"] = optionalValue(tx.age);
  j["hour"] = optionalValue(tx.hour_of_day);
  j["dist_km"] = number(tx.distance_km);
  j["z_score_amt"] = number(tx.amount_z_score);
  j["is_value_anomaly"] = tx.is_amount_anomaly;
  j["is_dist_anomaly"] = tx.is_distance_anomaly;
  return j;
}

nlohmann::json categoryStatisticToJson(const CategoryStatistic& stat) {
  nlohmann::json j;
  j["category"] = stat.category;
  j["mean_amount"] = number(stat.mean_amount);
  j["stddev_amount"] = number(stat.stddev_amount);
  j["count"] = stat.count;
  return j;
}

nlohmann::json distanceStatisticToJson(const std::optional<GlobalDistanceStatistic>& stat) {
  if (!stat) return nullptr;
  nlohmann::json j;
  j["mean_distance_km"] = number(stat->mean_distance_km);
  j["stddev_distance_km"] = number(stat->stddev_distance_km);
  j["count"] = stat->count;
  return j;
}

nlohmann::json summaryToJson(const analytics::ViewSummary& summary) {
  nlohmann::json j;
  j["rows"] = summary.row_count;
  j["total_amount"] = number(summary.total_amount);
  j["fraud_rate"] = optionalNumber(summary.fraud_rate);
  j["mean_distance_km"] = optionalNumber(summary.mean_distance_km);
  j["amount_anomalies"] = summary.amount_anomalies;
  j["distance_anomalies"] = summary.distance_anomalies;
  return j;
}

nlohmann::json riskMatrixToJson(const analytics::RiskMatrix& matrix) {
  nlohmann::json j = nlohmann::json::array();
  for (size_t g = 0; g < analytics::kAgeGroupCount; ++g) {
    auto group = static_cast<analytics::AgeGroup>(g);
    nlohmann::json row;
    row["age_group"] = analytics::ageGroupLabel(group);
    row["fraud_by_hour"] = matrix.fraud_counts[g];
    j.push_back(row);
  }
  return j;
}

nlohmann::json viewToJson(const ScoredView& view) {
  nlohmann::json j = nlohmann::json::array();
  for (const ScoredTransaction* tx : view) {
    j.push_back(transactionToJson(*tx));
  }
  return j;
}

nlohmann::json snapshotStatisticsToJson(const pipeline::RiskSnapshot& snapshot) {
  nlohmann::json j;
  j["evaluation_instant"] = formatEpochSeconds(snapshot.evaluationInstant());

  nlohmann::json categories = nlohmann::json::array();
  for (const auto& stat : snapshot.categoryStatistics()) {
    categories.push_back(categoryStatisticToJson(stat));
  }
  j["category_statistics"] = categories;
  j["distance_statistic"] = distanceStatisticToJson(snapshot.distanceStatistic());

  const auto& ingest = snapshot.ingestReport();
  j["ingest"] = {{"source", ingest.source},
                 {"rows_read", ingest.rows_read},
                 {"malformed_fields", ingest.malformed_fields},
                 {"short_rows", ingest.short_rows}};
  return j;
}

nlohmann::json snapshotToJson(const pipeline::RiskSnapshot& snapshot) {
  nlohmann::json j = snapshotStatisticsToJson(snapshot);

  nlohmann::json rows = nlohmann::json::array();
  for (const auto& tx : snapshot.transactions()) {
    rows.push_back(transactionToJson(tx));
  }
  j["transactions"] = rows;
  return j;
}

}  // namespace report
}  // namespace sentinel
