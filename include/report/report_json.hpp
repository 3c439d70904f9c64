#ifndef SENTINEL_REPORT_JSON_HPP_
#define SENTINEL_REPORT_JSON_HPP_

#include "../analytics/view_summary.hpp"
#include "../core/transaction.hpp"
#include "../pipeline/risk_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sentinel {
namespace report {

// Absent values and non-finite numbers serialize as null.
nlohmann::json transactionToJson(const ScoredTransaction& tx);
nlohmann::json categoryStatisticToJson(const CategoryStatistic& stat);
nlohmann::json distanceStatisticToJson(const std::optional<GlobalDistanceStatistic>& stat);
nlohmann::json summaryToJson(const analytics::ViewSummary& summary);
nlohmann::json riskMatrixToJson(const analytics::RiskMatrix& matrix);
nlohmann::json viewToJson(const ScoredView& view);

/**
 * Evaluation instant, both statistic summaries and the ingest report.
 */
nlohmann::json snapshotStatisticsToJson(const pipeline::RiskSnapshot& snapshot);

/**
 * Full snapshot: every scored row plus both statistic summaries.
 */
nlohmann::json snapshotToJson(const pipeline::RiskSnapshot& snapshot);

/**
 * Serializes a report document. Strings copied from the input file may
 * hold invalid UTF-8; such bytes are written as U+FFFD.
 */
std::string renderJson(const nlohmann::json& document, int indent = 2);

/**
 * Epoch seconds as "YYYY-MM-DD HH:MM:SS".
 */
std::string formatEpochSeconds(EpochSeconds seconds);

}  // namespace report
}  // namespace sentinel

#endif  // SENTINEL_REPORT_JSON_HPP_
