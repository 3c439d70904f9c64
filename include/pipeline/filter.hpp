#ifndef SENTINEL_FILTER_HPP_
#define SENTINEL_FILTER_HPP_

#include "../core/transaction.hpp"

#include <string>
#include <vector>

namespace sentinel {
namespace pipeline {

bool matchesCriteria(const ScoredTransaction& tx, const FilterCriteria& criteria);

/**
 * Stable selection over a scored batch. The rows themselves are never
 * copied or modified; callers may reorder the returned view freely.
 */
ScoredView filterTransactions(const std::vector<ScoredTransaction>& rows,
                              const FilterCriteria& criteria);

/**
 * Further narrows an existing view, keeping its order.
 */
ScoredView filterView(const ScoredView& view, const FilterCriteria& criteria);

/**
 * Distinct categories in order of first appearance.
 */
std::vector<std::string> allCategories(const std::vector<ScoredTransaction>& rows);

/**
 * Criteria selecting every category present in `rows`.
 */
FilterCriteria selectAll(const std::vector<ScoredTransaction>& rows, bool anomalies_only = false);

}  // namespace pipeline
}  // namespace sentinel

#endif  // SENTINEL_FILTER_HPP_
