#include "pipeline/filter.hpp"

#include <unordered_set>

namespace sentinel {
namespace pipeline {

bool matchesCriteria(const ScoredTransaction& tx, const FilterCriteria& criteria) {
  if (criteria.selected_categories.count(tx.category) == 0) {
    return false;
  }
  return !criteria.anomalies_only || tx.isAnomalous();
}

ScoredView filterTransactions(const std::vector<ScoredTransaction>& rows,
                              const FilterCriteria& criteria) {
  ScoredView view;
  if (criteria.selected_categories.empty()) {
    return view;
  }
  for (const auto& tx : rows) {
    if (matchesCriteria(tx, criteria)) {
      view.push_back(&tx);
    }
  }
  return view;
}

ScoredView filterView(const ScoredView& view, const FilterCriteria& criteria) {
  ScoredView narrowed;
  for (const ScoredTransaction* tx : view) {
    if (matchesCriteria(*tx, criteria)) {
      narrowed.push_back(tx);
    }
  }
  return narrowed;
}

std::vector<std::string> allCategories(const std::vector<ScoredTransaction>& rows) {
  std::vector<std::string> categories;
  std::unordered_set<std::string> seen;
  for (const auto& tx : rows) {
    if (seen.insert(tx.category).second) {
      categories.push_back(tx.category);
    }
  }
  return categories;
}

FilterCriteria selectAll(const std::vector<ScoredTransaction>& rows, bool anomalies_only) {
  FilterCriteria criteria;
  for (const auto& tx : rows) {
    criteria.selected_categories.insert(tx.category);
  }
  criteria.anomalies_only = anomalies_only;
  return criteria;
}

}  // namespace pipeline
}  // namespace sentinel
