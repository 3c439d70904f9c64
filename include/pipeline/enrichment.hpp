#ifndef SENTINEL_ENRICHMENT_HPP_
#define SENTINEL_ENRICHMENT_HPP_

#include "../core/transaction.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace sentinel {
namespace pipeline {

/**
 * floor(floor((evaluation - dob) / 1 day) / 365). Approximate, no
 * leap-year correction. Absent when the date of birth is absent.
 */
std::optional<int> ageInYears(const std::optional<EpochSeconds>& date_of_birth,
                              EpochSeconds evaluation_instant);

/**
 * Civil hour 0-23 of the timestamp, absent when the timestamp is absent.
 */
std::optional<int> hourOfDay(const std::optional<EpochSeconds>& timestamp);

/**
 * Derives the row-local features for a single transaction.
 */
EnrichedTransaction enrichTransaction(const RawTransaction& raw,
                                      EpochSeconds evaluation_instant);

/**
 * Owns a set of worker threads and joins every started worker when it goes
 * out of scope, including during stack unwinding.
 */
class WorkerGroup {
 public:
  WorkerGroup() = default;
  ~WorkerGroup();

  // Non-copyable
  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  template <typename Function, typename... Args>
  void spawn(Function&& function, Args&&... args) {
    auto worker = std::make_unique<std::thread>(std::forward<Function>(function),
                                                std::forward<Args>(args)...);
    try {
      workers_.push_back(std::move(worker));
    } catch (...) {
      worker->join();
      throw;
    }
  }

  void joinAll();

  size_t size() const { return workers_.size(); }

 private:
  std::vector<std::unique_ptr<std::thread>> workers_;
};

/**
 * Feature enrichment over a whole batch.
 * Rows are independent, so the batch is split into contiguous slices that
 * worker threads fill in place; output order always equals input order.
 */
class EnrichmentStage {
 public:
  explicit EnrichmentStage(size_t num_worker_threads = 1,
                           size_t min_rows_per_worker = 1024);

  std::vector<EnrichedTransaction> enrich(const std::vector<RawTransaction>& batch,
                                          EpochSeconds evaluation_instant) const;

  size_t workerCountFor(size_t rows) const;

 private:
  size_t num_workers_;
  size_t min_rows_per_worker_;
};

}  // namespace pipeline
}  // namespace sentinel

#endif  // SENTINEL_ENRICHMENT_HPP_
