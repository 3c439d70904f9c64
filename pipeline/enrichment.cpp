#include "pipeline/enrichment.hpp"

#include "observability/logger.hpp"
#include "pipeline/geo.hpp"

#include <algorithm>
#include <functional>
#include <thread>

namespace sentinel {
namespace pipeline {

namespace {

constexpr EpochSeconds kSecondsPerDay = 86400;
constexpr EpochSeconds kDaysPerYear = 365;

// Division rounding toward negative infinity.
EpochSeconds floorDiv(EpochSeconds value, EpochSeconds divisor) {
  EpochSeconds quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    quotient -= 1;
  }
  return quotient;
}

void enrichRange(const std::vector<RawTransaction>& batch,
                 std::vector<EnrichedTransaction>& output,
                 size_t begin, size_t end, EpochSeconds evaluation_instant) {
  for (size_t i = begin; i < end; ++i) {
    output[i] = enrichTransaction(batch[i], evaluation_instant);
  }
}

}  // namespace

std::optional<int> ageInYears(const std::optional<EpochSeconds>& date_of_birth,
                              EpochSeconds evaluation_instant) {
  if (!date_of_birth) return std::nullopt;
  EpochSeconds days = floorDiv(evaluation_instant - *date_of_birth, kSecondsPerDay);
  return static_cast<int>(floorDiv(days, kDaysPerYear));
}

std::optional<int> hourOfDay(const std::optional<EpochSeconds>& timestamp) {
  if (!timestamp) return std::nullopt;
  EpochSeconds seconds_into_day = *timestamp - floorDiv(*timestamp, kSecondsPerDay) * kSecondsPerDay;
  return static_cast<int>(seconds_into_day / 3600);
}

EnrichedTransaction enrichTransaction(const RawTransaction& raw,
                                      EpochSeconds evaluation_instant) {
  EnrichedTransaction enriched;
  static_cast<RawTransaction&>(enriched) = raw;
  enriched.age = ageInYears(raw.date_of_birth, evaluation_instant);
  enriched.hour_of_day = hourOfDay(raw.transaction_time);
  enriched.distance_km = haversineKm(raw.cardholder_latitude, raw.cardholder_longitude,
                                     raw.merchant_latitude, raw.merchant_longitude);
  return enriched;
}

WorkerGroup::~WorkerGroup() {
  joinAll();
}

void WorkerGroup::joinAll() {
  for (auto& worker : workers_) {
    if (worker && worker->joinable()) {
      worker->join();
    }
  }
}

EnrichmentStage::EnrichmentStage(size_t num_worker_threads, size_t min_rows_per_worker)
    : num_workers_(std::max<size_t>(1, num_worker_threads)),
      min_rows_per_worker_(std::max<size_t>(1, min_rows_per_worker)) {
}

size_t EnrichmentStage::workerCountFor(size_t rows) const {
  if (rows == 0) return 1;
  size_t by_size = (rows + min_rows_per_worker_ - 1) / min_rows_per_worker_;
  return std::max<size_t>(1, std::min(num_workers_, by_size));
}

std::vector<EnrichedTransaction> EnrichmentStage::enrich(
    const std::vector<RawTransaction>& batch, EpochSeconds evaluation_instant) const {
  std::vector<EnrichedTransaction> output(batch.size());

  const size_t workers = workerCountFor(batch.size());
  if (workers <= 1) {
    enrichRange(batch, output, 0, batch.size(), evaluation_instant);
    return output;
  }

  SENTINEL_LOG_BUILDER(observability::LogLevel::DEBUG, "Enriching in parallel")
      .field("rows", batch.size())
      .field("workers", workers);

  // Each worker owns a disjoint slice of the pre-sized output
  const size_t slice = (batch.size() + workers - 1) / workers;
  WorkerGroup group;
  for (size_t w = 0; w < workers; ++w) {
    size_t begin = w * slice;
    size_t end = std::min(batch.size(), begin + slice);
    if (begin >= end) break;
    group.spawn(enrichRange, std::cref(batch), std::ref(output), begin, end,
                evaluation_instant);
  }

  // Scoring needs every row, so join all workers before returning
  group.joinAll();

  return output;
}

}  // namespace pipeline
}  // namespace sentinel
