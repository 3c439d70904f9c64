#ifndef SENTINEL_METRICS_HPP_
#define SENTINEL_METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sentinel {
namespace observability {

/**
 * Metrics collection for pipeline runs.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  // Attach a HELP line to a metric of any kind
  void describe(const std::string& name, const std::string& help);

  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  size_t histogramCount(const std::string& name) const;

  // Observes elapsed seconds into a histogram on destruction
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  // Reset all metrics
  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const std::string& fallback) const;

  mutable std::mutex mutex_;
  // Ordered so the export is stable between runs
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace sentinel

#endif  // SENTINEL_METRICS_HPP_
