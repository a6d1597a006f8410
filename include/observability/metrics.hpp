#ifndef MULEGUARD_METRICS_HPP_
#define MULEGUARD_METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <ostream>
#include <mutex>
#include <string>
#include <vector>

namespace muleguard {
namespace observability {

/**
 * Process-wide counters, gauges and histograms with Prometheus text output.
 * Metric values never feed back into analysis results.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Non-copyable
  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  void incrementGauge(const std::string& name, double value = 1.0);
  void decrementGauge(const std::string& name, double value = 1.0);

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  // Help text exported as "# HELP" for a metric once it has a value.
  // Descriptions survive reset().
  void describe(const std::string& name, const std::string& help);

  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  size_t histogramCount(const std::string& name) const;

  /**
   * Observes the elapsed wall time (seconds) into a histogram on destruction.
   */
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format, names in lexical order
  std::string exportMetrics() const;

  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};  // observations falling in this bucket only
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;

  void writeHeader(std::ostream& out, const std::string& name, const char* type) const;

  // Stage durations in seconds
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace muleguard

#endif  // MULEGUARD_METRICS_HPP_
