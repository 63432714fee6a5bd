#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Process-wide metrics registry exporting Prometheus text format.
 *
 * Series are keyed by name plus label set. Output is sorted by series key so
 * scrapes are stable.
 */
class MetricsRegistry {
public:
  using Labels = std::map<std::string, std::string>;

  static MetricsRegistry &instance();

  void setGauge(const std::string &name, double value,
                const Labels &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const Labels &labels = {});

  /// Upper bounds of the histogram buckets, in the unit observed (ms).
  static const std::vector<double> &bucketBounds();

  /** Record an observation in a cumulative bucketed histogram. */
  void observe(const std::string &name, double value,
               const Labels &labels = {});

  /// Current counter value, 0 when the series has never been touched.
  double counterValue(const std::string &name, const Labels &labels = {}) const;
  double gaugeValue(const std::string &name, const Labels &labels = {}) const;
  unsigned long observationCount(const std::string &name,
                                 const Labels &labels = {}) const;
  /// Observations at or below bound; bound must be one of bucketBounds().
  unsigned long bucketCount(const std::string &name, double bound,
                            const Labels &labels = {}) const;

  std::string toPrometheus() const;

  /** Clear all stored metrics. Used by tests. */
  void reset();

  static std::string labelsToString(const Labels &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
    std::vector<unsigned long> buckets; // cumulative, parallel to bucketBounds()
  };

  mutable std::mutex mtx_;
  std::map<std::string, double> gauges_;
  std::map<std::string, double> counters_;
  std::map<std::string, Histogram> histograms_;
};
