#include "utilities/metrics.h"
#include <algorithm>
#include <set>
#include <sstream>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

namespace {

std::string makeKey(const std::string &name,
                    const MetricsRegistry::Labels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

std::pair<std::string, std::string> splitKey(const std::string &key) {
  auto pos = key.find('{');
  if (pos == std::string::npos)
    return {key, ""};
  return {key.substr(0, pos), key.substr(pos)};
}

// Label values are quoted; backslash, quote and newline must be escaped.
std::string escapeLabel(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

// Adds the le label to an already rendered label set.
std::string withBound(const std::string &labels, const std::string &le) {
  if (labels.empty())
    return "{le=\"" + le + "\"}";
  return labels.substr(0, labels.size() - 1) + ",le=\"" + le + "\"}";
}

} // namespace

const std::vector<double> &MetricsRegistry::bucketBounds() {
  static const std::vector<double> bounds{1,   5,    10,   25,   50,    100,
                                          250, 500, 1000, 2500, 5000, 10000};
  return bounds;
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const Labels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  const auto &bounds = bucketBounds();
  if (h.buckets.empty())
    h.buckets.assign(bounds.size(), 0);
  for (std::size_t i = 0; i < bounds.size(); ++i)
    if (value <= bounds[i])
      ++h.buckets[i];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::counterValue(const std::string &name,
                                     const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(const std::string &name,
                                   const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

unsigned long MetricsRegistry::observationCount(const std::string &name,
                                                const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = histograms_.find(makeKey(name, labels));
  return it == histograms_.end() ? 0 : it->second.count;
}

unsigned long MetricsRegistry::bucketCount(const std::string &name,
                                           double bound,
                                           const Labels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = histograms_.find(makeKey(name, labels));
  if (it == histograms_.end())
    return 0;
  const auto &bounds = bucketBounds();
  auto pos = std::find(bounds.begin(), bounds.end(), bound);
  if (pos == bounds.end())
    return 0;
  return it->second.buckets[pos - bounds.begin()];
}

std::string MetricsRegistry::labelsToString(const Labels &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << escapeLabel(kv.second) << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  std::set<std::string> typed;
  auto typeLine = [&](const std::string &name, const char *type) {
    if (typed.insert(name).second)
      oss << "# TYPE " << name << ' ' << type << '\n';
  };

  for (const auto &kv : gauges_) {
    auto [name, labels] = splitKey(kv.first);
    typeLine(name, "gauge");
    oss << name << labels << ' ' << kv.second << '\n';
  }
  for (const auto &kv : counters_) {
    auto [name, labels] = splitKey(kv.first);
    typeLine(name, "counter");
    oss << name << labels << ' ' << kv.second << '\n';
  }
  for (const auto &kv : histograms_) {
    auto [name, labels] = splitKey(kv.first);
    typeLine(name, "histogram");
    const auto &bounds = bucketBounds();
    for (std::size_t i = 0; i < bounds.size(); ++i) {
      std::ostringstream le;
      le << bounds[i];
      oss << name << "_bucket" << withBound(labels, le.str()) << ' '
          << kv.second.buckets[i] << '\n';
    }
    oss << name << "_bucket" << withBound(labels, "+Inf") << ' '
        << kv.second.count << '\n';
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}
