#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace metapipe {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  // 0.0 for names never touched
  double counter(const std::string& name) const;
  double gauge(const std::string& name) const;

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
};

} // namespace util
} // namespace metapipe

#define METAPIPE_METRIC_INC(name, d) ::metapipe::util::MetricRegistry::instance().increment((name), (d))
#define METAPIPE_METRIC_HIT(name)    ::metapipe::util::MetricRegistry::instance().increment((name), 1.0)
#define METAPIPE_METRIC_SET(name, v) ::metapipe::util::MetricRegistry::instance().setGauge((name), (v))
