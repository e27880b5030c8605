#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace livestore {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: a background reporter logs a snapshot every N seconds.
class MetricRegistry {
public:
  static MetricRegistry& instance() {
    static MetricRegistry inst;
    return inst;
  }

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  // Restarts the reporter if it is already running.
  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();
  bool reporterRunning() const { return running_.load(std::memory_order_acquire); }

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  // 0 when the counter was never touched.
  double counter(const std::string& name) const;

  // Snapshots (cheap copies) for tests and diagnostics.
  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::mutex runMu_;
  std::condition_variable runCv_;
  std::atomic<bool> running_{false};
  std::thread thr_;
};

} // namespace util
} // namespace livestore

#define LIVESTORE_METRIC_INC(name, d) ::livestore::util::MetricRegistry::instance().increment((name), (d))
#define LIVESTORE_METRIC_HIT(name)    ::livestore::util::MetricRegistry::instance().increment((name), 1.0)
#define LIVESTORE_METRIC_SET(name, v) ::livestore::util::MetricRegistry::instance().setGauge((name), (v))
