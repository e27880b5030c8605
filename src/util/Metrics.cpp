#include "livestore/util/Metrics.hpp"
#include "livestore/util/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

namespace livestore {
namespace util {

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(runMu_);
    running_.store(false, std::memory_order_release);
  }
  runCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  const auto period = std::chrono::seconds(intervalSeconds > 0 ? intervalSeconds : 10);

  for (;;) {
    {
      std::unique_lock<std::mutex> lk(runMu_);
      if (runCv_.wait_for(lk, period, [this]{ return !running_.load(std::memory_order_acquire); })) {
        return;
      }
    }

    std::vector<Field> fields;
    {
      std::lock_guard<std::mutex> lk(mu_);
      for (auto& kv : counters_) fields.push_back({kv.first, std::to_string(kv.second)});
      for (auto& kv : gauges_)   fields.push_back({kv.first, std::to_string(kv.second)});
    }
    if (fields.empty()) continue;

    std::sort(fields.begin(), fields.end(), [](const Field& a, const Field& b){ return a.k < b.k; });
    logger().log(LogLevel::Info, "metrics", fields);
  }
}

} // namespace util
} // namespace livestore
