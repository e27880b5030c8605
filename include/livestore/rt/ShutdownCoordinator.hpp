#pragma once
#include "livestore/util/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace livestore::rt {

class ShutdownCoordinator {
public:
  // Lower order runs earlier; higher order runs later.
  void registerStep(std::string name, int order, std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mx_);
    steps_.push_back({std::move(name), order, std::move(fn)});
  }

  // Idempotent stop: each step executed once, in ascending order.
  // A throwing step is logged and the remaining steps still run.
  void stop() {
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return; // already stopping
    }
    std::vector<Step> run;
    {
      std::lock_guard<std::mutex> lk(mx_);
      run = steps_;
    }
    std::stable_sort(run.begin(), run.end(), [](const Step& a, const Step& b){
      return a.order < b.order;
    });
    for (auto& s : run) {
      try {
        s.fn();
      } catch (const std::exception& ex) {
        util::logger().log(util::LogLevel::Warn, "shutdown step failed",
                           {{"step", s.name}, {"what", ex.what()}});
      }
    }
  }

  bool stopping() const noexcept { return stopping_.load(std::memory_order_acquire); }

private:
  struct Step { std::string name; int order; std::function<void()> fn; };
  std::vector<Step> steps_;
  std::atomic<bool> stopping_{false};
  std::mutex mx_;
};

} // namespace livestore::rt
