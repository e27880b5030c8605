#pragma once
#include "livestore/StoreObserver.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace livestore::test {

// Shared, ordered record of deliveries across several observers.
class DeliveryLog {
public:
  void record(const std::string& who, const StoreChange& c) {
    std::lock_guard<std::mutex> lk(mx_);
    entries_.emplace_back(who, c);
  }

  std::vector<std::pair<std::string, StoreChange>> entries() const {
    std::lock_guard<std::mutex> lk(mx_);
    return entries_;
  }

  std::vector<std::string> who() const {
    std::lock_guard<std::mutex> lk(mx_);
    std::vector<std::string> out;
    for (auto& e : entries_) out.push_back(e.first);
    return out;
  }

private:
  mutable std::mutex mx_;
  std::vector<std::pair<std::string, StoreChange>> entries_;
};

// Stub observer that writes every change into a DeliveryLog under its name.
class RecordingObserver : public IStoreObserver {
public:
  RecordingObserver(std::string name, std::shared_ptr<DeliveryLog> log)
    : name_(std::move(name)), log_(std::move(log)) {}

  void onStoreChange(const StoreChange& change) override { log_->record(name_, change); }
  bool isAlive() const noexcept override { return alive_.load(); }

  void kill() { alive_ = false; }

private:
  std::string name_;
  std::shared_ptr<DeliveryLog> log_;
  std::atomic<bool> alive_{true};
};

} // namespace livestore::test
