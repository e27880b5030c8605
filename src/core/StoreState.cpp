// src/core/StoreState.cpp
#include "livestore/StoreState.hpp"
#include "livestore/util/Logger.hpp"
#include "livestore/util/Metrics.hpp"

#include <exception>
#include <memory>
#include <utility>

namespace livestore {

using util::logger;
using util::LogLevel;

StoreState::StoreState(Assigns initial, std::uint64_t storeId)
  : assigns_(std::move(initial))
  , storeId_(storeId) {}

Value StoreState::get(const Key& key, const Value& def) const {
  auto it = assigns_.find(key);
  if (it == assigns_.end()) return def;
  return it->second;
}

Assigns StoreState::take(const std::vector<Key>& keys) const {
  Assigns out;
  for (const auto& key : keys) {
    auto it = assigns_.find(key);
    if (it != assigns_.end()) out.emplace(it->first, it->second);
  }
  return out;
}

bool StoreState::assign(const Key& key, Value value) {
  auto it = assigns_.find(key);
  if (it != assigns_.end() && it->second == value) {
    LIVESTORE_METRIC_HIT("livestore.assign.unchanged");
    if (logger().enabled(LogLevel::Trace)) {
      logger().log(LogLevel::Trace, "assign unchanged",
                   {{"store", std::to_string(storeId_)}, {"key", key}});
    }
    return false;
  }

  if (it == assigns_.end()) {
    it = assigns_.emplace(key, std::move(value)).first;
  } else {
    it->second = std::move(value);
  }
  LIVESTORE_METRIC_HIT("livestore.assign.changed");

  if (logger().enabled(LogLevel::Debug)) {
    logger().log(LogLevel::Debug, "assign",
                 {{"store", std::to_string(storeId_)}, {"key", key}, {"value", toString(it->second)}});
  }

  notify(key, it->second);
  return true;
}

void StoreState::assignMany(const Assigns& attrs) {
  for (const auto& [key, value] : attrs) {
    assign(key, value);
  }
}

void StoreState::assignMany(const AssignList& attrs) {
  for (const auto& [key, value] : attrs) {
    assign(key, value);
  }
}

bool StoreState::update(const Key& key, const UpdateFn& fn) {
  Value next = fn(get(key));
  return assign(key, std::move(next));
}

void StoreState::subscribe(const ObserverRef& observer, const std::vector<Key>& keys) {
  for (const auto& key : keys) {
    subscribers_[key].push_front(observer);
  }
  if (logger().enabled(LogLevel::Debug)) {
    logger().log(LogLevel::Debug, "subscribe",
                 {{"store", std::to_string(storeId_)}, {"keys", std::to_string(keys.size())}});
  }
}

std::size_t StoreState::subscriberCount(const Key& key) const {
  auto it = subscribers_.find(key);
  return it == subscribers_.end() ? 0 : it->second.size();
}

std::size_t StoreState::notify(const Key& key, const Value& value) {
  auto sit = subscribers_.find(key);
  if (sit == subscribers_.end()) return 0;

  // Keep only observers that are still reachable; the filtered list replaces
  // the stored one.
  auto& refs = sit->second;
  std::vector<std::shared_ptr<IStoreObserver>> live;
  live.reserve(refs.size());
  std::deque<ObserverRef> kept;
  for (auto& ref : refs) {
    auto obs = ref.lock();
    if (obs && obs->isAlive()) {
      live.push_back(std::move(obs));
      kept.push_back(ref);
    }
  }

  const std::size_t pruned = refs.size() - kept.size();
  refs.swap(kept);
  if (pruned > 0) {
    LIVESTORE_METRIC_INC("livestore.notify.pruned", static_cast<double>(pruned));
    logger().log(LogLevel::Debug, "pruned dead observers",
                 {{"store", std::to_string(storeId_)}, {"key", key}, {"count", std::to_string(pruned)}});
  }

  const StoreChange change{key, value};
  std::size_t delivered = 0;
  for (auto& obs : live) {
    try {
      obs->onStoreChange(change);
      ++delivered;
    } catch (const std::exception& ex) {
      LIVESTORE_METRIC_HIT("livestore.notify.failed");
      logger().log(LogLevel::Warn, "observer threw on store change",
                   {{"store", std::to_string(storeId_)}, {"key", key}, {"what", ex.what()}});
    } catch (...) {
      LIVESTORE_METRIC_HIT("livestore.notify.failed");
      logger().log(LogLevel::Warn, "observer threw on store change",
                   {{"store", std::to_string(storeId_)}, {"key", key}, {"what", "unknown"}});
    }
  }
  if (delivered > 0) {
    LIVESTORE_METRIC_INC("livestore.notify.delivered", static_cast<double>(delivered));
  }
  return delivered;
}

} // namespace livestore
