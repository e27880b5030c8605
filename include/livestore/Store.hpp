#pragma once
#include "livestore/StoreActor.hpp"
#include "livestore/StoreError.hpp"
#include "livestore/StoreObserver.hpp"
#include "livestore/StoreOptions.hpp"
#include "livestore/Value.hpp"
#include "livestore/rt/ThreadPool.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace livestore {

/**
 * Copyable reference to one running store.
 *
 * get()/take() are synchronous and throw StoreTerminated or CallTimeout.
 * assign()/update()/subscribe() only queue the request and return the handle
 * for chaining; the returned handle says nothing about completion.
 *
 * Example:
 *   auto store = StoreHandle::create(pool, {{"val", 0}}).subscribe(inbox, {"val"});
 *   store.update("val", [](const Value& v){ return Value(v.as<int>() + 1); });
 */
class StoreHandle {
public:
  static StoreHandle create(rt::ThreadPool& pool, Assigns initial = {},
                            const StoreOptions& opts = {});
  // Duplicate keys: the last pair wins.
  static StoreHandle create(rt::ThreadPool& pool, const AssignList& initial,
                            const StoreOptions& opts = {});
  static StoreHandle create(rt::ThreadPool& pool,
                            std::initializer_list<AssignList::value_type> initial,
                            const StoreOptions& opts = {});

  Value   get(const Key& key, const Value& def = Value{}) const;
  Assigns take(const std::vector<Key>& keys) const;

  StoreHandle assign(const Key& key, Value value) const;
  StoreHandle assign(Assigns attrs) const;
  StoreHandle assign(AssignList attrs) const;
  StoreHandle assign(std::initializer_list<AssignList::value_type> attrs) const;

  StoreHandle update(const Key& key, UpdateFn fn) const;

  StoreHandle subscribe(const ObserverRef& observer, const std::vector<Key>& keys) const;

  // Terminates the actor once everything queued before it has been processed.
  void stop(std::string reason = "normal") const;

  // `fn(reason)` runs once when the actor terminates; immediately if it already has.
  void monitor(StoreActor::MonitorFn fn) const;

  bool isAlive() const noexcept { return actor_->alive(); }
  std::string exitReason() const { return actor_->exitReason(); }

  std::uint64_t id() const noexcept { return actor_->id(); }
  const std::string& name() const noexcept { return actor_->name(); }

  friend bool operator==(const StoreHandle& a, const StoreHandle& b) noexcept { return a.actor_ == b.actor_; }
  friend bool operator!=(const StoreHandle& a, const StoreHandle& b) noexcept { return a.actor_ != b.actor_; }
  friend bool operator<(const StoreHandle& a, const StoreHandle& b) noexcept { return a.actor_ < b.actor_; }

private:
  explicit StoreHandle(std::shared_ptr<StoreActor> actor) : actor_(std::move(actor)) {}

  std::shared_ptr<StoreActor> actor_;
};

} // namespace livestore

namespace std {
template <>
struct hash<livestore::StoreHandle> {
  size_t operator()(const livestore::StoreHandle& h) const noexcept {
    return std::hash<std::uint64_t>{}(h.id());
  }
};
} // namespace std
