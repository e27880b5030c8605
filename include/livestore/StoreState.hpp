// include/livestore/StoreState.hpp
#pragma once
#include "livestore/StoreObserver.hpp"
#include "livestore/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace livestore {

using UpdateFn = std::function<Value(const Value&)>;

/**
 * The private state of one store: key/value assigns plus per-key observer lists.
 *
 * Not thread-safe. StoreActor owns an instance and only touches it from its
 * strand; tests drive it directly.
 */
class StoreState {
public:
  explicit StoreState(Assigns initial = {}, std::uint64_t storeId = 0);

  Value get(const Key& key, const Value& def = Value{}) const;

  // Keys not present are left out of the result.
  Assigns take(const std::vector<Key>& keys) const;

  // Stores `value` and notifies when the key is absent or holds something else.
  // Returns whether anything changed.
  bool assign(const Key& key, Value value);
  void assignMany(const Assigns& attrs);
  void assignMany(const AssignList& attrs);

  // Feeds the current value (nil when absent) through `fn` and assigns the result.
  // Whatever `fn` throws propagates; nothing is committed in that case.
  bool update(const Key& key, const UpdateFn& fn);

  // Prepends `observer` to each key's list. Duplicates are kept.
  void subscribe(const ObserverRef& observer, const std::vector<Key>& keys);

  // Entries currently listed for `key`, including ones not yet pruned.
  std::size_t subscriberCount(const Key& key) const;

  const Assigns& assigns() const noexcept { return assigns_; }
  std::uint64_t storeId() const noexcept { return storeId_; }

private:
  // Prunes dead observers of `key`, then delivers to the survivors in list order.
  // Returns the number of deliveries.
  std::size_t notify(const Key& key, const Value& value);

private:
  Assigns assigns_;
  std::unordered_map<Key, std::deque<ObserverRef>> subscribers_;
  std::uint64_t storeId_;
};

} // namespace livestore
