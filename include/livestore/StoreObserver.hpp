#pragma once

#include "livestore/Value.hpp"

#include <memory>

namespace livestore {

// A single change notification: `key` now holds `value`.
struct StoreChange {
  Key key;
  Value value;
};

inline bool operator==(const StoreChange& a, const StoreChange& b) {
  return a.key == b.key && a.value == b.value;
}

/**
 * Recipient of store change notifications.
 *
 * onStoreChange() runs on the store's strand, so implementations must hand the
 * change off (enqueue, post to their own executor) and return without blocking.
 * Synchronous calls back into the same store from here are rejected. A get()
 * or take() on a different store is not detected and can stall until its call
 * timeout when the pool has no other free worker.
 */
class IStoreObserver {
public:
  IStoreObserver() = default;
  virtual ~IStoreObserver() = default;

  IStoreObserver(const IStoreObserver&) = delete;
  IStoreObserver& operator=(const IStoreObserver&) = delete;

  virtual void onStoreChange(const StoreChange& change) = 0;

  // Consulted before every dispatch; false gets the observer pruned.
  virtual bool isAlive() const noexcept { return true; }
};

// Non-owning; the store never extends an observer's lifetime.
using ObserverRef = std::weak_ptr<IStoreObserver>;

} // namespace livestore
