#pragma once
#include "livestore/StoreObserver.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace livestore {

/**
 * Mailbox observer: every change is queued for the owner to consume from its
 * own thread. onStoreChange() only takes the lock and enqueues.
 *
 * close() makes the inbox unreachable; stores drop it on their next change
 * of each key it watched. Messages already queued stay readable.
 */
class ChangeInbox final : public IStoreObserver {
public:
  ChangeInbox() = default;

  void onStoreChange(const StoreChange& change) override;
  bool isAlive() const noexcept override { return !closed_.load(std::memory_order_acquire); }

  std::optional<StoreChange> tryPop();
  std::optional<StoreChange> waitPop(std::chrono::milliseconds timeout);
  std::vector<StoreChange> drain();

  std::size_t size() const;
  void close();

private:
  mutable std::mutex mx_;
  std::condition_variable cv_;
  std::deque<StoreChange> q_;
  std::atomic<bool> closed_{false};
};

} // namespace livestore
