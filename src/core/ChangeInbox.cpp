#include "livestore/ChangeInbox.hpp"

#include <iterator>

namespace livestore {

void ChangeInbox::onStoreChange(const StoreChange& change) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    q_.push_back(change);
  }
  cv_.notify_one();
}

std::optional<StoreChange> ChangeInbox::tryPop() {
  std::lock_guard<std::mutex> lk(mx_);
  if (q_.empty()) return std::nullopt;
  StoreChange c = std::move(q_.front());
  q_.pop_front();
  return c;
}

std::optional<StoreChange> ChangeInbox::waitPop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mx_);
  if (!cv_.wait_for(lk, timeout, [this]{ return !q_.empty(); })) return std::nullopt;
  StoreChange c = std::move(q_.front());
  q_.pop_front();
  return c;
}

std::vector<StoreChange> ChangeInbox::drain() {
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<StoreChange> out(std::make_move_iterator(q_.begin()), std::make_move_iterator(q_.end()));
  q_.clear();
  return out;
}

std::size_t ChangeInbox::size() const {
  std::lock_guard<std::mutex> lk(mx_);
  return q_.size();
}

void ChangeInbox::close() {
  closed_.store(true, std::memory_order_release);
}

} // namespace livestore
