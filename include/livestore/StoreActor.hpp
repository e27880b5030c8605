#pragma once
#include "livestore/StoreOptions.hpp"
#include "livestore/StoreState.hpp"
#include "livestore/rt/ThreadPool.hpp"

#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace livestore {

/**
 * One store instance: a StoreState reachable only through handlers posted to a
 * strand on the pool's io_context. The strand queue is the mailbox; handlers
 * run one at a time, in arrival order.
 *
 * get()/take() block the caller until the reply arrives (or the call timeout
 * expires). Everything else is queued and returns immediately.
 *
 * A throwing update function terminates the actor: state is released, queued
 * and future requests are discarded, synchronous callers get StoreTerminated
 * and monitors fire once with the exit reason.
 */
class StoreActor : public std::enable_shared_from_this<StoreActor> {
public:
  using Strand    = boost::asio::strand<rt::ThreadPool::executor_type>;
  using MonitorFn = std::function<void(const std::string& reason)>;

  StoreActor(rt::ThreadPool& pool, Assigns initial, StoreOptions opts);
  ~StoreActor();

  StoreActor(const StoreActor&)            = delete;
  StoreActor& operator=(const StoreActor&) = delete;

  Value   get(const Key& key, const Value& def);
  Assigns take(const std::vector<Key>& keys);

  void assign(AssignList attrs);
  void assign(Assigns attrs);
  void update(Key key, UpdateFn fn);
  void subscribe(ObserverRef observer, std::vector<Key> keys);
  void stop(std::string reason);

  void monitor(MonitorFn fn);

  bool alive() const noexcept { return alive_.load(std::memory_order_acquire); }
  std::string exitReason() const;

  std::uint64_t id() const noexcept { return id_; }
  const std::string& name() const noexcept { return opts_.name; }

private:
  template <typename R, typename Fn>
  R call(const char* op, Fn fn);

  template <typename Fn>
  void cast(Fn fn);

  // Runs on the strand (or from the destructor, when nothing else can).
  void terminate(const std::string& reason, bool crashed);

private:
  rt::ThreadPool& pool_;
  Strand          strand_;
  StoreOptions    opts_;
  std::uint64_t   id_;

  std::optional<StoreState> state_;   // strand-only; empty once terminated

  std::atomic<bool>      alive_{true};
  mutable std::mutex     exitMu_;     // guards exitReason_ and monitors_
  std::string            exitReason_;
  std::vector<MonitorFn> monitors_;
};

} // namespace livestore
