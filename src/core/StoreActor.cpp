#include "livestore/StoreActor.hpp"
#include "livestore/StoreError.hpp"
#include "livestore/util/Logger.hpp"
#include "livestore/util/Metrics.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <future>
#include <utility>

namespace livestore {

using util::logger;
using util::LogLevel;

namespace {

std::atomic<std::uint64_t> g_nextStoreId{1};

} // namespace

StoreActor::StoreActor(rt::ThreadPool& pool, Assigns initial, StoreOptions opts)
  : pool_(pool)
  , strand_(boost::asio::make_strand(pool.executor()))
  , opts_(std::move(opts))
  , id_(g_nextStoreId.fetch_add(1, std::memory_order_relaxed))
{
  const auto keys = initial.size();
  state_.emplace(std::move(initial), id_);

  LIVESTORE_METRIC_HIT("livestore.store.created");
  logger().log(LogLevel::Info, "store created",
               {{"store", std::to_string(id_)}, {"name", opts_.name}, {"keys", std::to_string(keys)}});
}

StoreActor::~StoreActor() {
  // Last handle and last queued handler are gone; nothing can race us here.
  if (alive()) terminate("released", false);
}

template <typename R, typename Fn>
R StoreActor::call(const char* op, Fn fn) {
  if (strand_.running_in_this_thread()) {
    throw StoreError(std::string(op) + " called from inside store " + std::to_string(id_) +
                     " would wait on itself");
  }
  if (!alive()) throw StoreTerminated(exitReason());
  if (pool_.stopped()) throw StoreTerminated("runtime stopped");

  auto promise = std::make_shared<std::promise<R>>();
  auto future  = promise->get_future();

  boost::asio::post(strand_, [self = shared_from_this(), promise, fn = std::move(fn)]() mutable {
    if (!self->state_) {
      promise->set_exception(std::make_exception_ptr(StoreTerminated(self->exitReason())));
      return;
    }
    try {
      promise->set_value(fn(*self->state_));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });

  if (future.wait_for(opts_.callTimeout) != std::future_status::ready) {
    // The actor still answers later; the promise keeps the stale reply alive until then.
    LIVESTORE_METRIC_HIT("livestore.call.timeout");
    logger().log(LogLevel::Warn, "call timed out",
                 {{"store", std::to_string(id_)}, {"op", op},
                  {"timeoutMs", std::to_string(opts_.callTimeout.count())}});
    throw CallTimeout(std::string(op) + " on store " + std::to_string(id_) + " timed out after " +
                      std::to_string(opts_.callTimeout.count()) + "ms");
  }

  try {
    return future.get();
  } catch (const std::future_error&) {
    // Handler destroyed unrun: the io_context went away with it queued.
    throw StoreTerminated("request dropped by runtime");
  }
}

template <typename Fn>
void StoreActor::cast(Fn fn) {
  boost::asio::post(strand_, [self = shared_from_this(), fn = std::move(fn)]() mutable {
    if (!self->state_) return; // terminated; the request is discarded
    fn(*self);
  });
}

Value StoreActor::get(const Key& key, const Value& def) {
  return call<Value>("get", [key, def](const StoreState& s) { return s.get(key, def); });
}

Assigns StoreActor::take(const std::vector<Key>& keys) {
  return call<Assigns>("take", [keys](const StoreState& s) { return s.take(keys); });
}

void StoreActor::assign(AssignList attrs) {
  cast([attrs = std::move(attrs)](StoreActor& self) {
    self.state_->assignMany(attrs);
  });
}

void StoreActor::assign(Assigns attrs) {
  cast([attrs = std::move(attrs)](StoreActor& self) {
    self.state_->assignMany(attrs);
  });
}

void StoreActor::update(Key key, UpdateFn fn) {
  cast([key = std::move(key), fn = std::move(fn)](StoreActor& self) {
    // Only the update function is fatal; observer failures are handled by notify.
    Value next;
    try {
      next = fn(self.state_->get(key));
    } catch (const std::exception& ex) {
      self.terminate("update of '" + key + "' failed: " + ex.what(), true);
      return;
    } catch (...) {
      self.terminate("update of '" + key + "' failed: unknown exception", true);
      return;
    }
    self.state_->assign(key, std::move(next));
  });
}

void StoreActor::subscribe(ObserverRef observer, std::vector<Key> keys) {
  cast([observer = std::move(observer), keys = std::move(keys)](StoreActor& self) {
    self.state_->subscribe(observer, keys);
  });
}

void StoreActor::stop(std::string reason) {
  cast([reason = std::move(reason)](StoreActor& self) {
    self.terminate(reason, false);
  });
}

void StoreActor::monitor(MonitorFn fn) {
  if (!fn) return;
  std::string reason;
  {
    std::lock_guard<std::mutex> lk(exitMu_);
    if (alive()) {
      monitors_.push_back(std::move(fn));
      return;
    }
    reason = exitReason_;
  }
  fn(reason);
}

std::string StoreActor::exitReason() const {
  std::lock_guard<std::mutex> lk(exitMu_);
  return exitReason_;
}

void StoreActor::terminate(const std::string& reason, bool crashed) {
  std::vector<MonitorFn> monitors;
  {
    std::lock_guard<std::mutex> lk(exitMu_);
    if (!alive()) return;
    exitReason_ = reason;
    alive_.store(false, std::memory_order_release);
    monitors.swap(monitors_);
  }
  state_.reset();

  if (crashed) {
    LIVESTORE_METRIC_HIT("livestore.store.crashed");
    logger().log(LogLevel::Error, "store crashed",
                 {{"store", std::to_string(id_)}, {"name", opts_.name}, {"reason", reason}});
  } else {
    LIVESTORE_METRIC_HIT("livestore.store.stopped");
    logger().log(LogLevel::Info, "store stopped",
                 {{"store", std::to_string(id_)}, {"name", opts_.name}, {"reason", reason}});
  }

  for (auto& m : monitors) {
    try {
      m(reason);
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Warn, "store monitor threw",
                   {{"store", std::to_string(id_)}, {"what", ex.what()}});
    }
  }
}

} // namespace livestore
