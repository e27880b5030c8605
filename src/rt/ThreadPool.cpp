#include "livestore/rt/ThreadPool.hpp"
#include "livestore/util/Logger.hpp"

#include <boost/asio/post.hpp>

#include <exception>

namespace livestore::rt {

using util::logger;
using util::LogLevel;

ThreadPool::ThreadPool(unsigned nThreads) {
  if (nThreads == 0) nThreads = 1;
  work_.emplace(boost::asio::make_work_guard(ioc_));
  threads_.reserve(nThreads);
  for (unsigned i=0;i<nThreads;++i) {
    threads_.emplace_back([this]{ workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::post(std::function<void()> fn) {
  if (!fn || stopping_.load(std::memory_order_acquire)) return;
  boost::asio::post(ioc_, [fn = std::move(fn)]{
    try {
      fn();
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "pool task failed", {{"what", ex.what()}});
    }
  });
}

void ThreadPool::shutdown() {
  std::lock_guard<std::mutex> lk(mx_);
  if (stopping_.exchange(true, std::memory_order_acq_rel)) return;

  // Dropping the guard lets run() return once the queue is empty.
  work_.reset();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void ThreadPool::workerLoop() {
  for (;;) {
    try {
      ioc_.run();
      return;
    } catch (const std::exception& ex) {
      // A handler escaped; log it and keep serving the queue.
      logger().log(LogLevel::Error, "worker caught exception", {{"what", ex.what()}});
    } catch (...) {
      logger().log(LogLevel::Error, "worker caught exception", {{"what", "unknown"}});
    }
  }
}

} // namespace livestore::rt
