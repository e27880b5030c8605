// File: include/livestore/rt/ThreadPool.hpp
#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace livestore::rt {

// Worker threads driving one io_context. Stores put their strands on it.
// The pool must outlive every store created on it.
class ThreadPool {
public:
  using executor_type = boost::asio::io_context::executor_type;

  explicit ThreadPool(unsigned nThreads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue work. Ignored once shutdown() has begun.
  void post(std::function<void()> fn);

  executor_type executor() noexcept { return ioc_.get_executor(); }
  boost::asio::io_context& context() noexcept { return ioc_; }

  // Runs everything already queued (and whatever that work queues), then joins.
  // Idempotent.
  void shutdown();

  bool stopped() const noexcept { return stopping_.load(std::memory_order_acquire); }
  unsigned size() const noexcept { return static_cast<unsigned>(threads_.size()); }

private:
  void workerLoop();

private:
  boost::asio::io_context ioc_;
  std::optional<boost::asio::executor_work_guard<executor_type>> work_;
  std::vector<std::thread> threads_;
  std::mutex               mx_;
  std::atomic<bool>        stopping_{false};
};

} // namespace livestore::rt
