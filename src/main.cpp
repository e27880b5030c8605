// File: src/main.cpp
//
// livestore_demo [configFile]
//
// A root view creates a store {val: 0} and mirrors it; a child button view
// shares the same store, increments `val` on each click and mirrors it too.
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "livestore/Store.hpp"
#include "livestore/rt/ShutdownCoordinator.hpp"
#include "livestore/rt/ThreadPool.hpp"
#include "livestore/util/Config.hpp"
#include "livestore/util/Logger.hpp"
#include "livestore/util/Metrics.hpp"

namespace {

using namespace livestore;
using util::logger;
using util::LogLevel;

volatile std::sig_atomic_t gInterrupted = 0;

void handleSignal(int) {
  gInterrupted = 1;
}

// Copies every change it is told about into its own assigns.
class MirrorView : public IStoreObserver {
public:
  explicit MirrorView(std::string label) : label_(std::move(label)) {}

  void onStoreChange(const StoreChange& change) override {
    std::lock_guard<std::mutex> lk(mx_);
    assigns_[change.key] = change.value;
  }

  void assign(const Assigns& attrs) {
    std::lock_guard<std::mutex> lk(mx_);
    for (auto& kv : attrs) assigns_[kv.first] = kv.second;
  }

  Value get(const Key& key) const {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = assigns_.find(key);
    return it == assigns_.end() ? Value{} : it->second;
  }

  const std::string& label() const noexcept { return label_; }

private:
  std::string label_;
  mutable std::mutex mx_;
  Assigns assigns_;
};

// Owns the store.
class CounterView : public MirrorView {
public:
  CounterView() : MirrorView("counter") {}

  StoreHandle mount(const std::shared_ptr<CounterView>& self, rt::ThreadPool& pool,
                    const util::Config& cfg) {
    auto store = StoreHandle::create(pool, {{"val", 0}}, StoreOptions::fromConfig(cfg, "counter"))
                   .subscribe(self, {"val"});
    assign(store.take({"val"}));
    return store;
  }
};

// Receives the store from its parent and writes to it.
class CounterButtonView : public MirrorView {
public:
  explicit CounterButtonView(StoreHandle store)
    : MirrorView("button"), store_(std::move(store)) {}

  void mount(const std::shared_ptr<CounterButtonView>& self) {
    store_.subscribe(self, {"val"});
    assign(store_.take({"val"}));
  }

  void click() {
    store_.update("val", [](const Value& v) { return Value(v.as<int>() + 1); });
  }

private:
  StoreHandle store_;
};

} // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT,  handleSignal);
  std::signal(SIGTERM, handleSignal);

  util::Config cfg;
  bool cfgOk = true;
  if (argc > 1) cfgOk = cfg.loadFromFile(argv[1]);
  cfg.applyLogging();
  if (!cfgOk) {
    logger().log(LogLevel::Warn, "failed to load config file, using defaults", {{"path", argv[1]}});
  }

  // Declared before the coordinator: steps hold store handles, which must be
  // released before the pool goes away.
  auto pool = std::make_unique<rt::ThreadPool>(cfg.threadPoolSize);

  rt::ShutdownCoordinator shutdown;
  shutdown.registerStep("pool-shutdown", 80, [&pool]{ pool->shutdown(); });

  if (cfg.metricsIntervalSec > 0) {
    util::MetricRegistry::instance().startReporter(cfg.metricsIntervalSec);
    shutdown.registerStep("metrics-stop", 90, []{ util::MetricRegistry::instance().stopReporter(); });
  }

  logger().log(LogLevel::Info, "boot",
               {{"threads", std::to_string(pool->size())}, {"clicks", std::to_string(cfg.clicks)}});

  auto root = std::make_shared<CounterView>();

  int rc = EXIT_SUCCESS;
  try {
    StoreHandle store = root->mount(root, *pool, cfg);
    shutdown.registerStep("store-stop", 10, [store]{ store.stop("shutdown"); });
    store.monitor([](const std::string& reason) {
      logger().log(LogLevel::Info, "counter store down", {{"reason", reason}});
    });

    auto button = std::make_shared<CounterButtonView>(store);
    button->mount(button);

    for (int i = 0; i < cfg.clicks && !gInterrupted; ++i) {
      button->click();
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg.clickIntervalMs));
    }

    // Ordered after every click, so both mirrors have seen the last change.
    const Value val = store.get("val");
    logger().log(LogLevel::Info, "done",
                 {{"store", toString(val)},
                  {root->label(), toString(root->get("val"))},
                  {"button", toString(button->get("val"))}});
  } catch (const StoreError& ex) {
    logger().log(LogLevel::Error, "store error", {{"what", ex.what()}});
    rc = EXIT_FAILURE;
  }

  shutdown.stop();
  logger().log(LogLevel::Info, "stopped", {});
  return rc;
}
