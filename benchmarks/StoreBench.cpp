#include <benchmark/benchmark.h>
#include "livestore/ChangeInbox.hpp"
#include "livestore/Store.hpp"
#include "livestore/StoreState.hpp"
#include "livestore/util/Logger.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace livestore;

namespace {

class NullObserver : public IStoreObserver {
public:
    void onStoreChange(const StoreChange& c) override { benchmark::DoNotOptimize(&c); }
};

} // namespace

static void BM_StateAssignChanged(benchmark::State& state) {
    StoreState s(Assigns{{"val", 0}});
    int i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(s.assign("val", ++i));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_StateAssignChanged);

static void BM_StateAssignUnchanged(benchmark::State& state) {
    StoreState s(Assigns{{"val", std::string(64, 'x')}});
    const Value same(std::string(64, 'x'));
    for (auto _ : state) {
        benchmark::DoNotOptimize(s.assign("val", same));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_StateAssignUnchanged);

static void BM_StateNotifyFanOut(benchmark::State& state) {
    StoreState s(Assigns{{"val", 0}});
    std::vector<std::shared_ptr<NullObserver>> observers;
    for (int n = 0; n < state.range(0); ++n) {
        observers.push_back(std::make_shared<NullObserver>());
        s.subscribe(observers.back(), {"val"});
    }
    int i = 0;
    for (auto _ : state) {
        s.assign("val", ++i);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_StateNotifyFanOut)->Arg(1)->Arg(16)->Arg(256);

static void BM_StoreGetRoundTrip(benchmark::State& state) {
    util::logger().setLevel(util::LogLevel::Warn);
    rt::ThreadPool pool(2);
    auto store = StoreHandle::create(pool, {{"val", 42}});
    for (auto _ : state) {
        benchmark::DoNotOptimize(store.get("val"));
    }
    state.SetItemsProcessed(state.iterations());
    store.stop();
}

BENCHMARK(BM_StoreGetRoundTrip)->Unit(benchmark::kMicrosecond);

static void BM_StoreAssignThenGet(benchmark::State& state) {
    util::logger().setLevel(util::LogLevel::Warn);
    rt::ThreadPool pool(2);
    auto inbox = std::make_shared<ChangeInbox>();
    auto store = StoreHandle::create(pool, {{"val", 0}}).subscribe(inbox, {"val"});
    const int batch = 100;
    int i = 0;
    for (auto _ : state) {
        for (int n = 0; n < batch; ++n) store.assign("val", ++i);
        benchmark::DoNotOptimize(store.get("val"));
        inbox->drain();
    }
    state.SetItemsProcessed(state.iterations() * batch);
    store.stop();
}

BENCHMARK(BM_StoreAssignThenGet)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
