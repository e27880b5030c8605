#include <benchmark/benchmark.h>
#include "livestore/rt/ThreadPool.hpp"
#include <atomic>
#include <thread>

static void BM_ThreadPoolPost(benchmark::State& state) {
    livestore::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThreadPoolPost)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kNanosecond);

static void BM_ThreadPoolPostAndWait(benchmark::State& state) {
    livestore::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        counter.store(0, std::memory_order_relaxed);
        for (int i = 0; i < 100; ++i) {
            pool.post([&counter]() { counter.fetch_add(1, std::memory_order_release); });
        }
        while (counter.load(std::memory_order_acquire) < 100) std::this_thread::yield();
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_ThreadPoolPostAndWait)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
