#include "livestore/rt/ThreadPool.hpp"
#include <gtest/gtest.h>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace livestore;
using namespace livestore::rt;

TEST(ThreadPoolTest, ExecutesTasks) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    const int tasks = 100;
    for (int i = 0; i < tasks; ++i) {
        pool.post([&counter](){ counter++; });
    }
    pool.shutdown();
    EXPECT_EQ(counter.load(), tasks);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(ThreadPoolTest, NoDeadlockOnImmediateShutdown) {
    ThreadPool pool(2);
    pool.shutdown();
    pool.shutdown();
    EXPECT_TRUE(pool.stopped());
}

TEST(ThreadPoolTest, PostAfterShutdownDoesNothing) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};
    pool.shutdown();
    pool.post([&counter](){ counter++; });
    // Allow brief window for any incorrectly executed tasks
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(counter.load(), 0);
}

TEST(ThreadPoolTest, DestructorShutsDownAndExecutesTasks) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(3);
        for (int i = 0; i < 50; ++i) {
            pool.post([&counter](){ counter++; });
        }
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, ConcurrentPost) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    const int threads = 4, tasksPerThread = 25;
    std::vector<std::thread> posters;
    for (int t = 0; t < threads; ++t) {
        posters.emplace_back([&pool, &counter, tasksPerThread](){
            for (int i = 0; i < tasksPerThread; ++i) {
                pool.post([&counter](){ counter++; });
            }
        });
    }
    for (auto& p : posters) p.join();
    pool.shutdown();
    EXPECT_EQ(counter.load(), threads * tasksPerThread);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    ThreadPool pool(1);
    std::atomic<int> counter{0};
    pool.post([]{ throw std::runtime_error("task failed"); });
    pool.post([&counter](){ counter++; });
    pool.shutdown();
    EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPoolTest, StrandSerializesWork) {
    ThreadPool pool(4);
    auto strand = boost::asio::make_strand(pool.executor());
    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};
    std::vector<int> order;

    for (int i = 0; i < 200; ++i) {
        boost::asio::post(strand, [&, i]{
            if (inside.fetch_add(1) != 0) overlapped = true;
            order.push_back(i);
            inside.fetch_sub(1);
        });
    }
    pool.shutdown();

    EXPECT_FALSE(overlapped.load());
    ASSERT_EQ(order.size(), 200u);
    for (int i = 0; i < 200; ++i) EXPECT_EQ(order[i], i);
}

TEST(ThreadPoolTest, NonStandardExceptionDoesNotKillWorker) {
    ThreadPool pool(1);
    std::atomic<int> counter{0};
    boost::asio::post(pool.executor(), []{ throw 42; });
    pool.post([&counter](){ counter++; });
    pool.shutdown();
    EXPECT_EQ(counter.load(), 1);
}
