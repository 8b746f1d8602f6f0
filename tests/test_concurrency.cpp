/**
 * @file test_concurrency.cpp
 * @brief Unit tests for the striped executor and the periodic scheduler
 */

#include <gtest/gtest.h>
#include "../src/core/include/sgate_thread_pool.hpp"
#include "../src/core/include/sgate_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sgate;
using namespace std::chrono_literals;

// ==================== StripedExecutor ====================

TEST(StripedExecutorTest, ReturnsResults) {
    StripedExecutor pool(4);
    auto f = pool.submit("10.0.0.1", [](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(f.get(), 5);
    EXPECT_EQ(pool.total_threads(), 4u);
    EXPECT_TRUE(pool.is_running());
}

TEST(StripedExecutorTest, SameKeyRunsInSubmissionOrder) {
    StripedExecutor pool(4);
    std::mutex mu;
    std::map<std::string, std::vector<int>> seen;

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 200; ++i) {
        std::string key = "10.0.0." + std::to_string(i % 5);
        futures.push_back(pool.submit(key, [&, key, i] {
            std::lock_guard<std::mutex> lock(mu);
            seen[key].push_back(i);
        }));
    }
    for (auto& f : futures) f.get();

    ASSERT_EQ(seen.size(), 5u);
    for (const auto& kv : seen) {
        ASSERT_EQ(kv.second.size(), 40u);
        for (size_t j = 1; j < kv.second.size(); ++j) {
            EXPECT_LT(kv.second[j - 1], kv.second[j]) << kv.first;
        }
    }
}

TEST(StripedExecutorTest, SameKeyNeverOverlaps) {
    StripedExecutor pool(8);
    std::atomic<int> inflight{0};
    std::atomic<bool> overlap{false};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.submit("192.0.2.1", [&] {
            if (inflight.fetch_add(1) != 0) overlap = true;
            std::this_thread::sleep_for(100us);
            inflight.fetch_sub(1);
        }));
    }
    for (auto& f : futures) f.get();
    EXPECT_FALSE(overlap.load());
}

TEST(StripedExecutorTest, RoutingIsStable) {
    StripedExecutor pool(3);
    EXPECT_EQ(pool.worker_for("10.0.0.1"), pool.worker_for("10.0.0.1"));
    EXPECT_LT(pool.worker_for("2001:db8::1"), 3u);
}

TEST(StripedExecutorTest, ExceptionsReachTheFuture) {
    StripedExecutor pool(2);
    auto f = pool.submit("k", []() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // The worker survives
    EXPECT_EQ(pool.submit("k", [] { return 7; }).get(), 7);
}

TEST(StripedExecutorTest, ShutdownDrainsQueue) {
    std::atomic<int> done{0};
    {
        StripedExecutor pool(2);
        for (int i = 0; i < 100; ++i) {
            pool.submit("key" + std::to_string(i), [&] { done++; });
        }
        pool.shutdown();
        EXPECT_FALSE(pool.is_running());
        EXPECT_EQ(pool.pending_tasks(), 0u);
        EXPECT_THROW(pool.submit("late", [] {}), std::runtime_error);
    }
    EXPECT_EQ(done.load(), 100);
}

TEST(StripedExecutorTest, ZeroThreadsMeansOne) {
    StripedExecutor pool(0);
    EXPECT_EQ(pool.total_threads(), 1u);
    EXPECT_EQ(pool.submit("k", [] { return 1; }).get(), 1);
}

// ==================== Scheduler ====================

namespace {

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace

TEST(SchedulerTest, RunsJobsRepeatedly) {
    Scheduler sched;
    std::atomic<int> fast{0};
    std::atomic<int> slow{0};
    sched.add_job("fast", 10ms, [&] { fast++; });
    sched.add_job("slow", 1h, [&] { slow++; });

    EXPECT_FALSE(sched.is_running());
    sched.start();
    EXPECT_TRUE(sched.is_running());

    EXPECT_TRUE(wait_for([&] { return fast.load() >= 3; }));
    sched.stop();
    EXPECT_FALSE(sched.is_running());
    EXPECT_EQ(slow.load(), 0);

    int after_stop = fast.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(fast.load(), after_stop);
}

TEST(SchedulerTest, FailingJobIsCountedAndRescheduled) {
    Scheduler sched;
    std::atomic<int> calls{0};
    sched.add_job("flaky", 10ms, [&] {
        calls++;
        throw std::runtime_error("ipset missing");
    });
    sched.start();
    EXPECT_TRUE(wait_for([&] { return calls.load() >= 2; }));
    sched.stop();

    auto stats = sched.get_stats();
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].name, "flaky");
    EXPECT_GE(stats[0].failures, 2u);
    EXPECT_EQ(stats[0].failures, stats[0].runs);
    EXPECT_EQ(stats[0].last_error, "ipset missing");
}

TEST(SchedulerTest, JobAddedWhileRunning) {
    Scheduler sched;
    sched.start();
    std::atomic<int> calls{0};
    sched.add_job("late", 10ms, [&] { calls++; });
    EXPECT_TRUE(wait_for([&] { return calls.load() >= 1; }));
    sched.stop();
}

TEST(SchedulerTest, StopIsIdempotent) {
    Scheduler sched;
    sched.stop();
    sched.start();
    sched.stop();
    sched.stop();
    EXPECT_FALSE(sched.is_running());
}
