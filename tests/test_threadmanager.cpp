#include <gtest/gtest.h>
#include "threadmanager.h"
#include "stop_token.h"
#include "test_helpers.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace blockshare;
using namespace blockshare::test;

namespace {

class Workers : public ThreadManager {
public:
    ~Workers() override {
        join_all_active_threads();
    }
};

} // anonymous namespace

TEST(ThreadManagerTest, RunsAndJoinsThreads) {
    Workers workers;
    std::atomic<int> counter{0};
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(workers.add_managed_thread([&counter]() { counter++; }, "worker-" + std::to_string(i)));
    }
    workers.join_all_active_threads();
    EXPECT_EQ(counter.load(), 5);
    EXPECT_EQ(workers.get_active_thread_count(), 0u);
}

TEST(ThreadManagerTest, ReapsFinishedThreadsOnly) {
    Workers workers;
    StopToken release;

    ASSERT_TRUE(workers.add_managed_thread([]() {}, "quick"));
    ASSERT_TRUE(workers.add_managed_thread([&release]() { release.wait(); }, "blocked"));

    ASSERT_TRUE(wait_until([&workers]() {
        workers.cleanup_finished_threads();
        return workers.get_active_thread_count() == 1;
    }));

    release.request_stop();
    workers.join_all_active_threads();
    EXPECT_EQ(workers.get_active_thread_count(), 0u);
}

TEST(ThreadManagerTest, EscapingExceptionMarksThreadFinished) {
    Workers workers;
    ASSERT_TRUE(workers.add_managed_thread([]() { throw std::runtime_error("boom"); }, "thrower"));
    EXPECT_TRUE(wait_until([&workers]() {
        workers.cleanup_finished_threads();
        return workers.get_active_thread_count() == 0;
    }));
}

TEST(ThreadManagerTest, RefusesThreadsAfterShutdown) {
    Workers workers;
    workers.shutdown_all_threads();
    EXPECT_TRUE(workers.is_shutdown_requested());
    EXPECT_FALSE(workers.add_managed_thread([]() {}, "late"));
    EXPECT_EQ(workers.get_active_thread_count(), 0u);
}

//=============================================================================
// StopToken
//=============================================================================

TEST(StopTokenTest, WaitForTimesOut) {
    StopToken token;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(45));
    EXPECT_FALSE(token.stop_requested());
}

TEST(StopTokenTest, StopWakesSleepers) {
    StopToken token;
    std::thread stopper([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    stopper.join();

    token.wait();
    EXPECT_TRUE(token.stop_requested());
    EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(0)));
}
