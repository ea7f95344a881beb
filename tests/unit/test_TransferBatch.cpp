#include <gtest/gtest.h>
#include "concurrency/TransferBatch.hpp"

#include <atomic>
#include <thread>

using namespace std::chrono_literals;
using namespace wsync::concurrency;

TEST(TransferBatchTest, CollectsEveryOutcome) {
    ThreadPool pool(4, "TestPool");
    TransferBatch batch(pool);
    std::atomic<int> ran{0};

    for (int i = 0; i < 10; ++i)
        batch.add("ok-" + std::to_string(i), [&] { ++ran; });
    batch.add("bad", [] { throw std::runtime_error("disk on fire"); });

    EXPECT_EQ(batch.size(), 11u);
    const auto outcomes = batch.wait();
    EXPECT_EQ(outcomes.size(), 11u);
    EXPECT_EQ(ran.load(), 10);

    const auto failures = TransferBatch::describeFailures(outcomes);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], "bad: disk on fire");
    EXPECT_EQ(batch.size(), 0u);
}

TEST(TransferBatchTest, ConcurrencyIsBoundedByPoolSize) {
    ThreadPool pool(3, "BoundedPool");
    TransferBatch batch(pool);
    std::atomic<int> active{0}, peak{0};

    for (int i = 0; i < 12; ++i)
        batch.add(std::to_string(i), [&] {
            const int now = ++active;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(20ms);
            --active;
        });

    (void)batch.wait();
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 2);
}

TEST(TransferBatchTest, StoppedPoolRejectsTasks) {
    ThreadPool pool(1, "StoppedPool");
    pool.stop();

    TransferBatch batch(pool);
    batch.add("late", [] {});
    const auto outcomes = batch.wait();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_FALSE(outcomes[0].ok());
    EXPECT_EQ(outcomes[0].label, "late");
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.workerCount(), 2u);
    pool.stop();
    EXPECT_TRUE(pool.isStopped());
    EXPECT_THROW(pool.submit(std::make_shared<FunctionTask>("x", [] {})), std::runtime_error);
}
