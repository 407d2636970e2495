#include <atomic>
#include <stdexcept>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "worker_pool.hpp"

using namespace std;
using namespace codejudge;

TEST(WorkerPoolTest, InFlightNeverExceedsConcurrency) {
    worker_pool pool(3);
    atomic<int> running{0}, peak{0}, finished{0};

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pool.submit([&] {
            int now = ++running;
            int observed = peak;
            while (now > observed && !peak.compare_exchange_weak(observed, now)) {}
            this_thread::sleep_for(chrono::milliseconds(10));
            --running;
            ++finished;
        }));
        EXPECT_LE(pool.in_flight(), 3u);
    }
    pool.wait_idle();

    EXPECT_EQ(finished.load(), 20);
    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(pool.in_flight(), 0u);
}

TEST(WorkerPoolTest, RejectsZeroConcurrency) {
    EXPECT_THROW(worker_pool(0), validation_error);
}

TEST(WorkerPoolTest, ShutdownDrainsSubmittedTasks) {
    atomic<int> finished{0};
    worker_pool pool(2);
    for (int i = 0; i < 2; ++i)
        pool.submit([&] {
            this_thread::sleep_for(chrono::milliseconds(50));
            ++finished;
        });
    pool.shutdown();

    EXPECT_EQ(finished.load(), 2);
    EXPECT_FALSE(pool.submit([&] { ++finished; }));
    EXPECT_EQ(finished.load(), 2);
}

TEST(WorkerPoolTest, CrashedTaskReleasesSlot) {
    worker_pool pool(1);
    atomic<bool> ran{false};
    ASSERT_TRUE(pool.submit([] { throw runtime_error("boom"); }));
    ASSERT_TRUE(pool.submit([&] { ran = true; }));
    pool.wait_idle();

    EXPECT_TRUE(ran.load());
    EXPECT_EQ(pool.concurrency(), 1u);
}
