#include <gtest/gtest.h>
#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <future>
#include <numeric>

#include "common/thread_utils.h"
#include "common/cancel_token.h"
#include "common/logging.h"
#include "common/time_utils.h"

using namespace Common;

// Base test class with proper setup
class ThreadUtilsTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        // Initialize logging for test
        std::string timestamp = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        std::string log_file = "logs/test_threadutils_" + timestamp + ".log";
        Common::initLogging(log_file.c_str());

        LOG_INFO("=== Starting ThreadUtils Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== ThreadUtils Test Completed ===");
        Common::shutdownLogging();
    }
};

TEST_F(ThreadUtilsTestBase, PoolWidthIsClamped) {
    ThreadPool zero(0);
    EXPECT_EQ(zero.width(), 1u);

    ThreadPool wide(1000);
    EXPECT_EQ(wide.width(), ThreadPool::MAX_THREADS);

    ThreadPool four(4);
    EXPECT_EQ(four.width(), 4u);
}

TEST_F(ThreadUtilsTestBase, FuturesCarryResults) {
    ThreadPool pool(4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.enqueue([](int x) { return x * x; }, i));
    }

    int sum = 0;
    for (auto& f : futures) {
        sum += f.get();
    }
    // sum of squares 0..49
    EXPECT_EQ(sum, 40425);
}

TEST_F(ThreadUtilsTestBase, ExceptionsReachTheCaller) {
    ThreadPool pool(2);
    auto f = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // Pool keeps working afterwards
    EXPECT_EQ(pool.enqueue([] { return 7; }).get(), 7);
}

TEST_F(ThreadUtilsTestBase, InFlightTasksNeverExceedWidth) {
    // === GIVEN ===
    // A pool of width 3 and many slow tasks
    constexpr size_t WIDTH = 3;
    ThreadPool pool(WIDTH);
    std::atomic<int> in_flight{0};
    std::atomic<int> max_seen{0};

    // === WHEN ===
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 24; ++i) {
        futures.push_back(pool.enqueue([&] {
            int now = ++in_flight;
            int seen = max_seen.load();
            while (now > seen && !max_seen.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --in_flight;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    // === THEN ===
    EXPECT_LE(max_seen.load(), static_cast<int>(WIDTH));
    EXPECT_GE(max_seen.load(), 2);
    LOG_INFO("max concurrent tasks observed: %d", max_seen.load());
}

TEST_F(ThreadUtilsTestBase, DestructorDrainsQueuedTasks) {
    std::atomic<int> completed{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            (void)pool.enqueue([&] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++completed;
            });
        }
    }
    EXPECT_EQ(completed.load(), 20);
}

TEST_F(ThreadUtilsTestBase, CancelTokenCopiesShareState) {
    CancelToken token;
    CancelToken copy = token;
    EXPECT_FALSE(copy.isCancelled());
    EXPECT_FALSE(token.hasDeadline());
    EXPECT_EQ(token.remaining(), std::chrono::milliseconds::max());

    token.cancel();
    EXPECT_TRUE(copy.isCancelled());
    EXPECT_STREQ(copy.reason(), "context canceled");
}

TEST_F(ThreadUtilsTestBase, CancelCutsWaitShort) {
    CancelToken token;
    auto start = std::chrono::steady_clock::now();

    std::thread canceller([token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    bool completed = token.waitFor(std::chrono::seconds(10));
    canceller.join();

    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_FALSE(completed);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ThreadUtilsTestBase, UninterruptedWaitCompletes) {
    CancelToken token;
    EXPECT_TRUE(token.waitFor(std::chrono::milliseconds(5)));
    EXPECT_FALSE(token.isCancelled());
}

TEST_F(ThreadUtilsTestBase, DeadlineContract) {
    // === GIVEN ===
    // A token with a short deadline
    CancelToken token = CancelToken::withTimeout(std::chrono::milliseconds(30));
    EXPECT_TRUE(token.hasDeadline());
    EXPECT_FALSE(token.isCancelled());
    EXPECT_LE(token.remaining(), std::chrono::milliseconds(30));

    // === WHEN ===
    // A longer wait is capped by the deadline
    bool completed = token.waitFor(std::chrono::seconds(10));

    // === THEN ===
    EXPECT_FALSE(completed);
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.remaining(), std::chrono::milliseconds(0));
    EXPECT_STREQ(token.reason(), "context deadline exceeded");
}

TEST_F(ThreadUtilsTestBase, ZeroTimeoutMeansNoDeadline) {
    CancelToken token = CancelToken::withTimeout(std::chrono::milliseconds(0));
    EXPECT_FALSE(token.hasDeadline());
    EXPECT_FALSE(token.isCancelled());
}

TEST_F(ThreadUtilsTestBase, TimeParsingContract) {
    EpochSeconds t = 0;
    ASSERT_TRUE(parseIso8601("2000-01-01T00:00:00Z", t));
    EXPECT_EQ(t, 946684800);
    ASSERT_TRUE(parseIso8601("2015-08-30T12:36:00.000Z", t));
    EXPECT_EQ(formatIso8601(t), "2015-08-30T12:36:00Z");
    EXPECT_FALSE(parseIso8601("yesterday", t));
    EXPECT_FALSE(parseIso8601("2015-13-30T12:36:00Z", t));
    EXPECT_FALSE(parseIso8601(nullptr, t));

    std::string amz_date, date_stamp;
    formatAmzDate(t, amz_date, date_stamp);
    EXPECT_EQ(amz_date, "20150830T123600Z");
    EXPECT_EQ(date_stamp, "20150830");

    EXPECT_EQ(daysBetween(946684800, 946684800 + 3 * 86400 + 10), 3);
    EXPECT_EQ(daysBetween(0, 946684800), 0);
    EXPECT_EQ(daysBetween(946684800, 946684800 - 86400), 0);
}
