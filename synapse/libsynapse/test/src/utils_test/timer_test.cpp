#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "threadpool.hpp"
#include "timer.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::synapse::utils;

namespace
{
class TimerTest : public Test
{
protected:
    void SetUp() override
    {
        thread_pool_ = std::make_shared<ThreadPool>(2);
    }

    std::shared_ptr<ThreadPool> thread_pool_;
};
}  // namespace

TEST_F(TimerTest, CallbackRunsPeriodically)
{
    Timer           timer {thread_pool_};
    std::atomic_int ticks {0};

    EXPECT_TRUE(timer.start(std::chrono::milliseconds {5}, [&] { ++ticks; }));
    EXPECT_TRUE(timer.is_running());
    EXPECT_TRUE(testutils::wait_for([&] { return ticks >= 3; }, 2000));
    EXPECT_TRUE(timer.stop());
    EXPECT_FALSE(timer.is_running());
}

TEST_F(TimerTest, NoCallbackAfterStop)
{
    Timer           timer {thread_pool_};
    std::atomic_int ticks {0};

    timer.start(std::chrono::milliseconds {1}, [&] { ++ticks; });
    testutils::wait_for([&] { return ticks >= 1; }, 2000);
    timer.stop();

    int ticks_at_stop = ticks;
    std::this_thread::sleep_for(std::chrono::milliseconds {20});
    EXPECT_EQ(ticks, ticks_at_stop);
}

TEST_F(TimerTest, StopWakesUpLongPeriod)
{
    Timer timer {thread_pool_};
    bool  called = false;

    timer.start(std::chrono::hours {1}, [&] { called = true; });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(timer.stop());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds {5});
    EXPECT_FALSE(called);
}

TEST_F(TimerTest, StartTwice)
{
    Timer timer {thread_pool_};
    EXPECT_TRUE(timer.start(std::chrono::hours {1}, [] {}));
    EXPECT_FALSE(timer.start(std::chrono::hours {1}, [] {}));
}

TEST_F(TimerTest, StopWhenNotRunning)
{
    Timer timer {thread_pool_};
    EXPECT_FALSE(timer.stop());
}
