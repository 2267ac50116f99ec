#include "piecenet/co_sync.hpp"
#include "helper.hpp"
#include "piecenet/thread_pool.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace piecenet;

TEST(CoSyncTest, ConditionNotify)
{
    event_context_t ctx(event_strategy::AUTO);
    test::fail_after(ctx, make_timespan(2));

    std::mutex mutex;
    co::condition_t cond;
    bool ready = false;
    int woken = 0;

    for (int i = 0; i < 3; i++)
    {
        test::spawn([&]() {
            std::unique_lock<std::mutex> lock(mutex);
            cond.wait(lock, [&ready]() { return ready; });
            if (++woken == 3)
                ctx.exit_all(0);
        });
    }
    test::spawn([&]() {
        test::sleep_for(make_timespan(0, 50));
        std::unique_lock<std::mutex> lock(mutex);
        ready = true;
        cond.notify_all();
    });

    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_EQ(woken, 3);
}

TEST(CoSyncTest, MutexExclusive)
{
    event_context_t ctx(event_strategy::AUTO);
    test::fail_after(ctx, make_timespan(2));

    co::mutex_t mutex;
    int inside = 0, max_inside = 0, done = 0;
    const int count = 4;

    for (int i = 0; i < count; i++)
    {
        test::spawn([&]() {
            std::lock_guard<co::mutex_t> guard(mutex);
            inside++;
            max_inside = std::max(max_inside, inside);
            /// suspend with the lock held
            test::sleep_for(make_timespan(0, 20));
            inside--;
            if (++done == count)
                ctx.exit_all(0);
        });
    }

    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_EQ(max_inside, 1);
}

TEST(CoSyncTest, RunBlocking)
{
    event_context_t ctx(event_strategy::AUTO);
    test::fail_after(ctx, make_timespan(3));
    thread_pool_t pool(2);

    auto loop_thread = std::this_thread::get_id();
    std::thread::id worker_thread;
    int value = 0;
    bool rethrown = false, inline_run = false;

    test::spawn([&]() {
        value = co::run_blocking(&pool, [&worker_thread]() {
            worker_thread = std::this_thread::get_id();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return 42;
        });

        try
        {
            co::run_blocking(&pool, []() { throw std::runtime_error("lookup failed"); });
        } catch (std::runtime_error &e)
        {
            rethrown = std::string(e.what()) == "lookup failed";
        }

        co::run_blocking(nullptr, [&]() { inline_run = std::this_thread::get_id() == loop_thread; });
        ctx.exit_all(0);
    });

    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_EQ(value, 42);
    GTEST_ASSERT_NE(worker_thread, loop_thread);
    GTEST_ASSERT_EQ(rethrown, true);
    GTEST_ASSERT_EQ(inline_run, true);
}

TEST(CoSyncTest, RunBlockingKeepsLoopRunning)
{
    event_context_t ctx(event_strategy::AUTO);
    test::fail_after(ctx, make_timespan(3));
    thread_pool_t pool(1);

    int ticks = 0;
    bool blocked_done = false;

    test::spawn([&]() {
        co::run_blocking(&pool, []() { std::this_thread::sleep_for(std::chrono::milliseconds(300)); });
        blocked_done = true;
        ctx.exit_all(0);
    });
    test::spawn([&]() {
        while (!blocked_done)
        {
            ticks++;
            test::sleep_for(make_timespan(0, 20));
        }
    });

    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_GT(ticks, 3);
}
