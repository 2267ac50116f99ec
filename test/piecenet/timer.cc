#include "piecenet/timer.hpp"
#include "piecenet/event.hpp"
#include "piecenet/execute_context.hpp"
#include <functional>
#include <gtest/gtest.h>
#include <thread>

using namespace piecenet;

TEST(TimerTest, TimerShortTick)
{
    event_context_t ctx(event_strategy::AUTO);
    microsecond_t point = get_current_time();
    microsecond_t point2;
    // 500ms
    microsecond_t span = 500000;

    event_loop_t::current().add_timer(::piecenet::make_timer(span, [&ctx, &point2]() {
        point2 = get_current_time();
        ctx.exit_all(1);
    }));
    GTEST_ASSERT_EQ(ctx.run(), 1);
    GTEST_ASSERT_GE(point2 - point, span);
}

TEST(TimerTest, TimerLongTick)
{
    event_context_t ctx(event_strategy::AUTO, 500000);
    microsecond_t point = get_current_time();
    microsecond_t point2;
    // 550ms
    microsecond_t span = 550000;

    event_loop_t::current().add_timer(::piecenet::make_timer(span, [&ctx, &point2]() {
        point2 = get_current_time();
        ctx.exit_all(1);
    }));
    ctx.run();
    GTEST_ASSERT_GE(point2 - point, span);
}

void work()
{
    event_loop_t::current().add_timer(::piecenet::timer_t(get_current_time() + 200000, []() { work(); }));
    // work load
    std::this_thread::sleep_for(std::chrono::milliseconds(180));
}

TEST(TimerTest, TimerFullWorkLoad)
{
    // 100ms
    event_context_t ctx(event_strategy::AUTO, 100000);

    microsecond_t point = get_current_time();
    microsecond_t point2;
    // 800ms
    microsecond_t span = 800000;
    event_loop_t::current().add_timer(::piecenet::make_timer(span, [&ctx, &point2]() {
        point2 = get_current_time();
        ctx.exit_all(1);
    }));

    event_loop_t::current().add_timer(::piecenet::timer_t(get_current_time() + 200000, []() { work(); }));

    ctx.run();
    GTEST_ASSERT_GE(point2 - point, span);
}

TEST(TimerTest, TimerRemove)
{
    event_context_t ctx(event_strategy::AUTO, 100000);

    auto tick = event_loop_t::current().add_timer(make_timer(make_timespan(1, 500), []() {
        std::string str = "timer remove failed";
        GTEST_ASSERT_EQ(str, "");
    }));

    event_loop_t::current().add_timer(
        make_timer(make_timespan(1), [&tick]() { event_loop_t::current().remove_timer(tick); }));
    event_loop_t::current().add_timer(make_timer(make_timespan(1, 800), [&ctx]() { ctx.exit_all(0); }));

    GTEST_ASSERT_EQ(ctx.run(), 0);
}

TEST(TimerTest, CoroutineSleep)
{
    event_context_t ctx(event_strategy::AUTO);
    // 300ms
    microsecond_t span = 300000, point = get_current_time(), point2 = 0, left = 1;

    execute_context_t::spawn(event_loop_t::current(), [&]() {
        left = execute_context_t::current()->sleep(span);
        point2 = get_current_time();
        ctx.exit_all(0);
    });
    event_loop_t::current().add_timer(make_timer(make_timespan(2), [&ctx]() { ctx.exit_all(-1); }));

    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_EQ(left, 0);
    GTEST_ASSERT_GE(point2 - point, span);
}

TEST(TimerTest, WakeUpSleep)
{
    event_context_t ctx(event_strategy::AUTO);
    microsecond_t left = 0;
    execute_context_t *sleeper = nullptr;

    execute_context_t::spawn(event_loop_t::current(), [&]() {
        sleeper = execute_context_t::current();
        left = sleeper->sleep(make_timespan(10));
        ctx.exit_all(0);
    });
    event_loop_t::current().add_timer(make_timer(make_timespan(0, 100), [&sleeper]() { sleeper->start(); }));
    event_loop_t::current().add_timer(make_timer(make_timespan(2), [&ctx]() { ctx.exit_all(-1); }));

    GTEST_ASSERT_EQ(ctx.run(), 0);
    GTEST_ASSERT_GT(left, 0);
}
