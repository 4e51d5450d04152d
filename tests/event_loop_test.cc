#include "mediaprobe/event_loop.h"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace mediaprobe {

TEST(EventLoop, PostedTasksRunInOrderBeforeTimers)
{
    EventLoop loop(LoopClock::Virtual);
    std::string trace;

    (void)loop.add_timer(0, [&]() { trace += "t"; });
    loop.post([&]() {
        trace += "a";
        loop.post([&]() { trace += "c"; });
    });
    loop.post([&]() { trace += "b"; });

    loop.run();
    EXPECT_EQ(trace, "abct");
    EXPECT_EQ(loop.pending_tasks(), 0U);
    EXPECT_EQ(loop.pending_timers(), 0U);
}


TEST(EventLoop, VirtualClockJumpsToDueTimers)
{
    EventLoop loop(LoopClock::Virtual);
    std::vector<uint64_t> fired_at;

    (void)loop.add_timer(300, [&]() { fired_at.push_back(loop.now_ms()); });
    (void)loop.add_timer(100, [&]() { fired_at.push_back(loop.now_ms()); });
    (void)loop.add_timer(100, [&]() { fired_at.push_back(loop.now_ms() + 1); });

    loop.run();
    ASSERT_EQ(fired_at.size(), 3U);
    // Equal due times fire in creation order.
    EXPECT_EQ(fired_at[0], 100U);
    EXPECT_EQ(fired_at[1], 101U);
    EXPECT_EQ(fired_at[2], 300U);
    EXPECT_EQ(loop.now_ms(), 300U);
}


TEST(EventLoop, CancelledTimerNeverFires)
{
    EventLoop loop(LoopClock::Virtual);
    bool fired = false;

    const TimerId id = loop.add_timer(10, [&]() { fired = true; });
    EXPECT_TRUE(loop.has_timer(id));
    EXPECT_TRUE(loop.cancel_timer(id));
    EXPECT_FALSE(loop.cancel_timer(id));
    EXPECT_FALSE(loop.has_timer(id));
    EXPECT_FALSE(loop.cancel_timer(kInvalidTimerId));

    loop.run();
    EXPECT_FALSE(fired);
}


TEST(EventLoop, TimerCancelledByEarlierCallbackDoesNotFire)
{
    EventLoop loop(LoopClock::Virtual);
    bool second_fired = false;

    TimerId second = kInvalidTimerId;
    (void)loop.add_timer(50, [&]() { (void)loop.cancel_timer(second); });
    second = loop.add_timer(50, [&]() { second_fired = true; });

    loop.run();
    EXPECT_FALSE(second_fired);
}


TEST(EventLoop, IntervalRepeatsUntilCancelled)
{
    EventLoop loop(LoopClock::Virtual);
    std::vector<uint64_t> ticks;

    TimerId id = kInvalidTimerId;
    id = loop.add_interval(250, [&]() {
        ticks.push_back(loop.now_ms());
        if (ticks.size() == 4U) {
            (void)loop.cancel_timer(id);
        }
    });

    loop.run();
    ASSERT_EQ(ticks.size(), 4U);
    EXPECT_EQ(ticks[0], 250U);
    EXPECT_EQ(ticks[3], 1000U);
    EXPECT_FALSE(loop.has_timer(id));
}


TEST(EventLoop, RunUntilStopsEarly)
{
    EventLoop loop(LoopClock::Virtual);
    int count = 0;

    const TimerId id = loop.add_interval(10, [&]() { count += 1; });
    loop.run_until([&]() { return count == 3; });
    EXPECT_EQ(count, 3);
    EXPECT_TRUE(loop.has_timer(id));
    EXPECT_TRUE(loop.run_once());
    EXPECT_EQ(count, 4);
    EXPECT_TRUE(loop.cancel_timer(id));
}


TEST(EventLoop, AdvanceVirtualMakesTimersDue)
{
    EventLoop loop(LoopClock::Virtual);
    bool fired = false;
    (void)loop.add_timer(1000, [&]() { fired = true; });

    loop.advance_virtual(5000);
    EXPECT_EQ(loop.now_ms(), 5000U);
    EXPECT_TRUE(loop.run_once());
    EXPECT_TRUE(fired);
    // Already past due: the clock does not move backwards.
    EXPECT_EQ(loop.now_ms(), 5000U);
}


TEST(EventLoop, OverdueTimerFiresBeforeQueuedTask)
{
    EventLoop loop(LoopClock::Virtual);
    std::string trace;

    (void)loop.add_timer(10, [&]() { trace += "t"; });
    loop.post([&]() { trace += "a"; });
    loop.advance_virtual(20);

    loop.run();
    EXPECT_EQ(trace, "ta");
}


TEST(EventLoop, BusyTaskChainDoesNotStarveTimers)
{
    EventLoop loop(LoopClock::Steady);
    bool fired = false;
    int steps  = 0;

    (void)loop.add_timer(30, [&]() { fired = true; });
    std::function<void()> step = [&]() {
        steps += 1;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        if (!fired && steps < 200) {
            loop.post(step);
        }
    };
    loop.post(step);

    loop.run();
    EXPECT_TRUE(fired);
    EXPECT_LT(steps, 200);
}


TEST(EventLoop, SteadyClockSleepsUntilDue)
{
    EventLoop loop(LoopClock::Steady);
    uint64_t fired_at = 0;
    (void)loop.add_timer(20, [&]() { fired_at = loop.now_ms(); });

    loop.run();
    EXPECT_GE(fired_at, 20U);
}

}  // namespace mediaprobe
