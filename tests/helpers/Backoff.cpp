#include <gtest/gtest.h>
#include <helpers/time/Backoff.hpp>
#include <helpers/time/Timer.hpp>

#include <numeric>

using namespace Hyprview;
using namespace std::chrono_literals;

TEST(HelpersBackoff, ResultRetryScheduleDoublesAndCaps) {
    const auto                                   DELAYS = CBackoff::schedule(10ms, 1000ms, 10);

    const std::vector<std::chrono::milliseconds> EXPECTED = {10ms, 20ms, 40ms, 80ms, 160ms, 320ms, 640ms, 1000ms, 1000ms, 1000ms};
    EXPECT_EQ(DELAYS, EXPECTED);

    EXPECT_EQ(std::accumulate(DELAYS.begin(), DELAYS.end(), 0ms), 4270ms);
}

TEST(HelpersBackoff, CommandPollScheduleCapsEarly) {
    const auto DELAYS = CBackoff::schedule(10ms, 100ms, 6);

    const std::vector<std::chrono::milliseconds> EXPECTED = {10ms, 20ms, 40ms, 80ms, 100ms, 100ms};
    EXPECT_EQ(DELAYS, EXPECTED);
}

TEST(HelpersBackoff, ResetStartsOver) {
    CBackoff backoff(5ms, 50ms);
    EXPECT_EQ(backoff.next(), 5ms);
    EXPECT_EQ(backoff.next(), 10ms);
    EXPECT_EQ(backoff.peek(), 20ms);

    backoff.reset();
    EXPECT_EQ(backoff.next(), 5ms);
}

TEST(HelpersTimer, MeasuresElapsedTime) {
    CTimer timer;
    EXPECT_FALSE(timer.passed(10s));

    CBackoff backoff(20ms, 20ms);
    backoff.sleep();

    EXPECT_TRUE(timer.passed(20ms));
    EXPECT_GE(timer.elapsed(), 20ms);

    timer.reset();
    EXPECT_LT(timer.elapsed(), 20ms);
}
