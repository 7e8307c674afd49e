#include <gtest/gtest.h>
#include "../include/sustain_timer.h"
#include "test_helpers.h"

using namespace DeskMonitor;
using Testing::at;

TEST(SustainTimerTest, AccumulatesWhileConditionHolds)
{
    SustainTimer timer;
    EXPECT_DOUBLE_EQ(timer.update(true, at(0.0)), 0.0);
    EXPECT_NEAR(timer.update(true, at(1.5)), 1.5, 1e-9);
    EXPECT_NEAR(timer.update(true, at(4.0)), 4.0, 1e-9);
    EXPECT_TRUE(timer.hasReached(4.0));
    EXPECT_FALSE(timer.hasReached(4.5));
}

TEST(SustainTimerTest, ClearingConditionResetsToZero)
{
    SustainTimer timer;
    timer.update(true, at(0.0));
    timer.update(true, at(10.0));
    EXPECT_DOUBLE_EQ(timer.update(false, at(11.0)), 0.0);
    EXPECT_FALSE(timer.isActive());

    timer.update(true, at(12.0));
    EXPECT_NEAR(timer.update(true, at(13.0)), 1.0, 1e-9);
}

TEST(SustainTimerTest, PauseSkipsTheGapButKeepsTotal)
{
    SustainTimer timer;
    timer.update(true, at(0.0));
    timer.update(true, at(5.0));
    timer.pause();
    EXPECT_NEAR(timer.sustainedSeconds(), 5.0, 1e-9);

    // 20 s gap not credited
    EXPECT_NEAR(timer.update(true, at(25.0)), 5.0, 1e-9);
    EXPECT_NEAR(timer.update(true, at(26.0)), 6.0, 1e-9);
}

TEST(SustainTimerTest, ResetForgetsEverything)
{
    SustainTimer timer;
    timer.update(true, at(0.0));
    timer.update(true, at(3.0));
    timer.reset();
    EXPECT_FALSE(timer.isActive());
    EXPECT_DOUBLE_EQ(timer.sustainedSeconds(), 0.0);
}
