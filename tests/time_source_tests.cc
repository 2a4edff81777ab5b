#include <gtest/gtest.h>

#include "time_source.hpp"

TEST(TimeSourceTest, DefaultsToNormalSpeed) {
    TimeSource time;
    EXPECT_EQ(time.RawSpeed(), 1);
    EXPECT_FALSE(time.IsPaused());
    EXPECT_DOUBLE_EQ(time.CurrentSpeedMultiplier(), 1.0);
}

TEST(TimeSourceTest, PauseReportsZeroMultiplier) {
    TimeSource time;
    ASSERT_TRUE(time.SetTimeSpeed(16));
    time.SetPaused(true);
    EXPECT_DOUBLE_EQ(time.CurrentSpeedMultiplier(), 0.0);
    EXPECT_EQ(time.RawSpeed(), 16);

    time.TogglePause();
    EXPECT_DOUBLE_EQ(time.CurrentSpeedMultiplier(), 16.0);
}

TEST(TimeSourceTest, RejectsUnsupportedSpeeds) {
    TimeSource time;
    EXPECT_FALSE(time.SetTimeSpeed(3));
    EXPECT_FALSE(time.SetTimeSpeed(0));
    EXPECT_EQ(time.RawSpeed(), 1);
    EXPECT_TRUE(time.SetTimeSpeed(32));
    EXPECT_EQ(time.RawSpeed(), 32);
}

TEST(TimeSourceTest, SlowestVoteWins) {
    TimeSource time;
    ASSERT_TRUE(time.Vote("alice", 16));
    ASSERT_TRUE(time.Vote("bob", 4));
    EXPECT_EQ(time.RawSpeed(), 4);

    time.ClearVote("bob");
    EXPECT_EQ(time.RawSpeed(), 16);

    time.ClearVote("alice");
    EXPECT_EQ(time.RawSpeed(), 1);

    EXPECT_FALSE(time.Vote("carol", 5));
    EXPECT_EQ(time.RawSpeed(), 1);
}

TEST(TimeSourceTest, StationApproachRestoresPreviousSpeed) {
    TimeSource time;
    ASSERT_TRUE(time.SetTimeSpeed(8));
    time.StoreSpeedAndSetNormal();
    EXPECT_EQ(time.RawSpeed(), 1);
    time.RestorePreviousSpeed();
    EXPECT_EQ(time.RawSpeed(), 8);

    // Nothing stored at 1x
    time.SetTimeSpeed(1);
    time.StoreSpeedAndSetNormal();
    time.RestorePreviousSpeed();
    EXPECT_EQ(time.RawSpeed(), 1);
}

TEST(TimeSourceTest, GameTimeAccumulatesScaledDelta) {
    TimeSource time;
    ASSERT_TRUE(time.SetTimeSpeed(4));
    EXPECT_DOUBLE_EQ(time.Advance(0.5), 2.0);
    time.SetPaused(true);
    EXPECT_DOUBLE_EQ(time.Advance(10.0), 0.0);
    EXPECT_DOUBLE_EQ(time.GameTime(), 2.0);
}
