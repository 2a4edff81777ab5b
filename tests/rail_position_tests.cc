#include <gtest/gtest.h>

#include "rail_position.hpp"

TEST(RailPositionTest, SetRailPositionClampsProgress) {
    RailPosition pos;
    SetRailPosition(pos, "r1", 1.7, TravelDirection::Reverse);
    EXPECT_TRUE(pos.on_rail);
    EXPECT_EQ(pos.rail_id, "r1");
    EXPECT_DOUBLE_EQ(pos.progress, 1.0);
    EXPECT_EQ(pos.direction, TravelDirection::Reverse);

    SetRailPosition(pos, "r1", -0.2);
    EXPECT_DOUBLE_EQ(pos.progress, 0.0);
    EXPECT_EQ(pos.direction, TravelDirection::Forward);
}

TEST(RailPositionTest, UpdateProgressNeverOvershoots) {
    RailPosition pos;
    SetRailPosition(pos, "r1", 0.9, TravelDirection::Forward);
    UpdateProgress(pos, 10.0);
    EXPECT_EQ(pos.progress, 1.0);

    SetRailPosition(pos, "r1", 0.1, TravelDirection::Reverse);
    UpdateProgress(pos, 10.0);
    EXPECT_EQ(pos.progress, 0.0);
}

TEST(RailPositionTest, UpdateProgressStaysInRangeForAnyDelta) {
    for (double delta : {0.0, 1e-12, 0.05, 0.3333, 1.0, 2.5, 1e6}) {
        for (auto dir : {TravelDirection::Forward, TravelDirection::Reverse}) {
            RailPosition pos;
            SetRailPosition(pos, "r1", 0.5, dir);
            for (int i = 0; i < 50; ++i) {
                UpdateProgress(pos, delta);
                EXPECT_GE(pos.progress, 0.0);
                EXPECT_LE(pos.progress, 1.0);
            }
        }
    }
}

TEST(RailPositionTest, UpdateProgressIsNoOpOffRail) {
    RailPosition pos;
    UpdateProgress(pos, 0.5);
    EXPECT_DOUBLE_EQ(pos.progress, 0.0);
    EXPECT_FALSE(pos.on_rail);
}

TEST(RailPositionTest, AccumulatedStepsLandExactlyOnBound) {
    RailPosition pos;
    SetRailPosition(pos, "r1", 0.0, TravelDirection::Forward);
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(HasReachedEnd(pos));
        UpdateProgress(pos, 0.1);
    }
    EXPECT_EQ(pos.progress, 1.0);
    EXPECT_TRUE(HasReachedEnd(pos));
}

TEST(RailPositionTest, HasReachedEndDependsOnDirection) {
    RailPosition pos;
    SetRailPosition(pos, "r1", 1.0, TravelDirection::Forward);
    EXPECT_TRUE(HasReachedEnd(pos));

    SetRailPosition(pos, "r1", 1.0, TravelDirection::Reverse);
    EXPECT_FALSE(HasReachedEnd(pos));

    SetRailPosition(pos, "r1", 0.0, TravelDirection::Reverse);
    EXPECT_TRUE(HasReachedEnd(pos));

    SetRailPosition(pos, "r1", 0.0, TravelDirection::Forward);
    EXPECT_FALSE(HasReachedEnd(pos));

    ClearRailPosition(pos);
    EXPECT_FALSE(HasReachedEnd(pos));
}

TEST(RailPositionTest, ReverseDirectionKeepsProgress) {
    RailPosition pos;
    SetRailPosition(pos, "r1", 0.4, TravelDirection::Forward);
    ReverseDirection(pos);
    EXPECT_EQ(pos.direction, TravelDirection::Reverse);
    EXPECT_DOUBLE_EQ(pos.progress, 0.4);
    ReverseDirection(pos);
    EXPECT_EQ(pos.direction, TravelDirection::Forward);
}

TEST(RailPositionTest, ClearRailPositionResetsRailState) {
    RailPosition pos;
    SetRailPosition(pos, "r1", 0.4, TravelDirection::Reverse);
    SetFormationOffset(pos, 6.5, 0.25);
    ClearRailPosition(pos);
    EXPECT_FALSE(pos.on_rail);
    EXPECT_TRUE(pos.rail_id.empty());
    EXPECT_DOUBLE_EQ(pos.progress, 0.0);
    EXPECT_EQ(pos.direction, TravelDirection::Forward);
    EXPECT_DOUBLE_EQ(pos.longitudinal_offset, 6.5);
    EXPECT_DOUBLE_EQ(pos.side_offset, 0.25);
}

TEST(RailPositionTest, DirectionNamesParseBack) {
    TravelDirection dir = TravelDirection::Forward;
    EXPECT_TRUE(ParseDirection(ToString(TravelDirection::Reverse), dir));
    EXPECT_EQ(dir, TravelDirection::Reverse);
    EXPECT_FALSE(ParseDirection("sideways", dir));
}
