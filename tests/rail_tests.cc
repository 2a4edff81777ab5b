#include <gtest/gtest.h>

#include "rail.hpp"

#include <cmath>
#include <stdexcept>

namespace {

RailConfig MakeConfig(std::vector<Vec3> points) {
    RailConfig config;
    config.id = "r1";
    config.name = "r1";
    config.station_a = "a";
    config.station_b = "b";
    config.track_points = std::move(points);
    return config;
}

void ExpectVec(const Vec3& v, double x, double y, double z) {
    EXPECT_NEAR(v.x, x, 1e-9);
    EXPECT_NEAR(v.y, y, 1e-9);
    EXPECT_NEAR(v.z, z, 1e-9);
}

} // namespace

TEST(RailTest, ConstructionRequiresTwoPoints) {
    EXPECT_THROW(Rail(MakeConfig({})), std::invalid_argument);
    EXPECT_THROW(Rail(MakeConfig({Vec3{0, 0, 0}})), std::invalid_argument);
    EXPECT_NO_THROW(Rail(MakeConfig({Vec3{0, 0, 0}, Vec3{1, 0, 0}})));
}

TEST(RailTest, TotalLengthIsSumOfSegments) {
    const Rail rail(MakeConfig({Vec3{0, 0, 0}, Vec3{3, 0, 4}, Vec3{3, 0, 14}}));
    EXPECT_DOUBLE_EQ(rail.TotalLength(), 15.0);
    EXPECT_EQ(rail.SegmentCount(), 2u);
}

TEST(RailTest, PositionAtEndpointsReturnsControlPoints) {
    const Rail rail(MakeConfig({Vec3{1, 2, 3}, Vec3{5, 2, 3}, Vec3{5, 2, 9}}));
    ExpectVec(rail.PositionAt(0.0), 1, 2, 3);
    ExpectVec(rail.PositionAt(1.0), 5, 2, 9);
    ExpectVec(rail.PositionAt(-0.5), 1, 2, 3);
    ExpectVec(rail.PositionAt(1.5), 5, 2, 9);
}

TEST(RailTest, PositionAtIsArcLengthParameterised) {
    // 10 units along x, then 30 units along z
    const Rail rail(MakeConfig({Vec3{0, 0, 0}, Vec3{10, 0, 0}, Vec3{10, 0, 30}}));
    ExpectVec(rail.PositionAt(0.125), 5, 0, 0);
    ExpectVec(rail.PositionAt(0.25), 10, 0, 0);
    ExpectVec(rail.PositionAt(0.5), 10, 0, 10);
}

TEST(RailTest, DirectionAtFollowsContainingSegment) {
    const Rail rail(MakeConfig({Vec3{0, 0, 0}, Vec3{10, 0, 0}, Vec3{10, 0, 30}}));
    ExpectVec(rail.DirectionAt(0.0), 1, 0, 0);
    ExpectVec(rail.DirectionAt(0.1), 1, 0, 0);
    ExpectVec(rail.DirectionAt(0.6), 0, 0, 1);
    ExpectVec(rail.DirectionAt(1.0), 0, 0, 1);
}

TEST(RailTest, DirectionAtSkipsZeroLengthSegments) {
    const Rail rail(MakeConfig({Vec3{0, 0, 0}, Vec3{0, 0, 0}, Vec3{0, 0, -8}}));
    ExpectVec(rail.DirectionAt(0.0), 0, 0, -1);
    ExpectVec(rail.DirectionAt(1.0), 0, 0, -1);
}

TEST(RailTest, DegenerateRailReturnsDefaultForward) {
    const Rail rail(MakeConfig({Vec3{2, 0, 2}, Vec3{2, 0, 2}}));
    EXPECT_DOUBLE_EQ(rail.TotalLength(), 0.0);
    ExpectVec(rail.DirectionAt(0.5), DEFAULT_FORWARD.x, DEFAULT_FORWARD.y, DEFAULT_FORWARD.z);
    ExpectVec(rail.PositionAt(0.5), 2, 0, 2);
    EXPECT_DOUBLE_EQ(rail.DistanceToProgress(3.0), 1.0);
    EXPECT_DOUBLE_EQ(rail.DistanceToProgress(0.0), 0.0);
}

TEST(RailTest, GeometryQueriesAreIdempotent) {
    const Rail rail(MakeConfig({Vec3{0, 0, 0}, Vec3{7, 1, 3}, Vec3{-2, 0, 11}, Vec3{4, 4, 4}}));
    for (double p : {0.0, 0.13, 0.5, 0.77, 1.0}) {
        const Vec3 first_pos = rail.PositionAt(p);
        const Vec3 first_dir = rail.DirectionAt(p);
        const Vec3 second_pos = rail.PositionAt(p);
        const Vec3 second_dir = rail.DirectionAt(p);
        EXPECT_EQ(first_pos.x, second_pos.x);
        EXPECT_EQ(first_pos.y, second_pos.y);
        EXPECT_EQ(first_pos.z, second_pos.z);
        EXPECT_EQ(first_dir.x, second_dir.x);
        EXPECT_EQ(first_dir.y, second_dir.y);
        EXPECT_EQ(first_dir.z, second_dir.z);
    }
}

TEST(RailTest, SegmentAtReportsIndexAndFraction) {
    const Rail rail(MakeConfig({Vec3{0, 0, 0}, Vec3{10, 0, 0}, Vec3{10, 0, 30}}));
    SegmentInfo first = rail.SegmentAt(0.125);
    EXPECT_EQ(first.index, 0u);
    EXPECT_NEAR(first.fraction, 0.5, 1e-12);

    SegmentInfo end = rail.SegmentAt(1.0);
    EXPECT_EQ(end.index, 1u);
    EXPECT_DOUBLE_EQ(end.fraction, 1.0);
}

TEST(RailTest, EndpointForMapsStationsToProgress) {
    const Rail rail(MakeConfig({Vec3{0, 0, 0}, Vec3{10, 0, 0}}));
    EXPECT_DOUBLE_EQ(rail.EndpointFor("a"), 0.0);
    EXPECT_DOUBLE_EQ(rail.EndpointFor("b"), 1.0);
    EXPECT_LT(rail.EndpointFor("c"), 0.0);
    EXPECT_TRUE(rail.Connects("b"));
    EXPECT_FALSE(rail.Connects("c"));
}

TEST(RailNetworkTest, StationPositionFallsBackToRailEndpoint) {
    RailNetwork network;
    EXPECT_TRUE(network.AddRail(Rail(MakeConfig({Vec3{0, 0, 0}, Vec3{10, 0, 0}}))));
    EXPECT_FALSE(network.AddRail(Rail(MakeConfig({Vec3{0, 0, 0}, Vec3{5, 0, 0}}))));
    network.AddStation("depot", Vec3{1, 2, 3});

    Vec3 pos;
    ASSERT_TRUE(network.StationPosition("depot", pos));
    ExpectVec(pos, 1, 2, 3);
    ASSERT_TRUE(network.StationPosition("b", pos));
    ExpectVec(pos, 10, 0, 0);
    EXPECT_FALSE(network.StationPosition("nowhere", pos));
    EXPECT_NE(network.FindRail("r1"), nullptr);
    EXPECT_EQ(network.FindRail("r2"), nullptr);
}
