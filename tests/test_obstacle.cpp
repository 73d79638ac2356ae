#include <gtest/gtest.h>
#include <geometry/obstacle.hpp>
#include <geometry/transform.hpp>

using namespace spinlogo;

TEST(CurveTest, LinspaceEndpoints) {
    auto values = linspace(0.0, 1.0, 5);
    ASSERT_EQ(values.size(), 5u);
    EXPECT_DOUBLE_EQ(values.front(), 0.0);
    EXPECT_DOUBLE_EQ(values[2], 0.5);
    EXPECT_DOUBLE_EQ(values.back(), 1.0);

    EXPECT_EQ(linspace(3.0, 7.0, 1), std::vector<double>{3.0});
    EXPECT_THROW(linspace(0.0, 1.0, 0), std::invalid_argument);
}

TEST(CurveTest, SampleArcFollowsSweepSign) {
    Curve ccw = sample_arc(vec2::zero(), 1.0, 0.0, kPi / 2.0, 3);
    EXPECT_NEAR(ccw[1].x, std::sqrt(0.5), 1e-15);
    EXPECT_NEAR(ccw[1].y, std::sqrt(0.5), 1e-15);

    Curve cw = sample_arc(vec2::zero(), 1.0, 0.0, -kPi / 2.0, 3);
    EXPECT_NEAR(cw[1].y, -std::sqrt(0.5), 1e-15);
    EXPECT_NEAR(cw[2].y, -1.0, 1e-15);
}

TEST(CurveTest, ClosestIndexPicksFirstOnTies) {
    Curve c{{0.0, 0.0}, {1.0, 0.0}, {2.0, 0.0}};
    EXPECT_EQ(closest_index(c, Vec2(1.1, 0.5)), 1u);
    EXPECT_EQ(closest_index(c, Vec2(0.5, 0.0)), 0u);
    EXPECT_THROW(closest_index(Curve{}, vec2::zero()), std::invalid_argument);
}

TEST(CurveTest, BoundingBox) {
    Curve c{{0.5, -1.0}, {-2.0, 3.0}, {1.0, 0.0}};
    auto [lo, hi] = bounding_box(c);
    EXPECT_EQ(lo, Vec2(-2.0, -1.0));
    EXPECT_EQ(hi, Vec2(1.0, 3.0));
}

// ============================================
// Obstacles
// ============================================

TEST(ObstacleTest, SegmentDistanceIsExact) {
    Obstacle seg = Obstacle::segment(Vec2(0.0, 0.0), Vec2(0.0, 1.0));
    EXPECT_EQ(seg.kind(), ObstacleKind::Segment);
    EXPECT_DOUBLE_EQ(seg.distance_to(Vec2(0.3, 0.5)), 0.3);
    EXPECT_DOUBLE_EQ(seg.sampling_error_bound(), 0.0);

    // Beyond the end the distance is to the endpoint
    EXPECT_DOUBLE_EQ(seg.distance_to(Vec2(0.0, 3.0)), 2.0);
    EXPECT_EQ(seg.closest_point(Vec2(-1.0, 0.25)), Vec2(0.0, 0.25));
}

TEST(ObstacleTest, PolylineUsesNearestLeg) {
    Obstacle poly = Obstacle::polyline({{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}});
    EXPECT_DOUBLE_EQ(poly.distance_to(Vec2(1.5, 0.5)), 0.5);
    EXPECT_DOUBLE_EQ(poly.distance_to(Vec2(0.5, -0.25)), 0.25);
}

TEST(ObstacleTest, SampledArcDistanceWithinBound) {
    Obstacle arc = Obstacle::sampled_arc(vec2::zero(), 1.0, 0.0, kPi / 2.0, 100);
    EXPECT_EQ(arc.kind(), ObstacleKind::SampledArc);
    EXPECT_EQ(arc.points().size(), 100u);

    double bound = arc.sampling_error_bound();
    EXPECT_GT(bound, 0.0);
    EXPECT_LT(bound, 0.02);

    // True distance from (0.5, 0.6) to the unit circle
    Vec2 p(0.5, 0.6);
    double exact = 1.0 - p.length();
    EXPECT_GE(arc.distance_to(p), exact - 1e-12);
    EXPECT_LE(arc.distance_to(p), exact + bound);
}

TEST(ObstacleTest, SampledArcClosestPointIsASample) {
    Curve samples = sample_arc(vec2::zero(), 1.0, 0.0, kPi, 5);
    Obstacle arc = Obstacle::sampled_arc(samples);
    EXPECT_EQ(arc.closest_point(Vec2(0.1, 2.0)), samples[2]);
}

TEST(ObstacleTest, RejectsEmptyInput) {
    EXPECT_THROW(Obstacle::sampled_arc(Curve{}), std::invalid_argument);
    EXPECT_THROW(Obstacle::polyline(Curve{{1.0, 1.0}}), std::invalid_argument);
}

TEST(ObstacleTest, KindNames) {
    EXPECT_EQ(to_string(ObstacleKind::Segment), "segment");
    EXPECT_EQ(to_string(ObstacleKind::SampledArc), "sampled_arc");
}
