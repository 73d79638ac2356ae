#include <gtest/gtest.h>
#include <fillet/line_joint_solver.hpp>
#include <geometry/transform.hpp>
#include <common/errors.hpp>

using namespace spinlogo;

namespace {

// Perpendicular distance from p to the infinite line through a and b
double line_distance(const Vec2& p, const Vec2& a, const Vec2& b) {
    Vec2 d = (b - a).normalized();
    return std::abs(d.cross(p - a));
}

}  // namespace

TEST(LineJointSolverTest, RightAngle) {
    Vec2 a(0.0, 1.0), b(0.0, 0.0), c(1.0, 0.0);
    FilletResult joint = LineJointSolver::solve(a, b, c, 0.2, Orientation::CounterClockwise);

    EXPECT_NEAR(joint.center.x, 0.2, 1e-12);
    EXPECT_NEAR(joint.center.y, 0.2, 1e-12);
    EXPECT_NEAR(joint.contact_a.x, 0.0, 1e-12);
    EXPECT_NEAR(joint.contact_a.y, 0.2, 1e-12);
    EXPECT_NEAR(joint.contact_b.x, 0.2, 1e-12);
    EXPECT_NEAR(joint.contact_b.y, 0.0, 1e-12);
    EXPECT_NEAR(joint.sweep(), kPi / 2.0, 1e-9);
    EXPECT_LT(joint.residual, 1e-12);
}

TEST(LineJointSolverTest, CenterIsRadiusFromBothLegs) {
    Vec2 a(-0.1, 0.9), b(-0.1, 0.0), c(0.35, -0.6);
    double r = 0.3;
    FilletResult joint = LineJointSolver::solve(a, b, c, r, Orientation::Clockwise);

    EXPECT_NEAR(line_distance(joint.center, b, a), r, 1e-6);
    EXPECT_NEAR(line_distance(joint.center, b, c), r, 1e-6);
    EXPECT_NEAR(joint.center.distance_to(joint.contact_a), r, 1e-12);
    EXPECT_NEAR(joint.center.distance_to(joint.contact_b), r, 1e-12);
}

TEST(LineJointSolverTest, ArcRunsBetweenContacts) {
    Vec2 a(0.0, 1.0), b(0.0, 0.0), c(1.0, 0.0);
    FilletResult joint = LineJointSolver::solve(a, b, c, 0.2, Orientation::CounterClockwise, 25);

    ASSERT_EQ(joint.arc.size(), 25u);
    EXPECT_EQ(joint.arc.front(), joint.contact_a);
    EXPECT_EQ(joint.arc.back(), joint.contact_b);

    // The arc bulges towards the vertex
    Vec2 mid = joint.arc[12];
    EXPECT_LT(mid.length(), joint.center.length());
}

TEST(LineJointSolverTest, SweepMatchesOpeningAngle) {
    // 120 degree opening: half-angle 60, arc covers 60 degrees
    Vec2 b(0.0, 0.0);
    Vec2 a = vec2::from_angle(degrees_to_radians(90.0));
    Vec2 c = vec2::from_angle(degrees_to_radians(-30.0));
    FilletResult joint = LineJointSolver::solve(a, b, c, 0.1, Orientation::CounterClockwise);

    EXPECT_NEAR(LineJointSolver::half_angle(a, b, c), kPi / 3.0, 1e-12);
    EXPECT_NEAR(joint.sweep(), kPi / 3.0, 1e-9);
    EXPECT_NEAR(joint.contact_a.distance_to(b),
                LineJointSolver::tangent_length(0.1, kPi / 3.0), 1e-12);
}

TEST(LineJointSolverTest, FoldedLegsThrow) {
    EXPECT_THROW(LineJointSolver::solve(Vec2(1.0, 0.0), vec2::zero(), Vec2(2.0, 0.0),
                                        0.1, Orientation::Clockwise),
                 DomainError);
}

TEST(LineJointSolverTest, StraightJointThrows) {
    EXPECT_THROW(LineJointSolver::solve(Vec2(-1.0, 0.0), vec2::zero(), Vec2(1.0, 0.0),
                                        0.1, Orientation::Clockwise),
                 DomainError);
}

TEST(LineJointSolverTest, DegenerateInputsThrow) {
    EXPECT_THROW(LineJointSolver::solve(vec2::zero(), vec2::zero(), Vec2(1.0, 0.0),
                                        0.1, Orientation::Clockwise),
                 DomainError);
    EXPECT_THROW(LineJointSolver::solve(Vec2(0.0, 1.0), vec2::zero(), Vec2(1.0, 0.0),
                                        0.0, Orientation::Clockwise),
                 DomainError);
}

// ============================================
// Orientation helpers
// ============================================

TEST(FilletTest, UnwrapEndAngle) {
    EXPECT_NEAR(unwrap_end_angle(0.0, -kPi / 2.0, Orientation::CounterClockwise),
                1.5 * kPi, 1e-15);
    EXPECT_NEAR(unwrap_end_angle(0.0, kPi / 2.0, Orientation::Clockwise),
                -1.5 * kPi, 1e-15);
    EXPECT_NEAR(unwrap_end_angle(3.0, -3.0, Orientation::CounterClockwise),
                -3.0 + 2.0 * kPi, 1e-15);
}

TEST(FilletTest, SweepArcFollowsOrientation) {
    Curve ccw = sweep_arc(vec2::zero(), 1.0, Vec2(1.0, 0.0), Vec2(0.0, 1.0),
                          Orientation::CounterClockwise, 3);
    EXPECT_GT(ccw[1].y, 0.0);
    EXPECT_GT(ccw[1].x, 0.0);

    Curve cw = sweep_arc(vec2::zero(), 1.0, Vec2(1.0, 0.0), Vec2(0.0, 1.0),
                         Orientation::Clockwise, 3);
    EXPECT_LT(cw[1].x, 0.0);
    EXPECT_LT(cw[1].y, 0.0);
}

TEST(FilletTest, SweepArcEndsOnGivenPoints) {
    // Neither end lies on the circle; the samples in between do
    Vec2 from(1.0 + 1e-9, 0.0);
    Vec2 to(0.3, 0.9);
    Curve arc = sweep_arc(vec2::zero(), 1.0, from, to, Orientation::CounterClockwise, 20);

    ASSERT_EQ(arc.size(), 20u);
    EXPECT_EQ(arc.front(), from);
    EXPECT_EQ(arc.back(), to);
    EXPECT_NEAR(arc[10].length(), 1.0, 1e-12);
}
