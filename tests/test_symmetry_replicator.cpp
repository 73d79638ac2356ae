#include <gtest/gtest.h>
#include <emblem/symmetry_replicator.hpp>
#include <geometry/transform.hpp>

using namespace spinlogo;

TEST(RevolutionAnglesTest, EvenlySpaced) {
    EXPECT_EQ(revolution_angles(1), std::vector<double>{0.0});

    auto three = revolution_angles(3);
    ASSERT_EQ(three.size(), 3u);
    EXPECT_DOUBLE_EQ(three[0], 0.0);
    EXPECT_DOUBLE_EQ(three[1], 120.0);
    EXPECT_DOUBLE_EQ(three[2], 240.0);

    auto twelve = revolution_angles(12);
    ASSERT_EQ(twelve.size(), 12u);
    EXPECT_DOUBLE_EQ(twelve[11], 330.0);
}

TEST(RevolutionAnglesTest, NonPositiveCountThrows) {
    EXPECT_THROW(revolution_angles(0), std::invalid_argument);
    EXPECT_THROW(revolution_angles(-2), std::invalid_argument);
}

TEST(SymmetryReplicatorTest, ZeroAngleCopiesExactly) {
    Curve base{{0.1, 0.2}, {0.3, -0.4}, {1.0 / 3.0, 2.0 / 7.0}};
    auto copies = replicate({base}, {0.0});
    ASSERT_EQ(copies.size(), 1u);
    EXPECT_EQ(copies[0], base);
}

TEST(SymmetryReplicatorTest, ThreeFoldRotation) {
    Curve base{{1.0, 0.0}, {0.0, 1.0}};
    auto copies = replicate({base}, revolution_angles(3));
    ASSERT_EQ(copies.size(), 3u);

    for (size_t k = 0; k < 3; ++k) {
        Vec2 expected = vec2::from_angle(degrees_to_radians(120.0 * static_cast<double>(k)));
        EXPECT_NEAR(copies[k][0].x, expected.x, 1e-12);
        EXPECT_NEAR(copies[k][0].y, expected.y, 1e-12);
    }
}

TEST(SymmetryReplicatorTest, AngleMajorOrder) {
    Curve a{{1.0, 0.0}};
    Curve b{{2.0, 0.0}};
    auto copies = replicate({a, b}, {0.0, 90.0});
    ASSERT_EQ(copies.size(), 4u);

    EXPECT_EQ(copies[0], a);
    EXPECT_EQ(copies[1], b);
    EXPECT_NEAR(copies[2][0].y, 1.0, 1e-12);
    EXPECT_NEAR(copies[3][0].y, 2.0, 1e-12);
}

TEST(SymmetryReplicatorTest, EmptyInputs) {
    EXPECT_TRUE(replicate({}, {0.0, 120.0}).empty());
    EXPECT_TRUE(replicate({Curve{{1.0, 0.0}}}, {}).empty());
}
