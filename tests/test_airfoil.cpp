#include <gtest/gtest.h>
#include <geometry/airfoil.hpp>
#include <common/errors.hpp>
#include <cmath>

using namespace spinlogo;

TEST(AirfoilTest, DefaultParametersGiveClosedCurve) {
    Curve airfoil = generate_airfoil(AirfoilParams{});

    ASSERT_EQ(airfoil.size(), static_cast<size_t>(kAirfoilSamples));
    EXPECT_TRUE(all_finite(airfoil));
    EXPECT_NEAR(airfoil.front().x, airfoil.back().x, 1e-9);
    EXPECT_NEAR(airfoil.front().y, airfoil.back().y, 1e-9);
}

TEST(AirfoilTest, FirstPointMatchesJoukowskyMap) {
    // theta = 0: w = (xc + R, yc)
    AirfoilParams params;
    Curve airfoil = generate_airfoil(params);

    double wx = params.x_center + params.radius;
    double wy = params.y_center;
    double w2 = wx * wx + wy * wy;
    double a2 = params.radius * params.radius;
    EXPECT_NEAR(airfoil[0].x, wx + a2 * wx / w2, 1e-12);
    EXPECT_NEAR(airfoil[0].y, wy - a2 * wy / w2, 1e-12);
}

TEST(AirfoilTest, ScaleMultipliesEveryPoint) {
    AirfoilParams params;
    Curve base = generate_airfoil(params);
    params.scale = 2.5;
    Curve scaled = generate_airfoil(params);

    ASSERT_EQ(base.size(), scaled.size());
    for (size_t i = 0; i < base.size(); ++i) {
        EXPECT_NEAR(scaled[i].x, 2.5 * base[i].x, 1e-12);
        EXPECT_NEAR(scaled[i].y, 2.5 * base[i].y, 1e-12);
    }
}

TEST(AirfoilTest, CenteredCircleMapsToSegment) {
    // A circle of radius R at the origin maps onto [-2R, 2R] on the x axis
    AirfoilParams params;
    params.radius = 1.0;
    params.x_center = 0.0;
    params.y_center = 0.0;
    params.scale = 1.0;

    for (const auto& p : generate_airfoil(params, 64)) {
        EXPECT_NEAR(p.y, 0.0, 1e-12);
        EXPECT_LE(std::abs(p.x), 2.0 + 1e-12);
    }
}

TEST(AirfoilTest, CircleThroughOriginThrows) {
    AirfoilParams params;
    params.radius = 0.5;
    params.x_center = 0.0;
    params.y_center = 0.5;
    EXPECT_THROW(generate_airfoil(params), DomainError);
}

TEST(AirfoilTest, SliderRangeGivesFiniteCurves) {
    for (int i = 0; i <= 7; ++i) {
        for (int j = 0; j <= 4; ++j) {
            for (int k = 0; k <= 4; ++k) {
                for (double scale : {0.1, 1.0, 3.0}) {
                    AirfoilParams params;
                    params.radius = 0.5 + 0.1 * i;
                    params.x_center = -0.5 + 0.25 * j;
                    params.y_center = 0.125 * k;
                    params.scale = scale;

                    double offset = std::hypot(params.x_center, params.y_center);
                    if (std::abs(offset - params.radius) <= 1e-9 * params.radius) {
                        EXPECT_THROW(generate_airfoil(params), DomainError);
                        continue;
                    }
                    Curve airfoil = generate_airfoil(params);
                    EXPECT_EQ(airfoil.size(), static_cast<size_t>(kAirfoilSamples));
                    EXPECT_TRUE(all_finite(airfoil))
                        << "R=" << params.radius << " xc=" << params.x_center
                        << " yc=" << params.y_center << " scale=" << scale;
                }
            }
        }
    }
}

TEST(AirfoilTest, TooFewSamplesThrows) {
    EXPECT_THROW(generate_airfoil(AirfoilParams{}, 1), DomainError);
}

TEST(AirfoilTest, ValidateDefaults) {
    ValidationResult result = AirfoilParams{}.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(AirfoilTest, ValidateRejectsOutOfRange) {
    AirfoilParams params;
    params.radius = 1.5;
    params.scale = 0.0;
    ValidationResult result = params.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST(AirfoilTest, ValidateRejectsCircleThroughOrigin) {
    AirfoilParams params;
    params.radius = 0.5;
    params.x_center = 0.0;
    params.y_center = 0.5;
    ValidationResult result = params.validate();
    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("origin"), std::string::npos);
}
