#ifndef SPINLOGO_GEOMETRY_TRANSFORM_HPP
#define SPINLOGO_GEOMETRY_TRANSFORM_HPP

#include "curve.hpp"

namespace spinlogo {

constexpr double kPi = 3.14159265358979323846;

constexpr double degrees_to_radians(double degrees) {
    return degrees * kPi / 180.0;
}

// Rotate a single point counter-clockwise about center
Vec2 rotate(const Vec2& point, double angle_deg, const Vec2& center = vec2::zero());

// Rotate every point counter-clockwise about center
Curve rotate(const Curve& points, double angle_deg, const Vec2& center = vec2::zero());

// Reflect across the line through the origin at axis_angle_deg.
// Off-origin axes: translate(-p), reflect, translate(+p).
Vec2 reflect(const Vec2& point, double axis_angle_deg);
Curve reflect(const Curve& points, double axis_angle_deg);

Curve translate(const Curve& points, const Vec2& offset);

// Multiply every coordinate by factor (about the origin)
Curve scale(const Curve& points, double factor);

}  // namespace spinlogo

#endif // SPINLOGO_GEOMETRY_TRANSFORM_HPP
