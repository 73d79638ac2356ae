#include "transform.hpp"
#include <cmath>

namespace spinlogo {

namespace {

// Standard 2x2 rotation with precomputed cos/sin
Vec2 rotate_by(const Vec2& p, double c, double s) {
    return {c * p.x - s * p.y, s * p.x + c * p.y};
}

}  // namespace

Vec2 rotate(const Vec2& point, double angle_deg, const Vec2& center) {
    double rad = degrees_to_radians(angle_deg);
    return rotate_by(point - center, std::cos(rad), std::sin(rad)) + center;
}

Curve rotate(const Curve& points, double angle_deg, const Vec2& center) {
    double rad = degrees_to_radians(angle_deg);
    double c = std::cos(rad);
    double s = std::sin(rad);

    Curve out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back(rotate_by(p - center, c, s) + center);
    }
    return out;
}

Vec2 reflect(const Vec2& point, double axis_angle_deg) {
    double rad = degrees_to_radians(axis_angle_deg);
    double c = std::cos(rad);
    double s = std::sin(rad);

    // Bring the axis onto +x, mirror, rotate back
    Vec2 aligned = rotate_by(point, c, -s);
    aligned.y = -aligned.y;
    return rotate_by(aligned, c, s);
}

Curve reflect(const Curve& points, double axis_angle_deg) {
    Curve out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back(reflect(p, axis_angle_deg));
    }
    return out;
}

Curve translate(const Curve& points, const Vec2& offset) {
    Curve out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back(p + offset);
    }
    return out;
}

Curve scale(const Curve& points, double factor) {
    Curve out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back(p * factor);
    }
    return out;
}

}  // namespace spinlogo
