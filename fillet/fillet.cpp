#include "fillet.hpp"
#include <geometry/transform.hpp>
#include <cmath>

namespace spinlogo {

std::string to_string(Orientation orientation) {
    return orientation == Orientation::Clockwise ? "clockwise" : "counter_clockwise";
}

double FilletResult::sweep() const {
    if (arc.size() < 2) {
        return 0.0;
    }
    double total = 0.0;
    double prev = (arc.front() - center).angle();
    for (size_t i = 1; i < arc.size(); ++i) {
        double a = (arc[i] - center).angle();
        double d = std::remainder(a - prev, 2.0 * kPi);
        total += d;
        prev = a;
    }
    return total;
}

double unwrap_end_angle(double start_angle, double end_angle, Orientation orientation) {
    const double turn = 2.0 * kPi;
    if (orientation == Orientation::CounterClockwise) {
        while (end_angle < start_angle) end_angle += turn;
        while (end_angle - start_angle >= turn) end_angle -= turn;
    } else {
        while (end_angle > start_angle) end_angle -= turn;
        while (start_angle - end_angle >= turn) end_angle += turn;
    }
    return end_angle;
}

Curve sweep_arc(const Vec2& center, double radius,
                const Vec2& from, const Vec2& to,
                Orientation orientation, int samples) {
    double start = (from - center).angle();
    double end = unwrap_end_angle(start, (to - center).angle(), orientation);
    Curve arc = sample_arc(center, radius, start, end, samples);

    // End samples are the given points, not their projections on the circle
    if (!arc.empty()) {
        arc.front() = from;
        arc.back() = to;
    }
    return arc;
}

FilletResult make_fillet(const Vec2& center,
                         const Obstacle& a, const Obstacle& b,
                         double radius, Orientation orientation, int samples) {
    FilletResult result;
    result.center = center;
    result.radius = radius;
    result.contact_a = a.closest_point(center);
    result.contact_b = b.closest_point(center);
    result.arc = sweep_arc(center, radius, result.contact_a, result.contact_b,
                           orientation, samples);

    double ea = center.distance_to(result.contact_a) - radius;
    double eb = center.distance_to(result.contact_b) - radius;
    result.residual = std::sqrt(ea * ea + eb * eb);
    return result;
}

}  // namespace spinlogo
