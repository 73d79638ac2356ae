#include "curve.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace spinlogo {

std::vector<double> linspace(double start, double end, int count) {
    if (count < 1) {
        throw std::invalid_argument("linspace needs at least one sample");
    }
    std::vector<double> values;
    values.reserve(static_cast<size_t>(count));
    if (count == 1) {
        values.push_back(start);
        return values;
    }

    double step = (end - start) / static_cast<double>(count - 1);
    for (int i = 0; i < count - 1; ++i) {
        values.push_back(start + step * static_cast<double>(i));
    }
    // Last value is exact
    values.push_back(end);
    return values;
}

Curve sample_arc(const Vec2& center, double radius,
                 double start_angle, double end_angle, int samples) {
    Curve points;
    points.reserve(static_cast<size_t>(samples));
    for (double t : linspace(start_angle, end_angle, samples)) {
        points.push_back(center + vec2::from_angle(t) * radius);
    }
    return points;
}

size_t closest_index(const Curve& curve, const Vec2& point) {
    if (curve.empty()) {
        throw std::invalid_argument("closest_index on an empty curve");
    }
    size_t best = 0;
    double best_dist = std::numeric_limits<double>::max();
    for (size_t i = 0; i < curve.size(); ++i) {
        double d = (curve[i] - point).length_squared();
        if (d < best_dist) {
            best_dist = d;
            best = i;
        }
    }
    return best;
}

double polyline_length(const Curve& curve) {
    double total = 0.0;
    for (size_t i = 1; i < curve.size(); ++i) {
        total += curve[i].distance_to(curve[i - 1]);
    }
    return total;
}

std::pair<Vec2, Vec2> bounding_box(const Curve& curve) {
    if (curve.empty()) {
        return {vec2::zero(), vec2::zero()};
    }

    Vec2 min_pt = curve[0];
    Vec2 max_pt = curve[0];
    for (const auto& p : curve) {
        min_pt.x = std::min(min_pt.x, p.x);
        min_pt.y = std::min(min_pt.y, p.y);
        max_pt.x = std::max(max_pt.x, p.x);
        max_pt.y = std::max(max_pt.y, p.y);
    }
    return {min_pt, max_pt};
}

bool all_finite(const Curve& curve) {
    return std::all_of(curve.begin(), curve.end(),
                       [](const Vec2& p) { return p.is_finite(); });
}

}  // namespace spinlogo
