#include "obstacle.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace spinlogo {

std::string to_string(ObstacleKind kind) {
    switch (kind) {
        case ObstacleKind::Segment: return "segment";
        case ObstacleKind::SampledArc: return "sampled_arc";
    }
    return "unknown";
}

Obstacle::Obstacle(ObstacleKind kind, Curve points)
    : kind_(kind), points_(std::move(points)) {
    if (points_.empty()) {
        throw std::invalid_argument("Obstacle needs at least one point");
    }
    if (kind_ == ObstacleKind::Segment && points_.size() < 2) {
        throw std::invalid_argument("Segment obstacle needs two points");
    }
}

Obstacle Obstacle::segment(const Vec2& a, const Vec2& b) {
    return Obstacle(ObstacleKind::Segment, Curve{a, b});
}

Obstacle Obstacle::polyline(Curve points) {
    return Obstacle(ObstacleKind::Segment, std::move(points));
}

Obstacle Obstacle::sampled_arc(Curve samples) {
    return Obstacle(ObstacleKind::SampledArc, std::move(samples));
}

Obstacle Obstacle::sampled_arc(const Vec2& center, double radius,
                               double start_angle, double end_angle, int samples) {
    return Obstacle(ObstacleKind::SampledArc,
                    sample_arc(center, radius, start_angle, end_angle, samples));
}

Vec2 closest_point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    Vec2 ab = b - a;
    double len2 = ab.length_squared();
    if (len2 == 0.0) {
        return a;
    }
    double t = std::clamp((p - a).dot(ab) / len2, 0.0, 1.0);
    return a + ab * t;
}

Vec2 Obstacle::closest_point(const Vec2& p) const {
    if (kind_ == ObstacleKind::SampledArc) {
        return points_[closest_index(points_, p)];
    }

    Vec2 best = points_[0];
    double best_dist = std::numeric_limits<double>::max();
    for (size_t i = 0; i + 1 < points_.size(); ++i) {
        Vec2 q = closest_point_on_segment(p, points_[i], points_[i + 1]);
        double d = (q - p).length_squared();
        if (d < best_dist) {
            best_dist = d;
            best = q;
        }
    }
    return best;
}

double Obstacle::distance_to(const Vec2& p) const {
    return closest_point(p).distance_to(p);
}

double Obstacle::sampling_error_bound() const {
    if (kind_ == ObstacleKind::Segment) {
        return 0.0;
    }
    return polyline_length(points_) / static_cast<double>(points_.size());
}

}  // namespace spinlogo
