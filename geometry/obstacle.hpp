#ifndef SPINLOGO_GEOMETRY_OBSTACLE_HPP
#define SPINLOGO_GEOMETRY_OBSTACLE_HPP

#include "curve.hpp"
#include <string>

namespace spinlogo {

enum class ObstacleKind {
    Segment,     // Straight segment(s); exact point distance
    SampledArc   // Discrete arc samples; distance is the minimum over samples
};

std::string to_string(ObstacleKind kind);

// Geometry a fillet circle has to touch
class Obstacle {
public:
    // Straight segment from a to b
    static Obstacle segment(const Vec2& a, const Vec2& b);

    // Polyline treated as a chain of exact segments
    static Obstacle polyline(Curve points);

    // Already sampled arc
    static Obstacle sampled_arc(Curve samples);

    // Arc of a circle sampled from start_angle to end_angle (radians)
    static Obstacle sampled_arc(const Vec2& center, double radius,
                                double start_angle, double end_angle, int samples);

    ObstacleKind kind() const { return kind_; }
    const Curve& points() const { return points_; }

    // Distance from p to the obstacle. For sampled arcs the error against the
    // true arc is bounded by sampling_error_bound().
    double distance_to(const Vec2& p) const;

    // Closest point on the obstacle to p (always one of the samples for arcs)
    Vec2 closest_point(const Vec2& p) const;

    // Arc length / sample count for sampled arcs, zero for segments
    double sampling_error_bound() const;

    bool operator==(const Obstacle& other) const {
        return kind_ == other.kind_ && points_ == other.points_;
    }

private:
    Obstacle(ObstacleKind kind, Curve points);

    ObstacleKind kind_;
    Curve points_;
};

// Closest point to p on the segment [a, b]
Vec2 closest_point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b);

}  // namespace spinlogo

#endif // SPINLOGO_GEOMETRY_OBSTACLE_HPP
