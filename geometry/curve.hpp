#ifndef SPINLOGO_GEOMETRY_CURVE_HPP
#define SPINLOGO_GEOMETRY_CURVE_HPP

#include <math/vec2.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace spinlogo {

// Ordered point sequence. Open or closed; the only ordering is traversal order.
using Curve = std::vector<Vec2>;

// `count` evenly spaced values over [start, end], both ends included
std::vector<double> linspace(double start, double end, int count);

// Sample a circular arc from start_angle to end_angle (radians, both included).
// The sweep direction follows the sign of (end_angle - start_angle).
Curve sample_arc(const Vec2& center, double radius,
                 double start_angle, double end_angle, int samples);

// Index of the sample closest to `point` (first one on ties)
size_t closest_index(const Curve& curve, const Vec2& point);

// Sum of the distances between consecutive points
double polyline_length(const Curve& curve);

// Axis aligned bounds as (min, max); {zero, zero} for an empty curve
std::pair<Vec2, Vec2> bounding_box(const Curve& curve);

// True if every coordinate is finite
bool all_finite(const Curve& curve);

}  // namespace spinlogo

#endif // SPINLOGO_GEOMETRY_CURVE_HPP
