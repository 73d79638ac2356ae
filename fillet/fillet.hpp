#ifndef SPINLOGO_FILLET_FILLET_HPP
#define SPINLOGO_FILLET_FILLET_HPP

#include <geometry/curve.hpp>
#include <geometry/obstacle.hpp>
#include <string>

namespace spinlogo {

// Sweep direction of a fillet arc. Fixed per call site, never inferred.
enum class Orientation {
    Clockwise,
    CounterClockwise
};

std::string to_string(Orientation orientation);

// A rounded corner tangent to two neighbouring pieces
struct FilletResult {
    Vec2 center;
    double radius = 0.0;
    Vec2 contact_a;     // Arc start, on the first obstacle
    Vec2 contact_b;     // Arc end, on the second obstacle
    Curve arc;          // From contact_a to contact_b around center
    double residual = 0.0;  // sqrt of summed squared tangency errors

    // Signed angle covered by the arc (radians, positive = counter-clockwise)
    double sweep() const;
};

// End angle shifted by whole turns so that sweeping from start in the given
// direction reaches it (result in (start - 2pi, start + 2pi))
double unwrap_end_angle(double start_angle, double end_angle, Orientation orientation);

// Arc of the given radius around center from the polar angle of `from` to the
// polar angle of `to`, travelling in `orientation`. The first and last samples
// are `from` and `to` themselves.
Curve sweep_arc(const Vec2& center, double radius,
                const Vec2& from, const Vec2& to,
                Orientation orientation, int samples);

// Complete a fitted center into a fillet: contacts are the closest points on
// each obstacle, the arc runs from contact on `a` to contact on `b`.
FilletResult make_fillet(const Vec2& center,
                         const Obstacle& a, const Obstacle& b,
                         double radius, Orientation orientation, int samples);

}  // namespace spinlogo

#endif // SPINLOGO_FILLET_FILLET_HPP
