#ifndef SPINLOGO_FILLET_LINE_JOINT_SOLVER_HPP
#define SPINLOGO_FILLET_LINE_JOINT_SOLVER_HPP

#include "fillet.hpp"

namespace spinlogo {

// Closed-form fillet between segments B->A and B->C that share vertex B
class LineJointSolver {
public:
    // Half-angle below which the fillet center runs off to infinity (radians)
    static constexpr double kMinHalfAngle = 1e-6;

    // Center sits on the angle bisector at radius / sin(half_angle) from B;
    // contacts are the perpendicular feet on each leg. The arc runs from the
    // contact on BA to the contact on BC through the side facing B.
    // Throws DomainError if the legs fold onto each other (half-angle ~ 0),
    // are collinear, or have zero length.
    static FilletResult solve(const Vec2& a, const Vec2& b, const Vec2& c,
                              double radius, Orientation orientation,
                              int samples = 100);

    // Half of the angle ABC (radians)
    static double half_angle(const Vec2& a, const Vec2& b, const Vec2& c);

    // Distance from B to each contact point
    static double tangent_length(double radius, double half_angle);
};

}  // namespace spinlogo

#endif // SPINLOGO_FILLET_LINE_JOINT_SOLVER_HPP
