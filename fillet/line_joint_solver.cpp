#include "line_joint_solver.hpp"
#include <geometry/transform.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace spinlogo {

double LineJointSolver::half_angle(const Vec2& a, const Vec2& b, const Vec2& c) {
    Vec2 u = (a - b).normalized();
    Vec2 v = (c - b).normalized();
    return std::acos(std::clamp(u.dot(v), -1.0, 1.0)) / 2.0;
}

double LineJointSolver::tangent_length(double radius, double half_angle) {
    return radius / std::tan(half_angle);
}

FilletResult LineJointSolver::solve(const Vec2& a, const Vec2& b, const Vec2& c,
                                    double radius, Orientation orientation,
                                    int samples) {
    auto log = logging::get_logger();

    if (!(radius > 0.0)) {
        throw DomainError("joint radius must be positive");
    }
    if (a.distance_to(b) == 0.0 || c.distance_to(b) == 0.0) {
        throw DomainError("joint legs must have non-zero length");
    }

    Vec2 u = (a - b).normalized();
    Vec2 v = (c - b).normalized();
    double theta = std::acos(std::clamp(u.dot(v), -1.0, 1.0)) / 2.0;

    if (theta < kMinHalfAngle) {
        std::ostringstream ss;
        ss << "joint at (" << b.x << ", " << b.y << ") has half-angle " << theta
           << "; the legs are parallel and the fillet radius diverges";
        throw DomainError(ss.str());
    }

    Vec2 bisector = u + v;
    if (bisector.length() < kMinHalfAngle) {
        std::ostringstream ss;
        ss << "joint at (" << b.x << ", " << b.y << ") is straight; nothing to round";
        throw DomainError(ss.str());
    }
    bisector = bisector.normalized();

    FilletResult result;
    result.radius = radius;
    result.center = b + bisector * (radius / std::sin(theta));

    // Perpendicular feet on the two leg lines
    result.contact_a = b + u * (result.center - b).dot(u);
    result.contact_b = b + v * (result.center - b).dot(v);
    result.arc = sweep_arc(result.center, radius, result.contact_a, result.contact_b,
                           orientation, samples);

    double ea = result.center.distance_to(result.contact_a) - radius;
    double eb = result.center.distance_to(result.contact_b) - radius;
    result.residual = std::sqrt(ea * ea + eb * eb);

    double reach = tangent_length(radius, theta);
    if (reach > a.distance_to(b) || reach > c.distance_to(b)) {
        log->warn("LineJointSolver: tangent length {} overruns a leg at ({}, {})",
                  reach, b.x, b.y);
    }

    // The short arc covers pi - 2*theta
    double expected = kPi - 2.0 * theta;
    if (std::abs(std::abs(result.sweep()) - expected) > 1e-6) {
        log->warn("LineJointSolver: {} sweep covers {} rad instead of {}; check orientation",
                  to_string(orientation), std::abs(result.sweep()), expected);
    }
    return result;
}

}  // namespace spinlogo
