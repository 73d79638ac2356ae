#include "airfoil.hpp"
#include "transform.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <complex>
#include <sstream>

namespace spinlogo {

namespace {

// Relative distance of the generating circle from the origin below which the
// map blows up
constexpr double kOriginTolerance = 1e-9;

void check_range(ValidationResult& result, const char* name,
                 double value, double lo, double hi) {
    if (!std::isfinite(value) || value < lo || value > hi) {
        std::ostringstream ss;
        ss << name << " = " << value << " outside [" << lo << ", " << hi << "]";
        result.add_error(ss.str());
    }
}

}  // namespace

ValidationResult AirfoilParams::validate() const {
    ValidationResult result;
    check_range(result, "radius", radius, 0.50, 1.20);
    check_range(result, "x_center", x_center, -0.50, 0.50);
    check_range(result, "y_center", y_center, 0.00, 0.50);
    check_range(result, "scale", scale, 0.10, 3.00);

    if (result.valid &&
        std::abs(std::hypot(x_center, y_center) - radius) <= kOriginTolerance * radius) {
        result.add_error("generating circle passes through the origin");
    }
    return result;
}

Curve generate_airfoil(const AirfoilParams& params, int samples) {
    auto log = logging::get_logger();

    if (samples < 2) {
        throw DomainError("airfoil needs at least two samples");
    }
    if (!(params.radius > 0.0)) {
        throw DomainError("airfoil radius must be positive");
    }

    double offset = std::hypot(params.x_center, params.y_center);
    if (std::abs(offset - params.radius) <= kOriginTolerance * params.radius) {
        std::ostringstream ss;
        ss << "Joukowsky map undefined: circle of radius " << params.radius
           << " centered at (" << params.x_center << ", " << params.y_center
           << ") passes through the origin";
        throw DomainError(ss.str());
    }

    using complex = std::complex<double>;
    const complex a2(params.radius * params.radius, 0.0);

    Curve points;
    points.reserve(static_cast<size_t>(samples));
    for (double theta : linspace(0.0, 2.0 * kPi, samples)) {
        complex w(params.x_center + params.radius * std::cos(theta),
                  params.y_center + params.radius * std::sin(theta));
        if (std::abs(w) <= kOriginTolerance) {
            throw DomainError("Joukowsky map undefined at theta = " + std::to_string(theta));
        }
        complex z = w + a2 / w;
        Vec2 p(params.scale * z.real(), params.scale * z.imag());
        if (!p.is_finite()) {
            throw DomainError("Joukowsky map produced a non-finite point at theta = " +
                              std::to_string(theta));
        }
        points.push_back(p);
    }

    log->trace("Generated airfoil: R={}, center=({}, {}), scale={}, {} points",
               params.radius, params.x_center, params.y_center, params.scale,
               points.size());
    return points;
}

}  // namespace spinlogo
