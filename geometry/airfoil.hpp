#ifndef SPINLOGO_GEOMETRY_AIRFOIL_HPP
#define SPINLOGO_GEOMETRY_AIRFOIL_HPP

#include "curve.hpp"
#include <common/errors.hpp>

namespace spinlogo {

// Parameters of the Joukowsky generating circle
struct AirfoilParams {
    double radius = 0.85;       // R, also the map constant a
    double x_center = -0.1;
    double y_center = 0.23;
    double scale = 1.0;         // Output scale factor

    // Range check against the slider limits of the interactive tool
    ValidationResult validate() const;

    bool operator==(const AirfoilParams& other) const = default;
};

constexpr int kAirfoilSamples = 400;

// Map the circle through z = w + R^2 / w and scale the result.
// theta covers [0, 2pi] inclusive, so the curve is closed up to rounding.
// Throws DomainError if the circle passes through the origin.
Curve generate_airfoil(const AirfoilParams& params, int samples = kAirfoilSamples);

}  // namespace spinlogo

#endif // SPINLOGO_GEOMETRY_AIRFOIL_HPP
