#include "symmetry_replicator.hpp"
#include <geometry/transform.hpp>
#include <stdexcept>

namespace spinlogo {

std::vector<Curve> replicate(const std::vector<Curve>& base_contours,
                             const std::vector<double>& angles_deg) {
    std::vector<Curve> out;
    out.reserve(base_contours.size() * angles_deg.size());
    for (double angle : angles_deg) {
        for (const auto& contour : base_contours) {
            if (angle == 0.0) {
                out.push_back(contour);
            } else {
                out.push_back(rotate(contour, angle));
            }
        }
    }
    return out;
}

std::vector<double> revolution_angles(int n) {
    if (n < 1) {
        throw std::invalid_argument("revolution count must be at least 1");
    }
    std::vector<double> angles;
    angles.reserve(static_cast<size_t>(n));
    double step = 360.0 / static_cast<double>(n);
    for (int i = 0; i < n; ++i) {
        angles.push_back(static_cast<double>(i) * step);
    }
    return angles;
}

}  // namespace spinlogo
