#ifndef SPINLOGO_EMBLEM_SYMMETRY_REPLICATOR_HPP
#define SPINLOGO_EMBLEM_SYMMETRY_REPLICATOR_HPP

#include <geometry/curve.hpp>
#include <vector>

namespace spinlogo {

// Rotate every base contour by every angle about the origin. Output is
// angle-major, contour-minor so draw order is reproducible. A zero angle
// copies the contour unchanged.
std::vector<Curve> replicate(const std::vector<Curve>& base_contours,
                             const std::vector<double>& angles_deg);

// {0, 360/n, 2*360/n, ...}; n = 1 gives {0}
std::vector<double> revolution_angles(int n);

}  // namespace spinlogo

#endif // SPINLOGO_EMBLEM_SYMMETRY_REPLICATOR_HPP
