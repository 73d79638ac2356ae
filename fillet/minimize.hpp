#ifndef SPINLOGO_FILLET_MINIMIZE_HPP
#define SPINLOGO_FILLET_MINIMIZE_HPP

#include <math/vec2.hpp>
#include <functional>

namespace spinlogo {

using Objective2D = std::function<double(const Vec2&)>;
using Objective1D = std::function<double(double)>;

// Stopping rules shared by the local minimizers
struct MinimizeConfig {
    // Simplex size / bracket width below which the search stops
    double x_tolerance = 1e-10;

    // Spread of objective values across the simplex below which it stops
    double f_tolerance = 1e-14;

    int max_iterations = 2000;
};

struct MinimizeResult2D {
    Vec2 x;
    double value = 0.0;
    int iterations = 0;
    bool converged = false;     // Tolerances met before max_iterations
};

struct MinimizeResult1D {
    double x = 0.0;
    double value = 0.0;
    int iterations = 0;
    bool converged = false;
};

// Derivative-free Nelder-Mead simplex search seeded at x0.
// Returns the best vertex found whether or not it converged.
MinimizeResult2D nelder_mead(const Objective2D& f, const Vec2& x0,
                             const MinimizeConfig& config = MinimizeConfig{});

// Golden-section search over [lo, hi]. Assumes f is unimodal on the interval;
// otherwise returns a local minimum.
MinimizeResult1D minimize_bounded(const Objective1D& f, double lo, double hi,
                                  const MinimizeConfig& config = MinimizeConfig{});

}  // namespace spinlogo

#endif // SPINLOGO_FILLET_MINIMIZE_HPP
