#ifndef SPINLOGO_FILLET_TANGENT_CIRCLE_SOLVER_HPP
#define SPINLOGO_FILLET_TANGENT_CIRCLE_SOLVER_HPP

#include "minimize.hpp"
#include <geometry/obstacle.hpp>
#include <map>
#include <vector>

namespace spinlogo {

// Soft constraint keeping the fitted center on one side of a circle boundary.
// Adds weight * violation^2 only while the constraint is violated.
struct DiskPenalty {
    enum class Side {
        KeepInside,    // |center - disk_center| <= radius
        KeepOutside    // |center - disk_center| >= radius
    };

    Side side = Side::KeepInside;
    Vec2 disk_center;
    double radius = 0.0;
    double weight = 1.0;

    double evaluate(const Vec2& center) const;

    bool operator==(const DiskPenalty& other) const = default;
};

struct FitConfig {
    MinimizeConfig minimize;

    // Residual above which a fit is reported as not converged
    double residual_tolerance = 1e-3;
};

// Fitted center of a circle tangent to the obstacles
struct FitResult {
    Vec2 center;
    double residual = 0.0;      // sqrt(sum of squared (distance - radius))
    double objective = 0.0;     // Final objective value including penalties
    int iterations = 0;
    bool converged = false;     // residual <= residual_tolerance
};

enum class Axis { X, Y };

// Fits a circle of fixed radius tangent to several obstacles
class TangentCircleSolver {
public:
    // Minimize sum((distance(center, obstacle) - radius)^2) + penalties
    // with a simplex search from initial_guess. The best iterate is returned
    // even when the residual stays above tolerance.
    static FitResult fit(const Vec2& initial_guess,
                         const std::vector<Obstacle>& obstacles,
                         double target_radius,
                         const std::vector<DiskPenalty>& penalties = {},
                         const FitConfig& config = FitConfig{});

    // Bounded 1-D variant: one coordinate of the center is fixed, the free
    // axis varies over [lo, hi]. Minimizes |distance(center, obstacle) - radius|.
    static FitResult fit_along_axis(Axis free_axis,
                                    double fixed_coordinate,
                                    double lo, double hi,
                                    const Obstacle& obstacle,
                                    double target_radius,
                                    const FitConfig& config = FitConfig{});

    // Objective value at center
    static double objective(const Vec2& center,
                            const std::vector<Obstacle>& obstacles,
                            double target_radius,
                            const std::vector<DiskPenalty>& penalties);

    // sqrt of the summed squared tangency errors, penalties excluded
    static double residual(const Vec2& center,
                           const std::vector<Obstacle>& obstacles,
                           double target_radius);
};

// Memoizes TangentCircleSolver::fit. The solver is deterministic, so equal
// inputs give equal results.
class FitCache {
public:
    FitResult fit(const Vec2& initial_guess,
                  const std::vector<Obstacle>& obstacles,
                  double target_radius,
                  const std::vector<DiskPenalty>& penalties = {},
                  const FitConfig& config = FitConfig{});

    size_t size() const { return entries_.size(); }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }
    void clear();

private:
    struct Key {
        std::vector<int> kinds;
        std::vector<double> coordinates;
        double target_radius;
        double guess_x;
        double guess_y;
        std::vector<double> penalty_values;

        bool operator<(const Key& other) const;
    };

    static Key make_key(const Vec2& initial_guess,
                        const std::vector<Obstacle>& obstacles,
                        double target_radius,
                        const std::vector<DiskPenalty>& penalties,
                        const FitConfig& config);

    std::map<Key, FitResult> entries_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

}  // namespace spinlogo

#endif // SPINLOGO_FILLET_TANGENT_CIRCLE_SOLVER_HPP
