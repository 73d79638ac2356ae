#include "tangent_circle_solver.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <stdexcept>
#include <tuple>

namespace spinlogo {

double DiskPenalty::evaluate(const Vec2& center) const {
    double d = center.distance_to(disk_center);
    if (side == Side::KeepInside && d > radius) {
        return weight * (d - radius) * (d - radius);
    }
    if (side == Side::KeepOutside && d < radius) {
        return weight * (radius - d) * (radius - d);
    }
    return 0.0;
}

double TangentCircleSolver::objective(const Vec2& center,
                                      const std::vector<Obstacle>& obstacles,
                                      double target_radius,
                                      const std::vector<DiskPenalty>& penalties) {
    double total = 0.0;
    for (const auto& obstacle : obstacles) {
        double e = obstacle.distance_to(center) - target_radius;
        total += e * e;
    }
    for (const auto& penalty : penalties) {
        total += penalty.evaluate(center);
    }
    return total;
}

double TangentCircleSolver::residual(const Vec2& center,
                                     const std::vector<Obstacle>& obstacles,
                                     double target_radius) {
    return std::sqrt(objective(center, obstacles, target_radius, {}));
}

FitResult TangentCircleSolver::fit(const Vec2& initial_guess,
                                   const std::vector<Obstacle>& obstacles,
                                   double target_radius,
                                   const std::vector<DiskPenalty>& penalties,
                                   const FitConfig& config) {
    auto log = logging::get_logger();

    if (obstacles.empty()) {
        throw std::invalid_argument("TangentCircleSolver::fit needs at least one obstacle");
    }

    auto f = [&](const Vec2& c) {
        return objective(c, obstacles, target_radius, penalties);
    };
    MinimizeResult2D min = nelder_mead(f, initial_guess, config.minimize);

    FitResult result;
    result.center = min.x;
    result.objective = min.value;
    result.iterations = min.iterations;
    result.residual = residual(min.x, obstacles, target_radius);
    result.converged = result.residual <= config.residual_tolerance;

    log->debug("TangentCircleSolver: center=({}, {}), residual={}, {} iterations{}",
               result.center.x, result.center.y, result.residual, result.iterations,
               min.converged ? "" : " (iteration limit)");
    if (!result.converged) {
        log->warn("TangentCircleSolver: residual {} exceeds tolerance {} from seed ({}, {}); "
                  "retry with a different seed",
                  result.residual, config.residual_tolerance,
                  initial_guess.x, initial_guess.y);
    }
    return result;
}

FitResult TangentCircleSolver::fit_along_axis(Axis free_axis,
                                              double fixed_coordinate,
                                              double lo, double hi,
                                              const Obstacle& obstacle,
                                              double target_radius,
                                              const FitConfig& config) {
    auto log = logging::get_logger();

    auto point_at = [&](double t) {
        return free_axis == Axis::X ? Vec2(t, fixed_coordinate) : Vec2(fixed_coordinate, t);
    };
    auto f = [&](double t) {
        return std::abs(obstacle.distance_to(point_at(t)) - target_radius);
    };
    MinimizeResult1D min = minimize_bounded(f, lo, hi, config.minimize);

    FitResult result;
    result.center = point_at(min.x);
    result.objective = min.value;
    result.iterations = min.iterations;
    result.residual = min.value;
    result.converged = result.residual <= config.residual_tolerance;

    log->debug("TangentCircleSolver: axis fit {} = {} in [{}, {}], residual={}",
               free_axis == Axis::X ? "x" : "y", min.x, lo, hi, result.residual);
    if (!result.converged) {
        log->warn("TangentCircleSolver: axis fit residual {} exceeds tolerance {} on [{}, {}]",
                  result.residual, config.residual_tolerance, lo, hi);
    }
    return result;
}

bool FitCache::Key::operator<(const Key& other) const {
    return std::tie(kinds, coordinates, target_radius, guess_x, guess_y, penalty_values) <
           std::tie(other.kinds, other.coordinates, other.target_radius,
                    other.guess_x, other.guess_y, other.penalty_values);
}

FitCache::Key FitCache::make_key(const Vec2& initial_guess,
                                 const std::vector<Obstacle>& obstacles,
                                 double target_radius,
                                 const std::vector<DiskPenalty>& penalties,
                                 const FitConfig& config) {
    Key key;
    key.target_radius = target_radius;
    key.guess_x = initial_guess.x;
    key.guess_y = initial_guess.y;
    for (const auto& obstacle : obstacles) {
        key.kinds.push_back(static_cast<int>(obstacle.kind()));
        key.kinds.push_back(static_cast<int>(obstacle.points().size()));
        for (const auto& p : obstacle.points()) {
            key.coordinates.push_back(p.x);
            key.coordinates.push_back(p.y);
        }
    }
    for (const auto& penalty : penalties) {
        key.penalty_values.push_back(static_cast<double>(penalty.side));
        key.penalty_values.push_back(penalty.disk_center.x);
        key.penalty_values.push_back(penalty.disk_center.y);
        key.penalty_values.push_back(penalty.radius);
        key.penalty_values.push_back(penalty.weight);
    }
    // Different stopping rules give different iterates
    key.penalty_values.push_back(config.minimize.x_tolerance);
    key.penalty_values.push_back(config.minimize.f_tolerance);
    key.penalty_values.push_back(static_cast<double>(config.minimize.max_iterations));
    key.penalty_values.push_back(config.residual_tolerance);
    return key;
}

FitResult FitCache::fit(const Vec2& initial_guess,
                        const std::vector<Obstacle>& obstacles,
                        double target_radius,
                        const std::vector<DiskPenalty>& penalties,
                        const FitConfig& config) {
    Key key = make_key(initial_guess, obstacles, target_radius, penalties, config);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    FitResult result = TangentCircleSolver::fit(initial_guess, obstacles, target_radius,
                                                penalties, config);
    entries_.emplace(std::move(key), result);
    return result;
}

void FitCache::clear() {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
}

}  // namespace spinlogo
