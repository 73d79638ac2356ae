#include "minimize.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace spinlogo {

namespace {

// Reflection, expansion, contraction and shrink coefficients
constexpr double kRho = 1.0;
constexpr double kChi = 2.0;
constexpr double kPsi = 0.5;
constexpr double kSigma = 0.5;

// Relative perturbation of each coordinate for the initial simplex
constexpr double kNonzeroDelta = 0.05;
constexpr double kZeroDelta = 0.00025;

struct Vertex {
    Vec2 x;
    double f;
};

}  // namespace

MinimizeResult2D nelder_mead(const Objective2D& f, const Vec2& x0,
                             const MinimizeConfig& config) {
    std::array<Vertex, 3> simplex;
    simplex[0] = {x0, f(x0)};
    for (size_t k = 0; k < 2; ++k) {
        Vec2 y = x0;
        double& coord = (k == 0) ? y.x : y.y;
        coord = (coord != 0.0) ? coord * (1.0 + kNonzeroDelta) : kZeroDelta;
        simplex[k + 1] = {y, f(y)};
    }

    auto by_value = [](const Vertex& a, const Vertex& b) { return a.f < b.f; };

    MinimizeResult2D result;
    int iter = 0;
    for (; iter < config.max_iterations; ++iter) {
        std::sort(simplex.begin(), simplex.end(), by_value);

        double x_spread = 0.0;
        double f_spread = 0.0;
        for (size_t i = 1; i < simplex.size(); ++i) {
            x_spread = std::max({x_spread,
                                 std::abs(simplex[i].x.x - simplex[0].x.x),
                                 std::abs(simplex[i].x.y - simplex[0].x.y)});
            f_spread = std::max(f_spread, std::abs(simplex[i].f - simplex[0].f));
        }
        if (x_spread <= config.x_tolerance && f_spread <= config.f_tolerance) {
            result.converged = true;
            break;
        }

        // Centroid of all but the worst vertex
        Vec2 centroid = (simplex[0].x + simplex[1].x) * 0.5;
        Vertex& worst = simplex[2];

        Vec2 xr = centroid + (centroid - worst.x) * kRho;
        double fr = f(xr);

        if (fr < simplex[0].f) {
            Vec2 xe = centroid + (centroid - worst.x) * (kRho * kChi);
            double fe = f(xe);
            worst = (fe < fr) ? Vertex{xe, fe} : Vertex{xr, fr};
            continue;
        }
        if (fr < simplex[1].f) {
            worst = {xr, fr};
            continue;
        }

        bool shrink = false;
        if (fr < worst.f) {
            // Outside contraction
            Vec2 xc = centroid + (xr - centroid) * kPsi;
            double fc = f(xc);
            if (fc <= fr) {
                worst = {xc, fc};
            } else {
                shrink = true;
            }
        } else {
            // Inside contraction
            Vec2 xcc = centroid + (worst.x - centroid) * kPsi;
            double fcc = f(xcc);
            if (fcc < worst.f) {
                worst = {xcc, fcc};
            } else {
                shrink = true;
            }
        }

        if (shrink) {
            for (size_t i = 1; i < simplex.size(); ++i) {
                simplex[i].x = simplex[0].x + (simplex[i].x - simplex[0].x) * kSigma;
                simplex[i].f = f(simplex[i].x);
            }
        }
    }

    std::sort(simplex.begin(), simplex.end(), by_value);
    result.x = simplex[0].x;
    result.value = simplex[0].f;
    result.iterations = iter;
    return result;
}

MinimizeResult1D minimize_bounded(const Objective1D& f, double lo, double hi,
                                  const MinimizeConfig& config) {
    if (!(lo < hi)) {
        throw std::invalid_argument("minimize_bounded needs lo < hi");
    }

    const double g = (std::sqrt(5.0) - 1.0) / 2.0;
    double a = lo;
    double b = hi;
    double c = b - g * (b - a);
    double d = a + g * (b - a);
    double fc = f(c);
    double fd = f(d);

    MinimizeResult1D result;
    int iter = 0;
    for (; iter < config.max_iterations; ++iter) {
        if (b - a <= config.x_tolerance) {
            result.converged = true;
            break;
        }
        if (fc < fd) {
            b = d;
            d = c;
            fd = fc;
            c = b - g * (b - a);
            fc = f(c);
        } else {
            a = c;
            c = d;
            fc = fd;
            d = a + g * (b - a);
            fd = f(d);
        }
    }

    result.x = 0.5 * (a + b);
    result.value = f(result.x);
    result.iterations = iter;
    return result;
}

}  // namespace spinlogo
