#include "emblem_geometry.hpp"
#include "symmetry_replicator.hpp"
#include <contour/contour_assembler.hpp>
#include <fillet/line_joint_solver.hpp>
#include <fillet/tangent_circle_solver.hpp>
#include <geometry/transform.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <sstream>
#include <utility>

namespace spinlogo {

namespace {

// y of the upper intersection of x = line_x with the circle of the given radius
double upper_intersection(double radius, double line_x, const char* what) {
    double h = radius * radius - line_x * line_x;
    if (!(h > 0.0)) {
        std::ostringstream ss;
        ss << what << " line x = " << line_x << " misses the arc of radius " << radius;
        throw DomainError(ss.str());
    }
    return std::sqrt(h);
}

void check_design(const EmblemDesign& d) {
    if (!(d.inner_radius > 0.0) || !(d.outer_radius > d.inner_radius)) {
        throw DomainError("emblem needs 0 < inner_radius < outer_radius");
    }
    if (!(d.corner_radius > 0.0) || !(d.joint_radius > 0.0)) {
        throw DomainError("emblem fillet radii must be positive");
    }
    if (d.arc_samples < 2 || d.fillet_samples < 2) {
        throw DomainError("emblem sample counts must be at least 2");
    }
    if (!(d.stem_x_lo < d.stem_x_hi) || !(d.stem_y_lo < d.stem_y_hi)) {
        throw DomainError("emblem stem search intervals are empty");
    }
}

}  // namespace

EmblemGeometry::EmblemGeometry(const EmblemDesign& design,
                               Obstacle outer_arc, Obstacle notch,
                               Obstacle inner_arc, Obstacle stem)
    : design_(design),
      outer_arc_(std::move(outer_arc)),
      notch_(std::move(notch)),
      inner_arc_(std::move(inner_arc)),
      stem_(std::move(stem)) {}

size_t EmblemGeometry::point_count() const {
    size_t total = 0;
    for (const auto& path : paths_) {
        total += path.size();
    }
    return total;
}

std::shared_ptr<const EmblemGeometry> EmblemGeometry::build(const EmblemDesign& d) {
    auto log = logging::get_logger();
    check_design(d);

    const double r1 = d.inner_radius;
    const double r2 = d.outer_radius;
    const double R = d.corner_radius;

    // Key points: notch meets inner/outer arc, stem meets inner arc and the x axis
    Vec2 notch_inner(d.notch_x, upper_intersection(r1, d.notch_x, "notch"));
    Vec2 notch_outer(d.notch_x, upper_intersection(r2, d.notch_x, "notch"));
    Vec2 stem_top(d.stem_x, upper_intersection(r1, d.stem_x, "stem"));
    Vec2 stem_foot(d.stem_x, 0.0);

    // Outer arc runs counter-clockwise from the top, inner arc clockwise
    // from the notch to the stem
    EmblemGeometry g(
        d,
        Obstacle::sampled_arc(vec2::zero(), r2, kPi / 2.0, std::acos(d.notch_x / r2),
                              d.arc_samples),
        Obstacle::segment(notch_outer, notch_inner),
        Obstacle::sampled_arc(vec2::zero(), r1, std::acos(d.notch_x / r1),
                              std::acos(d.stem_x / r1), d.arc_samples),
        Obstacle::segment(stem_top, stem_foot));

    auto note_fit = [&](const char* name, const FilletResult& fillet) {
        log->debug("EmblemGeometry: {} fillet center=({}, {}), residual={}",
                   name, fillet.center.x, fillet.center.y, fillet.residual);
        if (fillet.residual > d.solver.residual_tolerance) {
            std::ostringstream ss;
            ss << name << " fillet residual " << fillet.residual
               << " exceeds tolerance " << d.solver.residual_tolerance;
            g.warnings_.push_back(ss.str());
            log->warn("EmblemGeometry: {}", ss.str());
        }
    };

    // Corner 1: outer arc -> notch, center kept inside the outer band
    FitResult outer_fit = TangentCircleSolver::fit(
        d.notch_outer_seed, {g.notch_, g.outer_arc_}, R,
        {DiskPenalty{DiskPenalty::Side::KeepInside, vec2::zero(), r2 - R,
                     d.outer_penalty_weight}},
        d.solver);
    g.outer_corner_ = make_fillet(outer_fit.center, g.outer_arc_, g.notch_, R,
                                  Orientation::CounterClockwise, d.fillet_samples);
    note_fit("outer corner", g.outer_corner_);

    // Corner 2: notch -> inner arc, center kept off the inner disk
    FitResult inner_fit = TangentCircleSolver::fit(
        d.notch_inner_seed, {g.notch_, g.inner_arc_}, R,
        {DiskPenalty{DiskPenalty::Side::KeepOutside, vec2::zero(), r1 + R,
                     d.inner_penalty_weight}},
        d.solver);
    g.inner_corner_ = make_fillet(inner_fit.center, g.notch_, g.inner_arc_, R,
                                  Orientation::CounterClockwise, d.fillet_samples);
    note_fit("inner corner", g.inner_corner_);

    // Corner 3: inner arc -> stem. The stem fixes x, the arc then fixes y.
    FitResult stem_x_fit = TangentCircleSolver::fit_along_axis(
        Axis::X, d.stem_probe_y, d.stem_x_lo, d.stem_x_hi, g.stem_, R, d.solver);
    FitResult stem_y_fit = TangentCircleSolver::fit_along_axis(
        Axis::Y, stem_x_fit.center.x, d.stem_y_lo, d.stem_y_hi, g.inner_arc_, R, d.solver);
    g.stem_corner_ = make_fillet(stem_y_fit.center, g.inner_arc_, g.stem_, R,
                                 Orientation::Clockwise, d.fillet_samples);
    note_fit("stem corner", g.stem_corner_);

    // Sector: outer arc, notch, inner arc with their three fillets
    Curve inner_run = ContourAssembler::slice_between(g.inner_arc_.points(),
                                                      g.inner_corner_.center,
                                                      g.stem_corner_.center);
    if (inner_run.empty()) {
        throw DomainError("inner corner fillet lies past the stem corner fillet "
                          "along the inner arc");
    }
    g.sector_ = ContourAssembler()
        .append(ContourAssembler::truncate_before(g.outer_arc_.points(),
                                                  g.outer_corner_.center))
        .append(g.outer_corner_.arc)
        .append(Curve{g.outer_corner_.contact_b, g.inner_corner_.contact_a})
        .append(g.inner_corner_.arc)
        .append(inner_run)
        .append(g.stem_corner_.arc)
        .build();

    // Stem below the fillet and its mirror image meet near the origin
    Curve stem_piece{g.stem_corner_.contact_b, stem_foot};
    Curve mirrored_stem = reflect(stem_piece, d.mirror_axis_deg);
    g.mirrored_sector_ = reflect(g.sector_, d.mirror_axis_deg);

    g.stem_joint_ = LineJointSolver::solve(stem_piece.front(), stem_foot,
                                           mirrored_stem.front(), d.joint_radius,
                                           Orientation::Clockwise, d.fillet_samples);
    g.joint_ = ContourAssembler()
        .append(Curve{stem_piece.front(), g.stem_joint_.contact_a})
        .append(g.stem_joint_.arc)
        .append(Curve{g.stem_joint_.contact_b, mirrored_stem.front()})
        .build();

    g.base_paths_ = {g.sector_, g.joint_, g.mirrored_sector_};
    g.paths_ = replicate(g.base_paths_, d.symmetry_angles);

    log->info("EmblemGeometry: built {} paths ({} points), {} fit warnings",
              g.paths_.size(), g.point_count(), g.warnings_.size());
    return std::make_shared<const EmblemGeometry>(std::move(g));
}

}  // namespace spinlogo
