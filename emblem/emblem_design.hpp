#ifndef SPINLOGO_EMBLEM_EMBLEM_DESIGN_HPP
#define SPINLOGO_EMBLEM_EMBLEM_DESIGN_HPP

#include <fillet/tangent_circle_solver.hpp>
#include <math/vec2.hpp>
#include <vector>

namespace spinlogo {

// Design constants of the revolution emblem.
//
// One sector runs along the outer arc from the top (90 degrees) to the notch
// line x = notch_x, down the notch to the inner arc, back along the inner arc
// to the stem line x = stem_x and down the stem towards the origin.
struct EmblemDesign {
    double inner_radius = 1.0;      // r1
    double outer_radius = 1.2;      // r2
    double corner_radius = 0.05;    // Fillets on the three sector corners
    double joint_radius = 0.3;      // Fillet where the mirrored stems meet

    double notch_x = -0.7;
    double stem_x = -0.1;

    // Samples on each raw arc; also the resolution of the arc obstacles
    int arc_samples = 100;
    int fillet_samples = 100;

    // Seeds of the two simplex fits
    Vec2 notch_outer_seed{-0.65, 1.0};    // outer arc / notch
    Vec2 notch_inner_seed{-0.65, 0.8};    // notch / inner arc

    // Stem fillet: x found on the probe line y = stem_probe_y, then y
    double stem_probe_y = 0.3;
    double stem_x_lo = -0.3;
    double stem_x_hi = -0.1;
    double stem_y_lo = 0.3;
    double stem_y_hi = 1.0;

    // Penalty weights keeping the notch fillets inside the outer band
    // and outside the inner disk
    double outer_penalty_weight = 10.0;
    double inner_penalty_weight = 1000.0;

    double mirror_axis_deg = 150.0;
    std::vector<double> symmetry_angles{0.0, 120.0, 240.0};

    FitConfig solver;
};

}  // namespace spinlogo

#endif // SPINLOGO_EMBLEM_EMBLEM_DESIGN_HPP
