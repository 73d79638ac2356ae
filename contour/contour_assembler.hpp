#ifndef SPINLOGO_CONTOUR_CONTOUR_ASSEMBLER_HPP
#define SPINLOGO_CONTOUR_CONTOUR_ASSEMBLER_HPP

#include <geometry/curve.hpp>

namespace spinlogo {

// Stitches arcs, segments and fillet arcs into one open polyline.
//
// Usage:
//   Curve sector = ContourAssembler()
//       .append(ContourAssembler::truncate_before(outer_arc, fillet.center))
//       .append(fillet.arc)
//       .build();
class ContourAssembler {
public:
    // Keep samples [0, k] where k is the sample closest to fillet_center
    static Curve truncate_before(const Curve& piece, const Vec2& fillet_center);

    // Keep samples [k, end] where k is the sample closest to fillet_center
    static Curve truncate_after(const Curve& piece, const Vec2& fillet_center);

    // Keep samples between the ones closest to the two fillet centers
    // (both included). Empty if the first comes after the second.
    static Curve slice_between(const Curve& piece,
                               const Vec2& first_center,
                               const Vec2& second_center);

    // Append a piece. Every piece after the first loses its first point,
    // which coincides with the last point already in the contour.
    ContourAssembler& append(const Curve& piece);

    size_t piece_count() const { return pieces_; }
    const Curve& points() const { return points_; }

    // Copy of the assembled contour
    Curve build() const { return points_; }

private:
    Curve points_;
    size_t pieces_ = 0;
};

}  // namespace spinlogo

#endif // SPINLOGO_CONTOUR_CONTOUR_ASSEMBLER_HPP
