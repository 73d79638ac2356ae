#ifndef SPINLOGO_EMBLEM_EMBLEM_GEOMETRY_HPP
#define SPINLOGO_EMBLEM_EMBLEM_GEOMETRY_HPP

#include "emblem_design.hpp"
#include <fillet/fillet.hpp>
#include <geometry/obstacle.hpp>
#include <memory>
#include <string>
#include <vector>

namespace spinlogo {

// The static revolution emblem. Built once from an EmblemDesign and shared
// read-only afterwards; nothing mutates it after build() returns.
class EmblemGeometry {
public:
    // Fits the corner fillets, assembles one sector, mirrors it, joins the
    // mirrored stems and replicates the wedge over the symmetry angles.
    // Throws DomainError for designs whose lines miss the arcs, whose inner
    // corner lands past the stem corner, or whose stems cannot be joined.
    static std::shared_ptr<const EmblemGeometry> build(const EmblemDesign& design = EmblemDesign{});

    const EmblemDesign& design() const { return design_; }

    // Raw pieces, before truncation
    const Obstacle& outer_arc() const { return outer_arc_; }
    const Obstacle& notch() const { return notch_; }
    const Obstacle& inner_arc() const { return inner_arc_; }
    const Obstacle& stem() const { return stem_; }

    // Fillets in contour order
    const FilletResult& outer_corner() const { return outer_corner_; }   // outer arc -> notch
    const FilletResult& inner_corner() const { return inner_corner_; }   // notch -> inner arc
    const FilletResult& stem_corner() const { return stem_corner_; }     // inner arc -> stem
    const FilletResult& stem_joint() const { return stem_joint_; }       // stem -> mirrored stem

    // One open sector, its stem joint and the mirrored sector
    const Curve& sector() const { return sector_; }
    const Curve& joint() const { return joint_; }
    const Curve& mirrored_sector() const { return mirrored_sector_; }

    // {sector, joint, mirrored sector}: one wedge
    const std::vector<Curve>& base_paths() const { return base_paths_; }

    // Base paths replicated over the symmetry angles, angle-major
    const std::vector<Curve>& paths() const { return paths_; }

    // Fillet fits whose residual exceeded the solver tolerance
    const std::vector<std::string>& warnings() const { return warnings_; }
    bool converged() const { return warnings_.empty(); }

    size_t point_count() const;

private:
    EmblemGeometry(const EmblemDesign& design,
                   Obstacle outer_arc, Obstacle notch,
                   Obstacle inner_arc, Obstacle stem);

    EmblemDesign design_;

    Obstacle outer_arc_;
    Obstacle notch_;
    Obstacle inner_arc_;
    Obstacle stem_;

    FilletResult outer_corner_;
    FilletResult inner_corner_;
    FilletResult stem_corner_;
    FilletResult stem_joint_;

    Curve sector_;
    Curve joint_;
    Curve mirrored_sector_;
    std::vector<Curve> base_paths_;
    std::vector<Curve> paths_;

    std::vector<std::string> warnings_;
};

}  // namespace spinlogo

#endif // SPINLOGO_EMBLEM_EMBLEM_GEOMETRY_HPP
