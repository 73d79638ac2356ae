#ifndef SPINLOGO_SESSION_LOGO_SESSION_HPP
#define SPINLOGO_SESSION_LOGO_SESSION_HPP

#include <emblem/emblem_geometry.hpp>
#include <geometry/airfoil.hpp>
#include <serialization/svg_document.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spinlogo {

// Live overlay controls
struct OverlayParams {
    double y_offset = 0.0;      // Added to every airfoil y before rotation
    int revolutions = 1;        // Rotated copies about the origin, 1..12

    ValidationResult validate() const;

    bool operator==(const OverlayParams& other) const = default;
};

// Stroke styling per layer tier
struct LayerStyle {
    std::string stroke;
    double stroke_width = 0.01;
    std::optional<double> opacity;
};

struct ExportStyle {
    LayerStyle emblem{"blue", 0.01, 0.6};
    LayerStyle overlay{"red", 0.015, 0.8};
    std::string label_format = "SpinPAK Logo - {}× Revolution";
};

// Owns the shared emblem and the live airfoil parameters. The emblem is never
// recomputed; the overlay is rebuilt in full on every parameter change.
class LogoSession {
public:
    explicit LogoSession(std::shared_ptr<const EmblemGeometry> emblem,
                         const AirfoilParams& airfoil = AirfoilParams{},
                         const OverlayParams& overlay = OverlayParams{});

    const std::shared_ptr<const EmblemGeometry>& emblem() const { return emblem_; }
    const AirfoilParams& airfoil_params() const { return airfoil_params_; }
    const OverlayParams& overlay_params() const { return overlay_params_; }

    // Setters recompute the airfoil and overlay. On DomainError the previous
    // parameters and curves stay in place.
    void set_airfoil(const AirfoilParams& params);
    void set_overlay(const OverlayParams& params);

    // Airfoil alone: no offset, no rotation
    const Curve& airfoil() const { return airfoil_; }

    // Airfoil shifted by y_offset and replicated over revolution_angles(n)
    const std::vector<Curve>& overlay_paths() const { return overlay_paths_; }

    const std::vector<Curve>& emblem_paths() const { return emblem_->paths(); }

    // Emblem layers first, then overlay layers, in draw order
    std::vector<PathLayer> layers(const ExportStyle& style = ExportStyle{}) const;

    std::string label(const ExportStyle& style = ExportStyle{}) const;

    SvgDocument to_document(const ExportOptions& options = ExportOptions{},
                            const ExportStyle& style = ExportStyle{}) const;

private:
    static std::vector<Curve> build_overlay(const Curve& airfoil, const OverlayParams& params);

    std::shared_ptr<const EmblemGeometry> emblem_;
    AirfoilParams airfoil_params_;
    OverlayParams overlay_params_;
    Curve airfoil_;
    std::vector<Curve> overlay_paths_;
};

}  // namespace spinlogo

#endif // SPINLOGO_SESSION_LOGO_SESSION_HPP
