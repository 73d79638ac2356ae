#include "logo_session.hpp"
#include <emblem/symmetry_replicator.hpp>
#include <geometry/transform.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace spinlogo {

ValidationResult OverlayParams::validate() const {
    ValidationResult result;
    if (!std::isfinite(y_offset) || y_offset < -1.0 || y_offset > 1.0) {
        std::ostringstream ss;
        ss << "y_offset = " << y_offset << " outside [-1, 1]";
        result.add_error(ss.str());
    }
    if (revolutions < 1 || revolutions > 12) {
        result.add_error("revolutions = " + std::to_string(revolutions) + " outside [1, 12]");
    }
    return result;
}

LogoSession::LogoSession(std::shared_ptr<const EmblemGeometry> emblem,
                         const AirfoilParams& airfoil,
                         const OverlayParams& overlay)
    : emblem_(std::move(emblem)),
      airfoil_params_(airfoil),
      overlay_params_(overlay) {
    if (!emblem_) {
        throw std::invalid_argument("LogoSession needs an emblem");
    }
    airfoil_ = generate_airfoil(airfoil_params_);
    overlay_paths_ = build_overlay(airfoil_, overlay_params_);
}

std::vector<Curve> LogoSession::build_overlay(const Curve& airfoil, const OverlayParams& params) {
    Curve shifted = params.y_offset == 0.0
        ? airfoil
        : translate(airfoil, Vec2(0.0, params.y_offset));
    return replicate({shifted}, revolution_angles(params.revolutions));
}

void LogoSession::set_airfoil(const AirfoilParams& params) {
    // Compute first so a DomainError leaves the session untouched
    Curve airfoil = generate_airfoil(params);
    std::vector<Curve> overlay = build_overlay(airfoil, overlay_params_);

    airfoil_params_ = params;
    airfoil_ = std::move(airfoil);
    overlay_paths_ = std::move(overlay);
    logging::get_logger()->debug("LogoSession: airfoil R={}, center=({}, {}), scale={}",
                                 params.radius, params.x_center, params.y_center,
                                 params.scale);
}

void LogoSession::set_overlay(const OverlayParams& params) {
    std::vector<Curve> overlay = build_overlay(airfoil_, params);

    overlay_params_ = params;
    overlay_paths_ = std::move(overlay);
    logging::get_logger()->debug("LogoSession: overlay y_offset={}, revolutions={}",
                                 params.y_offset, params.revolutions);
}

std::vector<PathLayer> LogoSession::layers(const ExportStyle& style) const {
    std::vector<PathLayer> out;
    out.reserve(emblem_paths().size() + overlay_paths_.size());

    for (const auto& path : emblem_paths()) {
        out.push_back({path, style.emblem.stroke, style.emblem.stroke_width,
                       style.emblem.opacity});
    }

    // A single unrotated airfoil is drawn fully opaque
    bool single = overlay_params_.revolutions == 1;
    for (const auto& path : overlay_paths_) {
        out.push_back({path, style.overlay.stroke, style.overlay.stroke_width,
                       single ? std::nullopt : style.overlay.opacity});
    }
    return out;
}

std::string LogoSession::label(const ExportStyle& style) const {
    // "{}" in the format is replaced by the revolution count
    std::string text = style.label_format;
    auto pos = text.find("{}");
    if (pos != std::string::npos) {
        text.replace(pos, 2, std::to_string(overlay_params_.revolutions));
    }
    return text;
}

SvgDocument LogoSession::to_document(const ExportOptions& options,
                                     const ExportStyle& style) const {
    ExportOptions opts = options;
    opts.label = label(style);
    return SvgDocument::from_layers(layers(style), opts);
}

}  // namespace spinlogo
