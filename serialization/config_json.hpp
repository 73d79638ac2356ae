#ifndef SPINLOGO_SERIALIZATION_CONFIG_JSON_HPP
#define SPINLOGO_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <geometry/airfoil.hpp>
#include <emblem/emblem_design.hpp>
#include <fillet/tangent_circle_solver.hpp>
#include <session/logo_session.hpp>
#include <serialization/svg_document.hpp>

namespace spinlogo {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("Point must be an array [x, y]");
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

// AirfoilParams serialization
inline void to_json(nlohmann::json& j, const AirfoilParams& p) {
    j = {
        {"radius", p.radius},
        {"x_center", p.x_center},
        {"y_center", p.y_center},
        {"scale", p.scale}
    };
}

inline void from_json(const nlohmann::json& j, AirfoilParams& p) {
    p.radius = j.value("radius", 0.85);
    p.x_center = j.value("x_center", -0.1);
    p.y_center = j.value("y_center", 0.23);
    p.scale = j.value("scale", 1.0);
}

// OverlayParams serialization
inline void to_json(nlohmann::json& j, const OverlayParams& p) {
    j = {
        {"y_offset", p.y_offset},
        {"revolutions", p.revolutions}
    };
}

inline void from_json(const nlohmann::json& j, OverlayParams& p) {
    p.y_offset = j.value("y_offset", 0.0);
    p.revolutions = j.value("revolutions", 1);
}

// MinimizeConfig / FitConfig serialization
inline void to_json(nlohmann::json& j, const FitConfig& config) {
    j = {
        {"x_tolerance", config.minimize.x_tolerance},
        {"f_tolerance", config.minimize.f_tolerance},
        {"max_iterations", config.minimize.max_iterations},
        {"residual_tolerance", config.residual_tolerance}
    };
}

inline void from_json(const nlohmann::json& j, FitConfig& config) {
    config.minimize.x_tolerance = j.value("x_tolerance", 1e-10);
    config.minimize.f_tolerance = j.value("f_tolerance", 1e-14);
    config.minimize.max_iterations = j.value("max_iterations", 2000);
    config.residual_tolerance = j.value("residual_tolerance", 1e-3);
}

// EmblemDesign serialization
inline void to_json(nlohmann::json& j, const EmblemDesign& d) {
    j = {
        {"inner_radius", d.inner_radius},
        {"outer_radius", d.outer_radius},
        {"corner_radius", d.corner_radius},
        {"joint_radius", d.joint_radius},
        {"notch_x", d.notch_x},
        {"stem_x", d.stem_x},
        {"arc_samples", d.arc_samples},
        {"fillet_samples", d.fillet_samples},
        {"notch_outer_seed", d.notch_outer_seed},
        {"notch_inner_seed", d.notch_inner_seed},
        {"stem_probe_y", d.stem_probe_y},
        {"stem_x_bounds", {d.stem_x_lo, d.stem_x_hi}},
        {"stem_y_bounds", {d.stem_y_lo, d.stem_y_hi}},
        {"outer_penalty_weight", d.outer_penalty_weight},
        {"inner_penalty_weight", d.inner_penalty_weight},
        {"mirror_axis_deg", d.mirror_axis_deg},
        {"symmetry_angles", d.symmetry_angles},
        {"solver", d.solver}
    };
}

inline void from_json(const nlohmann::json& j, EmblemDesign& d) {
    EmblemDesign defaults;
    d.inner_radius = j.value("inner_radius", defaults.inner_radius);
    d.outer_radius = j.value("outer_radius", defaults.outer_radius);
    d.corner_radius = j.value("corner_radius", defaults.corner_radius);
    d.joint_radius = j.value("joint_radius", defaults.joint_radius);
    d.notch_x = j.value("notch_x", defaults.notch_x);
    d.stem_x = j.value("stem_x", defaults.stem_x);
    d.arc_samples = j.value("arc_samples", defaults.arc_samples);
    d.fillet_samples = j.value("fillet_samples", defaults.fillet_samples);
    d.notch_outer_seed = j.contains("notch_outer_seed")
        ? j["notch_outer_seed"].get<Vec2>() : defaults.notch_outer_seed;
    d.notch_inner_seed = j.contains("notch_inner_seed")
        ? j["notch_inner_seed"].get<Vec2>() : defaults.notch_inner_seed;
    d.stem_probe_y = j.value("stem_probe_y", defaults.stem_probe_y);
    if (j.contains("stem_x_bounds")) {
        d.stem_x_lo = j["stem_x_bounds"].at(0).get<double>();
        d.stem_x_hi = j["stem_x_bounds"].at(1).get<double>();
    }
    if (j.contains("stem_y_bounds")) {
        d.stem_y_lo = j["stem_y_bounds"].at(0).get<double>();
        d.stem_y_hi = j["stem_y_bounds"].at(1).get<double>();
    }
    d.outer_penalty_weight = j.value("outer_penalty_weight", defaults.outer_penalty_weight);
    d.inner_penalty_weight = j.value("inner_penalty_weight", defaults.inner_penalty_weight);
    d.mirror_axis_deg = j.value("mirror_axis_deg", defaults.mirror_axis_deg);
    d.symmetry_angles = j.value("symmetry_angles", defaults.symmetry_angles);
    if (j.contains("solver")) {
        d.solver = j["solver"].get<FitConfig>();
    }
}

// LayerStyle / ExportStyle serialization
inline void to_json(nlohmann::json& j, const LayerStyle& s) {
    j = {
        {"stroke", s.stroke},
        {"stroke_width", s.stroke_width}
    };
    if (s.opacity) {
        j["opacity"] = *s.opacity;
    }
}

inline void from_json(const nlohmann::json& j, LayerStyle& s) {
    s.stroke = j.value("stroke", s.stroke);
    s.stroke_width = j.value("stroke_width", s.stroke_width);
    if (j.contains("opacity")) {
        s.opacity = j["opacity"].is_null()
            ? std::nullopt : std::optional<double>(j["opacity"].get<double>());
    }
}

inline void to_json(nlohmann::json& j, const ExportStyle& s) {
    j = {
        {"emblem", s.emblem},
        {"overlay", s.overlay},
        {"label_format", s.label_format}
    };
}

inline void from_json(const nlohmann::json& j, ExportStyle& s) {
    if (j.contains("emblem")) {
        from_json(j["emblem"], s.emblem);
    }
    if (j.contains("overlay")) {
        from_json(j["overlay"], s.overlay);
    }
    s.label_format = j.value("label_format", s.label_format);
}

// ExportOptions serialization (the label text is generated, not configured)
inline void to_json(nlohmann::json& j, const ExportOptions& o) {
    j = {
        {"padding", o.padding},
        {"pixels_per_unit", o.pixels_per_unit},
        {"background", o.background},
        {"label_offset", o.label_offset},
        {"label_font_size", o.label_font_size},
        {"label_fill", o.label_fill}
    };
}

inline void from_json(const nlohmann::json& j, ExportOptions& o) {
    ExportOptions defaults;
    o.padding = j.value("padding", defaults.padding);
    o.pixels_per_unit = j.value("pixels_per_unit", defaults.pixels_per_unit);
    o.background = j.value("background", defaults.background);
    o.label_offset = j.contains("label_offset")
        ? j["label_offset"].get<Vec2>() : defaults.label_offset;
    o.label_font_size = j.value("label_font_size", defaults.label_font_size);
    o.label_fill = j.value("label_fill", defaults.label_fill);
}

// Everything a run can be configured with; every section is optional
struct RunConfig {
    AirfoilParams airfoil;
    OverlayParams overlay;
    EmblemDesign emblem;
    ExportOptions export_options;
    ExportStyle style;
};

inline void to_json(nlohmann::json& j, const RunConfig& c) {
    j = {
        {"airfoil", c.airfoil},
        {"overlay", c.overlay},
        {"emblem", c.emblem},
        {"export", c.export_options},
        {"style", c.style}
    };
}

inline void from_json(const nlohmann::json& j, RunConfig& c) {
    if (j.contains("airfoil")) c.airfoil = j["airfoil"].get<AirfoilParams>();
    if (j.contains("overlay")) c.overlay = j["overlay"].get<OverlayParams>();
    if (j.contains("emblem")) c.emblem = j["emblem"].get<EmblemDesign>();
    if (j.contains("export")) c.export_options = j["export"].get<ExportOptions>();
    if (j.contains("style")) c.style = j["style"].get<ExportStyle>();
}

}  // namespace spinlogo

#endif // SPINLOGO_SERIALIZATION_CONFIG_JSON_HPP
