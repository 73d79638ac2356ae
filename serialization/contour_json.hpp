#ifndef SPINLOGO_SERIALIZATION_CONTOUR_JSON_HPP
#define SPINLOGO_SERIALIZATION_CONTOUR_JSON_HPP

#include <nlohmann/json.hpp>
#include <emblem/emblem_geometry.hpp>
#include <fillet/fillet.hpp>
#include <fillet/tangent_circle_solver.hpp>
#include "config_json.hpp"
#include <vector>

namespace spinlogo {

// Curve serialization: array of [x, y]
inline nlohmann::json curve_to_json(const Curve& curve) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& p : curve) {
        j.push_back(p);
    }
    return j;
}

inline Curve curve_from_json(const nlohmann::json& j) {
    return j.get<std::vector<Vec2>>();
}

inline nlohmann::json curves_to_json(const std::vector<Curve>& curves) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& c : curves) {
        j.push_back(curve_to_json(c));
    }
    return j;
}

inline std::vector<Curve> curves_from_json(const nlohmann::json& j) {
    std::vector<Curve> curves;
    for (const auto& c : j) {
        curves.push_back(curve_from_json(c));
    }
    return curves;
}

// FilletResult serialization
inline void to_json(nlohmann::json& j, const FilletResult& fillet) {
    j["center"] = fillet.center;
    j["radius"] = fillet.radius;
    j["contact_a"] = fillet.contact_a;
    j["contact_b"] = fillet.contact_b;
    j["residual"] = fillet.residual;
    j["sweep"] = fillet.sweep();
    j["arc"] = curve_to_json(fillet.arc);
}

inline void from_json(const nlohmann::json& j, FilletResult& fillet) {
    fillet.center = j["center"].get<Vec2>();
    fillet.radius = j["radius"].get<double>();
    fillet.contact_a = j["contact_a"].get<Vec2>();
    fillet.contact_b = j["contact_b"].get<Vec2>();
    fillet.residual = j.value("residual", 0.0);
    fillet.arc = curve_from_json(j["arc"]);
}

// FitResult serialization (diagnostics only)
inline void to_json(nlohmann::json& j, const FitResult& fit) {
    j = {
        {"center", fit.center},
        {"residual", fit.residual},
        {"objective", fit.objective},
        {"iterations", fit.iterations},
        {"converged", fit.converged}
    };
}

// EmblemGeometry serialization (one way: the emblem is rebuilt from its design)
inline nlohmann::json emblem_to_json(const EmblemGeometry& emblem) {
    nlohmann::json j;
    j["paths"] = curves_to_json(emblem.paths());
    j["fillets"] = {
        {"outer_corner", emblem.outer_corner()},
        {"inner_corner", emblem.inner_corner()},
        {"stem_corner", emblem.stem_corner()},
        {"stem_joint", emblem.stem_joint()}
    };
    j["warnings"] = emblem.warnings();
    return j;
}

}  // namespace spinlogo

#endif // SPINLOGO_SERIALIZATION_CONTOUR_JSON_HPP
