#include "cli_common.hpp"
#include <geometry/airfoil.hpp>
#include <geometry/transform.hpp>
#include <emblem/symmetry_replicator.hpp>
#include <serialization/contour_json.hpp>

namespace spinlogo::cli {

int command_overlay(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.output_path.empty()) {
            std::cerr << "Usage: spinlogo overlay -o <overlay.json> [-c config.json] "
                         "[--y-offset V] [--revolutions N] [airfoil flags]\n";
            return 1;
        }

        RunConfig config = load_run_config(ctx);
        if (!check_parameters(config)) {
            return 1;
        }

        // Same pipeline as the session overlay, without building the emblem
        Curve airfoil = translate(generate_airfoil(config.airfoil),
                                  Vec2(0.0, config.overlay.y_offset));
        std::vector<double> angles = revolution_angles(config.overlay.revolutions);
        std::vector<Curve> overlay = replicate({airfoil}, angles);
        log->info("Replicated airfoil {} times", overlay.size());

        auto data = json::make_serialized("overlay", ctx.config_path.value_or(""));
        data.config = {
            {"airfoil", config.airfoil},
            {"overlay", config.overlay}
        };
        data.data = {
            {"angles", angles},
            {"paths", curves_to_json(overlay)}
        };
        data.stats = {{"path_count", overlay.size()}};

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote overlay to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << overlay.size() << " paths)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace spinlogo::cli
