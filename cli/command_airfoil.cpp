#include "cli_common.hpp"
#include <geometry/airfoil.hpp>
#include <serialization/contour_json.hpp>

namespace spinlogo::cli {

int command_airfoil(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.output_path.empty()) {
            std::cerr << "Usage: spinlogo airfoil -o <airfoil.json> [-c config.json] "
                         "[--radius R] [--x-center X] [--y-center Y] [--scale S]\n";
            return 1;
        }

        RunConfig config = load_run_config(ctx);
        if (!check_parameters(config)) {
            return 1;
        }

        log->info("Generating airfoil: R={}, center=({}, {}), scale={}",
                  config.airfoil.radius, config.airfoil.x_center,
                  config.airfoil.y_center, config.airfoil.scale);
        Curve airfoil = generate_airfoil(config.airfoil);

        auto data = json::make_serialized("airfoil", ctx.config_path.value_or(""));
        data.config = {{"airfoil", config.airfoil}};
        data.data = curve_to_json(airfoil);

        auto [min_pt, max_pt] = bounding_box(airfoil);
        data.stats = {
            {"point_count", airfoil.size()},
            {"closure_gap", airfoil.front().distance_to(airfoil.back())},
            {"min", min_pt},
            {"max", max_pt}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote airfoil to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " (" << airfoil.size() << " points)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace spinlogo::cli
