#include "cli_common.hpp"
#include <emblem/emblem_geometry.hpp>
#include <serialization/contour_json.hpp>

namespace spinlogo::cli {

int command_emblem(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.output_path.empty()) {
            std::cerr << "Usage: spinlogo emblem -o <emblem.json> [-c config.json]\n";
            return 1;
        }

        RunConfig config = load_run_config(ctx);

        log->info("Building emblem: r1={}, r2={}, corner radius={}, joint radius={}",
                  config.emblem.inner_radius, config.emblem.outer_radius,
                  config.emblem.corner_radius, config.emblem.joint_radius);
        auto emblem = EmblemGeometry::build(config.emblem);

        for (const auto& warning : emblem->warnings()) {
            std::cerr << "Warning: " << warning << "\n";
        }

        auto data = json::make_serialized("emblem", ctx.config_path.value_or(""));
        data.config = {{"emblem", config.emblem}};
        data.data = emblem_to_json(*emblem);
        data.stats = {
            {"path_count", emblem->paths().size()},
            {"point_count", emblem->point_count()},
            {"converged", emblem->converged()}
        };

        json::write_serialized(ctx.output_path, data);

        log->info("Wrote emblem to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << emblem->paths().size() << " paths, "
                  << emblem->point_count() << " points)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace spinlogo::cli
