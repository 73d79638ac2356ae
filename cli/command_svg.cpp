#include "cli_common.hpp"
#include <session/logo_session.hpp>

namespace spinlogo::cli {

int command_svg(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        RunConfig config = load_run_config(ctx);
        if (!check_parameters(config)) {
            return 1;
        }

        std::string output = ctx.output_path.empty()
            ? default_svg_name(config.overlay.revolutions)
            : ensure_svg_extension(ctx.output_path);

        log->info("Building emblem");
        LogoSession session(EmblemGeometry::build(config.emblem),
                            config.airfoil, config.overlay);
        for (const auto& warning : session.emblem()->warnings()) {
            std::cerr << "Warning: " << warning << "\n";
        }

        log->debug("Laying out SVG: padding={}, {} px/unit",
                   config.export_options.padding, config.export_options.pixels_per_unit);
        SvgDocument doc = session.to_document(config.export_options, config.style);
        doc.save(output);

        const ViewBox& vb = doc.view_box();
        log->info("Wrote SVG to {}", output);
        std::cerr << "Wrote " << output << " (" << doc.layers().size() << " paths)\n";
        std::cerr << "  Size: " << static_cast<long>(doc.pixel_width() + 0.5) << "px x "
                  << static_cast<long>(doc.pixel_height() + 0.5) << "px\n";
        std::cerr << "  ViewBox: " << vb.x << " " << vb.y << " "
                  << vb.width << " " << vb.height << "\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace spinlogo::cli
