#include "cli_common.hpp"

namespace spinlogo::cli {

int command_validate(int argc, char** argv) {
    auto log = logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        RunConfig config = load_run_config(ctx);

        if (!check_parameters(config)) {
            return 1;
        }

        std::cout << nlohmann::json{
            {"airfoil", config.airfoil},
            {"overlay", config.overlay}
        }.dump(2) << "\n";
        log->info("Parameters valid");
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace spinlogo::cli
