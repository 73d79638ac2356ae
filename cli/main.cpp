#include "cli_common.hpp"
#include <cstring>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Generates the revolution emblem and Joukowsky airfoil overlay.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  airfoil     Airfoil curve as JSON\n";
    std::cerr << "  emblem      Emblem paths and fillet fits as JSON\n";
    std::cerr << "  overlay     Replicated airfoils as JSON\n";
    std::cerr << "  svg         Full logo as SVG\n";
    std::cerr << "  validate    Check parameter ranges\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>      Output file\n";
    std::cerr << "  -c, --config <path>      JSON config (airfoil, overlay, emblem, export, style)\n";
    std::cerr << "  -v, --verbose            Debug logging\n";
    std::cerr << "  --radius <R>             Generating circle radius [0.50, 1.20]\n";
    std::cerr << "  --x-center <X>           Circle center x [-0.50, 0.50]\n";
    std::cerr << "  --y-center <Y>           Circle center y [0.00, 0.50]\n";
    std::cerr << "  --scale <S>              Airfoil scale [0.10, 3.00]\n";
    std::cerr << "  --y-offset <V>           Overlay vertical offset [-1.00, 1.00]\n";
    std::cerr << "  --revolutions <N>        Overlay copies [1, 12]\n";
    std::cerr << "  --padding <P>            SVG padding in units (default 0.2)\n";
    std::cerr << "  --pixels-per-unit <K>    SVG pixel scale (default 300)\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  SPINLOGO_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        print_usage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string command = argv[1];
    if (command == "airfoil") {
        return spinlogo::cli::command_airfoil(argc, argv);
    } else if (command == "emblem") {
        return spinlogo::cli::command_emblem(argc, argv);
    } else if (command == "overlay") {
        return spinlogo::cli::command_overlay(argc, argv);
    } else if (command == "svg") {
        return spinlogo::cli::command_svg(argc, argv);
    } else if (command == "validate") {
        return spinlogo::cli::command_validate(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
