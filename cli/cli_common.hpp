#ifndef SPINLOGO_CLI_COMMON_HPP
#define SPINLOGO_CLI_COMMON_HPP

#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>
#include <cctype>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <sstream>

namespace spinlogo::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;

    // Parameter overrides, applied on top of the config file
    std::optional<double> radius;
    std::optional<double> x_center;
    std::optional<double> y_center;
    std::optional<double> scale;
    std::optional<double> y_offset;
    std::optional<int> revolutions;
    std::optional<double> padding;
    std::optional<double> pixels_per_unit;
};

inline double parse_double(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + text + "'");
    }
}

inline int parse_int(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects an integer, got '" + text + "'");
    }
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        std::string value = argv[i + 1];
        i += 2;
        return value;
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = next_value("-c/--config");
        } else if (arg == "--radius") {
            ctx.radius = parse_double(arg, next_value(arg));
        } else if (arg == "--x-center") {
            ctx.x_center = parse_double(arg, next_value(arg));
        } else if (arg == "--y-center") {
            ctx.y_center = parse_double(arg, next_value(arg));
        } else if (arg == "--scale") {
            ctx.scale = parse_double(arg, next_value(arg));
        } else if (arg == "--y-offset") {
            ctx.y_offset = parse_double(arg, next_value(arg));
        } else if (arg == "--revolutions") {
            ctx.revolutions = parse_int(arg, next_value(arg));
        } else if (arg == "--padding") {
            ctx.padding = parse_double(arg, next_value(arg));
        } else if (arg == "--pixels-per-unit") {
            ctx.pixels_per_unit = parse_double(arg, next_value(arg));
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::enable_verbose();
    }
    return {ctx, i};
}

// Config file (if any) with the command line overrides applied
inline RunConfig load_run_config(const CommandContext& ctx) {
    RunConfig config;
    if (ctx.config_path) {
        logging::get_logger()->debug("Loading config: {}", *ctx.config_path);
        config = json::read_json_file(*ctx.config_path).get<RunConfig>();
    }

    if (ctx.radius) config.airfoil.radius = *ctx.radius;
    if (ctx.x_center) config.airfoil.x_center = *ctx.x_center;
    if (ctx.y_center) config.airfoil.y_center = *ctx.y_center;
    if (ctx.scale) config.airfoil.scale = *ctx.scale;
    if (ctx.y_offset) config.overlay.y_offset = *ctx.y_offset;
    if (ctx.revolutions) config.overlay.revolutions = *ctx.revolutions;
    if (ctx.padding) config.export_options.padding = *ctx.padding;
    if (ctx.pixels_per_unit) config.export_options.pixels_per_unit = *ctx.pixels_per_unit;
    return config;
}

// Range check the live parameters; logs every problem found
inline bool check_parameters(const RunConfig& config) {
    auto log = logging::get_logger();

    ValidationResult result = config.airfoil.validate();
    result.merge(config.overlay.validate());
    for (const auto& warning : result.warnings) {
        log->warn("{}", warning);
    }
    for (const auto& error : result.errors) {
        log->error("Invalid parameter: {}", error);
        std::cerr << "Invalid parameter: " << error << "\n";
    }
    return result.valid;
}

// Default export name: spinpak_logo_<N>rev_<timestamp>.svg
inline std::string default_svg_name(int revolutions) {
    return "spinpak_logo_" + std::to_string(revolutions) + "rev_" +
           json::get_file_timestamp() + ".svg";
}

// Append ".svg" unless the path already ends with it (any case)
inline std::string ensure_svg_extension(const std::string& path) {
    if (path.size() >= 4) {
        std::string tail = path.substr(path.size() - 4);
        for (auto& c : tail) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (tail == ".svg") {
            return path;
        }
    }
    return path + ".svg";
}

// Command function declarations
int command_airfoil(int argc, char** argv);
int command_emblem(int argc, char** argv);
int command_overlay(int argc, char** argv);
int command_svg(int argc, char** argv);
int command_validate(int argc, char** argv);

}  // namespace spinlogo::cli

#endif // SPINLOGO_CLI_COMMON_HPP
