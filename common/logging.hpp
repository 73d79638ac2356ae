#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace spinlogo {
namespace logging {

constexpr const char* kLoggerName = "spinlogo";
constexpr const char* kLevelVariable = "SPINLOGO_LOG_LEVEL";

// Level requested through SPINLOGO_LOG_LEVEL, or info. Unknown names map to off
// in spdlog, so they are ignored here instead.
inline spdlog::level::level_enum requested_level() {
    const char* env = std::getenv(kLevelVariable);
    if (env == nullptr) {
        return spdlog::level::info;
    }
    std::string name(env);
    if (name == "error") {
        name = "err";
    }
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

// Shared stderr logger for the library and the CLI
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt(kLoggerName);
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(requested_level());
        return log;
    }();
    return logger;
}

// -v on the command line; an explicit SPINLOGO_LOG_LEVEL wins
inline void enable_verbose() {
    if (std::getenv(kLevelVariable) == nullptr) {
        get_logger()->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace spinlogo
