// =============================================================================
// Hongg Kit - Logging Setup
// =============================================================================

#include "hongg_kit/logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <string>

namespace hongg {

spdlog::level::level_enum levelFromVerbosity(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::err;
    case 1:
        return spdlog::level::warn;
    case 2:
        return spdlog::level::info;
    case 3:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? spdlog::level::err : spdlog::level::trace;
    }
}

std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
    auto level = spdlog::level::from_str(std::string(name));
    // from_str() falls back to "off" for unknown names
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

void initLogging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("hongg");
    if (!logger) {
        logger = spdlog::stderr_color_mt("hongg");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(logger);
}

void flushLogs() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& l) { l->flush(); });
    std::fflush(stdout);
    std::fflush(stderr);
}

}  // namespace hongg
