#pragma once

// =============================================================================
// Hongg Kit - Logging Setup
// =============================================================================

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

namespace hongg {

// Map a repeated -v count to a level (0 = error ... 4+ = trace)
spdlog::level::level_enum levelFromVerbosity(int verbosity);

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parseLogLevel(std::string_view name);

// Install the stderr logger named "hongg" as the default logger
void initLogging(spdlog::level::level_enum level);

// Flush every registered logger (used on the crash path)
void flushLogs();

}  // namespace hongg
