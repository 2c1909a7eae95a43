// =============================================================================
// Hongg Kit - `hongg` Entry Point
// =============================================================================

#include "cli/commands.h"

#include "hongg_kit/logging.h"
#include "hongg_kit/process/process_runner.h"

#include <fmt/format.h>

#include <filesystem>
#include <system_error>

int main(int argc, char** argv) {
    using namespace hongg;

    auto env = config::processEnvironment();

    auto options = cli::parseCommandLine(argc, argv);
    if (!options) {
        fmt::print(stderr, "hongg: {}\n\n{}", options.error().message(), cli::usage());
        return static_cast<int>(ExitCode::kUsage);
    }

    // -v wins over HONGG_LOG_LEVEL
    auto level = levelFromVerbosity(options->verbosity);
    if (options->verbosity == 0) {
        if (auto name = env(config::kEnvLogLevel)) {
            if (auto parsed = parseLogLevel(*name)) {
                level = *parsed;
            } else {
                fmt::print(stderr, "hongg: ignoring unknown log level '{}'\n", *name);
            }
        }
    }
    initLogging(level);

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        fmt::print(stderr, "hongg: cannot determine the working directory: {}\n", ec.message());
        return static_cast<int>(ExitCode::kUsage);
    }

    process::PosixProcessRunner runner;
    int code = cli::runCommand(*options, runner, env, cwd);
    flushLogs();
    return code;
}
