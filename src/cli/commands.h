#pragma once

// =============================================================================
// Hongg Kit - Command-Line Tool
// =============================================================================

#include "hongg_kit/build/build_profile.h"
#include "hongg_kit/config/settings.h"
#include "hongg_kit/error.h"
#include "hongg_kit/process/process_runner.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hongg {
namespace cli {

enum class Command : uint8_t { kRun, kBuild, kDebug, kClean, kVersion, kInfo, kHelp };

struct CliOptions {
    Command command = Command::kHelp;

    // Positional arguments after the command name
    std::vector<std::string> args;

    // Everything after a literal "--", forwarded to the engine
    std::vector<std::string> engine_args;

    std::optional<std::string> workspace;
    std::optional<std::string> input;
    std::optional<std::string> target_dir;
    std::optional<std::string> sanitize;
    std::optional<std::string> debugger;

    bool no_instr = false;
    bool coverage = false;
    bool spawn = false;
    int verbosity = 0;
};

// Parse argv (argv[0] is skipped)
Result<CliOptions> parseCommandLine(int argc, const char* const* argv);

// Build mode selected by --sanitize / --no-instr / --coverage
Result<build::BuildProfile> profileFor(const CliOptions& options,
                                       const config::Settings& settings);

std::string usage();

// Execute a parsed command and return the process exit code
int runCommand(const CliOptions& options, process::ProcessRunner& runner,
               const config::EnvLookup& env, const std::filesystem::path& cwd);

}  // namespace cli
}  // namespace hongg
