#pragma once

// =============================================================================
// Hongg Kit - Settings
// =============================================================================
//
// Everything the orchestrator reads from the environment, gathered once at
// startup. Command-line options are applied on top by the CLI.
//

#include "hongg_kit/common.h"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hongg {
namespace config {

// Environment lookup, injectable for tests
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Lookup backed by the real process environment
EnvLookup processEnvironment();

// Lookup backed by a fixed map
EnvLookup mapEnvironment(std::map<std::string, std::string> values);

// Split on runs of whitespace (no quoting rules)
std::vector<std::string> splitWhitespace(std::string_view text);

// Default names, relative to the project root
inline constexpr std::string_view kDefaultTargetDir = "hfuzz_target";
inline constexpr std::string_view kDefaultWorkspace = "hfuzz_workspace";

// Variables the runtime and the orchestrator exchange
inline constexpr std::string_view kEnvFuzzingActive = "HONGG_FUZZING_ACTIVE";
inline constexpr std::string_view kEnvCrashFilename = "HONGG_CRASH_FILENAME";
inline constexpr std::string_view kEnvWorkspace = "HONGG_WORKSPACE";
inline constexpr std::string_view kEnvLogLevel = "HONGG_LOG_LEVEL";

struct Settings {
    // Build output root, kept apart from the project's own build tree
    std::filesystem::path target_dir{kDefaultTargetDir};
    std::filesystem::path workspace{kDefaultWorkspace};

    // Seed input directory override
    std::optional<std::filesystem::path> input;

    std::string target_triple{kHostTriple};

    std::vector<std::string> run_args;        // HONGG_RUN_ARGS, passed to the engine
    std::vector<std::string> build_args;      // HONGG_BUILD_ARGS, passed to `cmake --build`
    std::vector<std::string> configure_args;  // HONGG_CONFIGURE_ARGS, passed to `cmake -S`
    std::vector<std::string> extra_flags;     // HONGG_CFLAGS, appended to compile flags

    std::optional<std::string> debugger;
    std::filesystem::path engine_source_dir;

    std::string c_compiler = "cc";
    std::string cxx_compiler = "c++";

    // User sanitizer options, prefixed (never replaced) by the launcher
    std::string asan_options;
    std::string tsan_options;
    std::string ubsan_options;

    // Gather all settings from the environment
    static Settings fromEnvironment(const EnvLookup& env);

    // Make relative paths absolute against the project root
    void resolvePaths(const std::filesystem::path& project_root);
};

}  // namespace config
}  // namespace hongg
