#pragma once

// =============================================================================
// Hongg Kit - Launch Orchestrator
// =============================================================================
//
// Turns a built target into a honggfuzz session:
//
//   <workspace>/<target>/inputs/    seed inputs (-f)
//   <workspace>/<target>/corpus/    inputs that found new coverage (--output)
//   <workspace>/<target>/crashes/   crash reproducers (--crashdir)
//
// Directories are created when missing and their contents are never touched.
// The engine either replaces this process (exec) or runs as a child whose
// exit status is relayed.
//

#include "hongg_kit/config/settings.h"
#include "hongg_kit/error.h"
#include "hongg_kit/process/process_runner.h"
#include "hongg_kit/runtime/outcome.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hongg {
namespace launch {

// =============================================================================
// Workspace
// =============================================================================

struct WorkspaceLayout {
    std::filesystem::path root;
    std::filesystem::path inputs;
    std::filesystem::path corpus;
    std::filesystem::path crashes;

    // Layout for one target; `input_override` replaces the seed directory
    static WorkspaceLayout forTarget(const std::filesystem::path& workspace,
                                     const std::string& target_name,
                                     const std::optional<std::filesystem::path>& input_override);

    // Create missing directories; existing files are left alone
    Result<void> create() const;
};

// =============================================================================
// Invocations
// =============================================================================

struct EngineInvocation {
    std::filesystem::path engine_binary;
    std::filesystem::path target_binary;
    WorkspaceLayout workspace;

    std::vector<std::string> extra_args;   // Engine arguments, forwarded verbatim
    std::vector<std::string> target_args;  // Arguments of the fuzzed binary
    std::map<std::string, std::string> env_overrides;

    [[nodiscard]] process::Command toCommand() const;
};

struct DebugInvocation {
    std::filesystem::path target_binary;
    std::filesystem::path crash_file;
    std::vector<std::string> target_args;
    std::optional<std::string> debugger;
    std::map<std::string, std::string> env_overrides;

    // Direct execution, or wrapped in gdb/lldb when a debugger is set
    [[nodiscard]] process::Command toCommand() const;
};

enum class LaunchStyle : uint8_t {
    kExec,   // Replace the current process image
    kSpawn,  // Run as a child and relay its exit status
};

// Single-run replay verdict from the target's exit status
runtime::IterationOutcome classifyReplay(const process::ExitStatus& status);

struct ReplayReport {
    process::ExitStatus status = process::ExitStatus::exited(0);
    // Set only when the binary ran directly. A debugger's exit status says
    // nothing about how the inferior ended.
    std::optional<runtime::IterationOutcome> outcome;
};

// =============================================================================
// Launcher
// =============================================================================

class Launcher {
  public:
    Launcher(process::ProcessRunner& runner, config::Settings settings);

    // Environment telling the harness runtime it runs under the engine
    [[nodiscard]] std::map<std::string, std::string> environmentOverrides(
        const WorkspaceLayout& workspace) const;

    // Validate binaries, create the workspace and assemble the invocation
    Result<EngineInvocation> prepare(const std::filesystem::path& engine_binary,
                                     const std::filesystem::path& target_binary,
                                     const std::string& target_name,
                                     const std::vector<std::string>& engine_args,
                                     const std::vector<std::string>& target_args) const;

    // kExec returns only on failure. kSpawn returns the engine's exit code,
    // or kEngineAbnormalExit when a signal killed it.
    Result<int> launch(const EngineInvocation& invocation, LaunchStyle style);

    Result<DebugInvocation> prepareDebug(const std::filesystem::path& target_binary,
                                         const std::filesystem::path& crash_file,
                                         const std::vector<std::string>& target_args) const;

    // Run the triage binary once against the crash file
    Result<ReplayReport> runDebug(const DebugInvocation& invocation);

  private:
    process::ProcessRunner& runner_;
    config::Settings settings_;
};

}  // namespace launch
}  // namespace hongg
