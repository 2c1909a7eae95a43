// =============================================================================
// Hongg Kit - Launch Orchestrator Implementation
// =============================================================================

#include "hongg_kit/launch/launcher.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace hongg {
namespace launch {

namespace {

// Tool defaults first so the user's own options win (later keys override)
std::string prefixOptions(std::string_view defaults, const std::string& user) {
    if (user.empty()) {
        return std::string(defaults);
    }
    return fmt::format("{}:{}", defaults, user);
}

Result<void> ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return {};
    }
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir)) {
        HONGG_RETURN_ERROR(ErrorCode::kWorkspaceError,
                           fmt::format("cannot create workspace directory '{}': {}", dir.string(),
                                       ec ? ec.message() : "not a directory"));
    }
    return {};
}

}  // namespace

// =============================================================================
// WorkspaceLayout
// =============================================================================

WorkspaceLayout WorkspaceLayout::forTarget(
    const std::filesystem::path& workspace, const std::string& target_name,
    const std::optional<std::filesystem::path>& input_override) {
    WorkspaceLayout layout;
    layout.root = workspace / target_name;
    layout.inputs = input_override ? *input_override : layout.root / "inputs";
    layout.corpus = layout.root / "corpus";
    layout.crashes = layout.root / "crashes";
    return layout;
}

Result<void> WorkspaceLayout::create() const {
    HONGG_TRY(ensureDirectory(root));
    HONGG_TRY(ensureDirectory(inputs));
    HONGG_TRY(ensureDirectory(corpus));
    HONGG_TRY(ensureDirectory(crashes));
    return {};
}

// =============================================================================
// Commands
// =============================================================================

process::Command EngineInvocation::toCommand() const {
    process::Command cmd(engine_binary.string());
    cmd.arg("-W").arg(workspace.root.string());
    cmd.arg("-f").arg(workspace.inputs.string());
    cmd.arg("--output").arg(workspace.corpus.string());
    cmd.arg("--crashdir").arg(workspace.crashes.string());
    cmd.arg("-P");
    cmd.addArgs(extra_args);
    cmd.arg("--").arg(target_binary.string());
    cmd.addArgs(target_args);
    cmd.env = env_overrides;
    return cmd;
}

process::Command DebugInvocation::toCommand() const {
    if (!debugger) {
        process::Command cmd(target_binary.string());
        cmd.arg(crash_file.string()).addArgs(target_args);
        cmd.env = env_overrides;
        return cmd;
    }

    process::Command cmd(*debugger);
    bool is_lldb = std::filesystem::path(*debugger).filename().string().find("lldb") !=
                   std::string::npos;
    if (is_lldb) {
        cmd.addArgs({"-o", "b __cxa_throw", "-o", "r", "-o", "bt", "-f", target_binary.string(),
                     "--"});
    } else {
        cmd.addArgs({"-ex", "b __cxa_throw", "-ex", "r", "-ex", "bt", "--args",
                     target_binary.string()});
    }
    cmd.arg(crash_file.string()).addArgs(target_args);
    cmd.env = env_overrides;
    return cmd;
}

runtime::IterationOutcome classifyReplay(const process::ExitStatus& status) {
    if (status.success()) {
        return runtime::Completed{};
    }
    return runtime::CrashDetected{status.toString()};
}

// =============================================================================
// Launcher
// =============================================================================

Launcher::Launcher(process::ProcessRunner& runner, config::Settings settings)
    : runner_(runner), settings_(std::move(settings)) {}

std::map<std::string, std::string> Launcher::environmentOverrides(
    const WorkspaceLayout& workspace) const {
    std::map<std::string, std::string> env;
    env[std::string(config::kEnvFuzzingActive)] = "1";
    env[std::string(config::kEnvWorkspace)] = workspace.root.string();
    env["ASAN_OPTIONS"] =
        prefixOptions("detect_odr_violation=0:abort_on_error=1", settings_.asan_options);
    env["TSAN_OPTIONS"] = prefixOptions("report_signal_unsafe=0", settings_.tsan_options);
    env["UBSAN_OPTIONS"] =
        prefixOptions("halt_on_error=1:abort_on_error=1", settings_.ubsan_options);
    return env;
}

Result<EngineInvocation> Launcher::prepare(const std::filesystem::path& engine_binary,
                                           const std::filesystem::path& target_binary,
                                           const std::string& target_name,
                                           const std::vector<std::string>& engine_args,
                                           const std::vector<std::string>& target_args) const {
    if (!process::isExecutableFile(engine_binary)) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineNotFound,
                           fmt::format("cannot execute engine '{}'; run `hongg build` from the "
                                       "fuzzed project directory",
                                       engine_binary.string()));
    }
    if (!process::isExecutableFile(target_binary)) {
        HONGG_RETURN_ERROR(ErrorCode::kTargetNotExecutable,
                           fmt::format("target binary '{}' is missing or not executable",
                                       target_binary.string()));
    }

    EngineInvocation invocation;
    invocation.engine_binary = engine_binary;
    invocation.target_binary = target_binary;
    invocation.workspace =
        WorkspaceLayout::forTarget(settings_.workspace, target_name, settings_.input);
    HONGG_TRY(invocation.workspace.create());

    invocation.extra_args = settings_.run_args;
    invocation.extra_args.insert(invocation.extra_args.end(), engine_args.begin(),
                                 engine_args.end());
    invocation.target_args = target_args;
    invocation.env_overrides = environmentOverrides(invocation.workspace);
    return invocation;
}

Result<int> Launcher::launch(const EngineInvocation& invocation, LaunchStyle style) {
    auto cmd = invocation.toCommand();
    spdlog::info("Launching: {}", cmd.display());

    if (style == LaunchStyle::kExec) {
        Error err = runner_.exec(cmd);
        HONGG_RETURN_ERROR(ErrorCode::kLaunchError, std::string(err.message()));
    }

    auto result = runner_.run(cmd);
    if (!result) {
        HONGG_RETURN_ERROR(ErrorCode::kLaunchError,
                           fmt::format("cannot execute engine '{}': {}",
                                       invocation.engine_binary.string(),
                                       result.error().message()));
    }
    if (result->status.wasSignaled()) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineAbnormalExit,
                           fmt::format("engine exited abnormally ({})",
                                       result->status.toString()));
    }
    if (!result->status.success()) {
        spdlog::warn("Engine exited with status {}", result->status.code());
    }
    return result->status.code();
}

Result<DebugInvocation> Launcher::prepareDebug(const std::filesystem::path& target_binary,
                                               const std::filesystem::path& crash_file,
                                               const std::vector<std::string>& target_args) const {
    if (!process::isExecutableFile(target_binary)) {
        HONGG_RETURN_ERROR(ErrorCode::kTargetNotExecutable,
                           fmt::format("debug binary '{}' is missing or not executable",
                                       target_binary.string()));
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(crash_file, ec)) {
        HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument,
                           fmt::format("crash file '{}' does not exist", crash_file.string()));
    }

    DebugInvocation invocation;
    invocation.target_binary = target_binary;
    invocation.crash_file = std::filesystem::absolute(crash_file, ec);
    if (ec) {
        invocation.crash_file = crash_file;
    }
    invocation.target_args = target_args;
    invocation.debugger = settings_.debugger;
    invocation.env_overrides[std::string(config::kEnvCrashFilename)] =
        invocation.crash_file.string();
    return invocation;
}

Result<ReplayReport> Launcher::runDebug(const DebugInvocation& invocation) {
    auto cmd = invocation.toCommand();
    spdlog::info("Replaying: {}", cmd.display());

    auto result = runner_.run(cmd);
    if (!result) {
        HONGG_RETURN_ERROR(ErrorCode::kLaunchError, std::string(result.error().message()));
    }

    ReplayReport report;
    report.status = result->status;
    if (invocation.debugger) {
        spdlog::info("Debugger {} finished: {}", *invocation.debugger,
                     result->status.toString());
        return report;
    }
    report.outcome = classifyReplay(result->status);
    spdlog::info("Replay of {}: {}", invocation.crash_file.string(),
                 runtime::outcomeName(*report.outcome));
    return report;
}

}  // namespace launch
}  // namespace hongg
