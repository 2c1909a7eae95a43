// =============================================================================
// Hongg Kit - Command-Line Tool Implementation
// =============================================================================

#include "cli/commands.h"

#include "hongg_kit/build/engine_builder.h"
#include "hongg_kit/build/flag_resolver.h"
#include "hongg_kit/build/target_builder.h"
#include "hongg_kit/hongg_kit.h"
#include "hongg_kit/launch/launcher.h"
#include "hongg_kit/logging.h"

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <map>
#include <sstream>

namespace po = boost::program_options;

namespace hongg {
namespace cli {

namespace {

const std::map<std::string, Command, std::less<>> kCommands = {
    {"run", Command::kRun},         {"build", Command::kBuild}, {"debug", Command::kDebug},
    {"clean", Command::kClean},     {"version", Command::kVersion},
    {"info", Command::kInfo},       {"help", Command::kHelp},
};

po::options_description visibleOptions() {
    po::options_description options("Options");
    // clang-format off
    options.add_options()
        ("help,h", "show this message")
        ("workspace,w", po::value<std::string>(), "fuzzing workspace (HONGG_WORKSPACE)")
        ("input,i", po::value<std::string>(), "seed input directory (HONGG_INPUT)")
        ("target-dir", po::value<std::string>(), "build output root (HONGG_TARGET_DIR)")
        ("sanitize", po::value<std::string>(), "build with sanitizers, e.g. address,undefined")
        ("no-instr", "build without coverage instrumentation")
        ("coverage", "build for a source-based coverage report")
        ("spawn", "run the engine as a child instead of replacing this process")
        ("debugger", po::value<std::string>(), "debugger for `debug` (HONGG_DEBUGGER)")
        ("verbose,v", "more output, repeatable");
    // clang-format on
    return options;
}

// Shared pipeline state of build/run/debug
struct Session {
    config::Settings settings;
    std::filesystem::path project_root;
};

Result<Session> openSession(const CliOptions& options, const config::EnvLookup& env,
                            const std::filesystem::path& cwd) {
    Session session;
    session.settings = config::Settings::fromEnvironment(env);
    if (options.workspace) {
        session.settings.workspace = *options.workspace;
    }
    if (options.input) {
        session.settings.input = std::filesystem::path(*options.input);
    }
    if (options.target_dir) {
        session.settings.target_dir = *options.target_dir;
    }
    if (options.debugger) {
        session.settings.debugger = *options.debugger;
    }

    std::filesystem::path root;
    HONGG_ASSIGN_OR_RETURN(root, build::findProjectRoot(cwd));
    session.project_root = root;
    session.settings.resolvePaths(root);
    spdlog::debug("Project root: {}", root.string());
    return session;
}

build::TargetBuilder makeTargetBuilder(process::ProcessRunner& runner, const Session& session) {
    build::TargetBuilderOptions options;
    options.project_root = session.project_root;
    options.target_dir = session.settings.target_dir;
    options.c_compiler = session.settings.c_compiler;
    options.cxx_compiler = session.settings.cxx_compiler;
    options.configure_args = session.settings.configure_args;
    options.build_args = session.settings.build_args;
    return build::TargetBuilder(runner, std::move(options));
}

build::EngineBuilder makeEngineBuilder(process::ProcessRunner& runner, const Session& session) {
    build::EngineBuilderOptions options;
    options.source_dir = session.settings.engine_source_dir;
    options.output_dir = session.settings.target_dir / "engine";
    options.tool_version = Version::string();
    return build::EngineBuilder(runner, std::move(options));
}

struct BuiltTarget {
    build::BuildArtifact artifact;
    std::optional<build::EngineArtifacts> engine;
};

// Engine (when the mode is fuzzed), flags, then the target itself
Result<BuiltTarget> buildTarget(process::ProcessRunner& runner, const Session& session,
                                const build::BuildProfile& profile,
                                const std::string& target_name) {
    BuiltTarget built;
    build::ResolverOptions resolver_options;

    if (build::isFuzzingMode(profile.mode)) {
        auto engine_builder = makeEngineBuilder(runner, session);
        build::EngineArtifacts engine;
        HONGG_ASSIGN_OR_RETURN(engine, engine_builder.ensureBuilt());
        resolver_options.engine_lib_dir = engine.lib_dir;
        built.engine = engine;
    }
#if defined(HONGG_PLATFORM_LINUX)
    resolver_options.use_gold_linker = runner.findProgram("ld.gold").has_value();
#endif

    build::Toolchain toolchain;
    HONGG_ASSIGN_OR_RETURN(toolchain, build::detectToolchain(runner, session.settings.c_compiler,
                                                            session.settings.cxx_compiler));

    build::FlagResolver resolver(resolver_options);
    build::FlagSet flags;
    HONGG_ASSIGN_OR_RETURN(flags, resolver.resolve(profile, toolchain));

    auto target_builder = makeTargetBuilder(runner, session);
    build::BuildArtifact artifact;
    HONGG_ASSIGN_OR_RETURN(artifact, target_builder.build(profile, flags, target_name));
    built.artifact = artifact;
    return built;
}

int fail(const Error& error) {
    spdlog::error("{}", error.toString());
    flushLogs();
    return static_cast<int>(exitCodeFor(error.code()));
}

int usageError(const std::string& message) {
    fmt::print(stderr, "hongg: {}\n\n{}", message, usage());
    return static_cast<int>(ExitCode::kUsage);
}

// =============================================================================
// Commands
// =============================================================================

int cmdBuild(const CliOptions& options, process::ProcessRunner& runner, const Session& session) {
    if (options.args.size() != 1) {
        return usageError("`build` takes exactly one target name");
    }
    auto profile = profileFor(options, session.settings);
    if (!profile) {
        return fail(profile.error());
    }
    auto built = buildTarget(runner, session, *profile, options.args.front());
    if (!built) {
        return fail(built.error());
    }
    fmt::print("{}\n", built->artifact.binary.string());
    return 0;
}

int cmdRun(const CliOptions& options, process::ProcessRunner& runner, const Session& session) {
    if (options.args.empty()) {
        return usageError("`run` needs a target name");
    }
    if (options.coverage) {
        return usageError("coverage builds are not fuzzed; use `build --coverage`");
    }
    auto profile = profileFor(options, session.settings);
    if (!profile) {
        return fail(profile.error());
    }

    const std::string& target_name = options.args.front();
    auto built = buildTarget(runner, session, *profile, target_name);
    if (!built) {
        return fail(built.error());
    }

    launch::Launcher launcher(runner, session.settings);
    std::vector<std::string> target_args(options.args.begin() + 1, options.args.end());
    auto invocation = launcher.prepare(built->engine->binary, built->artifact.binary, target_name,
                                       options.engine_args, target_args);
    if (!invocation) {
        return fail(invocation.error());
    }

    flushLogs();
    auto style = options.spawn ? launch::LaunchStyle::kSpawn : launch::LaunchStyle::kExec;
    auto status = launcher.launch(*invocation, style);
    if (!status) {
        return fail(status.error());
    }
    return *status;
}

int cmdDebug(const CliOptions& options, process::ProcessRunner& runner, const Session& session) {
    if (options.args.size() < 2) {
        return usageError("`debug` needs a target name and a crash file");
    }
    build::BuildProfile profile;
    profile.mode = build::BuildMode::kDebugTriage;
    profile.target_triple = session.settings.target_triple;
    profile.extra_flags = session.settings.extra_flags;

    const std::string& target_name = options.args[0];
    auto built = buildTarget(runner, session, profile, target_name);
    if (!built) {
        return fail(built.error());
    }

    launch::Launcher launcher(runner, session.settings);
    std::vector<std::string> target_args(options.args.begin() + 2, options.args.end());
    auto invocation = launcher.prepareDebug(built->artifact.binary, options.args[1], target_args);
    if (!invocation) {
        return fail(invocation.error());
    }

    auto report = launcher.runDebug(*invocation);
    if (!report) {
        return fail(report.error());
    }
    if (!report->outcome) {
        // The debugger session shows how the target ended; relay the debugger
        fmt::print("Debugger exited with {}\n", report->status.toString());
        return report->status.wasSignaled() ? static_cast<int>(ExitCode::kAbnormalExit)
                                            : report->status.code();
    }
    if (const auto* crash = std::get_if<runtime::CrashDetected>(&*report->outcome)) {
        fmt::print("Crash reproduced: {}\n", crash->reason);
        return static_cast<int>(ExitCode::kAbnormalExit);
    }
    fmt::print("No crash: {} completed normally\n", target_name);
    return 0;
}

int cmdClean(process::ProcessRunner& runner, const Session& session) {
    auto target_builder = makeTargetBuilder(runner, session);
    auto cleaned = target_builder.clean();
    if (!cleaned) {
        return fail(cleaned.error());
    }
    return 0;
}

int cmdInfo(process::ProcessRunner& runner, const CliOptions& options,
            const config::EnvLookup& env, const std::filesystem::path& cwd) {
    fmt::print("hongg {}\n", Version::string());
    fmt::print("host:           {}\n", kHostTriple);

    auto settings = config::Settings::fromEnvironment(env);
    auto toolchain = build::detectToolchain(runner, settings.c_compiler, settings.cxx_compiler);
    fmt::print("toolchain:      {}\n", toolchain ? toolchain->id() : "not found");

    auto session = openSession(options, env, cwd);
    if (!session) {
        fmt::print("project:        none ({})\n", session.error().message());
        fmt::print("engine sources: {}\n", settings.engine_source_dir.string());
        return 0;
    }
    fmt::print("project:        {}\n", session->project_root.string());
    fmt::print("target dir:     {}\n", session->settings.target_dir.string());
    fmt::print("workspace:      {}\n", session->settings.workspace.string());
    fmt::print("engine sources: {}\n", session->settings.engine_source_dir.string());
    return 0;
}

}  // namespace

// =============================================================================
// Parsing
// =============================================================================

std::string usage() {
    std::ostringstream out;
    out << "Usage:\n"
           "  hongg run <target> [target-args...] [-- engine-args...]\n"
           "  hongg build <target> [--sanitize=<list> | --no-instr | --coverage]\n"
           "  hongg debug <target> <crash-file> [target-args...]\n"
           "  hongg clean\n"
           "  hongg version | info\n\n"
        << visibleOptions();
    return out.str();
}

Result<CliOptions> parseCommandLine(int argc, const char* const* argv) {
    CliOptions result;

    std::vector<std::string> args;
    bool engine_part = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (!engine_part && arg == "--") {
            engine_part = true;
            continue;
        }
        (engine_part ? result.engine_args : args).push_back(std::move(arg));
    }

    po::options_description hidden("Hidden options");
    // clang-format off
    hidden.add_options()
        ("command", po::value<std::string>(), "command")
        ("args", po::value<std::vector<std::string>>(), "arguments");
    // clang-format on

    po::options_description all;
    all.add(visibleOptions()).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    // Unknown dash tokens after the command belong to the target (run) or the
    // replayed binary (debug) and are kept in order with the positionals
    po::variables_map vm;
    std::vector<std::string> tokens;
    std::optional<std::string> stray_option;
    std::optional<std::string> unknown_arg_option;
    try {
        auto parsed = po::command_line_parser(args)
                          .options(all)
                          .positional(positional)
                          .allow_unregistered()
                          .run();

        // Positionals and unknown tokens are collected in command-line order.
        // -v may repeat; count it here since store() rejects repeated switches
        std::vector<po::option> kept;
        for (auto& o : parsed.options) {
            if (o.unregistered) {
                const auto& token =
                    o.original_tokens.empty() ? o.string_key : o.original_tokens.front();
                if (tokens.empty()) {
                    stray_option = stray_option.value_or(token);
                } else {
                    unknown_arg_option = unknown_arg_option.value_or(token);
                    tokens.insert(tokens.end(), o.original_tokens.begin(),
                                  o.original_tokens.end());
                }
            } else if (o.position_key != -1) {
                tokens.insert(tokens.end(), o.value.begin(), o.value.end());
            } else if (o.string_key == "verbose") {
                ++result.verbosity;
            } else {
                kept.push_back(std::move(o));
            }
        }
        parsed.options = std::move(kept);

        po::store(parsed, vm);
        po::notify(vm);
    } catch (const po::error& e) {
        HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument, e.what());
    }

    if (stray_option) {
        HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument,
                           fmt::format("unrecognised option '{}'", *stray_option));
    }
    if (vm.count("help") || tokens.empty()) {
        result.command = Command::kHelp;
        return result;
    }

    const auto& name = tokens.front();
    auto it = kCommands.find(name);
    if (it == kCommands.end()) {
        HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument, fmt::format("unknown command '{}'", name));
    }
    result.command = it->second;
    result.args.assign(tokens.begin() + 1, tokens.end());

    bool passes_target_args = result.command == Command::kRun || result.command == Command::kDebug;
    if (unknown_arg_option && !passes_target_args) {
        HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument,
                           fmt::format("unrecognised option '{}'", *unknown_arg_option));
    }

    auto optional_string = [&vm](const char* key) -> std::optional<std::string> {
        if (!vm.count(key)) {
            return std::nullopt;
        }
        return vm[key].as<std::string>();
    };
    result.workspace = optional_string("workspace");
    result.input = optional_string("input");
    result.target_dir = optional_string("target-dir");
    result.sanitize = optional_string("sanitize");
    result.debugger = optional_string("debugger");
    result.no_instr = vm.count("no-instr") > 0;
    result.coverage = vm.count("coverage") > 0;
    result.spawn = vm.count("spawn") > 0;

    if (!result.engine_args.empty() && result.command != Command::kRun) {
        HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument,
                           "engine arguments after `--` are only accepted by `run`");
    }
    return result;
}

Result<build::BuildProfile> profileFor(const CliOptions& options,
                                       const config::Settings& settings) {
    int selected = (options.sanitize ? 1 : 0) + (options.no_instr ? 1 : 0) +
                   (options.coverage ? 1 : 0);
    if (selected > 1) {
        HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument,
                           "--sanitize, --no-instr and --coverage are mutually exclusive");
    }

    build::BuildProfile profile;
    profile.target_triple = settings.target_triple;
    profile.extra_flags = settings.extra_flags;

    if (options.sanitize) {
        profile.mode = build::BuildMode::kFuzzingWithSanitizers;
        build::SanitizerSet set;
        HONGG_ASSIGN_OR_RETURN(set, build::SanitizerSet::parse(*options.sanitize));
        profile.sanitizers = set;
    } else if (options.no_instr) {
        profile.mode = build::BuildMode::kFuzzingNoInstrumentation;
    } else if (options.coverage) {
        profile.mode = build::BuildMode::kCoverageProfile;
    } else {
        profile.mode = build::BuildMode::kFuzzing;
    }
    return profile;
}

// =============================================================================
// Dispatch
// =============================================================================

int runCommand(const CliOptions& options, process::ProcessRunner& runner,
               const config::EnvLookup& env, const std::filesystem::path& cwd) {
    switch (options.command) {
    case Command::kHelp:
        fmt::print("{}", usage());
        return 0;
    case Command::kVersion:
        fmt::print("hongg {}\n", Version::string());
        return 0;
    case Command::kInfo:
        return cmdInfo(runner, options, env, cwd);
    default:
        break;
    }

    auto session = openSession(options, env, cwd);
    if (!session) {
        return fail(session.error());
    }

    switch (options.command) {
    case Command::kBuild:
        return cmdBuild(options, runner, *session);
    case Command::kRun:
        return cmdRun(options, runner, *session);
    case Command::kDebug:
        return cmdDebug(options, runner, *session);
    case Command::kClean:
        return cmdClean(runner, *session);
    default:
        return fail(Error(ErrorCode::kInternalError, "unhandled command"));
    }
}

}  // namespace cli
}  // namespace hongg
