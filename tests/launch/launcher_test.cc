// =============================================================================
// Hongg Kit - Launch Orchestrator Tests
// =============================================================================

#include "hongg_kit/launch/launcher.h"

#include "fake_process_runner.h"

#include <gtest/gtest.h>

#include <csignal>

namespace hongg {
namespace launch {
namespace {

class LauncherTest : public ::testing::Test {
  protected:
    void SetUp() override {
        engine_ = tmp_.path() / "engine" / "honggfuzz";
        target_ = tmp_.path() / "build" / "parser_fuzz";
        test::writeExecutable(engine_);
        test::writeExecutable(target_);

        settings_ = config::Settings::fromEnvironment(config::mapEnvironment({}));
        settings_.workspace = tmp_.path() / "hfuzz_workspace";
    }

    test::TempDir tmp_;
    std::filesystem::path engine_;
    std::filesystem::path target_;
    config::Settings settings_;
    test::FakeProcessRunner runner_;
};

TEST_F(LauncherTest, PrepareCreatesWorkspace) {
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, target_, "parser_fuzz", {}, {});
    ASSERT_TRUE(inv) << inv.error().toString();

    auto root = settings_.workspace / "parser_fuzz";
    EXPECT_EQ(inv->workspace.root, root);
    EXPECT_TRUE(std::filesystem::is_directory(root / "inputs"));
    EXPECT_TRUE(std::filesystem::is_directory(root / "corpus"));
    EXPECT_TRUE(std::filesystem::is_directory(root / "crashes"));
}

TEST_F(LauncherTest, CommandLineLayout) {
    settings_.run_args = {"-t", "10"};
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, target_, "parser_fuzz", {"--threads", "4"}, {"--strict"});
    ASSERT_TRUE(inv);

    auto cmd = inv->toCommand();
    auto root = settings_.workspace / "parser_fuzz";
    EXPECT_EQ(cmd.program, engine_.string());
    EXPECT_EQ(cmd.args, (std::vector<std::string>{
                            "-W", root.string(), "-f", (root / "inputs").string(), "--output",
                            (root / "corpus").string(), "--crashdir", (root / "crashes").string(),
                            "-P", "-t", "10", "--threads", "4", "--", target_.string(),
                            "--strict"}));
}

TEST_F(LauncherTest, InputOverride) {
    settings_.input = tmp_.path() / "seeds";
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, target_, "t", {}, {});
    ASSERT_TRUE(inv);
    EXPECT_EQ(inv->workspace.inputs, tmp_.path() / "seeds");
    EXPECT_TRUE(std::filesystem::is_directory(tmp_.path() / "seeds"));
}

TEST_F(LauncherTest, EnvironmentPrefixesUserOptions) {
    settings_.asan_options = "detect_leaks=0";
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, target_, "t", {}, {});
    ASSERT_TRUE(inv);

    const auto& env = inv->env_overrides;
    EXPECT_EQ(env.at("HONGG_FUZZING_ACTIVE"), "1");
    EXPECT_EQ(env.at("HONGG_WORKSPACE"), (settings_.workspace / "t").string());
    EXPECT_EQ(env.at("ASAN_OPTIONS"), "detect_odr_violation=0:abort_on_error=1:detect_leaks=0");
    EXPECT_EQ(env.at("TSAN_OPTIONS"), "report_signal_unsafe=0");
    EXPECT_EQ(env.at("UBSAN_OPTIONS"), "halt_on_error=1:abort_on_error=1");
}

TEST_F(LauncherTest, WorkspaceIsNeverDestructive) {
    auto root = settings_.workspace / "t";
    test::writeFile(root / "corpus" / "interesting", "abc");
    test::writeFile(root / "crashes" / "SIGSEGV.crash", "\xff");
    test::writeFile(root / "inputs" / "seed", "seed");

    Launcher launcher(runner_, settings_);
    ASSERT_TRUE(launcher.prepare(engine_, target_, "t", {}, {}));
    ASSERT_TRUE(launcher.prepare(engine_, target_, "t", {}, {}));

    EXPECT_EQ(test::readFile(root / "corpus" / "interesting"), "abc");
    EXPECT_EQ(test::readFile(root / "crashes" / "SIGSEGV.crash"), "\xff");
    EXPECT_EQ(test::readFile(root / "inputs" / "seed"), "seed");
}

TEST_F(LauncherTest, MissingEngine) {
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(tmp_.path() / "missing", target_, "t", {}, {});
    ASSERT_FALSE(inv);
    EXPECT_EQ(inv.error().code(), ErrorCode::kEngineNotFound);
    EXPECT_EQ(exitCodeFor(inv.error().code()), ExitCode::kLaunchFailure);
}

TEST_F(LauncherTest, TargetMustBeExecutable) {
    auto plain = tmp_.path() / "plain";
    test::writeFile(plain, "data");
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, plain, "t", {}, {});
    ASSERT_FALSE(inv);
    EXPECT_EQ(inv.error().code(), ErrorCode::kTargetNotExecutable);
    EXPECT_FALSE(std::filesystem::exists(settings_.workspace));
}

TEST_F(LauncherTest, WorkspaceBlockedByFile) {
    test::writeFile(settings_.workspace, "not a directory");
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, target_, "t", {}, {});
    ASSERT_FALSE(inv);
    EXPECT_EQ(inv.error().code(), ErrorCode::kWorkspaceError);
}

TEST_F(LauncherTest, SpawnRelaysExitStatus) {
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, target_, "t", {}, {});
    ASSERT_TRUE(inv);

    auto ok = launcher.launch(*inv, LaunchStyle::kSpawn);
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, 0);
    ASSERT_EQ(runner_.commands().size(), 1u);
    EXPECT_EQ(runner_.commands()[0].env.at("HONGG_FUZZING_ACTIVE"), "1");

    runner_.setHandler([](const process::Command&) -> Result<process::ProcessResult> {
        process::ProcessResult r;
        r.status = process::ExitStatus::exited(3);
        return r;
    });
    auto failed = launcher.launch(*inv, LaunchStyle::kSpawn);
    ASSERT_TRUE(failed);
    EXPECT_EQ(*failed, 3);

    runner_.setHandler([](const process::Command&) -> Result<process::ProcessResult> {
        process::ProcessResult r;
        r.status = process::ExitStatus::signaled(SIGKILL);
        return r;
    });
    auto killed = launcher.launch(*inv, LaunchStyle::kSpawn);
    ASSERT_FALSE(killed);
    EXPECT_EQ(killed.error().code(), ErrorCode::kEngineAbnormalExit);
}

TEST_F(LauncherTest, ExecFailureIsLaunchError) {
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepare(engine_, target_, "t", {}, {});
    ASSERT_TRUE(inv);
    auto result = launcher.launch(*inv, LaunchStyle::kExec);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::kLaunchError);
    EXPECT_EQ(runner_.execCommands().size(), 1u);
}

// =============================================================================
// Debug replay
// =============================================================================

TEST_F(LauncherTest, DebugWithoutDebuggerRunsTargetDirectly) {
    auto crash = tmp_.path() / "crash.bin";
    test::writeFile(crash, "\xff");
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepareDebug(target_, crash, {"-x"});
    ASSERT_TRUE(inv) << inv.error().toString();

    auto cmd = inv->toCommand();
    EXPECT_EQ(cmd.program, target_.string());
    EXPECT_EQ(cmd.args, (std::vector<std::string>{crash.string(), "-x"}));
    EXPECT_EQ(cmd.env.at("HONGG_CRASH_FILENAME"), crash.string());
}

TEST_F(LauncherTest, DebugWrapsLldb) {
    auto crash = tmp_.path() / "crash.bin";
    test::writeFile(crash, "x");
    settings_.debugger = "/usr/bin/lldb-15";
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepareDebug(target_, crash, {});
    ASSERT_TRUE(inv);

    auto cmd = inv->toCommand();
    EXPECT_EQ(cmd.program, "/usr/bin/lldb-15");
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"-o", "b __cxa_throw", "-o", "r", "-o", "bt",
                                                  "-f", target_.string(), "--", crash.string()}));
}

TEST_F(LauncherTest, DebugWrapsGdb) {
    auto crash = tmp_.path() / "crash.bin";
    test::writeFile(crash, "x");
    settings_.debugger = "gdb";
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepareDebug(target_, crash, {"arg"});
    ASSERT_TRUE(inv);

    auto cmd = inv->toCommand();
    EXPECT_EQ(cmd.program, "gdb");
    EXPECT_EQ(cmd.args,
              (std::vector<std::string>{"-ex", "b __cxa_throw", "-ex", "r", "-ex", "bt", "--args",
                                        target_.string(), crash.string(), "arg"}));
}

TEST_F(LauncherTest, DebugNeedsCrashFile) {
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepareDebug(target_, tmp_.path() / "nope", {});
    ASSERT_FALSE(inv);
    EXPECT_EQ(inv.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(LauncherTest, ReplayClassification) {
    auto crash = tmp_.path() / "crash.bin";
    test::writeFile(crash, "x");
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepareDebug(target_, crash, {});
    ASSERT_TRUE(inv);

    auto clean = launcher.runDebug(*inv);
    ASSERT_TRUE(clean);
    ASSERT_TRUE(clean->outcome.has_value());
    EXPECT_EQ(*clean->outcome, runtime::IterationOutcome{runtime::Completed{}});

    runner_.setHandler([](const process::Command&) -> Result<process::ProcessResult> {
        process::ProcessResult r;
        r.status = process::ExitStatus::signaled(SIGABRT);
        return r;
    });
    auto crashed = launcher.runDebug(*inv);
    ASSERT_TRUE(crashed);
    ASSERT_TRUE(crashed->outcome.has_value());
    EXPECT_TRUE(runtime::isCrash(*crashed->outcome));
    EXPECT_EQ(crashed->status, process::ExitStatus::signaled(SIGABRT));
}

TEST_F(LauncherTest, DebuggerExitStatusIsNotAVerdict) {
    auto crash = tmp_.path() / "crash.bin";
    test::writeFile(crash, "x");
    settings_.debugger = "gdb";
    Launcher launcher(runner_, settings_);
    auto inv = launcher.prepareDebug(target_, crash, {});
    ASSERT_TRUE(inv);

    // gdb exits 0 after the inferior aborted
    auto report = launcher.runDebug(*inv);
    ASSERT_TRUE(report) << report.error().toString();
    EXPECT_TRUE(report->status.success());
    EXPECT_FALSE(report->outcome.has_value());

    ASSERT_EQ(runner_.commands().size(), 1u);
    EXPECT_EQ(runner_.commands()[0].program, "gdb");
}

TEST(ClassifyReplayTest, ExitStatusMapping) {
    EXPECT_FALSE(runtime::isCrash(classifyReplay(process::ExitStatus::exited(0))));
    EXPECT_TRUE(runtime::isCrash(classifyReplay(process::ExitStatus::exited(1))));
    EXPECT_TRUE(runtime::isCrash(classifyReplay(process::ExitStatus::signaled(SIGSEGV))));
}

}  // namespace
}  // namespace launch
}  // namespace hongg
