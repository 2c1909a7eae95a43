// =============================================================================
// Hongg Kit - Process Runner Tests
// =============================================================================

#include "hongg_kit/process/process_runner.h"

#include "fake_process_runner.h"

#include <gtest/gtest.h>

#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <thread>

namespace hongg {
namespace process {
namespace {

TEST(PosixProcessRunnerTest, CapturesOutputAndExitCode) {
    PosixProcessRunner runner;
    auto result = runner.run(Command("/bin/sh").arg("-c").arg("echo hello; echo oops >&2; exit 3")
                                 .captured());
    ASSERT_TRUE(result) << result.error().toString();
    EXPECT_FALSE(result->status.success());
    EXPECT_EQ(result->status.code(), 3);
    EXPECT_NE(result->output.find("hello"), std::string::npos);
    EXPECT_NE(result->output.find("oops"), std::string::npos);
}

TEST(PosixProcessRunnerTest, EnvironmentAndWorkingDirectory) {
    test::TempDir tmp;
    PosixProcessRunner runner;
    auto cmd = Command("/bin/sh")
                   .arg("-c")
                   .arg("printf '%s:' \"$HONGG_MARKER\"; pwd")
                   .setEnv("HONGG_MARKER", "42")
                   .cwd(tmp.path())
                   .captured();
    auto result = runner.run(cmd);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->status.success());
    auto expected = "42:" + std::filesystem::canonical(tmp.path()).string();
    EXPECT_EQ(result->output.substr(0, expected.size()), expected);
}

TEST(PosixProcessRunnerTest, SignalDeath) {
    PosixProcessRunner runner;
    auto result = runner.run(Command("/bin/sh").arg("-c").arg("kill -SEGV $$"));
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->status.wasSignaled());
    EXPECT_EQ(result->status.signal(), SIGSEGV);
    EXPECT_EQ(result->status.code(), 128 + SIGSEGV);
}

TEST(PosixProcessRunnerTest, MissingProgramIsSpawnFailure) {
    PosixProcessRunner runner;
    auto result = runner.run(Command("/nonexistent/hongg-no-such-program"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::kProcessSpawnFailed);
}

// A terminal Ctrl-C reaches the whole foreground process group. The runner
// must outlive it and relay the child's own exit status.
TEST(PosixProcessRunnerTest, InterruptReachesChildNotRunner) {
    test::TempDir tmp;
    auto ready = tmp.path() / "ready";

    pid_t runner_pid = ::fork();
    ASSERT_GE(runner_pid, 0);
    if (runner_pid == 0) {
        ::setpgid(0, 0);
        PosixProcessRunner runner;
        auto result = runner.run(
            Command("/bin/sh")
                .arg("-c")
                .arg("trap 'exit 3' INT; : > \"$1\"; while :; do sleep 0.05; done")
                .arg("sh")
                .arg(ready.string()));
        ::_exit(result ? result->status.code() : 99);
    }
    ::setpgid(runner_pid, runner_pid);

    for (int i = 0; i < 200 && !std::filesystem::exists(ready); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(25));
    }
    ASSERT_TRUE(std::filesystem::exists(ready));
    ASSERT_EQ(::kill(-runner_pid, SIGINT), 0);

    int status = 0;
    ASSERT_EQ(::waitpid(runner_pid, &status, 0), runner_pid);
    ASSERT_TRUE(WIFEXITED(status)) << "runner was killed by signal " << WTERMSIG(status);
    EXPECT_EQ(WEXITSTATUS(status), 3);
}

TEST(PosixProcessRunnerTest, SignalDispositionRestoredAfterRun) {
    PosixProcessRunner runner;
    struct sigaction before = {};
    ASSERT_EQ(::sigaction(SIGINT, nullptr, &before), 0);

    auto result = runner.run(Command("/bin/sh").arg("-c").arg("exit 0"));
    ASSERT_TRUE(result);

    struct sigaction after = {};
    ASSERT_EQ(::sigaction(SIGINT, nullptr, &after), 0);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST(PosixProcessRunnerTest, FindProgram) {
    PosixProcessRunner runner;
    auto sh = runner.findProgram("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(isExecutableFile(*sh));
    EXPECT_FALSE(runner.findProgram("hongg-surely-not-installed").has_value());
    EXPECT_EQ(runner.findProgram("/bin/sh"), std::optional<std::filesystem::path>("/bin/sh"));
}

TEST(ExitStatusTest, Rendering) {
    EXPECT_EQ(ExitStatus::exited(0).toString(), "exit code 0");
    EXPECT_NE(ExitStatus::signaled(SIGABRT).toString().find("signal 6"), std::string::npos);
    EXPECT_TRUE(ExitStatus::exited(0).success());
    EXPECT_FALSE(ExitStatus::signaled(SIGABRT).success());
}

TEST(CommandTest, DisplayQuotesArguments) {
    auto cmd = Command("cmake").arg("-DCMAKE_CXX_FLAGS=-O3 -g0").arg("plain");
    auto text = cmd.display();
    EXPECT_EQ(text.rfind("cmake ", 0), 0u);
    EXPECT_NE(text.find("plain"), std::string::npos);
    EXPECT_NE(text.find("'-DCMAKE_CXX_FLAGS=-O3 -g0'"), std::string::npos);
}

}  // namespace
}  // namespace process
}  // namespace hongg
