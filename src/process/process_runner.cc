// =============================================================================
// Hongg Kit - POSIX Process Runner
// =============================================================================

#include "hongg_kit/process/process_runner.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

extern char** environ;

namespace hongg {
namespace process {

namespace {

// Quote an argument only when it needs it for display
std::string quoteForDisplay(const std::string& s) {
    if (!s.empty() && s.find_first_of(" \t\"'$\\") == std::string::npos) {
        return s;
    }
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::vector<char*> makeArgv(const Command& command) {
    std::vector<char*> argv;
    argv.reserve(command.args.size() + 2);
    argv.push_back(const_cast<char*>(command.program.c_str()));
    for (const auto& a : command.args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

// Inherited environment with the command's overrides applied, as NAME=VALUE
std::vector<std::string> buildEnvironment(const Command& command) {
    std::vector<std::string> entries;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto name = entry.substr(0, entry.find('='));
        if (command.env.find(std::string(name)) == command.env.end()) {
            entries.emplace_back(entry);
        }
    }
    for (const auto& [name, value] : command.env) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

std::vector<char*> makeEnvp(std::vector<std::string>& entries) {
    std::vector<char*> envp;
    envp.reserve(entries.size() + 1);
    for (auto& e : entries) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);
    return envp;
}

// PATH lookup up front so the exec itself can use execve
std::string resolveProgram(const ProcessRunner& runner, const std::string& program) {
    if (program.find('/') != std::string::npos) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(program, ec);
        return ec ? program : absolute.string();
    }
    auto found = runner.findProgram(program);
    return found ? found->string() : program;
}

// pipe2() is Linux-only; set close-on-exec on both ends by hand
int cloexecPipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        return -1;
    }
    for (int i = 0; i < 2; ++i) {
        if (::fcntl(fds[i], F_SETFD, FD_CLOEXEC) != 0) {
            int err = errno;
            ::close(fds[0]);
            ::close(fds[1]);
            errno = err;
            return -1;
        }
    }
    return 0;
}

// While a child runs in the foreground the terminal delivers SIGINT and
// SIGQUIT to both processes. The parent ignores them (and SIGTERM) until the
// child is reaped so the child's own exit status is what gets relayed.
class ForegroundSignalGuard {
  public:
    ForegroundSignalGuard() {
        struct sigaction ignore = {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        for (size_t i = 0; i < kCount; ++i) {
            installed_[i] = ::sigaction(kSignals[i], &ignore, &saved_[i]) == 0;
        }
    }

    ~ForegroundSignalGuard() { restore(); }

    ForegroundSignalGuard(const ForegroundSignalGuard&) = delete;
    ForegroundSignalGuard& operator=(const ForegroundSignalGuard&) = delete;

    // Async-signal-safe. Called in the child before execve since ignored
    // dispositions survive the exec.
    void restore() {
        for (size_t i = 0; i < kCount; ++i) {
            if (installed_[i]) {
                ::sigaction(kSignals[i], &saved_[i], nullptr);
                installed_[i] = false;
            }
        }
    }

  private:
    static constexpr int kSignals[] = {SIGINT, SIGQUIT, SIGTERM};
    static constexpr size_t kCount = sizeof(kSignals) / sizeof(kSignals[0]);

    struct sigaction saved_[kCount] = {};
    bool installed_[kCount] = {};
};

ExitStatus decodeWaitStatus(int status) {
    if (WIFSIGNALED(status)) {
        return ExitStatus::signaled(WTERMSIG(status));
    }
    return ExitStatus::exited(WIFEXITED(status) ? WEXITSTATUS(status) : 1);
}

}  // namespace

// =============================================================================
// Command / ExitStatus
// =============================================================================

std::string Command::display() const {
    std::ostringstream ss;
    for (const auto& [name, value] : env) {
        ss << name << "=" << quoteForDisplay(value) << " ";
    }
    ss << quoteForDisplay(program);
    for (const auto& a : args) {
        ss << " " << quoteForDisplay(a);
    }
    return ss.str();
}

std::string ExitStatus::toString() const {
    if (kind_ == Kind::kSignaled) {
        return fmt::format("killed by signal {} ({})", value_, ::strsignal(value_));
    }
    return fmt::format("exit code {}", value_);
}

// =============================================================================
// PosixProcessRunner
// =============================================================================

Result<ProcessResult> PosixProcessRunner::run(const Command& command) {
    spdlog::debug("Running: {}", command.display());

    int out_pipe[2] = {-1, -1};
    if (command.capture_output && cloexecPipe(out_pipe) != 0) {
        HONGG_RETURN_ERROR(ErrorCode::kProcessSpawnFailed,
                           fmt::format("pipe() failed: {}", std::strerror(errno)));
    }

    // Reports {stage, errno} of a failed chdir or exec in the child; closed by a
    // successful exec
    int err_pipe[2];
    if (cloexecPipe(err_pipe) != 0) {
        int err = errno;
        if (command.capture_output) {
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
        }
        HONGG_RETURN_ERROR(ErrorCode::kProcessSpawnFailed,
                           fmt::format("pipe() failed: {}", std::strerror(err)));
    }

    auto argv = makeArgv(command);
    auto env_entries = buildEnvironment(command);
    auto envp = makeEnvp(env_entries);
    auto program = resolveProgram(*this, command.program);

    ForegroundSignalGuard signal_guard;
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        if (command.capture_output) {
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
        }
        HONGG_RETURN_ERROR(ErrorCode::kProcessSpawnFailed,
                           fmt::format("fork() failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        signal_guard.restore();
        ::close(err_pipe[0]);
        if (command.capture_output) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(out_pipe[1], STDERR_FILENO);
        }
        if (command.working_dir && ::chdir(command.working_dir->c_str()) != 0) {
            int report[2] = {kStageChdir, errno};
            (void)!::write(err_pipe[1], report, sizeof(report));
            ::_exit(127);
        }
        ::execve(program.c_str(), argv.data(), envp.data());
        int report[2] = {kStageExec, errno};
        (void)!::write(err_pipe[1], report, sizeof(report));
        ::_exit(127);
    }

    ::close(err_pipe[1]);

    ProcessResult result;
    if (command.capture_output) {
        ::close(out_pipe[1]);
        char buf[4096];
        for (;;) {
            ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                break;
            }
        }
        ::close(out_pipe[0]);
    }

    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(err_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            HONGG_RETURN_ERROR(ErrorCode::kProcessSpawnFailed,
                               fmt::format("waitpid() failed: {}", std::strerror(errno)));
        }
    }

    if (n == static_cast<ssize_t>(sizeof(report))) {
        if (report[0] == kStageChdir) {
            HONGG_RETURN_ERROR(ErrorCode::kProcessSpawnFailed,
                               fmt::format("cannot change to '{}': {}",
                                           command.working_dir->string(),
                                           std::strerror(report[1])));
        }
        HONGG_RETURN_ERROR(ErrorCode::kProcessSpawnFailed,
                           fmt::format("cannot execute '{}': {}", command.program,
                                       std::strerror(report[1])));
    }

    result.status = decodeWaitStatus(status);
    spdlog::debug("'{}' finished: {}", command.program, result.status.toString());
    return result;
}

Error PosixProcessRunner::exec(const Command& command) {
    spdlog::debug("Exec: {}", command.display());

    auto program = resolveProgram(*this, command.program);
    if (!isExecutableFile(program)) {
        return Error::make(ErrorCode::kLaunchError,
                           fmt::format("cannot execute '{}': not an executable file",
                                       command.program));
    }

    auto argv = makeArgv(command);
    auto env_entries = buildEnvironment(command);
    auto envp = makeEnvp(env_entries);

    // The working directory is the only state changed in this process before
    // execve; it is restored if the exec fails
    std::optional<std::filesystem::path> previous_dir;
    if (command.working_dir) {
        std::error_code ec;
        previous_dir = std::filesystem::current_path(ec);
        if (ec) {
            return Error::make(ErrorCode::kLaunchError,
                               fmt::format("cannot determine the working directory: {}",
                                           ec.message()));
        }
        if (::chdir(command.working_dir->c_str()) != 0) {
            return Error::make(ErrorCode::kLaunchError,
                               fmt::format("cannot change to '{}': {}",
                                           command.working_dir->string(), std::strerror(errno)));
        }
    }

    spdlog::default_logger()->flush();
    ::execve(program.c_str(), argv.data(), envp.data());

    // Only reached on failure
    int err = errno;
    if (previous_dir && ::chdir(previous_dir->c_str()) != 0) {
        spdlog::warn("Could not return to '{}': {}", previous_dir->string(), std::strerror(errno));
    }
    return Error::make(ErrorCode::kLaunchError,
                       fmt::format("cannot execute '{}': {}", command.program, std::strerror(err)));
}

std::optional<std::filesystem::path> PosixProcessRunner::findProgram(std::string_view name) const {
    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path p(name);
        if (isExecutableFile(p)) {
            return p;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string_view path_list(path_env);
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string_view::npos) {
            end = path_list.size();
        }
        std::string_view dir = path_list.substr(start, end - start);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path(dir) / name;
            if (isExecutableFile(candidate)) {
                return candidate;
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

bool isExecutableFile(const std::filesystem::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

}  // namespace process
}  // namespace hongg
