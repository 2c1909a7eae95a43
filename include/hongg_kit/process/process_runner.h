#pragma once

// =============================================================================
// Hongg Kit - External Process Collaborator
// =============================================================================
//
// Every external program the toolchain drives (cmake, make, the compiler
// version check, the fuzzing engine, a debugger) goes through ProcessRunner, so
// the build and launch logic can be exercised with a scripted fake.
//

#include "hongg_kit/error.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hongg {
namespace process {

// =============================================================================
// Command
// =============================================================================

struct Command {
    std::string program;
    std::vector<std::string> args;

    // Variables set on top of the inherited environment
    std::map<std::string, std::string> env;

    std::optional<std::filesystem::path> working_dir;

    // Capture stdout+stderr instead of inheriting the terminal
    bool capture_output = false;

    Command() = default;
    explicit Command(std::string prog) : program(std::move(prog)) {}

    Command& arg(std::string value) {
        args.push_back(std::move(value));
        return *this;
    }
    Command& addArgs(const std::vector<std::string>& values) {
        args.insert(args.end(), values.begin(), values.end());
        return *this;
    }
    Command& setEnv(std::string name, std::string value) {
        env[std::move(name)] = std::move(value);
        return *this;
    }
    Command& cwd(std::filesystem::path dir) {
        working_dir = std::move(dir);
        return *this;
    }
    Command& captured() {
        capture_output = true;
        return *this;
    }

    // Shell-like rendering for log messages
    [[nodiscard]] std::string display() const;
};

// =============================================================================
// Exit Status
// =============================================================================

class ExitStatus {
  public:
    enum class Kind : uint8_t { kExited, kSignaled };

    static ExitStatus exited(int code) { return ExitStatus(Kind::kExited, code); }
    static ExitStatus signaled(int signo) { return ExitStatus(Kind::kSignaled, signo); }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool success() const { return kind_ == Kind::kExited && value_ == 0; }
    [[nodiscard]] bool wasSignaled() const { return kind_ == Kind::kSignaled; }

    // Exit code, or 128 + signal number for signal deaths (shell convention)
    [[nodiscard]] int code() const { return kind_ == Kind::kExited ? value_ : 128 + value_; }
    [[nodiscard]] int signal() const { return kind_ == Kind::kSignaled ? value_ : 0; }

    [[nodiscard]] std::string toString() const;

    bool operator==(const ExitStatus& other) const {
        return kind_ == other.kind_ && value_ == other.value_;
    }

  private:
    ExitStatus(Kind kind, int value) : kind_(kind), value_(value) {}

    Kind kind_;
    int value_;
};

struct ProcessResult {
    ExitStatus status = ExitStatus::exited(0);
    std::string output;  // Empty unless Command::capture_output was set
};

// =============================================================================
// ProcessRunner Interface
// =============================================================================

class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    // Run to completion. Fails only if the program could not be started.
    virtual Result<ProcessResult> run(const Command& command) = 0;

    // Replace the current process image. Returns only on failure.
    virtual Error exec(const Command& command) = 0;

    // Resolve a program name against PATH (like `which`)
    [[nodiscard]] virtual std::optional<std::filesystem::path> findProgram(
        std::string_view name) const = 0;
};

// =============================================================================
// PosixProcessRunner - fork/execvp based implementation
// =============================================================================

class PosixProcessRunner final : public ProcessRunner {
  public:
    Result<ProcessResult> run(const Command& command) override;
    Error exec(const Command& command) override;
    [[nodiscard]] std::optional<std::filesystem::path> findProgram(
        std::string_view name) const override;
};

// True if `path` is a regular file with an execute permission bit set
[[nodiscard]] bool isExecutableFile(const std::filesystem::path& path);

}  // namespace process
}  // namespace hongg
