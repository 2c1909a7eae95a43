#pragma once

// =============================================================================
// Hongg Kit - Harness Runtime
// =============================================================================
//
// Linked into every fuzz target. The mode is decided once at startup:
//
//   Persistent   started by honggfuzz (HONGG_FUZZING_ACTIVE=1, fd 1023 open,
//                libhfuzz linked); loop over inputs fetched with HF_ITER
//   SingleRun    replay one file (HONGG_CRASH_FILENAME or first argument)
//   Unavailable  neither; print a hint and exit with kNotFuzzingExitCode
//
// Usage:
//   int main(int argc, char** argv) {
//       return hongg::runtime::fuzzMain(argc, argv, [](std::span<const uint8_t> data) {
//           parse(data);
//       });
//   }
//
// A C++ exception escaping the target is a crash: it is logged, the loggers
// are flushed and the process aborts so the engine records the input.
// Signals, sanitizer reports and timeouts are left to the engine.
//

#include "hongg_kit/common.h"
#include "hongg_kit/config/settings.h"
#include "hongg_kit/error.h"
#include "hongg_kit/runtime/channel.h"
#include "hongg_kit/runtime/input_reader.h"
#include "hongg_kit/runtime/outcome.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace hongg {
namespace runtime {

// Exit code of a binary started outside the engine without a crash file
inline constexpr int kNotFuzzingExitCode = 17;

// Bytes honggfuzz looks for to enable persistent mode
inline constexpr std::string_view kPersistentSignature =
    "\x01_LIBHFUZZ_PERSISTENT_BINARY_SIGNATURE_\x02\xFF";

using FuzzTarget = std::function<void(std::span<const uint8_t>)>;

// libFuzzer entry point: LLVMFuzzerTestOneInput-compatible
using LibFuzzerEntry = int (*)(const uint8_t*, size_t);

FuzzTarget adaptLibFuzzer(LibFuzzerEntry entry);

// =============================================================================
// HarnessConfig
// =============================================================================

struct HarnessConfig {
    enum class Mode : uint8_t { kPersistent, kSingleRun, kUnavailable };

    Mode mode = Mode::kUnavailable;
    std::optional<std::filesystem::path> crash_file;
    size_t max_input_size = kDefaultMaxInputSize;

    // Decide the mode from the environment and the command line.
    // `engine_attached`: libhfuzz is linked and fd 1023 is open.
    static HarnessConfig fromEnvironment(int argc, char** argv,
                                         const config::EnvLookup& env,
                                         bool engine_attached);
    static HarnessConfig fromEnvironment(int argc, char** argv);
};

std::string_view harnessModeName(HarnessConfig::Mode mode);

struct HarnessStats {
    uint64_t iterations = 0;
    uint64_t bytes_processed = 0;
    uint64_t skipped = 0;  // Typed inputs that did not convert
};

// =============================================================================
// Harness
// =============================================================================

class Harness : NonCopyable {
  public:
    // Persistent mode gets a HonggfuzzChannel over libhfuzz
    explicit Harness(HarnessConfig config);
    Harness(HarnessConfig config, std::unique_ptr<EngineChannel> channel);

    // Drive the target in the configured mode and return the exit code.
    // A crash never returns.
    int run(const FuzzTarget& target);

    // Same as run() for a target taking a structured value. Inputs that do
    // not convert count as completed iterations.
    template <typename T, typename Fn>
    int runTyped(Fn&& fn) {
        return run([this, &fn](std::span<const uint8_t> data) {
            auto value = arbitraryFrom<T>(data);
            if (!value) {
                ++stats_.skipped;
                return;
            }
            fn(std::move(*value));
        });
    }

    // Execute the target once, converting an escaping exception to
    // CrashDetected. Never aborts.
    IterationOutcome runOnce(const FuzzTarget& target, std::span<const uint8_t> data);

    // One persistent iteration: wait for input, execute, acknowledge
    Result<IterationOutcome> runIteration(const FuzzTarget& target);

    [[nodiscard]] const HarnessConfig& config() const { return config_; }
    [[nodiscard]] const HarnessStats& stats() const { return stats_; }

  private:
    int runPersistent(const FuzzTarget& target);
    int runSingle(const FuzzTarget& target);
    [[noreturn]] void reportCrash(const CrashDetected& crash) const;

    HarnessConfig config_;
    std::unique_ptr<EngineChannel> channel_;
    std::vector<uint8_t> buffer_;
    HarnessStats stats_;
};

// Flush logs before std::terminate aborts the process
void installTerminateHandler();

// Logging from HONGG_LOG_LEVEL plus the terminate handler
void prepareRuntime();

// prepareRuntime(), mode detection and the run loop in one call
int fuzzMain(int argc, char** argv, const FuzzTarget& target);

template <typename T, typename Fn>
int fuzzMainTyped(int argc, char** argv, Fn&& fn) {
    prepareRuntime();
    Harness harness(HarnessConfig::fromEnvironment(argc, argv));
    return harness.runTyped<T>(std::forward<Fn>(fn));
}

}  // namespace runtime
}  // namespace hongg
