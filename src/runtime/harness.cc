// =============================================================================
// Hongg Kit - Harness Runtime Implementation
// =============================================================================

#include "hongg_kit/runtime/harness.h"

#include "hongg_kit/logging.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>

// Scanned for by honggfuzz to switch the engine into persistent mode. Build
// profiles pass -Wl,--undefined=HonggKitPersistentSignature so the linker
// keeps it even when nothing references it.
extern "C" HONGG_USED HONGG_EXPORT const char HonggKitPersistentSignature[] =
    "\x01_LIBHFUZZ_PERSISTENT_BINARY_SIGNATURE_\x02\xFF";

namespace hongg {
namespace runtime {

namespace {

constexpr std::string_view kNotFuzzingHint =
    "This binary was built for fuzzing but was not started by honggfuzz.\n"
    "Fuzz it with `hongg run <target>`, or pass a crash file to replay it:\n"
    "    <binary> <crash-file>\n";

Result<std::vector<uint8_t>> readWholeFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        HONGG_RETURN_ERROR(ErrorCode::kIoError,
                           fmt::format("cannot open crash file '{}'", path.string()));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        HONGG_RETURN_ERROR(ErrorCode::kIoError,
                           fmt::format("cannot read crash file '{}'", path.string()));
    }
    return data;
}

}  // namespace

FuzzTarget adaptLibFuzzer(LibFuzzerEntry entry) {
    return [entry](std::span<const uint8_t> data) {
        int rc = entry(data.data(), data.size());
        // -1 asks libFuzzer not to keep the input; honggfuzz has no equivalent
        if (rc != 0) {
            spdlog::trace("Entry point returned {}", rc);
        }
    };
}

// =============================================================================
// HarnessConfig
// =============================================================================

HarnessConfig HarnessConfig::fromEnvironment(int argc, char** argv,
                                             const config::EnvLookup& env,
                                             bool engine_attached) {
    HarnessConfig cfg;

    auto active = env(config::kEnvFuzzingActive);
    if (active && *active == "1" && engine_attached) {
        cfg.mode = Mode::kPersistent;
        return cfg;
    }

    auto crash = env(config::kEnvCrashFilename);
    if (crash && !crash->empty()) {
        cfg.mode = Mode::kSingleRun;
        cfg.crash_file = std::filesystem::path(*crash);
        return cfg;
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (!arg.empty() && arg.front() != '-') {
            cfg.mode = Mode::kSingleRun;
            cfg.crash_file = std::filesystem::path(arg);
            return cfg;
        }
    }

    cfg.mode = Mode::kUnavailable;
    return cfg;
}

HarnessConfig HarnessConfig::fromEnvironment(int argc, char** argv) {
    bool attached = engineRuntimeLinked() && channelAvailable(kControlFd);
    return fromEnvironment(argc, argv, config::processEnvironment(), attached);
}

std::string_view harnessModeName(HarnessConfig::Mode mode) {
    switch (mode) {
    case HarnessConfig::Mode::kPersistent:
        return "persistent";
    case HarnessConfig::Mode::kSingleRun:
        return "single-run";
    case HarnessConfig::Mode::kUnavailable:
        return "unavailable";
    }
    return "unknown";
}

// =============================================================================
// Harness
// =============================================================================

Harness::Harness(HarnessConfig config) : config_(std::move(config)) {
    if (config_.mode == HarnessConfig::Mode::kPersistent) {
        channel_ = std::make_unique<HonggfuzzChannel>(engineFetchFunction(),
                                                      config_.max_input_size);
    }
}

Harness::Harness(HarnessConfig config, std::unique_ptr<EngineChannel> channel)
    : config_(std::move(config)), channel_(std::move(channel)) {}

int Harness::run(const FuzzTarget& target) {
    spdlog::debug("Harness mode: {}", harnessModeName(config_.mode));

    switch (config_.mode) {
    case HarnessConfig::Mode::kPersistent:
        return runPersistent(target);
    case HarnessConfig::Mode::kSingleRun:
        return runSingle(target);
    case HarnessConfig::Mode::kUnavailable:
        break;
    }

    std::fputs(kNotFuzzingHint.data(), stderr);
    return kNotFuzzingExitCode;
}

IterationOutcome Harness::runOnce(const FuzzTarget& target, std::span<const uint8_t> data) {
    ++stats_.iterations;
    stats_.bytes_processed += data.size();

    try {
        target(data);
    } catch (const std::exception& e) {
        return CrashDetected{fmt::format("uncaught exception: {}", e.what())};
    } catch (...) {
        return CrashDetected{"uncaught exception of unknown type"};
    }
    return Completed{};
}

Result<IterationOutcome> Harness::runIteration(const FuzzTarget& target) {
    if (!channel_) {
        HONGG_RETURN_ERROR(ErrorCode::kInternalError, "persistent iteration without a channel");
    }

    auto event = channel_->awaitInput(buffer_);
    if (!event) {
        return event.error();
    }
    if (*event == ChannelEvent::kStop) {
        return IterationOutcome{EngineRequestedStop{}};
    }

    IterationOutcome outcome = runOnce(target, buffer_);
    if (isCrash(outcome)) {
        return outcome;
    }

    HONGG_TRY(channel_->reportCompleted());
    return outcome;
}

int Harness::runPersistent(const FuzzTarget& target) {
    while (true) {
        auto outcome = runIteration(target);
        if (!outcome) {
            spdlog::error("Fuzzing session ended: {}", outcome.error().toString());
            break;
        }
        if (std::holds_alternative<EngineRequestedStop>(*outcome)) {
            break;
        }
        if (const auto* crash = std::get_if<CrashDetected>(&*outcome)) {
            reportCrash(*crash);
        }
    }

    spdlog::debug("Harness stats: {} iterations, {} bytes, {} skipped", stats_.iterations,
                  stats_.bytes_processed, stats_.skipped);
    return 0;
}

int Harness::runSingle(const FuzzTarget& target) {
    auto data = readWholeFile(*config_.crash_file);
    if (!data) {
        spdlog::error("{}", data.error().message());
        flushLogs();
        return 1;
    }

    spdlog::info("Replaying {} ({} bytes)", config_.crash_file->string(), data->size());
    auto outcome = runOnce(target, *data);
    if (const auto* crash = std::get_if<CrashDetected>(&outcome)) {
        reportCrash(*crash);
    }
    return 0;
}

void Harness::reportCrash(const CrashDetected& crash) const {
    spdlog::critical("Crash in iteration {}: {}", stats_.iterations, crash.reason);
    flushLogs();
    std::abort();
}

// =============================================================================
// Process setup
// =============================================================================

void installTerminateHandler() {
    std::set_terminate([] {
        spdlog::critical("std::terminate called");
        flushLogs();
        std::abort();
    });
}

void prepareRuntime() {
    auto level = spdlog::level::warn;
    if (auto name = config::processEnvironment()(config::kEnvLogLevel)) {
        if (auto parsed = parseLogLevel(*name)) {
            level = *parsed;
        }
    }
    initLogging(level);
    installTerminateHandler();
}

int fuzzMain(int argc, char** argv, const FuzzTarget& target) {
    prepareRuntime();
    Harness harness(HarnessConfig::fromEnvironment(argc, argv));
    return harness.run(target);
}

}  // namespace runtime
}  // namespace hongg
