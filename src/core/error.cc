// =============================================================================
// Hongg Kit - Error Handling Implementation
// =============================================================================

#include "hongg_kit/error.h"

#include "hongg_kit/common.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>

namespace hongg {

// =============================================================================
// Assert Failure
// =============================================================================

[[noreturn]] void assertFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Assertion failed: {} at {}:{}", cond, file, line);
    spdlog::default_logger()->flush();
    std::fflush(stderr);
    std::abort();
}

// =============================================================================
// Error Code to String
// =============================================================================

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk:
        return "OK";

    // Configuration errors
    case ErrorCode::kConfigurationError:
        return "ConfigurationError";
    case ErrorCode::kIncompatibleSanitizers:
        return "IncompatibleSanitizers";
    case ErrorCode::kUnsupportedToolchain:
        return "UnsupportedToolchain";
    case ErrorCode::kInvalidArgument:
        return "InvalidArgument";
    case ErrorCode::kProjectNotFound:
        return "ProjectNotFound";

    // Target build errors
    case ErrorCode::kBuildError:
        return "BuildError";
    case ErrorCode::kMissingArtifact:
        return "MissingArtifact";
    case ErrorCode::kAmbiguousArtifact:
        return "AmbiguousArtifact";

    // Engine build errors
    case ErrorCode::kEngineBuildError:
        return "EngineBuildError";

    // Launch errors
    case ErrorCode::kLaunchError:
        return "LaunchError";
    case ErrorCode::kEngineNotFound:
        return "EngineNotFound";
    case ErrorCode::kTargetNotExecutable:
        return "TargetNotExecutable";
    case ErrorCode::kWorkspaceError:
        return "WorkspaceError";
    case ErrorCode::kEngineAbnormalExit:
        return "EngineAbnormalExit";

    // Runtime errors
    case ErrorCode::kRuntimeCrash:
        return "RuntimeCrash";
    case ErrorCode::kProtocolViolation:
        return "ProtocolViolation";

    // System errors
    case ErrorCode::kIoError:
        return "IoError";
    case ErrorCode::kProcessSpawnFailed:
        return "ProcessSpawnFailed";

    // Internal errors
    case ErrorCode::kInternalError:
        return "InternalError";
    case ErrorCode::kNotImplemented:
        return "NotImplemented";

    default:
        return "UnknownError";
    }
}

// =============================================================================
// Exit Code Mapping
// =============================================================================

ExitCode exitCodeFor(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk:
        return ExitCode::kSuccess;

    case ErrorCode::kBuildError:
        return ExitCode::kBuildFailure;

    case ErrorCode::kMissingArtifact:
    case ErrorCode::kAmbiguousArtifact:
        return ExitCode::kMissingTarget;

    case ErrorCode::kEngineBuildError:
        return ExitCode::kEngineBuildFailure;

    case ErrorCode::kLaunchError:
    case ErrorCode::kEngineNotFound:
    case ErrorCode::kTargetNotExecutable:
    case ErrorCode::kWorkspaceError:
    case ErrorCode::kProcessSpawnFailed:
        return ExitCode::kLaunchFailure;

    case ErrorCode::kEngineAbnormalExit:
    case ErrorCode::kRuntimeCrash:
        return ExitCode::kAbnormalExit;

    default:
        return ExitCode::kUsage;
    }
}

// =============================================================================
// Error::toString
// =============================================================================

std::string Error::toString() const {
    if (isOk()) {
        return "OK";
    }

    auto code_str = errorCodeToString(code_);
    if (message_.empty()) {
        return std::string(code_str);
    }

    return fmt::format("{}: {}", code_str, message_);
}

}  // namespace hongg
