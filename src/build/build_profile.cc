// =============================================================================
// Hongg Kit - Build Profiles
// =============================================================================

#include "hongg_kit/build/build_profile.h"

#include <fmt/format.h>

namespace hongg {
namespace build {

std::string_view buildModeName(BuildMode mode) {
    switch (mode) {
    case BuildMode::kFuzzing:
        return "fuzzing";
    case BuildMode::kFuzzingWithSanitizers:
        return "fuzzing+sanitizers";
    case BuildMode::kDebugTriage:
        return "debug-triage";
    case BuildMode::kFuzzingNoInstrumentation:
        return "fuzzing-no-instr";
    case BuildMode::kCoverageProfile:
        return "coverage";
    }
    return "unknown";
}

std::string_view buildModeDirName(BuildMode mode) {
    switch (mode) {
    case BuildMode::kFuzzing:
        return "release";
    case BuildMode::kFuzzingWithSanitizers:
        return "release-sanitize";
    case BuildMode::kDebugTriage:
        return "debug";
    case BuildMode::kFuzzingNoInstrumentation:
        return "release-noinstr";
    case BuildMode::kCoverageProfile:
        return "coverage";
    }
    return "unknown";
}

std::string_view cmakeBuildType(BuildMode mode) {
    switch (mode) {
    case BuildMode::kFuzzing:
    case BuildMode::kFuzzingWithSanitizers:
    case BuildMode::kFuzzingNoInstrumentation:
        return "Release";
    case BuildMode::kDebugTriage:
    case BuildMode::kCoverageProfile:
        return "Debug";
    }
    return "Debug";
}

std::string_view sanitizerName(Sanitizer s) {
    switch (s) {
    case Sanitizer::kAddress:
        return "address";
    case Sanitizer::kUndefined:
        return "undefined";
    case Sanitizer::kLeak:
        return "leak";
    case Sanitizer::kThread:
        return "thread";
    case Sanitizer::kMemory:
        return "memory";
    }
    return "unknown";
}

std::string SanitizerSet::toString() const {
    std::string out;
    for (auto s : kAllSanitizers) {
        if (contains(s)) {
            if (!out.empty()) {
                out += ',';
            }
            out += sanitizerName(s);
        }
    }
    return out;
}

Result<SanitizerSet> SanitizerSet::parse(std::string_view list) {
    SanitizerSet set;
    size_t start = 0;
    while (start <= list.size()) {
        size_t end = list.find(',', start);
        if (end == std::string_view::npos) {
            end = list.size();
        }
        auto name = list.substr(start, end - start);
        if (!name.empty()) {
            bool found = false;
            for (auto s : kAllSanitizers) {
                if (sanitizerName(s) == name) {
                    set.insert(s);
                    found = true;
                    break;
                }
            }
            if (!found) {
                HONGG_RETURN_ERROR(ErrorCode::kInvalidArgument,
                                   fmt::format("unknown sanitizer '{}'", name));
            }
        }
        start = end + 1;
    }
    return set;
}

}  // namespace build
}  // namespace hongg
