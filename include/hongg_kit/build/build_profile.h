#pragma once

// =============================================================================
// Hongg Kit - Build Profiles
// =============================================================================

#include "hongg_kit/common.h"
#include "hongg_kit/error.h"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hongg {
namespace build {

// =============================================================================
// Build Mode
// =============================================================================

enum class BuildMode : uint8_t {
    kFuzzing = 0,                   // Optimized, coverage instrumented
    kFuzzingWithSanitizers = 1,     // kFuzzing plus sanitizers
    kDebugTriage = 2,               // -O0, full debug info, never instrumented
    kFuzzingNoInstrumentation = 3,  // Optimized, persistent loop, no coverage
    kCoverageProfile = 4,           // Source-based coverage report build
};

inline constexpr BuildMode kAllBuildModes[] = {
    BuildMode::kFuzzing,
    BuildMode::kFuzzingWithSanitizers,
    BuildMode::kDebugTriage,
    BuildMode::kFuzzingNoInstrumentation,
    BuildMode::kCoverageProfile,
};

std::string_view buildModeName(BuildMode mode);

// Directory name under <target_dir>/<triple>/ holding this mode's build tree
std::string_view buildModeDirName(BuildMode mode);

// CMAKE_BUILD_TYPE used for the mode
std::string_view cmakeBuildType(BuildMode mode);

// Modes whose binary is fed to the engine
[[nodiscard]] inline bool isFuzzingMode(BuildMode mode) {
    return mode == BuildMode::kFuzzing || mode == BuildMode::kFuzzingWithSanitizers ||
           mode == BuildMode::kFuzzingNoInstrumentation;
}

// Modes that emit coverage feedback for the engine
[[nodiscard]] inline bool isInstrumentedMode(BuildMode mode) {
    return mode == BuildMode::kFuzzing || mode == BuildMode::kFuzzingWithSanitizers;
}

// =============================================================================
// Sanitizers
// =============================================================================

enum class Sanitizer : uint8_t {
    kAddress = 1 << 0,
    kUndefined = 1 << 1,
    kLeak = 1 << 2,
    kThread = 1 << 3,
    kMemory = 1 << 4,
};

inline constexpr Sanitizer kAllSanitizers[] = {
    Sanitizer::kAddress, Sanitizer::kUndefined, Sanitizer::kLeak,
    Sanitizer::kThread,  Sanitizer::kMemory,
};

std::string_view sanitizerName(Sanitizer s);

// Small bitset over Sanitizer
class SanitizerSet {
  public:
    SanitizerSet() = default;
    SanitizerSet(std::initializer_list<Sanitizer> list) {
        for (auto s : list) {
            insert(s);
        }
    }

    void insert(Sanitizer s) { bits_ |= static_cast<uint8_t>(s); }
    [[nodiscard]] bool contains(Sanitizer s) const {
        return (bits_ & static_cast<uint8_t>(s)) != 0;
    }
    [[nodiscard]] bool empty() const { return bits_ == 0; }
    [[nodiscard]] uint8_t bits() const { return bits_; }

    // Comma separated, in declaration order: "address,undefined"
    [[nodiscard]] std::string toString() const;

    // Parse a comma separated list; unknown names are an error
    static Result<SanitizerSet> parse(std::string_view list);

    bool operator==(const SanitizerSet& other) const { return bits_ == other.bits_; }

  private:
    uint8_t bits_ = 0;
};

// =============================================================================
// BuildProfile
// =============================================================================

struct BuildProfile {
    BuildMode mode = BuildMode::kFuzzing;
    std::string target_triple{kHostTriple};
    std::vector<std::string> extra_flags;

    // Only meaningful for kFuzzingWithSanitizers; empty selects the default set
    SanitizerSet sanitizers;
};

}  // namespace build
}  // namespace hongg
