#pragma once

// =============================================================================
// Hongg Kit - Instrumentation Flag Resolver
// =============================================================================
//
// Computes compiler and linker flags for a BuildProfile so that:
// - coverage feedback matches what honggfuzz reads (trace-pc-guard on Clang,
//   trace-pc on GCC),
// - the persistent-mode signature and harness entry points survive linking,
// - requested sanitizers never collide with each other or with the toolchain.
//
// Every incompatibility is reported as a configuration error here, before a
// single compiler process is started.
//

#include "hongg_kit/build/build_profile.h"
#include "hongg_kit/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hongg {

namespace process {
class ProcessRunner;
}  // namespace process

namespace build {

// =============================================================================
// Toolchain
// =============================================================================

enum class CompilerKind : uint8_t { kUnknown = 0, kClang, kGcc };

std::string_view compilerKindName(CompilerKind kind);

struct Toolchain {
    CompilerKind kind = CompilerKind::kUnknown;
    int major = 0;
    int minor = 0;
    std::string c_compiler = "cc";
    std::string cxx_compiler = "c++";

    // Parse the first lines of `<compiler> --version`
    static Toolchain fromVersionOutput(std::string_view text);

    [[nodiscard]] bool atLeast(int req_major, int req_minor = 0) const {
        return major > req_major || (major == req_major && minor >= req_minor);
    }

    // "clang-14.0", "gcc-12.2", "unknown-0.0"
    [[nodiscard]] std::string id() const;
};

// Run `<cxx> --version` and classify the compiler
Result<Toolchain> detectToolchain(process::ProcessRunner& runner, const std::string& c_compiler,
                                 const std::string& cxx_compiler);

// Minimum versions with the coverage modes honggfuzz needs
inline constexpr int kMinClangMajor = 6;
inline constexpr int kMinGccMajor = 8;

// =============================================================================
// FlagSet
// =============================================================================

struct FlagSet {
    BuildMode mode = BuildMode::kFuzzing;
    std::string target_triple;
    std::string toolchain_id;

    std::vector<std::string> compile_flags;  // Shared by C and C++
    std::vector<std::string> link_flags;
    std::vector<std::string> link_libraries;  // Placed after all objects
    std::vector<std::string> definitions;  // NAME or NAME=VALUE, without -D
    SanitizerSet sanitizers;

    // Discard previous build products before building
    bool clean_build = false;

    // compile_flags followed by -D definitions, space separated
    [[nodiscard]] std::string compileFlagString() const;
    [[nodiscard]] std::string linkFlagString() const;
    [[nodiscard]] std::string linkLibraryString() const;

    // Stable hash over everything that influences generated code
    [[nodiscard]] uint64_t fingerprint() const;
};

// Sanitizer pairs that cannot be combined in one binary
[[nodiscard]] bool sanitizersCompatible(Sanitizer a, Sanitizer b);

// Re-check a flag set (including user extra flags) for forbidden combinations
Result<void> validateFlagSet(const FlagSet& flags);

// =============================================================================
// FlagResolver
// =============================================================================

struct ResolverOptions {
    // Directory holding libhfuzz.a and libhfcommon.a; required for
    // every mode whose binary the engine drives
    std::optional<std::filesystem::path> engine_lib_dir;

    // ld.gold found on PATH
    bool use_gold_linker = false;

    // trace-cmp without a sanitizer is broken on macOS
    bool host_is_macos =
#if defined(HONGG_PLATFORM_MACOS)
        true;
#else
        false;
#endif
};

class FlagResolver {
  public:
    explicit FlagResolver(ResolverOptions options = {});

    // Resolve flags for a profile, or explain why the combination is rejected
    [[nodiscard]] Result<FlagSet> resolve(const BuildProfile& profile,
                                          const Toolchain& toolchain) const;

    [[nodiscard]] const ResolverOptions& options() const { return options_; }

  private:
    Result<SanitizerSet> checkSanitizers(const BuildProfile& profile,
                                         const Toolchain& toolchain) const;
    Result<void> checkToolchain(const BuildProfile& profile, const Toolchain& toolchain) const;

    void addFuzzingBase(FlagSet& flags, const BuildProfile& profile,
                        const Toolchain& toolchain) const;
    void addCoverageFeedback(FlagSet& flags, const Toolchain& toolchain) const;
    void addEngineRuntime(FlagSet& flags) const;

    ResolverOptions options_;
};

// Symbol kept alive in every fuzzing build; defined by the harness runtime
inline constexpr std::string_view kPersistentSignatureSymbol = "HonggKitPersistentSignature";

// libhfuzz persistent-mode fetch function called by the harness
inline constexpr std::string_view kEngineIterSymbol = "HF_ITER";

}  // namespace build
}  // namespace hongg
