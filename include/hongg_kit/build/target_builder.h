#pragma once

// =============================================================================
// Hongg Kit - Target Build Orchestrator
// =============================================================================
//
// Configures and builds the user's CMake project with the resolved flags in a
// build tree reserved for one BuildMode:
//
//   <target_dir>/<triple>/<mode-dir>/        e.g. hfuzz_target/x86_64-linux-gnu/release
//
// Flags reach every target of the dependency graph through the CMAKE_*_FLAGS
// cache variables. A stamp (hongg_build.json) records the FlagSet
// fingerprint; a different fingerprint drops the CMake cache and forces a
// clean rebuild, so objects built with other flags are never linked in.
//

#include "hongg_kit/build/build_profile.h"
#include "hongg_kit/build/flag_resolver.h"
#include "hongg_kit/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hongg {

namespace process {
class ProcessRunner;
}  // namespace process

namespace build {

struct BuildArtifact {
    std::filesystem::path binary;
    std::filesystem::path build_dir;
    uint64_t fingerprint = 0;

    // Previous products were discarded before building
    bool cleaned = false;
};

struct TargetBuilderOptions {
    std::filesystem::path project_root;
    std::filesystem::path target_dir;

    std::string c_compiler = "cc";
    std::string cxx_compiler = "c++";

    std::vector<std::string> configure_args;  // Appended to `cmake -S ... -B ...`
    std::vector<std::string> build_args;      // Appended to `cmake --build ...`

    std::optional<std::string> generator;
    std::string cmake_program = "cmake";
};

// Top-most directory of the contiguous chain of CMakeLists.txt files above
// `start` (add_subdirectory() children always sit below their parent)
Result<std::filesystem::path> findProjectRoot(const std::filesystem::path& start);

class TargetBuilder {
  public:
    static constexpr const char* kStampName = "hongg_build.json";

    TargetBuilder(process::ProcessRunner& runner, TargetBuilderOptions options);

    // Build tree used for a profile
    [[nodiscard]] std::filesystem::path buildDirFor(const BuildProfile& profile) const;

    // Configure + build `target_name`, then locate its executable
    Result<BuildArtifact> build(const BuildProfile& profile, const FlagSet& flags,
                                const std::string& target_name);

    // Find exactly one executable called `name` below `build_dir`
    [[nodiscard]] Result<std::filesystem::path> locateArtifact(
        const std::filesystem::path& build_dir, const std::string& name) const;

    // Fingerprint recorded by the last successful build, if any
    [[nodiscard]] std::optional<uint64_t> recordedFingerprint(
        const std::filesystem::path& build_dir) const;

    // Remove the whole target directory (never the fuzzing workspace)
    Result<void> clean();

    [[nodiscard]] const TargetBuilderOptions& options() const { return options_; }

  private:
    Result<void> prepareBuildDir(const std::filesystem::path& build_dir, const FlagSet& flags,
                                 bool& cleaned);
    Result<void> configure(const BuildProfile& profile, const FlagSet& flags,
                           const std::filesystem::path& build_dir);
    Result<void> compile(const std::filesystem::path& build_dir, const std::string& target_name,
                         bool clean_first);
    Result<void> writeStamp(const std::filesystem::path& build_dir, const FlagSet& flags) const;

    process::ProcessRunner& runner_;
    TargetBuilderOptions options_;
};

}  // namespace build
}  // namespace hongg
