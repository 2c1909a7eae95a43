#pragma once

// =============================================================================
// Hongg Kit - Native Engine Builder
// =============================================================================
//
// Builds the honggfuzz engine and its coverage runtime archives from the
// bundled sources with GNU make, once. A JSON stamp next to the artifacts
// records the source fingerprint; a matching stamp skips the rebuild.
//
// Layout of <output_dir>:
//   honggfuzz        engine executable
//   libhfuzz.a       coverage/feedback runtime linked into targets
//   libhfcommon.a
//   engine.json      {"version", "fingerprint", "source_dir"}
//

#include "hongg_kit/error.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hongg {

namespace process {
class ProcessRunner;
}  // namespace process

namespace build {

struct EngineArtifacts {
    std::filesystem::path binary;
    std::filesystem::path lib_dir;
    std::string fingerprint;
    bool rebuilt = false;
};

struct EngineBuilderOptions {
    std::filesystem::path source_dir;
    std::filesystem::path output_dir;

    // Mixed into the fingerprint so a tool upgrade rebuilds the engine
    std::string tool_version;

    // Override the make program (default: gmake on BSD, make elsewhere)
    std::optional<std::string> make_program;
};

class EngineBuilder {
  public:
    EngineBuilder(process::ProcessRunner& runner, EngineBuilderOptions options);

    // Reuse the existing engine when its stamp matches, build it otherwise
    Result<EngineArtifacts> ensureBuilt();

    // Fingerprint of the engine sources (build products excluded)
    [[nodiscard]] Result<std::string> sourceFingerprint() const;

    // True when all artifacts exist and the stamp records `fingerprint`
    [[nodiscard]] bool isUpToDate(const std::string& fingerprint) const;

    [[nodiscard]] std::filesystem::path binaryPath() const;
    [[nodiscard]] std::filesystem::path stampPath() const;

  private:
    Result<void> runMake(const std::vector<std::string>& args);
    Result<void> installArtifacts();
    Result<void> writeStamp(const std::string& fingerprint) const;

    process::ProcessRunner& runner_;
    EngineBuilderOptions options_;
    std::string make_program_;
};

}  // namespace build
}  // namespace hongg
