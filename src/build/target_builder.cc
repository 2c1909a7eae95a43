// =============================================================================
// Hongg Kit - Target Build Orchestrator Implementation
// =============================================================================

#include "hongg_kit/build/target_builder.h"

#include "hongg_kit/fingerprint.h"
#include "hongg_kit/process/process_runner.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace hongg {
namespace build {

namespace {

std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

}  // namespace

// =============================================================================
// Project Root Discovery
// =============================================================================

Result<std::filesystem::path> findProjectRoot(const std::filesystem::path& start) {
    std::error_code ec;
    auto dir = std::filesystem::absolute(start, ec).lexically_normal();
    if (ec) {
        HONGG_RETURN_ERROR(ErrorCode::kProjectNotFound,
                           fmt::format("cannot resolve '{}': {}", start.string(), ec.message()));
    }

    // Climb to the first directory holding a CMakeLists.txt
    while (!std::filesystem::is_regular_file(dir / "CMakeLists.txt", ec)) {
        if (dir == dir.root_path() || !dir.has_parent_path()) {
            HONGG_RETURN_ERROR(ErrorCode::kProjectNotFound,
                               fmt::format("could not find CMakeLists.txt in '{}' or any parent "
                                           "directory",
                                           start.string()));
        }
        dir = dir.parent_path();
    }

    // Then keep climbing while the parent is part of the same project
    while (dir != dir.root_path() &&
           std::filesystem::is_regular_file(dir.parent_path() / "CMakeLists.txt", ec)) {
        dir = dir.parent_path();
    }
    return dir;
}

// =============================================================================
// TargetBuilder
// =============================================================================

TargetBuilder::TargetBuilder(process::ProcessRunner& runner, TargetBuilderOptions options)
    : runner_(runner), options_(std::move(options)) {}

std::filesystem::path TargetBuilder::buildDirFor(const BuildProfile& profile) const {
    return options_.target_dir / profile.target_triple / std::string(buildModeDirName(profile.mode));
}

std::optional<uint64_t> TargetBuilder::recordedFingerprint(
    const std::filesystem::path& build_dir) const {
    std::ifstream in(build_dir / kStampName);
    if (!in) {
        return std::nullopt;
    }
    try {
        auto j = nlohmann::json::parse(in);
        auto hex = j.at("fingerprint").get<std::string>();
        return std::stoull(hex, nullptr, 16);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring unreadable build stamp in {}: {}", build_dir.string(), e.what());
    } catch (const std::logic_error& e) {
        spdlog::warn("Ignoring malformed fingerprint in {}: {}", build_dir.string(), e.what());
    }
    return std::nullopt;
}

Result<void> TargetBuilder::writeStamp(const std::filesystem::path& build_dir,
                                       const FlagSet& flags) const {
    nlohmann::json j;
    j["fingerprint"] = Fingerprint::toHex(flags.fingerprint());
    j["mode"] = std::string(buildModeName(flags.mode));
    j["target_triple"] = flags.target_triple;
    j["toolchain"] = flags.toolchain_id;
    j["compile_flags"] = flags.compileFlagString();
    j["link_flags"] = flags.linkFlagString();

    std::ofstream out(build_dir / kStampName, std::ios::trunc);
    if (!out) {
        HONGG_RETURN_ERROR(ErrorCode::kIoError,
                           fmt::format("cannot write build stamp in '{}'", build_dir.string()));
    }
    out << j.dump(2) << '\n';
    return {};
}

Result<void> TargetBuilder::prepareBuildDir(const std::filesystem::path& build_dir,
                                            const FlagSet& flags, bool& cleaned) {
    std::error_code ec;
    std::filesystem::create_directories(build_dir, ec);
    if (ec) {
        HONGG_RETURN_ERROR(ErrorCode::kIoError, fmt::format("cannot create build directory '{}': {}",
                                                            build_dir.string(), ec.message()));
    }

    auto recorded = recordedFingerprint(build_dir);
    bool has_cache = std::filesystem::exists(build_dir / "CMakeCache.txt", ec);
    cleaned = flags.clean_build || (has_cache && recorded != flags.fingerprint());

    if (has_cache && recorded != flags.fingerprint()) {
        spdlog::info("Instrumentation flags changed for {}, rebuilding from scratch",
                     build_dir.string());
        // Compiler selection and flags live in the cache; start it over
        for (const char* name : {"CMakeCache.txt", kStampName}) {
            std::filesystem::remove(build_dir / name, ec);
            if (ec) {
                HONGG_RETURN_ERROR(ErrorCode::kIoError,
                                   fmt::format("cannot remove '{}' from '{}': {}", name,
                                               build_dir.string(), ec.message()));
            }
        }
    }
    return {};
}

Result<void> TargetBuilder::configure(const BuildProfile& profile, const FlagSet& flags,
                                      const std::filesystem::path& build_dir) {
    auto build_type = cmakeBuildType(profile.mode);
    auto config = upper(build_type);
    auto compile_flags = flags.compileFlagString();
    auto link_flags = flags.linkFlagString();

    process::Command cmd(options_.cmake_program);
    cmd.arg("-S").arg(options_.project_root.string());
    cmd.arg("-B").arg(build_dir.string());
    if (options_.generator) {
        cmd.arg("-G").arg(*options_.generator);
    }
    cmd.arg(fmt::format("-DCMAKE_BUILD_TYPE={}", build_type));
    cmd.arg(fmt::format("-DCMAKE_C_COMPILER={}", options_.c_compiler));
    cmd.arg(fmt::format("-DCMAKE_CXX_COMPILER={}", options_.cxx_compiler));
    cmd.arg(fmt::format("-DCMAKE_C_FLAGS={}", compile_flags));
    cmd.arg(fmt::format("-DCMAKE_CXX_FLAGS={}", compile_flags));
    // Per-config defaults (-O3 -DNDEBUG, ...) would override the resolved set
    cmd.arg(fmt::format("-DCMAKE_C_FLAGS_{}=", config));
    cmd.arg(fmt::format("-DCMAKE_CXX_FLAGS_{}=", config));
    // Shared and module libraries in the graph need the sanitizer runtimes too
    cmd.arg(fmt::format("-DCMAKE_EXE_LINKER_FLAGS={}", link_flags));
    cmd.arg(fmt::format("-DCMAKE_SHARED_LINKER_FLAGS={}", link_flags));
    cmd.arg(fmt::format("-DCMAKE_MODULE_LINKER_FLAGS={}", link_flags));
    // Archives must follow the objects on the link line
    cmd.arg(fmt::format("-DCMAKE_C_STANDARD_LIBRARIES={}", flags.linkLibraryString()));
    cmd.arg(fmt::format("-DCMAKE_CXX_STANDARD_LIBRARIES={}", flags.linkLibraryString()));
    cmd.arg(fmt::format("-DHONGG_FUZZING={}", isFuzzingMode(profile.mode) ? "ON" : "OFF"));
    cmd.addArgs(options_.configure_args);

    spdlog::info("Configuring {} build in {}", buildModeName(profile.mode), build_dir.string());
    auto result = runner_.run(cmd);
    if (!result) {
        HONGG_RETURN_ERROR(ErrorCode::kBuildError,
                           fmt::format("cannot run '{}': {}", options_.cmake_program,
                                       result.error().message()));
    }
    if (!result->status.success()) {
        HONGG_RETURN_ERROR(ErrorCode::kBuildError,
                           fmt::format("CMake configuration failed ({})",
                                       result->status.toString()));
    }
    return {};
}

Result<void> TargetBuilder::compile(const std::filesystem::path& build_dir,
                                    const std::string& target_name, bool clean_first) {
    process::Command cmd(options_.cmake_program);
    cmd.arg("--build").arg(build_dir.string());
    cmd.arg("--target").arg(target_name);
    cmd.arg("--parallel");
    if (clean_first) {
        cmd.arg("--clean-first");
    }
    cmd.addArgs(options_.build_args);

    auto result = runner_.run(cmd);
    if (!result) {
        HONGG_RETURN_ERROR(ErrorCode::kBuildError,
                           fmt::format("cannot run '{}': {}", options_.cmake_program,
                                       result.error().message()));
    }
    if (!result->status.success()) {
        HONGG_RETURN_ERROR(ErrorCode::kBuildError,
                           fmt::format("build of '{}' failed ({})", target_name,
                                       result->status.toString()));
    }
    return {};
}

Result<std::filesystem::path> TargetBuilder::locateArtifact(const std::filesystem::path& build_dir,
                                                            const std::string& name) const {
    std::vector<std::filesystem::path> matches;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(build_dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        if (it->is_directory(ec)) {
            if (path.filename() == "CMakeFiles") {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (path.filename() == name && process::isExecutableFile(path)) {
            matches.push_back(path);
        }
    }
    if (ec) {
        HONGG_RETURN_ERROR(ErrorCode::kIoError, fmt::format("cannot scan '{}': {}",
                                                            build_dir.string(), ec.message()));
    }

    if (matches.empty()) {
        HONGG_RETURN_ERROR(ErrorCode::kMissingArtifact,
                           fmt::format("build succeeded but no executable named '{}' exists in "
                                       "'{}'; check the target name",
                                       name, build_dir.string()));
    }
    if (matches.size() > 1) {
        std::sort(matches.begin(), matches.end());
        std::string list;
        for (const auto& m : matches) {
            list += "\n  " + m.string();
        }
        HONGG_RETURN_ERROR(ErrorCode::kAmbiguousArtifact,
                           fmt::format("more than one executable named '{}':{}", name, list));
    }
    return matches.front();
}

Result<BuildArtifact> TargetBuilder::build(const BuildProfile& profile, const FlagSet& flags,
                                           const std::string& target_name) {
    if (target_name.empty()) {
        HONGG_RETURN_ERROR(ErrorCode::kMissingArtifact,
                           "no target specified; name the executable to build");
    }
    if (flags.mode != profile.mode) {
        HONGG_RETURN_ERROR(ErrorCode::kInternalError,
                           fmt::format("flags resolved for {} used for a {} build",
                                       buildModeName(flags.mode), buildModeName(profile.mode)));
    }

    BuildArtifact artifact;
    artifact.build_dir = buildDirFor(profile);
    artifact.fingerprint = flags.fingerprint();

    HONGG_TRY(prepareBuildDir(artifact.build_dir, flags, artifact.cleaned));
    HONGG_TRY(configure(profile, flags, artifact.build_dir));
    HONGG_TRY(compile(artifact.build_dir, target_name, artifact.cleaned));
    HONGG_TRY(writeStamp(artifact.build_dir, flags));

    std::filesystem::path binary;
    HONGG_ASSIGN_OR_RETURN(binary, locateArtifact(artifact.build_dir, target_name));
    artifact.binary = binary;
    spdlog::info("Built {} ({})", artifact.binary.string(), buildModeName(profile.mode));
    return artifact;
}

Result<void> TargetBuilder::clean() {
    std::error_code ec;
    auto removed = std::filesystem::remove_all(options_.target_dir, ec);
    if (ec) {
        HONGG_RETURN_ERROR(ErrorCode::kIoError, fmt::format("cannot remove '{}': {}",
                                                            options_.target_dir.string(),
                                                            ec.message()));
    }
    spdlog::info("Removed {} ({} entries)", options_.target_dir.string(), removed);
    return {};
}

}  // namespace build
}  // namespace hongg
