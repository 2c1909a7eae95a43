// =============================================================================
// Hongg Kit - Native Engine Builder Implementation
// =============================================================================

#include "hongg_kit/build/engine_builder.h"

#include "hongg_kit/common.h"
#include "hongg_kit/fingerprint.h"
#include "hongg_kit/process/process_runner.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <vector>

namespace hongg {
namespace build {

namespace {

constexpr const char* kEngineBinaryName = "honggfuzz";
constexpr const char* kStampName = "engine.json";

// Artifacts produced by make, relative to the source tree
constexpr const char* kMakeArtifacts[] = {
    "honggfuzz",
    "libhfuzz/libhfuzz.a",
    "libhfcommon/libhfcommon.a",
};

bool isBuildProduct(const std::filesystem::path& relative) {
    for (const auto& part : relative) {
        if (part.string().rfind(".git", 0) == 0) {
            return true;
        }
    }
    auto ext = relative.extension().string();
    if (ext == ".o" || ext == ".a" || ext == ".so" || ext == ".d" || ext == ".dylib") {
        return true;
    }
    return relative == kEngineBinaryName;
}

}  // namespace

EngineBuilder::EngineBuilder(process::ProcessRunner& runner, EngineBuilderOptions options)
    : runner_(runner), options_(std::move(options)) {
    if (options_.make_program) {
        make_program_ = *options_.make_program;
    } else {
#if defined(HONGG_PLATFORM_BSD)
        make_program_ = "gmake";
#else
        make_program_ = "make";
#endif
    }
}

std::filesystem::path EngineBuilder::binaryPath() const {
    return options_.output_dir / kEngineBinaryName;
}

std::filesystem::path EngineBuilder::stampPath() const {
    return options_.output_dir / kStampName;
}

Result<std::string> EngineBuilder::sourceFingerprint() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(options_.source_dir, ec)) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                           fmt::format("engine sources not found at '{}' (set "
                                       "HONGG_ENGINE_SOURCE_DIR)",
                                       options_.source_dir.string()));
    }

    std::vector<std::filesystem::path> files;
    for (auto it = std::filesystem::recursive_directory_iterator(options_.source_dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        auto relative = it->path().lexically_relative(options_.source_dir);
        if (!isBuildProduct(relative)) {
            files.push_back(relative);
        }
    }
    if (ec) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                           fmt::format("cannot scan engine sources '{}': {}",
                                       options_.source_dir.string(), ec.message()));
    }
    std::sort(files.begin(), files.end());

    Fingerprint fp;
    fp.add(options_.tool_version);
    std::vector<char> buffer(64 * 1024);
    for (const auto& relative : files) {
        fp.add(relative.generic_string());

        std::ifstream in(options_.source_dir / relative, std::ios::binary);
        if (!in) {
            HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                               fmt::format("cannot read engine source '{}'", relative.string()));
        }
        uint64_t size = 0;
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto n = static_cast<size_t>(in.gcount());
            fp.addBytes(buffer.data(), n);
            size += n;
        }
        fp.add(size);
    }

    spdlog::debug("Engine sources: {} files, fingerprint {}", files.size(), fp.hex());
    return fp.hex();
}

bool EngineBuilder::isUpToDate(const std::string& fingerprint) const {
    std::error_code ec;
    for (const char* name : {kEngineBinaryName, "libhfuzz.a", "libhfcommon.a"}) {
        if (!std::filesystem::is_regular_file(options_.output_dir / name, ec)) {
            return false;
        }
    }
    if (!process::isExecutableFile(binaryPath())) {
        return false;
    }

    std::ifstream in(stampPath());
    if (!in) {
        return false;
    }
    try {
        auto j = nlohmann::json::parse(in);
        return j.value("fingerprint", std::string()) == fingerprint;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring unreadable engine stamp {}: {}", stampPath().string(), e.what());
        return false;
    }
}

Result<void> EngineBuilder::runMake(const std::vector<std::string>& args) {
    auto cmd = process::Command(make_program_).captured();
    cmd.arg("-C").arg(options_.source_dir.string()).addArgs(args);

    auto result = runner_.run(cmd);
    if (!result) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                           fmt::format("cannot run '{}': {}", make_program_,
                                       result.error().message()));
    }
    if (!result->status.success()) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                           fmt::format("'{}' failed ({}):\n{}", cmd.display(),
                                       result->status.toString(), result->output));
    }
    return {};
}

Result<void> EngineBuilder::installArtifacts() {
    std::error_code ec;
    std::filesystem::create_directories(options_.output_dir, ec);
    if (ec) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                           fmt::format("cannot create '{}': {}", options_.output_dir.string(),
                                       ec.message()));
    }

    for (const char* artifact : kMakeArtifacts) {
        auto from = options_.source_dir / artifact;
        auto to = options_.output_dir / std::filesystem::path(artifact).filename();
        if (!std::filesystem::is_regular_file(from, ec)) {
            HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                               fmt::format("make succeeded but '{}' was not produced",
                                           from.string()));
        }
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing,
                                   ec);
        if (ec) {
            HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                               fmt::format("cannot copy '{}' to '{}': {}", from.string(),
                                           to.string(), ec.message()));
        }
    }

    std::filesystem::permissions(binaryPath(),
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read |
                                     std::filesystem::perms::others_exec,
                                 ec);
    if (ec || !process::isExecutableFile(binaryPath())) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                           fmt::format("engine binary '{}' is not executable",
                                       binaryPath().string()));
    }
    return {};
}

Result<void> EngineBuilder::writeStamp(const std::string& fingerprint) const {
    nlohmann::json j;
    j["version"] = options_.tool_version;
    j["fingerprint"] = fingerprint;
    j["source_dir"] = options_.source_dir.string();

    std::ofstream out(stampPath(), std::ios::trunc);
    if (!out) {
        HONGG_RETURN_ERROR(ErrorCode::kEngineBuildError,
                           fmt::format("cannot write '{}'", stampPath().string()));
    }
    out << j.dump(2) << '\n';
    return {};
}

Result<EngineArtifacts> EngineBuilder::ensureBuilt() {
#if defined(HONGG_PLATFORM_WINDOWS)
    HONGG_RETURN_ERROR(ErrorCode::kConfigurationError,
                       "honggfuzz does not support Windows; use WSL instead");
#endif

    std::string fingerprint;
    HONGG_ASSIGN_OR_RETURN(fingerprint, sourceFingerprint());

    EngineArtifacts artifacts;
    artifacts.binary = binaryPath();
    artifacts.lib_dir = options_.output_dir;
    artifacts.fingerprint = fingerprint;

    if (isUpToDate(fingerprint)) {
        spdlog::info("Engine up to date ({})", binaryPath().string());
        return artifacts;
    }

    spdlog::info("Building honggfuzz from {}", options_.source_dir.string());
    HONGG_TRY(runMake({"clean"}));

    std::vector<std::string> targets(std::begin(kMakeArtifacts), std::end(kMakeArtifacts));
    HONGG_TRY(runMake(targets));
    HONGG_TRY(installArtifacts());
    HONGG_TRY(writeStamp(fingerprint));

    artifacts.rebuilt = true;
    spdlog::info("Engine built: {}", binaryPath().string());
    return artifacts;
}

}  // namespace build
}  // namespace hongg
