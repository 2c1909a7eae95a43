// =============================================================================
// Hongg Kit - Settings Implementation
// =============================================================================

#include "hongg_kit/config/settings.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>

#ifndef HONGG_ENGINE_SOURCE_DEFAULT
    #define HONGG_ENGINE_SOURCE_DEFAULT "/usr/local/share/hongg_kit/honggfuzz"
#endif

namespace hongg {
namespace config {

EnvLookup processEnvironment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

EnvLookup mapEnvironment(std::map<std::string, std::string> values) {
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        auto it = values.find(std::string(name));
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::vector<std::string> splitWhitespace(std::string_view text) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i > start) {
            parts.emplace_back(text.substr(start, i - start));
        }
    }
    return parts;
}

Settings Settings::fromEnvironment(const EnvLookup& env) {
    Settings s;
    s.engine_source_dir = HONGG_ENGINE_SOURCE_DEFAULT;

    // Empty values count as unset
    auto get = [&env](std::string_view name) -> std::optional<std::string> {
        auto value = env(name);
        if (value && value->empty()) {
            return std::nullopt;
        }
        return value;
    };

    if (auto v = get("HONGG_TARGET_DIR")) {
        s.target_dir = *v;
    }
    if (auto v = get(kEnvWorkspace)) {
        s.workspace = *v;
    }
    if (auto v = get("HONGG_INPUT")) {
        s.input = std::filesystem::path(*v);
    }
    if (auto v = get("HONGG_TARGET_TRIPLE")) {
        s.target_triple = *v;
    }
    if (auto v = get("HONGG_RUN_ARGS")) {
        s.run_args = splitWhitespace(*v);
    }
    if (auto v = get("HONGG_BUILD_ARGS")) {
        s.build_args = splitWhitespace(*v);
    }
    if (auto v = get("HONGG_CONFIGURE_ARGS")) {
        s.configure_args = splitWhitespace(*v);
    }
    if (auto v = get("HONGG_CFLAGS")) {
        s.extra_flags = splitWhitespace(*v);
    }
    if (auto v = get("HONGG_DEBUGGER")) {
        s.debugger = *v;
    }
    if (auto v = get("HONGG_ENGINE_SOURCE_DIR")) {
        s.engine_source_dir = *v;
    }
    if (auto v = get("CC")) {
        s.c_compiler = *v;
    }
    if (auto v = get("CXX")) {
        s.cxx_compiler = *v;
    }
    s.asan_options = get("ASAN_OPTIONS").value_or("");
    s.tsan_options = get("TSAN_OPTIONS").value_or("");
    s.ubsan_options = get("UBSAN_OPTIONS").value_or("");

    return s;
}

void Settings::resolvePaths(const std::filesystem::path& project_root) {
    auto resolve = [&project_root](std::filesystem::path& p) {
        if (p.is_relative()) {
            p = project_root / p;
        }
        p = p.lexically_normal();
    };

    resolve(target_dir);
    resolve(workspace);
    if (input) {
        resolve(*input);
    }

    spdlog::debug("Target dir: {}, workspace: {}", target_dir.string(), workspace.string());
}

}  // namespace config
}  // namespace hongg
