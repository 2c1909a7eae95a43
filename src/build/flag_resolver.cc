// =============================================================================
// Hongg Kit - Instrumentation Flag Resolver Implementation
// =============================================================================

#include "hongg_kit/build/flag_resolver.h"

#include "hongg_kit/fingerprint.h"
#include "hongg_kit/process/process_runner.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cctype>

namespace hongg {
namespace build {

namespace {

// Components longer than this are rejected rather than overflowing
constexpr size_t kMaxVersionDigits = 6;

bool readNumber(std::string_view text, size_t& i, int& value) {
    size_t start = i;
    value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        if (i - start == kMaxVersionDigits) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
        ++i;
    }
    return true;
}

// Reads "<major>[.<minor>...]" at the start of `text`
bool parseVersion(std::string_view text, int& major, int& minor) {
    size_t i = 0;
    if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) {
        return false;
    }
    int maj = 0;
    int min = 0;
    if (!readNumber(text, i, maj)) {
        return false;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        if (!readNumber(text, i, min)) {
            return false;
        }
    }
    major = maj;
    minor = min;
    return true;
}

std::string joinFlags(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) {
            out += ' ';
        }
        out += p;
    }
    return out;
}

// Sanitizer names listed by "-fsanitize=a,b" tokens; names outside
// kAllSanitizers (cfi, integer, ...) are not tracked
SanitizerSet collectSanitizers(const std::vector<std::string>& flags) {
    constexpr std::string_view kPrefix = "-fsanitize=";
    SanitizerSet set;
    for (const auto& flag : flags) {
        std::string_view f(flag);
        if (f.substr(0, kPrefix.size()) != kPrefix) {
            continue;
        }
        f.remove_prefix(kPrefix.size());
        size_t start = 0;
        while (start <= f.size()) {
            size_t end = f.find(',', start);
            if (end == std::string_view::npos) {
                end = f.size();
            }
            auto name = f.substr(start, end - start);
            for (auto s : kAllSanitizers) {
                if (sanitizerName(s) == name) {
                    set.insert(s);
                }
            }
            start = end + 1;
        }
    }
    return set;
}

}  // namespace

// =============================================================================
// Toolchain
// =============================================================================

std::string_view compilerKindName(CompilerKind kind) {
    switch (kind) {
    case CompilerKind::kClang:
        return "clang";
    case CompilerKind::kGcc:
        return "gcc";
    default:
        return "unknown";
    }
}

Toolchain Toolchain::fromVersionOutput(std::string_view text) {
    Toolchain tc;

    // Clang: "clang version 14.0.6", "Apple clang version 15.0.0 (...)"
    constexpr std::string_view kClangMarker = "clang version ";
    if (auto pos = text.find(kClangMarker); pos != std::string_view::npos) {
        if (parseVersion(text.substr(pos + kClangMarker.size()), tc.major, tc.minor)) {
            tc.kind = CompilerKind::kClang;
        }
        return tc;
    }

    // GCC: "gcc (Debian 12.2.0-14) 12.2.0", "c++ (GCC) 13.1.1 20230429"
    auto first_line = text.substr(0, text.find('\n'));
    bool looks_like_gcc = first_line.find("(GCC)") != std::string_view::npos ||
                          first_line.find("gcc") != std::string_view::npos ||
                          first_line.find("g++") != std::string_view::npos ||
                          text.find("Free Software Foundation") != std::string_view::npos;
    if (!looks_like_gcc) {
        return tc;
    }

    // The version is the first token after the closing parenthesis
    size_t pos = first_line.rfind(')');
    pos = (pos == std::string_view::npos) ? 0 : pos + 1;
    while (pos < first_line.size()) {
        while (pos < first_line.size() && first_line[pos] == ' ') {
            ++pos;
        }
        if (parseVersion(first_line.substr(pos), tc.major, tc.minor)) {
            tc.kind = CompilerKind::kGcc;
            break;
        }
        pos = first_line.find(' ', pos);
        if (pos == std::string_view::npos) {
            break;
        }
    }
    return tc;
}

std::string Toolchain::id() const {
    return fmt::format("{}-{}.{}", compilerKindName(kind), major, minor);
}

Result<Toolchain> detectToolchain(process::ProcessRunner& runner, const std::string& c_compiler,
                                 const std::string& cxx_compiler) {
    auto cmd = process::Command(cxx_compiler).arg("--version").captured();
    auto result = runner.run(cmd);
    if (!result) {
        HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                           fmt::format("cannot run C++ compiler '{}': {}", cxx_compiler,
                                       result.error().message()));
    }
    if (!result->status.success()) {
        HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                           fmt::format("'{} --version' failed ({})", cxx_compiler,
                                       result->status.toString()));
    }

    Toolchain tc = Toolchain::fromVersionOutput(result->output);
    tc.c_compiler = c_compiler;
    tc.cxx_compiler = cxx_compiler;
    spdlog::info("Toolchain: {} ({})", tc.id(), cxx_compiler);
    return tc;
}

// =============================================================================
// FlagSet
// =============================================================================

std::string FlagSet::compileFlagString() const {
    std::vector<std::string> all = compile_flags;
    for (const auto& d : definitions) {
        all.push_back("-D" + d);
    }
    return joinFlags(all);
}

std::string FlagSet::linkFlagString() const {
    return joinFlags(link_flags);
}

std::string FlagSet::linkLibraryString() const {
    return joinFlags(link_libraries);
}

uint64_t FlagSet::fingerprint() const {
    Fingerprint fp;
    fp.add(static_cast<uint64_t>(mode));
    fp.add(target_triple);
    fp.add(toolchain_id);
    fp.add(static_cast<uint64_t>(compile_flags.size()));
    for (const auto& f : compile_flags) {
        fp.add(f);
    }
    fp.add(static_cast<uint64_t>(link_flags.size()));
    for (const auto& f : link_flags) {
        fp.add(f);
    }
    fp.add(static_cast<uint64_t>(link_libraries.size()));
    for (const auto& l : link_libraries) {
        fp.add(l);
    }
    fp.add(static_cast<uint64_t>(definitions.size()));
    for (const auto& d : definitions) {
        fp.add(d);
    }
    fp.add(static_cast<uint64_t>(sanitizers.bits()));
    return fp.value();
}

// =============================================================================
// Compatibility Rules
// =============================================================================

bool sanitizersCompatible(Sanitizer a, Sanitizer b) {
    if (a == b) {
        return true;
    }
    auto pair_is = [a, b](Sanitizer x, Sanitizer y) {
        return (a == x && b == y) || (a == y && b == x);
    };
    // ASan, TSan and MSan each own the shadow memory layout
    if (pair_is(Sanitizer::kAddress, Sanitizer::kThread) ||
        pair_is(Sanitizer::kAddress, Sanitizer::kMemory) ||
        pair_is(Sanitizer::kThread, Sanitizer::kMemory)) {
        return false;
    }
    // Standalone LSan only combines with ASan and UBSan
    if (pair_is(Sanitizer::kLeak, Sanitizer::kThread) ||
        pair_is(Sanitizer::kLeak, Sanitizer::kMemory)) {
        return false;
    }
    return true;
}

Result<void> validateFlagSet(const FlagSet& flags) {
    SanitizerSet all = collectSanitizers(flags.compile_flags);
    for (auto a : kAllSanitizers) {
        for (auto b : kAllSanitizers) {
            if (all.contains(a) && all.contains(b) && !sanitizersCompatible(a, b)) {
                HONGG_RETURN_ERROR(
                    ErrorCode::kIncompatibleSanitizers,
                    fmt::format("sanitizers '{}' and '{}' cannot be combined ({} build)",
                                sanitizerName(a), sanitizerName(b), buildModeName(flags.mode)));
            }
        }
    }

    if (!isInstrumentedMode(flags.mode)) {
        for (const auto& f : flags.compile_flags) {
            if (f.rfind("-fsanitize-coverage", 0) == 0) {
                HONGG_RETURN_ERROR(ErrorCode::kConfigurationError,
                                   fmt::format("coverage instrumentation '{}' is not allowed in a "
                                               "{} build",
                                               f, buildModeName(flags.mode)));
            }
        }
    }
    return {};
}

// =============================================================================
// FlagResolver
// =============================================================================

FlagResolver::FlagResolver(ResolverOptions options) : options_(std::move(options)) {}

Result<void> FlagResolver::checkToolchain(const BuildProfile& profile,
                                          const Toolchain& toolchain) const {
    if (profile.target_triple != kHostTriple && toolchain.kind != CompilerKind::kClang) {
        HONGG_RETURN_ERROR(ErrorCode::kConfigurationError,
                           fmt::format("cannot build for '{}' with {}; cross builds need clang "
                                       "(set CC/CXX)",
                                       profile.target_triple, toolchain.id()));
    }

    if (isFuzzingMode(profile.mode) && !options_.engine_lib_dir) {
        HONGG_RETURN_ERROR(ErrorCode::kConfigurationError,
                           fmt::format("{} build needs the engine runtime libraries, but no "
                                       "engine build directory was given",
                                       buildModeName(profile.mode)));
    }

    if (!isInstrumentedMode(profile.mode)) {
        return {};
    }

    switch (toolchain.kind) {
    case CompilerKind::kClang:
        if (!toolchain.atLeast(kMinClangMajor)) {
            HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                               fmt::format("{} is too old for trace-pc-guard coverage "
                                           "(clang {} or newer required)",
                                           toolchain.id(), kMinClangMajor));
        }
        break;
    case CompilerKind::kGcc:
        if (!toolchain.atLeast(kMinGccMajor)) {
            HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                               fmt::format("{} is too old for trace-pc/trace-cmp coverage "
                                           "(gcc {} or newer required)",
                                           toolchain.id(), kMinGccMajor));
        }
        break;
    default:
        HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                           fmt::format("cannot instrument with unrecognized compiler '{}'; "
                                       "set CC/CXX to clang or gcc",
                                       toolchain.cxx_compiler));
    }
    return {};
}

Result<SanitizerSet> FlagResolver::checkSanitizers(const BuildProfile& profile,
                                                   const Toolchain& toolchain) const {
    if (profile.mode != BuildMode::kFuzzingWithSanitizers) {
        if (!profile.sanitizers.empty()) {
            HONGG_RETURN_ERROR(ErrorCode::kConfigurationError,
                               fmt::format("sanitizers '{}' requested for a {} build; only "
                                           "fuzzing+sanitizers builds accept them",
                                           profile.sanitizers.toString(),
                                           buildModeName(profile.mode)));
        }
        return SanitizerSet{};
    }

    SanitizerSet set = profile.sanitizers;
    if (set.empty()) {
        set = SanitizerSet{Sanitizer::kAddress, Sanitizer::kUndefined};
    }

    if (toolchain.kind == CompilerKind::kUnknown) {
        HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                           fmt::format("sanitizers '{}' need a known toolchain; '{}' was not "
                                       "recognized as clang or gcc",
                                       set.toString(), toolchain.cxx_compiler));
    }

    for (auto a : kAllSanitizers) {
        for (auto b : kAllSanitizers) {
            if (set.contains(a) && set.contains(b) && !sanitizersCompatible(a, b)) {
                HONGG_RETURN_ERROR(ErrorCode::kIncompatibleSanitizers,
                                   fmt::format("sanitizers '{}' and '{}' are mutually exclusive",
                                               sanitizerName(a), sanitizerName(b)));
            }
        }
    }

    if (set.contains(Sanitizer::kMemory) && toolchain.kind != CompilerKind::kClang) {
        HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                           fmt::format("memory sanitizer requires clang, found {}",
                                       toolchain.id()));
    }
    if (set.contains(Sanitizer::kLeak) && options_.host_is_macos &&
        !set.contains(Sanitizer::kAddress)) {
        HONGG_RETURN_ERROR(ErrorCode::kUnsupportedToolchain,
                           "standalone leak sanitizer is not supported on macOS");
    }
    return set;
}

void FlagResolver::addFuzzingBase(FlagSet& flags, const BuildProfile& profile,
                                  const Toolchain& toolchain) const {
    flags.compile_flags.push_back("-O3");
    if (profile.mode == BuildMode::kFuzzingWithSanitizers) {
        // Line tables keep sanitizer reports symbolized
        flags.compile_flags.push_back(toolchain.kind == CompilerKind::kClang
                                          ? "-gline-tables-only"
                                          : "-g1");
    } else {
        flags.compile_flags.push_back("-g0");
    }
    if (profile.target_triple == kHostTriple) {
        flags.compile_flags.push_back("-march=native");
    }
    flags.compile_flags.push_back("-fno-omit-frame-pointer");

    flags.definitions.push_back("HONGG_FUZZING=1");
    flags.definitions.push_back("FUZZING_BUILD_MODE_UNSAFE_FOR_PRODUCTION");
    flags.definitions.push_back("_GLIBCXX_ASSERTIONS");

    // Keep the persistent signature (and with it the harness) in the binary
    if (options_.host_is_macos) {
        flags.link_flags.push_back(fmt::format("-Wl,-u,_{}", kPersistentSignatureSymbol));
    } else {
        flags.link_flags.push_back(fmt::format("-Wl,--undefined={}", kPersistentSignatureSymbol));
    }
    flags.link_flags.push_back("-rdynamic");
}

void FlagResolver::addCoverageFeedback(FlagSet& flags, const Toolchain& toolchain) const {
    bool trace_cmp = !options_.host_is_macos || !flags.sanitizers.empty();

    if (toolchain.kind == CompilerKind::kClang) {
        std::string cov = "-fsanitize-coverage=trace-pc-guard,indirect-calls,trace-div";
        if (trace_cmp) {
            cov += ",trace-cmp";
        }
        flags.compile_flags.push_back(cov);
    } else {
        flags.compile_flags.push_back(trace_cmp ? "-fsanitize-coverage=trace-pc,trace-cmp"
                                                : "-fsanitize-coverage=trace-pc");
    }

    if (options_.use_gold_linker) {
        flags.link_flags.push_back("-fuse-ld=gold");
    }
}

void FlagResolver::addEngineRuntime(FlagSet& flags) const {
    // HF_ITER is only reached through a weak reference in the harness, which
    // does not pull persistent.o out of libhfuzz.a on its own
    if (options_.host_is_macos) {
        flags.link_flags.push_back(fmt::format("-Wl,-u,_{}", kEngineIterSymbol));
    } else {
        flags.link_flags.push_back(fmt::format("-Wl,--undefined={}", kEngineIterSymbol));
    }

    const auto& dir = *options_.engine_lib_dir;
    flags.link_libraries.push_back((dir / "libhfuzz.a").string());
    flags.link_libraries.push_back((dir / "libhfcommon.a").string());
    flags.link_libraries.push_back("-pthread");
    if (!options_.host_is_macos) {
        flags.link_libraries.push_back("-ldl");
        flags.link_libraries.push_back("-lrt");
    }
}

Result<FlagSet> FlagResolver::resolve(const BuildProfile& profile,
                                      const Toolchain& toolchain) const {
    HONGG_TRY(checkToolchain(profile, toolchain));

    FlagSet flags;
    flags.mode = profile.mode;
    flags.target_triple = profile.target_triple;
    flags.toolchain_id = toolchain.id();
    SanitizerSet sanitizers;
    HONGG_ASSIGN_OR_RETURN(sanitizers, checkSanitizers(profile, toolchain));
    flags.sanitizers = sanitizers;

    switch (profile.mode) {
    case BuildMode::kFuzzing:
    case BuildMode::kFuzzingWithSanitizers:
        addFuzzingBase(flags, profile, toolchain);
        addCoverageFeedback(flags, toolchain);
        if (!flags.sanitizers.empty()) {
            std::string san = "-fsanitize=" + flags.sanitizers.toString();
            flags.compile_flags.push_back(san);
            flags.compile_flags.push_back("-fno-sanitize-recover=all");
            flags.link_flags.push_back(san);
        }
        addEngineRuntime(flags);
        break;

    case BuildMode::kFuzzingNoInstrumentation:
        addFuzzingBase(flags, profile, toolchain);
        addEngineRuntime(flags);
        break;

    case BuildMode::kDebugTriage:
        flags.compile_flags = {"-O0", "-g3", "-fno-omit-frame-pointer"};
        flags.definitions = {"HONGG_FUZZING=1", "HONGG_FUZZING_DEBUG=1"};
        break;

    case BuildMode::kCoverageProfile:
        flags.compile_flags = {"-O0", "-g", "-fno-omit-frame-pointer"};
        if (toolchain.kind == CompilerKind::kClang) {
            flags.compile_flags.push_back("-fprofile-instr-generate");
            flags.compile_flags.push_back("-fcoverage-mapping");
            flags.link_flags.push_back("-fprofile-instr-generate");
        } else {
            flags.compile_flags.push_back("--coverage");
            flags.link_flags.push_back("--coverage");
        }
        flags.definitions = {"HONGG_FUZZING=1", "HONGG_FUZZING_DEBUG=1"};
        flags.clean_build = true;
        break;
    }

    if (profile.target_triple != kHostTriple) {
        std::string target = "--target=" + profile.target_triple;
        flags.compile_flags.push_back(target);
        flags.link_flags.push_back(target);
    }

    // User flags go last so they can override optimization levels
    for (const auto& f : profile.extra_flags) {
        flags.compile_flags.push_back(f);
    }

    HONGG_TRY(validateFlagSet(flags));

    spdlog::debug("Resolved {} flags: {}", buildModeName(profile.mode), flags.compileFlagString());
    return flags;
}

}  // namespace build
}  // namespace hongg
