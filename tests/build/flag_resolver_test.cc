// =============================================================================
// Hongg Kit - Flag Resolver Tests
// =============================================================================

#include "hongg_kit/build/flag_resolver.h"

#include "fake_process_runner.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace hongg {
namespace build {
namespace {

bool hasFlag(const std::vector<std::string>& flags, const std::string& flag) {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
}

bool hasPrefix(const std::vector<std::string>& flags, const std::string& prefix) {
    return std::any_of(flags.begin(), flags.end(),
                       [&](const std::string& f) { return f.rfind(prefix, 0) == 0; });
}

Toolchain clang(int major = 14) {
    Toolchain tc;
    tc.kind = CompilerKind::kClang;
    tc.major = major;
    tc.c_compiler = "clang";
    tc.cxx_compiler = "clang++";
    return tc;
}

Toolchain gcc(int major = 12) {
    Toolchain tc;
    tc.kind = CompilerKind::kGcc;
    tc.major = major;
    tc.c_compiler = "gcc";
    tc.cxx_compiler = "g++";
    return tc;
}

ResolverOptions linuxOptions() {
    ResolverOptions options;
    options.engine_lib_dir = "/engine";
    options.host_is_macos = false;
    return options;
}

BuildProfile profileFor(BuildMode mode) {
    BuildProfile profile;
    profile.mode = mode;
    return profile;
}

// =============================================================================
// Toolchain probing
// =============================================================================

TEST(ToolchainTest, ParsesClang) {
    auto tc = Toolchain::fromVersionOutput(
        "Ubuntu clang version 14.0.6\nTarget: x86_64-pc-linux-gnu\nThread model: posix\n");
    EXPECT_EQ(tc.kind, CompilerKind::kClang);
    EXPECT_EQ(tc.major, 14);
    EXPECT_EQ(tc.minor, 0);
    EXPECT_EQ(tc.id(), "clang-14.0");
}

TEST(ToolchainTest, ParsesAppleClang) {
    auto tc = Toolchain::fromVersionOutput("Apple clang version 15.0.0 (clang-1500.0.40.1)\n");
    EXPECT_EQ(tc.kind, CompilerKind::kClang);
    EXPECT_EQ(tc.major, 15);
}

TEST(ToolchainTest, ParsesGcc) {
    auto tc = Toolchain::fromVersionOutput(
        "g++ (Debian 12.2.0-14) 12.2.0\nCopyright (C) 2022 Free Software Foundation, Inc.\n");
    EXPECT_EQ(tc.kind, CompilerKind::kGcc);
    EXPECT_EQ(tc.major, 12);
    EXPECT_EQ(tc.minor, 2);
}

TEST(ToolchainTest, UnknownCompiler) {
    auto tc = Toolchain::fromVersionOutput("Intel(R) oneAPI DPC++/C++ Compiler\n");
    EXPECT_EQ(tc.kind, CompilerKind::kUnknown);
}

TEST(ToolchainTest, DetectionRunsCompilerVersion) {
    test::FakeProcessRunner runner;
    runner.setHandler([](const process::Command&) -> Result<process::ProcessResult> {
        process::ProcessResult r;
        r.output = "clang version 17.0.1\n";
        return r;
    });

    auto tc = detectToolchain(runner, "clang", "clang++");
    ASSERT_TRUE(tc) << tc.error().toString();
    EXPECT_EQ(tc->kind, CompilerKind::kClang);
    EXPECT_EQ(tc->cxx_compiler, "clang++");
    ASSERT_EQ(runner.commands().size(), 1u);
    EXPECT_EQ(runner.commands()[0].program, "clang++");
    EXPECT_EQ(runner.commands()[0].args, (std::vector<std::string>{"--version"}));
    EXPECT_TRUE(runner.commands()[0].capture_output);
}

TEST(ToolchainTest, DetectionFailure) {
    test::FakeProcessRunner runner;
    runner.setHandler([](const process::Command&) -> Result<process::ProcessResult> {
        return Error(ErrorCode::kProcessSpawnFailed, "No such file or directory");
    });
    auto tc = detectToolchain(runner, "cc", "c++");
    ASSERT_FALSE(tc);
    EXPECT_EQ(tc.error().code(), ErrorCode::kUnsupportedToolchain);
}

// =============================================================================
// Mode flags
// =============================================================================

TEST(FlagResolverTest, FuzzingOnClang) {
    FlagResolver resolver(linuxOptions());
    auto flags = resolver.resolve(profileFor(BuildMode::kFuzzing), clang());
    ASSERT_TRUE(flags) << flags.error().toString();

    EXPECT_TRUE(hasFlag(flags->compile_flags, "-O3"));
    EXPECT_TRUE(hasFlag(flags->compile_flags, "-march=native"));
    EXPECT_TRUE(hasFlag(flags->compile_flags, "-fno-omit-frame-pointer"));
    EXPECT_TRUE(hasFlag(flags->compile_flags,
                        "-fsanitize-coverage=trace-pc-guard,indirect-calls,trace-div,trace-cmp"));
    EXPECT_TRUE(hasFlag(flags->definitions, "HONGG_FUZZING=1"));
    EXPECT_TRUE(hasFlag(flags->definitions, "FUZZING_BUILD_MODE_UNSAFE_FOR_PRODUCTION"));
    EXPECT_TRUE(hasFlag(flags->link_flags, "-Wl,--undefined=HonggKitPersistentSignature"));
    EXPECT_TRUE(hasFlag(flags->link_flags, "-Wl,--undefined=HF_ITER"));
    EXPECT_TRUE(hasFlag(flags->link_libraries, "/engine/libhfuzz.a"));
    EXPECT_TRUE(hasFlag(flags->link_libraries, "/engine/libhfcommon.a"));
    EXPECT_TRUE(flags->sanitizers.empty());
    EXPECT_FALSE(hasPrefix(flags->compile_flags, "-fsanitize="));
}

TEST(FlagResolverTest, FuzzingOnGcc) {
    FlagResolver resolver(linuxOptions());
    auto flags = resolver.resolve(profileFor(BuildMode::kFuzzing), gcc());
    ASSERT_TRUE(flags) << flags.error().toString();
    EXPECT_TRUE(hasFlag(flags->compile_flags, "-fsanitize-coverage=trace-pc,trace-cmp"));
}

TEST(FlagResolverTest, TraceCmpDroppedOnMacosWithoutSanitizers) {
    auto options = linuxOptions();
    options.host_is_macos = true;
    FlagResolver resolver(options);

    auto plain = resolver.resolve(profileFor(BuildMode::kFuzzing), clang());
    ASSERT_TRUE(plain);
    EXPECT_TRUE(hasFlag(plain->compile_flags,
                        "-fsanitize-coverage=trace-pc-guard,indirect-calls,trace-div"));
    EXPECT_TRUE(hasFlag(plain->link_flags, "-Wl,-u,_HonggKitPersistentSignature"));
    EXPECT_TRUE(hasFlag(plain->link_flags, "-Wl,-u,_HF_ITER"));

    auto sanitized = resolver.resolve(profileFor(BuildMode::kFuzzingWithSanitizers), clang());
    ASSERT_TRUE(sanitized);
    EXPECT_TRUE(hasFlag(sanitized->compile_flags,
                        "-fsanitize-coverage=trace-pc-guard,indirect-calls,trace-div,trace-cmp"));
}

TEST(FlagResolverTest, CrossCompilePassesTargetToClang) {
    FlagResolver resolver(linuxOptions());
    auto profile = profileFor(BuildMode::kFuzzing);
    profile.target_triple = "aarch64-linux-android";
    auto flags = resolver.resolve(profile, clang());
    ASSERT_TRUE(flags) << flags.error().toString();
    EXPECT_FALSE(hasFlag(flags->compile_flags, "-march=native"));
    EXPECT_TRUE(hasFlag(flags->compile_flags, "--target=aarch64-linux-android"));
    EXPECT_TRUE(hasFlag(flags->link_flags, "--target=aarch64-linux-android"));

    auto debug = profileFor(BuildMode::kDebugTriage);
    debug.target_triple = "aarch64-linux-android";
    auto debug_flags = resolver.resolve(debug, clang());
    ASSERT_TRUE(debug_flags);
    EXPECT_TRUE(hasFlag(debug_flags->compile_flags, "--target=aarch64-linux-android"));
}

TEST(FlagResolverTest, CrossCompileRejectedWithoutClang) {
    FlagResolver resolver(linuxOptions());
    auto profile = profileFor(BuildMode::kDebugTriage);
    profile.target_triple = "aarch64-linux-android";
    auto flags = resolver.resolve(profile, gcc());
    ASSERT_FALSE(flags);
    EXPECT_EQ(flags.error().code(), ErrorCode::kConfigurationError);
    EXPECT_NE(std::string(flags.error().message()).find("aarch64-linux-android"),
              std::string::npos);
}

TEST(FlagResolverTest, HostBuildHasNoTargetFlag) {
    FlagResolver resolver(linuxOptions());
    for (auto mode : kAllBuildModes) {
        auto flags = resolver.resolve(profileFor(mode), clang());
        ASSERT_TRUE(flags);
        EXPECT_FALSE(hasPrefix(flags->compile_flags, "--target=")) << buildModeName(mode);
    }
}

TEST(FlagResolverTest, GoldLinkerWhenAvailable) {
    auto options = linuxOptions();
    options.use_gold_linker = true;
    FlagResolver resolver(options);
    auto flags = resolver.resolve(profileFor(BuildMode::kFuzzing), clang());
    ASSERT_TRUE(flags);
    EXPECT_TRUE(hasFlag(flags->link_flags, "-fuse-ld=gold"));
}

TEST(FlagResolverTest, DefaultSanitizers) {
    FlagResolver resolver(linuxOptions());
    auto flags = resolver.resolve(profileFor(BuildMode::kFuzzingWithSanitizers), clang());
    ASSERT_TRUE(flags) << flags.error().toString();
    EXPECT_EQ(flags->sanitizers, (SanitizerSet{Sanitizer::kAddress, Sanitizer::kUndefined}));
    EXPECT_TRUE(hasFlag(flags->compile_flags, "-fsanitize=address,undefined"));
    EXPECT_TRUE(hasFlag(flags->compile_flags, "-fno-sanitize-recover=all"));
    EXPECT_TRUE(hasFlag(flags->link_flags, "-fsanitize=address,undefined"));
}

TEST(FlagResolverTest, DebugTriageHasNoInstrumentation) {
    FlagResolver resolver(linuxOptions());
    auto flags = resolver.resolve(profileFor(BuildMode::kDebugTriage), gcc());
    ASSERT_TRUE(flags);
    EXPECT_TRUE(hasFlag(flags->compile_flags, "-O0"));
    EXPECT_TRUE(hasFlag(flags->compile_flags, "-g3"));
    EXPECT_TRUE(hasFlag(flags->definitions, "HONGG_FUZZING_DEBUG=1"));
    EXPECT_FALSE(hasPrefix(flags->compile_flags, "-fsanitize"));
    EXPECT_TRUE(flags->link_libraries.empty());
}

TEST(FlagResolverTest, DebugTriageAcceptsUnknownToolchain) {
    FlagResolver resolver(ResolverOptions{});
    auto flags = resolver.resolve(profileFor(BuildMode::kDebugTriage), Toolchain{});
    EXPECT_TRUE(flags);
}

TEST(FlagResolverTest, NoInstrumentationStillLinksEngineRuntime) {
    FlagResolver resolver(linuxOptions());
    auto flags = resolver.resolve(profileFor(BuildMode::kFuzzingNoInstrumentation), gcc());
    ASSERT_TRUE(flags) << flags.error().toString();
    EXPECT_FALSE(hasPrefix(flags->compile_flags, "-fsanitize-coverage"));
    EXPECT_TRUE(hasFlag(flags->definitions, "HONGG_FUZZING=1"));
    EXPECT_TRUE(hasFlag(flags->link_flags, "-Wl,--undefined=HonggKitPersistentSignature"));
    EXPECT_TRUE(hasFlag(flags->link_flags, "-Wl,--undefined=HF_ITER"));
    EXPECT_TRUE(hasFlag(flags->link_libraries, "/engine/libhfuzz.a"));

    FlagResolver without_engine(ResolverOptions{});
    auto missing = without_engine.resolve(profileFor(BuildMode::kFuzzingNoInstrumentation), gcc());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::kConfigurationError);
}

TEST(FlagResolverTest, CoverageProfileAlwaysClean) {
    FlagResolver resolver(ResolverOptions{});
    auto c = resolver.resolve(profileFor(BuildMode::kCoverageProfile), clang());
    ASSERT_TRUE(c);
    EXPECT_TRUE(c->clean_build);
    EXPECT_TRUE(hasFlag(c->compile_flags, "-fprofile-instr-generate"));
    EXPECT_TRUE(hasFlag(c->compile_flags, "-fcoverage-mapping"));

    auto g = resolver.resolve(profileFor(BuildMode::kCoverageProfile), gcc());
    ASSERT_TRUE(g);
    EXPECT_TRUE(hasFlag(g->compile_flags, "--coverage"));
    EXPECT_TRUE(hasFlag(g->link_flags, "--coverage"));
}

TEST(FlagResolverTest, ExtraFlagsAppendedLast) {
    FlagResolver resolver(linuxOptions());
    auto profile = profileFor(BuildMode::kFuzzing);
    profile.extra_flags = {"-O1", "-DUSER=1"};
    auto flags = resolver.resolve(profile, clang());
    ASSERT_TRUE(flags);
    ASSERT_GE(flags->compile_flags.size(), 2u);
    EXPECT_EQ(flags->compile_flags[flags->compile_flags.size() - 2], "-O1");
    EXPECT_EQ(flags->compile_flags.back(), "-DUSER=1");
}

// =============================================================================
// Rejections
// =============================================================================

TEST(FlagResolverTest, RejectsSanitizersOutsideSanitizerMode) {
    FlagResolver resolver(linuxOptions());
    auto profile = profileFor(BuildMode::kFuzzing);
    profile.sanitizers = SanitizerSet{Sanitizer::kAddress};
    auto flags = resolver.resolve(profile, clang());
    ASSERT_FALSE(flags);
    EXPECT_EQ(flags.error().code(), ErrorCode::kConfigurationError);
}

TEST(FlagResolverTest, RejectsExclusiveSanitizers) {
    FlagResolver resolver(linuxOptions());
    const SanitizerSet kBad[] = {
        {Sanitizer::kAddress, Sanitizer::kThread},
        {Sanitizer::kAddress, Sanitizer::kMemory},
        {Sanitizer::kThread, Sanitizer::kMemory},
        {Sanitizer::kLeak, Sanitizer::kThread},
        {Sanitizer::kLeak, Sanitizer::kMemory},
    };
    for (const auto& set : kBad) {
        auto profile = profileFor(BuildMode::kFuzzingWithSanitizers);
        profile.sanitizers = set;
        auto flags = resolver.resolve(profile, clang());
        ASSERT_FALSE(flags) << set.toString();
        EXPECT_EQ(flags.error().code(), ErrorCode::kIncompatibleSanitizers) << set.toString();
    }
}

TEST(FlagResolverTest, RejectsMemorySanitizerOnGcc) {
    FlagResolver resolver(linuxOptions());
    auto profile = profileFor(BuildMode::kFuzzingWithSanitizers);
    profile.sanitizers = SanitizerSet{Sanitizer::kMemory};
    EXPECT_FALSE(resolver.resolve(profile, gcc()));
    EXPECT_TRUE(resolver.resolve(profile, clang()));
}

TEST(FlagResolverTest, RejectsSanitizersWithUnknownToolchain) {
    FlagResolver resolver(linuxOptions());
    auto flags = resolver.resolve(profileFor(BuildMode::kFuzzingWithSanitizers), Toolchain{});
    ASSERT_FALSE(flags);
    EXPECT_EQ(flags.error().code(), ErrorCode::kUnsupportedToolchain);
}

TEST(FlagResolverTest, RejectsOldToolchains) {
    FlagResolver resolver(linuxOptions());
    EXPECT_FALSE(resolver.resolve(profileFor(BuildMode::kFuzzing), clang(5)));
    EXPECT_TRUE(resolver.resolve(profileFor(BuildMode::kFuzzing), clang(6)));
    EXPECT_FALSE(resolver.resolve(profileFor(BuildMode::kFuzzing), gcc(7)));
    EXPECT_TRUE(resolver.resolve(profileFor(BuildMode::kFuzzing), gcc(8)));
}

TEST(FlagResolverTest, InstrumentedModesNeedEngineLibraries) {
    FlagResolver resolver(ResolverOptions{});
    auto flags = resolver.resolve(profileFor(BuildMode::kFuzzing), clang());
    ASSERT_FALSE(flags);
    EXPECT_EQ(flags.error().code(), ErrorCode::kConfigurationError);
}

TEST(FlagResolverTest, ExtraFlagsCannotSmuggleExclusiveSanitizers) {
    FlagResolver resolver(linuxOptions());
    auto profile = profileFor(BuildMode::kFuzzingWithSanitizers);
    profile.sanitizers = SanitizerSet{Sanitizer::kAddress};
    profile.extra_flags = {"-fsanitize=thread"};
    auto flags = resolver.resolve(profile, clang());
    ASSERT_FALSE(flags);
    EXPECT_EQ(flags.error().code(), ErrorCode::kIncompatibleSanitizers);
}

TEST(FlagResolverTest, ExtraFlagsCannotInstrumentDebugBuilds) {
    FlagResolver resolver(linuxOptions());
    auto profile = profileFor(BuildMode::kDebugTriage);
    profile.extra_flags = {"-fsanitize-coverage=trace-pc"};
    EXPECT_FALSE(resolver.resolve(profile, clang()));
}

// =============================================================================
// Properties over every mode
// =============================================================================

TEST(FlagResolverPropertyTest, EveryModeIsInternallyConsistent) {
    FlagResolver resolver(linuxOptions());
    for (auto mode : kAllBuildModes) {
        for (const auto& tc : {clang(), gcc()}) {
            auto flags = resolver.resolve(profileFor(mode), tc);
            ASSERT_TRUE(flags) << buildModeName(mode) << " " << tc.id() << ": "
                               << flags.error().toString();
            EXPECT_EQ(flags->mode, mode);
            EXPECT_TRUE(validateFlagSet(*flags));

            bool has_coverage = hasPrefix(flags->compile_flags, "-fsanitize-coverage");
            EXPECT_EQ(has_coverage, isInstrumentedMode(mode)) << buildModeName(mode);
            EXPECT_EQ(!flags->sanitizers.empty(), mode == BuildMode::kFuzzingWithSanitizers);
            EXPECT_EQ(hasFlag(flags->definitions, "FUZZING_BUILD_MODE_UNSAFE_FOR_PRODUCTION"),
                      isFuzzingMode(mode));
        }
    }
}

TEST(FlagResolverPropertyTest, FingerprintStableAndDistinct) {
    FlagResolver resolver(linuxOptions());
    std::vector<uint64_t> seen;
    for (auto mode : kAllBuildModes) {
        auto a = resolver.resolve(profileFor(mode), clang());
        auto b = resolver.resolve(profileFor(mode), clang());
        ASSERT_TRUE(a && b);
        EXPECT_EQ(a->fingerprint(), b->fingerprint());
        EXPECT_EQ(std::find(seen.begin(), seen.end(), a->fingerprint()), seen.end());
        seen.push_back(a->fingerprint());
    }

    auto base = resolver.resolve(profileFor(BuildMode::kFuzzing), clang());
    auto other_compiler = resolver.resolve(profileFor(BuildMode::kFuzzing), clang(15));
    ASSERT_TRUE(base && other_compiler);
    EXPECT_NE(base->fingerprint(), other_compiler->fingerprint());
}

TEST(SanitizerSetTest, ParseAndFormat) {
    auto set = SanitizerSet::parse("undefined,address");
    ASSERT_TRUE(set);
    EXPECT_EQ(set->toString(), "address,undefined");
    EXPECT_TRUE(SanitizerSet::parse("")->empty());

    auto bad = SanitizerSet::parse("address,bogus");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::kInvalidArgument);
}

}  // namespace
}  // namespace build
}  // namespace hongg
