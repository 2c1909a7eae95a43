#pragma once

// =============================================================================
// Hongg Kit - Common Definitions
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <string_view>

// Version information
#define HONGG_VERSION_MAJOR 0
#define HONGG_VERSION_MINOR 5
#define HONGG_VERSION_PATCH 61

namespace hongg {

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define HONGG_PLATFORM_WINDOWS 1
    #define HONGG_OS_NAME "windows"
#elif defined(__APPLE__)
    #define HONGG_PLATFORM_MACOS 1
    #define HONGG_OS_NAME "apple-darwin"
#elif defined(__ANDROID__)
    #define HONGG_PLATFORM_ANDROID 1
    #define HONGG_OS_NAME "linux-android"
#elif defined(__linux__)
    #define HONGG_PLATFORM_LINUX 1
    #define HONGG_OS_NAME "linux-gnu"
#elif defined(__FreeBSD__)
    #define HONGG_PLATFORM_BSD 1
    #define HONGG_OS_NAME "unknown-freebsd"
#elif defined(__NetBSD__) || defined(__OpenBSD__)
    #define HONGG_PLATFORM_BSD 1
    #define HONGG_OS_NAME "unknown-bsd"
#else
    #define HONGG_PLATFORM_UNKNOWN 1
    #define HONGG_OS_NAME "unknown"
#endif

#if !defined(HONGG_PLATFORM_WINDOWS)
    #define HONGG_PLATFORM_POSIX 1
#endif

// =============================================================================
// Architecture Detection (architectures honggfuzz supports)
// =============================================================================

#if defined(__x86_64__) || defined(_M_X64)
    #define HONGG_ARCH_X86_64 1
    #define HONGG_ARCH_NAME "x86_64"
#elif defined(__i386__) || defined(_M_IX86) || defined(__i686__)
    #define HONGG_ARCH_X86_32 1
    #define HONGG_ARCH_NAME "i686"
#elif defined(__aarch64__) || defined(_M_ARM64)
    #define HONGG_ARCH_ARM64 1
    #define HONGG_ARCH_NAME "aarch64"
#elif defined(__arm__) || defined(_M_ARM)
    #define HONGG_ARCH_ARM32 1
    #define HONGG_ARCH_NAME "armv7"
#else
    #define HONGG_ARCH_UNKNOWN 1
    #define HONGG_ARCH_NAME "unknown"
#endif

// Host target triple, e.g. "x86_64-linux-gnu"
inline constexpr std::string_view kHostTriple = HONGG_ARCH_NAME "-" HONGG_OS_NAME;

// =============================================================================
// Compiler Attributes
// =============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define HONGG_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define HONGG_USED __attribute__((used))
    #define HONGG_EXPORT __attribute__((visibility("default")))
    #define HONGG_WEAK __attribute__((weak))
#else
    #define HONGG_UNLIKELY(x) (x)
    #define HONGG_USED
    #define HONGG_EXPORT
    #define HONGG_WEAK
#endif

// =============================================================================
// Debug Macros
// =============================================================================

#ifdef NDEBUG
    #define HONGG_ASSERT(cond) ((void)0)
#else
    #define HONGG_ASSERT(cond)                                  \
        do {                                                    \
            if (HONGG_UNLIKELY(!(cond))) {                      \
                hongg::assertFailed(#cond, __FILE__, __LINE__); \
            }                                                   \
        } while (0)
#endif

// Assert failure handler (implemented in error.cc)
[[noreturn]] void assertFailed(const char* cond, const char* file, int line);

// =============================================================================
// Utility Types
// =============================================================================

// Non-copyable base class
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

}  // namespace hongg
