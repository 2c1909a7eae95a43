#pragma once

// =============================================================================
// Hongg Kit - Main Header
// =============================================================================
//
// Build, launch and replay honggfuzz targets built with CMake.
//
// Include this header for the orchestration API. Fuzz targets only need
// "hongg_kit/runtime/harness.h".
//

#include "hongg_kit/build/build_profile.h"
#include "hongg_kit/build/engine_builder.h"
#include "hongg_kit/build/flag_resolver.h"
#include "hongg_kit/build/target_builder.h"
#include "hongg_kit/common.h"
#include "hongg_kit/config/settings.h"
#include "hongg_kit/error.h"
#include "hongg_kit/launch/launcher.h"
#include "hongg_kit/process/process_runner.h"

#include <string>

namespace hongg {

// =============================================================================
// Version Information
// =============================================================================

struct Version {
    static constexpr int major = HONGG_VERSION_MAJOR;
    static constexpr int minor = HONGG_VERSION_MINOR;
    static constexpr int patch = HONGG_VERSION_PATCH;

    static std::string string() {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

}  // namespace hongg
