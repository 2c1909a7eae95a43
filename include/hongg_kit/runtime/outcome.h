#pragma once

// =============================================================================
// Hongg Kit - Iteration Outcome
// =============================================================================

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace hongg {
namespace runtime {

// The target returned normally
struct Completed {
    bool operator==(const Completed&) const { return true; }
};

// The target raised a fault (exception, abort, signal, sanitizer report)
struct CrashDetected {
    std::string reason;
    bool operator==(const CrashDetected& other) const { return reason == other.reason; }
};

// The engine closed the channel
struct EngineRequestedStop {
    bool operator==(const EngineRequestedStop&) const { return true; }
};

using IterationOutcome = std::variant<Completed, CrashDetected, EngineRequestedStop>;

inline std::string_view outcomeName(const IterationOutcome& outcome) {
    return std::visit(
        [](const auto& o) -> std::string_view {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Completed>) {
                return "Completed";
            } else if constexpr (std::is_same_v<T, CrashDetected>) {
                return "CrashDetected";
            } else {
                return "EngineRequestedStop";
            }
        },
        outcome);
}

[[nodiscard]] inline bool isCrash(const IterationOutcome& outcome) {
    return std::holds_alternative<CrashDetected>(outcome);
}

}  // namespace runtime
}  // namespace hongg
