// =============================================================================
// Hongg Kit - Sanitizer List Fuzz Target
// =============================================================================

#include "hongg_kit/build/build_profile.h"
#include "hongg_kit/runtime/harness.h"

#include <stdexcept>
#include <string>

int main(int argc, char** argv) {
    return hongg::runtime::fuzzMainTyped<std::string>(argc, argv, [](std::string list) {
        auto parsed = hongg::build::SanitizerSet::parse(list);
        if (!parsed) {
            return;
        }

        // Rendering and parsing again must give the same set
        auto again = hongg::build::SanitizerSet::parse(parsed->toString());
        if (!parsed->empty() && (!again || !(*again == *parsed))) {
            throw std::logic_error("sanitizer list does not round-trip: " + list);
        }
    });
}
