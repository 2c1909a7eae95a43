// =============================================================================
// Hongg Kit - Compiler Version Parser Fuzz Target
// =============================================================================

#include "hongg_kit/build/flag_resolver.h"
#include "hongg_kit/runtime/harness.h"

#include <stdexcept>
#include <string_view>

int main(int argc, char** argv) {
    return hongg::runtime::fuzzMain(argc, argv, [](std::span<const uint8_t> data) {
        std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
        auto tc = hongg::build::Toolchain::fromVersionOutput(text);

        if (tc.kind == hongg::build::CompilerKind::kUnknown && (tc.major != 0 || tc.minor != 0)) {
            throw std::logic_error("unknown compiler with a version");
        }
        if (tc.major < 0 || tc.minor < 0) {
            throw std::logic_error("negative version component");
        }
        (void)tc.id();
    });
}
