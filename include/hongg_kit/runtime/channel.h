#pragma once

// =============================================================================
// Hongg Kit - Engine Channel
// =============================================================================
//
// Persistent-mode link between the harness and honggfuzz. The framing is the
// engine's: libhfuzz's HF_ITER() tells the engine the process is ready on
// fd 1023, blocks until the next input arrives and returns a pointer into
// the engine's shared input mapping. Every input, the first included, is
// fetched with exactly one HF_ITER() call; calling it again is what
// acknowledges the previous iteration.
//
// When the engine closes the session libhfuzz ends the process itself, so
// HF_ITER() never returns a shutdown indication.
//
// HF_ITER is referenced weakly. Debug and coverage builds do not link
// libhfuzz and never enter persistent mode.
//

#include "hongg_kit/error.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hongg {
namespace runtime {

// Descriptor honggfuzz hands persistent-mode targets
inline constexpr int kControlFd = 1023;

// Engine's hard ceiling on input size
inline constexpr size_t kDefaultMaxInputSize = size_t{1} << 30;

enum class ChannelEvent : uint8_t {
    kInputReady,  // Buffer holds the next input
    kStop,        // Engine ended the session
};

// =============================================================================
// EngineChannel Interface
// =============================================================================

class EngineChannel {
  public:
    virtual ~EngineChannel() = default;

    // Block until the engine supplies an input or ends the session. The
    // buffer is cleared first so nothing survives from the last iteration.
    virtual Result<ChannelEvent> awaitInput(std::vector<uint8_t>& buffer) = 0;

    // Tell the engine the current input was processed without a crash
    virtual Result<void> reportCompleted() = 0;
};

// =============================================================================
// HonggfuzzChannel
// =============================================================================

// Signature of libhfuzz's HF_ITER
using EngineFetchFn = void (*)(const uint8_t** buf_ptr, size_t* len_ptr);

// HF_ITER when libhfuzz is linked in, nullptr otherwise
[[nodiscard]] EngineFetchFn engineFetchFunction();

[[nodiscard]] inline bool engineRuntimeLinked() {
    return engineFetchFunction() != nullptr;
}

class HonggfuzzChannel final : public EngineChannel {
  public:
    explicit HonggfuzzChannel(EngineFetchFn fetch = engineFetchFunction(),
                              size_t max_input_size = kDefaultMaxInputSize);

    // Copies the input out of the engine's mapping, which the engine
    // rewrites as soon as the next fetch starts
    Result<ChannelEvent> awaitInput(std::vector<uint8_t>& buffer) override;

    // Nothing to send: the next HF_ITER() call carries the ready tag
    Result<void> reportCompleted() override;

    [[nodiscard]] uint64_t fetches() const { return fetches_; }

  private:
    EngineFetchFn fetch_;
    size_t max_input_size_;
    uint64_t fetches_ = 0;
};

// True if `fd` refers to an open descriptor
[[nodiscard]] bool channelAvailable(int fd = kControlFd);

}  // namespace runtime
}  // namespace hongg
