// =============================================================================
// Hongg Kit - Engine Channel Implementation
// =============================================================================

#include "hongg_kit/runtime/channel.h"

#include "hongg_kit/common.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>

// Defined in libhfuzz (persistent.c)
extern "C" HONGG_WEAK void HF_ITER(const uint8_t** buf_ptr, size_t* len_ptr);

namespace hongg {
namespace runtime {

EngineFetchFn engineFetchFunction() {
    return &HF_ITER;
}

HonggfuzzChannel::HonggfuzzChannel(EngineFetchFn fetch, size_t max_input_size)
    : fetch_(fetch), max_input_size_(max_input_size) {}

Result<ChannelEvent> HonggfuzzChannel::awaitInput(std::vector<uint8_t>& buffer) {
    buffer.clear();

    if (!fetch_) {
        HONGG_RETURN_ERROR(ErrorCode::kProtocolViolation,
                           "persistent mode needs libhfuzz, which is not linked into this "
                           "binary; rebuild it with `hongg build`");
    }

    const uint8_t* data = nullptr;
    size_t size = 0;
    fetch_(&data, &size);
    ++fetches_;

    if (size > max_input_size_) {
        HONGG_RETURN_ERROR(ErrorCode::kProtocolViolation,
                           fmt::format("input of {} bytes exceeds the {} byte limit", size,
                                       max_input_size_));
    }
    if (size > 0 && data == nullptr) {
        HONGG_RETURN_ERROR(ErrorCode::kProtocolViolation,
                           fmt::format("engine announced {} bytes without a buffer", size));
    }

    buffer.assign(data, data + size);
    spdlog::trace("Received input of {} bytes", size);
    return ChannelEvent::kInputReady;
}

Result<void> HonggfuzzChannel::reportCompleted() {
    return {};
}

bool channelAvailable(int fd) {
    return ::fcntl(fd, F_GETFD) != -1;
}

}  // namespace runtime
}  // namespace hongg
