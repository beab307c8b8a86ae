#include "sync/chunk_sizer.h"
#include "logging.h"

namespace photosync {

AdaptiveChunkSizer::AdaptiveChunkSizer(std::size_t initial, std::size_t step, int rttTargetMs)
    : size_(initial), step_(step), target_(rttTargetMs) {}

void AdaptiveChunkSizer::onAck(long rttMs)
{
    lastRtt_ = rttMs;
    if (stable_)
        return;
    if (rttMs < target_) {
        size_ += step_;
        return;
    }
    stable_ = true;
    LOG_D("[chunk]") << "size frozen at " << size_ << " bytes (rtt " << rttMs << "ms)";
}

} // namespace photosync
