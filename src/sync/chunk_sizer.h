#pragma once
#include <cstddef>
#include "constants.h"

namespace photosync {

/**
 * Grows the chunk size by a fixed step after every acknowledged chunk whose
 * round trip stayed under the target, and freezes at the first slow one.
 * Once frozen the size never changes for the rest of the transfer.
 */
class AdaptiveChunkSizer {
public:
    AdaptiveChunkSizer(std::size_t initial = CHUNK_INITIAL_SIZE,
                       std::size_t step = CHUNK_SIZE_STEP,
                       int rttTargetMs = CHUNK_RTT_TARGET_MS);

    std::size_t current() const { return size_; }
    bool stabilized() const { return stable_; }
    long lastRttMs() const { return lastRtt_; }

    // Feed the RTT of the chunk just acknowledged.
    void onAck(long rttMs);

private:
    std::size_t size_;
    std::size_t step_;
    int target_;
    bool stable_{false};
    long lastRtt_{0};
};

} // namespace photosync
