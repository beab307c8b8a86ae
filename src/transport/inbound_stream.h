#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace photosync {

/**
 * One listener on an InboundStream. Chunks published after subscribe() are
 * queued here until the owner pulls them; nothing published earlier is seen.
 */
class InboundSubscription {
public:
    enum class WaitResult { Data, TimedOut, Closed };

    // Blocks up to `timeout` for the next chunk. Buffered chunks are still
    // handed out after the stream closes; Closed is returned once drained.
    WaitResult next(std::vector<uint8_t>& out, std::chrono::milliseconds timeout);

    bool isClosed() const;

private:
    friend class InboundStream;
    void push(const uint8_t* data, std::size_t len);
    void close();

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::vector<uint8_t>> chunks;
    bool closed{false};
};

/**
 * Broadcast channel of raw inbound byte chunks for one connection lifetime.
 * close() ends the current generation; open() starts a new one so stale
 * subscribers from a previous socket never see the new socket's bytes.
 */
class InboundStream {
public:
    std::shared_ptr<InboundSubscription> subscribe();
    void publish(const uint8_t* data, std::size_t len);
    void open();
    void close();

private:
    std::mutex mutex;
    std::vector<std::weak_ptr<InboundSubscription>> subs;
    bool isOpen{false};
};

} // namespace photosync
