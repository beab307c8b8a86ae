#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace photosync {

struct ProgressEvent {
    std::string fileId;
    uint64_t bytesSent{0};
    uint64_t totalBytes{0};
};

/**
 * Unbounded single-consumer queue of upload progress. The engine pushes after
 * every acknowledged chunk; the caller drains at its own pace.
 */
class ProgressChannel {
public:
    void push(ProgressEvent ev) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (closed)
                return;
            events.push_back(std::move(ev));
        }
        cv.notify_one();
    }

    std::optional<ProgressEvent> tryPop() {
        std::lock_guard<std::mutex> lk(mutex);
        if (events.empty())
            return std::nullopt;
        ProgressEvent ev = std::move(events.front());
        events.pop_front();
        return ev;
    }

    // Empty result means timeout or closed-and-drained.
    std::optional<ProgressEvent> waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mutex);
        cv.wait_for(lk, timeout, [this] { return !events.empty() || closed; });
        if (events.empty())
            return std::nullopt;
        ProgressEvent ev = std::move(events.front());
        events.pop_front();
        return ev;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lk(mutex);
        return closed;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mutex);
        return events.size();
    }

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<ProgressEvent> events;
    bool closed{false};
};

} // namespace photosync
