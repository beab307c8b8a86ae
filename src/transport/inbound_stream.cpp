#include "inbound_stream.h"
#include <algorithm>

namespace photosync {

InboundSubscription::WaitResult
InboundSubscription::next(std::vector<uint8_t>& out, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, timeout, [this] { return !chunks.empty() || closed; });
    if (!chunks.empty()) {
        out = std::move(chunks.front());
        chunks.pop_front();
        return WaitResult::Data;
    }
    return closed ? WaitResult::Closed : WaitResult::TimedOut;
}

bool InboundSubscription::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

void InboundSubscription::push(const uint8_t* data, std::size_t len)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed)
            return;
        chunks.emplace_back(data, data + len);
    }
    cv.notify_all();
}

void InboundSubscription::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    cv.notify_all();
}

std::shared_ptr<InboundSubscription> InboundStream::subscribe()
{
    auto sub = std::make_shared<InboundSubscription>();
    std::lock_guard<std::mutex> lock(mutex);
    if (!isOpen) {
        sub->close();
        return sub;
    }
    subs.push_back(sub);
    return sub;
}

void InboundStream::publish(const uint8_t* data, std::size_t len)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (!isOpen)
        return;
    subs.erase(std::remove_if(subs.begin(), subs.end(),
                              [](const std::weak_ptr<InboundSubscription>& w) { return w.expired(); }),
               subs.end());
    for (auto& w : subs) {
        if (auto s = w.lock())
            s->push(data, len);
    }
}

void InboundStream::open()
{
    std::lock_guard<std::mutex> lock(mutex);
    isOpen = true;
}

void InboundStream::close()
{
    std::vector<std::weak_ptr<InboundSubscription>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex);
        isOpen = false;
        drained.swap(subs);
    }
    for (auto& w : drained) {
        if (auto s = w.lock())
            s->close();
    }
}

} // namespace photosync
