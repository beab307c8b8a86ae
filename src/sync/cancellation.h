#pragma once
#include <atomic>
#include <memory>

namespace photosync {

// Read side handed to blocking operations. A default-constructed token is
// never cancelled.
class CancellationToken {
    struct State {
        std::atomic<bool> requested{false};
    };
    std::shared_ptr<State> state;

public:
    CancellationToken() = default;

    bool isCancellationRequested() const {
        return state && state->requested.load(std::memory_order_acquire);
    }

    friend class CancellationSource;
};

// Owner side, held by whoever may abort the work (CLI signal handler, tests).
class CancellationSource {
    CancellationToken token;

public:
    CancellationSource() { token.state = std::make_shared<CancellationToken::State>(); }

    void cancel() {
        token.state->requested.store(true, std::memory_order_release);
    }

    bool isCancellationRequested() const { return token.isCancellationRequested(); }

    CancellationToken getToken() const { return token; }

    // Fresh state; tokens handed out earlier stay cancelled.
    void reset() { token.state = std::make_shared<CancellationToken::State>(); }
};

} // namespace photosync
