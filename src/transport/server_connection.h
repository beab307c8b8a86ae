#pragma once
#include "transport.h"
#include "constants.h"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace photosync {

struct ConnectionOptions {
    std::size_t queueCapacity = SEND_QUEUE_CAPACITY;
    std::size_t batchSize = SEND_BATCH_SIZE;
    int batchPauseMs = SEND_BATCH_PAUSE_MS;
    int batchPauseFullMs = SEND_BATCH_PAUSE_FULL_MS;
    int backpressurePollMs = SEND_BACKPRESSURE_POLL_MS;
    int keepAliveIntervalS = TCP_KEEPALIVE_INTERVAL_S;
    int reconnectCooldownMs = RECONNECT_COOLDOWN_MS;
    int forceReconnectCooldownMs = FORCE_RECONNECT_COOLDOWN_MS;

    // Pacing values from the loaded AppConfig.
    static ConnectionOptions fromConfig();
};

/**
 * Concrete Boost-Asio TCP connection to one photo server.
 *
 * All socket operations run on a private io_context thread. A second thread
 * drains the bounded outbound queue so sendData() can block producers while
 * the OS send buffer catches up.
 */
class ServerConnection : public Transport {
public:
    ServerConnection();
    explicit ServerConnection(ConnectionOptions opts);
    ~ServerConnection() override;

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    bool         connect(const std::string& host, uint16_t port) override;
    void         disconnect() override;
    bool         reconnect() override;
    bool         forceReconnect() override;
    bool         ensureConnected() override;

    bool         sendData(std::vector<uint8_t> data) override;

    bool         isClosed() const override;
    std::string  remoteId() const override;
    std::shared_ptr<InboundSubscription> subscribe() override;

    // Diagnostics
    std::size_t  queuedChunks() const;
    std::size_t  maxQueueDepth() const { return maxDepth_.load(); }
    uint64_t     bytesWritten() const { return bytesWritten_.load(); }

private:
    bool connectLocked(const std::string& host, uint16_t port);
    void startRead();
    void drainLoop();
    bool writeChunk(const std::vector<uint8_t>& chunk);
    void markClosed(const std::string& reason);
    void closeSocket();
    void applySocketOptions();
    void teardown();

    ConnectionOptions opts_;
    std::string host_;
    uint16_t port_{0};

    std::unique_ptr<boost::asio::io_context> io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
    std::thread ioThread_;
    std::thread drainThread_;
    std::array<uint8_t, READ_BUFFER_SIZE> readBuf_{};

    std::deque<std::vector<uint8_t>> sendQueue_;
    mutable std::mutex queueMutex_;
    std::condition_variable queueReady_;  // drain side
    std::condition_variable queueSpace_;  // producer side

    std::atomic<bool> closed_{true};
    std::atomic<std::size_t> maxDepth_{0};
    std::atomic<uint64_t> bytesWritten_{0};

    // Serializes connect/disconnect/reconnect.
    std::mutex lifecycleMutex_;
    InboundStream inbound_;
};

} // namespace photosync
