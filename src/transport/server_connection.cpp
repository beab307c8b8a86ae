#include "transport/server_connection.h"
#include "config.h"
#include "logging.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <algorithm>
#include <chrono>
#include <future>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace photosync {

using boost::asio::ip::tcp;

ConnectionOptions ConnectionOptions::fromConfig()
{
    const auto& cfg = getAppConfig();
    ConnectionOptions o;
    o.queueCapacity = std::max<std::size_t>(1, cfg.send_queue_capacity);
    o.batchSize = std::max<std::size_t>(1, cfg.send_batch_size);
    o.batchPauseMs = cfg.send_batch_pause_ms;
    o.batchPauseFullMs = cfg.send_batch_pause_ms + (SEND_BATCH_PAUSE_FULL_MS - SEND_BATCH_PAUSE_MS);
    return o;
}

ServerConnection::ServerConnection() : ServerConnection(ConnectionOptions{}) {}

ServerConnection::ServerConnection(ConnectionOptions opts) : opts_(opts) {}

ServerConnection::~ServerConnection()
{
    disconnect();
}

bool ServerConnection::connect(const std::string& host, uint16_t port)
{
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    return connectLocked(host, port);
}

bool ServerConnection::connectLocked(const std::string& host, uint16_t port)
{
    teardown();
    host_ = host;
    port_ = port;

    io_ = std::make_unique<boost::asio::io_context>();
    socket_ = std::make_unique<tcp::socket>(*io_);
    try {
        tcp::resolver res(*io_);
        auto endpoints = res.resolve(host, std::to_string(port));
        boost::asio::connect(*socket_, endpoints);
    } catch (const boost::system::system_error& e) {
        LOG_W("[conn]") << "connect " << host << ':' << port << " failed: " << e.what();
        socket_.reset();
        io_.reset();
        return false;
    }
    applySocketOptions();

    {
        std::lock_guard<std::mutex> q(queueMutex_);
        sendQueue_.clear();
        closed_ = false;
    }
    inbound_.open();
    work_.emplace(boost::asio::make_work_guard(*io_));
    startRead();
    ioThread_ = std::thread([this] { io_->run(); });
    drainThread_ = std::thread(&ServerConnection::drainLoop, this);

    LOG_I("[conn]") << "connected to " << remoteId();
    return true;
}

void ServerConnection::applySocketOptions()
{
    boost::system::error_code ec;
    socket_->set_option(tcp::socket::keep_alive(true), ec);
    if (ec)
        LOG_W("[conn]") << "keepalive: " << ec.message();
    // Nagle stays on; the drain loop writes many small frames back to back.
    socket_->set_option(tcp::no_delay(false), ec);

    int secs = opts_.keepAliveIntervalS;
    int fd = socket_->native_handle();
#ifdef TCP_KEEPIDLE
    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &secs, sizeof(secs)) != 0)
        LOG_D("[conn]") << "TCP_KEEPIDLE not applied";
#endif
#ifdef TCP_KEEPINTVL
    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &secs, sizeof(secs)) != 0)
        LOG_D("[conn]") << "TCP_KEEPINTVL not applied";
#endif
}

void ServerConnection::startRead()
{
    socket_->async_read_some(
        boost::asio::buffer(readBuf_),
        [this](const boost::system::error_code& ec, std::size_t n) {
            if (ec) {
                if (ec == boost::asio::error::eof)
                    markClosed("peer closed the connection");
                else if (ec != boost::asio::error::operation_aborted)
                    markClosed("read error: " + ec.message());
                return;
            }
            NET_TRACE("[conn] rx {} bytes", n);
            inbound_.publish(readBuf_.data(), n);
            startRead();
        });
}

bool ServerConnection::sendData(std::vector<uint8_t> data)
{
    if (closed_) {
        LOG_D("[conn]") << "sendData on closed connection";
        return false;
    }
    std::unique_lock<std::mutex> lk(queueMutex_);
    while (sendQueue_.size() >= opts_.queueCapacity && !closed_)
        queueSpace_.wait_for(lk, std::chrono::milliseconds(opts_.backpressurePollMs));
    if (closed_)
        return false;

    sendQueue_.push_back(std::move(data));
    std::size_t depth = sendQueue_.size();
    std::size_t prev = maxDepth_.load();
    while (depth > prev && !maxDepth_.compare_exchange_weak(prev, depth)) {
    }
    lk.unlock();
    queueReady_.notify_one();
    return true;
}

void ServerConnection::drainLoop()
{
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(queueMutex_);
            queueReady_.wait(lk, [this] { return closed_.load() || !sendQueue_.empty(); });
            if (closed_)
                return;
        }

        for (std::size_t sent = 0; sent < opts_.batchSize; ++sent) {
            std::vector<uint8_t> chunk;
            {
                std::lock_guard<std::mutex> lk(queueMutex_);
                if (sendQueue_.empty())
                    break;
                chunk = std::move(sendQueue_.front());
                sendQueue_.pop_front();
            }
            queueSpace_.notify_all();
            if (!writeChunk(chunk))
                return;
        }

        // Pause only while backlog remains; an empty queue goes straight back
        // to waiting so a lone ack-gated frame is not delayed.
        std::unique_lock<std::mutex> lk(queueMutex_);
        if (sendQueue_.empty())
            continue;
        int pause = sendQueue_.size() >= opts_.queueCapacity ? opts_.batchPauseFullMs
                                                              : opts_.batchPauseMs;
        queueReady_.wait_for(lk, std::chrono::milliseconds(pause),
                             [this] { return closed_.load(); });
    }
}

bool ServerConnection::writeChunk(const std::vector<uint8_t>& chunk)
{
    auto done = std::make_shared<std::promise<boost::system::error_code>>();
    auto result = done->get_future();
    boost::asio::post(*io_, [this, &chunk, done] {
        boost::asio::async_write(*socket_, boost::asio::buffer(chunk),
                                 [done](const boost::system::error_code& ec, std::size_t) {
                                     done->set_value(ec);
                                 });
    });

    auto ec = result.get();
    if (ec) {
        if (ec != boost::asio::error::operation_aborted)
            markClosed("write error: " + ec.message());
        return false;
    }
    bytesWritten_ += chunk.size();
    NET_TRACE("[conn] tx {} bytes", chunk.size());
    return true;
}

void ServerConnection::markClosed(const std::string& reason)
{
    if (closed_.exchange(true))
        return;
    LOG_W("[conn]") << remoteId() << " closed: " << reason;
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        sendQueue_.clear();
    }
    queueReady_.notify_all();
    queueSpace_.notify_all();
    inbound_.close();
    if (io_)
        boost::asio::post(*io_, [this] { closeSocket(); });
}

void ServerConnection::closeSocket()
{
    if (!socket_ || !socket_->is_open())
        return;
    boost::system::error_code ec;
    // Drop the socket outright; no FIN handshake, no lingering Send-Q.
    socket_->set_option(boost::asio::socket_base::linger(true, 0), ec);
    socket_->close(ec);
}

void ServerConnection::teardown()
{
    if (!closed_.load()) {
        {
            std::lock_guard<std::mutex> lk(queueMutex_);
            closed_ = true;
            sendQueue_.clear();
        }
        queueReady_.notify_all();
        queueSpace_.notify_all();
        inbound_.close();
        if (io_)
            boost::asio::post(*io_, [this] { closeSocket(); });
        LOG_D("[conn]") << "disconnected " << remoteId();
    }
    if (drainThread_.joinable())
        drainThread_.join();
    work_.reset();
    if (ioThread_.joinable())
        ioThread_.join();
    socket_.reset();
    io_.reset();

    std::lock_guard<std::mutex> lk(queueMutex_);
    sendQueue_.clear();
}

void ServerConnection::disconnect()
{
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    teardown();
}

bool ServerConnection::reconnect()
{
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    if (host_.empty())
        return false;
    teardown();
    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.reconnectCooldownMs));
    LOG_I("[conn]") << "reconnecting to " << remoteId();
    return connectLocked(host_, port_);
}

bool ServerConnection::forceReconnect()
{
    std::lock_guard<std::mutex> lk(lifecycleMutex_);
    if (host_.empty())
        return false;
    teardown();
    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.forceReconnectCooldownMs));
    LOG_I("[conn]") << "force reconnecting to " << remoteId();
    return connectLocked(host_, port_);
}

bool ServerConnection::ensureConnected()
{
    if (!closed_)
        return true;
    return reconnect();
}

bool ServerConnection::isClosed() const
{
    return closed_.load();
}

std::string ServerConnection::remoteId() const
{
    return host_ + ':' + std::to_string(port_);
}

std::shared_ptr<InboundSubscription> ServerConnection::subscribe()
{
    return inbound_.subscribe();
}

std::size_t ServerConnection::queuedChunks() const
{
    std::lock_guard<std::mutex> lk(queueMutex_);
    return sendQueue_.size();
}

} // namespace photosync
