#pragma once
// In-process photo server for the networked tests. Each accepted connection
// runs the supplied handler on the server thread with blocking I/O.
#include "constants.h"
#include "sync/payloads.h"
#include "wire/frame_codec.h"
#include <atomic>
#include <boost/asio.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace testing_support {

using boost::asio::ip::tcp;
using namespace photosync;

class FakePeer {
public:
    explicit FakePeer(tcp::socket s) : sock(std::move(s)) {}

    std::optional<Frame> readFrame() {
        uint8_t header[FRAME_HEADER_SIZE];
        boost::system::error_code ec;
        boost::asio::read(sock, boost::asio::buffer(header), ec);
        if (ec)
            return std::nullopt;
        uint32_t len = FrameCodec::readUint32BE(header + 1);
        std::vector<uint8_t> payload(len);
        if (len) {
            boost::asio::read(sock, boost::asio::buffer(payload), ec);
            if (ec)
                return std::nullopt;
        }
        return Frame(static_cast<PacketType>(header[0]), std::move(payload));
    }

    bool sendRaw(const std::vector<uint8_t>& bytes) {
        boost::system::error_code ec;
        boost::asio::write(sock, boost::asio::buffer(bytes), ec);
        return !ec;
    }

    bool send(PacketType type, const std::string& payload) {
        return sendRaw(FrameCodec::encode(type, payload));
    }

    bool send(PacketType type, const std::vector<uint8_t>& payload) {
        return sendRaw(FrameCodec::encode(type, payload));
    }

    bool ack(const std::string& id) {
        return send(PacketType::SYNC_COMPLETE, Payloads::ackText(id));
    }

    void close() {
        boost::system::error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }

    tcp::socket sock;
};

class FakeServer {
public:
    using Handler = std::function<void(FakePeer&)>;

    explicit FakeServer(Handler h)
        : handler(std::move(h)),
          acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        serverPort = acceptor.local_endpoint().port();
        worker = std::thread([this] { acceptLoop(); });
    }

    ~FakeServer() {
        stopping = true;
        // Wake a blocked accept().
        boost::system::error_code ec;
        boost::asio::io_context wake;
        tcp::socket s(wake);
        s.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), serverPort), ec);
        worker.join();
    }

    uint16_t port() const { return serverPort; }
    int connections() const { return accepted.load(); }

private:
    void acceptLoop() {
        while (!stopping) {
            boost::system::error_code ec;
            tcp::socket s(io);
            acceptor.accept(s, ec);
            if (ec || stopping)
                return;
            ++accepted;
            FakePeer peer(std::move(s));
            handler(peer);
            peer.close();
        }
    }

    Handler handler;
    boost::asio::io_context io;
    tcp::acceptor acceptor;
    uint16_t serverPort{0};
    std::thread worker;
    std::atomic<bool> stopping{false};
    std::atomic<int> accepted{0};
};

// What a cooperative server saw during a session.
struct ServerLog {
    std::mutex m;
    std::vector<std::string> uploadedIds;
    std::vector<std::size_t> chunkSizes;
    std::vector<uint8_t> chunkedBytes;
    std::string deviceName;
    int syncCompletes{0};

    void add(const std::string& id) {
        std::lock_guard<std::mutex> lk(m);
        uploadedIds.push_back(id);
    }
};

// Acknowledges every upload the way a well-behaved server does. Ids listed in
// `reject` get a mismatched ack instead.
inline void serveAcks(FakePeer& peer, ServerLog& log, const std::vector<std::string>& reject = {}) {
    std::string chunkedId;
    while (auto f = peer.readFrame()) {
        switch (f->type) {
        case PacketType::SYNC_START: {
            std::lock_guard<std::mutex> lk(log.m);
            log.deviceName = f->payloadText();
            break;
        }
        case PacketType::PHOTO:
        case PacketType::VIDEO: {
            auto p = Payloads::decodeMediaPacket(f->payloadText());
            if (!p)
                return;
            bool bad = false;
            for (const auto& r : reject)
                bad = bad || r == p->id;
            if (bad) {
                peer.ack("SOMETHING_ELSE");
                break;
            }
            log.add(p->id);
            peer.ack(p->id);
            break;
        }
        case PacketType::CHUNKED_VIDEO_START: {
            auto s = Payloads::decodeChunkedStart(f->payloadText());
            if (!s)
                return;
            chunkedId = s->id;
            peer.ack(std::string(ACK_START));
            break;
        }
        case PacketType::CHUNKED_VIDEO_DATA: {
            auto c = Payloads::decodeChunkData(f->payloadText());
            if (!c)
                return;
            {
                std::lock_guard<std::mutex> lk(log.m);
                log.chunkSizes.push_back(c->bytes.size());
                log.chunkedBytes.insert(log.chunkedBytes.end(), c->bytes.begin(), c->bytes.end());
            }
            peer.ack(std::string(ACK_CHUNK_PREFIX) + std::to_string(c->chunkIndex));
            break;
        }
        case PacketType::CHUNKED_VIDEO_COMPLETE: {
            auto c = Payloads::decodeChunkedComplete(f->payloadText());
            if (!c)
                return;
            log.add(c->id);
            peer.ack(c->id);
            break;
        }
        case PacketType::SYNC_COMPLETE: {
            {
                std::lock_guard<std::mutex> lk(log.m);
                ++log.syncCompletes;
            }
            peer.ack(std::string(SYNC_COMPLETE_ID));
            break;
        }
        default:
            return;
        }
    }
}

} // namespace testing_support
