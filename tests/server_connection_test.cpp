#include "test_server.h"
#include "transport/server_connection.h"
#include <cassert>
#include <chrono>
#include <iostream>

using namespace photosync;
using namespace testing_support;
using namespace std::chrono_literals;

static uint16_t unusedPort() {
    boost::asio::io_context io;
    tcp::acceptor a(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    return a.local_endpoint().port();
}

static bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
    auto end = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < end) {
        if (pred())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

static void testUnreachable() {
    ServerConnection conn;
    assert(!conn.connect("127.0.0.1", unusedPort()));
    assert(conn.isClosed());
    assert(!conn.sendData({1, 2, 3}));
}

static void testBackpressure() {
    constexpr std::size_t kChunk = 256 * 1024;
    constexpr std::size_t kChunks = 128;
    std::atomic<std::size_t> received{0};
    std::atomic<bool> inOrder{true};

    FakeServer server([&](FakePeer& peer) {
        // Stall long enough for the kernel buffers and the queue to fill.
        std::this_thread::sleep_for(800ms);
        std::vector<uint8_t> buf(64 * 1024);
        boost::system::error_code ec;
        while (received < kChunk * kChunks) {
            std::size_t n = peer.sock.read_some(boost::asio::buffer(buf), ec);
            if (ec)
                return;
            for (std::size_t i = 0; i < n; ++i) {
                std::size_t pos = received + i;
                if (buf[i] != static_cast<uint8_t>((pos / kChunk) % 251))
                    inOrder = false;
            }
            received += n;
        }
    });

    {
        ServerConnection conn;
        assert(conn.connect("127.0.0.1", server.port()));
        assert(!conn.isClosed());

        std::atomic<bool> producerDone{false};
        std::thread producer([&] {
            for (std::size_t i = 0; i < kChunks; ++i) {
                bool ok = conn.sendData(std::vector<uint8_t>(kChunk, static_cast<uint8_t>(i % 251)));
                assert(ok);
            }
            producerDone = true;
        });

        std::this_thread::sleep_for(400ms);
        assert(!producerDone);                 // blocked on a full queue
        assert(conn.queuedChunks() <= SEND_QUEUE_CAPACITY);

        producer.join();
        assert(waitFor([&] { return received == kChunk * kChunks; }, 20000ms));
        assert(inOrder);
        assert(conn.maxQueueDepth() <= SEND_QUEUE_CAPACITY);
        assert(conn.bytesWritten() == kChunk * kChunks);
        conn.disconnect();
        assert(conn.isClosed());
        assert(!conn.sendData({1}));
    }
}

static void testPeerCloseAndReconnect() {
    FakeServer server([](FakePeer& peer) {
        auto f = peer.readFrame();
        if (f && f->payloadText() == "echo")
            peer.send(PacketType::SYNC_COMPLETE, std::string("OK:echo"));
        // returning closes the socket
    });

    ServerConnection conn;
    assert(conn.connect("127.0.0.1", server.port()));
    auto sub = conn.subscribe();
    assert(conn.sendData(FrameCodec::encode(PacketType::SYNC_START, std::string("echo"))));

    // Bytes come back on the subscription, then the stream closes.
    std::vector<uint8_t> got, chunk;
    InboundSubscription::WaitResult r;
    while ((r = sub->next(chunk, 3000ms)) == InboundSubscription::WaitResult::Data)
        got.insert(got.end(), chunk.begin(), chunk.end());
    assert(r == InboundSubscription::WaitResult::Closed);
    auto dec = FrameCodec::decode(got);
    assert(dec.status == DecodeStatus::Complete && dec.frame.payloadText() == "OK:echo");
    assert(waitFor([&] { return conn.isClosed(); }, 2000ms));
    assert(!conn.sendData({1}));

    // ensureConnected rebuilds a dead connection; reconnect always does.
    assert(conn.ensureConnected());
    assert(!conn.isClosed());
    assert(conn.ensureConnected());
    assert(conn.reconnect());
    assert(!conn.isClosed());
    conn.disconnect();
    assert(waitFor([&] { return server.connections() == 3; }, 2000ms));
}

int main() {
    testUnreachable();
    testBackpressure();
    testPeerCloseAndReconnect();
    std::cout << "Server connection tests OK\n";
    return 0;
}
