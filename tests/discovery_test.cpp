#include "discovery/device_finder.h"
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace photosync;
using boost::asio::ip::udp;

static void testBroadcastMath() {
    assert(DeviceFinder::calculateBroadcastAddress("192.168.1.23", "255.255.255.0").value() == "192.168.1.255");
    assert(DeviceFinder::calculateBroadcastAddress("10.1.2.3", "255.0.0.0").value() == "10.255.255.255");
    assert(DeviceFinder::calculateBroadcastAddress("172.16.5.4", "255.255.240.0").value() == "172.16.15.255");
    assert(!DeviceFinder::calculateBroadcastAddress("192.168.1", "255.255.255.0"));
    assert(!DeviceFinder::calculateBroadcastAddress("192.168.1.1", "mask"));

    DiscoveryOptions opts;
    opts.broadcastAddress = "10.0.0.255";
    assert(DeviceFinder::resolveBroadcastTarget(opts) == "10.0.0.255");
}

static void testReplyParsing() {
    auto a = DeviceFinder::parseReply("photo_server:Living Room,IP:192.168.1.40");
    assert(a.name == "Living Room" && a.ipAddress == "192.168.1.40");

    auto b = DeviceFinder::parseReply("IP:10.0.0.7,photo_server:nas\r\n");
    assert(b.name == "nas" && b.ipAddress == "10.0.0.7");

    auto c = DeviceFinder::parseReply("IP:10.0.0.8");
    assert(c.name == "Unknown" && c.ipAddress == "10.0.0.8");

    auto d = DeviceFinder::parseReply("garbage");
    assert(d.name == "Unknown" && d.ipAddress.empty());
}

static void testLoopbackExchange() {
    boost::asio::io_context io;
    udp::socket responder(io, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    const uint16_t port = responder.local_endpoint().port();

    std::string seenQuery;
    std::thread server([&] {
        char buf[256];
        udp::endpoint from;
        boost::system::error_code ec;
        std::size_t n = responder.receive_from(boost::asio::buffer(buf), from, 0, ec);
        if (ec)
            return;
        seenQuery.assign(buf, n);
        responder.send_to(boost::asio::buffer(std::string("photo_server:alpha,IP:127.0.0.1")), from, 0, ec);
        responder.send_to(boost::asio::buffer(std::string("photo_server:beta,IP:127.0.0.2")), from, 0, ec);
    });

    DiscoveryOptions opts;
    opts.port = port;
    opts.windowMs = 600;
    opts.broadcastAddress = "127.0.0.1";

    auto start = std::chrono::steady_clock::now();
    auto devices = DeviceFinder::discover(opts);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    server.join();

    assert(seenQuery == "who is photo server?");
    assert(devices.size() == 2);
    assert(devices[0].name == "alpha" && devices[0].ipAddress == "127.0.0.1");
    assert(devices[1].name == "beta" && devices[1].ipAddress == "127.0.0.2");
    // The window runs to the end even after replies arrive.
    assert(elapsed >= 550);
}

static void testCancelledAndSilent() {
    DiscoveryOptions opts;
    opts.port = 9; // discard; nobody answers
    opts.windowMs = 5000;
    opts.broadcastAddress = "127.0.0.1";

    CancellationSource cancel;
    cancel.cancel();
    auto start = std::chrono::steady_clock::now();
    auto devices = DeviceFinder::discover(opts, cancel.getToken());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    assert(devices.empty());
    assert(elapsed < 1000);

    opts.windowMs = 200;
    DiscoverySession session(opts);
    assert(session.start());
    assert(session.target() == "127.0.0.1");
    DeviceInfo info;
    assert(!session.next(info));
    assert(!session.next(info));

    opts.broadcastAddress = "not-an-address";
    DiscoverySession bad(opts);
    assert(!bad.start());
}

int main() {
    testBroadcastMath();
    testReplyParsing();
    testLoopbackExchange();
    testCancelledAndSilent();
    std::cout << "Discovery tests OK\n";
    return 0;
}
