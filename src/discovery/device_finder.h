#pragma once
#include <array>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "constants.h"
#include "sync/cancellation.h"

namespace photosync {

struct DeviceInfo {
    std::string name;
    std::string ipAddress; // empty when the reply carried no IP field
};

struct DiscoveryOptions {
    uint16_t port = DEFAULT_DISCOVERY_PORT;
    int windowMs = DEFAULT_DISCOVERY_WINDOW_MS;
    // Explicit target; empty means derive from the first usable interface.
    std::string broadcastAddress;

    static DiscoveryOptions fromConfig();
};

struct InterfaceAddress {
    std::string name;
    std::string ip;
    std::string mask;
};

namespace DeviceFinder {

    // (ip & mask) | ~mask per octet. nullopt on a malformed address.
    std::optional<std::string> calculateBroadcastAddress(const std::string& ip,
                                                         const std::string& mask);

    // "photo_server:<name>,IP:<ip>"; missing name is "Unknown".
    DeviceInfo parseReply(const std::string& reply);

    // First interface that is up, not loopback, and has an IPv4 address.
    std::optional<InterfaceAddress> primaryIPv4Interface();

    // Override, else interface broadcast, else 255.255.255.255.
    std::string resolveBroadcastTarget(const DiscoveryOptions& opts);

    // Collects every reply within the window. No retries, no de-duplication.
    std::vector<DeviceInfo> discover(const DiscoveryOptions& opts,
                                     CancellationToken token = {});
}

/**
 * Streaming discovery. start() sends the query; next() yields replies as they
 * arrive and returns false once the window elapses or the token fires.
 */
class DiscoverySession {
public:
    DiscoverySession(DiscoveryOptions opts, CancellationToken token = {});
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    bool start();
    bool next(DeviceInfo& out);
    void close();

    const std::string& target() const { return target_; }

private:
    void armReceive();

    DiscoveryOptions opts_;
    CancellationToken token_;
    boost::asio::io_context io_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint sender_;
    std::array<char, 1500> buf_{};
    std::deque<DeviceInfo> ready_;
    std::chrono::steady_clock::time_point deadline_{};
    std::string target_;
    bool started_{false};
    bool closed_{false};
};

} // namespace photosync
