#include "discovery/device_finder.h"
#include "config.h"
#include "logging.h"
#include <algorithm>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace photosync {

using boost::asio::ip::udp;
using Clock = std::chrono::steady_clock;

DiscoveryOptions DiscoveryOptions::fromConfig()
{
    const auto& cfg = getAppConfig();
    DiscoveryOptions o;
    o.port = cfg.discovery_port;
    o.windowMs = cfg.discovery_timeout_ms;
    o.broadcastAddress = cfg.discovery_broadcast;
    return o;
}

namespace DeviceFinder {

std::optional<std::string> calculateBroadcastAddress(const std::string& ip, const std::string& mask)
{
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(ip, ec);
    if (ec)
        return std::nullopt;
    auto netmask = boost::asio::ip::make_address_v4(mask, ec);
    if (ec)
        return std::nullopt;
    uint32_t m = netmask.to_uint();
    uint32_t b = (addr.to_uint() & m) | ~m;
    return boost::asio::ip::address_v4(b).to_string();
}

DeviceInfo parseReply(const std::string& reply)
{
    const std::string nameTag(DISCOVERY_REPLY_NAME_TAG);
    const std::string ipTag(DISCOVERY_REPLY_IP_TAG);

    DeviceInfo info{"Unknown", {}};
    std::size_t pos = 0;
    while (pos <= reply.size()) {
        std::size_t comma = reply.find(',', pos);
        std::string part = reply.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        while (!part.empty() && (part.back() == '\n' || part.back() == '\r' || part.back() == ' '))
            part.pop_back();

        if (part.compare(0, nameTag.size(), nameTag) == 0)
            info.name = part.substr(nameTag.size());
        else if (part.compare(0, ipTag.size(), ipTag) == 0)
            info.ipAddress = part.substr(ipTag.size());

        if (comma == std::string::npos)
            break;
        pos = comma + 1;
    }
    return info;
}

std::optional<InterfaceAddress> primaryIPv4Interface()
{
    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        LOG_W("[discovery]") << "getifaddrs failed";
        return std::nullopt;
    }

    std::optional<InterfaceAddress> found;
    for (auto* ifa = list; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || !ifa->ifa_netmask || ifa->ifa_addr->sa_family != AF_INET)
            continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK))
            continue;

        char ip[INET_ADDRSTRLEN] = {};
        char mask[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in*>(ifa->ifa_addr)->sin_addr, ip, sizeof(ip));
        inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask)->sin_addr, mask, sizeof(mask));
        found = InterfaceAddress{ifa->ifa_name, ip, mask};
        break;
    }
    freeifaddrs(list);
    return found;
}

std::string resolveBroadcastTarget(const DiscoveryOptions& opts)
{
    if (!opts.broadcastAddress.empty())
        return opts.broadcastAddress;
    if (auto iface = primaryIPv4Interface()) {
        LOG_D("[discovery]") << "local " << iface->name << " " << iface->ip << "/" << iface->mask;
        if (auto b = calculateBroadcastAddress(iface->ip, iface->mask))
            return *b;
    }
    return "255.255.255.255";
}

std::vector<DeviceInfo> discover(const DiscoveryOptions& opts, CancellationToken token)
{
    std::vector<DeviceInfo> devices;
    DiscoverySession session(opts, std::move(token));
    if (!session.start())
        return devices;
    DeviceInfo info;
    while (session.next(info))
        devices.push_back(info);
    return devices;
}

} // namespace DeviceFinder

DiscoverySession::DiscoverySession(DiscoveryOptions opts, CancellationToken token)
    : opts_(std::move(opts)), token_(std::move(token)), socket_(io_) {}

DiscoverySession::~DiscoverySession()
{
    close();
}

bool DiscoverySession::start()
{
    if (started_)
        return !closed_;
    started_ = true;

    target_ = DeviceFinder::resolveBroadcastTarget(opts_);
    boost::system::error_code ec;
    auto targetAddr = boost::asio::ip::make_address_v4(target_, ec);
    if (ec) {
        LOG_E("[discovery]") << "bad broadcast address '" << target_ << "'";
        closed_ = true;
        return false;
    }

    socket_.open(udp::v4(), ec);
    if (!ec)
        socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
    if (!ec)
        socket_.bind(udp::endpoint(udp::v4(), 0), ec);
    if (ec) {
        LOG_E("[discovery]") << "cannot open UDP socket: " << ec.message();
        closed_ = true;
        return false;
    }

    const std::string query(DISCOVERY_QUERY);
    socket_.send_to(boost::asio::buffer(query), udp::endpoint(targetAddr, opts_.port), 0, ec);
    if (ec) {
        LOG_E("[discovery]") << "broadcast to " << target_ << ":" << opts_.port << " failed: " << ec.message();
        close();
        return false;
    }
    LOG_I("[discovery]") << "query sent to " << target_ << ":" << opts_.port;

    deadline_ = Clock::now() + std::chrono::milliseconds(opts_.windowMs);
    armReceive();
    return true;
}

void DiscoverySession::armReceive()
{
    socket_.async_receive_from(
        boost::asio::buffer(buf_), sender_,
        [this](const boost::system::error_code& ec, std::size_t n) {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (ec) {
                // ICMP unreachable from an earlier send surfaces here; keep listening.
                LOG_D("[discovery]") << "receive: " << ec.message();
                armReceive();
                return;
            }
            std::string msg(buf_.data(), n);
            LOG_D("[discovery]") << "reply '" << msg << "' from " << sender_.address().to_string();
            ready_.push_back(DeviceFinder::parseReply(msg));
            armReceive();
        });
}

bool DiscoverySession::next(DeviceInfo& out)
{
    if (!started_ || closed_)
        return false;

    const auto poll = std::chrono::milliseconds(WAIT_POLL_INTERVAL_MS);
    while (ready_.empty()) {
        if (token_.isCancellationRequested()) {
            LOG_D("[discovery]") << "cancelled";
            close();
            return false;
        }
        auto now = Clock::now();
        if (now >= deadline_) {
            close();
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
        io_.run_for(std::min(left, poll));
        if (io_.stopped())
            io_.restart();
    }
    out = ready_.front();
    ready_.pop_front();
    return true;
}

void DiscoverySession::close()
{
    if (closed_)
        return;
    closed_ = true;
    boost::system::error_code ec;
    socket_.close(ec);
    // Let the aborted receive handler run so nothing refers to us afterwards.
    io_.restart();
    io_.poll();
}

} // namespace photosync
