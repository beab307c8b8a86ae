#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "transport/inbound_stream.h"

namespace photosync {

// ---- Core abstract transport interface ----
// Opaque byte chunks out, broadcast stream of byte chunks in. Framing and
// acknowledgement live above this line.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool         connect(const std::string& host, uint16_t port) = 0;
    virtual void         disconnect()                                     = 0;
    virtual bool         reconnect()                                      = 0;
    virtual bool         forceReconnect()                                 = 0;
    // Reconnects only when there is no live socket.
    virtual bool         ensureConnected()                                = 0;

    // Blocks while the outbound queue is full. False once closed.
    virtual bool         sendData(std::vector<uint8_t> data)              = 0;

    virtual bool         isClosed() const                                 = 0;
    virtual std::string  remoteId() const                                 = 0;

    // Listener that sees every chunk received from now on.
    virtual std::shared_ptr<InboundSubscription> subscribe()              = 0;
};

} // namespace photosync
