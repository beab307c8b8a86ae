#include "wire/frame_codec.h"
#include "logging.h"

namespace photosync {
namespace FrameCodec {

void putUint32BE(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>(v >> 24);
    out[1] = static_cast<uint8_t>(v >> 16);
    out[2] = static_cast<uint8_t>(v >> 8);
    out[3] = static_cast<uint8_t>(v);
}

uint32_t readUint32BE(const uint8_t* in) {
    return (uint32_t(in[0]) << 24) | (uint32_t(in[1]) << 16) |
           (uint32_t(in[2]) << 8) | uint32_t(in[3]);
}

std::vector<uint8_t> encode(PacketType type, const uint8_t* payload, std::size_t len) {
    std::vector<uint8_t> out;
    out.reserve(FRAME_HEADER_SIZE + len);
    uint8_t header[FRAME_HEADER_SIZE];
    header[0] = static_cast<uint8_t>(type);
    putUint32BE(header + 1, static_cast<uint32_t>(len));
    out.insert(out.end(), header, header + FRAME_HEADER_SIZE);
    if (len)
        out.insert(out.end(), payload, payload + len);
    NET_TRACE("[codec] encode {} len={}", packetTypeName(type), len);
    return out;
}

std::vector<uint8_t> encode(PacketType type, const std::vector<uint8_t>& payload) {
    return encode(type, payload.data(), payload.size());
}

std::vector<uint8_t> encode(PacketType type, const std::string& payload) {
    return encode(type, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

std::vector<uint8_t> encode(const Frame& frame) {
    return encode(frame.type, frame.payload);
}

DecodeResult decode(const uint8_t* data, std::size_t len, std::size_t maxPayload) {
    DecodeResult r;
    if (len < FRAME_HEADER_SIZE)
        return r;

    const uint8_t rawType = data[0];
    const uint32_t payloadLen = readUint32BE(data + 1);

    if (!isKnownPacketType(rawType) || payloadLen > maxPayload) {
        NET_TRACE("[codec] malformed header type={} len={}", rawType, payloadLen);
        r.status = DecodeStatus::Malformed;
        return r;
    }
    if (len - FRAME_HEADER_SIZE < payloadLen)
        return r; // incomplete

    r.status = DecodeStatus::Complete;
    r.frame.type = static_cast<PacketType>(rawType);
    r.frame.payload.assign(data + FRAME_HEADER_SIZE, data + FRAME_HEADER_SIZE + payloadLen);
    r.consumed = FRAME_HEADER_SIZE + payloadLen;
    return r;
}

DecodeResult decode(const std::vector<uint8_t>& buffer, std::size_t maxPayload) {
    return decode(buffer.data(), buffer.size(), maxPayload);
}

} // namespace FrameCodec
} // namespace photosync
