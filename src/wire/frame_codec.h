#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "constants.h"
#include "wire/packet_type.h"

namespace photosync {

/**
 * One unit on the wire: [type:1][length:4 BE][payload:length].
 */
struct Frame {
    PacketType type{PacketType::SYNC_COMPLETE};
    std::vector<uint8_t> payload;

    Frame() = default;
    Frame(PacketType t, std::vector<uint8_t> p) : type(t), payload(std::move(p)) {}

    std::string payloadText() const {
        return std::string(payload.begin(), payload.end());
    }
    bool operator==(const Frame& o) const { return type == o.type && payload == o.payload; }
};

enum class DecodeStatus {
    Complete,
    Incomplete, // keep buffering
    Malformed   // unknown type or absurd length, fatal to the stream
};

struct DecodeResult {
    DecodeStatus status{DecodeStatus::Incomplete};
    Frame frame;
    std::size_t consumed{0};
};

namespace FrameCodec {

    std::vector<uint8_t> encode(PacketType type, const uint8_t* payload, std::size_t len);
    std::vector<uint8_t> encode(PacketType type, const std::vector<uint8_t>& payload);
    std::vector<uint8_t> encode(PacketType type, const std::string& payload);
    std::vector<uint8_t> encode(const Frame& frame);

    // Pure; never throws on short input.
    DecodeResult decode(const uint8_t* data, std::size_t len,
                        std::size_t maxPayload = MAX_FRAME_PAYLOAD);
    DecodeResult decode(const std::vector<uint8_t>& buffer,
                        std::size_t maxPayload = MAX_FRAME_PAYLOAD);

    // Big-endian helpers shared with payload decoding.
    void putUint32BE(uint8_t* out, uint32_t v);
    uint32_t readUint32BE(const uint8_t* in);
}

} // namespace photosync
