#include "wire/frame_codec.h"
#include <cassert>
#include <iostream>
#include <string>

using namespace photosync;

int main() {
    // Layout: type, big-endian length, payload.
    auto bytes = FrameCodec::encode(PacketType::PHOTO, std::string("abc"));
    assert(bytes.size() == 8);
    assert(bytes[0] == 0x01);
    assert(bytes[1] == 0 && bytes[2] == 0 && bytes[3] == 0 && bytes[4] == 3);
    assert(bytes[5] == 'a' && bytes[7] == 'c');

    // Every packet type survives the trip, including an empty payload.
    for (uint8_t t = 1; t <= 15; ++t) {
        std::vector<uint8_t> payload(t * 7, static_cast<uint8_t>(t));
        auto enc = FrameCodec::encode(static_cast<PacketType>(t), payload);
        auto r = FrameCodec::decode(enc);
        assert(r.status == DecodeStatus::Complete);
        assert(r.consumed == enc.size());
        assert(static_cast<uint8_t>(r.frame.type) == t);
        assert(r.frame.payload == payload);
    }
    auto empty = FrameCodec::decode(FrameCodec::encode(PacketType::GET_MEDIA_COUNT, std::vector<uint8_t>{}));
    assert(empty.status == DecodeStatus::Complete && empty.frame.payload.empty());

    // Strict prefixes never decode.
    auto frame = FrameCodec::encode(PacketType::SYNC_COMPLETE, std::string("OK:IMG_1.jpg"));
    for (std::size_t n = 0; n < frame.size(); ++n) {
        auto r = FrameCodec::decode(frame.data(), n);
        assert(r.status == DecodeStatus::Incomplete);
        assert(r.consumed == 0);
    }

    // Two frames in one buffer come out one at a time.
    auto two = frame;
    auto second = FrameCodec::encode(PacketType::MEDIA_DELETE_ACK, std::string("OK"));
    two.insert(two.end(), second.begin(), second.end());
    auto first = FrameCodec::decode(two);
    assert(first.status == DecodeStatus::Complete);
    assert(first.frame.payloadText() == "OK:IMG_1.jpg");
    auto next = FrameCodec::decode(two.data() + first.consumed, two.size() - first.consumed);
    assert(next.status == DecodeStatus::Complete);
    assert(next.frame.type == PacketType::MEDIA_DELETE_ACK);

    // Unknown types and absurd lengths are malformed as soon as the header is in.
    std::vector<uint8_t> bad = {0x00, 0, 0, 0, 1, 'x'};
    assert(FrameCodec::decode(bad).status == DecodeStatus::Malformed);
    bad[0] = 16;
    assert(FrameCodec::decode(bad).status == DecodeStatus::Malformed);
    std::vector<uint8_t> huge = {0x02, 0xFF, 0xFF, 0xFF, 0xFF};
    assert(FrameCodec::decode(huge).status == DecodeStatus::Malformed);
    std::vector<uint8_t> capped = {0x02, 0, 0, 0x10, 0};
    assert(FrameCodec::decode(capped.data(), capped.size(), 1024).status == DecodeStatus::Malformed);
    assert(FrameCodec::decode(capped.data(), capped.size()).status == DecodeStatus::Incomplete);

    std::cout << "Frame codec tests OK\n";
    return 0;
}
