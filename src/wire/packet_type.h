#pragma once
#include <cstdint>

namespace photosync {

enum class PacketType : uint8_t {
    PHOTO                  = 0x01,
    VIDEO                  = 0x02,
    SYNC_COMPLETE          = 0x03, // ack carrier
    SYNC_START             = 0x04,
    GET_MEDIA_COUNT        = 0x05,
    MEDIA_COUNT_RESPONSE   = 0x06,
    MEDIA_THUMB_LIST       = 0x07,
    MEDIA_THUMB_DATA       = 0x08,
    MEDIA_DELETE_LIST      = 0x09,
    MEDIA_DELETE_ACK       = 0x0A,
    MEDIA_DOWNLOAD_LIST    = 0x0B,
    MEDIA_DOWNLOAD_ACK     = 0x0C,
    CHUNKED_VIDEO_START    = 0x0D,
    CHUNKED_VIDEO_DATA     = 0x0E,
    CHUNKED_VIDEO_COMPLETE = 0x0F
};

inline bool isKnownPacketType(uint8_t raw) {
    return raw >= static_cast<uint8_t>(PacketType::PHOTO) &&
           raw <= static_cast<uint8_t>(PacketType::CHUNKED_VIDEO_COMPLETE);
}

inline const char* packetTypeName(PacketType t) {
    switch (t) {
        case PacketType::PHOTO:                  return "Photo";
        case PacketType::VIDEO:                  return "Video";
        case PacketType::SYNC_COMPLETE:          return "SyncComplete";
        case PacketType::SYNC_START:             return "SyncStart";
        case PacketType::GET_MEDIA_COUNT:        return "GetMediaCount";
        case PacketType::MEDIA_COUNT_RESPONSE:   return "MediaCountResponse";
        case PacketType::MEDIA_THUMB_LIST:       return "MediaThumbList";
        case PacketType::MEDIA_THUMB_DATA:       return "MediaThumbData";
        case PacketType::MEDIA_DELETE_LIST:      return "MediaDeleteList";
        case PacketType::MEDIA_DELETE_ACK:       return "MediaDeleteAck";
        case PacketType::MEDIA_DOWNLOAD_LIST:    return "MediaDownloadList";
        case PacketType::MEDIA_DOWNLOAD_ACK:     return "MediaDownloadAck";
        case PacketType::CHUNKED_VIDEO_START:    return "ChunkedVideoStart";
        case PacketType::CHUNKED_VIDEO_DATA:     return "ChunkedVideoData";
        case PacketType::CHUNKED_VIDEO_COMPLETE: return "ChunkedVideoComplete";
    }
    return "Unknown";
}

} // namespace photosync
