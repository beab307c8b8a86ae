#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "wire/frame_codec.h"

namespace photosync {

// Photo / Video upload body. `data` is already base64.
struct MediaPacket {
    std::string id;
    std::string data;
    std::string media;
};

struct ThumbListRequest {
    int pageIndex{0};
    int pageSize{0};
};

struct ThumbItem {
    std::string id;
    std::string media;
    std::vector<uint8_t> data;
};

struct ThumbPage {
    std::vector<ThumbItem> photos;
};

// One photo returned inline in a MediaDownloadAck.
struct DownloadedMedia {
    std::string id;
    std::vector<uint8_t> data;
};

struct ChunkedStart {
    std::string id;
    std::string media;
    uint64_t totalSize{0};
};

struct ChunkData {
    std::string id;
    uint64_t chunkIndex{0};
    std::vector<uint8_t> bytes; // `size` on the wire is bytes.size()
};

struct ChunkedComplete {
    std::string id;
    uint64_t totalBytes{0};
};

namespace Payloads {

    // Compact single-line JSON.
    std::string toJson(const Json::Value& v);
    bool parseJson(const std::string& text, Json::Value& out);

    std::string encode(const MediaPacket& p);
    std::optional<MediaPacket> decodeMediaPacket(const std::string& text);

    std::string encode(const ThumbListRequest& r);
    std::optional<ThumbListRequest> decodeThumbListRequest(const std::string& text);
    std::string encode(const ThumbPage& page);
    std::optional<ThumbPage> decodeThumbPage(const std::string& text);

    std::string encodeIdList(const std::vector<std::string>& ids);
    std::optional<std::vector<std::string>> decodeIdList(const std::string& text);

    // `[{"<id>":"<b64>"}, ...]`. nullopt when the text is not such an array.
    std::string encodeDownloadList(const std::vector<DownloadedMedia>& items);
    std::optional<std::vector<DownloadedMedia>> decodeDownloadList(const std::string& text);
    bool looksLikeJsonArray(const std::string& text);

    std::string encode(const ChunkedStart& s);
    std::optional<ChunkedStart> decodeChunkedStart(const std::string& text);
    std::string encode(const ChunkData& c);
    // Rejects a chunk whose declared size differs from its decoded length.
    std::optional<ChunkData> decodeChunkData(const std::string& text);
    std::string encode(const ChunkedComplete& c);
    std::optional<ChunkedComplete> decodeChunkedComplete(const std::string& text);

    // 4- or 8-byte big-endian count; falls back to decimal text for older
    // servers.
    std::optional<uint64_t> decodeMediaCount(const std::vector<uint8_t>& payload);
    std::vector<uint8_t> encodeMediaCount(uint64_t count);

    std::string ackText(const std::string& id);
    // SyncComplete frame whose text contains "OK:<id>".
    bool ackMatches(const Frame& frame, const std::string& id);
}

} // namespace photosync
