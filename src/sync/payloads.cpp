#include "sync/payloads.h"
#include "base64.h"
#include "constants.h"
#include <cctype>
#include <memory>
#include <sstream>

namespace photosync {
namespace Payloads {

namespace {

bool readString(const Json::Value& obj, const char* key, std::string& out) {
    const Json::Value& v = obj[key];
    if (!v.isString())
        return false;
    out = v.asString();
    return true;
}

bool readUInt64(const Json::Value& obj, const char* key, uint64_t& out) {
    const Json::Value& v = obj[key];
    if (v.isUInt64()) {
        out = v.asUInt64();
        return true;
    }
    // Some servers emit sizes as doubles.
    if (v.isDouble() && v.asDouble() >= 0) {
        out = static_cast<uint64_t>(v.asDouble());
        return true;
    }
    return false;
}

bool parseObject(const std::string& text, Json::Value& out) {
    return parseJson(text, out) && out.isObject();
}

} // namespace

std::string toJson(const Json::Value& v) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, v);
}

bool parseJson(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder reader;
    std::unique_ptr<Json::CharReader> r(reader.newCharReader());
    std::string errs;
    return r->parse(text.data(), text.data() + text.size(), &out, &errs);
}

std::string encode(const MediaPacket& p) {
    Json::Value j;
    j["id"] = p.id;
    j["data"] = p.data;
    j["media"] = p.media;
    return toJson(j);
}

std::optional<MediaPacket> decodeMediaPacket(const std::string& text) {
    Json::Value j;
    if (!parseObject(text, j))
        return std::nullopt;
    MediaPacket p;
    if (!readString(j, "id", p.id) || !readString(j, "data", p.data))
        return std::nullopt;
    if (!readString(j, "media", p.media))
        p.media = "bin";
    return p;
}

std::string encode(const ThumbListRequest& r) {
    Json::Value j;
    j["pageIndex"] = r.pageIndex;
    j["pageSize"] = r.pageSize;
    return toJson(j);
}

std::optional<ThumbListRequest> decodeThumbListRequest(const std::string& text) {
    Json::Value j;
    if (!parseObject(text, j) || !j["pageIndex"].isInt() || !j["pageSize"].isInt())
        return std::nullopt;
    return ThumbListRequest{j["pageIndex"].asInt(), j["pageSize"].asInt()};
}

std::string encode(const ThumbPage& page) {
    Json::Value j;
    j["photos"] = Json::Value(Json::arrayValue);
    for (const auto& item : page.photos) {
        Json::Value e;
        e["id"] = item.id;
        e["media"] = item.media;
        e["data"] = Base64::encode(item.data);
        j["photos"].append(e);
    }
    return toJson(j);
}

std::optional<ThumbPage> decodeThumbPage(const std::string& text) {
    Json::Value j;
    if (!parseObject(text, j))
        return std::nullopt;
    const Json::Value& photos = j["photos"];
    if (!photos.isArray())
        return std::nullopt;

    ThumbPage page;
    for (const auto& e : photos) {
        if (!e.isObject())
            return std::nullopt;
        ThumbItem item;
        std::string b64;
        if (!readString(e, "id", item.id) || !readString(e, "data", b64))
            return std::nullopt;
        readString(e, "media", item.media);
        auto bytes = Base64::decode(b64);
        if (!bytes)
            return std::nullopt;
        item.data = std::move(*bytes);
        page.photos.push_back(std::move(item));
    }
    return page;
}

std::string encodeIdList(const std::vector<std::string>& ids) {
    Json::Value arr(Json::arrayValue);
    for (const auto& id : ids)
        arr.append(id);
    return toJson(arr);
}

std::optional<std::vector<std::string>> decodeIdList(const std::string& text) {
    Json::Value j;
    if (!parseJson(text, j) || !j.isArray())
        return std::nullopt;
    std::vector<std::string> ids;
    for (const auto& e : j) {
        if (!e.isString())
            return std::nullopt;
        ids.push_back(e.asString());
    }
    return ids;
}

std::string encodeDownloadList(const std::vector<DownloadedMedia>& items) {
    Json::Value arr(Json::arrayValue);
    for (const auto& item : items) {
        Json::Value e;
        e[item.id] = Base64::encode(item.data);
        arr.append(e);
    }
    return toJson(arr);
}

bool looksLikeJsonArray(const std::string& text) {
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        return c == '[';
    }
    return false;
}

std::optional<std::vector<DownloadedMedia>> decodeDownloadList(const std::string& text) {
    Json::Value j;
    if (!parseJson(text, j) || !j.isArray())
        return std::nullopt;
    std::vector<DownloadedMedia> out;
    for (const auto& e : j) {
        if (!e.isObject())
            return std::nullopt;
        for (const auto& key : e.getMemberNames()) {
            if (!e[key].isString())
                return std::nullopt;
            auto bytes = Base64::decode(e[key].asString());
            if (!bytes)
                return std::nullopt;
            out.push_back(DownloadedMedia{key, std::move(*bytes)});
        }
    }
    return out;
}

std::string encode(const ChunkedStart& s) {
    Json::Value j;
    j["id"] = s.id;
    j["media"] = s.media;
    j["totalSize"] = Json::UInt64(s.totalSize);
    return toJson(j);
}

std::optional<ChunkedStart> decodeChunkedStart(const std::string& text) {
    Json::Value j;
    if (!parseObject(text, j))
        return std::nullopt;
    ChunkedStart s;
    if (!readString(j, "id", s.id) || !readUInt64(j, "totalSize", s.totalSize))
        return std::nullopt;
    readString(j, "media", s.media);
    return s;
}

std::string encode(const ChunkData& c) {
    Json::Value j;
    j["id"] = c.id;
    j["chunkIndex"] = Json::UInt64(c.chunkIndex);
    j["size"] = Json::UInt64(c.bytes.size());
    j["data"] = Base64::encode(c.bytes);
    return toJson(j);
}

std::optional<ChunkData> decodeChunkData(const std::string& text) {
    Json::Value j;
    if (!parseObject(text, j))
        return std::nullopt;
    ChunkData c;
    uint64_t size = 0;
    std::string b64;
    if (!readString(j, "id", c.id) || !readUInt64(j, "chunkIndex", c.chunkIndex) ||
        !readUInt64(j, "size", size) || !readString(j, "data", b64))
        return std::nullopt;
    auto bytes = Base64::decode(b64);
    if (!bytes || bytes->size() != size)
        return std::nullopt;
    c.bytes = std::move(*bytes);
    return c;
}

std::string encode(const ChunkedComplete& c) {
    Json::Value j;
    j["id"] = c.id;
    j["totalBytes"] = Json::UInt64(c.totalBytes);
    return toJson(j);
}

std::optional<ChunkedComplete> decodeChunkedComplete(const std::string& text) {
    Json::Value j;
    if (!parseObject(text, j))
        return std::nullopt;
    ChunkedComplete c;
    if (!readString(j, "id", c.id) || !readUInt64(j, "totalBytes", c.totalBytes))
        return std::nullopt;
    return c;
}

std::optional<uint64_t> decodeMediaCount(const std::vector<uint8_t>& payload) {
    if (payload.size() == 4)
        return FrameCodec::readUint32BE(payload.data());
    if (payload.size() == 8) {
        uint64_t hi = FrameCodec::readUint32BE(payload.data());
        uint64_t lo = FrameCodec::readUint32BE(payload.data() + 4);
        return (hi << 32) | lo;
    }

    std::string text(payload.begin(), payload.end());
    std::size_t b = text.find_first_not_of(" \t\r\n");
    std::size_t e = text.find_last_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::nullopt;
    text = text.substr(b, e - b + 1);
    if (text.size() > 19)
        return std::nullopt;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    }
    return std::stoull(text);
}

std::vector<uint8_t> encodeMediaCount(uint64_t count) {
    std::vector<uint8_t> out(8);
    FrameCodec::putUint32BE(out.data(), static_cast<uint32_t>(count >> 32));
    FrameCodec::putUint32BE(out.data() + 4, static_cast<uint32_t>(count));
    return out;
}

std::string ackText(const std::string& id) {
    return std::string(ACK_PREFIX) + id;
}

bool ackMatches(const Frame& frame, const std::string& id) {
    if (frame.type != PacketType::SYNC_COMPLETE)
        return false;
    return frame.payloadText().find(ackText(id)) != std::string::npos;
}

} // namespace Payloads
} // namespace photosync
