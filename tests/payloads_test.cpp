#include "sync/payloads.h"
#include "base64.h"
#include <cassert>
#include <iostream>

using namespace photosync;

int main() {
    // Media count: 8-byte and 4-byte big-endian, then the decimal fallback.
    std::vector<uint8_t> eight = {0, 0, 0, 0, 0, 0, 0, 0xAC};
    assert(Payloads::decodeMediaCount(eight).value() == 172);
    std::vector<uint8_t> four = {0, 0, 0x01, 0x00};
    assert(Payloads::decodeMediaCount(four).value() == 256);
    std::string text = "172\n";
    assert(Payloads::decodeMediaCount(std::vector<uint8_t>(text.begin(), text.end())).value() == 172);
    std::string junk = "lots!";
    assert(!Payloads::decodeMediaCount(std::vector<uint8_t>(junk.begin(), junk.end())));
    assert(!Payloads::decodeMediaCount({}));
    assert(Payloads::decodeMediaCount(Payloads::encodeMediaCount(5000000000ULL)).value() == 5000000000ULL);

    // Ack matching is a substring test on SyncComplete frames only.
    std::string ackBody = "OK:IMG_1.jpg";
    Frame ok(PacketType::SYNC_COMPLETE, std::vector<uint8_t>(ackBody.begin(), ackBody.end()));
    assert(Payloads::ackMatches(ok, "IMG_1.jpg"));
    assert(!Payloads::ackMatches(ok, "IMG_2.jpg"));
    Frame wrongType(PacketType::MEDIA_DELETE_ACK, ok.payload);
    assert(!Payloads::ackMatches(wrongType, "IMG_1.jpg"));

    // Media packet keeps the field names the server expects.
    auto body = Payloads::encode(MediaPacket{"IMG_1.jpg", Base64::encode(std::string("hi")), "jpg"});
    Json::Value j;
    assert(Payloads::parseJson(body, j));
    assert(j["id"].asString() == "IMG_1.jpg" && j["data"].asString() == "aGk=" && j["media"].asString() == "jpg");
    auto back = Payloads::decodeMediaPacket(R"({"id":"x","data":"aGk="})");
    assert(back && back->media == "bin");

    // Thumb page validation.
    auto page = Payloads::decodeThumbPage(R"({"photos":[{"id":"IMG_1.jpg","media":"jpg","data":"aGk="}]})");
    assert(page && page->photos.size() == 1 && page->photos[0].data.size() == 2);
    assert(!Payloads::decodeThumbPage(R"({"photos":[{"id":"IMG_1.jpg","data":"***"}]})"));
    assert(!Payloads::decodeThumbPage(R"({"items":[]})"));
    assert(!Payloads::decodeThumbPage("not json"));

    // Download ack: array form carries the files inline.
    assert(Payloads::looksLikeJsonArray("  [ ]"));
    assert(!Payloads::looksLikeJsonArray("OK"));
    auto files = Payloads::decodeDownloadList(R"([{"IMG_1.jpg":"aGk="},{"IMG_2.jpg":""}])");
    assert(files && files->size() == 2 && (*files)[0].id == "IMG_1.jpg" && (*files)[1].data.empty());
    assert(!Payloads::decodeDownloadList(R"(["IMG_1.jpg"])"));

    // Chunk data: declared size must match the decoded bytes.
    ChunkData c{"VID_1.mp4", 3, {1, 2, 3, 4}};
    auto decoded = Payloads::decodeChunkData(Payloads::encode(c));
    assert(decoded && decoded->chunkIndex == 3 && decoded->bytes == c.bytes);
    assert(!Payloads::decodeChunkData(R"({"id":"VID_1.mp4","chunkIndex":0,"size":9,"data":"AQIDBA=="})"));

    auto start = Payloads::decodeChunkedStart(Payloads::encode(ChunkedStart{"VID_1.mp4", "mp4", 12000000}));
    assert(start && start->totalSize == 12000000 && start->media == "mp4");
    auto done = Payloads::decodeChunkedComplete(R"({"id":"VID_1.mp4","totalBytes":12000000})");
    assert(done && done->totalBytes == 12000000);

    auto ids = Payloads::decodeIdList(Payloads::encodeIdList({"a", "b/c"}));
    assert(ids && ids->size() == 2 && (*ids)[1] == "b/c");

    std::cout << "Payload tests OK\n";
    return 0;
}
