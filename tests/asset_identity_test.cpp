#include "media/asset_identity.h"
#include <cassert>
#include <iostream>
#include <sstream>

using namespace photosync;

static std::string sniff(const std::string& head) {
    auto ext = AssetIdentity::sniffExtension(reinterpret_cast<const uint8_t*>(head.data()), head.size());
    return ext ? *ext : std::string("?");
}

int main() {
    // Leading-byte signatures.
    assert(sniff(std::string("\xFF\xD8\xFF\xE0", 4) + "JFIF") == "jpg");
    assert(sniff("\x89PNG\r\n\x1a\n") == "png");
    assert(sniff("GIF89a") == "gif");
    assert(sniff(std::string("RIFF\x10\x00\x00\x00WEBPVP8 ", 16)) == "webp");
    assert(sniff("BM\x36\x00") == "bmp");
    assert(sniff(std::string("\x00\x00\x00\x18", 4) + "ftypheic") == "heic");
    assert(sniff(std::string("\x00\x00\x00\x18", 4) + "ftypmif1") == "heif");
    assert(sniff(std::string("\x00\x00\x00\x14", 4) + "ftypqt  ") == "mov");
    assert(sniff(std::string("\x00\x00\x00\x20", 4) + "ftypisom") == "mp4");
    assert(sniff(std::string("\x00\x00\x00\x20", 4) + "ftyp3gp4") == "3gp");
    assert(sniff("hello world") == "?");

    // Mime fallback mapping.
    assert(AssetIdentity::extensionFromMime("image/jpeg").value() == "jpg");
    assert(AssetIdentity::extensionFromMime("image/JPEG; charset=UTF-8").value() == "jpg");
    assert(AssetIdentity::extensionFromMime("video/quicktime").value() == "mov");
    assert(AssetIdentity::extensionFromMime("video/x-msvideo").value() == "avi");
    assert(AssetIdentity::extensionFromMime("video/3gpp2").value() == "3g2");
    assert(AssetIdentity::extensionFromMime("image/png").value() == "png");
    assert(!AssetIdentity::extensionFromMime("garbage"));

    // Content beats mime, mime beats the per-kind default.
    std::string png = "\x89PNG....";
    auto* p = reinterpret_cast<const uint8_t*>(png.data());
    assert(AssetIdentity::resolveExtension(p, png.size(), "image/jpeg", AssetKind::Photo) == "png");
    assert(AssetIdentity::resolveExtension(nullptr, 0, "video/quicktime", AssetKind::Video) == "mov");
    assert(AssetIdentity::resolveExtension(nullptr, 0, "", AssetKind::Photo) == "jpg");
    assert(AssetIdentity::resolveExtension(nullptr, 0, "", AssetKind::Video) == "mp4");

    // File ids are deterministic and flatten path separators.
    assert(AssetIdentity::deriveFileId("1", AssetKind::Video, "mp4") == "VID_1.mp4");
    assert(AssetIdentity::deriveFileId("DCIM/2024/a.jpg", AssetKind::Photo, "jpg") == "IMG_DCIM_2024_a.jpg.jpg");
    assert(AssetIdentity::deriveFileId("x", AssetKind::Photo, "png") ==
           AssetIdentity::deriveFileId("x", AssetKind::Photo, "png"));

    // Peeking leaves the stream where it was.
    std::istringstream in(std::string("\xFF\xD8\xFF\xE1", 4) + std::string(100, 'z'));
    auto head = AssetIdentity::peekHeader(in);
    assert(head.size() == AssetIdentity::SNIFF_BYTES);
    char c = 0;
    in.get(c);
    assert(static_cast<unsigned char>(c) == 0xFF);

    std::istringstream shortIn("GIF8");
    assert(AssetIdentity::peekHeader(shortIn).size() == 4);
    assert(shortIn.good());

    std::cout << "Asset identity tests OK\n";
    return 0;
}
