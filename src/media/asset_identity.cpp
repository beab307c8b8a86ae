#include "media/asset_identity.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <map>

namespace photosync {
namespace AssetIdentity {

namespace {

bool startsWith(const uint8_t* head, std::size_t len, const char* magic, std::size_t n) {
    return len >= n && std::memcmp(head, magic, n) == 0;
}

std::optional<std::string> extensionFromBrand(const std::string& brand) {
    static const std::map<std::string, std::string> brands = {
        {"heic", "heic"}, {"heix", "heic"}, {"hevc", "heic"}, {"hevx", "heic"},
        {"heim", "heic"}, {"heis", "heic"}, {"hevm", "heic"}, {"hevs", "heic"},
        {"mif1", "heif"}, {"msf1", "heif"},
        {"qt  ", "mov"},
        {"3gp4", "3gp"}, {"3gp5", "3gp"}, {"3gp6", "3gp"}, {"3ge6", "3gp"},
        {"3g2a", "3g2"}, {"3g2b", "3g2"}, {"3g2c", "3g2"},
    };
    auto it = brands.find(brand);
    if (it != brands.end())
        return it->second;
    return std::string("mp4");
}

} // namespace

std::optional<std::string> sniffExtension(const uint8_t* head, std::size_t len) {
    if (!head || len < 2)
        return std::nullopt;
    if (startsWith(head, len, "\xFF\xD8\xFF", 3))
        return std::string("jpg");
    if (startsWith(head, len, "\x89PNG", 4))
        return std::string("png");
    if (startsWith(head, len, "GIF8", 4))
        return std::string("gif");
    if (len >= 12 && startsWith(head, len, "RIFF", 4) && std::memcmp(head + 8, "WEBP", 4) == 0)
        return std::string("webp");
    if (len >= 12 && std::memcmp(head + 4, "ftyp", 4) == 0)
        return extensionFromBrand(std::string(reinterpret_cast<const char*>(head + 8), 4));
    if (startsWith(head, len, "BM", 2))
        return std::string("bmp");
    return std::nullopt;
}

std::optional<std::string> extensionFromMime(const std::string& mime) {
    std::string primary = mime.substr(0, mime.find(';'));
    primary.erase(std::remove_if(primary.begin(), primary.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  primary.end());
    auto slash = primary.find('/');
    if (slash == std::string::npos || primary.find('/', slash + 1) != std::string::npos)
        return std::nullopt;
    std::string subtype = primary.substr(slash + 1);
    if (subtype.empty())
        return std::nullopt;
    std::transform(subtype.begin(), subtype.end(), subtype.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, std::string> mapping = {
        {"jpeg", "jpg"},       {"quicktime", "mov"}, {"x-msvideo", "avi"},
        {"x-ms-wmv", "wmv"},   {"3gpp", "3gp"},      {"3gpp2", "3g2"},
    };
    auto it = mapping.find(subtype);
    return it != mapping.end() ? it->second : subtype;
}

std::string resolveExtension(const uint8_t* head, std::size_t len,
                             const std::string& mime, AssetKind kind) {
    if (auto ext = sniffExtension(head, len))
        return *ext;
    if (!mime.empty()) {
        if (auto ext = extensionFromMime(mime))
            return *ext;
    }
    return kind == AssetKind::Photo ? "jpg" : "mp4";
}

std::string deriveFileId(const std::string& assetId, AssetKind kind, const std::string& ext) {
    std::string safe = assetId;
    std::replace(safe.begin(), safe.end(), '/', '_');
    return std::string(kind == AssetKind::Photo ? "IMG_" : "VID_") + safe + "." + ext;
}

std::vector<uint8_t> peekHeader(std::istream& in) {
    std::vector<uint8_t> head(SNIFF_BYTES);
    auto start = in.tellg();
    in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<std::size_t>(in.gcount()));
    in.clear();
    in.seekg(start);
    return head;
}

} // namespace AssetIdentity
} // namespace photosync
