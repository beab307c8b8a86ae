#pragma once
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace photosync {

enum class AssetKind { Photo, Video };

inline const char* toString(AssetKind k) {
    return k == AssetKind::Photo ? "photo" : "video";
}

inline std::optional<AssetKind> assetKindFromString(const std::string& s) {
    if (s == "photo" || s == "photos")
        return AssetKind::Photo;
    if (s == "video" || s == "videos")
        return AssetKind::Video;
    return std::nullopt;
}

struct AssetRef {
    std::string id; // provider-local, stable across runs
    AssetKind kind{AssetKind::Photo};
};

// Source of local media. Implementations must be safe to call from the sync
// thread only; no internal locking is expected.
class AssetProvider {
public:
    virtual ~AssetProvider() = default;

    virtual std::vector<AssetRef> listAssets(AssetKind kind) = 0;
    // nullptr when the asset cannot be read.
    virtual std::unique_ptr<std::istream> openStream(const AssetRef& asset) = 0;
    // Empty when unknown.
    virtual std::string mimeType(const AssetRef& asset) = 0;
    virtual std::optional<uint64_t> byteSize(const AssetRef& asset) = 0;
};

} // namespace photosync
