#pragma once
#include "media/asset_provider.h"
#include <filesystem>

namespace photosync {

/**
 * Treats a directory tree as the device photo library. Asset ids are paths
 * relative to the root with '/' separators, sorted for a stable order.
 */
class DirectoryAssetProvider : public AssetProvider {
public:
    explicit DirectoryAssetProvider(std::filesystem::path root);

    std::vector<AssetRef> listAssets(AssetKind kind) override;
    std::unique_ptr<std::istream> openStream(const AssetRef& asset) override;
    std::string mimeType(const AssetRef& asset) override;
    std::optional<uint64_t> byteSize(const AssetRef& asset) override;

    // Kind implied by a file extension such as ".JPG"; nullopt when neither.
    static std::optional<AssetKind> kindForExtension(const std::string& ext);
    static std::string mimeForExtension(const std::string& ext);

private:
    std::filesystem::path resolve(const AssetRef& asset) const;

    std::filesystem::path root_;
};

} // namespace photosync
