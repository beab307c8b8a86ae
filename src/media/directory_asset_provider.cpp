#include "media/directory_asset_provider.h"
#include "logging.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace photosync {

namespace fs = std::filesystem;

namespace {

std::string lowerExt(const std::string& ext) {
    std::string out = ext;
    if (!out.empty() && out[0] == '.')
        out.erase(0, 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const std::map<std::string, std::pair<AssetKind, std::string>>& extensionTable() {
    static const std::map<std::string, std::pair<AssetKind, std::string>> table = {
        {"jpg",  {AssetKind::Photo, "image/jpeg"}},
        {"jpeg", {AssetKind::Photo, "image/jpeg"}},
        {"png",  {AssetKind::Photo, "image/png"}},
        {"gif",  {AssetKind::Photo, "image/gif"}},
        {"webp", {AssetKind::Photo, "image/webp"}},
        {"heic", {AssetKind::Photo, "image/heic"}},
        {"heif", {AssetKind::Photo, "image/heif"}},
        {"bmp",  {AssetKind::Photo, "image/bmp"}},
        {"mp4",  {AssetKind::Video, "video/mp4"}},
        {"mov",  {AssetKind::Video, "video/quicktime"}},
        {"avi",  {AssetKind::Video, "video/x-msvideo"}},
        {"wmv",  {AssetKind::Video, "video/x-ms-wmv"}},
        {"3gp",  {AssetKind::Video, "video/3gpp"}},
        {"3g2",  {AssetKind::Video, "video/3gpp2"}},
        {"mkv",  {AssetKind::Video, "video/x-matroska"}},
        {"webm", {AssetKind::Video, "video/webm"}},
    };
    return table;
}

} // namespace

DirectoryAssetProvider::DirectoryAssetProvider(fs::path root) : root_(std::move(root)) {}

std::optional<AssetKind> DirectoryAssetProvider::kindForExtension(const std::string& ext) {
    auto it = extensionTable().find(lowerExt(ext));
    if (it == extensionTable().end())
        return std::nullopt;
    return it->second.first;
}

std::string DirectoryAssetProvider::mimeForExtension(const std::string& ext) {
    auto it = extensionTable().find(lowerExt(ext));
    return it == extensionTable().end() ? std::string() : it->second.second;
}

std::vector<AssetRef> DirectoryAssetProvider::listAssets(AssetKind kind) {
    std::vector<AssetRef> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_W("[assets]") << "cannot scan " << root_.string() << ": " << ec.message();
        return out;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_W("[assets]") << "scan error: " << ec.message();
            break;
        }
        if (!it->is_regular_file(ec))
            continue;
        auto k = kindForExtension(it->path().extension().string());
        if (!k || *k != kind)
            continue;
        out.push_back(AssetRef{fs::relative(it->path(), root_, ec).generic_string(), kind});
    }
    std::sort(out.begin(), out.end(),
              [](const AssetRef& a, const AssetRef& b) { return a.id < b.id; });
    return out;
}

fs::path DirectoryAssetProvider::resolve(const AssetRef& asset) const {
    return root_ / fs::path(asset.id);
}

std::unique_ptr<std::istream> DirectoryAssetProvider::openStream(const AssetRef& asset) {
    auto in = std::make_unique<std::ifstream>(resolve(asset), std::ios::binary);
    if (!in->is_open()) {
        LOG_W("[assets]") << "cannot open " << asset.id;
        return nullptr;
    }
    return in;
}

std::string DirectoryAssetProvider::mimeType(const AssetRef& asset) {
    return mimeForExtension(resolve(asset).extension().string());
}

std::optional<uint64_t> DirectoryAssetProvider::byteSize(const AssetRef& asset) {
    std::error_code ec;
    auto size = fs::file_size(resolve(asset), ec);
    if (ec)
        return std::nullopt;
    return static_cast<uint64_t>(size);
}

} // namespace photosync
