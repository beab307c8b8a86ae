#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "media/asset_provider.h"

namespace photosync {
namespace AssetIdentity {

    inline constexpr std::size_t SNIFF_BYTES = 32;

    // Container/codec from leading bytes; nullopt if nothing matched.
    std::optional<std::string> sniffExtension(const uint8_t* head, std::size_t len);

    // "image/jpeg; charset=..." -> "jpg"; nullopt for an unparsable type.
    std::optional<std::string> extensionFromMime(const std::string& mime);

    // Content first, then the mime type, then jpg/mp4.
    std::string resolveExtension(const uint8_t* head, std::size_t len,
                                 const std::string& mime, AssetKind kind);

    // IMG_<id>.<ext> / VID_<id>.<ext>, '/' in the id replaced by '_'.
    std::string deriveFileId(const std::string& assetId, AssetKind kind,
                             const std::string& ext);

    // Reads up to SNIFF_BYTES and rewinds the stream.
    std::vector<uint8_t> peekHeader(std::istream& in);
}
} // namespace photosync
