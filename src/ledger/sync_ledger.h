#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "media/asset_provider.h"

namespace photosync {

struct SyncRecord {
    std::string fileId;
    AssetKind kind{AssetKind::Photo};
    std::string syncedTime; // ISO-8601 UTC
};

// Persistent record of file ids the server has acknowledged. Constructed by
// the caller and injected; there is no global instance.
class SyncLedger {
public:
    virtual ~SyncLedger() = default;

    virtual bool isSynced(const std::string& fileId) = 0;
    // Re-recording an id refreshes its timestamp.
    virtual bool recordSynced(const std::string& fileId, AssetKind kind) = 0;
    virtual std::vector<SyncRecord> allSynced() = 0;
    virtual bool clear() = 0;
    virtual std::size_t countByKind(AssetKind kind) = 0;

    virtual bool saveDeviceName(const std::string& name) = 0;
    virtual std::optional<std::string> deviceName() = 0;
};

// "2026-10-19T08:15:00Z"
std::string utcTimestamp();

} // namespace photosync
