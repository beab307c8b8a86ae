#pragma once
#include "ledger/sync_ledger.h"
#include <map>
#include <mutex>

namespace photosync {

class MemorySyncLedger : public SyncLedger {
public:
    bool isSynced(const std::string& fileId) override;
    bool recordSynced(const std::string& fileId, AssetKind kind) override;
    std::vector<SyncRecord> allSynced() override;
    bool clear() override;
    std::size_t countByKind(AssetKind kind) override;

    bool saveDeviceName(const std::string& name) override;
    std::optional<std::string> deviceName() override;

private:
    std::mutex mutex_;
    std::map<std::string, SyncRecord> records_;
    std::optional<std::string> deviceName_;
};

} // namespace photosync
