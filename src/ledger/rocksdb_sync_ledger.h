#pragma once
#include "ledger/sync_ledger.h"
#include <rocksdb/db.h>
#include <mutex>

namespace photosync {

/**
 * Sync history on RocksDB. Each record is a JSON document under
 * "synced_<fileId>"; the device name lives under "device_name".
 */
class RocksDbSyncLedger : public SyncLedger {
public:
    explicit RocksDbSyncLedger(const std::string& path);
    ~RocksDbSyncLedger() override;

    RocksDbSyncLedger(const RocksDbSyncLedger&) = delete;
    RocksDbSyncLedger& operator=(const RocksDbSyncLedger&) = delete;

    bool isOpen() const { return db != nullptr; }

    bool isSynced(const std::string& fileId) override;
    bool recordSynced(const std::string& fileId, AssetKind kind) override;
    std::vector<SyncRecord> allSynced() override;
    bool clear() override;
    std::size_t countByKind(AssetKind kind) override;

    bool saveDeviceName(const std::string& name) override;
    std::optional<std::string> deviceName() override;

private:
    std::string makeKey(const std::string& fileId) const;

    rocksdb::DB* db{nullptr};
    std::string db_path;
    std::mutex db_mutex;
};

} // namespace photosync
