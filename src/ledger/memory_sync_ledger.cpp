#include "ledger/memory_sync_ledger.h"

namespace photosync {

bool MemorySyncLedger::isSynced(const std::string& fileId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(fileId) != 0;
}

bool MemorySyncLedger::recordSynced(const std::string& fileId, AssetKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[fileId] = SyncRecord{fileId, kind, utcTimestamp()};
    return true;
}

std::vector<SyncRecord> MemorySyncLedger::allSynced() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SyncRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_)
        out.push_back(kv.second);
    return out;
}

bool MemorySyncLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    return true;
}

std::size_t MemorySyncLedger::countByKind(AssetKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& kv : records_) {
        if (kv.second.kind == kind)
            ++n;
    }
    return n;
}

bool MemorySyncLedger::saveDeviceName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    deviceName_ = name;
    return true;
}

std::optional<std::string> MemorySyncLedger::deviceName() {
    std::lock_guard<std::mutex> lock(mutex_);
    return deviceName_;
}

} // namespace photosync
