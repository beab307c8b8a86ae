#include "ledger/rocksdb_sync_ledger.h"
#include "logging.h"
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <json/json.h>
#include <memory>
#include <sstream>

namespace photosync {

namespace {

const std::string RECORD_PREFIX = "synced_";
const std::string DEVICE_NAME_KEY = "device_name";

bool parseRecord(const std::string& value, SyncRecord& out) {
    Json::Value json;
    Json::CharReaderBuilder reader;
    std::istringstream ss(value);
    std::string errs;
    if (!Json::parseFromStream(reader, ss, &json, &errs))
        return false;
    auto kind = assetKindFromString(json["file_type"].asString());
    if (!kind)
        return false;
    out.fileId = json["file_id"].asString();
    out.kind = *kind;
    out.syncedTime = json["synced_time"].asString();
    return true;
}

} // namespace

RocksDbSyncLedger::RocksDbSyncLedger(const std::string& path) : db_path(path) {
    rocksdb::Options options;
    options.create_if_missing = true;
    rocksdb::Status status = rocksdb::DB::Open(options, db_path, &db);
    if (!status.ok()) {
        LOG_E("[ledger]") << "failed to open " << db_path << ": " << status.ToString();
        db = nullptr;
    }
}

RocksDbSyncLedger::~RocksDbSyncLedger() {
    delete db;
}

std::string RocksDbSyncLedger::makeKey(const std::string& fileId) const {
    return RECORD_PREFIX + fileId;
}

bool RocksDbSyncLedger::isSynced(const std::string& fileId) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return false;
    std::string value;
    rocksdb::Status s = db->Get(rocksdb::ReadOptions(), makeKey(fileId), &value);
    return s.ok();
}

bool RocksDbSyncLedger::recordSynced(const std::string& fileId, AssetKind kind) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return false;

    Json::Value json;
    json["file_id"] = fileId;
    json["file_type"] = toString(kind);
    json["synced_time"] = utcTimestamp();

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    rocksdb::Status s = db->Put(rocksdb::WriteOptions(), makeKey(fileId), Json::writeString(writer, json));
    if (!s.ok())
        LOG_W("[ledger]") << "record " << fileId << " failed: " << s.ToString();
    return s.ok();
}

std::vector<SyncRecord> RocksDbSyncLedger::allSynced() {
    std::lock_guard<std::mutex> lock(db_mutex);
    std::vector<SyncRecord> records;
    if (!db) return records;

    std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
    for (it->Seek(RECORD_PREFIX); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (key.compare(0, RECORD_PREFIX.size(), RECORD_PREFIX) != 0)
            break;
        SyncRecord rec;
        if (parseRecord(it->value().ToString(), rec))
            records.push_back(rec);
        else
            LOG_W("[ledger]") << "skipping unreadable record " << key;
    }
    return records;
}

bool RocksDbSyncLedger::clear() {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return false;

    rocksdb::WriteBatch batch;
    std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
    for (it->Seek(RECORD_PREFIX); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (key.compare(0, RECORD_PREFIX.size(), RECORD_PREFIX) != 0)
            break;
        batch.Delete(key);
    }
    rocksdb::Status s = db->Write(rocksdb::WriteOptions(), &batch);
    return s.ok();
}

std::size_t RocksDbSyncLedger::countByKind(AssetKind kind) {
    std::size_t n = 0;
    for (const auto& rec : allSynced()) {
        if (rec.kind == kind)
            ++n;
    }
    return n;
}

bool RocksDbSyncLedger::saveDeviceName(const std::string& name) {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return false;
    return db->Put(rocksdb::WriteOptions(), DEVICE_NAME_KEY, name).ok();
}

std::optional<std::string> RocksDbSyncLedger::deviceName() {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (!db) return std::nullopt;
    std::string value;
    if (!db->Get(rocksdb::ReadOptions(), DEVICE_NAME_KEY, &value).ok())
        return std::nullopt;
    return value;
}

} // namespace photosync
