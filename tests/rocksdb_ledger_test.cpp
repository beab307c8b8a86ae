#include "ledger/rocksdb_sync_ledger.h"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <unistd.h>

using namespace photosync;
namespace fs = std::filesystem;

int main() {
    fs::path dir = fs::temp_directory_path() / ("photosync_ledger_" + std::to_string(::getpid()));
    fs::remove_all(dir);

    {
        RocksDbSyncLedger ledger(dir.string());
        assert(ledger.isOpen());
        assert(ledger.recordSynced("IMG_1.jpg", AssetKind::Photo));
        assert(ledger.recordSynced("VID_1.mp4", AssetKind::Video));
        assert(ledger.saveDeviceName("pixel"));
    }

    // Survives a reopen.
    {
        RocksDbSyncLedger ledger(dir.string());
        assert(ledger.isSynced("IMG_1.jpg"));
        assert(!ledger.isSynced("IMG_2.jpg"));
        auto all = ledger.allSynced();
        assert(all.size() == 2);
        assert(ledger.countByKind(AssetKind::Video) == 1);
        assert(ledger.deviceName().value() == "pixel");

        assert(ledger.clear());
        assert(ledger.allSynced().empty());
        assert(ledger.deviceName().value() == "pixel");
    }

    fs::remove_all(dir);
    std::cout << "RocksDB ledger tests OK\n";
    return 0;
}
