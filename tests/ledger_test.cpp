#include "ledger/memory_sync_ledger.h"
#include <cassert>
#include <iostream>

using namespace photosync;

int main() {
    MemorySyncLedger ledger;
    assert(!ledger.isSynced("IMG_1.jpg"));
    assert(ledger.allSynced().empty());

    assert(ledger.recordSynced("IMG_1.jpg", AssetKind::Photo));
    assert(ledger.recordSynced("IMG_2.png", AssetKind::Photo));
    assert(ledger.recordSynced("VID_1.mp4", AssetKind::Video));
    assert(ledger.recordSynced("IMG_1.jpg", AssetKind::Photo)); // idempotent

    assert(ledger.isSynced("IMG_1.jpg"));
    assert(ledger.allSynced().size() == 3);
    assert(ledger.countByKind(AssetKind::Photo) == 2);
    assert(ledger.countByKind(AssetKind::Video) == 1);

    auto rec = ledger.allSynced().front();
    assert(rec.syncedTime.size() == 20 && rec.syncedTime.back() == 'Z');

    assert(!ledger.deviceName());
    ledger.saveDeviceName("pixel");
    assert(ledger.deviceName().value() == "pixel");

    assert(ledger.clear());
    assert(!ledger.isSynced("IMG_1.jpg"));
    assert(ledger.countByKind(AssetKind::Photo) == 0);
    assert(ledger.deviceName().value() == "pixel");

    std::cout << "Memory ledger tests OK\n";
    return 0;
}
