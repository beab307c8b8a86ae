#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "constants.h"
#include "ledger/sync_ledger.h"
#include "media/asset_provider.h"
#include "sync/cancellation.h"
#include "sync/media_sync_protocol.h"

namespace photosync {

struct SyncReport {
    std::size_t synced{0};
    std::size_t skipped{0};  // already in the ledger
    std::size_t failed{0};
    bool cancelled{false};
    bool aborted{false};     // connection lost and could not be rebuilt

    SyncReport& operator+=(const SyncReport& o) {
        synced += o.synced;
        skipped += o.skipped;
        failed += o.failed;
        cancelled = cancelled || o.cancelled;
        aborted = aborted || o.aborted;
        return *this;
    }
};

struct SyncerOptions {
    uint64_t chunkedVideoThreshold = CHUNKED_VIDEO_THRESHOLD;
    std::size_t batchSize = SYNC_BATCH_SIZE;
    int batchPauseMs = SYNC_BATCH_PAUSE_MS;
};

/**
 * Walks the local library and uploads whatever the ledger has not seen.
 * A failed item is logged and skipped. If the failure left the connection
 * closed, it is rebuilt once before the next item.
 */
class MediaSyncer {
public:
    MediaSyncer(Transport& conn, SyncProtocolEngine& engine, AssetProvider& assets,
                SyncLedger& ledger, SyncerOptions opts = {});

    void setCancellationToken(CancellationToken token);

    // SyncStart, every kind in order, then the end-of-session handshake.
    SyncReport run(const std::string& deviceName, const std::vector<AssetKind>& kinds);
    SyncReport syncKind(AssetKind kind);

private:
    enum class Outcome { Synced, Skipped, Failed };
    Outcome syncOne(const AssetRef& asset);
    bool recover();

    Transport& conn_;
    SyncProtocolEngine& engine_;
    AssetProvider& assets_;
    SyncLedger& ledger_;
    SyncerOptions opts_;
    CancellationToken token_;
    std::string deviceName_; // replayed as SyncStart after a reconnect
    SyncStatus lastFailure_{SyncStatus::Ok};
};

} // namespace photosync
