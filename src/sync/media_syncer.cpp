#include "sync/media_syncer.h"
#include "logging.h"
#include "media/asset_identity.h"
#include <algorithm>
#include <chrono>
#include <iterator>
#include <thread>

namespace photosync {

MediaSyncer::MediaSyncer(Transport& conn, SyncProtocolEngine& engine, AssetProvider& assets,
                         SyncLedger& ledger, SyncerOptions opts)
    : conn_(conn), engine_(engine), assets_(assets), ledger_(ledger), opts_(opts) {}

void MediaSyncer::setCancellationToken(CancellationToken token)
{
    token_ = token;
    engine_.setCancellationToken(std::move(token));
}

SyncReport MediaSyncer::run(const std::string& deviceName, const std::vector<AssetKind>& kinds)
{
    SyncReport report;
    deviceName_ = deviceName;
    if (!engine_.sendSyncStart(deviceName)) {
        LOG_E("[syncer]") << "could not open sync session: " << toString(engine_.lastStatus());
        report.aborted = true;
        return report;
    }

    for (AssetKind kind : kinds) {
        report += syncKind(kind);
        if (report.cancelled || report.aborted)
            break;
    }

    if (!report.cancelled && !report.aborted && !engine_.endSyncSession())
        LOG_W("[syncer]") << "sync session not confirmed: " << toString(engine_.lastStatus());
    return report;
}

SyncReport MediaSyncer::syncKind(AssetKind kind)
{
    SyncReport report;
    const auto assets = assets_.listAssets(kind);
    LOG_I("[syncer]") << assets.size() << " " << toString(kind) << "(s) to check";

    for (std::size_t i = 0; i < assets.size(); i += opts_.batchSize) {
        const std::size_t end = std::min(assets.size(), i + opts_.batchSize);
        LOG_D("[syncer]") << "processing " << i + 1 << " to " << end << " of " << assets.size();

        for (std::size_t j = i; j < end; ++j) {
            if (token_.isCancellationRequested()) {
                report.cancelled = true;
                LOG_I("[syncer]") << "sync cancelled";
                return report;
            }
            switch (syncOne(assets[j])) {
            case Outcome::Synced:  ++report.synced;  break;
            case Outcome::Skipped: ++report.skipped; break;
            case Outcome::Failed:
                ++report.failed;
                if (lastFailure_ == SyncStatus::Cancelled) {
                    report.cancelled = true;
                    return report;
                }
                // Whatever closed the connection, the next item needs a live one.
                if (conn_.isClosed() && !recover()) {
                    report.aborted = true;
                    return report;
                }
                break;
            }
        }

        if (end < assets.size())
            std::this_thread::sleep_for(std::chrono::milliseconds(opts_.batchPauseMs));
    }
    return report;
}

MediaSyncer::Outcome MediaSyncer::syncOne(const AssetRef& asset)
{
    lastFailure_ = SyncStatus::Ok;
    auto in = assets_.openStream(asset);
    auto size = assets_.byteSize(asset);
    if (!in || !size) {
        lastFailure_ = SyncStatus::AssetUnavailable;
        LOG_W("[syncer]") << "skipping unreadable asset " << asset.id;
        return Outcome::Failed;
    }

    auto head = AssetIdentity::peekHeader(*in);
    const std::string ext = AssetIdentity::resolveExtension(head.data(), head.size(),
                                                            assets_.mimeType(asset), asset.kind);
    const std::string fileId = AssetIdentity::deriveFileId(asset.id, asset.kind, ext);
    if (ledger_.isSynced(fileId))
        return Outcome::Skipped;

    bool ok = false;
    if (asset.kind == AssetKind::Video && *size >= opts_.chunkedVideoThreshold) {
        ok = engine_.uploadVideoChunked(fileId, ext, *in, *size);
    } else {
        std::vector<uint8_t> bytes;
        bytes.reserve(static_cast<std::size_t>(*size));
        bytes.assign(std::istreambuf_iterator<char>(*in), std::istreambuf_iterator<char>());
        ok = asset.kind == AssetKind::Photo ? engine_.uploadPhoto(fileId, ext, bytes)
                                            : engine_.uploadVideo(fileId, ext, bytes);
    }

    if (!ok) {
        lastFailure_ = engine_.lastStatus();
        LOG_W("[syncer]") << "server did not accept " << fileId << ": " << toString(engine_.lastStatus());
        return Outcome::Failed;
    }
    if (!ledger_.recordSynced(fileId, asset.kind))
        LOG_W("[syncer]") << fileId << " uploaded but not recorded in history";
    LOG_I("[syncer]") << "synced " << fileId;
    return Outcome::Synced;
}

bool MediaSyncer::recover()
{
    LOG_W("[syncer]") << "connection lost, reconnecting";
    if (conn_.reconnect()) {
        if (!deviceName_.empty() && !engine_.sendSyncStart(deviceName_))
            return false;
        return true;
    }
    LOG_E("[syncer]") << "reconnect failed, stopping sync";
    return false;
}

} // namespace photosync
