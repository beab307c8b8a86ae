#pragma once
#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "sync/cancellation.h"
#include "sync/payloads.h"
#include "sync/progress_channel.h"
#include "sync/sync_status.h"
#include "transport/transport.h"
#include "wire/frame_codec.h"

namespace photosync {

/**
 * Reassembles frames from one inbound subscription. The buffer persists
 * across next() calls so frames that arrive back to back in one read are
 * handed out in order.
 */
class FrameAwaiter {
public:
    FrameAwaiter(Transport& conn, CancellationToken token);

    // Ok with `out` filled, or Timeout / Cancelled / ConnectionClosed /
    // MalformedFrame. The token and the connection are polled every 100ms.
    SyncStatus next(Frame& out, std::chrono::milliseconds timeout);

    std::size_t buffered() const { return buffer_.size(); }

private:
    bool tryDecode(Frame& out, SyncStatus& status);

    Transport& conn_;
    std::shared_ptr<InboundSubscription> sub_;
    CancellationToken token_;
    std::vector<uint8_t> buffer_;
};

/**
 * Client side of the media sync protocol. One operation at a time per
 * connection; callers serialize. Every operation reports failure through its
 * return value and leaves the reason in lastStatus(). Connection-fatal
 * failures, and any failure in the middle of a chunked transfer, disconnect
 * the transport before returning.
 */
class SyncProtocolEngine {
public:
    explicit SyncProtocolEngine(Transport& conn);

    void setCancellationToken(CancellationToken token) { token_ = std::move(token); }
    void setProgressChannel(ProgressChannel* channel) { progress_ = channel; }
    SyncStatus lastStatus() const { return lastStatus_; }

    // 10s + 1.5s/MB, at least 10s; capped at 60s unless `capped` is false.
    static std::chrono::milliseconds computeAckTimeout(std::size_t payloadBytes, bool capped = true);

    bool sendPacketWaitAck(PacketType type, const std::vector<uint8_t>& payload,
                           const std::string& fileId);

    bool sendSyncStart(const std::string& deviceName);
    bool endSyncSession();

    std::optional<uint64_t> getMediaCount();
    std::optional<ThumbPage> getMediaThumbList(int pageIndex, int pageSize);
    std::optional<std::vector<std::string>> getAllServerFileIds();
    bool deleteMedia(const std::vector<std::string>& fileIds);
    std::optional<std::vector<DownloadedMedia>> downloadMedia(const std::vector<std::string>& fileIds);

    bool uploadPhoto(const std::string& fileId, const std::string& ext,
                     const std::vector<uint8_t>& bytes);
    bool uploadVideo(const std::string& fileId, const std::string& ext,
                     const std::vector<uint8_t>& bytes);
    bool uploadVideoChunked(const std::string& fileId, const std::string& ext,
                            std::istream& in, uint64_t totalSize);

private:
    bool submit(const std::vector<uint8_t>& frameBytes, std::size_t payloadBytes);
    bool await(FrameAwaiter& awaiter, Frame& out, std::chrono::milliseconds timeout);
    bool sendAck(const std::string& text);
    bool receiveChunkedFile(FrameAwaiter& awaiter, DownloadedMedia& out);
    bool fail(SyncStatus status, const std::string& what);
    bool abortTransfer(SyncStatus status, const std::string& what);
    bool succeed();
    void reportProgress(const std::string& fileId, uint64_t done, uint64_t total);

    Transport& conn_;
    CancellationToken token_;
    ProgressChannel* progress_{nullptr};
    SyncStatus lastStatus_{SyncStatus::Ok};
};

} // namespace photosync
