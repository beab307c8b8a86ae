#include "sync/media_sync_protocol.h"
#include "base64.h"
#include "constants.h"
#include "logging.h"
#include "sync/chunk_sizer.h"
#include <algorithm>
#include <set>
#include <thread>

namespace photosync {

using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

namespace {

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

// ---------------------------------------------------------------------------
// FrameAwaiter
// ---------------------------------------------------------------------------

FrameAwaiter::FrameAwaiter(Transport& conn, CancellationToken token)
    : conn_(conn), sub_(conn.subscribe()), token_(std::move(token)) {}

bool FrameAwaiter::tryDecode(Frame& out, SyncStatus& status)
{
    if (buffer_.empty())
        return false;
    DecodeResult r = FrameCodec::decode(buffer_);
    if (r.status == DecodeStatus::Incomplete)
        return false;
    if (r.status == DecodeStatus::Malformed) {
        status = SyncStatus::MalformedFrame;
        return true;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(r.consumed));
    out = std::move(r.frame);
    status = SyncStatus::Ok;
    return true;
}

SyncStatus FrameAwaiter::next(Frame& out, milliseconds timeout)
{
    SyncStatus status = SyncStatus::Ok;
    if (tryDecode(out, status))
        return status;

    const auto deadline = Clock::now() + timeout;
    const milliseconds poll(WAIT_POLL_INTERVAL_MS);
    std::vector<uint8_t> chunk;
    for (;;) {
        if (token_.isCancellationRequested())
            return SyncStatus::Cancelled;

        auto now = Clock::now();
        if (now >= deadline)
            return SyncStatus::Timeout;
        auto left = std::chrono::duration_cast<milliseconds>(deadline - now);

        switch (sub_->next(chunk, std::min(left, poll))) {
        case InboundSubscription::WaitResult::Data:
            buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
            if (tryDecode(out, status))
                return status;
            break;
        case InboundSubscription::WaitResult::Closed:
            return SyncStatus::ConnectionClosed;
        case InboundSubscription::WaitResult::TimedOut:
            if (conn_.isClosed())
                return SyncStatus::ConnectionClosed;
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// SyncProtocolEngine
// ---------------------------------------------------------------------------

SyncProtocolEngine::SyncProtocolEngine(Transport& conn) : conn_(conn) {}

milliseconds SyncProtocolEngine::computeAckTimeout(std::size_t payloadBytes, bool capped)
{
    double mb = static_cast<double>(payloadBytes) / (1024.0 * 1024.0);
    auto ms = static_cast<long long>(ACK_TIMEOUT_BASE_MS + mb * ACK_TIMEOUT_PER_MB_MS);
    ms = std::max<long long>(ms, ACK_TIMEOUT_BASE_MS);
    if (capped)
        ms = std::min<long long>(ms, ACK_TIMEOUT_MAX_MS);
    return milliseconds(ms);
}

bool SyncProtocolEngine::fail(SyncStatus status, const std::string& what)
{
    lastStatus_ = status;
    if (isConnectionFatal(status) || status == SyncStatus::InvalidResponse) {
        LOG_W("[sync]") << what << ": " << toString(status) << ", dropping connection";
        conn_.disconnect();
    } else {
        LOG_W("[sync]") << what << ": " << toString(status);
    }
    return false;
}

// The server holds a half-received file; only a fresh connection resets it.
bool SyncProtocolEngine::abortTransfer(SyncStatus status, const std::string& what)
{
    lastStatus_ = status;
    LOG_W("[sync]") << what << ": " << toString(status) << ", abandoning transfer";
    conn_.disconnect();
    return false;
}

bool SyncProtocolEngine::succeed()
{
    lastStatus_ = SyncStatus::Ok;
    return true;
}

void SyncProtocolEngine::reportProgress(const std::string& fileId, uint64_t done, uint64_t total)
{
    if (progress_)
        progress_->push(ProgressEvent{fileId, done, total});
}

bool SyncProtocolEngine::submit(const std::vector<uint8_t>& frameBytes, std::size_t payloadBytes)
{
    if (conn_.isClosed()) {
        lastStatus_ = SyncStatus::ConnectionClosed;
        LOG_W("[sync]") << "send on closed connection";
        return false;
    }
    if (payloadBytes <= SPLIT_SEND_THRESHOLD) {
        if (!conn_.sendData(frameBytes))
            return fail(SyncStatus::ConnectionClosed, "send");
        return true;
    }

    // Large frames go out in 1 MB slices so the bounded queue paces them.
    LOG_D("[sync]") << "splitting " << frameBytes.size() << " bytes into "
                    << (frameBytes.size() + SPLIT_SEND_PIECE - 1) / SPLIT_SEND_PIECE << " pieces";
    for (std::size_t off = 0; off < frameBytes.size(); off += SPLIT_SEND_PIECE) {
        if (token_.isCancellationRequested())
            return fail(SyncStatus::Cancelled, "split send");
        std::size_t n = std::min(SPLIT_SEND_PIECE, frameBytes.size() - off);
        std::vector<uint8_t> piece(frameBytes.begin() + static_cast<std::ptrdiff_t>(off),
                                   frameBytes.begin() + static_cast<std::ptrdiff_t>(off + n));
        if (!conn_.sendData(std::move(piece)))
            return fail(SyncStatus::ConnectionClosed, "split send");
        if (off + n < frameBytes.size())
            std::this_thread::sleep_for(milliseconds(SPLIT_SEND_PIECE_DELAY_MS));
    }
    return true;
}

bool SyncProtocolEngine::await(FrameAwaiter& awaiter, Frame& out, milliseconds timeout)
{
    SyncStatus s = awaiter.next(out, timeout);
    if (s != SyncStatus::Ok)
        return fail(s, "waiting for reply");
    NET_TRACE("[sync] <- {} ({} bytes)", packetTypeName(out.type), out.payload.size());
    return true;
}

bool SyncProtocolEngine::sendAck(const std::string& text)
{
    return submit(FrameCodec::encode(PacketType::SYNC_COMPLETE, Payloads::ackText(text)), 0);
}

bool SyncProtocolEngine::sendPacketWaitAck(PacketType type, const std::vector<uint8_t>& payload,
                                           const std::string& fileId)
{
    FrameAwaiter awaiter(conn_, token_);
    if (!submit(FrameCodec::encode(type, payload), payload.size()))
        return false;

    const bool split = payload.size() > SPLIT_SEND_THRESHOLD;
    Frame reply;
    if (!await(awaiter, reply, computeAckTimeout(payload.size(), !split)))
        return false;

    if (!Payloads::ackMatches(reply, fileId)) {
        LOG_W("[sync]") << packetTypeName(type) << " " << fileId << " not acknowledged, got "
                        << packetTypeName(reply.type) << " '" << reply.payloadText().substr(0, 64) << "'";
        return fail(SyncStatus::Rejected, fileId);
    }
    return succeed();
}

bool SyncProtocolEngine::sendSyncStart(const std::string& deviceName)
{
    LOG_I("[sync]") << "session start for '" << deviceName << "'";
    if (!submit(FrameCodec::encode(PacketType::SYNC_START, deviceName), deviceName.size()))
        return false;
    return succeed();
}

bool SyncProtocolEngine::endSyncSession()
{
    return sendPacketWaitAck(PacketType::SYNC_COMPLETE, {}, std::string(SYNC_COMPLETE_ID));
}

std::optional<uint64_t> SyncProtocolEngine::getMediaCount()
{
    FrameAwaiter awaiter(conn_, token_);
    if (!submit(FrameCodec::encode(PacketType::GET_MEDIA_COUNT, std::vector<uint8_t>{}), 0))
        return std::nullopt;
    Frame reply;
    if (!await(awaiter, reply, computeAckTimeout(0)))
        return std::nullopt;
    if (reply.type != PacketType::MEDIA_COUNT_RESPONSE) {
        fail(SyncStatus::Rejected, "media count");
        return std::nullopt;
    }
    auto count = Payloads::decodeMediaCount(reply.payload);
    if (!count) {
        lastStatus_ = SyncStatus::InvalidResponse;
        LOG_W("[sync]") << "unreadable media count (" << reply.payload.size() << " bytes)";
        return std::nullopt;
    }
    succeed();
    return count;
}

std::optional<ThumbPage> SyncProtocolEngine::getMediaThumbList(int pageIndex, int pageSize)
{
    FrameAwaiter awaiter(conn_, token_);
    std::string body = Payloads::encode(ThumbListRequest{pageIndex, pageSize});
    if (!submit(FrameCodec::encode(PacketType::MEDIA_THUMB_LIST, body), body.size()))
        return std::nullopt;
    Frame reply;
    if (!await(awaiter, reply, computeAckTimeout(0)))
        return std::nullopt;
    if (reply.type != PacketType::MEDIA_THUMB_DATA) {
        fail(SyncStatus::Rejected, "thumb list");
        return std::nullopt;
    }
    auto page = Payloads::decodeThumbPage(reply.payloadText());
    if (!page) {
        lastStatus_ = SyncStatus::InvalidResponse;
        LOG_W("[sync]") << "thumb page " << pageIndex << " failed validation";
        return std::nullopt;
    }
    succeed();
    return page;
}

std::optional<std::vector<std::string>> SyncProtocolEngine::getAllServerFileIds()
{
    auto count = getMediaCount();
    if (!count)
        return std::nullopt;

    if (*count > MAX_SERVER_MEDIA_COUNT) {
        lastStatus_ = SyncStatus::InvalidResponse;
        LOG_W("[sync]") << "implausible media count " << *count;
        return std::nullopt;
    }

    std::vector<std::string> ids;
    ids.reserve(static_cast<std::size_t>(std::min<uint64_t>(*count, SERVER_ID_RESERVE_LIMIT)));
    const uint64_t pages = *count / SERVER_ID_PAGE_SIZE + (*count % SERVER_ID_PAGE_SIZE != 0);
    for (uint64_t p = 0; p < pages; ++p) {
        auto page = getMediaThumbList(static_cast<int>(p), SERVER_ID_PAGE_SIZE);
        if (!page)
            return std::nullopt;
        for (auto& item : page->photos)
            ids.push_back(std::move(item.id));
    }
    LOG_D("[sync]") << "server holds " << ids.size() << " files in " << pages << " pages";
    succeed();
    return ids;
}

bool SyncProtocolEngine::deleteMedia(const std::vector<std::string>& fileIds)
{
    FrameAwaiter awaiter(conn_, token_);
    std::string body = Payloads::encodeIdList(fileIds);
    if (!submit(FrameCodec::encode(PacketType::MEDIA_DELETE_LIST, body), body.size()))
        return false;
    Frame reply;
    if (!await(awaiter, reply, computeAckTimeout(body.size())))
        return false;
    if (reply.type != PacketType::MEDIA_DELETE_ACK)
        return fail(SyncStatus::Rejected, "delete");

    std::string status = reply.payloadText();
    if (status.compare(0, 2, "OK") != 0) {
        LOG_W("[sync]") << "server refused delete: " << status;
        return fail(SyncStatus::Rejected, "delete");
    }
    LOG_I("[sync]") << "deleted " << fileIds.size() << " file(s) on server";
    return succeed();
}

std::optional<std::vector<DownloadedMedia>>
SyncProtocolEngine::downloadMedia(const std::vector<std::string>& fileIds)
{
    FrameAwaiter awaiter(conn_, token_);
    std::string body = Payloads::encodeIdList(fileIds);
    if (!submit(FrameCodec::encode(PacketType::MEDIA_DOWNLOAD_LIST, body), body.size()))
        return std::nullopt;
    Frame reply;
    if (!await(awaiter, reply, computeAckTimeout(body.size())))
        return std::nullopt;
    if (reply.type != PacketType::MEDIA_DOWNLOAD_ACK) {
        fail(SyncStatus::Rejected, "download");
        return std::nullopt;
    }

    std::string text = reply.payloadText();
    if (Payloads::looksLikeJsonArray(text)) {
        auto items = Payloads::decodeDownloadList(text);
        if (!items) {
            lastStatus_ = SyncStatus::InvalidResponse;
            LOG_W("[sync]") << "download list failed validation";
            return std::nullopt;
        }
        succeed();
        return items;
    }

    // Anything else announces a server-to-client chunked flow, one file at a
    // time, until every requested id has arrived.
    LOG_D("[sync]") << "download ack '" << text.substr(0, 32) << "', expecting chunked flow";
    std::set<std::string> pending(fileIds.begin(), fileIds.end());
    std::vector<DownloadedMedia> out;
    while (!pending.empty()) {
        DownloadedMedia file;
        if (!receiveChunkedFile(awaiter, file))
            return std::nullopt;
        pending.erase(file.id);
        out.push_back(std::move(file));
    }
    succeed();
    return out;
}

bool SyncProtocolEngine::receiveChunkedFile(FrameAwaiter& awaiter, DownloadedMedia& out)
{
    const milliseconds timeout = computeAckTimeout(0);
    Frame f;
    if (!await(awaiter, f, timeout))
        return false;
    if (f.type != PacketType::CHUNKED_VIDEO_START)
        return fail(SyncStatus::InvalidResponse, "expected chunked start");
    auto start = Payloads::decodeChunkedStart(f.payloadText());
    if (!start)
        return fail(SyncStatus::InvalidResponse, "chunked start");
    if (!sendAck(std::string(ACK_START)))
        return false;

    out.id = start->id;
    out.data.clear();
    out.data.reserve(static_cast<std::size_t>(std::min<uint64_t>(start->totalSize, MAX_FRAME_PAYLOAD)));
    uint64_t expected = 0;

    for (;;) {
        if (!await(awaiter, f, timeout))
            return false;

        if (f.type == PacketType::CHUNKED_VIDEO_DATA) {
            auto chunk = Payloads::decodeChunkData(f.payloadText());
            if (!chunk || chunk->id != start->id || chunk->chunkIndex != expected)
                return fail(SyncStatus::InvalidResponse, "chunk " + std::to_string(expected) + " of " + start->id);
            out.data.insert(out.data.end(), chunk->bytes.begin(), chunk->bytes.end());
            if (!sendAck(std::string(ACK_CHUNK_PREFIX) + std::to_string(expected)))
                return false;
            ++expected;
            reportProgress(start->id, out.data.size(), start->totalSize);
            continue;
        }

        if (f.type == PacketType::CHUNKED_VIDEO_COMPLETE) {
            auto done = Payloads::decodeChunkedComplete(f.payloadText());
            if (!done || done->id != start->id || done->totalBytes != out.data.size())
                return fail(SyncStatus::InvalidResponse, "chunked complete for " + start->id);
            if (!sendAck(start->id))
                return false;
            LOG_I("[sync]") << "received " << start->id << " (" << out.data.size() << " bytes, "
                            << expected << " chunks)";
            return true;
        }

        return fail(SyncStatus::InvalidResponse,
                    std::string("unexpected ") + packetTypeName(f.type) + " in chunked flow");
    }
}

bool SyncProtocolEngine::uploadPhoto(const std::string& fileId, const std::string& ext,
                                     const std::vector<uint8_t>& bytes)
{
    std::string body = Payloads::encode(MediaPacket{fileId, Base64::encode(bytes), ext});
    LOG_D("[sync]") << "photo " << fileId << " " << bytes.size() << " bytes";
    return sendPacketWaitAck(PacketType::PHOTO, bytesOf(body), fileId);
}

bool SyncProtocolEngine::uploadVideo(const std::string& fileId, const std::string& ext,
                                     const std::vector<uint8_t>& bytes)
{
    std::string body = Payloads::encode(MediaPacket{fileId, Base64::encode(bytes), ext});
    LOG_D("[sync]") << "video " << fileId << " " << bytes.size() << " bytes";
    return sendPacketWaitAck(PacketType::VIDEO, bytesOf(body), fileId);
}

bool SyncProtocolEngine::uploadVideoChunked(const std::string& fileId, const std::string& ext,
                                            std::istream& in, uint64_t totalSize)
{
    FrameAwaiter awaiter(conn_, token_);
    const milliseconds timeout = computeAckTimeout(0);

    std::string startBody = Payloads::encode(ChunkedStart{fileId, ext, totalSize});
    if (!submit(FrameCodec::encode(PacketType::CHUNKED_VIDEO_START, startBody), startBody.size()))
        return false;
    Frame reply;
    if (!await(awaiter, reply, timeout))
        return false;
    if (!Payloads::ackMatches(reply, std::string(ACK_START)) && !Payloads::ackMatches(reply, fileId))
        return fail(SyncStatus::Rejected, "chunked start " + fileId);

    AdaptiveChunkSizer sizer;
    uint64_t sent = 0;
    uint64_t index = 0;
    std::vector<uint8_t> buf;
    while (sent < totalSize) {
        if (token_.isCancellationRequested())
            return fail(SyncStatus::Cancelled, "chunked upload " + fileId);

        std::size_t n = static_cast<std::size_t>(std::min<uint64_t>(sizer.current(), totalSize - sent));
        buf.resize(n);
        in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
        if (static_cast<std::size_t>(in.gcount()) != n) {
            LOG_W("[sync]") << fileId << " ended after " << sent + in.gcount() << " of " << totalSize << " bytes";
            return abortTransfer(SyncStatus::AssetUnavailable, "chunked upload " + fileId);
        }

        ChunkData chunk{fileId, index, std::move(buf)};
        std::string body = Payloads::encode(chunk);
        buf = std::move(chunk.bytes);

        auto t0 = Clock::now();
        if (!submit(FrameCodec::encode(PacketType::CHUNKED_VIDEO_DATA, body), body.size()))
            return false;
        if (!await(awaiter, reply, computeAckTimeout(body.size())))
            return false;
        const std::string expectedAck = std::string(ACK_CHUNK_PREFIX) + std::to_string(index);
        if (!Payloads::ackMatches(reply, expectedAck))
            return abortTransfer(SyncStatus::Rejected, fileId + " chunk " + std::to_string(index));
        long rtt = static_cast<long>(
            std::chrono::duration_cast<milliseconds>(Clock::now() - t0).count());

        sizer.onAck(rtt);
        sent += n;
        ++index;
        NET_TRACE("[sync] {} chunk {} size {} rtt {}ms", fileId, index - 1, n, rtt);
        reportProgress(fileId, sent, totalSize);
    }

    std::string doneBody = Payloads::encode(ChunkedComplete{fileId, totalSize});
    if (!submit(FrameCodec::encode(PacketType::CHUNKED_VIDEO_COMPLETE, doneBody), doneBody.size()))
        return false;
    if (!await(awaiter, reply, timeout))
        return false;
    if (!Payloads::ackMatches(reply, fileId))
        return fail(SyncStatus::Rejected, "chunked complete " + fileId);

    LOG_I("[sync]") << fileId << " uploaded in " << index << " chunks, final chunk size "
                    << sizer.current() << (sizer.stabilized() ? " (stabilized)" : "");
    return succeed();
}

} // namespace photosync
