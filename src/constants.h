#ifndef PHOTOSYNC_CONSTANTS_H
#define PHOTOSYNC_CONSTANTS_H
#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace photosync {

// Well-known ports. The server listens for TCP sessions and answers discovery
// queries on UDP.
inline constexpr uint16_t DEFAULT_SERVER_PORT = 9922;
inline constexpr uint16_t DEFAULT_DISCOVERY_PORT = 7799;
inline constexpr int DEFAULT_DISCOVERY_WINDOW_MS = 5000;

inline constexpr std::string_view DISCOVERY_QUERY = "who is photo server?";
inline constexpr std::string_view DISCOVERY_REPLY_NAME_TAG = "photo_server:";
inline constexpr std::string_view DISCOVERY_REPLY_IP_TAG = "IP:";

// 1 byte type + 4 byte big-endian length
inline constexpr std::size_t FRAME_HEADER_SIZE = 5;
// Anything above this is treated as a corrupted length prefix rather than a
// frame we should keep buffering for.
inline constexpr std::size_t MAX_FRAME_PAYLOAD = 256 * 1024 * 1024; // 256 MiB

// --- Connection manager pacing ---
// Very small queue on purpose: the OS send buffer (Send-Q) is the real
// buffer on slow uplinks and we do not want to stack a second one on top.
inline constexpr std::size_t SEND_QUEUE_CAPACITY = 10;
inline constexpr int SEND_BACKPRESSURE_POLL_MS = 100;
inline constexpr std::size_t SEND_BATCH_SIZE = 3;
inline constexpr int SEND_BATCH_PAUSE_MS = 100;
inline constexpr int SEND_BATCH_PAUSE_FULL_MS = 150; // queue still at capacity
inline constexpr int RECONNECT_COOLDOWN_MS = 500;
inline constexpr int FORCE_RECONNECT_COOLDOWN_MS = 1000;
inline constexpr int TCP_KEEPALIVE_INTERVAL_S = 10;
inline constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;

// --- Engine waits and timeouts ---
inline constexpr int WAIT_POLL_INTERVAL_MS = 100;
inline constexpr int ACK_TIMEOUT_BASE_MS = 10000;
inline constexpr int ACK_TIMEOUT_PER_MB_MS = 1500;
inline constexpr int ACK_TIMEOUT_MAX_MS = 60000;
inline constexpr std::size_t SPLIT_SEND_THRESHOLD = 5 * 1024 * 1024; // > 5 MB
inline constexpr std::size_t SPLIT_SEND_PIECE = 1024 * 1024;         // 1 MB
inline constexpr int SPLIT_SEND_PIECE_DELAY_MS = 50;

// --- Adaptive chunked upload ---
inline constexpr std::size_t CHUNK_INITIAL_SIZE = 1024;
inline constexpr std::size_t CHUNK_SIZE_STEP = 512;
inline constexpr int CHUNK_RTT_TARGET_MS = 100;
inline constexpr std::size_t CHUNKED_VIDEO_THRESHOLD = 10 * 1024 * 1024;

// --- Ack vocabulary ---
inline constexpr std::string_view ACK_PREFIX = "OK:";
inline constexpr std::string_view ACK_START = "START";
inline constexpr std::string_view ACK_CHUNK_PREFIX = "CHUNK:";
inline constexpr std::string_view SYNC_COMPLETE_ID = "sync_complete";

// --- Server listing ---
inline constexpr int SERVER_ID_PAGE_SIZE = 100;
// Counts above this are treated as a corrupt reply rather than paged through.
inline constexpr uint64_t MAX_SERVER_MEDIA_COUNT = 10000000;
inline constexpr std::size_t SERVER_ID_RESERVE_LIMIT = 4096;

// --- Media syncer ---
inline constexpr std::size_t SYNC_BATCH_SIZE = 5;
inline constexpr int SYNC_BATCH_PAUSE_MS = 50;

} // namespace photosync

#endif // PHOTOSYNC_CONSTANTS_H
