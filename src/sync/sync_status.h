#ifndef PHOTOSYNC_SYNC_STATUS_H
#define PHOTOSYNC_SYNC_STATUS_H

namespace photosync {

enum class SyncStatus {
    Ok,
    MalformedFrame,   // codec could not decode; connection closed
    Timeout,          // no reply in time; connection closed
    Cancelled,        // token fired; connection closed
    ConnectionClosed, // socket died underneath us
    Rejected,         // well-formed reply that is not the expected ack
    Unreachable,      // connect failed
    InvalidResponse,  // reply failed validation; connection stays open unless mid-transfer
    AssetUnavailable  // could not read the local asset
};

// Statuses after which the connection must be rebuilt before reuse.
inline bool isConnectionFatal(SyncStatus s) {
    switch (s) {
    case SyncStatus::MalformedFrame:
    case SyncStatus::Timeout:
    case SyncStatus::Cancelled:
    case SyncStatus::ConnectionClosed:
    case SyncStatus::Unreachable:
        return true;
    default:
        return false;
    }
}

inline const char* toString(SyncStatus s) {
    switch (s) {
    case SyncStatus::Ok:               return "ok";
    case SyncStatus::MalformedFrame:   return "malformed frame";
    case SyncStatus::Timeout:          return "timeout";
    case SyncStatus::Cancelled:        return "cancelled";
    case SyncStatus::ConnectionClosed: return "connection closed";
    case SyncStatus::Rejected:         return "rejected";
    case SyncStatus::Unreachable:      return "unreachable";
    case SyncStatus::InvalidResponse:  return "invalid response";
    case SyncStatus::AssetUnavailable: return "asset unavailable";
    }
    return "unknown";
}

} // namespace photosync

#endif // PHOTOSYNC_SYNC_STATUS_H
