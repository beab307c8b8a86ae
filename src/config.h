#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace photosync {

struct AppConfig {
    uint16_t server_port = 9922;
    uint16_t discovery_port = 7799;
    int discovery_timeout_ms = 5000;
    std::string discovery_broadcast;        // empty = derive from interface ip/mask
    std::string device_name;                // empty = hostname
    std::string ledger_path;                // empty = DBPaths::getLedgerDB()
    std::string log_level = "info";         // trace|debug|info|warn|error|off

    // --- Connection manager pacing ---
    std::size_t send_queue_capacity = 10;
    std::size_t send_batch_size = 3;
    int send_batch_pause_ms = 100;

    // Videos at or above this size go through the adaptive chunked path.
    int chunked_video_threshold_mb = 10;
};

AppConfig& getAppConfig();
void loadConfigFile(const std::string &path);
void saveConfigValue(const std::string &path, const std::string &key,
                     const std::string &value);

} // namespace photosync
