#include "config.h"
#include "logging.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace photosync {

AppConfig& getAppConfig() {
    static AppConfig cfg;
    return cfg;
}

namespace {

std::string trim(std::string value) {
    auto notSpace = [](int ch) { return std::isspace(ch) == 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

int parseInt(const std::string &key, const std::string &value, int minVal, int maxVal) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception &) {
        throw std::runtime_error("config: " + key + " expects an integer, got '" + value + "'");
    }
    return std::clamp(parsed, minVal, maxVal);
}

void applyEnvOverrides(AppConfig &cfg) {
    if (const char *env = std::getenv("PHOTOSYNC_LOG_LEVEL"))
        cfg.log_level = env;
    if (const char *env = std::getenv("PHOTOSYNC_DEVICE_NAME"))
        cfg.device_name = env;
}

} // namespace

void loadConfigFile(const std::string &path) {
    auto &cfg = getAppConfig();
    std::ifstream in(path);
    if (!in.is_open()) {
        applyEnvOverrides(cfg);
        return;
    }
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_W("[config]") << "ignoring line without '=': " << line;
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "server_port") {
            cfg.server_port = static_cast<uint16_t>(parseInt(key, value, 1, 65535));
        } else if (key == "discovery_port") {
            cfg.discovery_port = static_cast<uint16_t>(parseInt(key, value, 1, 65535));
        } else if (key == "discovery_timeout_ms") {
            cfg.discovery_timeout_ms = parseInt(key, value, 100, 60000);
        } else if (key == "discovery_broadcast") {
            cfg.discovery_broadcast = value;
        } else if (key == "device_name") {
            cfg.device_name = value;
        } else if (key == "ledger_path") {
            cfg.ledger_path = value;
        } else if (key == "log_level") {
            cfg.log_level = value;
        } else if (key == "send_queue_capacity") {
            cfg.send_queue_capacity = static_cast<std::size_t>(parseInt(key, value, 1, 1024));
        } else if (key == "send_batch_size") {
            cfg.send_batch_size = static_cast<std::size_t>(parseInt(key, value, 1, 64));
        } else if (key == "send_batch_pause_ms") {
            cfg.send_batch_pause_ms = parseInt(key, value, 0, 5000);
        } else if (key == "chunked_video_threshold_mb") {
            cfg.chunked_video_threshold_mb = parseInt(key, value, 1, 4096);
        } else {
            LOG_W("[config]") << "unknown key '" << key << "'";
        }
    }

    applyEnvOverrides(cfg);
}

void saveConfigValue(const std::string &path, const std::string &key,
                     const std::string &value) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    bool updated = false;
    std::string line;
    if (in.is_open()) {
        while (std::getline(in, line)) {
            if (line.rfind(key + '=', 0) == 0) {
                lines.push_back(key + '=' + value);
                updated = true;
            } else {
                lines.push_back(line);
            }
        }
        in.close();
    }
    if (!updated) {
        lines.push_back(key + '=' + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_E("[config]") << "cannot write " << path;
        return;
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 != lines.size())
            out << '\n';
    }
}

} // namespace photosync
