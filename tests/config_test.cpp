#include "config.h"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace photosync;
namespace fs = std::filesystem;

int main() {
    ::unsetenv("PHOTOSYNC_LOG_LEVEL");
    ::unsetenv("PHOTOSYNC_DEVICE_NAME");
    fs::path file = fs::temp_directory_path() / ("photosync_conf_" + std::to_string(::getpid()));

    {
        std::ofstream out(file);
        out << "# comment\n"
            << "server_port = 9000\n"
            << "discovery_broadcast=10.0.0.255\n"
            << "send_queue_capacity=4\n"
            << "chunked_video_threshold_mb=2\n"
            << "no_such_key=1\n"
            << "garbage line\n";
    }
    loadConfigFile(file.string());
    auto& cfg = getAppConfig();
    assert(cfg.server_port == 9000);
    assert(cfg.discovery_port == 7799);
    assert(cfg.discovery_broadcast == "10.0.0.255");
    assert(cfg.send_queue_capacity == 4);
    assert(cfg.chunked_video_threshold_mb == 2);

    // Out of range values are clamped.
    saveConfigValue(file.string(), "server_port", "70000");
    loadConfigFile(file.string());
    assert(cfg.server_port == 65535);

    // Environment wins over the file.
    ::setenv("PHOTOSYNC_DEVICE_NAME", "bench-phone", 1);
    loadConfigFile(file.string());
    assert(cfg.device_name == "bench-phone");
    ::unsetenv("PHOTOSYNC_DEVICE_NAME");

    saveConfigValue(file.string(), "send_batch_size", "abc");
    bool threw = false;
    try {
        loadConfigFile(file.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // Missing file leaves the config alone.
    loadConfigFile((file.string() + ".missing"));
    assert(cfg.server_port == 65535);

    // Environment still applies when there is no file yet.
    ::setenv("PHOTOSYNC_LOG_LEVEL", "debug", 1);
    ::setenv("PHOTOSYNC_DEVICE_NAME", "first-run", 1);
    loadConfigFile((file.string() + ".missing"));
    assert(cfg.log_level == "debug");
    assert(cfg.device_name == "first-run");
    ::unsetenv("PHOTOSYNC_LOG_LEVEL");
    ::unsetenv("PHOTOSYNC_DEVICE_NAME");

    fs::remove(file);
    std::cout << "Config tests OK\n";
    return 0;
}
