#ifndef PHOTOSYNC_LOGGER_H
#define PHOTOSYNC_LOGGER_H

#include <string>

namespace photosync {

// User-facing status lines for the CLI. Routed through spdlog so they honour
// the configured level and sink.
class Logger {
public:
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void success(const std::string& msg);
};

} // namespace photosync

#endif // PHOTOSYNC_LOGGER_H
