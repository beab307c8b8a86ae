#include "logger.h"
#include <spdlog/spdlog.h>

namespace photosync {

void Logger::info(const std::string& msg) {
    spdlog::info("ℹ️  {}", msg);
}

void Logger::warn(const std::string& msg) {
    spdlog::warn("⚠️  {}", msg);
}

void Logger::error(const std::string& msg) {
    spdlog::error("❌ {}", msg);
}

void Logger::success(const std::string& msg) {
    spdlog::info("✅ {}", msg);
}

} // namespace photosync
