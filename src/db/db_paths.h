#pragma once
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace photosync {
namespace DBPaths {

inline std::string getHomePath() {
  const char *home = std::getenv("HOME");
  if (!home)
    home = "/root";
  return std::string(home);
}

inline std::string getBaseDir() {
  const char *env = std::getenv("PHOTOSYNC_HOME");
  return env ? std::string(env) : getHomePath() + "/.photosync";
}

inline std::string getConfigFile() {
  return getBaseDir() + "/photosync.conf";
}

inline std::string getLedgerDB() {
  const char *env = std::getenv("PHOTOSYNC_LEDGER_DB");
  return env ? std::string(env) : getBaseDir() + "/sync_ledger";
}

inline void ensureDir(const std::string &path) {
  if (path.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory '" + path +
                             "': " + ec.message());
  }
}

inline void ensureDirs() { ensureDir(getBaseDir()); }

} // namespace DBPaths
} // namespace photosync
