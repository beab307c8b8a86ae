#pragma once
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

namespace photosync {

struct LogHelper {
  spdlog::level::level_enum level;
  const char* tag;
  std::ostringstream ss;
  LogHelper(spdlog::level::level_enum lvl, const char* t) : level(lvl), tag(t) {}
  ~LogHelper() { spdlog::log(level, "{} {}", tag, ss.str()); }
  template <typename T> LogHelper& operator<<(const T& v) {
    ss << v;
    return *this;
  }
  LogHelper& operator<<(std::ostream& (*pf)(std::ostream&)) {
    pf(ss);
    return *this;
  }
};

// Accepts trace|debug|info|warn|error|off; unknown names leave the level alone.
inline void setLogLevel(const std::string& name) {
  auto lvl = spdlog::level::from_str(name);
  if (lvl == spdlog::level::off && name != "off")
    return;
  spdlog::set_level(lvl);
}

} // namespace photosync

#define LOG_T(tag) ::photosync::LogHelper(spdlog::level::trace, tag)
#define LOG_D(tag) ::photosync::LogHelper(spdlog::level::debug, tag)
#define LOG_I(tag) ::photosync::LogHelper(spdlog::level::info, tag)
#define LOG_W(tag) ::photosync::LogHelper(spdlog::level::warn, tag)
#define LOG_E(tag) ::photosync::LogHelper(spdlog::level::err, tag)

// Wire-level tracing, compiled out unless PHOTOSYNC_NET_TRACE is defined.
#ifdef PHOTOSYNC_NET_TRACE
  #define NET_TRACE(...) spdlog::debug(__VA_ARGS__)
#else
  #define NET_TRACE(...) (void)0
#endif
