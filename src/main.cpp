#include "config.h"
#include "constants.h"
#include "db/db_paths.h"
#include "discovery/device_finder.h"
#include "ledger/memory_sync_ledger.h"
#include "ledger/rocksdb_sync_ledger.h"
#include "logging.h"
#include "media/directory_asset_provider.h"
#include "sync/media_sync_protocol.h"
#include "sync/media_syncer.h"
#include "sync/progress_channel.h"
#include "transport/server_connection.h"
#include "utils/logger.h"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace photosync;

namespace {

CancellationSource g_cancel;

void handleSigint(int) { g_cancel.cancel(); }

struct CliOptions {
  std::string configPath;
  bool noHistory = false;
  int port = -1;
  std::string logLevel;
  std::vector<std::string> args; // command + positionals
};

} // namespace

// Print usage information for CLI commands
void print_usage() {
  std::cout
      << "Usage: photosync [options] <command> [args]\n"
      << "Commands:\n"
      << "  discover                              Broadcast for photo servers "
         "on the local network\n"
      << "  count <host>                          Show how many files the "
         "server holds\n"
      << "  list <host> [page] [size]             List one page of server "
         "thumbnails\n"
      << "  ids <host>                            List every file id on the "
         "server\n"
      << "  delete <host> <id>...                 Delete files on the server\n"
      << "  download <host> <dir> <id>...         Download files into <dir>\n"
      << "  sync <host> <root> [photos|videos|all]  Upload new media under "
         "<root>\n"
      << "  history                               Show sync history\n"
      << "  clear-history                         Forget every synced file\n"
      << "  config <key> <value>                  Save a setting to the config "
         "file\n"
      << "Options:\n"
      << "  --config <file>                       Config file (default "
      << DBPaths::getConfigFile() << ")\n"
      << "  --port <n>                            Server TCP port\n"
      << "  --log-level <level>                   trace|debug|info|warn|error\n"
      << "  --no-history                          Keep sync history in memory "
         "for this run only\n"
      << "  --help                                Show this message\n"
      << "<host> may be 'auto' to use the first server that answers "
         "discovery.\n";
}

static std::unique_ptr<SyncLedger> openLedger(const CliOptions &opts) {
  if (opts.noHistory)
    return std::make_unique<MemorySyncLedger>();
  std::string path = getAppConfig().ledger_path.empty()
                         ? DBPaths::getLedgerDB()
                         : getAppConfig().ledger_path;
  DBPaths::ensureDir(std::filesystem::path(path).parent_path().string());
  auto ledger = std::make_unique<RocksDbSyncLedger>(path);
  if (!ledger->isOpen()) {
    Logger::error("Cannot open sync history at " + path);
    return nullptr;
  }
  return ledger;
}

static std::string localDeviceName(SyncLedger &ledger) {
  if (!getAppConfig().device_name.empty())
    return getAppConfig().device_name;
  if (auto saved = ledger.deviceName())
    return *saved;
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0')
    return "photosync";
  return host;
}

static std::string resolveHost(const std::string &host) {
  if (host != "auto")
    return host;
  auto devices = DeviceFinder::discover(DiscoveryOptions::fromConfig(),
                                        g_cancel.getToken());
  for (const auto &d : devices) {
    if (!d.ipAddress.empty()) {
      Logger::info("Using " + d.name + " at " + d.ipAddress);
      return d.ipAddress;
    }
  }
  return {};
}

static bool openSession(const std::string &host, ServerConnection &conn) {
  std::string target = resolveHost(host);
  if (target.empty()) {
    Logger::error("No photo server found");
    return false;
  }
  if (!conn.connect(target, getAppConfig().server_port)) {
    Logger::error("Cannot reach " + target + ":" +
                  std::to_string(getAppConfig().server_port));
    return false;
  }
  return true;
}

static int cmdDiscover() {
  DiscoverySession session(DiscoveryOptions::fromConfig(), g_cancel.getToken());
  if (!session.start())
    return 1;
  std::cout << "🔍 Searching on " << session.target() << " ...\n";
  DeviceInfo dev;
  int found = 0;
  while (session.next(dev)) {
    ++found;
    std::cout << "  📷 " << dev.name << "  "
              << (dev.ipAddress.empty() ? "(no address)" : dev.ipAddress)
              << "\n";
  }
  if (found == 0)
    Logger::warn("No photo server answered");
  return 0;
}

static int cmdCount(SyncProtocolEngine &engine) {
  auto count = engine.getMediaCount();
  if (!count) {
    Logger::error(std::string("Count failed: ") + toString(engine.lastStatus()));
    return 1;
  }
  std::cout << *count << "\n";
  return 0;
}

static int cmdList(SyncProtocolEngine &engine, int page, int size) {
  auto thumbs = engine.getMediaThumbList(page, size);
  if (!thumbs) {
    Logger::error(std::string("List failed: ") + toString(engine.lastStatus()));
    return 1;
  }
  for (const auto &t : thumbs->photos)
    std::cout << t.id << "\t" << t.media << "\t" << t.data.size()
              << " bytes\n";
  return 0;
}

static int cmdIds(SyncProtocolEngine &engine) {
  auto ids = engine.getAllServerFileIds();
  if (!ids) {
    Logger::error(std::string("Listing failed: ") +
                  toString(engine.lastStatus()));
    return 1;
  }
  for (const auto &id : *ids)
    std::cout << id << "\n";
  return 0;
}

static int cmdDownload(SyncProtocolEngine &engine, const std::string &dir,
                       const std::vector<std::string> &ids) {
  auto files = engine.downloadMedia(ids);
  if (!files) {
    Logger::error(std::string("Download failed: ") +
                  toString(engine.lastStatus()));
    return 1;
  }
  DBPaths::ensureDir(dir);
  for (const auto &f : *files) {
    auto out = std::filesystem::path(dir) / std::filesystem::path(f.id).filename();
    std::ofstream os(out, std::ios::binary);
    if (!os) {
      Logger::error("Cannot write " + out.string());
      return 1;
    }
    os.write(reinterpret_cast<const char *>(f.data.data()),
             static_cast<std::streamsize>(f.data.size()));
    Logger::success(out.string() + " (" + std::to_string(f.data.size()) +
                    " bytes)");
  }
  return 0;
}

static int cmdSync(ServerConnection &conn, SyncProtocolEngine &engine,
                   SyncLedger &ledger, const std::string &root,
                   const std::string &what) {
  std::vector<AssetKind> kinds;
  if (what == "all") {
    kinds = {AssetKind::Photo, AssetKind::Video};
  } else if (auto k = assetKindFromString(what)) {
    kinds = {*k};
  } else {
    Logger::error("Unknown media kind '" + what + "'");
    return 1;
  }

  std::string device = localDeviceName(ledger);
  ledger.saveDeviceName(device);

  DirectoryAssetProvider assets(root);
  SyncerOptions sopts;
  sopts.chunkedVideoThreshold =
      static_cast<uint64_t>(getAppConfig().chunked_video_threshold_mb) *
      1024 * 1024;
  MediaSyncer syncer(conn, engine, assets, ledger, sopts);
  syncer.setCancellationToken(g_cancel.getToken());

  ProgressChannel progress;
  engine.setProgressChannel(&progress);
  std::thread printer([&progress] {
    std::map<std::string, int> lastPct;
    while (!progress.isClosed() || progress.size() > 0) {
      auto ev = progress.waitPop(std::chrono::milliseconds(200));
      if (!ev || ev->totalBytes == 0)
        continue;
      int pct = static_cast<int>(ev->bytesSent * 100 / ev->totalBytes);
      if (pct / 10 != lastPct[ev->fileId] / 10 || pct == 100) {
        lastPct[ev->fileId] = pct;
        std::cout << "  ⏫ " << ev->fileId << " " << pct << "%\n";
      }
    }
  });

  SyncReport report = syncer.run(device, kinds);
  progress.close();
  printer.join();
  engine.setProgressChannel(nullptr);

  std::cout << "📊 synced " << report.synced << ", already synced "
            << report.skipped << ", failed " << report.failed << "\n";
  if (report.cancelled)
    Logger::warn("Sync cancelled");
  if (report.aborted) {
    Logger::error("Sync stopped: server unreachable");
    return 1;
  }
  return report.failed == 0 ? 0 : 2;
}

static int cmdHistory(SyncLedger &ledger) {
  auto records = ledger.allSynced();
  for (const auto &r : records)
    std::cout << r.syncedTime << "  " << toString(r.kind) << "  " << r.fileId
              << "\n";
  std::cout << "📷 " << ledger.countByKind(AssetKind::Photo) << " photos, 🎞️  "
            << ledger.countByKind(AssetKind::Video) << " videos\n";
  return 0;
}

static int runCommand(const CliOptions &opts) {
  const auto &a = opts.args;
  const std::string &cmd = a[0];

  if (cmd == "discover")
    return cmdDiscover();

  if (cmd == "history" || cmd == "clear-history") {
    auto ledger = openLedger(opts);
    if (!ledger)
      return 1;
    if (cmd == "history")
      return cmdHistory(*ledger);
    if (!ledger->clear()) {
      Logger::error("Could not clear history");
      return 1;
    }
    Logger::success("Sync history cleared");
    return 0;
  }

  if (cmd == "config") {
    if (a.size() < 3) {
      std::cerr << "❌ Usage: config <key> <value>\n";
      return 1;
    }
    const std::string path = opts.configPath.empty() ? DBPaths::getConfigFile()
                                                     : opts.configPath;
    saveConfigValue(path, a[1], a[2]);
    loadConfigFile(path); // throws on a value that does not parse
    Logger::success(a[1] + " saved to " + path);
    return 0;
  }

  static const std::map<std::string, size_t> minArgs = {
      {"count", 2}, {"list", 2},     {"ids", 2}, {"delete", 3},
      {"download", 4}, {"sync", 3}};
  auto it = minArgs.find(cmd);
  if (it == minArgs.end()) {
    std::cerr << "❌ Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
  }
  if (a.size() < it->second) {
    std::cerr << "❌ Missing arguments for " << cmd << "\n";
    print_usage();
    return 1;
  }

  ServerConnection conn(ConnectionOptions::fromConfig());
  if (!openSession(a[1], conn))
    return 1;
  SyncProtocolEngine engine(conn);
  engine.setCancellationToken(g_cancel.getToken());

  int rc = 1;
  if (cmd == "count") {
    rc = cmdCount(engine);
  } else if (cmd == "list") {
    int page = a.size() > 2 ? std::stoi(a[2]) : 0;
    int size = a.size() > 3 ? std::stoi(a[3]) : 20;
    rc = cmdList(engine, page, size);
  } else if (cmd == "ids") {
    rc = cmdIds(engine);
  } else if (cmd == "delete") {
    std::vector<std::string> ids(a.begin() + 2, a.end());
    if (engine.deleteMedia(ids)) {
      Logger::success("Deleted " + std::to_string(ids.size()) + " file(s)");
      rc = 0;
    } else {
      Logger::error(std::string("Delete failed: ") +
                    toString(engine.lastStatus()));
    }
  } else if (cmd == "download") {
    rc = cmdDownload(engine, a[2], std::vector<std::string>(a.begin() + 3, a.end()));
  } else if (cmd == "sync") {
    auto ledger = openLedger(opts);
    if (!ledger)
      return 1;
    rc = cmdSync(conn, engine, *ledger, a[2], a.size() > 3 ? a[3] : "all");
  }
  conn.disconnect();
  return rc;
}

int main(int argc, char *argv[]) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h" || arg == "help") {
      print_usage();
      return 0;
    } else if (arg == "--config" && i + 1 < argc) {
      opts.configPath = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      opts.port = std::atoi(argv[++i]);
    } else if (arg == "--log-level" && i + 1 < argc) {
      opts.logLevel = argv[++i];
    } else if (arg == "--no-history") {
      opts.noHistory = true;
    } else {
      opts.args.push_back(arg);
    }
  }
  if (opts.args.empty()) {
    print_usage();
    return 1;
  }

  try {
    DBPaths::ensureDirs();
    loadConfigFile(opts.configPath.empty() ? DBPaths::getConfigFile()
                                           : opts.configPath);
    if (opts.port > 0 && opts.port <= 65535)
      getAppConfig().server_port = static_cast<uint16_t>(opts.port);
    if (!opts.logLevel.empty())
      getAppConfig().log_level = opts.logLevel;
    setLogLevel(getAppConfig().log_level);

    std::signal(SIGINT, handleSigint);
    return runCommand(opts);
  } catch (const std::exception &e) {
    Logger::error(e.what());
    return 1;
  }
}
