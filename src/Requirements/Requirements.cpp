// requirements.cpp
#include "requirements.hpp"
#include "MetadataIndex.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>

namespace {

const char* kStartupLog = "logs/config.log";
const uint64_t kMB = 1024ULL * 1024ULL;
const uint64_t kSizeCeiling = 1024ULL * 1024ULL * kMB; // 1TB

std::string mb_text(uint64_t bytes) {
    return std::to_string(bytes / kMB) + " MB";
}

} // namespace

// Desc: record a fatal startup error
// In: StartupResult& out, const std::string& msg
// Out: void
void Requirements::fail(StartupResult& out, const std::string& msg) {
    out.error = msg;
    out.logs.push_back("[startup] " + msg);
}

// Desc: write all collected startup lines to logs/config.log in one open
// In: const std::vector<std::string>& lines
// Out: void
void Requirements::flushStartupLog(const std::vector<std::string>& lines) {
    std::ofstream log(kStartupLog, std::ios::app);
    if (!log) return;

    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm tm_now{};
    localtime_r(&now, &tm_now);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);

    for (const auto& l : lines) log << "[" << stamp << "] " << l << "\n";
}

// Desc: mkdir one level; an existing directory counts as success
// In: const std::string& dir, StartupResult& out
// Out: bool
bool Requirements::makeDir(const std::string& dir, StartupResult& out) {
    if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
        out.logs.push_back("[dirs] cannot create " + dir + ": " + ::strerror(errno));
        return false;
    }
    out.logs.push_back("[dirs] ready: " + dir);
    return true;
}

// Desc: make sure the directory holding a configured file exists
// In: const std::string& file_path, StartupResult& out
// Out: bool
bool Requirements::makeParentDir(const std::string& file_path, StartupResult& out) {
    const auto slash = file_path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return true;
    return makeDir(file_path.substr(0, slash), out);
}

// Desc: parse the JSON config into out.config
// In: const std::string& config_path, StartupResult& out
// Out: bool
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (!out.config.loadFromFile(config_path)) {
        fail(out, "config unreadable or invalid: " + config_path);
        return false;
    }
    out.logs.push_back("[config] using " + config_path);
    return true;
}

// Desc: reject absurd cache ceilings, report the effective settings
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool
bool Requirements::checkLimits(const ConfigManager& cfg, StartupResult& out) {
    if (cfg.hasMaxSize() && cfg.getMaxSizeBytes() > kSizeCeiling) {
        fail(out, "cache.max_size above 1TB");
        return false;
    }
    if (cfg.getMinSizeBytes() > kSizeCeiling) {
        fail(out, "cache.min_size above 1TB");
        return false;
    }
    if (cfg.hasMaxSize() && cfg.getMaxSizeBytes() < cfg.getMinSizeBytes()) {
        out.logs.push_back("[config] cache.max_size " + mb_text(cfg.getMaxSizeBytes()) +
                           " lifted to floor " + mb_text(cfg.getMinSizeBytes()));
    }

    const PrefetchSettings& p = cfg.getPrefetchSettings();
    out.logs.push_back("[config] cache: count=" +
                       (cfg.hasMaxCount() ? std::to_string(cfg.getMaxCount()) : std::string("auto")) +
                       " size=" + (cfg.hasMaxSize() ? mb_text(cfg.getMaxSizeBytes()) : std::string("auto")) +
                       " floor=" + mb_text(cfg.getMinSizeBytes()));
    out.logs.push_back("[config] prefetch: +" + std::to_string(p.forward) + " -" +
                       std::to_string(p.backward) + " visible=" + std::to_string(p.visible_center) +
                       " poll=" + std::to_string(p.poll_interval_ms) + "ms");
    out.logs.push_back("[config] decoders=" + std::to_string(cfg.getDecodeConcurrency()) +
                       " workers=" + std::to_string(cfg.getWorkers()));
    return true;
}

// Desc: open the SQLite metadata index and create its schema
// In: const std::string& db_path, StartupResult& out
// Out: bool
bool Requirements::openMetadataIndex(const std::string& db_path, StartupResult& out) {
    sqlite3* raw = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &raw, flags, nullptr) != SQLITE_OK) {
        fail(out, "metadata index open failed (" + db_path + "): " +
                  (raw ? sqlite3_errmsg(raw) : "out of memory"));
        if (raw) sqlite3_close(raw);
        return false;
    }
    out.db.reset(raw);

    sqlite3_busy_timeout(raw, 5000);
    sqlite3_exec(raw, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(raw, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    std::string err;
    if (!MetadataIndex::ensure_schema(raw, err)) {
        fail(out, "metadata index schema: " + err);
        out.db.reset();
        return false;
    }
    out.logs.push_back("[metadata] index ready: " + db_path);
    return true;
}

// Desc: boot sequence: dirs, config, metadata index; every step is logged
// In: const std::string& config_path, const std::string& db_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path,
                                const std::string& db_path) {
    StartupResult res;
    makeDir("logs", res);
    makeDir("cache", res);

    bool ok = loadConfig(config_path, res) && checkLimits(res.config, res);
    if (ok) {
        const std::string path = db_path.empty() ? res.config.getMetadataIndexPath() : db_path;
        makeParentDir(res.config.getLogPath(), res);
        if (path != ":memory:") makeParentDir(path, res);
        ok = openMetadataIndex(path, res);
    }

    res.ok = ok;
    res.logs.push_back(ok ? "[startup] ok" : "[startup] aborted");
    flushStartupLog(res.logs);
    return res;
}
