// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

using SqliteHandle = std::unique_ptr<sqlite3, void(*)(sqlite3*)>;

// Everything main() needs after boot; on failure only ok/error/logs are meaningful.
struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
    SqliteHandle db{nullptr, [](sqlite3* p){ if (p) sqlite3_close(p); }};
};

class Requirements {
public:
    // db_path empty: use the config's metadata_index.
    static StartupResult run(const std::string& config_path,
                             const std::string& db_path = "");

private:
    static bool makeDir(const std::string& dir, StartupResult& out);
    static bool makeParentDir(const std::string& file_path, StartupResult& out);
    static void flushStartupLog(const std::vector<std::string>& lines);
    static bool loadConfig(const std::string& config_path, StartupResult& out);
    static bool checkLimits(const ConfigManager& cfg, StartupResult& out);
    static bool openMetadataIndex(const std::string& db_path, StartupResult& out);
    static void fail(StartupResult& out, const std::string& msg);
};
