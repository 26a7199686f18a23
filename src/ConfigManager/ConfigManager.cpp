// === ConfigManager.cpp ===
#include "ConfigManager.hpp"
#include "MemoryBudget.hpp"

#include <fstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <nlohmann/json.hpp>
using nlohmann::json;


// Desc: convert string to lowercase
// In: std::string s
// Out: std::string (lowercased)
static inline std::string toLower(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}


// Desc: parse size string (KB/MB/GB) into bytes
// In: const std::string& raw
// Out: std::uint64_t (bytes); throws on invalid input
std::uint64_t ConfigManager::parse_size(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([kKmMgG][bB]?)$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw std::runtime_error("invalid format (only KB/MB/GB allowed): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number : '" + raw + "'");
    }

    std::string unit = m[2].str();
    for (auto& c : unit) c = (char)std::toupper((unsigned char)c);

    if (unit == "K" || unit == "KB") return n * 1024ULL;
    if (unit == "M" || unit == "MB") return n * 1024ULL * 1024ULL;
    if (unit == "G" || unit == "GB") return n * 1024ULL * 1024ULL * 1024ULL;
    throw std::runtime_error("unreachable unit");
}


// Desc: read an optional non-negative integer member
// In: const json& obj, const char* key, int& out, int min_value, const char* label
// Out: bool (false if present but invalid)
static bool read_int(const json& obj, const char* key, int& out, int min_value, const char* label) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_number_integer()) {
        std::cerr << "[ConfigManager] '" << label << "' must be integer\n";
        return false;
    }
    const long long v = obj[key].get<long long>();
    if (v < min_value || v > 1000000000LL) {
        std::cerr << "[ConfigManager] '" << label << "' out of range: " << v << "\n";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}


bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }

    json j;
    try { file >> j; }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }
    if (!j.is_object()) { std::cerr << "[ConfigManager] top level must be an object\n"; return false; }

    // cache
    if (j.contains("cache")) {
        if (!j["cache"].is_object()) { std::cerr << "[ConfigManager] 'cache' must be an object\n"; return false; }
        const auto& c = j["cache"];

        if (c.contains("max_count")) {
            if (!c["max_count"].is_number_integer() || c["max_count"].get<long long>() < 1) {
                std::cerr << "[ConfigManager] 'cache.max_count' must be integer >= 1\n";
                return false;
            }
            max_count_ = c["max_count"].get<std::uint64_t>();
            has_max_count_ = true;
        }
        if (c.contains("max_size")) {
            if (!c["max_size"].is_string()) { std::cerr << "[ConfigManager] 'cache.max_size' must be like '2048MB'\n"; return false; }
            try { max_size_bytes_ = parse_size(c["max_size"].get<std::string>()); }
            catch (const std::exception& e) { std::cerr << "[ConfigManager] 'cache.max_size': " << e.what() << "\n"; return false; }
            if (max_size_bytes_ == 0) { std::cerr << "[ConfigManager] 'cache.max_size' must be > 0\n"; return false; }
            has_max_size_ = true;
        }
        if (c.contains("min_size")) {
            if (!c["min_size"].is_string()) { std::cerr << "[ConfigManager] 'cache.min_size' must be like '256MB'\n"; return false; }
            try { min_size_bytes_ = parse_size(c["min_size"].get<std::string>()); }
            catch (const std::exception& e) { std::cerr << "[ConfigManager] 'cache.min_size': " << e.what() << "\n"; return false; }
        }
        if (c.contains("strip_alpha")) {
            if (!c["strip_alpha"].is_boolean()) { std::cerr << "[ConfigManager] 'cache.strip_alpha' must be true/false\n"; return false; }
            strip_alpha_ = c["strip_alpha"].get<bool>();
        }
    }

    // prefetch
    if (j.contains("prefetch")) {
        if (!j["prefetch"].is_object()) { std::cerr << "[ConfigManager] 'prefetch' must be an object\n"; return false; }
        const auto& p = j["prefetch"];
        if (!read_int(p, "forward",          prefetch_.forward,          0, "prefetch.forward"))          return false;
        if (!read_int(p, "backward",         prefetch_.backward,         0, "prefetch.backward"))         return false;
        if (!read_int(p, "visible_center",   prefetch_.visible_center,   1, "prefetch.visible_center"))   return false;
        if (!read_int(p, "poll_interval_ms", prefetch_.poll_interval_ms, 1, "prefetch.poll_interval_ms")) return false;
        if (!read_int(p, "idle_ceiling_ms",  prefetch_.idle_ceiling_ms,  0, "prefetch.idle_ceiling_ms"))  return false;
        if (!read_int(p, "throttle_ms",      prefetch_.throttle_ms,      0, "prefetch.throttle_ms"))      return false;
    }

    // decode
    if (j.contains("decode")) {
        if (!j["decode"].is_object()) { std::cerr << "[ConfigManager] 'decode' must be an object\n"; return false; }
        const auto& d = j["decode"];
        if (!read_int(d, "concurrency", decode_concurrency_, 1, "decode.concurrency")) return false;
        if (d.contains("alternate_extensions")) {
            if (!d["alternate_extensions"].is_array()) {
                std::cerr << "[ConfigManager] 'decode.alternate_extensions' must be an array of strings\n";
                return false;
            }
            alternate_extensions_.clear();
            for (const auto& e : d["alternate_extensions"]) {
                if (!e.is_string()) continue;
                std::string ext = toLower(e.get<std::string>());
                trim_inplace(ext);
                if (ext.empty()) continue;
                if (ext[0] != '.') ext = "." + ext;
                alternate_extensions_.push_back(ext);
            }
        }
    }

    // paths / workers
    if (j.contains("metadata_index")) {
        if (!j["metadata_index"].is_string() || j["metadata_index"].get<std::string>().empty()) {
            std::cerr << "[ConfigManager] 'metadata_index' must be a non-empty path\n";
            return false;
        }
        metadata_index_path_ = j["metadata_index"].get<std::string>();
    }
    if (j.contains("log_path")) {
        if (!j["log_path"].is_string() || j["log_path"].get<std::string>().empty()) {
            std::cerr << "[ConfigManager] 'log_path' must be a non-empty path\n";
            return false;
        }
        log_path_ = j["log_path"].get<std::string>();
    }
    if (j.contains("workers")) {
        if (!j["workers"].is_number_integer() || j["workers"].get<long long>() < 1) {
            std::cerr << "[ConfigManager] 'workers' must be integer >= 1\n";
            return false;
        }
        workers_ = j["workers"].get<std::uint64_t>();
    }

    return true;
}


// Desc: effective cache ceilings
// In: std::uint64_t memory_limit_mb
// Out: CacheLimits
CacheLimits ConfigManager::cacheLimits(std::uint64_t memory_limit_mb) const {
    CacheLimits lim = MemoryBudget::default_cache_limits(memory_limit_mb);
    lim.min_size = min_size_bytes_;
    if (has_max_count_) lim.max_count = static_cast<size_t>(max_count_);
    if (has_max_size_)  lim.max_size  = max_size_bytes_;
    if (lim.max_size < lim.min_size) lim.max_size = lim.min_size;
    return lim;
}
