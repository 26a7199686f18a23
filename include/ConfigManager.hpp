// include/ConfigManager.hpp
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include "CapacityManager.hpp"
#include "PrefetchCoordinator.hpp"

class ConfigManager {
public:
    explicit ConfigManager() = default;
    bool loadFromFile(const std::string& config_path);

    bool hasMaxCount() const { return has_max_count_; }
    bool hasMaxSize()  const { return has_max_size_; }
    std::uint64_t getMaxCount() const { return max_count_; }
    std::uint64_t getMaxSizeBytes() const { return max_size_bytes_; }
    std::uint64_t getMinSizeBytes() const { return min_size_bytes_; }
    bool getStripAlpha() const { return strip_alpha_; }

    const PrefetchSettings& getPrefetchSettings() const { return prefetch_; }

    int getDecodeConcurrency() const { return decode_concurrency_; }
    const std::vector<std::string>& getAlternateExtensions() const { return alternate_extensions_; }

    const std::string& getMetadataIndexPath() const { return metadata_index_path_; }
    const std::string& getLogPath() const { return log_path_; }
    std::uint64_t getWorkers() const { return workers_; }

    // Configured ceilings; missing ones come from the memory budget.
    CacheLimits cacheLimits(std::uint64_t memory_limit_mb) const;

    // Accepts "512KB", "64MB", "2GB" (unit letters case-insensitive, B optional).
    static std::uint64_t parse_size(const std::string& s);

private:
    bool has_max_count_ = false;
    bool has_max_size_ = false;
    std::uint64_t max_count_ = 0;
    std::uint64_t max_size_bytes_ = 0;
    std::uint64_t min_size_bytes_ = 256ULL * 1024ULL * 1024ULL;
    bool strip_alpha_ = false;

    PrefetchSettings prefetch_;

    int decode_concurrency_ = 4;
    std::vector<std::string> alternate_extensions_{ ".heif", ".heic", ".avif", ".hif" };

    std::string metadata_index_path_ = "cache/metadata.sqlite";
    std::string log_path_ = "logs/pixcache.log";
    std::uint64_t workers_ = 2;
};
