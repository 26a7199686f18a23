#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <sqlite3.h>
#include "MetadataProvider.hpp"

// Two-tier cache of header metadata in front of another provider:
// an in-memory map over a SQLite table keyed by (dev, ino) and validated by
// mtime/ctime/size. Rows go stale whenever the file changes on disk.
class MetadataIndex : public MetadataProvider {
public:
    struct Key {
        int64_t dev{0}, ino{0};
        bool operator==(const Key& o) const noexcept { return dev==o.dev && ino==o.ino; }
    };
    struct KeyHash {
        size_t operator()(const Key& k) const noexcept {
            uint64_t x = static_cast<uint64_t>(k.dev);
            uint64_t y = static_cast<uint64_t>(k.ino);
            x ^= y + 0x9e3779b97f4a7c15ULL + (x<<6) + (x>>2);
            return static_cast<size_t>(x);
        }
    };
    struct Record {
        int64_t mtime_ns{0};
        int64_t ctime_ns{0};
        int64_t size{0};
        int     orientation{1};
        int     width{0};
        int     height{0};
        int64_t last_access_ts{0};
    };

public:
    // db may be null: the index then only keeps the in-memory tier.
    MetadataIndex(MetadataProvider& source, sqlite3* db, int log_fd = -1,
                  size_t max_rows = 50000);

    int get_orientation(const ImageFile& file) override;
    std::optional<ImageDimensions> get_dimensions(const ImageFile& file) override;

    size_t memory_rows() const;
    uint64_t source_reads() const { return source_reads_.load(); }

    static bool ensure_schema(sqlite3* db, std::string& error);

private:
    Record resolve(const ImageFile& file);
    Record read_source(const ImageFile& file);
    bool db_get(const Key& k, const Record& cur, Record& out);
    void db_put(const Key& k, const Record& rec);
    void evict_lru(int max_rows_to_evict);
    int64_t db_row_count();

    MetadataProvider& source_;
    sqlite3* db_{nullptr};
    int log_fd_{-1};
    size_t max_rows_{50000};

    mutable std::shared_mutex mu_;
    std::unordered_map<Key, Record, KeyHash> map_;
    std::mutex db_mu_;
    std::atomic<uint64_t> source_reads_{0};
};
