#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "Bitmap.hpp"
#include "Dispatcher.hpp"

struct CacheStats {
    size_t   count{0};
    uint64_t size_bytes{0};
};

// (key, now_cached): true on insert, false on every removal.
// Delivered on the store's dispatcher, in event order.
using CacheStatusListener = std::function<void(const std::string& key, bool cached)>;

// Strictly increasing access stamp (steady clock ns, bumped on ties).
int64_t next_access_stamp();

// Key -> decoded bitmap table with last-access bookkeeping.
// Single operations are safe from any thread; batch eviction is serialised
// by the CapacityManager that drives remove().
class CacheStore {
public:
    struct LruRow {
        std::string key;
        int64_t     last_access{0};
        uint64_t    size{0};
    };

    explicit CacheStore(Dispatcher& disposer, int log_fd = -1);
    ~CacheStore();
    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    // Hit: refreshes the access stamp. Miss: nullptr.
    BitmapPtr lookup(const std::string& key);
    bool contains(const std::string& key) const;

    // Replaces any previous entry for key; size comes from the bitmap itself.
    void insert(const std::string& key, BitmapPtr bitmap);

    // Removes one entry; freed receives its size. false if absent.
    bool remove(const std::string& key, uint64_t* freed = nullptr);
    size_t clear();

    CacheStats stats() const;
    uint64_t current_size() const { return size_bytes_.load(); }
    size_t count() const;

    // Oldest first.
    std::vector<LruRow> lru_snapshot() const;
    // -1 when key is not cached.
    int64_t last_access(const std::string& key) const;

    int  add_listener(CacheStatusListener listener);
    void remove_listener(int id);

private:
    struct Entry {
        BitmapPtr bitmap;
        uint64_t  size{0};
        mutable std::atomic<int64_t> last_access{0};
    };

    void notify(const std::string& key, bool cached);
    void dispose(BitmapPtr bitmap);

    Dispatcher& disposer_;
    int log_fd_{-1};

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, Entry> map_;
    std::atomic<uint64_t> size_bytes_{0};

    std::mutex listeners_mu_;
    std::vector<std::pair<int, CacheStatusListener>> listeners_;
    int next_listener_id_{1};
};
