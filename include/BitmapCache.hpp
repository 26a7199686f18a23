#pragma once
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "AsyncTaskQueue.hpp"
#include "Bitmap.hpp"
#include "Cancellation.hpp"
#include "CacheStore.hpp"
#include "CapacityManager.hpp"
#include "DecodePipeline.hpp"
#include "Dispatcher.hpp"
#include "ImageFile.hpp"
#include "MetadataProvider.hpp"
#include "SizeEstimator.hpp"

// Decoded-bitmap cache service: store, admission control, decode and
// background cleanup behind one object. Construct once and inject.
// Concurrent misses on one key share a single decode.
class BitmapCache {
public:
    BitmapCache(DecodePipeline& pipeline,
                MetadataProvider& metadata,
                Dispatcher& disposer,
                const CacheLimits& limits,
                int log_fd = -1,
                size_t workers = 2,
                bool background_priority = true);
    ~BitmapCache();
    BitmapCache(const BitmapCache&) = delete;
    BitmapCache& operator=(const BitmapCache&) = delete;

    // Hit or decode-and-insert. nullptr when the file cannot be decoded.
    BitmapPtr get_bitmap(const ImageFile& file);

    // Background loads: the worker's reference goes to the dispatcher, so an
    // entry evicted meanwhile is still released on the owning thread.
    // false when the file cannot be decoded.
    bool warm(const ImageFile& file);
    // Same, for a caller that already holds a reservation for this file.
    bool warm_reserved(const ImageFile& file, CapacityManager::Reservation& reservation);

    // Fire-and-forget warm on a background worker.
    void preload(ImageFilePtr file);
    // Warms files in order on the calling thread; skips cached ones, stops on cancel.
    // Returns how many were decoded.
    size_t preload_sequentially(const std::vector<ImageFilePtr>& files, const CancellationToken& token);

    ReservationPtr reserve_for_preload(const ImageFile& file);

    bool is_in_cache(const std::string& path) const;
    int64_t last_access(const std::string& path) const;

    void set_max_count(size_t n) { capacity_.set_max_count(n); }
    void set_max_size(uint64_t bytes) { capacity_.set_max_size(bytes); }
    size_t   max_count() const { return capacity_.max_count(); }
    uint64_t max_size()  const { return capacity_.max_size(); }

    int  subscribe(CacheStatusListener listener) { return store_.add_listener(std::move(listener)); }
    void unsubscribe(int id) { store_.remove_listener(id); }

    void clear();
    bool remove(const std::string& path);
    CacheStats stats() const { return store_.stats(); }
    // "Cache: n/max items, a/b MB"
    std::string stats_info() const;

    std::pair<uint64_t, uint64_t> trim_on_memory_warning(double ratio = 0.5);

    uint64_t estimate(const ImageFile& file) const { return estimator_.estimate(file); }
    int64_t reserved_bytes() const { return capacity_.reserved_bytes(); }

    // Waits for queued preloads and cleanup passes.
    void wait_idle() { background_.wait_idle(); }

private:
    BitmapPtr load(const ImageFile& file, bool admit);
    BitmapPtr load_once(const ImageFile& file, const std::string& key, bool admit);
    bool hand_off(BitmapPtr bitmap);

    int log_fd_{-1};
    Dispatcher& disposer_;
    DecodePipeline& pipeline_;
    CacheStore store_;
    SizeEstimator estimator_;
    AsyncTaskQueue background_;
    CapacityManager capacity_;

    std::mutex inflight_mu_;
    // completion only; joiners read the bitmap back from the store
    std::unordered_map<std::string, std::shared_future<void>> inflight_;
};
