#include "BitmapCache.hpp"
#include "Logger.hpp"
#include <stdexcept>


BitmapCache::BitmapCache(DecodePipeline& pipeline,
                         MetadataProvider& metadata,
                         Dispatcher& disposer,
                         const CacheLimits& limits,
                         int log_fd,
                         size_t workers,
                         bool background_priority)
    : log_fd_(log_fd),
      disposer_(disposer),
      pipeline_(pipeline),
      store_(disposer, log_fd),
      estimator_(metadata, store_, pipeline),
      background_(workers, log_fd, background_priority),
      capacity_(store_, estimator_, background_, limits, log_fd) {}

BitmapCache::~BitmapCache() {
    // queued cleanups and preloads reference the members below
    background_.shutdown();
}


// Desc: admission, decode, insert; errors end here
// In: const ImageFile& file, const std::string& key, bool admit
// Out: BitmapPtr (nullptr on failure)
BitmapPtr BitmapCache::load_once(const ImageFile& file, const std::string& key, bool admit) {
    try {
        if (admit) capacity_.ensure_capacity(estimator_.estimate(file));
        BitmapPtr bmp = pipeline_.decode(file);
        if (!bmp) return nullptr;
        store_.insert(key, bmp);
        capacity_.schedule_cleanup();
        return bmp;
    } catch (const std::exception& e) {
        log_line(log_fd_, "BitmapCache", "load failed " + file.path() + ": " + e.what());
        return nullptr;
    }
}


// Desc: hit path, or a single shared decode per key
// In: const ImageFile& file, bool admit
// Out: BitmapPtr
BitmapPtr BitmapCache::load(const ImageFile& file, bool admit) {
    const std::string key = cache_key(file.path());
    if (BitmapPtr hit = store_.lookup(key)) return hit;

    std::promise<void> promise;
    std::shared_future<void> pending;
    {
        std::lock_guard<std::mutex> lk(inflight_mu_);
        // the previous owner inserts before leaving the in-flight map
        if (BitmapPtr hit = store_.lookup(key)) return hit;
        auto it = inflight_.find(key);
        if (it != inflight_.end()) {
            pending = it->second;
        } else {
            inflight_.emplace(key, promise.get_future().share());
        }
    }
    if (pending.valid()) {
        #ifdef DEBUG
        log_line(log_fd_, "BitmapCache", "joining in-flight decode of " + key);
        #endif
        pending.wait();
        return store_.lookup(key);
    }

    BitmapPtr result = load_once(file, key, admit);
    {
        std::lock_guard<std::mutex> lk(inflight_mu_);
        inflight_.erase(key);
    }
    promise.set_value();
    return result;
}

BitmapPtr BitmapCache::get_bitmap(const ImageFile& file) {
    return load(file, true);
}

// Desc: post the caller's last reference to the dispatcher
// In: BitmapPtr bitmap
// Out: bool (false for nullptr)
bool BitmapCache::hand_off(BitmapPtr bitmap) {
    if (!bitmap) return false;
    disposer_.post([b = std::move(bitmap)]() mutable { b.reset(); });
    return true;
}

bool BitmapCache::warm(const ImageFile& file) {
    return hand_off(load(file, true));
}

bool BitmapCache::warm_reserved(const ImageFile& file, CapacityManager::Reservation& reservation) {
    BitmapPtr bmp = load(file, false);
    reservation.release();
    return hand_off(std::move(bmp));
}


void BitmapCache::preload(ImageFilePtr file) {
    if (!file) return;
    background_.post([this, file]() {
        if (!is_in_cache(file->path())) warm(*file);
    });
}


// Desc: ordered warm-up of a list of files
// In: const std::vector<ImageFilePtr>& files, const CancellationToken& token
// Out: size_t (files decoded)
size_t BitmapCache::preload_sequentially(const std::vector<ImageFilePtr>& files, const CancellationToken& token) {
    size_t loaded = 0;
    for (const auto& f : files) {
        if (token.is_cancelled()) break;
        if (!f || is_in_cache(f->path())) continue;
        if (warm(*f)) ++loaded;
    }
    return loaded;
}


ReservationPtr BitmapCache::reserve_for_preload(const ImageFile& file) {
    try {
        return capacity_.reserve_for_preload(file);
    } catch (const std::logic_error& e) {
        log_line(log_fd_, "BitmapCache", std::string("reservation refused: ") + e.what());
        return nullptr;
    }
}

bool BitmapCache::is_in_cache(const std::string& path) const {
    return store_.contains(cache_key(path));
}

int64_t BitmapCache::last_access(const std::string& path) const {
    return store_.last_access(cache_key(path));
}

void BitmapCache::clear() {
    const size_t n = store_.clear();
    log_line(log_fd_, "BitmapCache", "cleared " + std::to_string(n) + " entries");
}

bool BitmapCache::remove(const std::string& path) {
    return store_.remove(cache_key(path));
}

std::string BitmapCache::stats_info() const {
    const CacheStats st = store_.stats();
    const uint64_t mb = 1024ULL * 1024ULL;
    return "Cache: " + std::to_string(st.count) + "/" + std::to_string(max_count()) + " items, " +
           std::to_string(st.size_bytes / mb) + "/" + std::to_string(max_size() / mb) + " MB";
}

std::pair<uint64_t, uint64_t> BitmapCache::trim_on_memory_warning(double ratio) {
    return capacity_.trim_to_ratio(ratio);
}
