#include "CapacityManager.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

static inline uint64_t to_mb(uint64_t bytes) { return bytes / (1024ULL * 1024ULL); }


void CapacityManager::Reservation::release() {
    if (released_.exchange(true)) return;
    owner_->unreserve(bytes_);
}


CapacityManager::CapacityManager(CacheStore& store,
                                 const SizeEstimator& estimator,
                                 AsyncTaskQueue& background,
                                 const CacheLimits& limits,
                                 int log_fd)
    : store_(store),
      estimator_(estimator),
      background_(background),
      log_fd_(log_fd),
      max_count_(std::max<size_t>(1, limits.max_count)),
      max_size_(std::max(limits.min_size, limits.max_size)),
      min_size_(limits.min_size) {}


void CapacityManager::unreserve(uint64_t bytes) {
    reserved_.fetch_sub(static_cast<int64_t>(bytes));
}


// Desc: evict oldest entries until the incoming bytes fit (lock held)
// In: uint64_t need
// Out: void; throws std::logic_error on a negative reservation total
void CapacityManager::ensure_capacity_locked(uint64_t need) {
    if (reserved_.load() < 0) {
        throw std::logic_error("reserved bytes went negative: " + std::to_string(reserved_.load()));
    }

    const uint64_t max = max_size_.load();
    // A request that alone takes most of the cache is held to the stricter bar.
    const uint64_t limit = is_too_large(need, max) ? safe_limit(max) : max;

    auto over = [&]() {
        const int64_t reserved = std::max<int64_t>(0, reserved_.load());
        return store_.current_size() + static_cast<uint64_t>(reserved) + need > limit;
    };
    if (!over()) return;

    const std::vector<CacheStore::LruRow> rows = store_.lru_snapshot();
    size_t evicted = 0;
    uint64_t freed_total = 0;
    for (const auto& row : rows) {
        if (!over()) break;
        uint64_t freed = 0;
        if (store_.remove(row.key, &freed)) {
            ++evicted;
            freed_total += freed;
        }
    }

    #ifdef DEBUG
    if (evicted > 0) {
        log_line(log_fd_, "Capacity", "admission evicted " + std::to_string(evicted) +
                 " entries (" + std::to_string(to_mb(freed_total)) + " MB) for " +
                 std::to_string(to_mb(need)) + " MB");
    }
    #else
    (void)evicted;
    (void)freed_total;
    #endif
}

void CapacityManager::ensure_capacity(uint64_t need) {
    std::lock_guard<std::mutex> lk(capacity_mu_);
    ensure_capacity_locked(need);
}


// Desc: make room for a speculative decode and hold its bytes
// In: const ImageFile& file
// Out: ReservationPtr (nullptr when refused)
ReservationPtr CapacityManager::reserve_for_preload(const ImageFile& file) {
    const uint64_t estimate = estimator_.estimate(file);
    const uint64_t max = max_size_.load();
    if (is_too_large(estimate, max)) {
        log_line(log_fd_, "Capacity", "skip prefetch of " + file.path() + ": estimate " +
                 std::to_string(to_mb(estimate)) + " MB exceeds 60% of " + std::to_string(to_mb(max)) + " MB");
        return nullptr;
    }

    std::lock_guard<std::mutex> lk(capacity_mu_);
    ensure_capacity_locked(estimate);
    reserved_.fetch_add(static_cast<int64_t>(estimate));
    return std::make_unique<Reservation>(*this, estimate);
}


// Desc: count pass then size pass over one LRU ordering
// In: (none)
// Out: void
void CapacityManager::cleanup() {
    std::lock_guard<std::mutex> lk(capacity_mu_);

    const std::vector<CacheStore::LruRow> rows = store_.lru_snapshot();
    const size_t max_count = max_count_.load();
    const uint64_t max_size = max_size_.load();
    const uint64_t target = safe_limit(max_size);
    size_t idx = 0;
    size_t by_count = 0, by_size = 0;

    // (a) count
    if (rows.size() > max_count) {
        const size_t excess = rows.size() - max_count;
        for (; idx < excess; ++idx) {
            if (store_.remove(rows[idx].key)) ++by_count;
        }
    }

    // (b) size, only once over max_size; trims to 80% and the most recent entry always stays
    if (store_.current_size() > max_size) {
        while (idx + 1 < rows.size() && store_.current_size() > target) {
            if (store_.remove(rows[idx].key)) ++by_size;
            ++idx;
        }
    }

    if (by_count + by_size > 0) {
        const CacheStats st = store_.stats();
        log_line(log_fd_, "Capacity", "cleanup removed " + std::to_string(by_count) + " by count, " +
                 std::to_string(by_size) + " by size; now " + std::to_string(st.count) + " items, " +
                 std::to_string(to_mb(st.size_bytes)) + " MB");
    }
}


void CapacityManager::schedule_cleanup() {
    if (!background_.post([this]() { cleanup(); })) {
        log_line(log_fd_, "Capacity", "cleanup not scheduled: background queue stopped");
    }
}


// Desc: shed entries after a memory-pressure signal
// In: double ratio
// Out: std::pair<uint64_t, uint64_t> (bytes before, bytes after)
std::pair<uint64_t, uint64_t> CapacityManager::trim_to_ratio(double ratio) {
    ratio = std::min(0.9, std::max(0.1, ratio));
    std::lock_guard<std::mutex> lk(capacity_mu_);

    const uint64_t before = store_.current_size();
    const uint64_t target = static_cast<uint64_t>(static_cast<double>(max_size_.load()) * ratio);
    if (before > target) {
        for (const auto& row : store_.lru_snapshot()) {
            if (store_.current_size() <= target) break;
            store_.remove(row.key);
        }
    }
    const uint64_t after = store_.current_size();
    log_line(log_fd_, "Capacity", "memory warning trim: " + std::to_string(to_mb(before)) + " MB -> " +
             std::to_string(to_mb(after)) + " MB");
    return { before, after };
}


void CapacityManager::set_max_count(size_t n) {
    max_count_.store(std::max<size_t>(1, n));
    schedule_cleanup();
}

void CapacityManager::set_max_size(uint64_t bytes) {
    max_size_.store(std::max(min_size_, bytes));
    schedule_cleanup();
}
