#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include "AsyncTaskQueue.hpp"
#include "CacheStore.hpp"
#include "ImageFile.hpp"
#include "SizeEstimator.hpp"

struct CacheLimits {
    size_t   max_count{30};
    uint64_t max_size{2048ULL * 1024ULL * 1024ULL};
    uint64_t min_size{256ULL * 1024ULL * 1024ULL};   // floor for set_max_size
};

// Admission control and eviction for the CacheStore.
// Every capacity decision runs inside one critical section.
class CapacityManager {
public:
    // Bytes promised to an in-flight decode. Released exactly once:
    // explicitly or on destruction, whichever comes first.
    // Must not outlive the manager that issued it.
    class Reservation {
    public:
        Reservation(CapacityManager& owner, uint64_t bytes) : owner_(&owner), bytes_(bytes) {}
        ~Reservation() { release(); }
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;

        void release();
        uint64_t bytes() const { return bytes_; }
        bool released() const { return released_.load(); }

    private:
        CapacityManager* owner_;
        uint64_t bytes_;
        std::atomic<bool> released_{false};
    };
    using ReservationPtr = std::unique_ptr<Reservation>;

    CapacityManager(CacheStore& store,
                    const SizeEstimator& estimator,
                    AsyncTaskQueue& background,
                    const CacheLimits& limits,
                    int log_fd = -1);

    // Evicts LRU entries until size + reserved + need fits the applicable limit.
    // Throws std::logic_error if the reservation counter is corrupt.
    void ensure_capacity(uint64_t need);

    // nullptr when the estimate is above 60% of max size (nothing is mutated then).
    ReservationPtr reserve_for_preload(const ImageFile& file);

    // Count pass to max_count; once size exceeds max_size, size pass down to 80% of it.
    void cleanup();
    void schedule_cleanup();

    // Evicts down to ratio * max_size, ratio clamped to [0.1, 0.9].
    // Returns (bytes before, bytes after).
    std::pair<uint64_t, uint64_t> trim_to_ratio(double ratio);

    void set_max_count(size_t n);
    void set_max_size(uint64_t bytes);
    size_t   max_count() const { return max_count_.load(); }
    uint64_t max_size()  const { return max_size_.load(); }
    uint64_t min_size()  const { return min_size_; }

    int64_t reserved_bytes() const { return reserved_.load(); }

    static uint64_t safe_limit(uint64_t max_size) { return max_size / 5 * 4; }
    static bool is_too_large(uint64_t need, uint64_t max_size) {
        return static_cast<double>(need) > static_cast<double>(max_size) * 0.6;
    }

private:
    void ensure_capacity_locked(uint64_t need);
    void unreserve(uint64_t bytes);

    CacheStore& store_;
    const SizeEstimator& estimator_;
    AsyncTaskQueue& background_;
    int log_fd_{-1};

    std::mutex capacity_mu_;
    std::atomic<size_t> max_count_;
    std::atomic<uint64_t> max_size_;
    uint64_t min_size_;
    std::atomic<int64_t> reserved_{0};
};

using ReservationPtr = CapacityManager::ReservationPtr;
