#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>
#include "AsyncTaskQueue.hpp"
#include "BitmapCache.hpp"
#include "Cancellation.hpp"
#include "ImageFile.hpp"

// What the prefetcher needs to know about the viewer. Called from worker threads.
class PrefetchHost {
public:
    virtual ~PrefetchHost() = default;
    virtual std::vector<ImageFilePtr> files() const = 0;
    virtual int  current_index() const = 0;          // -1 when nothing is shown
    virtual bool is_foreground_loading() const = 0;  // current image not ready yet
    virtual bool is_thumbnail_loading_busy() const = 0;
};

struct PrefetchSettings {
    int forward{10};
    int backward{3};
    int visible_center{5};
    int poll_interval_ms{120};
    int idle_ceiling_ms{5000};
    int throttle_ms{40};
};

// Indices after/before current (current excluded), nearest first, ties by index.
std::vector<int> around_current_indices(int current, int count, int forward, int backward);

// Up to need indices of [first, last] (clamped to the list), nearest to the midpoint first.
std::vector<int> visible_center_indices(int first, int last, int count, int need);

// Background warm-up ahead of navigation. Two intents (around-current and
// visible-center), each with its own cancellation source; only one queue
// drains at a time and every item yields to foreground loading first.
class PrefetchCoordinator {
public:
    PrefetchCoordinator(BitmapCache& cache,
                        PrefetchHost& host,
                        const PrefetchSettings& settings,
                        int log_fd = -1,
                        bool background_priority = true);
    ~PrefetchCoordinator();
    PrefetchCoordinator(const PrefetchCoordinator&) = delete;
    PrefetchCoordinator& operator=(const PrefetchCoordinator&) = delete;

    void notify_current_changed();
    void notify_visible_range_settled(int first, int last);

    void set_settings(const PrefetchSettings& s);
    PrefetchSettings settings() const;

    void cancel_all();
    // Blocks until every started run has finished or aborted.
    void wait_idle() { runner_.wait_idle(); }

    uint64_t items_processed() const { return processed_.load(); }

private:
    enum class Intent { AroundCurrent, VisibleCenter };

    void start(Intent intent, std::vector<ImageFilePtr> queue);
    void run_queue(const std::vector<ImageFilePtr>& queue, const CancellationToken& token, const char* name);
    bool acquire_drain(const CancellationToken& token);
    void release_drain();
    bool wait_for_high_priority_idle(const CancellationToken& token, const PrefetchSettings& s);

    BitmapCache& cache_;
    PrefetchHost& host_;
    int log_fd_{-1};

    mutable std::mutex mu_;
    PrefetchSettings settings_;
    CancellationSource around_src_;
    CancellationSource visible_src_;

    std::mutex drain_mu_;
    std::condition_variable drain_cv_;
    bool busy_{false};

    std::atomic<uint64_t> processed_{0};
    AsyncTaskQueue runner_;
};
