#include "PrefetchCoordinator.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

// How often a run waiting for the drain re-checks its token.
static const int kDrainPollMs = 20;


// Desc: candidate indices around the current image
// In: int current, int count, int forward, int backward
// Out: std::vector<int> (ascending distance, then ascending index)
std::vector<int> around_current_indices(int current, int count, int forward, int backward) {
    std::vector<int> out;
    if (current < 0 || current >= count) return out;
    forward = std::max(0, forward);
    backward = std::max(0, backward);

    for (int i = 1; i <= forward && current + i < count; ++i) out.push_back(current + i);
    for (int i = 1; i <= backward && current - i >= 0; ++i) out.push_back(current - i);

    std::stable_sort(out.begin(), out.end(), [current](int a, int b) {
        const int da = std::abs(a - current), db = std::abs(b - current);
        if (da != db) return da < db;
        return a < b;
    });
    return out;
}


// Desc: indices of a settled visible range, centre first
// In: int first, int last, int count, int need
// Out: std::vector<int> (at most max(1, need) entries)
std::vector<int> visible_center_indices(int first, int last, int count, int need) {
    std::vector<int> out;
    if (count <= 0) return out;
    first = std::max(0, std::min(first, count - 1));
    last  = std::max(0, std::min(last,  count - 1));
    if (last < first) return out;

    const int center = (first + last) / 2;
    for (int i = first; i <= last; ++i) out.push_back(i);
    std::sort(out.begin(), out.end(), [center](int a, int b) {
        const int da = std::abs(a - center), db = std::abs(b - center);
        if (da != db) return da < db;
        return a < b;
    });
    const size_t take = static_cast<size_t>(std::max(1, need));
    if (out.size() > take) out.resize(take);
    return out;
}


PrefetchCoordinator::PrefetchCoordinator(BitmapCache& cache,
                                         PrefetchHost& host,
                                         const PrefetchSettings& settings,
                                         int log_fd,
                                         bool background_priority)
    : cache_(cache),
      host_(host),
      log_fd_(log_fd),
      settings_(settings),
      runner_(2, log_fd, background_priority) {}

PrefetchCoordinator::~PrefetchCoordinator() {
    cancel_all();
    runner_.shutdown();
}

void PrefetchCoordinator::set_settings(const PrefetchSettings& s) {
    std::lock_guard<std::mutex> lk(mu_);
    settings_ = s;
}

PrefetchSettings PrefetchCoordinator::settings() const {
    std::lock_guard<std::mutex> lk(mu_);
    return settings_;
}

void PrefetchCoordinator::cancel_all() {
    std::lock_guard<std::mutex> lk(mu_);
    around_src_.cancel();
    visible_src_.cancel();
}


void PrefetchCoordinator::notify_current_changed() {
    const std::vector<ImageFilePtr> files = host_.files();
    const int idx = host_.current_index();
    const PrefetchSettings s = settings();

    std::vector<ImageFilePtr> queue;
    for (int i : around_current_indices(idx, static_cast<int>(files.size()), s.forward, s.backward)) {
        queue.push_back(files[static_cast<size_t>(i)]);
    }
    start(Intent::AroundCurrent, std::move(queue));
}

void PrefetchCoordinator::notify_visible_range_settled(int first, int last) {
    const std::vector<ImageFilePtr> files = host_.files();
    const PrefetchSettings s = settings();

    std::vector<ImageFilePtr> queue;
    for (int i : visible_center_indices(first, last, static_cast<int>(files.size()), s.visible_center)) {
        queue.push_back(files[static_cast<size_t>(i)]);
    }
    start(Intent::VisibleCenter, std::move(queue));
}


// Desc: cancel the intent's previous run and queue a new one
// In: Intent intent, std::vector<ImageFilePtr> queue
// Out: void
void PrefetchCoordinator::start(Intent intent, std::vector<ImageFilePtr> queue) {
    CancellationToken token;
    const char* name = intent == Intent::AroundCurrent ? "around-current" : "visible-center";
    {
        std::lock_guard<std::mutex> lk(mu_);
        CancellationSource& src = intent == Intent::AroundCurrent ? around_src_ : visible_src_;
        src.cancel();
        src = CancellationSource();
        token = src.token();
    }
    if (queue.empty()) return;

    if (!runner_.post([this, q = std::move(queue), token, name]() { run_queue(q, token, name); })) {
        log_line(log_fd_, "Prefetch", std::string(name) + " run dropped: coordinator stopping");
    }
}


// Desc: take the shared drain, waiting for another intent's run if needed
// In: const CancellationToken& token
// Out: bool (false if cancelled while waiting)
bool PrefetchCoordinator::acquire_drain(const CancellationToken& token) {
    std::unique_lock<std::mutex> lk(drain_mu_);
    while (busy_) {
        if (token.is_cancelled()) return false;
        drain_cv_.wait_for(lk, std::chrono::milliseconds(kDrainPollMs));
    }
    if (token.is_cancelled()) return false;
    busy_ = true;
    return true;
}

void PrefetchCoordinator::release_drain() {
    {
        std::lock_guard<std::mutex> lk(drain_mu_);
        busy_ = false;
    }
    drain_cv_.notify_all();
}


// Desc: yield to foreground and thumbnail loading, bounded by the idle ceiling
// In: const CancellationToken& token, const PrefetchSettings& s
// Out: bool (false if cancelled)
bool PrefetchCoordinator::wait_for_high_priority_idle(const CancellationToken& token, const PrefetchSettings& s) {
    int waited = 0;
    while (!token.is_cancelled()) {
        if (!host_.is_foreground_loading() && !host_.is_thumbnail_loading_busy()) return true;
        if (!token.sleep_for(s.poll_interval_ms)) return false;
        waited += s.poll_interval_ms;
        if (waited > s.idle_ceiling_ms) return true;
    }
    return false;
}


// Desc: drain one intent's queue in order; per-item failures are logged and skipped
// In: const std::vector<ImageFilePtr>& queue, const CancellationToken& token, const char* name
// Out: void
void PrefetchCoordinator::run_queue(const std::vector<ImageFilePtr>& queue,
                                    const CancellationToken& token,
                                    const char* name) {
    if (!acquire_drain(token)) return;
    const PrefetchSettings s = settings();
    size_t loaded = 0;

    for (const auto& file : queue) {
        if (token.is_cancelled()) break;
        if (!wait_for_high_priority_idle(token, s)) break;
        if (!file || cache_.is_in_cache(file->path())) continue;

        try {
            ReservationPtr reservation = cache_.reserve_for_preload(*file);
            if (!reservation) continue;
            if (token.is_cancelled()) break;
            ++processed_;
            if (cache_.warm_reserved(*file, *reservation)) ++loaded;
        } catch (const std::exception& e) {
            log_line(log_fd_, "Prefetch", "item failed " + file->path() + ": " + e.what());
        }

        if (!token.sleep_for(s.throttle_ms)) break;
    }

    release_drain();
    #ifdef DEBUG
    log_line(log_fd_, "Prefetch", std::string(name) + " run done, " + std::to_string(loaded) + " loaded" +
             (token.is_cancelled() ? " (cancelled)" : ""));
    #else
    (void)name;
    (void)loaded;
    #endif
}
