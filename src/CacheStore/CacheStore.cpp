#include "CacheStore.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>


// Desc: monotonic access stamp; never returns the same value twice
// In: (none)
// Out: int64_t (nanoseconds on the steady clock, bumped past the previous stamp)
int64_t next_access_stamp() {
    static std::atomic<int64_t> last{0};
    const int64_t now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    int64_t prev = last.load();
    int64_t next;
    do {
        next = std::max(now, prev + 1);
    } while (!last.compare_exchange_weak(prev, next));
    return next;
}


CacheStore::CacheStore(Dispatcher& disposer, int log_fd)
    : disposer_(disposer), log_fd_(log_fd) {}

CacheStore::~CacheStore() {
    std::unique_lock wlk(mu_);
    for (auto& kv : map_) dispose(std::move(kv.second.bitmap));
    map_.clear();
}


BitmapPtr CacheStore::lookup(const std::string& key) {
    std::shared_lock rlk(mu_);
    auto it = map_.find(key);
    if (it == map_.end()) return nullptr;
    it->second.last_access.store(next_access_stamp());
    return it->second.bitmap;
}

bool CacheStore::contains(const std::string& key) const {
    std::shared_lock rlk(mu_);
    return map_.find(key) != map_.end();
}


// Desc: insert or replace an entry, then notify listeners
// In: const std::string& key, BitmapPtr bitmap
// Out: void
void CacheStore::insert(const std::string& key, BitmapPtr bitmap) {
    if (!bitmap) return;
    BitmapPtr replaced;
    {
        std::unique_lock wlk(mu_);
        Entry& e = map_[key];
        if (e.bitmap) {
            size_bytes_ -= e.size;
            replaced = std::move(e.bitmap);
        }
        e.size = bitmap->byte_size();
        e.bitmap = std::move(bitmap);
        e.last_access.store(next_access_stamp());
        size_bytes_ += e.size;
    }
    if (replaced) dispose(std::move(replaced));
    notify(key, true);
}


// Desc: remove one entry, release its bitmap on the dispatcher, notify
// In: const std::string& key, uint64_t* freed
// Out: bool (false if the key was not cached)
bool CacheStore::remove(const std::string& key, uint64_t* freed) {
    BitmapPtr victim;
    uint64_t sz = 0;
    {
        std::unique_lock wlk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        sz = it->second.size;
        victim = std::move(it->second.bitmap);
        map_.erase(it);
        size_bytes_ -= sz;
    }
    if (freed) *freed = sz;
    dispose(std::move(victim));
    notify(key, false);
    return true;
}


// Desc: drop every entry; one notification per key
// In: (none)
// Out: size_t (entries removed)
size_t CacheStore::clear() {
    std::vector<std::string> keys;
    std::vector<BitmapPtr> victims;
    {
        std::unique_lock wlk(mu_);
        keys.reserve(map_.size());
        victims.reserve(map_.size());
        for (auto& kv : map_) {
            keys.push_back(kv.first);
            victims.push_back(std::move(kv.second.bitmap));
        }
        map_.clear();
        size_bytes_.store(0);
    }
    for (auto& b : victims) dispose(std::move(b));
    for (const auto& k : keys) notify(k, false);
    return keys.size();
}

CacheStats CacheStore::stats() const {
    std::shared_lock rlk(mu_);
    return CacheStats{ map_.size(), size_bytes_.load() };
}

size_t CacheStore::count() const {
    std::shared_lock rlk(mu_);
    return map_.size();
}

std::vector<CacheStore::LruRow> CacheStore::lru_snapshot() const {
    std::vector<LruRow> rows;
    {
        std::shared_lock rlk(mu_);
        rows.reserve(map_.size());
        for (const auto& kv : map_) {
            rows.push_back(LruRow{ kv.first, kv.second.last_access.load(), kv.second.size });
        }
    }
    std::sort(rows.begin(), rows.end(), [](const LruRow& a, const LruRow& b){
        return a.last_access < b.last_access;
    });
    return rows;
}

int64_t CacheStore::last_access(const std::string& key) const {
    std::shared_lock rlk(mu_);
    auto it = map_.find(key);
    return it == map_.end() ? -1 : it->second.last_access.load();
}

int CacheStore::add_listener(CacheStatusListener listener) {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    const int id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void CacheStore::remove_listener(int id) {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const std::pair<int, CacheStatusListener>& l){ return l.first == id; }),
                     listeners_.end());
}


// Desc: deliver (key, cached) to the current listeners on the dispatcher
// In: const std::string& key, bool cached
// Out: void
void CacheStore::notify(const std::string& key, bool cached) {
    std::vector<CacheStatusListener> snapshot;
    {
        std::lock_guard<std::mutex> lk(listeners_mu_);
        snapshot.reserve(listeners_.size());
        for (const auto& l : listeners_) snapshot.push_back(l.second);
    }
    if (snapshot.empty()) return;

    // Never on the evicting thread: callers may hold the capacity lock,
    // and a listener is free to load again.
    const int fd = log_fd_;
    disposer_.post([snapshot = std::move(snapshot), key, cached, fd]() {
        for (const auto& cb : snapshot) {
            try {
                cb(key, cached);
            } catch (const std::exception& e) {
                log_line(fd, "CacheStore", std::string("status listener failed: ") + e.what());
            }
        }
    });
}


// Desc: hand the last store reference to the owning thread
// In: BitmapPtr bitmap
// Out: void
void CacheStore::dispose(BitmapPtr bitmap) {
    if (!bitmap) return;
    disposer_.post([b = std::move(bitmap)]() mutable { b.reset(); });
}
