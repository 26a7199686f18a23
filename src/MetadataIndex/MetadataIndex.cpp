#include "MetadataIndex.hpp"
#include "Logger.hpp"
#include <ctime>
#include <vector>
#include <sys/stat.h>


static const char* kMetadataSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS image_metadata (
  dev             INTEGER NOT NULL,
  ino             INTEGER NOT NULL,
  mtime_ns        INTEGER NOT NULL,
  ctime_ns        INTEGER NOT NULL,
  size            INTEGER NOT NULL,
  orientation     INTEGER NOT NULL,
  width           INTEGER NOT NULL,
  height          INTEGER NOT NULL,
  last_access_ts  INTEGER NOT NULL,
  PRIMARY KEY (dev, ino)
);

CREATE INDEX IF NOT EXISTS idx_metadata_last_access ON image_metadata(last_access_ts);
)SQL";

static inline int64_t to_ns(time_t s, long ns) {
    return static_cast<int64_t>(s) * 1000000000LL + static_cast<int64_t>(ns);
}


MetadataIndex::MetadataIndex(MetadataProvider& source, sqlite3* db, int log_fd, size_t max_rows)
    : source_(source), db_(db), log_fd_(log_fd), max_rows_(max_rows ? max_rows : 1) {}


// Desc: create the metadata table and its access index
// In: sqlite3* db, std::string& error
// Out: bool (true on success, error filled otherwise)
bool MetadataIndex::ensure_schema(sqlite3* db, std::string& error) {
    if (!db) { error = "null database handle"; return false; }
    char* err = nullptr;
    if (sqlite3_exec(db, kMetadataSchemaSQL, nullptr, nullptr, &err) != SQLITE_OK) {
        error = err ? err : "unknown";
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}


// Desc: query the wrapped provider for a fresh record
// In: const ImageFile& file
// Out: Record (orientation/dimensions filled; file identity left to caller)
MetadataIndex::Record MetadataIndex::read_source(const ImageFile& file) {
    ++source_reads_;
    Record rec{};
    rec.orientation = source_.get_orientation(file);
    if (rec.orientation < 1 || rec.orientation > 8) rec.orientation = 1;
    auto dims = source_.get_dimensions(file);
    if (dims && dims->width > 0 && dims->height > 0) {
        rec.width  = dims->width;
        rec.height = dims->height;
    }
    return rec;
}


// Desc: fetch a row if it still matches the file's stat identity
// In: const Key& k, const Record& cur, Record& out
// Out: bool (true=hit, false=miss or stale)
bool MetadataIndex::db_get(const Key& k, const Record& cur, Record& out) {
    if (!db_) return false;

    const char* sql =
        "SELECT mtime_ns, ctime_ns, size, orientation, width, height "
        "FROM image_metadata WHERE dev=? AND ino=?;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    sqlite3_bind_int64(stmt, 1, k.dev);
    sqlite3_bind_int64(stmt, 2, k.ino);

    bool hit = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const long long row_mtime_ns = sqlite3_column_int64(stmt, 0);
        const long long row_ctime_ns = sqlite3_column_int64(stmt, 1);
        const long long row_size     = sqlite3_column_int64(stmt, 2);
        if (row_mtime_ns == cur.mtime_ns &&
            row_ctime_ns == cur.ctime_ns &&
            row_size     == cur.size) {
            out = cur;
            out.orientation = sqlite3_column_int(stmt, 3);
            out.width       = sqlite3_column_int(stmt, 4);
            out.height      = sqlite3_column_int(stmt, 5);
            hit = true;
        }
    }
    (void)sqlite3_finalize(stmt);

    if (hit) {
        const char* upd =
            "UPDATE image_metadata SET last_access_ts = ? WHERE dev=? AND ino=?;";
        sqlite3_stmt* upd_stmt = nullptr;
        if (sqlite3_prepare_v2(db_, upd, -1, &upd_stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_int64(upd_stmt, 1, static_cast<long long>(time(nullptr)));
            sqlite3_bind_int64(upd_stmt, 2, k.dev);
            sqlite3_bind_int64(upd_stmt, 3, k.ino);
            (void)sqlite3_step(upd_stmt);
            (void)sqlite3_finalize(upd_stmt);
        }
    }
    return hit;
}


// Desc: number of persisted rows
// In: (none)
// Out: int64_t (0 on error)
int64_t MetadataIndex::db_row_count() {
    sqlite3_stmt* stmt = nullptr;
    int64_t n = 0;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM image_metadata;", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int64(stmt, 0);
        (void)sqlite3_finalize(stmt);
    }
    return n;
}


// Desc: evict oldest rows using LRU strategy
// In: int max_rows_to_evict
// Out: void (deletes rows)
void MetadataIndex::evict_lru(int max_rows_to_evict) {
    if (!db_ || max_rows_to_evict <= 0) return;

    const char* sel_sql =
        "SELECT dev, ino FROM image_metadata "
        "ORDER BY last_access_ts ASC "
        "LIMIT ?;";
    sqlite3_stmt* sel = nullptr;
    if (sqlite3_prepare_v2(db_, sel_sql, -1, &sel, nullptr) != SQLITE_OK) return;
    sqlite3_bind_int(sel, 1, max_rows_to_evict);

    std::vector<std::pair<long long,long long>> keys;
    while (sqlite3_step(sel) == SQLITE_ROW) {
        keys.emplace_back(sqlite3_column_int64(sel, 0), sqlite3_column_int64(sel, 1));
    }
    (void)sqlite3_finalize(sel);
    if (keys.empty()) return;

    char* err = nullptr;
    (void)sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err);
    if (err) { sqlite3_free(err); err = nullptr; }
    const char* del_sql = "DELETE FROM image_metadata WHERE dev=? AND ino=?;";
    sqlite3_stmt* del = nullptr;
    if (sqlite3_prepare_v2(db_, del_sql, -1, &del, nullptr) == SQLITE_OK) {
        for (auto& k : keys) {
            sqlite3_bind_int64(del, 1, k.first);
            sqlite3_bind_int64(del, 2, k.second);
            (void)sqlite3_step(del);
            (void)sqlite3_reset(del);
        }
        (void)sqlite3_finalize(del);
    }
    (void)sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err);
    if (err) {
        log_line(log_fd_, "MetadataIndex", std::string("evict commit failed: ") + err);
        sqlite3_free(err);
    }
}


// Desc: upsert a row; evicts a batch of old rows when the table is full
// In: const Key& k, const Record& rec
// Out: void
void MetadataIndex::db_put(const Key& k, const Record& rec) {
    if (!db_) return;

    const int64_t rows = db_row_count();
    if (rows >= static_cast<int64_t>(max_rows_)) {
        #ifdef DEBUG
        log_line(log_fd_, "MetadataIndex", "table full, removing least recently used rows");
        #endif
        evict_lru(static_cast<int>(rows - static_cast<int64_t>(max_rows_)) + 10);
    }

    const char* sql =
        "INSERT OR REPLACE INTO image_metadata "
        "(dev, ino, mtime_ns, ctime_ns, size, orientation, width, height, last_access_ts) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        log_line(log_fd_, "MetadataIndex", std::string("prepare failed: ") + sqlite3_errmsg(db_));
        return;
    }
    sqlite3_bind_int64(stmt, 1, k.dev);
    sqlite3_bind_int64(stmt, 2, k.ino);
    sqlite3_bind_int64(stmt, 3, rec.mtime_ns);
    sqlite3_bind_int64(stmt, 4, rec.ctime_ns);
    sqlite3_bind_int64(stmt, 5, rec.size);
    sqlite3_bind_int(stmt,   6, rec.orientation);
    sqlite3_bind_int(stmt,   7, rec.width);
    sqlite3_bind_int(stmt,   8, rec.height);
    sqlite3_bind_int64(stmt, 9, static_cast<long long>(time(nullptr)));
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        log_line(log_fd_, "MetadataIndex", std::string("insert failed: ") + sqlite3_errmsg(db_));
    }
    (void)sqlite3_finalize(stmt);
}


// Desc: memory tier -> SQLite tier -> wrapped provider
// In: const ImageFile& file
// Out: Record; throws whatever the wrapped provider throws on a cold miss
MetadataIndex::Record MetadataIndex::resolve(const ImageFile& file) {
    struct stat st{};
    if (::stat(file.path().c_str(), &st) != 0) {
        // Not a local file: nothing to validate a cached row against.
        return read_source(file);
    }

    const Key k{ static_cast<int64_t>(st.st_dev), static_cast<int64_t>(st.st_ino) };
    Record cur{};
    cur.mtime_ns = to_ns(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    cur.ctime_ns = to_ns(st.st_ctim.tv_sec, st.st_ctim.tv_nsec);
    cur.size     = static_cast<int64_t>(st.st_size);
    cur.last_access_ts = static_cast<int64_t>(time(nullptr));

    {
        std::shared_lock rlk(mu_);
        auto it = map_.find(k);
        if (it != map_.end()) {
            const Record& e = it->second;
            if (e.mtime_ns == cur.mtime_ns && e.ctime_ns == cur.ctime_ns && e.size == cur.size) {
                return e;
            }
        }
    }

    Record rec{};
    bool from_db = false;
    {
        std::lock_guard<std::mutex> dlk(db_mu_);
        from_db = db_get(k, cur, rec);
    }
    if (!from_db) {
        Record fresh = read_source(file);
        rec = cur;
        rec.orientation = fresh.orientation;
        rec.width       = fresh.width;
        rec.height      = fresh.height;
        std::lock_guard<std::mutex> dlk(db_mu_);
        db_put(k, rec);
    }

    std::unique_lock wlk(mu_);
    if (map_.size() >= max_rows_) map_.clear();
    map_[k] = rec;
    return rec;
}

int MetadataIndex::get_orientation(const ImageFile& file) {
    return resolve(file).orientation;
}

std::optional<ImageDimensions> MetadataIndex::get_dimensions(const ImageFile& file) {
    const Record rec = resolve(file);
    if (rec.width <= 0 || rec.height <= 0) return std::nullopt;
    return ImageDimensions{ rec.width, rec.height };
}

size_t MetadataIndex::memory_rows() const {
    std::shared_lock rlk(mu_);
    return map_.size();
}
