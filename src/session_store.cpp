#include "gmailup/session_store.hpp"
#include "gmailup/log.hpp"

#include <sqlite3.h>
#include <thread>

namespace gmailup {

namespace {

constexpr const char* SESSION_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS upload_sessions (
    session_key TEXT PRIMARY KEY,
    url TEXT NOT NULL,
    method_id TEXT NOT NULL,
    total_size INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_created
    ON upload_sessions(created_at);
)";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

// ============================================================================
// SessionStore
// ============================================================================

SessionStore::~SessionStore() {
    close();
}

std::string SessionStore::open(const std::filesystem::path& db_path) {
    std::lock_guard lock(mutex_);
    if (db_) {
        return "session store already open";
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = "Cannot open session store: " + std::string(sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, SESSION_SCHEMA)) {
        std::string err = "Cannot create session schema: " + std::string(sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    bool prepared =
        sqlite3_prepare_v2(db_,
            "SELECT session_key, url, method_id, total_size, created_at, updated_at "
            "FROM upload_sessions WHERE session_key = ?1",
            -1, &stmt_get_, nullptr) == SQLITE_OK &&
        sqlite3_prepare_v2(db_,
            "INSERT INTO upload_sessions (session_key, url, method_id, total_size, created_at, updated_at) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?5) "
            "ON CONFLICT(session_key) DO UPDATE SET url = excluded.url, "
            "method_id = excluded.method_id, total_size = excluded.total_size, "
            "created_at = CASE WHEN upload_sessions.url = excluded.url "
            "THEN upload_sessions.created_at ELSE excluded.created_at END, "
            "updated_at = excluded.updated_at",
            -1, &stmt_put_, nullptr) == SQLITE_OK &&
        sqlite3_prepare_v2(db_,
            "DELETE FROM upload_sessions WHERE session_key = ?1",
            -1, &stmt_remove_, nullptr) == SQLITE_OK;

    if (!prepared) {
        std::string err = "Cannot prepare session statements: " + std::string(sqlite3_errmsg(db_));
        close_locked();
        return err;
    }
    return {};
}

void SessionStore::close() {
    std::lock_guard lock(mutex_);
    close_locked();
}

void SessionStore::close_locked() {
    if (stmt_get_) sqlite3_finalize(stmt_get_);
    if (stmt_put_) sqlite3_finalize(stmt_put_);
    if (stmt_remove_) sqlite3_finalize(stmt_remove_);
    stmt_get_ = stmt_put_ = stmt_remove_ = nullptr;
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<SessionRecord> SessionStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::nullopt;

    sqlite3_reset(stmt_get_);
    sqlite3_bind_text(stmt_get_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sql_step_retry(stmt_get_) != SQLITE_ROW) {
        return std::nullopt;
    }

    SessionRecord rec;
    rec.key = column_text(stmt_get_, 0);
    rec.url = column_text(stmt_get_, 1);
    rec.method_id = column_text(stmt_get_, 2);
    rec.total_size = static_cast<uint64_t>(sqlite3_column_int64(stmt_get_, 3));
    rec.created_at = sqlite3_column_int64(stmt_get_, 4);
    rec.updated_at = sqlite3_column_int64(stmt_get_, 5);
    sqlite3_reset(stmt_get_);
    return rec;
}

bool SessionStore::put(const std::string& key, const std::string& url,
                       const std::string& method_id, uint64_t total_size) {
    std::lock_guard lock(mutex_);
    if (!db_) return false;

    sqlite3_reset(stmt_put_);
    sqlite3_bind_text(stmt_put_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 2, url.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_put_, 3, method_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_put_, 4, static_cast<int64_t>(total_size));
    sqlite3_bind_int64(stmt_put_, 5, now_epoch());
    int rc = sql_step_retry(stmt_put_);
    if (rc != SQLITE_DONE) {
        log_error("Failed to store upload session %s: %s", key.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SessionStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    if (!db_) return false;

    sqlite3_reset(stmt_remove_);
    sqlite3_bind_text(stmt_remove_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    return sql_step_retry(stmt_remove_) == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

int SessionStore::purge_older_than(std::chrono::seconds max_age) {
    std::lock_guard lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM upload_sessions WHERE created_at < ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        log_error("Failed to prepare purge: %s", sqlite3_errmsg(db_));
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, now_epoch() - max_age.count());
    int removed = 0;
    if (sql_step_retry(stmt) == SQLITE_DONE) {
        removed = sqlite3_changes(db_);
    }
    sqlite3_finalize(stmt);
    return removed;
}

uint64_t SessionStore::count() {
    std::lock_guard lock(mutex_);
    if (!db_) return 0;

    uint64_t total = 0;
    sqlite3_stmt* stmt = nullptr;
    sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM upload_sessions", -1, &stmt, nullptr);
    if (stmt && sql_step_retry(stmt) == SQLITE_ROW) {
        total = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

std::string make_session_key(const std::string& method_id, const std::string& media_id,
                             uint64_t total_size) {
    return method_id + "|" + media_id + "|" + std::to_string(total_size);
}

// ============================================================================
// PersistentSessionDelegate
// ============================================================================

PersistentSessionDelegate::PersistentSessionDelegate(Delegate& inner, SessionStore& store,
                                                     std::string key, uint64_t total_size,
                                                     std::chrono::seconds max_age)
    : ForwardingDelegate(inner)
    , store_(store)
    , key_(std::move(key))
    , total_size_(total_size)
    , max_age_(max_age) {}

void PersistentSessionDelegate::begin(const MethodInfo& info) {
    method_id_ = info.id;
    inner_.begin(info);
}

std::optional<std::string> PersistentSessionDelegate::upload_url() {
    auto rec = store_.get(key_);
    if (rec) {
        if (now_epoch() - rec->created_at > max_age_.count() || rec->total_size != total_size_) {
            log_info("Discarding stale upload session for %s", key_.c_str());
            store_.remove(key_);
        } else {
            return rec->url;
        }
    }
    return inner_.upload_url();
}

void PersistentSessionDelegate::store_upload_url(const std::optional<std::string>& url) {
    if (url) {
        store_.put(key_, *url, method_id_, total_size_);
    } else {
        store_.remove(key_);
    }
    inner_.store_upload_url(url);
}

}  // namespace gmailup
