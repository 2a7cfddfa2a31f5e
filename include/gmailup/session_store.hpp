#pragma once

#include "gmailup/delegate.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace gmailup {

struct SessionRecord {
    std::string key;
    std::string url;
    std::string method_id;
    uint64_t total_size = 0;
    int64_t created_at = 0;   // epoch seconds
    int64_t updated_at = 0;
};

/// SQLite table of resumable session URLs, keyed by an upload identity.
///
/// Lets an interrupted transfer continue after a process restart. Thread-safe.
class SessionStore {
public:
    SessionStore() = default;
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Open (or create) the database. ":memory:" is accepted.
    /// Returns error message on failure, empty string on success.
    std::string open(const std::filesystem::path& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    std::optional<SessionRecord> get(const std::string& key);
    bool put(const std::string& key, const std::string& url,
             const std::string& method_id, uint64_t total_size);
    bool remove(const std::string& key);

    /// Delete sessions created more than `max_age` ago. Returns rows removed.
    int purge_older_than(std::chrono::seconds max_age);

    uint64_t count();

private:
    void close_locked();

    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_put_ = nullptr;
    sqlite3_stmt* stmt_remove_ = nullptr;
};

/// Identity of one upload: same method, same media, same size.
std::string make_session_key(const std::string& method_id, const std::string& media_id,
                             uint64_t total_size);

/// Keeps the session URL of a resumable transfer in a SessionStore.
///
/// Wraps another delegate; every hook not related to the session URL is
/// forwarded unchanged. Sessions older than `max_age` are not reused.
class PersistentSessionDelegate : public ForwardingDelegate {
public:
    PersistentSessionDelegate(Delegate& inner, SessionStore& store, std::string key,
                              uint64_t total_size,
                              std::chrono::seconds max_age = std::chrono::hours(24 * 7));

    void begin(const MethodInfo& info) override;
    std::optional<std::string> upload_url() override;
    void store_upload_url(const std::optional<std::string>& url) override;

private:
    SessionStore& store_;
    std::string key_;
    uint64_t total_size_;
    std::chrono::seconds max_age_;
    std::string method_id_;
};

}  // namespace gmailup
