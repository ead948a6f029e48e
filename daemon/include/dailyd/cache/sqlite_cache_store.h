/**
 * @file sqlite_cache_store.h
 * @brief SQLite cache backend shared between processes
 */

#pragma once

#include "dailyd/cache/cache_store.h"
#include <mutex>

namespace dailyd {

/**
 * @brief Cache table in a SQLite database file
 *
 * Counters and set-if-absent run inside BEGIN IMMEDIATE transactions, so
 * several daemons pointing at the same file stay consistent. Lock waits are
 * bounded by the operation timeout (sqlite busy timeout). Writes delete
 * expired rows at most once per CACHE_SWEEP_INTERVAL_SEC.
 */
class SqliteCacheStore : public CacheStore {
public:
    /**
     * @param db_path Database file (":memory:" for a private in-memory db)
     * @param op_timeout Upper bound for waiting on a locked database
     * @param clock Source of "now" for expiry
     */
    SqliteCacheStore(const std::string& db_path,
                     std::chrono::milliseconds op_timeout,
                     Clock clock = system_clock_source());
    ~SqliteCacheStore() override;

    SqliteCacheStore(const SqliteCacheStore&) = delete;
    SqliteCacheStore& operator=(const SqliteCacheStore&) = delete;

    /**
     * @brief Open the database and create the schema
     * @return true if successful
     */
    bool initialize();

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    bool set_if_absent(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    int64_t increment(const std::string& key, std::chrono::seconds ttl) override;
    size_t remove(const std::string& key) override;
    size_t remove_matching(const std::string& pattern) override;
    bool remove_if_equals(const std::string& key, const std::string& expected) override;
    std::vector<std::string> keys(const std::string& pattern) override;
    bool ping() override;
    const char* backend() const override { return "sqlite"; }

    const std::string& path() const { return db_path_; }

    /**
     * @brief Rows in the table, expired ones not yet swept included
     */
    size_t row_count();

private:
    std::string db_path_;
    std::chrono::milliseconds op_timeout_;
    Clock clock_;
    void* db_handle_ = nullptr;  // sqlite3*
    std::mutex mutex_;           // one connection, serialized
    int64_t last_sweep_ms_ = 0;

    int64_t now_ms() const;
    int64_t expiry_ms(std::chrono::seconds ttl, int64_t now) const;

    // Caller must hold mutex_
    bool open_locked();
    void* db();
    void exec(const char* sql);
    void purge_expired(int64_t now);
    void sweep_if_due(int64_t now);
    std::vector<std::string> matching_keys(const std::string& pattern, int64_t now);
    std::string last_error() const;
};

} // namespace dailyd
