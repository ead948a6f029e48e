/**
 * @file sqlite_cache_store.cpp
 * @brief SQLite cache backend implementation
 */

#include "dailyd/cache/sqlite_cache_store.h"
#include "dailyd/logger.h"
#include <sqlite3.h>
#include <filesystem>

namespace dailyd {

namespace {

/**
 * @brief Prepared statement finalized on scope exit
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw CacheUnavailable(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& text) {
        sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }

    void bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    void bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
    }

    /**
     * @return true when a row is available
     */
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw CacheUnavailable(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    int64_t column_int64(int index) const {
        return sqlite3_column_int64(stmt_, index);
    }

    std::string column_text(int index) const {
        const unsigned char* text = sqlite3_column_text(stmt_, index);
        int len = sqlite3_column_bytes(stmt_, index);
        return text ? std::string(reinterpret_cast<const char*>(text), len) : std::string();
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief BEGIN IMMEDIATE ... COMMIT, rolled back unless committed
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        run("BEGIN IMMEDIATE");
    }
    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    void commit() {
        run("COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;

    void run(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg ? err_msg : sqlite3_errmsg(db_);
            sqlite3_free(err_msg);
            throw CacheUnavailable(std::string(sql) + " failed: " + message);
        }
    }
};

constexpr const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS cache (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL,
        expires_at INTEGER
    );

    CREATE INDEX IF NOT EXISTS idx_cache_expires ON cache(expires_at);
)";

// Row is live when it has no expiry or expires in the future
constexpr const char* kLiveClause = "(expires_at IS NULL OR expires_at > ?)";

} // namespace

SqliteCacheStore::SqliteCacheStore(const std::string& db_path,
                                   std::chrono::milliseconds op_timeout,
                                   Clock clock)
    : db_path_(db_path), op_timeout_(op_timeout), clock_(std::move(clock)) {
}

SqliteCacheStore::~SqliteCacheStore() {
    if (db_handle_) {
        sqlite3_close(static_cast<sqlite3*>(db_handle_));
    }
}

bool SqliteCacheStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_locked();
}

bool SqliteCacheStore::open_locked() {
    if (db_handle_) {
        return true;
    }

    if (db_path_ != ":memory:") {
        try {
            auto parent = std::filesystem::path(db_path_).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
        } catch (const std::filesystem::filesystem_error& e) {
            LOG_ERROR("SqliteCacheStore", "Failed to create cache directory: " + std::string(e.what()));
            return false;
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open(db_path_.c_str(), &db);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteCacheStore", "Failed to open database: " +
                  std::string(db ? sqlite3_errmsg(db) : "out of memory"));
        if (db) {
            sqlite3_close(db);
        }
        return false;
    }
    db_handle_ = db;

    sqlite3_busy_timeout(db, static_cast<int>(op_timeout_.count()));
    for (const char* pragma : {"PRAGMA journal_mode=WAL", "PRAGMA synchronous=NORMAL"}) {
        if (sqlite3_exec(db, pragma, nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_WARN("SqliteCacheStore", std::string(pragma) + " failed: " + sqlite3_errmsg(db));
        }
    }

    char* err_msg = nullptr;
    rc = sqlite3_exec(db, kSchemaSql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteCacheStore", "Failed to create schema: " +
                  std::string(err_msg ? err_msg : "unknown error"));
        sqlite3_free(err_msg);
        sqlite3_close(db);
        db_handle_ = nullptr;
        return false;
    }

    LOG_INFO("SqliteCacheStore", "Cache database ready at " + db_path_);
    return true;
}

int64_t SqliteCacheStore::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_().time_since_epoch()).count();
}

int64_t SqliteCacheStore::expiry_ms(std::chrono::seconds ttl, int64_t now) const {
    return now + std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
}

void* SqliteCacheStore::db() {
    // Reopen lazily so the cache recovers once the backing file is reachable
    if (!db_handle_ && !open_locked()) {
        throw CacheUnavailable("database not open: " + db_path_);
    }
    return db_handle_;
}

std::string SqliteCacheStore::last_error() const {
    return db_handle_ ? sqlite3_errmsg(static_cast<sqlite3*>(db_handle_)) : "database not open";
}

void SqliteCacheStore::exec(const char* sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(static_cast<sqlite3*>(db()), sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string message = err_msg ? err_msg : last_error();
        sqlite3_free(err_msg);
        throw CacheUnavailable(message);
    }
}

void SqliteCacheStore::purge_expired(int64_t now) {
    Statement stmt(static_cast<sqlite3*>(db()),
                   "DELETE FROM cache WHERE expires_at IS NOT NULL AND expires_at <= ?");
    stmt.bind(1, now);
    stmt.step();
}

void SqliteCacheStore::sweep_if_due(int64_t now) {
    if (now - last_sweep_ms_ < int64_t{CACHE_SWEEP_INTERVAL_SEC} * 1000) {
        return;
    }
    purge_expired(now);
    last_sweep_ms_ = now;
}

std::vector<std::string> SqliteCacheStore::matching_keys(const std::string& pattern, int64_t now) {
    Statement stmt(static_cast<sqlite3*>(db()),
                   (std::string("SELECT key FROM cache WHERE ") + kLiveClause + " ORDER BY key").c_str());
    stmt.bind(1, now);

    std::vector<std::string> result;
    while (stmt.step()) {
        std::string key = stmt.column_text(0);
        if (glob_match(pattern, key)) {
            result.push_back(std::move(key));
        }
    }
    return result;
}

std::optional<std::string> SqliteCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(static_cast<sqlite3*>(db()),
                   (std::string("SELECT value FROM cache WHERE key = ? AND ") + kLiveClause).c_str());
    stmt.bind(1, key);
    stmt.bind(2, now_ms());
    if (!stmt.step()) {
        return std::nullopt;
    }
    return stmt.column_text(0);
}

void SqliteCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = now_ms();
    sweep_if_due(now);

    Statement stmt(static_cast<sqlite3*>(db()),
                   "INSERT OR REPLACE INTO cache (key, value, expires_at) VALUES (?, ?, ?)");
    stmt.bind(1, key);
    stmt.bind(2, value);
    if (ttl.count() > 0) {
        stmt.bind(3, expiry_ms(ttl, now));
    } else {
        stmt.bind_null(3);
    }
    stmt.step();
}

bool SqliteCacheStore::set_if_absent(const std::string& key, const std::string& value,
                                     std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = static_cast<sqlite3*>(db());
    int64_t now = now_ms();

    Transaction tx(handle);
    sweep_if_due(now);
    {
        Statement expired(handle,
                          "DELETE FROM cache WHERE key = ? AND expires_at IS NOT NULL AND expires_at <= ?");
        expired.bind(1, key);
        expired.bind(2, now);
        expired.step();
    }

    Statement insert(handle, "INSERT OR IGNORE INTO cache (key, value, expires_at) VALUES (?, ?, ?)");
    insert.bind(1, key);
    insert.bind(2, value);
    if (ttl.count() > 0) {
        insert.bind(3, expiry_ms(ttl, now));
    } else {
        insert.bind_null(3);
    }
    insert.step();
    bool created = sqlite3_changes(handle) == 1;

    tx.commit();
    return created;
}

int64_t SqliteCacheStore::increment(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = static_cast<sqlite3*>(db());
    int64_t now = now_ms();

    Transaction tx(handle);
    sweep_if_due(now);

    std::optional<int64_t> current;
    {
        Statement select(handle,
                         (std::string("SELECT value FROM cache WHERE key = ? AND ") + kLiveClause).c_str());
        select.bind(1, key);
        select.bind(2, now);
        if (select.step()) {
            try {
                current = std::stoll(select.column_text(0));
            } catch (const std::exception&) {
                throw CacheUnavailable("value at " + key + " is not an integer");
            }
        }
    }

    int64_t value = 1;
    if (current) {
        value = *current + 1;
        Statement update(handle, "UPDATE cache SET value = ? WHERE key = ?");
        update.bind(1, std::to_string(value));
        update.bind(2, key);
        update.step();
    } else {
        Statement insert(handle, "INSERT OR REPLACE INTO cache (key, value, expires_at) VALUES (?, '1', ?)");
        insert.bind(1, key);
        if (ttl.count() > 0) {
            insert.bind(2, expiry_ms(ttl, now));
        } else {
            insert.bind_null(2);
        }
        insert.step();
    }

    tx.commit();
    return value;
}

size_t SqliteCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = static_cast<sqlite3*>(db());
    Statement stmt(handle, (std::string("DELETE FROM cache WHERE key = ? AND ") + kLiveClause).c_str());
    stmt.bind(1, key);
    stmt.bind(2, now_ms());
    stmt.step();
    return static_cast<size_t>(sqlite3_changes(handle));
}

size_t SqliteCacheStore::remove_matching(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = static_cast<sqlite3*>(db());
    int64_t now = now_ms();

    Transaction tx(handle);
    purge_expired(now);

    size_t removed = 0;
    for (const auto& key : matching_keys(pattern, now)) {
        Statement stmt(handle, "DELETE FROM cache WHERE key = ?");
        stmt.bind(1, key);
        stmt.step();
        removed += static_cast<size_t>(sqlite3_changes(handle));
    }

    tx.commit();
    return removed;
}

bool SqliteCacheStore::remove_if_equals(const std::string& key, const std::string& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* handle = static_cast<sqlite3*>(db());
    Statement stmt(handle,
                   (std::string("DELETE FROM cache WHERE key = ? AND value = ? AND ") + kLiveClause).c_str());
    stmt.bind(1, key);
    stmt.bind(2, expected);
    stmt.bind(3, now_ms());
    stmt.step();
    return sqlite3_changes(handle) == 1;
}

std::vector<std::string> SqliteCacheStore::keys(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    return matching_keys(pattern, now_ms());
}

size_t SqliteCacheStore::row_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(static_cast<sqlite3*>(db()), "SELECT COUNT(*) FROM cache");
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.column_int64(0));
}

bool SqliteCacheStore::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        exec("SELECT 1");
        return true;
    } catch (const CacheUnavailable& e) {
        LOG_WARN("SqliteCacheStore", std::string("Ping failed: ") + e.what());
        return false;
    }
}

} // namespace dailyd
