/**
 * @file memory_cache_store.h
 * @brief In-process cache backend
 */

#pragma once

#include "dailyd/cache/cache_store.h"
#include <mutex>
#include <unordered_map>

namespace dailyd {

/**
 * @brief Mutex-guarded map with lazy expiry
 *
 * Reads drop the expired key they hit; writes also sweep every expired
 * entry once per CACHE_SWEEP_INTERVAL_SEC, so keys that are never read
 * again (past rate windows) do not accumulate.
 *
 * Only coordinates callers inside one process; use SqliteCacheStore when
 * several daemons share a cache.
 */
class MemoryCacheStore : public CacheStore {
public:
    explicit MemoryCacheStore(Clock clock = system_clock_source());

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    bool set_if_absent(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    int64_t increment(const std::string& key, std::chrono::seconds ttl) override;
    size_t remove(const std::string& key) override;
    size_t remove_matching(const std::string& pattern) override;
    bool remove_if_equals(const std::string& key, const std::string& expected) override;
    std::vector<std::string> keys(const std::string& pattern) override;
    bool ping() override { return true; }
    const char* backend() const override { return "memory"; }

    /**
     * @brief Entries held, expired ones not yet swept included
     */
    size_t size();

private:
    struct Entry {
        std::string value;
        std::optional<TimePoint> expires_at;
    };

    Clock clock_;
    std::unordered_map<std::string, Entry> entries_;
    std::mutex mutex_;
    TimePoint last_sweep_;

    // Caller must hold mutex_
    Entry* find_live(const std::string& key, TimePoint now);
    void sweep_expired(TimePoint now);
    std::optional<TimePoint> expiry_for(std::chrono::seconds ttl, TimePoint now) const;
};

} // namespace dailyd
