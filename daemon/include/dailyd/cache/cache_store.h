/**
 * @file cache_store.h
 * @brief Key/value store with per-key TTL and atomic counters
 */

#pragma once

#include "dailyd/common.h"
#include "dailyd/errors.h"
#include "dailyd/utils/helpers.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dailyd {

/**
 * @brief Shared cache used for daily batches, generation locks, rate
 *        counters and stats
 *
 * Every operation is atomic per key and throws CacheUnavailable when the
 * backend cannot be reached. A TTL of zero means the key never expires.
 * Patterns accept '*' as a wildcard.
 */
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void set(const std::string& key, const std::string& value,
                     std::chrono::seconds ttl) = 0;

    /**
     * @brief Store only if the key is absent (or expired)
     * @return true if this call created the key
     */
    virtual bool set_if_absent(const std::string& key, const std::string& value,
                               std::chrono::seconds ttl) = 0;

    /**
     * @brief Atomically add one
     *
     * Creates the key at 1 when absent; the TTL is applied only on creation.
     * @return Value after the increment
     */
    virtual int64_t increment(const std::string& key, std::chrono::seconds ttl) = 0;

    /**
     * @return Number of keys removed (0 or 1)
     */
    virtual size_t remove(const std::string& key) = 0;

    /**
     * @return Number of keys removed
     */
    virtual size_t remove_matching(const std::string& pattern) = 0;

    /**
     * @brief Delete the key only if it still holds the expected value
     */
    virtual bool remove_if_equals(const std::string& key, const std::string& expected) = 0;

    /**
     * @brief Live keys matching the pattern, sorted
     */
    virtual std::vector<std::string> keys(const std::string& pattern) = 0;

    /**
     * @brief Liveness check; never throws
     */
    virtual bool ping() = 0;

    virtual const char* backend() const = 0;
};

/**
 * @brief Match a key against a '*' wildcard pattern
 */
bool glob_match(const std::string& pattern, const std::string& key);

/**
 * @brief Build a store from a connection string
 *
 * Supported: "memory://" and "sqlite://<path>" (e.g. sqlite:///var/lib/dailyd/cache.db).
 * @throws ValidationError for an unsupported scheme
 *
 * A backend that cannot be opened yet is still returned; its operations
 * throw CacheUnavailable until it becomes reachable.
 */
std::shared_ptr<CacheStore> make_cache_store(const std::string& url,
                                             std::chrono::milliseconds op_timeout,
                                             Clock clock = system_clock_source());

} // namespace dailyd
