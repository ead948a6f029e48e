/**
 * @file rate_limiter.h
 * @brief Fixed-window request limiter backed by the cache store
 */

#pragma once

#include "dailyd/cache/cache_store.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace dailyd {

struct RateLimitPolicy {
    std::chrono::seconds window{DEFAULT_RATE_WINDOW_SEC};
    int64_t max_requests = DEFAULT_RATE_MAX_REQUESTS;
};

/**
 * @brief Result of RateLimiter::admit
 */
struct Admission {
    bool allowed = true;
    std::chrono::seconds retry_after{0};  // set when rejected
    bool degraded = false;                 // cache down, admitted without counting
    int64_t count = 0;                     // requests seen in this window

    json to_json() const;
};

/**
 * @brief Counts requests per caller in fixed windows
 *
 * The counter for a window lives under rate:<caller>:<window_id> and expires
 * with the window. Cache failures admit the request.
 */
class RateLimiter {
public:
    RateLimiter(std::shared_ptr<CacheStore> cache, RateLimitPolicy policy,
                Clock clock = system_clock_source());

    Admission admit(const std::string& caller_key);

    /**
     * @brief Cache key of the window containing now
     */
    std::string key_for(const std::string& caller_key, TimePoint now) const;

    int64_t window_id(TimePoint now) const;

    const RateLimitPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<CacheStore> cache_;
    RateLimitPolicy policy_;
    Clock clock_;
};

} // namespace dailyd
