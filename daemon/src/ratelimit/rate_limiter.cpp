/**
 * @file rate_limiter.cpp
 * @brief Rate limiter implementation
 */

#include "dailyd/ratelimit/rate_limiter.h"
#include "dailyd/logger.h"
#include <algorithm>

namespace dailyd {

json Admission::to_json() const {
    json j = {
        {"allowed", allowed},
        {"count", count},
        {"degraded", degraded}
    };
    if (!allowed) {
        j["retry_after"] = retry_after.count();
    }
    return j;
}

RateLimiter::RateLimiter(std::shared_ptr<CacheStore> cache, RateLimitPolicy policy, Clock clock)
    : cache_(std::move(cache)),
      policy_(policy),
      clock_(std::move(clock)) {
    if (policy_.window.count() <= 0) {
        throw ValidationError("rate_limit.window_sec", "must be positive");
    }
    if (policy_.max_requests <= 0) {
        throw ValidationError("rate_limit.max_requests", "must be positive");
    }
}

int64_t RateLimiter::window_id(TimePoint now) const {
    return epoch_seconds(now) / policy_.window.count();
}

std::string RateLimiter::key_for(const std::string& caller_key, TimePoint now) const {
    return "rate:" + caller_key + ":" + std::to_string(window_id(now));
}

Admission RateLimiter::admit(const std::string& caller_key) {
    Admission admission;
    const TimePoint now = clock_();

    try {
        admission.count = cache_->increment(key_for(caller_key, now), policy_.window);
    } catch (const CacheUnavailable& e) {
        Logger::degraded("RateLimiter", Degradation::RATE_FAIL_OPEN,
                         std::string("Admitting without counting: ") + e.what(),
                         LogFields::for_caller(caller_key));
        admission.degraded = true;
        return admission;
    }

    if (admission.count > policy_.max_requests) {
        const int64_t window = policy_.window.count();
        const int64_t rollover = (window_id(now) + 1) * window;
        admission.allowed = false;
        admission.retry_after = std::chrono::seconds(std::max<int64_t>(1, rollover - epoch_seconds(now)));
        LOG_DEBUG("RateLimiter", "Rejected " + caller_key + " (" + std::to_string(admission.count) +
                  " requests, retry in " + std::to_string(admission.retry_after.count()) + "s)");
    }
    return admission;
}

} // namespace dailyd
