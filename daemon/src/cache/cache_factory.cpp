/**
 * @file cache_factory.cpp
 * @brief Connection-string parsing and key pattern matching
 */

#include "dailyd/cache/cache_store.h"
#include "dailyd/cache/memory_cache_store.h"
#include "dailyd/cache/sqlite_cache_store.h"
#include "dailyd/logger.h"

namespace dailyd {

bool glob_match(const std::string& pattern, const std::string& key) {
    // Iterative wildcard match with single-star backtracking
    size_t p = 0, k = 0;
    size_t star = std::string::npos, mark = 0;

    while (k < key.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = k;
        } else if (p < pattern.size() && pattern[p] == key[k]) {
            ++p;
            ++k;
        } else if (star != std::string::npos) {
            p = star + 1;
            k = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::shared_ptr<CacheStore> make_cache_store(const std::string& url,
                                             std::chrono::milliseconds op_timeout,
                                             Clock clock) {
    const std::string memory_scheme = "memory://";
    const std::string sqlite_scheme = "sqlite://";

    if (url.rfind(memory_scheme, 0) == 0) {
        LOG_INFO("CacheStore", "Using in-process cache");
        return std::make_shared<MemoryCacheStore>(std::move(clock));
    }

    if (url.rfind(sqlite_scheme, 0) == 0) {
        std::string path = expand_path(url.substr(sqlite_scheme.size()));
        if (path.empty()) {
            throw ValidationError("cache.url", "sqlite url needs a database path");
        }
        auto store = std::make_shared<SqliteCacheStore>(path, op_timeout, std::move(clock));
        if (!store->initialize()) {
            LOG_WARN("CacheStore", "Cache database unavailable, running without cache until it opens: " + path);
        }
        return store;
    }

    throw ValidationError("cache.url", "unsupported scheme in '" + url + "'");
}

} // namespace dailyd
