/**
 * @file memory_cache_store.cpp
 * @brief In-process cache backend
 */

#include "dailyd/cache/memory_cache_store.h"
#include <algorithm>

namespace dailyd {

MemoryCacheStore::MemoryCacheStore(Clock clock)
    : clock_(std::move(clock)),
      last_sweep_(clock_()) {
}

MemoryCacheStore::Entry* MemoryCacheStore::find_live(const std::string& key, TimePoint now) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.expires_at && *it->second.expires_at <= now) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

void MemoryCacheStore::sweep_expired(TimePoint now) {
    if (now - last_sweep_ < std::chrono::seconds(CACHE_SWEEP_INTERVAL_SEC)) {
        return;
    }
    last_sweep_ = now;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at && *it->second.expires_at <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<TimePoint> MemoryCacheStore::expiry_for(std::chrono::seconds ttl, TimePoint now) const {
    if (ttl.count() <= 0) {
        return std::nullopt;
    }
    return now + ttl;
}

std::optional<std::string> MemoryCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key, clock_());
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

void MemoryCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    sweep_expired(now);
    entries_[key] = Entry{value, expiry_for(ttl, now)};
}

bool MemoryCacheStore::set_if_absent(const std::string& key, const std::string& value,
                                     std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    sweep_expired(now);
    if (find_live(key, now)) {
        return false;
    }
    entries_[key] = Entry{value, expiry_for(ttl, now)};
    return true;
}

int64_t MemoryCacheStore::increment(const std::string& key, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    sweep_expired(now);
    Entry* entry = find_live(key, now);
    if (!entry) {
        entries_[key] = Entry{"1", expiry_for(ttl, now)};
        return 1;
    }

    int64_t value = 0;
    try {
        value = std::stoll(entry->value);
    } catch (const std::exception&) {
        throw CacheUnavailable("value at " + key + " is not an integer");
    }
    entry->value = std::to_string(++value);
    return value;
}

size_t MemoryCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!find_live(key, clock_())) {
        return 0;
    }
    return entries_.erase(key);
}

size_t MemoryCacheStore::remove_matching(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        bool expired = it->second.expires_at && *it->second.expires_at <= now;
        if (expired) {
            it = entries_.erase(it);
        } else if (glob_match(pattern, it->first)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

bool MemoryCacheStore::remove_if_equals(const std::string& key, const std::string& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find_live(key, clock_());
    if (!entry || entry->value != expected) {
        return false;
    }
    entries_.erase(key);
    return true;
}

std::vector<std::string> MemoryCacheStore::keys(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    std::vector<std::string> result;
    for (const auto& [key, entry] : entries_) {
        if (entry.expires_at && *entry.expires_at <= now) continue;
        if (glob_match(pattern, key)) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t MemoryCacheStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace dailyd
