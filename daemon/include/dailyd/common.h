/**
 * @file common.h
 * @brief Shared constants, type aliases and small helpers
 */

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <functional>
#include <string>

namespace dailyd {

using json = nlohmann::json;

// Identity
constexpr const char* NAME = "dailyd";
constexpr const char* VERSION = "1.0.0";

// Paths
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/dailyd/dailyd.yaml";
constexpr const char* DEFAULT_SOCKET_PATH = "/run/dailyd/dailyd.sock";
constexpr const char* DEFAULT_CACHE_URL = "sqlite:///var/lib/dailyd/cache.db";

// Socket
constexpr int SOCKET_BACKLOG = 16;
constexpr int SOCKET_TIMEOUT_MS = 5000;
constexpr size_t MAX_MESSAGE_SIZE = 65536;
constexpr int DRAIN_LOG_INTERVAL_SEC = 5;

// Cache
constexpr int DEFAULT_CACHE_OP_TIMEOUT_MS = 2000;
constexpr int CACHE_SWEEP_INTERVAL_SEC = 60;

// Projects
constexpr int DEFAULT_DAILY_TTL_SEC = 86400 * 7;
constexpr int DEFAULT_FALLBACK_TTL_SEC = 3600;
constexpr int DEFAULT_MAX_PROJECT_COUNT = 10;
constexpr int DEFAULT_PROJECT_COUNT = 5;
constexpr int MAX_ARCHIVE_DAYS = 30;
constexpr int DEFAULT_POOL_TTL_SEC = 86400 * 7;
constexpr int MAX_POOL_SEED = 50;

// Generation
constexpr int DEFAULT_GENERATION_TIMEOUT_SEC = 30;
constexpr int DEFAULT_GENERATION_RETRIES = 1;
constexpr int DEFAULT_RETRY_BACKOFF_MS = 500;
constexpr int DEFAULT_LOCK_TTL_SEC = 300;
constexpr int DEFAULT_POLL_INTERVAL_MS = 1000;
constexpr int DEFAULT_POLL_MAX_ATTEMPTS = 75;
constexpr size_t MAX_PROMPT_SIZE = 16384;

// Rate limiting
constexpr int DEFAULT_RATE_WINDOW_SEC = 60;
constexpr int DEFAULT_RATE_MAX_REQUESTS = 60;

/**
 * @brief Wall clock source, injectable so time-dependent logic is testable
 */
using Clock = std::function<std::chrono::system_clock::time_point()>;

inline Clock system_clock_source() {
    return [] { return std::chrono::system_clock::now(); };
}

/**
 * @brief Expand a leading ~ to $HOME
 */
inline std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

namespace internal {
    // syslog priorities used for journald
    constexpr int SYSLOG_CRIT = 2;
    constexpr int SYSLOG_ERR = 3;
    constexpr int SYSLOG_WARNING = 4;
    constexpr int SYSLOG_INFO = 6;
    constexpr int SYSLOG_DEBUG = 7;
}

} // namespace dailyd
