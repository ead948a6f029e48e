/**
 * @file logger.h
 * @brief Structured logging to journald or stderr
 */

#pragma once

#include "dailyd/common.h"
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace dailyd {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    CRITICAL = 4
};

/**
 * @brief Ways the daemon keeps serving with reduced quality
 *
 * Each one is logged at WARN with a DAILYD_DEGRADATION journald field so
 * operators can alert on them without parsing messages.
 */
enum class Degradation {
    CACHE_BYPASS,        // cache unreachable, request served without it
    RATE_FAIL_OPEN,      // request admitted without being counted
    TEMPLATE_FALLBACK,   // generation unavailable, templates served
    POOL_FALLBACK,       // generation unavailable, pooled projects served
    PADDED,              // partial generation topped up from templates
    FILTER_WIDENED,      // fallback filters relaxed to fill the batch
    WAIT_EXPIRED         // waiter gave up on another generation
};

constexpr size_t DEGRADATION_KINDS = 7;

const char* to_string(Degradation signal);

/**
 * @brief Optional structured fields of one record
 *
 * Empty fields are omitted from journald and stderr output.
 */
struct LogFields {
    std::string cache_key;
    std::string generation_id;
    std::string caller;
    std::optional<Degradation> degradation;

    static LogFields for_key(std::string key) {
        LogFields fields;
        fields.cache_key = std::move(key);
        return fields;
    }

    static LogFields for_caller(std::string caller_key) {
        LogFields fields;
        fields.caller = std::move(caller_key);
        return fields;
    }

    LogFields& generation(std::string id) {
        generation_id = std::move(id);
        return *this;
    }
};

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    LogFields fields;
};

/**
 * @brief Process-wide logger
 *
 * Writes to journald when running as a service and to stderr in the
 * foreground. An optional sink sees every record that passes the level
 * filter; it must not log itself.
 */
class Logger {
public:
    using Sink = std::function<void(const LogRecord&)>;

    /**
     * @param min_level Records below this level are dropped
     * @param use_journald Send to journald instead of stderr
     *
     * Resets the degradation counters.
     */
    static void init(LogLevel min_level, bool use_journald = true);

    /**
     * @brief Flush and drop the sink
     */
    static void shutdown();

    static void set_level(LogLevel level);
    static LogLevel get_level();

    static void set_sink(Sink sink);

    static void log(LogLevel level, const std::string& component, const std::string& message,
                    const LogFields& fields = LogFields{});

    /**
     * @brief Report a degradation signal at WARN and count it
     */
    static void degraded(const std::string& component, Degradation signal,
                         const std::string& message, LogFields fields = LogFields{});

    /**
     * @brief Signals reported since init()
     */
    static uint64_t degradation_count(Degradation signal);
    static json degradation_counts();

    /**
     * @brief Map the numeric config value (0-4) to a level
     */
    static LogLevel level_from_int(int level);

    static const char* level_name(LogLevel level);

    /**
     * @brief "[LEVEL] component: message key=value..." without timestamp
     */
    static std::string format(const LogRecord& record);

private:
    static LogLevel min_level_;
    static bool use_journald_;
    static std::mutex mutex_;
    static Sink sink_;
    static std::array<std::atomic<uint64_t>, DEGRADATION_KINDS> degradations_;

    static void write_journald(const LogRecord& record);
    static void write_stderr(const LogRecord& record);
};

} // namespace dailyd

#define LOG_DEBUG(component, message) ::dailyd::Logger::log(::dailyd::LogLevel::DEBUG, component, message)
#define LOG_INFO(component, message) ::dailyd::Logger::log(::dailyd::LogLevel::INFO, component, message)
#define LOG_WARN(component, message) ::dailyd::Logger::log(::dailyd::LogLevel::WARN, component, message)
#define LOG_ERROR(component, message) ::dailyd::Logger::log(::dailyd::LogLevel::ERROR, component, message)
#define LOG_CRITICAL(component, message) ::dailyd::Logger::log(::dailyd::LogLevel::CRITICAL, component, message)
