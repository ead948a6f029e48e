/**
 * @file logger.cpp
 * @brief Structured logger: journald fields, stderr lines, degradation counters
 */

#include "dailyd/logger.h"
#include <ctime>
#include <iostream>
#include <sstream>
#include <vector>
#include <sys/uio.h>
#include <systemd/sd-journal.h>

namespace dailyd {

LogLevel Logger::min_level_ = LogLevel::INFO;
bool Logger::use_journald_ = true;
std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;
std::array<std::atomic<uint64_t>, DEGRADATION_KINDS> Logger::degradations_{};

namespace {

int syslog_priority(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return internal::SYSLOG_DEBUG;
        case LogLevel::INFO: return internal::SYSLOG_INFO;
        case LogLevel::WARN: return internal::SYSLOG_WARNING;
        case LogLevel::ERROR: return internal::SYSLOG_ERR;
        case LogLevel::CRITICAL: return internal::SYSLOG_CRIT;
        default: return internal::SYSLOG_INFO;
    }
}

} // namespace

const char* to_string(Degradation signal) {
    switch (signal) {
        case Degradation::CACHE_BYPASS: return "cache_bypass";
        case Degradation::RATE_FAIL_OPEN: return "rate_fail_open";
        case Degradation::TEMPLATE_FALLBACK: return "template_fallback";
        case Degradation::POOL_FALLBACK: return "pool_fallback";
        case Degradation::PADDED: return "padded";
        case Degradation::FILTER_WIDENED: return "filter_widened";
        case Degradation::WAIT_EXPIRED: return "wait_expired";
        default: return "unknown";
    }
}

void Logger::init(LogLevel min_level, bool use_journald) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = min_level;
    use_journald_ = use_journald;
    for (auto& counter : degradations_) {
        counter.store(0);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
    if (!use_journald_) {
        std::cerr.flush();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

LogLevel Logger::level_from_int(int level) {
    if (level < 0 || level > static_cast<int>(LogLevel::CRITICAL)) {
        return LogLevel::INFO;
    }
    return static_cast<LogLevel>(level);
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogFields& fields) {
    LogRecord record;
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (static_cast<int>(level) < static_cast<int>(min_level_)) {
            return;
        }

        record.level = level;
        record.component = component;
        record.message = message;
        record.fields = fields;

        if (use_journald_) {
            write_journald(record);
        } else {
            write_stderr(record);
        }
        sink = sink_;
    }

    if (sink) {
        sink(record);
    }
}

void Logger::degraded(const std::string& component, Degradation signal,
                      const std::string& message, LogFields fields) {
    degradations_[static_cast<size_t>(signal)].fetch_add(1, std::memory_order_relaxed);
    fields.degradation = signal;
    log(LogLevel::WARN, component, message, fields);
}

uint64_t Logger::degradation_count(Degradation signal) {
    return degradations_[static_cast<size_t>(signal)].load(std::memory_order_relaxed);
}

json Logger::degradation_counts() {
    json counts = json::object();
    for (size_t i = 0; i < DEGRADATION_KINDS; ++i) {
        counts[to_string(static_cast<Degradation>(i))] = degradations_[i].load(std::memory_order_relaxed);
    }
    return counts;
}

std::string Logger::format(const LogRecord& record) {
    std::ostringstream out;
    out << "[" << level_name(record.level) << "] " << record.component << ": " << record.message;

    const LogFields& f = record.fields;
    if (!f.cache_key.empty()) out << " key=" << f.cache_key;
    if (!f.generation_id.empty()) out << " generation=" << f.generation_id;
    if (!f.caller.empty()) out << " caller=" << f.caller;
    if (f.degradation) out << " degradation=" << to_string(*f.degradation);
    return out.str();
}

void Logger::write_journald(const LogRecord& record) {
    std::vector<std::string> entries = {
        "MESSAGE=" + record.message,
        "PRIORITY=" + std::to_string(syslog_priority(record.level)),
        "SYSLOG_IDENTIFIER=dailyd",
        "DAILYD_COMPONENT=" + record.component
    };

    const LogFields& f = record.fields;
    if (!f.cache_key.empty()) entries.push_back("DAILYD_CACHE_KEY=" + f.cache_key);
    if (!f.generation_id.empty()) entries.push_back("DAILYD_GENERATION_ID=" + f.generation_id);
    if (!f.caller.empty()) entries.push_back("DAILYD_CALLER=" + f.caller);
    if (f.degradation) entries.push_back(std::string("DAILYD_DEGRADATION=") + to_string(*f.degradation));

    std::vector<struct iovec> iov(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        iov[i].iov_base = const_cast<char*>(entries[i].data());
        iov[i].iov_len = entries[i].size();
    }

    if (sd_journal_sendv(iov.data(), static_cast<int>(iov.size())) < 0) {
        // journald gone (container, early boot): keep the line
        write_stderr(record);
    }
}

void Logger::write_stderr(const LogRecord& record) {
    char stamp[32] = "[XXXX-XX-XX XX:XX:XX]";
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    if (localtime_r(&now, &tm_buf)) {
        std::strftime(stamp, sizeof(stamp), "[%Y-%m-%d %H:%M:%S]", &tm_buf);
    }
    std::cerr << stamp << " " << format(record) << std::endl;
}

} // namespace dailyd
