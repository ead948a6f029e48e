/**
 * @file helpers.cpp
 * @brief Date, timestamp and identifier helpers
 */

#include "dailyd/utils/helpers.h"
#include <uuid/uuid.h>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace dailyd {

static bool to_utc_tm(TimePoint tp, std::tm& out) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return gmtime_r(&t, &out) != nullptr;
}

std::string format_utc_time(TimePoint tp) {
    std::tm tm_buf{};
    if (!to_utc_tm(tp, tm_buf)) {
        return "";
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

std::optional<TimePoint> parse_utc_time(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(static_cast<unsigned char>(ss.peek()))) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }
    if (ss.peek() != 'Z') {
        return std::nullopt;
    }

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    return tp + std::chrono::milliseconds(millis);
}

std::string format_date(TimePoint tp) {
    std::tm tm_buf{};
    if (!to_utc_tm(tp, tm_buf)) {
        return "";
    }
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

std::string format_compact_stamp(TimePoint tp) {
    std::tm tm_buf{};
    if (!to_utc_tm(tp, tm_buf)) {
        return "";
    }
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &tm_buf);
    return buf;
}

// Parses YYYY-MM-DD and rejects days that do not exist (2025-02-30).
static bool parse_date(const std::string& date, std::tm& out) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return false;
    }

    std::tm tm = {};
    tm.tm_year = std::stoi(date.substr(0, 4)) - 1900;
    tm.tm_mon = std::stoi(date.substr(5, 2)) - 1;
    tm.tm_mday = std::stoi(date.substr(8, 2));
    tm.tm_hour = 12;

    std::tm normalized = tm;
    std::time_t t = timegm(&normalized);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    if (normalized.tm_year != tm.tm_year || normalized.tm_mon != tm.tm_mon ||
        normalized.tm_mday != tm.tm_mday) {
        return false;
    }
    out = normalized;
    return true;
}

bool is_valid_date(const std::string& date) {
    std::tm tm{};
    return parse_date(date, tm);
}

std::optional<std::string> shift_date(const std::string& date, int days) {
    std::tm tm{};
    if (!parse_date(date, tm)) {
        return std::nullopt;
    }
    tm.tm_mday += days;
    std::time_t t = timegm(&tm);
    return format_date(std::chrono::system_clock::from_time_t(t));
}

int64_t epoch_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string generate_uuid() {
    uuid_t uuid;
    char uuid_str[37];
    uuid_generate(uuid);
    uuid_unparse_lower(uuid, uuid_str);
    return uuid_str;
}

uint64_t fnv1a_hash(const std::string& text) {
    constexpr uint64_t fnv_offset = 14695981039346656037ULL;
    constexpr uint64_t fnv_prime = 1099511628211ULL;

    uint64_t hash = fnv_offset;
    for (unsigned char byte : text) {
        hash ^= byte;
        hash *= fnv_prime;
    }
    return hash;
}

std::vector<size_t> seeded_permutation(size_t size, const std::string& seed) {
    std::vector<size_t> order(size);
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }

    std::mt19937_64 rng(fnv1a_hash(seed));
    for (size_t i = order.size(); i > 1; --i) {
        size_t j = static_cast<size_t>(rng() % i);
        std::swap(order[i - 1], order[j]);
    }
    return order;
}

} // namespace dailyd
