/**
 * @file helpers.h
 * @brief Date, timestamp and identifier helpers
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dailyd {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Format as ISO 8601 UTC with milliseconds (2025-09-13T08:00:00.000Z)
 */
std::string format_utc_time(TimePoint tp);

/**
 * @brief Parse the output of format_utc_time (milliseconds optional)
 */
std::optional<TimePoint> parse_utc_time(const std::string& text);

/**
 * @brief Calendar date (UTC) as YYYY-MM-DD
 */
std::string format_date(TimePoint tp);

/**
 * @brief Compact stamp YYYYMMDDHHMMSS (UTC)
 */
std::string format_compact_stamp(TimePoint tp);

/**
 * @brief Check YYYY-MM-DD syntax and that the day exists
 */
bool is_valid_date(const std::string& date);

/**
 * @brief Shift a YYYY-MM-DD date by a number of days
 * @return Shifted date, std::nullopt if the input is not a valid date
 */
std::optional<std::string> shift_date(const std::string& date, int days);

/**
 * @brief Seconds since the Unix epoch
 */
int64_t epoch_seconds(TimePoint tp);

/**
 * @brief Random lowercase UUID string
 */
std::string generate_uuid();

/**
 * @brief 64-bit FNV-1a hash
 */
uint64_t fnv1a_hash(const std::string& text);

/**
 * @brief Permutation of 0..size-1 determined only by the seed
 *
 * Fisher-Yates on raw mt19937_64 output, so the order is the same with
 * every standard library.
 */
std::vector<size_t> seeded_permutation(size_t size, const std::string& seed);

} // namespace dailyd
