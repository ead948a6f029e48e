/**
 * @file errors.h
 * @brief Exception types crossing module boundaries
 */

#pragma once

#include <stdexcept>
#include <string>

namespace dailyd {

/**
 * @brief Cache backend unreachable, timed out or failed
 *
 * Callers treat this as "proceed without cache", never as fatal.
 */
class CacheUnavailable : public std::runtime_error {
public:
    explicit CacheUnavailable(const std::string& message)
        : std::runtime_error("cache unavailable: " + message) {}
};

/**
 * @brief Malformed caller input; names the violated field
 */
class ValidationError : public std::invalid_argument {
public:
    ValidationError(const std::string& field, const std::string& message)
        : std::invalid_argument(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

} // namespace dailyd
