/**
 * @file protocol.h
 * @brief JSON-RPC protocol definitions for IPC
 */

#pragma once

#include "dailyd/common.h"
#include <string>
#include <optional>

namespace dailyd {

/**
 * @brief IPC request structure
 */
struct Request {
    std::string method;
    json params;
    std::optional<std::string> id;
    std::string caller;  // rate limit key, filled in by the server

    /**
     * @brief Parse request from JSON string
     * @param raw Raw JSON string
     * @return Request if valid, std::nullopt on parse error
     */
    static std::optional<Request> parse(const std::string& raw);

    std::string to_json() const;
};

/**
 * @brief IPC response structure
 */
struct Response {
    bool success = false;
    json result;
    std::string error;
    int error_code = 0;
    json details;  // extra error data (violated field, retry_after)

    std::string to_json() const;

    static Response ok(json result = json::object());

    static Response err(const std::string& message, int code = -1, json details = nullptr);
};

/**
 * @brief Supported IPC methods
 */
namespace Methods {
    // Status and health
    constexpr const char* PING = "ping";
    constexpr const char* VERSION = "version";
    constexpr const char* HEALTH = "health";
    constexpr const char* STATS = "stats";

    // Projects
    constexpr const char* DAILY_GET = "daily.get";
    constexpr const char* PROJECTS_GENERATE = "projects.generate";
    constexpr const char* PROJECTS_GET = "projects.get";
    constexpr const char* PROJECTS_ARCHIVE = "projects.archive";
    constexpr const char* CACHE_CLEAR = "cache.clear";

    // Project pool
    constexpr const char* POOL_STATS = "pool.stats";
    constexpr const char* POOL_CLEAR = "pool.clear";
    constexpr const char* POOL_SEED = "pool.seed";

    // Configuration
    constexpr const char* CONFIG_GET = "config.get";
    constexpr const char* CONFIG_RELOAD = "config.reload";

    // Daemon control
    constexpr const char* SHUTDOWN = "shutdown";
}

/**
 * @brief Error codes for IPC responses
 *
 * JSON-RPC reserves -32768 to -32000 for standard errors.
 * Custom application errors use positive integers (1-999).
 */
namespace ErrorCodes {
    // JSON-RPC standard errors (reserved range: -32768 to -32000)
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // Custom application errors (non-reserved range: 1-999)
    constexpr int VALIDATION_ERROR = 100;
    constexpr int RATE_LIMITED = 102;
    constexpr int NOT_FOUND = 103;
    constexpr int CONFIG_ERROR = 104;
    constexpr int CACHE_UNAVAILABLE = 105;
    constexpr int GENERATION_UNAVAILABLE = 106;
}

} // namespace dailyd
