/**
 * @file config.h
 * @brief Configuration management with YAML support
 */

#pragma once

#include "dailyd/common.h"
#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <mutex>
#include <vector>

namespace dailyd {

struct OrchestratorSettings;
struct AdapterSettings;
struct RateLimitPolicy;

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // Socket configuration
    std::string socket_path = DEFAULT_SOCKET_PATH;
    int socket_backlog = SOCKET_BACKLOG;
    int socket_timeout_ms = SOCKET_TIMEOUT_MS;

    // Cache store
    std::string cache_url = DEFAULT_CACHE_URL;
    int cache_op_timeout_ms = DEFAULT_CACHE_OP_TIMEOUT_MS;

    // Projects
    int daily_ttl_sec = DEFAULT_DAILY_TTL_SEC;
    int fallback_ttl_sec = DEFAULT_FALLBACK_TTL_SEC;
    int pool_ttl_sec = DEFAULT_POOL_TTL_SEC;
    int max_project_count = DEFAULT_MAX_PROJECT_COUNT;
    int default_project_count = DEFAULT_PROJECT_COUNT;
    std::string catalog_path;  // empty = built-in catalog

    // Generation
    int generation_timeout_sec = DEFAULT_GENERATION_TIMEOUT_SEC;
    int generation_max_retries = DEFAULT_GENERATION_RETRIES;
    int retry_backoff_ms = DEFAULT_RETRY_BACKOFF_MS;
    int lock_ttl_sec = DEFAULT_LOCK_TTL_SEC;
    int poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
    int poll_max_attempts = DEFAULT_POLL_MAX_ATTEMPTS;

    // LLM configuration
    std::string model_path;
    int llm_context_length = 4096;
    int llm_threads = 4;
    int llm_max_tokens = 2000;
    double llm_temperature = 0.8;
    bool llm_lazy_load = true;  // Load model on first request

    // Rate limiting
    int rate_window_sec = DEFAULT_RATE_WINDOW_SEC;
    int rate_max_requests = DEFAULT_RATE_MAX_REQUESTS;

    // Logging
    int log_level = 1;  // INFO by default (0=DEBUG, 1=INFO, 2=WARN, 3=ERROR)

    /**
     * @brief Load configuration from YAML file
     * @param path Path to YAML configuration file
     * @return Config if successful, std::nullopt on error
     */
    static std::optional<Config> load(const std::string& path);

    /**
     * @brief Save configuration to YAML file
     * @param path Path to save configuration
     * @return true if successful
     */
    bool save(const std::string& path) const;

    /**
     * @brief Expand all paths (~ -> home directory)
     */
    void expand_paths();

    /**
     * @brief Validate configuration values
     * @return Error message naming the key if invalid, empty string if valid
     */
    std::string validate() const;

    static Config defaults();

    json to_json() const;

    OrchestratorSettings orchestrator_settings() const;
    AdapterSettings adapter_settings() const;
    RateLimitPolicy rate_limit_policy() const;
};

/**
 * @brief Configuration manager singleton
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return true if successful; defaults are kept otherwise
     */
    bool load(const std::string& path);

    /**
     * @brief Reload configuration from previously loaded path
     * @return true if successful
     */
    bool reload();

    /**
     * @brief Get current configuration (returns copy for thread safety)
     */
    Config get() const;

    const std::string& config_path() const { return config_path_; }

    /**
     * @brief Register callback for configuration changes
     */
    using ChangeCallback = std::function<void(const Config&)>;
    void on_change(ChangeCallback callback);

    /**
     * @brief Drop loaded state and callbacks (used between daemon runs)
     */
    void reset();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

private:
    ConfigManager() = default;

    Config config_;
    std::string config_path_;
    std::vector<ChangeCallback> callbacks_;
    mutable std::mutex mutex_;

    static void notify_callbacks(const std::vector<ChangeCallback>& callbacks, const Config& config);
};

} // namespace dailyd
