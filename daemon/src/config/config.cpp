/**
 * @file config.cpp
 * @brief Configuration implementation with YAML support
 */

#include "dailyd/config.h"
#include "dailyd/core/orchestrator.h"
#include "dailyd/llm/generation_adapter.h"
#include "dailyd/logger.h"
#include "dailyd/ratelimit/rate_limiter.h"
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace dailyd {

namespace {

template <typename T>
void read_key(const YAML::Node& section, const char* key, T& target) {
    if (section[key]) {
        target = section[key].as<T>();
    }
}

} // namespace

std::optional<Config> Config::load(const std::string& path) {
    try {
        std::string expanded_path = expand_path(path);

        std::ifstream file(expanded_path);
        if (!file.good()) {
            LOG_WARN("Config", "Configuration file not found: " + expanded_path);
            return std::nullopt;
        }

        YAML::Node yaml = YAML::LoadFile(expanded_path);
        Config config;

        if (auto socket = yaml["socket"]) {
            read_key(socket, "path", config.socket_path);
            read_key(socket, "backlog", config.socket_backlog);
            read_key(socket, "timeout_ms", config.socket_timeout_ms);
        }

        if (auto cache = yaml["cache"]) {
            read_key(cache, "url", config.cache_url);
            read_key(cache, "op_timeout_ms", config.cache_op_timeout_ms);
        }

        if (auto projects = yaml["projects"]) {
            read_key(projects, "daily_ttl_sec", config.daily_ttl_sec);
            read_key(projects, "fallback_ttl_sec", config.fallback_ttl_sec);
            read_key(projects, "pool_ttl_sec", config.pool_ttl_sec);
            read_key(projects, "max_count", config.max_project_count);
            read_key(projects, "default_count", config.default_project_count);
            read_key(projects, "catalog_path", config.catalog_path);
        }

        if (auto generation = yaml["generation"]) {
            read_key(generation, "timeout_sec", config.generation_timeout_sec);
            read_key(generation, "max_retries", config.generation_max_retries);
            read_key(generation, "retry_backoff_ms", config.retry_backoff_ms);
            read_key(generation, "lock_ttl_sec", config.lock_ttl_sec);
            read_key(generation, "poll_interval_ms", config.poll_interval_ms);
            read_key(generation, "poll_max_attempts", config.poll_max_attempts);
        }

        if (auto llm = yaml["llm"]) {
            read_key(llm, "model_path", config.model_path);
            read_key(llm, "context_length", config.llm_context_length);
            read_key(llm, "threads", config.llm_threads);
            read_key(llm, "max_tokens", config.llm_max_tokens);
            read_key(llm, "temperature", config.llm_temperature);
            read_key(llm, "lazy_load", config.llm_lazy_load);
        }

        if (auto rate = yaml["rate_limit"]) {
            read_key(rate, "window_sec", config.rate_window_sec);
            read_key(rate, "max_requests", config.rate_max_requests);
        }

        if (yaml["log_level"]) {
            config.log_level = yaml["log_level"].as<int>();
        }

        config.expand_paths();
        std::string error = config.validate();
        if (!error.empty()) {
            LOG_ERROR("Config", "Configuration validation failed: " + error);
            return std::nullopt;
        }

        LOG_INFO("Config", "Configuration loaded from " + expanded_path);
        return config;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "YAML parse error: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool Config::save(const std::string& path) const {
    try {
        std::string expanded_path = expand_path(path);

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "socket" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << socket_path;
        out << YAML::Key << "backlog" << YAML::Value << socket_backlog;
        out << YAML::Key << "timeout_ms" << YAML::Value << socket_timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "cache" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << cache_url;
        out << YAML::Key << "op_timeout_ms" << YAML::Value << cache_op_timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "projects" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "daily_ttl_sec" << YAML::Value << daily_ttl_sec;
        out << YAML::Key << "fallback_ttl_sec" << YAML::Value << fallback_ttl_sec;
        out << YAML::Key << "pool_ttl_sec" << YAML::Value << pool_ttl_sec;
        out << YAML::Key << "max_count" << YAML::Value << max_project_count;
        out << YAML::Key << "default_count" << YAML::Value << default_project_count;
        out << YAML::Key << "catalog_path" << YAML::Value << catalog_path;
        out << YAML::EndMap;

        out << YAML::Key << "generation" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "timeout_sec" << YAML::Value << generation_timeout_sec;
        out << YAML::Key << "max_retries" << YAML::Value << generation_max_retries;
        out << YAML::Key << "retry_backoff_ms" << YAML::Value << retry_backoff_ms;
        out << YAML::Key << "lock_ttl_sec" << YAML::Value << lock_ttl_sec;
        out << YAML::Key << "poll_interval_ms" << YAML::Value << poll_interval_ms;
        out << YAML::Key << "poll_max_attempts" << YAML::Value << poll_max_attempts;
        out << YAML::EndMap;

        out << YAML::Key << "llm" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "model_path" << YAML::Value << model_path;
        out << YAML::Key << "context_length" << YAML::Value << llm_context_length;
        out << YAML::Key << "threads" << YAML::Value << llm_threads;
        out << YAML::Key << "max_tokens" << YAML::Value << llm_max_tokens;
        out << YAML::Key << "temperature" << YAML::Value << llm_temperature;
        out << YAML::Key << "lazy_load" << YAML::Value << llm_lazy_load;
        out << YAML::EndMap;

        out << YAML::Key << "rate_limit" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "window_sec" << YAML::Value << rate_window_sec;
        out << YAML::Key << "max_requests" << YAML::Value << rate_max_requests;
        out << YAML::EndMap;

        out << YAML::Key << "log_level" << YAML::Value << log_level;

        out << YAML::EndMap;

        std::ofstream file(expanded_path);
        if (!file.good()) {
            LOG_ERROR("Config", "Cannot write to " + expanded_path);
            return false;
        }

        file << out.c_str();
        LOG_INFO("Config", "Configuration saved to " + expanded_path);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "Error saving config: " + std::string(e.what()));
        return false;
    }
}

void Config::expand_paths() {
    socket_path = expand_path(socket_path);
    model_path = expand_path(model_path);
    catalog_path = expand_path(catalog_path);
}

std::string Config::validate() const {
    if (socket_backlog <= 0) {
        return "socket.backlog must be positive";
    }
    if (socket_timeout_ms <= 0) {
        return "socket.timeout_ms must be positive";
    }
    if (cache_url.empty()) {
        return "cache.url must not be empty";
    }
    if (cache_op_timeout_ms <= 0) {
        return "cache.op_timeout_ms must be positive";
    }
    if (daily_ttl_sec <= 0 || fallback_ttl_sec <= 0) {
        return "projects ttls must be positive";
    }
    if (fallback_ttl_sec > daily_ttl_sec) {
        return "projects.fallback_ttl_sec must not exceed projects.daily_ttl_sec";
    }
    if (pool_ttl_sec <= 0) {
        return "projects.pool_ttl_sec must be positive";
    }
    if (max_project_count < 1) {
        return "projects.max_count must be at least 1";
    }
    if (default_project_count < 1 || default_project_count > max_project_count) {
        return "projects.default_count must be between 1 and projects.max_count";
    }
    if (generation_timeout_sec <= 0) {
        return "generation.timeout_sec must be positive";
    }
    if (generation_max_retries < 0) {
        return "generation.max_retries must not be negative";
    }
    if (retry_backoff_ms < 0) {
        return "generation.retry_backoff_ms must not be negative";
    }
    if (lock_ttl_sec <= 0) {
        return "generation.lock_ttl_sec must be positive";
    }
    if (poll_interval_ms <= 0 || poll_max_attempts <= 0) {
        return "generation polling values must be positive";
    }
    if (llm_context_length <= 0 || llm_threads <= 0 || llm_max_tokens <= 0) {
        return "llm sizes must be positive";
    }
    if (llm_temperature < 0.0 || llm_temperature > 2.0) {
        return "llm.temperature must be between 0 and 2";
    }
    if (rate_window_sec <= 0) {
        return "rate_limit.window_sec must be positive";
    }
    if (rate_max_requests <= 0) {
        return "rate_limit.max_requests must be positive";
    }
    if (log_level < 0 || log_level > 4) {
        return "log_level must be between 0 and 4";
    }
    return "";  // Valid
}

Config Config::defaults() {
    return Config{};
}

json Config::to_json() const {
    return {
        {"socket_path", socket_path},
        {"socket_backlog", socket_backlog},
        {"socket_timeout_ms", socket_timeout_ms},
        {"cache_url", cache_url},
        {"cache_op_timeout_ms", cache_op_timeout_ms},
        {"daily_ttl_sec", daily_ttl_sec},
        {"fallback_ttl_sec", fallback_ttl_sec},
        {"pool_ttl_sec", pool_ttl_sec},
        {"max_count", max_project_count},
        {"default_count", default_project_count},
        {"catalog_path", catalog_path},
        {"generation_timeout_sec", generation_timeout_sec},
        {"generation_max_retries", generation_max_retries},
        {"lock_ttl_sec", lock_ttl_sec},
        {"model_path", model_path},
        {"llm_lazy_load", llm_lazy_load},
        {"rate_window_sec", rate_window_sec},
        {"rate_max_requests", rate_max_requests},
        {"log_level", log_level}
    };
}

OrchestratorSettings Config::orchestrator_settings() const {
    OrchestratorSettings settings;
    settings.daily_ttl = std::chrono::seconds(daily_ttl_sec);
    settings.fallback_ttl = std::chrono::seconds(fallback_ttl_sec);
    settings.pool_ttl = std::chrono::seconds(pool_ttl_sec);
    settings.max_count = max_project_count;
    settings.default_count = default_project_count;
    settings.lock_ttl = std::chrono::seconds(lock_ttl_sec);
    settings.poll_interval = std::chrono::milliseconds(poll_interval_ms);
    settings.poll_max_attempts = poll_max_attempts;
    return settings;
}

AdapterSettings Config::adapter_settings() const {
    AdapterSettings settings;
    settings.timeout = std::chrono::seconds(generation_timeout_sec);
    settings.max_retries = generation_max_retries;
    settings.retry_backoff = std::chrono::milliseconds(retry_backoff_ms);
    settings.max_tokens = llm_max_tokens;
    settings.temperature = static_cast<float>(llm_temperature);
    return settings;
}

RateLimitPolicy Config::rate_limit_policy() const {
    RateLimitPolicy policy;
    policy.window = std::chrono::seconds(rate_window_sec);
    policy.max_requests = rate_max_requests;
    return policy;
}

// ConfigManager implementation

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::load(const std::string& path) {
    Config config_copy;
    std::vector<ChangeCallback> callbacks_copy;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto loaded = Config::load(path);
        if (!loaded) {
            LOG_WARN("ConfigManager", "Using default configuration");
            config_ = Config::defaults();
            config_.expand_paths();
            return false;
        }

        config_ = *loaded;
        config_path_ = path;

        config_copy = config_;
        callbacks_copy = callbacks_;
    }

    // Outside the lock: callbacks may call get()
    notify_callbacks(callbacks_copy, config_copy);
    return true;
}

bool ConfigManager::reload() {
    std::string path_copy;
    Config config_copy;
    std::vector<ChangeCallback> callbacks_copy;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_path_.empty()) {
            LOG_WARN("ConfigManager", "No config path set, cannot reload");
            return false;
        }
        path_copy = config_path_;
    }

    auto loaded = Config::load(path_copy);
    if (!loaded) {
        LOG_ERROR("ConfigManager", "Failed to reload configuration");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_path_ != path_copy) {
            LOG_WARN("ConfigManager", "Config path changed during reload; aborting");
            return false;
        }
        config_ = *loaded;
        config_copy = config_;
        callbacks_copy = callbacks_;
    }

    notify_callbacks(callbacks_copy, config_copy);
    LOG_INFO("ConfigManager", "Configuration reloaded");
    return true;
}

Config ConfigManager::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void ConfigManager::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = Config::defaults();
    config_path_.clear();
    callbacks_.clear();
}

void ConfigManager::notify_callbacks(const std::vector<ChangeCallback>& callbacks,
                                     const Config& config) {
    for (const auto& callback : callbacks) {
        try {
            callback(config);
        } catch (const std::exception& e) {
            LOG_ERROR("ConfigManager", "Callback error: " + std::string(e.what()));
        }
    }
}

} // namespace dailyd
