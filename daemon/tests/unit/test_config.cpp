/**
 * @file test_config.cpp
 * @brief Unit tests for Config and ConfigManager
 */

#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <unistd.h>
#include "dailyd/config.h"
#include "dailyd/core/orchestrator.h"
#include "dailyd/llm/generation_adapter.h"
#include "dailyd/ratelimit/rate_limiter.h"
#include "dailyd/logger.h"

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dailyd::Logger::init(dailyd::LogLevel::ERROR, false);

        temp_dir_ = fs::temp_directory_path() / ("dailyd_test_" + std::to_string(getpid()) + "_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
        dailyd::ConfigManager::instance().reset();
        dailyd::Logger::shutdown();
    }

    fs::path temp_dir_;

    void write_config(const std::string& filename, const std::string& content) {
        std::ofstream file(temp_dir_ / filename);
        file << content;
        file.close();
    }
};

// ============================================================================
// Config::defaults() tests
// ============================================================================

TEST_F(ConfigTest, DefaultsReturnsValidConfig) {
    auto config = dailyd::Config::defaults();

    EXPECT_EQ(config.socket_path, "/run/dailyd/dailyd.sock");
    EXPECT_EQ(config.socket_backlog, 16);
    EXPECT_EQ(config.cache_url, "sqlite:///var/lib/dailyd/cache.db");
    EXPECT_EQ(config.daily_ttl_sec, 604800);
    EXPECT_EQ(config.fallback_ttl_sec, 3600);
    EXPECT_EQ(config.pool_ttl_sec, 604800);
    EXPECT_EQ(config.max_project_count, 10);
    EXPECT_EQ(config.default_project_count, 5);
    EXPECT_EQ(config.generation_timeout_sec, 30);
    EXPECT_EQ(config.log_level, 1);
}

TEST_F(ConfigTest, DefaultsPassesValidation) {
    auto config = dailyd::Config::defaults();
    std::string error = config.validate();

    EXPECT_TRUE(error.empty()) << "Validation error: " << error;
}

// ============================================================================
// Config::validate() tests
// ============================================================================

TEST_F(ConfigTest, ValidateRejectsZeroSocketBacklog) {
    auto config = dailyd::Config::defaults();
    config.socket_backlog = 0;

    std::string error = config.validate();
    EXPECT_NE(error.find("socket.backlog"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsEmptyCacheUrl) {
    auto config = dailyd::Config::defaults();
    config.cache_url = "";

    EXPECT_NE(config.validate().find("cache.url"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsFallbackTtlAboveDailyTtl) {
    auto config = dailyd::Config::defaults();
    config.daily_ttl_sec = 600;
    config.fallback_ttl_sec = 601;

    EXPECT_NE(config.validate().find("fallback_ttl_sec"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsNonPositivePoolTtl) {
    auto config = dailyd::Config::defaults();
    config.pool_ttl_sec = 0;

    EXPECT_NE(config.validate().find("pool_ttl_sec"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsDefaultCountAboveMax) {
    auto config = dailyd::Config::defaults();
    config.max_project_count = 3;
    config.default_project_count = 4;

    EXPECT_NE(config.validate().find("default_count"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsNegativeRetries) {
    auto config = dailyd::Config::defaults();
    config.generation_max_retries = -1;

    EXPECT_NE(config.validate().find("max_retries"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsTemperatureOutOfRange) {
    auto config = dailyd::Config::defaults();
    config.llm_temperature = 2.5;

    EXPECT_NE(config.validate().find("temperature"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsZeroRateLimit) {
    auto config = dailyd::Config::defaults();
    config.rate_max_requests = 0;

    EXPECT_NE(config.validate().find("rate_limit.max_requests"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsInvalidLogLevel) {
    auto config = dailyd::Config::defaults();
    config.log_level = 5;

    EXPECT_NE(config.validate().find("log_level"), std::string::npos);
}

TEST_F(ConfigTest, ValidateAcceptsAllValidLogLevels) {
    auto config = dailyd::Config::defaults();

    for (int level = 0; level <= 4; ++level) {
        config.log_level = level;
        EXPECT_TRUE(config.validate().empty()) << "Log level " << level << " should be valid";
    }
}

// ============================================================================
// Config::load() tests
// ============================================================================

TEST_F(ConfigTest, LoadReturnsNulloptForNonexistentFile) {
    auto result = dailyd::Config::load("/nonexistent/path/config.yaml");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, LoadParsesValidYaml) {
    write_config("valid.yaml", R"(
socket:
  path: /tmp/test.sock
  backlog: 32

cache:
  url: memory://
  op_timeout_ms: 250

projects:
  daily_ttl_sec: 7200
  fallback_ttl_sec: 600
  pool_ttl_sec: 86400
  max_count: 8
  default_count: 3

generation:
  timeout_sec: 10
  max_retries: 2
  lock_ttl_sec: 60

rate_limit:
  window_sec: 30
  max_requests: 5

log_level: 2
)");

    auto result = dailyd::Config::load((temp_dir_ / "valid.yaml").string());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->socket_path, "/tmp/test.sock");
    EXPECT_EQ(result->socket_backlog, 32);
    EXPECT_EQ(result->cache_url, "memory://");
    EXPECT_EQ(result->cache_op_timeout_ms, 250);
    EXPECT_EQ(result->daily_ttl_sec, 7200);
    EXPECT_EQ(result->fallback_ttl_sec, 600);
    EXPECT_EQ(result->pool_ttl_sec, 86400);
    EXPECT_EQ(result->max_project_count, 8);
    EXPECT_EQ(result->default_project_count, 3);
    EXPECT_EQ(result->generation_timeout_sec, 10);
    EXPECT_EQ(result->generation_max_retries, 2);
    EXPECT_EQ(result->lock_ttl_sec, 60);
    EXPECT_EQ(result->rate_window_sec, 30);
    EXPECT_EQ(result->rate_max_requests, 5);
    EXPECT_EQ(result->log_level, 2);
}

TEST_F(ConfigTest, LoadUsesDefaultsForMissingFields) {
    write_config("minimal.yaml", R"(
cache:
  url: memory://
)");

    auto result = dailyd::Config::load((temp_dir_ / "minimal.yaml").string());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->cache_url, "memory://");
    EXPECT_EQ(result->socket_path, "/run/dailyd/dailyd.sock");
    EXPECT_EQ(result->default_project_count, 5);
    EXPECT_EQ(result->rate_max_requests, 60);
}

TEST_F(ConfigTest, LoadReturnsNulloptForInvalidYaml) {
    write_config("invalid.yaml", R"(
socket:
  path: [invalid yaml
  not closed
)");

    auto result = dailyd::Config::load((temp_dir_ / "invalid.yaml").string());
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, LoadReturnsNulloptForWrongValueType) {
    write_config("wrong_type.yaml", R"(
projects:
  max_count: lots
)");

    auto result = dailyd::Config::load((temp_dir_ / "wrong_type.yaml").string());
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, LoadReturnsNulloptForInvalidConfig) {
    write_config("invalid_values.yaml", R"(
projects:
  daily_ttl_sec: 60
  fallback_ttl_sec: 3600
)");

    auto result = dailyd::Config::load((temp_dir_ / "invalid_values.yaml").string());
    EXPECT_FALSE(result.has_value());
}

// ============================================================================
// Config::save() tests
// ============================================================================

TEST_F(ConfigTest, SaveCreatesLoadableYamlFile) {
    auto config = dailyd::Config::defaults();
    config.socket_path = "/tmp/saved.sock";
    config.cache_url = "memory://";
    config.default_project_count = 7;

    std::string path = (temp_dir_ / "saved.yaml").string();
    ASSERT_TRUE(config.save(path));

    auto loaded = dailyd::Config::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->socket_path, "/tmp/saved.sock");
    EXPECT_EQ(loaded->cache_url, "memory://");
    EXPECT_EQ(loaded->default_project_count, 7);
}

// ============================================================================
// Derived settings
// ============================================================================

TEST_F(ConfigTest, DerivedSettingsCarryConfiguredValues) {
    auto config = dailyd::Config::defaults();
    config.daily_ttl_sec = 7200;
    config.fallback_ttl_sec = 120;
    config.pool_ttl_sec = 3600;
    config.generation_timeout_sec = 12;
    config.rate_window_sec = 30;
    config.rate_max_requests = 9;

    auto orchestrator = config.orchestrator_settings();
    EXPECT_EQ(orchestrator.daily_ttl, std::chrono::seconds(7200));
    EXPECT_EQ(orchestrator.fallback_ttl, std::chrono::seconds(120));
    EXPECT_EQ(orchestrator.pool_ttl, std::chrono::seconds(3600));
    EXPECT_EQ(orchestrator.default_count, 5);

    auto adapter = config.adapter_settings();
    EXPECT_EQ(adapter.timeout, std::chrono::milliseconds(12000));

    auto policy = config.rate_limit_policy();
    EXPECT_EQ(policy.window, std::chrono::seconds(30));
    EXPECT_EQ(policy.max_requests, 9);
}

// ============================================================================
// expand_path tests
// ============================================================================

TEST_F(ConfigTest, ExpandPathsExpandsTilde) {
    const char* home = std::getenv("HOME");
    ASSERT_NE(home, nullptr);

    auto config = dailyd::Config::defaults();
    config.catalog_path = "~/templates.yaml";
    config.expand_paths();

    EXPECT_EQ(config.catalog_path, std::string(home) + "/templates.yaml");
}

TEST_F(ConfigTest, ExpandPathHandlesEmptyAndAbsolute) {
    EXPECT_EQ(dailyd::expand_path(""), "");
    EXPECT_EQ(dailyd::expand_path("/etc/dailyd"), "/etc/dailyd");
}

// ============================================================================
// ConfigManager tests
// ============================================================================

TEST_F(ConfigTest, ConfigManagerReturnsSameInstance) {
    auto& a = dailyd::ConfigManager::instance();
    auto& b = dailyd::ConfigManager::instance();
    EXPECT_EQ(&a, &b);
}

TEST_F(ConfigTest, ConfigManagerLoadReturnsDefaultsOnFailure) {
    auto& manager = dailyd::ConfigManager::instance();

    EXPECT_FALSE(manager.load("/nonexistent/config.yaml"));
    EXPECT_EQ(manager.get().socket_path, "/run/dailyd/dailyd.sock");
}

TEST_F(ConfigTest, ConfigManagerReloadPicksUpChangesAndNotifies) {
    write_config("reload.yaml", R"(
projects:
  default_count: 2
)");
    auto& manager = dailyd::ConfigManager::instance();
    std::string path = (temp_dir_ / "reload.yaml").string();
    ASSERT_TRUE(manager.load(path));
    EXPECT_EQ(manager.get().default_project_count, 2);

    int notified = 0;
    manager.on_change([&notified](const dailyd::Config&) { notified++; });

    write_config("reload.yaml", R"(
projects:
  default_count: 4
)");
    ASSERT_TRUE(manager.reload());
    EXPECT_EQ(manager.get().default_project_count, 4);
    EXPECT_EQ(notified, 1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
