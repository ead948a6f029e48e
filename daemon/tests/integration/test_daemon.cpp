/**
 * @file test_daemon.cpp
 * @brief Integration tests for Daemon lifecycle and service management
 */

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <atomic>
#include <mutex>
#include <vector>
#include <unistd.h>
#include "dailyd/core/daemon.h"
#include "dailyd/core/service.h"
#include "dailyd/config.h"
#include "dailyd/logger.h"
#include "dailyd/ipc/server.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

/**
 * @brief Records the order services were started and stopped in
 */
struct LifecycleLog {
    std::mutex mutex;
    std::vector<std::string> events;

    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }
};

/**
 * @brief Mock service for testing service lifecycle
 */
class MockService : public dailyd::Service {
public:
    MockService(const std::string& name, int priority = 0, LifecycleLog* log = nullptr)
        : name_(name), priority_(priority), log_(log) {}

    bool start() override {
        if (should_fail_start_) return false;
        running_ = true;
        start_count_++;
        if (log_) log_->add("start:" + name_);
        return true;
    }

    void stop() override {
        running_ = false;
        stop_count_++;
        if (log_) log_->add("stop:" + name_);
    }

    const char* name() const override { return name_.c_str(); }
    int priority() const override { return priority_; }
    bool is_running() const override { return running_; }
    bool is_healthy() const override { return healthy_ && running_; }

    void set_should_fail_start(bool fail) { should_fail_start_ = fail; }
    void set_healthy(bool healthy) { healthy_ = healthy; }

    int start_count() const { return start_count_; }
    int stop_count() const { return stop_count_; }

private:
    std::string name_;
    int priority_;
    LifecycleLog* log_;
    std::atomic<bool> running_{false};
    bool should_fail_start_ = false;
    std::atomic<bool> healthy_{true};
    std::atomic<int> start_count_{0};
    std::atomic<int> stop_count_{0};
};

class DaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        dailyd::Logger::init(dailyd::LogLevel::ERROR, false);

        temp_dir_ = fs::temp_directory_path() / ("dailyd_daemon_test_" + std::to_string(getpid()));
        fs::create_directories(temp_dir_);

        config_path_ = (temp_dir_ / "config.yaml").string();
        socket_path_ = (temp_dir_ / "test.sock").string();

        write_config(1);
    }

    void TearDown() override {
        dailyd::Daemon::instance().reset();
        dailyd::ConfigManager::instance().reset();

        fs::remove_all(temp_dir_);
        dailyd::Logger::shutdown();
    }

    void write_config(int log_level) {
        std::ofstream config_file(config_path_);
        config_file << R"(
socket:
  path: )" << socket_path_ << R"(
  backlog: 16
  timeout_ms: 5000

cache:
  url: memory://

rate_limit:
  window_sec: 60
  max_requests: 100

log_level: )" << log_level << "\n";
    }

    fs::path temp_dir_;
    std::string config_path_;
    std::string socket_path_;
};

// ============================================================================
// Singleton tests
// ============================================================================

TEST_F(DaemonTest, InstanceReturnsSameDaemon) {
    auto& daemon1 = dailyd::Daemon::instance();
    auto& daemon2 = dailyd::Daemon::instance();

    EXPECT_EQ(&daemon1, &daemon2);
}

// ============================================================================
// Initialization tests
// ============================================================================

TEST_F(DaemonTest, InitializeWithValidConfig) {
    EXPECT_TRUE(dailyd::Daemon::instance().initialize(config_path_));
}

TEST_F(DaemonTest, InitializeWithNonexistentConfigUsesDefaults) {
    auto& daemon = dailyd::Daemon::instance();

    EXPECT_TRUE(daemon.initialize((temp_dir_ / "missing.yaml").string()));
    EXPECT_EQ(daemon.config().cache_url, dailyd::DEFAULT_CACHE_URL);
}

TEST_F(DaemonTest, InitializeRejectsInvalidConfig) {
    std::ofstream config_file(config_path_);
    config_file << "projects:\n  default_count: 50\n";
    config_file.close();

    EXPECT_FALSE(dailyd::Daemon::instance().initialize(config_path_));
}

TEST_F(DaemonTest, ConfigIsLoadedAfterInitialize) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    auto config = daemon.config();
    EXPECT_EQ(config.socket_path, socket_path_);
    EXPECT_EQ(config.cache_url, "memory://");
}

// ============================================================================
// Shutdown request tests
// ============================================================================

TEST_F(DaemonTest, RequestShutdownSetsFlag) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    daemon.request_shutdown();

    EXPECT_TRUE(daemon.shutdown_requested());
}

TEST_F(DaemonTest, ResetClearsShutdownFlag) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.request_shutdown();

    daemon.reset();

    EXPECT_FALSE(daemon.shutdown_requested());
}

// ============================================================================
// Service registration tests
// ============================================================================

TEST_F(DaemonTest, RegisterServiceAddsService) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    auto mock = std::make_unique<MockService>("TestService", 50);
    MockService* mock_ptr = mock.get();

    daemon.register_service(std::move(mock));

    EXPECT_EQ(daemon.get_service<MockService>(), mock_ptr);
}

TEST_F(DaemonTest, GetServiceReturnsNullptrForUnregistered) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    EXPECT_EQ(daemon.get_service<dailyd::IPCServer>(), nullptr);
}

// ============================================================================
// Run loop tests
// ============================================================================

TEST_F(DaemonTest, RunReturnsOnShutdownRequest) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    auto mock = std::make_unique<MockService>("Worker");
    MockService* mock_ptr = mock.get();
    daemon.register_service(std::move(mock));

    std::atomic<int> exit_code{-1};
    std::thread runner([&] { exit_code = daemon.run(); });

    for (int i = 0; i < 100 && !daemon.is_running(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(daemon.is_running());
    EXPECT_TRUE(mock_ptr->is_running());

    daemon.request_shutdown();
    runner.join();

    EXPECT_EQ(exit_code.load(), 0);
    EXPECT_FALSE(daemon.is_running());
    EXPECT_EQ(mock_ptr->stop_count(), 1);
}

TEST_F(DaemonTest, RunFailsWhenServiceFailsToStart) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    auto healthy = std::make_unique<MockService>("Healthy", 20);
    MockService* healthy_ptr = healthy.get();
    auto failing = std::make_unique<MockService>("Failing", 10);
    failing->set_should_fail_start(true);

    daemon.register_service(std::move(healthy));
    daemon.register_service(std::move(failing));

    EXPECT_EQ(daemon.run(), 1);
    EXPECT_FALSE(daemon.is_running());
    // The service that did start is stopped again
    EXPECT_EQ(healthy_ptr->start_count(), 1);
    EXPECT_FALSE(healthy_ptr->is_running());
}

TEST_F(DaemonTest, ServicesStartByPriorityAndStopInReverse) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    LifecycleLog log;
    daemon.register_service(std::make_unique<MockService>("Low", 10, &log));
    daemon.register_service(std::make_unique<MockService>("High", 100, &log));
    daemon.register_service(std::make_unique<MockService>("Mid", 50, &log));

    daemon.request_shutdown();
    EXPECT_EQ(daemon.run(), 0);

    std::vector<std::string> expected = {
        "start:High", "start:Mid", "start:Low",
        "stop:Low", "stop:Mid", "stop:High"
    };
    EXPECT_EQ(log.events, expected);
}

TEST_F(DaemonTest, UptimeGrowsWhileRunning) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    std::thread runner([&] { daemon.run(); });
    for (int i = 0; i < 100 && !daemon.is_running(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    std::this_thread::sleep_for(1100ms);

    EXPECT_GE(daemon.uptime().count(), 1);

    daemon.request_shutdown();
    runner.join();
}

// ============================================================================
// Config reload tests
// ============================================================================

TEST_F(DaemonTest, ReloadConfigWorks) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);
    EXPECT_EQ(daemon.config().log_level, 1);

    write_config(2);

    EXPECT_TRUE(daemon.reload_config());
    EXPECT_EQ(daemon.config().log_level, 2);
}

TEST_F(DaemonTest, ReloadKeepsOldConfigWhenFileBecomesInvalid) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    std::ofstream config_file(config_path_);
    config_file << "socket: [unclosed\n";
    config_file.close();

    EXPECT_FALSE(daemon.reload_config());
    EXPECT_EQ(daemon.config().socket_path, socket_path_);
}

TEST_F(DaemonTest, ReloadBeforeInitFails) {
    EXPECT_FALSE(dailyd::Daemon::instance().reload_config());
}

// ============================================================================
// Thread safety tests
// ============================================================================

TEST_F(DaemonTest, ConfigAccessIsThreadSafe) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    std::atomic<int> read_count{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 10; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                auto config = daemon.config();
                if (config.socket_path == socket_path_) {
                    read_count++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(read_count.load(), 1000);
}

TEST_F(DaemonTest, ServiceLookupIsThreadSafe) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    std::atomic<int> found{0};
    std::vector<std::thread> threads;
    threads.emplace_back([&] {
        for (int i = 0; i < 50; ++i) {
            daemon.register_service(std::make_unique<MockService>("Svc" + std::to_string(i)));
        }
    });
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                if (daemon.get_service<MockService>() != nullptr) {
                    found++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_NE(daemon.get_service<MockService>(), nullptr);
    EXPECT_LE(found.load(), 800);
}

// ============================================================================
// systemd notifications (no NOTIFY_SOCKET in the test environment)
// ============================================================================

TEST_F(DaemonTest, NotificationsWithoutSystemdAreHarmless) {
    auto& daemon = dailyd::Daemon::instance();
    daemon.initialize(config_path_);

    daemon.notify_ready();
    daemon.notify_watchdog();
    daemon.notify_stopping();

    EXPECT_FALSE(daemon.is_running());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
