/**
 * @file daemon.h
 * @brief Main daemon class - coordinates all services
 */

#pragma once

#include "dailyd/core/service.h"
#include "dailyd/config.h"
#include "dailyd/common.h"
#include <memory>
#include <vector>
#include <atomic>
#include <chrono>
#include <shared_mutex>

namespace dailyd {

/**
 * @brief Main daemon coordinator
 *
 * Singleton that owns the registered services, handles signals and
 * coordinates graceful shutdown.
 */
class Daemon {
public:
    static Daemon& instance();

    /**
     * @brief Load configuration and install signal handlers
     * @param config_path Path to YAML configuration file
     * @return false if the file exists but is invalid
     */
    bool initialize(const std::string& config_path);

    /**
     * @brief Run the daemon main loop
     * @return Exit code (0 = success)
     *
     * Blocks until shutdown is requested.
     */
    int run();

    void request_shutdown();

    bool is_running() const { return running_.load(); }
    bool shutdown_requested() const { return shutdown_requested_.load(); }

    void register_service(std::unique_ptr<Service> service);

    /**
     * @brief Get service by type
     * @return Pointer to service or nullptr if not found
     */
    template<typename T>
    T* get_service() {
        std::shared_lock<std::shared_mutex> lock(services_mutex_);
        for (auto& svc : services_) {
            if (auto* ptr = dynamic_cast<T*>(svc.get())) {
                return ptr;
            }
        }
        return nullptr;
    }

    /**
     * @brief Current configuration (copy)
     */
    Config config() const;

    std::chrono::seconds uptime() const;

    // systemd notifications
    void notify_ready();
    void notify_stopping();
    void notify_watchdog();

    /**
     * @brief Reload configuration from the path given to initialize()
     *
     * Only the log level is re-applied to a running daemon; cache, TTL and
     * generation settings take effect on restart.
     */
    bool reload_config();

    /**
     * @brief Stop services and clear all state so the daemon can run again
     *
     * Only call while run() is not executing.
     */
    void reset();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

private:
    Daemon() = default;

    std::vector<std::unique_ptr<Service>> services_;
    mutable std::shared_mutex services_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::chrono::steady_clock::time_point start_time_;

    void setup_signals();
    void apply_log_level(const Config& config);

    /**
     * @brief Start services in priority order
     * @return false (with already-started services stopped) on first failure
     */
    bool start_services();
    void stop_services();

    /**
     * @brief One main loop iteration: signals, health, watchdog
     */
    void event_loop();
};

} // namespace dailyd
