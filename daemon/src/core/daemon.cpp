/**
 * @file daemon.cpp
 * @brief Main daemon implementation
 */

#include "dailyd/core/daemon.h"
#include "dailyd/logger.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <thread>
#include <signal.h>
#include <systemd/sd-daemon.h>

namespace dailyd {

// Signal handlers only set flags; the main loop acts on them
static volatile sig_atomic_t g_shutdown_requested = 0;
static volatile sig_atomic_t g_reload_requested = 0;

static void signal_handler(int sig) {
    if (sig == SIGTERM || sig == SIGINT) {
        g_shutdown_requested = 1;
    } else if (sig == SIGHUP) {
        g_reload_requested = 1;
    }
}

// Main loop tick; short enough that IPC shutdown requests are honored promptly
static constexpr auto EVENT_LOOP_INTERVAL = std::chrono::milliseconds(200);
static constexpr int WATCHDOG_EVERY_TICKS = 25;

Daemon& Daemon::instance() {
    static Daemon instance;
    return instance;
}

bool Daemon::initialize(const std::string& config_path) {
    LOG_INFO("Daemon", "Initializing dailyd version " + std::string(VERSION));

    auto& config_mgr = ConfigManager::instance();
    if (!config_mgr.load(config_path)) {
        // A missing file is fine (defaults); an invalid one is not
        std::error_code ec;
        if (std::filesystem::exists(config_path, ec)) {
            LOG_ERROR("Daemon", "Invalid configuration in " + config_path);
            return false;
        }
        LOG_WARN("Daemon", "Using default configuration");
    }

    apply_log_level(config_mgr.get());
    setup_signals();

    LOG_INFO("Daemon", "Initialization complete");
    return true;
}

int Daemon::run() {
    auto startup_start = std::chrono::steady_clock::now();
    LOG_INFO("Daemon", "Starting daemon");
    start_time_ = startup_start;

    if (!start_services()) {
        LOG_ERROR("Daemon", "Failed to start services");
        return 1;
    }

    running_ = true;
    notify_ready();

    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - startup_start);
    char buf[32];
    snprintf(buf, sizeof(buf), "%.3f", elapsed_us.count() / 1000.0);
    LOG_INFO("Daemon", "Startup completed in " + std::string(buf) + "ms");

    int tick = 0;
    while (!shutdown_requested_.load(std::memory_order_relaxed)) {
        event_loop();
        if (++tick % WATCHDOG_EVERY_TICKS == 0) {
            notify_watchdog();
        }
        std::this_thread::sleep_for(EVENT_LOOP_INTERVAL);
    }

    LOG_INFO("Daemon", "Shutdown requested, stopping services");
    notify_stopping();
    stop_services();
    running_ = false;

    LOG_INFO("Daemon", "Daemon stopped");
    return 0;
}

void Daemon::request_shutdown() {
    shutdown_requested_.store(true, std::memory_order_relaxed);
}

void Daemon::register_service(std::unique_ptr<Service> service) {
    LOG_DEBUG("Daemon", "Registering service: " + std::string(service->name()));
    std::unique_lock<std::shared_mutex> lock(services_mutex_);
    services_.push_back(std::move(service));
}

Config Daemon::config() const {
    return ConfigManager::instance().get();
}

std::chrono::seconds Daemon::uptime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);
}

void Daemon::notify_ready() {
    sd_notify(0, "READY=1\nSTATUS=Serving daily projects");
    LOG_DEBUG("Daemon", "Notified systemd: READY");
}

void Daemon::notify_stopping() {
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down");
    LOG_DEBUG("Daemon", "Notified systemd: STOPPING");
}

void Daemon::notify_watchdog() {
    sd_notify(0, "WATCHDOG=1");
}

bool Daemon::reload_config() {
    LOG_INFO("Daemon", "Reloading configuration");
    if (!ConfigManager::instance().reload()) {
        LOG_ERROR("Daemon", "Failed to reload configuration");
        return false;
    }
    apply_log_level(ConfigManager::instance().get());
    LOG_INFO("Daemon", "Configuration reloaded successfully");
    return true;
}

void Daemon::reset() {
    stop_services();

    {
        std::unique_lock<std::shared_mutex> lock(services_mutex_);
        services_.clear();
    }

    g_shutdown_requested = 0;
    g_reload_requested = 0;
    shutdown_requested_.store(false, std::memory_order_relaxed);
    running_.store(false, std::memory_order_relaxed);
    start_time_ = std::chrono::steady_clock::time_point{};

    LOG_DEBUG("Daemon", "Daemon state reset");
}

void Daemon::apply_log_level(const Config& config) {
    Logger::set_level(Logger::level_from_int(config.log_level));
}

void Daemon::setup_signals() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    // Clients may hang up before their response is written
    signal(SIGPIPE, SIG_IGN);

    LOG_DEBUG("Daemon", "Signal handlers installed");
}

bool Daemon::start_services() {
    std::vector<Service*> ordered;
    {
        std::unique_lock<std::shared_mutex> lock(services_mutex_);
        std::stable_sort(services_.begin(), services_.end(),
            [](const auto& a, const auto& b) {
                return a->priority() > b->priority();
            });
        for (const auto& service : services_) {
            ordered.push_back(service.get());
        }
    }

    for (auto* service : ordered) {
        LOG_INFO("Daemon", "Starting service: " + std::string(service->name()));
        if (!service->start()) {
            LOG_ERROR("Daemon", "Failed to start service: " + std::string(service->name()));
            stop_services();
            return false;
        }
    }
    return true;
}

void Daemon::stop_services() {
    std::vector<Service*> reversed;
    {
        std::shared_lock<std::shared_mutex> lock(services_mutex_);
        for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
            reversed.push_back(it->get());
        }
    }

    for (auto* service : reversed) {
        if (service->is_running()) {
            LOG_INFO("Daemon", "Stopping service: " + std::string(service->name()));
            service->stop();
        }
    }
}

void Daemon::event_loop() {
    if (g_shutdown_requested) {
        g_shutdown_requested = 0;
        LOG_INFO("Daemon", "Received shutdown signal");
        request_shutdown();
        return;
    }

    if (g_reload_requested) {
        g_reload_requested = 0;
        LOG_INFO("Daemon", "Received SIGHUP, reloading configuration");
        reload_config();
    }

    std::shared_lock<std::shared_mutex> lock(services_mutex_);
    for (const auto& service : services_) {
        if (service->is_running() && !service->is_healthy()) {
            LOG_WARN("Daemon", "Service unhealthy: " + std::string(service->name()));
        }
    }
}

} // namespace dailyd
