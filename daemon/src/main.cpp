/**
 * @file main.cpp
 * @brief dailyd daemon entry point
 */

#include "dailyd/core/daemon.h"
#include "dailyd/core/orchestrator.h"
#include "dailyd/cache/cache_store.h"
#include "dailyd/fallback/template_catalog.h"
#include "dailyd/llm/generation_adapter.h"
#include "dailyd/llm/llama_backend.h"
#include "dailyd/ratelimit/rate_limiter.h"
#include "dailyd/ipc/server.h"
#include "dailyd/ipc/handlers.h"
#include "dailyd/logger.h"
#include "dailyd/config.h"
#include "dailyd/common.h"
#include <iostream>
#include <getopt.h>
#include <memory>

using namespace dailyd;

void print_version() {
    std::cout << NAME << " " << VERSION << std::endl;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n"
              << "Daily project idea daemon\n\n"
              << "Options:\n"
              << "  -c, --config PATH    Configuration file path\n"
              << "                       (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -v, --verbose        Enable debug logging\n"
              << "  -f, --foreground     Run in foreground (log to stderr)\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version information\n"
              << "\n"
              << "systemd integration:\n"
              << "  systemctl start dailyd        Start the daemon\n"
              << "  systemctl reload dailyd       Reload configuration (SIGHUP)\n"
              << "  journalctl -u dailyd -f       View logs\n"
              << std::endl;
}

static std::shared_ptr<const TemplateCatalog> load_catalog(const Config& config) {
    if (!config.catalog_path.empty()) {
        auto loaded = TemplateCatalog::load(config.catalog_path);
        if (loaded) {
            LOG_INFO("main", "Loaded " + std::to_string(loaded->size()) +
                     " templates from " + config.catalog_path);
            return std::make_shared<const TemplateCatalog>(std::move(*loaded));
        }
        LOG_WARN("main", "Falling back to built-in templates");
    }
    return std::make_shared<const TemplateCatalog>(TemplateCatalog::builtin());
}

int main(int argc, char* argv[]) {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool verbose = false;
    bool foreground = false;

    static struct option long_options[] = {
        {"config",     required_argument, nullptr, 'c'},
        {"verbose",    no_argument,       nullptr, 'v'},
        {"foreground", no_argument,       nullptr, 'f'},
        {"help",       no_argument,       nullptr, 'h'},
        {"version",    no_argument,       nullptr, 'V'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:vfhV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'f':
                foreground = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case 'V':
                print_version();
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    Logger::init(verbose ? LogLevel::DEBUG : LogLevel::INFO, !foreground);
    LOG_INFO("main", "dailyd starting - version " + std::string(VERSION));

    auto& daemon = Daemon::instance();
    if (!daemon.initialize(config_path)) {
        LOG_ERROR("main", "Failed to initialize daemon");
        Logger::shutdown();
        return 1;
    }
    if (verbose) {
        Logger::set_level(LogLevel::DEBUG);
    }

    const auto config = ConfigManager::instance().get();

    std::shared_ptr<ProjectOrchestrator> orchestrator;
    try {
        auto cache = make_cache_store(config.cache_url,
                                      std::chrono::milliseconds(config.cache_op_timeout_ms));
        auto catalog = load_catalog(config);

        auto generator = std::make_shared<LlamaGenerator>(
            config.model_path, config.llm_context_length, config.llm_threads, config.llm_lazy_load);
        auto adapter = std::make_shared<GenerationAdapter>(generator, catalog, config.adapter_settings());

        auto limiter = std::make_shared<RateLimiter>(cache, config.rate_limit_policy());
        orchestrator = std::make_shared<ProjectOrchestrator>(
            cache, adapter, catalog, limiter, config.orchestrator_settings());
    } catch (const std::exception& e) {
        LOG_ERROR("main", "Failed to build project engine: " + std::string(e.what()));
        Logger::shutdown();
        return 1;
    }

    auto ipc_server = std::make_unique<IPCServer>(
        config.socket_path, config.socket_backlog, config.socket_timeout_ms);
    Handlers::register_all(*ipc_server, orchestrator);

    daemon.register_service(std::move(ipc_server));

    int exit_code = daemon.run();

    LOG_INFO("main", "dailyd shutdown complete");
    Logger::shutdown();

    return exit_code;
}
