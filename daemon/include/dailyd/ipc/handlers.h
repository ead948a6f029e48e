/**
 * @file handlers.h
 * @brief IPC request handlers
 */

#pragma once

#include "dailyd/ipc/server.h"
#include "dailyd/ipc/protocol.h"
#include <memory>

namespace dailyd {

class ProjectOrchestrator;

/**
 * @brief IPC request handlers
 *
 * Thin mapping from JSON-RPC methods to orchestrator calls. Validation
 * errors, missing projects and cache outages become error responses.
 */
class Handlers {
public:
    /**
     * @brief Register all handlers with IPC server and install its rate limit check
     */
    static void register_all(IPCServer& server, std::shared_ptr<ProjectOrchestrator> orchestrator);

private:
    static Response handle_ping(const Request& req);
    static Response handle_version(const Request& req);

    // Projects
    static Response handle_daily_get(const Request& req, ProjectOrchestrator& orchestrator);
    static Response handle_projects_generate(const Request& req, ProjectOrchestrator& orchestrator);
    static Response handle_projects_get(const Request& req, ProjectOrchestrator& orchestrator);
    static Response handle_projects_archive(const Request& req, ProjectOrchestrator& orchestrator);
    static Response handle_cache_clear(const Request& req, ProjectOrchestrator& orchestrator);

    // Status
    static Response handle_health(const Request& req, ProjectOrchestrator& orchestrator);
    static Response handle_stats(const Request& req, ProjectOrchestrator& orchestrator);

    // Project pool
    static Response handle_pool_stats(const Request& req, ProjectOrchestrator& orchestrator);
    static Response handle_pool_clear(const Request& req, ProjectOrchestrator& orchestrator);
    static Response handle_pool_seed(const Request& req, ProjectOrchestrator& orchestrator);

    // Config handlers
    static Response handle_config_get(const Request& req);
    static Response handle_config_reload(const Request& req);

    // Daemon control
    static Response handle_shutdown(const Request& req);
};

} // namespace dailyd
