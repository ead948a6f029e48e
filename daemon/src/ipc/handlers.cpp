/**
 * @file handlers.cpp
 * @brief IPC request handler implementations
 */

#include "dailyd/ipc/handlers.h"
#include "dailyd/config.h"
#include "dailyd/core/daemon.h"
#include "dailyd/core/orchestrator.h"
#include "dailyd/errors.h"
#include "dailyd/logger.h"
#include <algorithm>

namespace dailyd {

namespace {

using OrchestratorHandler = Response (*)(const Request&, ProjectOrchestrator&);

// Maps the engine's error types onto response codes
Response guarded(const Request& req, ProjectOrchestrator& orchestrator, OrchestratorHandler handler) {
    try {
        return handler(req, orchestrator);
    } catch (const ValidationError& e) {
        return Response::err(e.what(), ErrorCodes::VALIDATION_ERROR, {{"field", e.field()}});
    } catch (const CacheUnavailable& e) {
        LOG_WARN("Handlers", req.method + ": " + e.what());
        return Response::err(e.what(), ErrorCodes::CACHE_UNAVAILABLE);
    } catch (const json::exception& e) {
        return Response::err(std::string("Invalid params: ") + e.what(), ErrorCodes::INVALID_PARAMS);
    }
}

std::optional<std::string> optional_string(const json& params, const char* field) {
    auto it = params.find(field);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ValidationError(field, "must be a string");
    }
    return it->get<std::string>();
}

int optional_int(const json& params, const char* field, int fallback) {
    auto it = params.find(field);
    if (it == params.end() || it->is_null()) {
        return fallback;
    }
    return checked_int(*it, field);
}

bool optional_bool(const json& params, const char* field) {
    auto it = params.find(field);
    if (it == params.end() || it->is_null()) {
        return false;
    }
    if (!it->is_boolean()) {
        throw ValidationError(field, "must be a boolean");
    }
    return it->get<bool>();
}

} // namespace

void Handlers::register_all(IPCServer& server, std::shared_ptr<ProjectOrchestrator> orchestrator) {
    server.register_handler(Methods::PING, [](const Request& req) {
        return handle_ping(req);
    });

    server.register_handler(Methods::VERSION, [](const Request& req) {
        return handle_version(req);
    });

    server.register_handler(Methods::CONFIG_GET, [](const Request& req) {
        return handle_config_get(req);
    });

    server.register_handler(Methods::CONFIG_RELOAD, [](const Request& req) {
        return handle_config_reload(req);
    });

    server.register_handler(Methods::SHUTDOWN, [](const Request& req) {
        return handle_shutdown(req);
    });

    int handler_count = 5;

    if (orchestrator) {
        const std::pair<const char*, OrchestratorHandler> routes[] = {
            {Methods::DAILY_GET, &Handlers::handle_daily_get},
            {Methods::PROJECTS_GENERATE, &Handlers::handle_projects_generate},
            {Methods::PROJECTS_GET, &Handlers::handle_projects_get},
            {Methods::PROJECTS_ARCHIVE, &Handlers::handle_projects_archive},
            {Methods::CACHE_CLEAR, &Handlers::handle_cache_clear},
            {Methods::HEALTH, &Handlers::handle_health},
            {Methods::STATS, &Handlers::handle_stats},
            {Methods::POOL_STATS, &Handlers::handle_pool_stats},
            {Methods::POOL_CLEAR, &Handlers::handle_pool_clear},
            {Methods::POOL_SEED, &Handlers::handle_pool_seed},
        };
        for (const auto& route : routes) {
            OrchestratorHandler handler = route.second;
            server.register_handler(route.first, [orchestrator, handler](const Request& req) {
                return guarded(req, *orchestrator, handler);
            });
            handler_count++;
        }

        server.set_admission([orchestrator](const std::string& caller) {
            return orchestrator->admit_request(caller);
        });
    }

    LOG_INFO("Handlers", "Registered " + std::to_string(handler_count) + " IPC handlers");
}

Response Handlers::handle_ping(const Request& /*req*/) {
    return Response::ok({{"pong", true}});
}

Response Handlers::handle_version(const Request& /*req*/) {
    return Response::ok({
        {"version", VERSION},
        {"name", NAME}
    });
}

Response Handlers::handle_daily_get(const Request& req, ProjectOrchestrator& orchestrator) {
    auto date = optional_string(req.params, "date");
    int count = optional_int(req.params, "count", orchestrator.settings().default_count);
    bool force = optional_bool(req.params, "force_regenerate");

    DailyBatch batch = orchestrator.get_daily(date, count, force);
    return Response::ok(batch.to_json());
}

Response Handlers::handle_projects_generate(const Request& req, ProjectOrchestrator& orchestrator) {
    GenerationRequest request = GenerationRequest::from_json(req.params);
    auto projects = orchestrator.generate_custom(request);

    json items = json::array();
    for (const auto& p : projects) {
        items.push_back(p.to_json());
    }
    return Response::ok({
        {"projects", items},
        {"count", items.size()}
    });
}

Response Handlers::handle_projects_get(const Request& req, ProjectOrchestrator& orchestrator) {
    auto id = optional_string(req.params, "id");
    if (!id || id->empty()) {
        throw ValidationError("id", "is required");
    }

    auto project = orchestrator.get_by_id(*id);
    if (!project) {
        return Response::err("Project not found: " + *id, ErrorCodes::NOT_FOUND);
    }
    return Response::ok(project->to_json());
}

Response Handlers::handle_projects_archive(const Request& req, ProjectOrchestrator& orchestrator) {
    int days = optional_int(req.params, "days", 7);

    json entries = json::array();
    for (const auto& entry : orchestrator.archive(days)) {
        entries.push_back(entry.to_json());
    }
    return Response::ok({
        {"archive", entries},
        {"days", std::min(days, MAX_ARCHIVE_DAYS)}
    });
}

Response Handlers::handle_cache_clear(const Request& req, ProjectOrchestrator& orchestrator) {
    auto date = optional_string(req.params, "date");
    size_t removed = orchestrator.invalidate(date);
    return Response::ok({
        {"removed", removed},
        {"scope", date ? *date : "all"}
    });
}

Response Handlers::handle_health(const Request& /*req*/, ProjectOrchestrator& orchestrator) {
    return Response::ok(orchestrator.health().to_json());
}

Response Handlers::handle_stats(const Request& /*req*/, ProjectOrchestrator& orchestrator) {
    return Response::ok(orchestrator.stats().to_json());
}

Response Handlers::handle_pool_stats(const Request& /*req*/, ProjectOrchestrator& orchestrator) {
    return Response::ok(orchestrator.pool_stats().to_json());
}

Response Handlers::handle_pool_clear(const Request& /*req*/, ProjectOrchestrator& orchestrator) {
    return Response::ok({{"removed", orchestrator.clear_pool()}});
}

Response Handlers::handle_pool_seed(const Request& req, ProjectOrchestrator& orchestrator) {
    int count = optional_int(req.params, "count", orchestrator.settings().default_count);

    PoolSeedResult result = orchestrator.seed_pool(count);
    if (!result.ok()) {
        return Response::err("Generation unavailable: " + result.error,
                             ErrorCodes::GENERATION_UNAVAILABLE, result.to_json());
    }
    return Response::ok(result.to_json());
}

Response Handlers::handle_config_get(const Request& /*req*/) {
    return Response::ok(ConfigManager::instance().get().to_json());
}

Response Handlers::handle_config_reload(const Request& /*req*/) {
    if (Daemon::instance().reload_config()) {
        return Response::ok({{"reloaded", true}});
    }
    return Response::err("Failed to reload configuration", ErrorCodes::CONFIG_ERROR);
}

Response Handlers::handle_shutdown(const Request& /*req*/) {
    LOG_INFO("Handlers", "Shutdown requested via IPC");
    Daemon::instance().request_shutdown();
    return Response::ok({{"shutdown", "initiated"}});
}

} // namespace dailyd
