/**
 * @file orchestrator.h
 * @brief Daily batch serving, single-flight generation and fallback
 */

#pragma once

#include "dailyd/cache/cache_store.h"
#include "dailyd/fallback/template_catalog.h"
#include "dailyd/llm/generation_adapter.h"
#include "dailyd/models/project.h"
#include "dailyd/ratelimit/rate_limiter.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dailyd {

/**
 * @brief Per-request state for one (date, count) key
 */
enum class GenerationState {
    IDLE,
    SERVED,
    GENERATING,
    WAITING
};

const char* to_string(GenerationState state);

struct OrchestratorSettings {
    std::chrono::seconds daily_ttl{DEFAULT_DAILY_TTL_SEC};
    std::chrono::seconds fallback_ttl{DEFAULT_FALLBACK_TTL_SEC};
    int max_count = DEFAULT_MAX_PROJECT_COUNT;
    int default_count = DEFAULT_PROJECT_COUNT;
    std::chrono::seconds lock_ttl{DEFAULT_LOCK_TTL_SEC};
    std::chrono::milliseconds poll_interval{DEFAULT_POLL_INTERVAL_MS};
    int poll_max_attempts = DEFAULT_POLL_MAX_ATTEMPTS;
    std::chrono::seconds pool_ttl{DEFAULT_POOL_TTL_SEC};
};

/**
 * @brief Counters read back from the cache
 */
struct StatsSnapshot {
    int64_t total_generated = 0;
    int64_t ai_sourced = 0;
    int64_t fallback_sourced = 0;
    int64_t degraded = 0;
    int64_t cache_hits = 0;
    int64_t cache_misses = 0;
    int64_t generation_unavailable = 0;
    int64_t project_pool_size = 0;
    double cache_hit_ratio = 0.0;
    bool available = true;  // false when the cache could not be read

    json to_json() const;
};

/**
 * @brief Summary of one past day
 */
struct ArchiveEntry {
    std::string date;
    std::vector<Project> projects;  // first three of the largest batch
    size_t total = 0;

    json to_json() const;
};

struct PoolStats {
    size_t pool_size = 0;

    bool pool_available() const { return pool_size > 0; }
    json to_json() const;
};

/**
 * @brief Outcome of an explicit pool seeding run
 */
struct PoolSeedResult {
    int requested = 0;
    size_t generated = 0;  // AI projects returned by the generator
    size_t added = 0;      // of those, newly stored (titles not already pooled)
    size_t pool_size = 0;
    std::string error;     // set when generation was unavailable

    bool ok() const { return error.empty(); }
    json to_json() const;
};

struct HealthReport {
    bool cache_reachable = false;
    std::string cache_backend;
    bool generator_available = false;
    std::string generator;

    bool healthy() const { return cache_reachable && generator_available; }
    json to_json() const;
};

/**
 * @brief Engine facade
 *
 * Every cross-request decision goes through the cache store: batches under
 * daily:<date>:<count>, generation locks under lock:daily:<date>:<count>
 * counters under stats:<name> and pooled AI projects under pool:<hash>.
 * Nothing here is cached in process memory, so several daemons can share
 * one store.
 *
 * The pool keeps every AI project served for pool_ttl and is drawn from
 * before the template catalog when generation is unavailable.
 */
class ProjectOrchestrator {
public:
    ProjectOrchestrator(std::shared_ptr<CacheStore> cache,
                        std::shared_ptr<GenerationAdapter> adapter,
                        std::shared_ptr<const TemplateCatalog> catalog,
                        std::shared_ptr<RateLimiter> limiter,
                        OrchestratorSettings settings,
                        Clock clock = system_clock_source());

    /**
     * @brief Serve the batch for (date, count), generating it at most once
     * @param date YYYY-MM-DD, today when empty
     * @param count Number of projects, 1..max_count
     * @param force_regenerate Replace an existing batch
     * @throws ValidationError for a bad date or count
     */
    DailyBatch get_daily(const std::optional<std::string>& date, int count,
                         bool force_regenerate = false);

    /**
     * @brief One-off generation outside the daily cache
     * @throws ValidationError for a malformed request
     */
    std::vector<Project> generate_custom(const GenerationRequest& request);

    /**
     * @brief Look a project up in the cached batches of its date
     *
     * Never triggers generation; malformed ids are simply not found.
     */
    std::optional<Project> get_by_id(const std::string& id);

    StatsSnapshot stats();

    /**
     * @brief Drop cached batches for one date, or every date
     * @return Number of keys removed
     * @throws ValidationError for a bad date
     * @throws CacheUnavailable when the store cannot be reached
     */
    size_t invalidate(const std::optional<std::string>& date);

    /**
     * @brief Batches cached for the previous days (at most MAX_ARCHIVE_DAYS)
     * @throws ValidationError when days < 1
     */
    std::vector<ArchiveEntry> archive(int days);

    HealthReport health();

    /**
     * @throws CacheUnavailable when the store cannot be reached
     */
    PoolStats pool_stats();

    /**
     * @brief Remove every pooled project
     * @return Number of entries removed
     * @throws CacheUnavailable when the store cannot be reached
     */
    size_t clear_pool();

    /**
     * @brief Generate count projects straight into the pool
     * @throws ValidationError when count is outside 1..MAX_POOL_SEED
     * @throws CacheUnavailable when the store cannot be reached
     */
    PoolSeedResult seed_pool(int count);

    Admission admit_request(const std::string& caller_key);

    const OrchestratorSettings& settings() const { return settings_; }

    /**
     * @brief Today's date as seen by the injected clock
     */
    std::string today() const;

    static std::string daily_key(const std::string& date, int count);
    static std::string lock_key(const std::string& date, int count);

    /**
     * @brief pool:<16 hex digits of FNV-1a over the lowercased title>
     */
    static std::string pool_key(const std::string& title);

private:
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<GenerationAdapter> adapter_;
    std::shared_ptr<const TemplateCatalog> catalog_;
    std::shared_ptr<RateLimiter> limiter_;
    OrchestratorSettings settings_;
    Clock clock_;

    std::optional<DailyBatch> read_batch(const std::string& key);
    DailyBatch generate_batch(const std::string& date, int count);
    DailyBatch fallback_batch(const std::string& date, int count, const std::string& reason);
    void finish_batch(DailyBatch& batch, const std::string& id_prefix);
    void publish(const std::string& key, const DailyBatch& batch);
    size_t add_to_pool(const std::vector<Project>& projects);
    void remember(const std::vector<Project>& projects);
    std::vector<Project> draw_from_pool(const std::string& date, size_t count);
    size_t pool_size();
    void bump(const char* counter);
    int64_t read_counter(const char* counter);
};

} // namespace dailyd
