/**
 * @file orchestrator.cpp
 * @brief Project orchestrator implementation
 */

#include "dailyd/core/orchestrator.h"
#include "dailyd/logger.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>
#include <thread>

namespace dailyd {

namespace {

constexpr const char* STAT_TOTAL = "total_generated";
constexpr const char* STAT_AI = "ai_sourced";
constexpr const char* STAT_FALLBACK = "fallback_sourced";
constexpr const char* STAT_DEGRADED = "degraded";
constexpr const char* STAT_HITS = "cache_hits";
constexpr const char* STAT_MISSES = "cache_misses";
constexpr const char* STAT_UNAVAILABLE = "generation_unavailable";

/**
 * @brief Logs the state machine of one request
 */
class StateTrace {
public:
    explicit StateTrace(std::string key) : key_(std::move(key)) {}

    void to(GenerationState next) {
        if (next == state_) return;
        LOG_DEBUG("Orchestrator", key_ + ": " + to_string(state_) + " -> " + to_string(next));
        state_ = next;
    }

private:
    std::string key_;
    GenerationState state_ = GenerationState::IDLE;
};

/**
 * @brief Holds a generation lock until scope exit
 *
 * Release removes the key only while it still carries our token, so a lock
 * that expired and was taken by another request is left alone.
 */
class LockHolder {
public:
    LockHolder(CacheStore& cache, std::string key, std::string token)
        : cache_(cache), key_(std::move(key)), token_(std::move(token)) {}

    ~LockHolder() {
        try {
            if (!cache_.remove_if_equals(key_, token_)) {
                LOG_WARN("Orchestrator", key_ + " expired before release");
            }
        } catch (const std::exception& e) {
            LOG_WARN("Orchestrator", "Lock " + key_ + " left to expire: " + e.what());
        }
    }

    LockHolder(const LockHolder&) = delete;
    LockHolder& operator=(const LockHolder&) = delete;

private:
    CacheStore& cache_;
    std::string key_;
    std::string token_;
};

void check_date(const std::string& date) {
    if (!is_valid_date(date)) {
        throw ValidationError("date", "expected YYYY-MM-DD, got '" + date + "'");
    }
}

} // namespace

const char* to_string(GenerationState state) {
    switch (state) {
        case GenerationState::IDLE: return "IDLE";
        case GenerationState::SERVED: return "SERVED";
        case GenerationState::GENERATING: return "GENERATING";
        case GenerationState::WAITING: return "WAITING";
        default: return "UNKNOWN";
    }
}

json StatsSnapshot::to_json() const {
    return {
        {"total_generated", total_generated},
        {"ai_sourced", ai_sourced},
        {"fallback_sourced", fallback_sourced},
        {"degraded", degraded},
        {"cache_hits", cache_hits},
        {"cache_misses", cache_misses},
        {"generation_unavailable", generation_unavailable},
        {"project_pool_size", project_pool_size},
        {"cache_hit_ratio", cache_hit_ratio},
        {"available", available}
    };
}

json ArchiveEntry::to_json() const {
    json items = json::array();
    for (const auto& p : projects) {
        items.push_back(p.to_json());
    }
    return {
        {"date", date},
        {"projects", items},
        {"total", total}
    };
}

json PoolStats::to_json() const {
    return {
        {"pool_size", pool_size},
        {"pool_available", pool_available()}
    };
}

json PoolSeedResult::to_json() const {
    return {
        {"requested", requested},
        {"generated", generated},
        {"added", added},
        {"pool_size", pool_size}
    };
}

json HealthReport::to_json() const {
    return {
        {"status", healthy() ? "healthy" : "degraded"},
        {"cache", {
            {"backend", cache_backend},
            {"reachable", cache_reachable}
        }},
        {"generator", {
            {"name", generator},
            {"available", generator_available}
        }},
        {"degradations", Logger::degradation_counts()}
    };
}

ProjectOrchestrator::ProjectOrchestrator(std::shared_ptr<CacheStore> cache,
                                         std::shared_ptr<GenerationAdapter> adapter,
                                         std::shared_ptr<const TemplateCatalog> catalog,
                                         std::shared_ptr<RateLimiter> limiter,
                                         OrchestratorSettings settings,
                                         Clock clock)
    : cache_(std::move(cache)),
      adapter_(std::move(adapter)),
      catalog_(std::move(catalog)),
      limiter_(std::move(limiter)),
      settings_(settings),
      clock_(std::move(clock)) {
}

std::string ProjectOrchestrator::today() const {
    return format_date(clock_());
}

std::string ProjectOrchestrator::daily_key(const std::string& date, int count) {
    return "daily:" + date + ":" + std::to_string(count);
}

std::string ProjectOrchestrator::lock_key(const std::string& date, int count) {
    return "lock:daily:" + date + ":" + std::to_string(count);
}

std::string ProjectOrchestrator::pool_key(const std::string& title) {
    std::string folded;
    folded.reserve(title.size());
    for (unsigned char c : title) {
        folded.push_back(static_cast<char>(std::tolower(c)));
    }
    std::ostringstream key;
    key << "pool:" << std::hex << std::setw(16) << std::setfill('0') << fnv1a_hash(folded);
    return key.str();
}

DailyBatch ProjectOrchestrator::get_daily(const std::optional<std::string>& date, int count,
                                          bool force_regenerate) {
    const std::string day = date.value_or(today());
    check_date(day);
    if (count < 1 || count > settings_.max_count) {
        throw ValidationError("count", "must be between 1 and " + std::to_string(settings_.max_count));
    }

    const std::string key = daily_key(day, count);
    const std::string lock = lock_key(day, count);
    StateTrace trace(key);

    // Idle: consult the cache
    std::optional<DailyBatch> cached;
    try {
        auto raw = cache_->get(key);
        if (raw) {
            std::string error;
            cached = DailyBatch::deserialize(*raw, error);
            if (!cached) {
                LOG_WARN("Orchestrator", "Discarding unreadable batch " + key + ": " + error);
            }
        }
    } catch (const CacheUnavailable& e) {
        Logger::degraded("Orchestrator", Degradation::CACHE_BYPASS,
                         std::string("Generating without cache: ") + e.what(), LogFields::for_key(key));
        trace.to(GenerationState::GENERATING);
        DailyBatch batch = generate_batch(day, count);
        trace.to(GenerationState::SERVED);
        return batch;
    }

    if (cached && !force_regenerate) {
        bump(STAT_HITS);
        trace.to(GenerationState::SERVED);
        return *cached;
    }
    if (!force_regenerate) {
        bump(STAT_MISSES);
    }

    // Any batch with another generation id was published after this request began
    const std::string stale_id = cached ? cached->generation_id : "";
    auto fresh = [&](const std::optional<DailyBatch>& batch) {
        return batch && batch->generation_id != stale_id;
    };

    const std::string token = generate_uuid();
    int attempts = 0;

    while (true) {
        bool acquired = false;
        try {
            acquired = cache_->set_if_absent(lock, token, settings_.lock_ttl);
        } catch (const CacheUnavailable& e) {
            Logger::degraded("Orchestrator", Degradation::CACHE_BYPASS,
                             std::string("Lock unavailable, generating without cache: ") + e.what(),
                             LogFields::for_key(lock));
            trace.to(GenerationState::GENERATING);
            DailyBatch batch = generate_batch(day, count);
            trace.to(GenerationState::SERVED);
            return batch;
        }

        if (acquired) {
            LockHolder holder(*cache_, lock, token);

            // A previous holder may have published between our read and the lock
            auto published = read_batch(key);
            if (fresh(published)) {
                trace.to(GenerationState::SERVED);
                return *published;
            }

            trace.to(GenerationState::GENERATING);
            DailyBatch batch = generate_batch(day, count);
            publish(key, batch);
            trace.to(GenerationState::SERVED);
            return batch;
        }

        trace.to(GenerationState::WAITING);
        bool lock_gone = false;
        while (attempts < settings_.poll_max_attempts && !lock_gone) {
            std::this_thread::sleep_for(settings_.poll_interval);
            ++attempts;

            auto published = read_batch(key);
            if (fresh(published)) {
                LOG_DEBUG("Orchestrator", key + ": served batch published by another request after " +
                          std::to_string(attempts) + " polls");
                trace.to(GenerationState::SERVED);
                return *published;
            }

            try {
                lock_gone = !cache_->get(lock).has_value();
            } catch (const CacheUnavailable& e) {
                LOG_WARN("Orchestrator", std::string("Lost cache while waiting: ") + e.what());
                break;
            }
        }

        if (!lock_gone) {
            Logger::degraded("Orchestrator", Degradation::WAIT_EXPIRED,
                             "No batch published within the grace period after " +
                             std::to_string(attempts) + " polls", LogFields::for_key(key));
            trace.to(GenerationState::GENERATING);
            DailyBatch batch = fallback_batch(day, count, "generation in progress elsewhere did not finish in time");
            trace.to(GenerationState::SERVED);
            return batch;
        }
        LOG_DEBUG("Orchestrator", key + ": lock released without a batch, retrying");
    }
}

std::vector<Project> ProjectOrchestrator::generate_custom(const GenerationRequest& request) {
    request.validate(settings_.max_count);

    const std::string day = today();
    GenerationOutcome outcome = adapter_->generate(request, day);
    bump(STAT_TOTAL);

    std::vector<Project> projects;
    if (outcome.usable()) {
        bump(STAT_AI);
        if (outcome.failure == GenerationFailure::DEGRADED) {
            bump(STAT_DEGRADED);
        }
        projects = std::move(outcome.projects);
        remember(projects);
    } else {
        bump(STAT_UNAVAILABLE);
        bump(STAT_FALLBACK);
        Logger::degraded("Orchestrator", Degradation::TEMPLATE_FALLBACK,
                         "Custom generation unavailable, using templates: " + outcome.error);
        projects = catalog_->sample(static_cast<size_t>(request.count), request.constraints(), day).projects;
    }

    const TimePoint now = clock_();
    const std::string prefix = "custom-" + format_compact_stamp(now) + "-";
    for (size_t i = 0; i < projects.size(); ++i) {
        projects[i].id = prefix + std::to_string(i + 1);
        projects[i].generated_at = now;
    }

    LOG_INFO("Orchestrator", "Generated " + std::to_string(projects.size()) + " custom projects");
    return projects;
}

std::optional<Project> ProjectOrchestrator::get_by_id(const std::string& id) {
    // <YYYY-MM-DD>-<n>
    if (id.size() < 12 || id[10] != '-') {
        return std::nullopt;
    }
    const std::string date = id.substr(0, 10);
    const std::string index = id.substr(11);
    if (!is_valid_date(date) ||
        !std::all_of(index.begin(), index.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    std::vector<std::string> keys;
    try {
        keys = cache_->keys("daily:" + date + ":*");
    } catch (const CacheUnavailable& e) {
        LOG_WARN("Orchestrator", std::string("Cannot look up ") + id + ": " + e.what());
        return std::nullopt;
    }

    for (const auto& key : keys) {
        auto batch = read_batch(key);
        if (!batch) continue;
        for (const auto& project : batch->projects) {
            if (project.id == id) {
                return project;
            }
        }
    }
    return std::nullopt;
}

StatsSnapshot ProjectOrchestrator::stats() {
    StatsSnapshot snapshot;
    try {
        snapshot.total_generated = read_counter(STAT_TOTAL);
        snapshot.ai_sourced = read_counter(STAT_AI);
        snapshot.fallback_sourced = read_counter(STAT_FALLBACK);
        snapshot.degraded = read_counter(STAT_DEGRADED);
        snapshot.cache_hits = read_counter(STAT_HITS);
        snapshot.cache_misses = read_counter(STAT_MISSES);
        snapshot.generation_unavailable = read_counter(STAT_UNAVAILABLE);
        snapshot.project_pool_size = static_cast<int64_t>(pool_size());
    } catch (const CacheUnavailable& e) {
        LOG_WARN("Orchestrator", std::string("Stats unavailable: ") + e.what());
        StatsSnapshot unavailable;
        unavailable.available = false;
        return unavailable;
    }

    const int64_t lookups = snapshot.cache_hits + snapshot.cache_misses;
    if (lookups > 0) {
        snapshot.cache_hit_ratio = static_cast<double>(snapshot.cache_hits) / static_cast<double>(lookups);
    }
    return snapshot;
}

size_t ProjectOrchestrator::invalidate(const std::optional<std::string>& date) {
    std::string pattern = "daily:*";
    if (date) {
        check_date(*date);
        pattern = "daily:" + *date + ":*";
    }

    size_t removed = cache_->remove_matching(pattern);
    LOG_INFO("Orchestrator", "Invalidated " + std::to_string(removed) + " cached batches (" +
             (date ? *date : std::string("all dates")) + ")");
    return removed;
}

std::vector<ArchiveEntry> ProjectOrchestrator::archive(int days) {
    if (days < 1) {
        throw ValidationError("days", "must be at least 1");
    }
    const int span = std::min(days, MAX_ARCHIVE_DAYS);
    const std::string now = today();

    std::vector<ArchiveEntry> entries;
    for (int back = 1; back <= span; ++back) {
        auto date = shift_date(now, -back);
        if (!date) continue;

        std::vector<std::string> keys;
        try {
            keys = cache_->keys("daily:" + *date + ":*");
        } catch (const CacheUnavailable& e) {
            LOG_WARN("Orchestrator", std::string("Archive truncated: ") + e.what());
            break;
        }

        std::optional<DailyBatch> largest;
        for (const auto& key : keys) {
            auto batch = read_batch(key);
            if (batch && (!largest || batch->projects.size() > largest->projects.size())) {
                largest = std::move(batch);
            }
        }
        if (!largest) continue;

        ArchiveEntry entry;
        entry.date = *date;
        entry.total = largest->projects.size();
        const size_t shown = std::min<size_t>(3, largest->projects.size());
        entry.projects.assign(largest->projects.begin(), largest->projects.begin() + shown);
        entries.push_back(std::move(entry));
    }
    return entries;
}

HealthReport ProjectOrchestrator::health() {
    HealthReport report;
    report.cache_backend = cache_->backend();
    report.cache_reachable = cache_->ping();
    report.generator = adapter_->generator_name();
    report.generator_available = adapter_->available();
    return report;
}

PoolStats ProjectOrchestrator::pool_stats() {
    PoolStats stats;
    stats.pool_size = pool_size();
    return stats;
}

size_t ProjectOrchestrator::clear_pool() {
    size_t removed = cache_->remove_matching("pool:*");
    LOG_INFO("Orchestrator", "Cleared " + std::to_string(removed) + " pooled projects");
    return removed;
}

PoolSeedResult ProjectOrchestrator::seed_pool(int count) {
    if (count < 1 || count > MAX_POOL_SEED) {
        throw ValidationError("count", "must be between 1 and " + std::to_string(MAX_POOL_SEED));
    }

    PoolSeedResult result;
    result.requested = count;

    GenerationRequest request;
    request.count = count;
    GenerationOutcome outcome = adapter_->generate(request, today());
    if (!outcome.usable()) {
        result.error = outcome.error.empty() ? std::string("generation unavailable") : outcome.error;
        LOG_WARN("Orchestrator", "Pool not seeded: " + result.error);
        result.pool_size = pool_size();
        return result;
    }

    std::vector<Project> generated;
    for (auto& project : outcome.projects) {
        if (project.source == ProjectSource::AI) {
            generated.push_back(std::move(project));
        }
    }
    result.generated = generated.size();
    result.added = add_to_pool(generated);
    result.pool_size = pool_size();

    LOG_INFO("Orchestrator", "Seeded pool with " + std::to_string(result.added) + " new projects (" +
             std::to_string(result.pool_size) + " pooled)");
    return result;
}

Admission ProjectOrchestrator::admit_request(const std::string& caller_key) {
    return limiter_->admit(caller_key);
}

std::optional<DailyBatch> ProjectOrchestrator::read_batch(const std::string& key) {
    try {
        auto raw = cache_->get(key);
        if (!raw) {
            return std::nullopt;
        }
        std::string error;
        auto batch = DailyBatch::deserialize(*raw, error);
        if (!batch) {
            LOG_WARN("Orchestrator", "Unreadable batch " + key + ": " + error);
        }
        return batch;
    } catch (const CacheUnavailable& e) {
        LOG_WARN("Orchestrator", std::string("Cannot read ") + key + ": " + e.what());
        return std::nullopt;
    }
}

DailyBatch ProjectOrchestrator::generate_batch(const std::string& date, int count) {
    GenerationRequest request;
    request.count = count;

    GenerationOutcome outcome = adapter_->generate(request, date);
    if (!outcome.usable()) {
        bump(STAT_UNAVAILABLE);
        return fallback_batch(date, count, "generation unavailable: " + outcome.error);
    }

    DailyBatch batch;
    batch.date = date;
    batch.source = ProjectSource::AI;
    batch.projects = std::move(outcome.projects);
    batch.degraded = outcome.failure == GenerationFailure::DEGRADED;
    batch.notes = std::move(outcome.notes);
    finish_batch(batch, date + "-");
    remember(batch.projects);

    bump(STAT_TOTAL);
    bump(STAT_AI);
    if (batch.degraded) {
        bump(STAT_DEGRADED);
    }
    LOG_INFO("Orchestrator", "Generated batch " + daily_key(date, count) +
             (batch.degraded ? " (degraded)" : ""));
    return batch;
}

DailyBatch ProjectOrchestrator::fallback_batch(const std::string& date, int count, const std::string& reason) {
    const size_t wanted = static_cast<size_t>(count);

    DailyBatch batch;
    batch.date = date;
    batch.source = ProjectSource::FALLBACK;
    batch.projects = draw_from_pool(date, wanted);
    batch.notes.push_back(reason);

    const size_t pooled = batch.projects.size();
    if (pooled > 0) {
        batch.notes.push_back(std::to_string(pooled) + " of " + std::to_string(wanted) +
                              " projects drawn from the project pool");
    }

    if (pooled < wanted) {
        std::set<std::string> taken;
        for (const auto& p : batch.projects) {
            taken.insert(p.title);
        }
        FallbackSelection selection = catalog_->sample(wanted - pooled, GenerationConstraints{}, date, taken);
        for (auto& p : selection.projects) {
            batch.projects.push_back(std::move(p));
        }
        batch.degraded = selection.widened;
        for (auto& note : selection.notes) {
            batch.notes.push_back(std::move(note));
        }
    }
    finish_batch(batch, date + "-");

    bump(STAT_TOTAL);
    bump(STAT_FALLBACK);
    if (batch.degraded) {
        bump(STAT_DEGRADED);
    }

    const std::string key = daily_key(date, count);
    if (pooled > 0) {
        Logger::degraded("Orchestrator", Degradation::POOL_FALLBACK,
                         "Serving " + std::to_string(pooled) + " pooled projects: " + reason,
                         LogFields::for_key(key).generation(batch.generation_id));
    } else {
        Logger::degraded("Orchestrator", Degradation::TEMPLATE_FALLBACK,
                         "Serving template batch: " + reason,
                         LogFields::for_key(key).generation(batch.generation_id));
    }
    return batch;
}

void ProjectOrchestrator::finish_batch(DailyBatch& batch, const std::string& id_prefix) {
    batch.generated_at = clock_();
    batch.generation_id = generate_uuid();
    for (size_t i = 0; i < batch.projects.size(); ++i) {
        batch.projects[i].id = id_prefix + std::to_string(i + 1);
        batch.projects[i].generated_at = batch.generated_at;
    }
}

void ProjectOrchestrator::publish(const std::string& key, const DailyBatch& batch) {
    const bool full_quality = batch.source == ProjectSource::AI && !batch.degraded;
    const std::chrono::seconds ttl = full_quality ? settings_.daily_ttl : settings_.fallback_ttl;
    try {
        cache_->set(key, batch.serialize(), ttl);
        LOG_DEBUG("Orchestrator", "Published " + key + " for " + std::to_string(ttl.count()) + "s");
    } catch (const CacheUnavailable& e) {
        LOG_WARN("Orchestrator", std::string("Batch not cached: ") + e.what());
    }
}

size_t ProjectOrchestrator::add_to_pool(const std::vector<Project>& projects) {
    size_t added = 0;
    for (const auto& project : projects) {
        if (project.source != ProjectSource::AI) {
            continue;
        }
        const std::string key = pool_key(project.title);
        const std::string value = project.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
        if (cache_->set_if_absent(key, value, settings_.pool_ttl)) {
            ++added;
        } else {
            // Seen before: keep it another full TTL
            cache_->set(key, value, settings_.pool_ttl);
        }
    }
    return added;
}

void ProjectOrchestrator::remember(const std::vector<Project>& projects) {
    try {
        size_t added = add_to_pool(projects);
        if (added > 0) {
            LOG_DEBUG("Orchestrator", "Pooled " + std::to_string(added) + " new projects");
        }
    } catch (const CacheUnavailable& e) {
        LOG_WARN("Orchestrator", std::string("Projects not pooled: ") + e.what());
    }
}

std::vector<Project> ProjectOrchestrator::draw_from_pool(const std::string& date, size_t count) {
    std::vector<Project> drawn;
    std::vector<std::string> keys;
    try {
        keys = cache_->keys("pool:*");
    } catch (const CacheUnavailable& e) {
        LOG_DEBUG("Orchestrator", std::string("Pool unreachable: ") + e.what());
        return drawn;
    }

    // Same pool and date, same draw
    std::sort(keys.begin(), keys.end());
    const std::vector<size_t> order = seeded_permutation(keys.size(), "pool:" + date);

    for (size_t index : order) {
        if (drawn.size() >= count) {
            break;
        }
        const std::string& key = keys[index];

        std::optional<std::string> raw;
        try {
            raw = cache_->get(key);
        } catch (const CacheUnavailable& e) {
            LOG_DEBUG("Orchestrator", std::string("Pool unreachable: ") + e.what());
            break;
        }
        if (!raw) {
            continue;  // expired after listing
        }

        std::string error;
        std::optional<Project> project;
        try {
            project = Project::from_json(json::parse(*raw), error);
        } catch (const json::parse_error& e) {
            error = e.what();
        }
        if (!project) {
            LOG_WARN("Orchestrator", "Skipping unreadable pool entry " + key + ": " + error);
            continue;
        }
        drawn.push_back(std::move(*project));
    }
    return drawn;
}

size_t ProjectOrchestrator::pool_size() {
    return cache_->keys("pool:*").size();
}

void ProjectOrchestrator::bump(const char* counter) {
    try {
        cache_->increment(std::string("stats:") + counter, std::chrono::seconds(0));
    } catch (const CacheUnavailable& e) {
        LOG_DEBUG("Orchestrator", std::string("Counter ") + counter + " not updated: " + e.what());
    }
}

int64_t ProjectOrchestrator::read_counter(const char* counter) {
    auto raw = cache_->get(std::string("stats:") + counter);
    if (!raw) {
        return 0;
    }
    try {
        return std::stoll(*raw);
    } catch (const std::exception&) {
        LOG_WARN("Orchestrator", std::string("Counter ") + counter + " holds a non-integer value");
        return 0;
    }
}

} // namespace dailyd
