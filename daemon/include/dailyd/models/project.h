/**
 * @file project.h
 * @brief Project, DailyBatch and GenerationRequest data model
 */

#pragma once

#include "dailyd/common.h"
#include "dailyd/utils/helpers.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dailyd {

enum class TechnologyKind {
    FRONTEND,
    BACKEND,
    DATABASE,
    DEVOPS,
    MOBILE,
    OTHER
};

enum class Difficulty {
    BEGINNER,
    INTERMEDIATE,
    ADVANCED
};

/**
 * @brief Where a project (or a whole batch) came from
 */
enum class ProjectSource {
    AI,
    FALLBACK
};

const char* to_string(TechnologyKind kind);
const char* to_string(Difficulty difficulty);
const char* to_string(ProjectSource source);

/**
 * @brief Lenient mapping; unknown kinds (framework, tool, ...) become OTHER
 */
TechnologyKind technology_kind_from_string(const std::string& text);

std::optional<Difficulty> difficulty_from_string(const std::string& text);
std::optional<ProjectSource> project_source_from_string(const std::string& text);

/**
 * @brief A technology recommended for a project
 */
struct Technology {
    std::string name;
    TechnologyKind kind = TechnologyKind::OTHER;
    std::string reason;

    json to_json() const;
};

/**
 * @brief A single project idea
 *
 * Immutable once placed in a batch; ids are "<YYYY-MM-DD>-<n>" for daily
 * batches and "custom-<YYYYMMDDHHMMSS>-<n>" for custom generations.
 */
struct Project {
    std::string id;
    std::string title;
    std::string description;
    Difficulty difficulty = Difficulty::BEGINNER;
    std::string estimated_time;
    std::string category;
    std::vector<Technology> technologies;
    std::vector<std::string> features;
    TimePoint generated_at{};
    ProjectSource source = ProjectSource::AI;

    /**
     * @brief Check field lengths and collection sizes
     * @return Error message naming the field, empty string if valid
     */
    std::string validate() const;

    json to_json() const;

    /**
     * @brief Parse a project record
     * @param j JSON object (cached record or AI draft)
     * @param error Receives the reason on failure
     * @return Project if the record has the required shape
     */
    static std::optional<Project> from_json(const json& j, std::string& error);
};

/**
 * @brief Projects cached under one (date, count) key
 */
struct DailyBatch {
    std::string date;
    std::vector<Project> projects;
    ProjectSource source = ProjectSource::AI;
    bool degraded = false;
    std::vector<std::string> notes;
    std::string generation_id;
    TimePoint generated_at{};

    json to_json() const;
    static std::optional<DailyBatch> from_json(const json& j, std::string& error);

    /**
     * @brief Compact JSON; invalid UTF-8 in generated text is replaced, never thrown
     */
    std::string serialize() const {
        return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
    }
    static std::optional<DailyBatch> deserialize(const std::string& raw, std::string& error);
};

/**
 * @brief Filters shared by the AI path and the template fallback
 */
struct GenerationConstraints {
    std::set<Difficulty> difficulties;   // empty = any
    std::string category;                // empty = any
};

/**
 * @brief Caller request for a generation
 */
struct GenerationRequest {
    int count = DEFAULT_PROJECT_COUNT;
    std::set<Difficulty> difficulty_preference;
    std::optional<std::string> category_preference;
    bool force_regenerate = false;

    /**
     * @throws ValidationError naming the violated constraint
     */
    void validate(int max_count) const;

    GenerationConstraints constraints() const;

    /**
     * @brief Parse from request parameters
     * @throws ValidationError on wrong types or unknown difficulty values
     */
    static GenerationRequest from_json(const json& j);
};

/**
 * @brief Integer request parameter, range-checked before narrowing to int
 * @throws ValidationError when the value is not an integer or does not fit
 */
int checked_int(const json& value, const char* field);

} // namespace dailyd
