/**
 * @file project.cpp
 * @brief Data model validation and JSON conversion
 */

#include "dailyd/models/project.h"
#include "dailyd/errors.h"
#include <algorithm>
#include <cctype>
#include <limits>

namespace dailyd {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

std::string check_length(const char* field, const std::string& value, size_t min, size_t max) {
    if (value.size() < min || value.size() > max || is_blank(value)) {
        return std::string(field) + " must be " + std::to_string(min) + ".." +
               std::to_string(max) + " characters";
    }
    return "";
}

// Required string member; throws json::type_error when present with the wrong type
bool read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // namespace

const char* to_string(TechnologyKind kind) {
    switch (kind) {
        case TechnologyKind::FRONTEND: return "frontend";
        case TechnologyKind::BACKEND: return "backend";
        case TechnologyKind::DATABASE: return "database";
        case TechnologyKind::DEVOPS: return "devops";
        case TechnologyKind::MOBILE: return "mobile";
        case TechnologyKind::OTHER: return "other";
    }
    return "other";
}

const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::BEGINNER: return "beginner";
        case Difficulty::INTERMEDIATE: return "intermediate";
        case Difficulty::ADVANCED: return "advanced";
    }
    return "beginner";
}

const char* to_string(ProjectSource source) {
    return source == ProjectSource::FALLBACK ? "fallback" : "ai";
}

TechnologyKind technology_kind_from_string(const std::string& text) {
    std::string kind = to_lower(text);
    if (kind == "frontend") return TechnologyKind::FRONTEND;
    if (kind == "backend") return TechnologyKind::BACKEND;
    if (kind == "database") return TechnologyKind::DATABASE;
    if (kind == "devops") return TechnologyKind::DEVOPS;
    if (kind == "mobile") return TechnologyKind::MOBILE;
    return TechnologyKind::OTHER;
}

std::optional<Difficulty> difficulty_from_string(const std::string& text) {
    std::string level = to_lower(text);
    if (level == "beginner") return Difficulty::BEGINNER;
    if (level == "intermediate") return Difficulty::INTERMEDIATE;
    if (level == "advanced") return Difficulty::ADVANCED;
    return std::nullopt;
}

std::optional<ProjectSource> project_source_from_string(const std::string& text) {
    if (text == "ai") return ProjectSource::AI;
    if (text == "fallback") return ProjectSource::FALLBACK;
    return std::nullopt;
}

// Technology

json Technology::to_json() const {
    return {
        {"name", name},
        {"kind", dailyd::to_string(kind)},
        {"reason", reason}
    };
}

// Project

std::string Project::validate() const {
    std::string error;
    if (!(error = check_length("title", title, 5, 150)).empty()) return error;
    if (!(error = check_length("description", description, 20, 800)).empty()) return error;
    if (!(error = check_length("estimated_time", estimated_time, 3, 50)).empty()) return error;
    if (!(error = check_length("category", category, 3, 50)).empty()) return error;

    if (technologies.empty() || technologies.size() > 6) {
        return "technologies must contain 1..6 entries";
    }
    for (const auto& tech : technologies) {
        if (!(error = check_length("technologies.name", tech.name, 1, 100)).empty()) return error;
        if (!(error = check_length("technologies.reason", tech.reason, 3, 200)).empty()) return error;
    }

    if (features.empty() || features.size() > 10) {
        return "features must contain 1..10 entries";
    }
    for (const auto& feature : features) {
        if (is_blank(feature)) {
            return "features cannot be empty";
        }
    }
    return "";
}

json Project::to_json() const {
    json techs = json::array();
    for (const auto& tech : technologies) {
        techs.push_back(tech.to_json());
    }

    json j = {
        {"id", id},
        {"title", title},
        {"description", description},
        {"difficulty", dailyd::to_string(difficulty)},
        {"estimated_time", estimated_time},
        {"category", category},
        {"technologies", techs},
        {"features", features},
        {"source", dailyd::to_string(source)}
    };
    if (generated_at != TimePoint{}) {
        j["generated_at"] = format_utc_time(generated_at);
    }
    return j;
}

std::optional<Project> Project::from_json(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "project must be an object";
        return std::nullopt;
    }

    try {
        Project project;
        read_string(j, "id", project.id);

        if (!read_string(j, "title", project.title)) { error = "title missing"; return std::nullopt; }
        if (!read_string(j, "description", project.description)) { error = "description missing"; return std::nullopt; }
        if (!read_string(j, "estimated_time", project.estimated_time)) { error = "estimated_time missing"; return std::nullopt; }
        if (!read_string(j, "category", project.category)) { error = "category missing"; return std::nullopt; }

        std::string difficulty;
        if (!read_string(j, "difficulty", difficulty)) { error = "difficulty missing"; return std::nullopt; }
        auto level = difficulty_from_string(difficulty);
        if (!level) {
            error = "difficulty must be beginner, intermediate or advanced";
            return std::nullopt;
        }
        project.difficulty = *level;

        auto techs = j.find("technologies");
        if (techs == j.end() || !techs->is_array()) {
            error = "technologies must be an array";
            return std::nullopt;
        }
        for (const auto& t : *techs) {
            if (!t.is_object()) {
                error = "technology must be an object";
                return std::nullopt;
            }
            Technology tech;
            read_string(t, "name", tech.name);
            read_string(t, "reason", tech.reason);
            std::string kind;
            if (!read_string(t, "kind", kind)) {
                read_string(t, "type", kind);
            }
            tech.kind = technology_kind_from_string(kind);
            project.technologies.push_back(std::move(tech));
        }

        auto features = j.find("features");
        if (features == j.end() || !features->is_array()) {
            error = "features must be an array";
            return std::nullopt;
        }
        for (const auto& f : *features) {
            project.features.push_back(f.get<std::string>());
        }

        std::string generated_at;
        if (read_string(j, "generated_at", generated_at)) {
            auto tp = parse_utc_time(generated_at);
            if (tp) project.generated_at = *tp;
        }

        std::string source;
        if (read_string(j, "source", source)) {
            project.source = project_source_from_string(source).value_or(ProjectSource::AI);
        }

        error = project.validate();
        if (!error.empty()) {
            return std::nullopt;
        }
        return project;

    } catch (const json::exception& e) {
        error = std::string("malformed project: ") + e.what();
        return std::nullopt;
    }
}

// DailyBatch

json DailyBatch::to_json() const {
    json items = json::array();
    for (const auto& project : projects) {
        items.push_back(project.to_json());
    }
    return {
        {"date", date},
        {"count", projects.size()},
        {"projects", items},
        {"source", dailyd::to_string(source)},
        {"degraded", degraded},
        {"notes", notes},
        {"generation_id", generation_id},
        {"generated_at", format_utc_time(generated_at)}
    };
}

std::optional<DailyBatch> DailyBatch::from_json(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "batch must be an object";
        return std::nullopt;
    }

    try {
        DailyBatch batch;
        batch.date = j.value("date", "");
        if (!is_valid_date(batch.date)) {
            error = "batch date invalid";
            return std::nullopt;
        }

        auto source = project_source_from_string(j.value("source", ""));
        if (!source) {
            error = "batch source invalid";
            return std::nullopt;
        }
        batch.source = *source;
        batch.degraded = j.value("degraded", false);
        batch.notes = j.value("notes", std::vector<std::string>{});
        batch.generation_id = j.value("generation_id", "");

        auto tp = parse_utc_time(j.value("generated_at", ""));
        if (tp) batch.generated_at = *tp;

        auto items = j.find("projects");
        if (items == j.end() || !items->is_array() || items->empty()) {
            error = "batch has no projects";
            return std::nullopt;
        }
        for (const auto& item : *items) {
            auto project = Project::from_json(item, error);
            if (!project) {
                return std::nullopt;
            }
            batch.projects.push_back(std::move(*project));
        }
        return batch;

    } catch (const json::exception& e) {
        error = std::string("malformed batch: ") + e.what();
        return std::nullopt;
    }
}

std::optional<DailyBatch> DailyBatch::deserialize(const std::string& raw, std::string& error) {
    json j = json::parse(raw, nullptr, false);
    if (j.is_discarded()) {
        error = "cached batch is not valid JSON";
        return std::nullopt;
    }
    return from_json(j, error);
}

// GenerationRequest

void GenerationRequest::validate(int max_count) const {
    if (count < 1 || count > max_count) {
        throw ValidationError("count", "must be between 1 and " + std::to_string(max_count));
    }
    if (category_preference && category_preference->size() > 50) {
        throw ValidationError("category_preference", "must be at most 50 characters");
    }
}

GenerationConstraints GenerationRequest::constraints() const {
    GenerationConstraints c;
    c.difficulties = difficulty_preference;
    if (category_preference) {
        c.category = *category_preference;
    }
    return c;
}

GenerationRequest GenerationRequest::from_json(const json& j) {
    GenerationRequest request;
    if (j.is_null()) {
        return request;
    }
    if (!j.is_object()) {
        throw ValidationError("params", "must be an object");
    }

    if (j.contains("count")) {
        request.count = checked_int(j["count"], "count");
    }

    if (j.contains("difficulty_preference") && !j["difficulty_preference"].is_null()) {
        const auto& prefs = j["difficulty_preference"];
        if (!prefs.is_array()) {
            throw ValidationError("difficulty_preference", "must be an array");
        }
        for (const auto& p : prefs) {
            if (!p.is_string()) {
                throw ValidationError("difficulty_preference", "entries must be strings");
            }
            auto level = difficulty_from_string(p.get<std::string>());
            if (!level) {
                throw ValidationError("difficulty_preference",
                                      "unknown difficulty '" + p.get<std::string>() + "'");
            }
            request.difficulty_preference.insert(*level);
        }
    }

    if (j.contains("category_preference") && !j["category_preference"].is_null()) {
        if (!j["category_preference"].is_string()) {
            throw ValidationError("category_preference", "must be a string");
        }
        request.category_preference = j["category_preference"].get<std::string>();
    }

    if (j.contains("force_regenerate")) {
        if (!j["force_regenerate"].is_boolean()) {
            throw ValidationError("force_regenerate", "must be a boolean");
        }
        request.force_regenerate = j["force_regenerate"].get<bool>();
    }

    return request;
}

int checked_int(const json& value, const char* field) {
    if (!value.is_number_integer()) {
        throw ValidationError(field, "must be an integer");
    }

    constexpr int64_t lowest = std::numeric_limits<int>::min();
    constexpr int64_t highest = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(highest)) {
            throw ValidationError(field, "out of range");
        }
    } else {
        const int64_t wide = value.get<int64_t>();
        if (wide < lowest || wide > highest) {
            throw ValidationError(field, "out of range");
        }
    }
    return value.get<int>();
}

} // namespace dailyd
