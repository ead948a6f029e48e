/**
 * @file template_catalog.cpp
 * @brief Built-in project catalog and seeded selection
 */

#include "dailyd/fallback/template_catalog.h"
#include "dailyd/logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace dailyd {

namespace {

Project make_template(const std::string& title,
                      const std::string& description,
                      Difficulty difficulty,
                      const std::string& estimated_time,
                      const std::string& category,
                      std::vector<Technology> technologies,
                      std::vector<std::string> features) {
    Project p;
    p.title = title;
    p.description = description;
    p.difficulty = difficulty;
    p.estimated_time = estimated_time;
    p.category = category;
    p.technologies = std::move(technologies);
    p.features = std::move(features);
    p.source = ProjectSource::FALLBACK;
    return p;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool matches(const Project& p, const std::set<Difficulty>& difficulties,
             const std::string& category) {
    if (!difficulties.empty() && difficulties.count(p.difficulty) == 0) {
        return false;
    }
    if (!category.empty() && lowercase(p.category).find(category) == std::string::npos) {
        return false;
    }
    return true;
}

} // namespace

TemplateCatalog::TemplateCatalog(std::vector<Project> entries)
    : entries_(std::move(entries)) {
    for (auto& entry : entries_) {
        entry.source = ProjectSource::FALLBACK;
    }
}

TemplateCatalog TemplateCatalog::builtin() {
    using K = TechnologyKind;
    using D = Difficulty;

    std::vector<Project> entries;

    entries.push_back(make_template(
        "Personal Task Tracker",
        "A small web application for creating, completing and filtering daily tasks, "
        "with data kept in the browser so it works without a server.",
        D::BEGINNER, "1-2 days", "Productivity",
        {{"React", K::FRONTEND, "Component model keeps the list views simple"},
         {"LocalStorage", K::DATABASE, "Persistence without running a backend"}},
        {"Add, edit and delete tasks", "Mark tasks as done",
         "Filter by status", "Persist tasks between sessions"}));

    entries.push_back(make_template(
        "Weather Dashboard",
        "A dashboard that looks up current conditions and a five day forecast for a "
        "city using a public weather API and shows them as cards and charts.",
        D::BEGINNER, "2-3 days", "Web Development",
        {{"Vue.js", K::FRONTEND, "Reactive bindings for API-driven views"},
         {"Chart.js", K::FRONTEND, "Simple forecast charts"}},
        {"City search with suggestions", "Current conditions card",
         "Five day forecast chart", "Unit toggle between metric and imperial"}));

    entries.push_back(make_template(
        "Markdown Notes CLI",
        "A command line tool that creates, lists and searches markdown notes stored in "
        "a plain directory, with tags read from front matter.",
        D::BEGINNER, "1-2 days", "Developer Tools",
        {{"Python", K::BACKEND, "Quick scripting and rich standard library"},
         {"SQLite", K::DATABASE, "Index for fast full text search"}},
        {"Create notes from a template", "Tag extraction from front matter",
         "Full text search", "Export a note to HTML"}));

    entries.push_back(make_template(
        "Recipe Box API",
        "A REST API for storing recipes with ingredients and steps, supporting search "
        "by ingredient and scaling quantities to a number of servings.",
        D::INTERMEDIATE, "3-5 days", "Backend",
        {{"Node.js", K::BACKEND, "Fast iteration on HTTP handlers"},
         {"PostgreSQL", K::DATABASE, "Relational model for recipes and ingredients"},
         {"Docker", K::DEVOPS, "Reproducible local database"}},
        {"CRUD endpoints for recipes", "Search by ingredient",
         "Serving size scaling", "Input validation with clear errors"}));

    entries.push_back(make_template(
        "Habit Streak Mobile App",
        "A mobile app that tracks daily habits, shows the current streak for each one "
        "and sends a reminder notification at a chosen time.",
        D::INTERMEDIATE, "1 week", "Mobile",
        {{"React Native", K::MOBILE, "One codebase for Android and iOS"},
         {"SQLite", K::DATABASE, "On-device storage for habit history"}},
        {"Create habits with a reminder time", "Streak calculation",
         "Local notifications", "Monthly calendar view"}));

    entries.push_back(make_template(
        "URL Shortener Service",
        "A service that turns long links into short codes, redirects visitors and "
        "records click counts per link with a small statistics page.",
        D::INTERMEDIATE, "3-4 days", "Backend",
        {{"Go", K::BACKEND, "Efficient HTTP server with low overhead"},
         {"Redis", K::DATABASE, "Fast lookups and atomic click counters"}},
        {"Short code generation", "HTTP redirect endpoint",
         "Click statistics", "Expiring links"}));

    entries.push_back(make_template(
        "Expense Splitter",
        "A web application for groups to record shared expenses and compute the "
        "smallest set of payments that settles every balance.",
        D::INTERMEDIATE, "4-6 days", "Finance",
        {{"Svelte", K::FRONTEND, "Lightweight reactive UI"},
         {"FastAPI", K::BACKEND, "Typed endpoints with automatic docs"},
         {"PostgreSQL", K::DATABASE, "Transactions for balance updates"}},
        {"Groups and members", "Expense entry with split rules",
         "Settlement calculation", "CSV export"}));

    entries.push_back(make_template(
        "CI Pipeline for a Static Site",
        "A continuous integration setup that builds, tests and deploys a static site "
        "on every push, with preview deployments for pull requests.",
        D::INTERMEDIATE, "2-3 days", "DevOps",
        {{"GitHub Actions", K::DEVOPS, "Hosted pipelines triggered by pushes"},
         {"Hugo", K::FRONTEND, "Fast static site generation"},
         {"Docker", K::DEVOPS, "Pinned build environment"}},
        {"Build and link check on push", "Preview deployments",
         "Cached dependencies", "Deployment status badge"}));

    entries.push_back(make_template(
        "Real-time Chat Server",
        "A chat backend with rooms, presence and message history, pushing messages to "
        "connected clients over websockets and scaling across several instances.",
        D::ADVANCED, "1-2 weeks", "Backend",
        {{"Rust", K::BACKEND, "Safe concurrency for many connections"},
         {"Redis", K::DATABASE, "Pub/sub fan-out between instances"},
         {"PostgreSQL", K::DATABASE, "Durable message history"}},
        {"Rooms and direct messages", "Presence tracking",
         "Paginated message history", "Horizontal scaling with pub/sub"}));

    entries.push_back(make_template(
        "Log Aggregation Pipeline",
        "A pipeline that collects logs from several services, parses them into "
        "structured events, stores them and offers search with saved alerts.",
        D::ADVANCED, "2 weeks", "DevOps",
        {{"Kafka", K::BACKEND, "Durable buffering between stages"},
         {"Elasticsearch", K::DATABASE, "Indexed search over events"},
         {"Kubernetes", K::DEVOPS, "Runs collectors next to services"}},
        {"Log shipping agents", "Structured parsing rules",
         "Search interface", "Threshold alerts"}));

    entries.push_back(make_template(
        "Collaborative Whiteboard",
        "A browser whiteboard where several people draw at the same time, with "
        "conflict-free merging of edits and replay of a board's history.",
        D::ADVANCED, "2-3 weeks", "Web Development",
        {{"TypeScript", K::FRONTEND, "Typed canvas and sync code"},
         {"Node.js", K::BACKEND, "Websocket relay"},
         {"CRDT library", K::OTHER, "Merging concurrent edits"}},
        {"Freehand and shape tools", "Live cursors",
         "Conflict-free merging", "History replay"}));

    entries.push_back(make_template(
        "Offline-first Field Survey App",
        "A mobile app for collecting survey responses without connectivity, syncing "
        "to a server when online and resolving edits made on several devices.",
        D::ADVANCED, "2-3 weeks", "Mobile",
        {{"Flutter", K::MOBILE, "Single codebase with good offline tooling"},
         {"SQLite", K::DATABASE, "Local queue of pending responses"},
         {"Django", K::BACKEND, "Admin site for survey definitions"}},
        {"Form builder for surveys", "Offline response queue",
         "Background sync", "Conflict resolution view"}));

    entries.push_back(make_template(
        "Portfolio Site Generator",
        "A tool that turns a YAML description of projects and skills into a themed "
        "static portfolio site ready to host for free.",
        D::BEGINNER, "1-2 days", "Web Development",
        {{"JavaScript", K::FRONTEND, "Templates rendered at build time"},
         {"Netlify", K::DEVOPS, "Free static hosting"}},
        {"YAML input format", "Two selectable themes",
         "Project gallery page", "Contact form"}));

    entries.push_back(make_template(
        "Inventory Tracker for a Small Shop",
        "An application for tracking stock levels, suppliers and reorder points, with "
        "a low stock report and barcode lookup from a phone camera.",
        D::INTERMEDIATE, "1 week", "Business",
        {{"Angular", K::FRONTEND, "Forms-heavy admin screens"},
         {"Spring Boot", K::BACKEND, "Structured service layer"},
         {"MySQL", K::DATABASE, "Relational stock and supplier data"}},
        {"Product and supplier records", "Reorder point alerts",
         "Barcode lookup", "Low stock report"}));

    return TemplateCatalog(std::move(entries));
}

std::optional<TemplateCatalog> TemplateCatalog::load(const std::string& path) {
    try {
        std::string expanded_path = expand_path(path);

        std::ifstream file(expanded_path);
        if (!file.good()) {
            LOG_WARN("TemplateCatalog", "Catalog file not found: " + expanded_path);
            return std::nullopt;
        }

        YAML::Node yaml = YAML::LoadFile(expanded_path);
        YAML::Node list = yaml["projects"];
        if (!list || !list.IsSequence() || list.size() == 0) {
            LOG_ERROR("TemplateCatalog", "Catalog has no 'projects' list: " + expanded_path);
            return std::nullopt;
        }

        std::vector<Project> entries;
        for (size_t i = 0; i < list.size(); ++i) {
            const YAML::Node node = list[i];
            Project p;
            p.title = node["title"].as<std::string>("");
            p.description = node["description"].as<std::string>("");
            p.estimated_time = node["estimated_time"].as<std::string>("");
            p.category = node["category"].as<std::string>("");

            auto difficulty = difficulty_from_string(node["difficulty"].as<std::string>(""));
            if (!difficulty) {
                LOG_ERROR("TemplateCatalog", "Entry " + std::to_string(i) + ": bad difficulty");
                return std::nullopt;
            }
            p.difficulty = *difficulty;

            if (node["technologies"]) {
                for (const auto& tech : node["technologies"]) {
                    Technology t;
                    t.name = tech["name"].as<std::string>("");
                    t.kind = technology_kind_from_string(tech["kind"].as<std::string>("other"));
                    t.reason = tech["reason"].as<std::string>("");
                    p.technologies.push_back(std::move(t));
                }
            }
            if (node["features"]) {
                for (const auto& feature : node["features"]) {
                    p.features.push_back(feature.as<std::string>());
                }
            }

            std::string error = p.validate();
            if (!error.empty()) {
                LOG_ERROR("TemplateCatalog", "Entry " + std::to_string(i) + ": " + error);
                return std::nullopt;
            }
            entries.push_back(std::move(p));
        }

        LOG_INFO("TemplateCatalog", "Loaded " + std::to_string(entries.size()) +
                 " templates from " + expanded_path);
        return TemplateCatalog(std::move(entries));

    } catch (const YAML::Exception& e) {
        LOG_ERROR("TemplateCatalog", "YAML parse error: " + std::string(e.what()));
        return std::nullopt;
    }
}

FallbackSelection TemplateCatalog::sample(size_t count,
                                          const GenerationConstraints& constraints,
                                          const std::string& seed,
                                          const std::set<std::string>& exclude_titles) const {
    FallbackSelection selection;
    if (count == 0 || entries_.empty()) {
        return selection;
    }

    const std::vector<size_t> order = seeded_permutation(entries_.size(), seed);
    const std::string category = lowercase(constraints.category);
    std::vector<bool> taken(entries_.size(), false);

    auto take = [&](const std::set<Difficulty>& difficulties, const std::string& cat,
                    bool allow_excluded) {
        for (size_t idx : order) {
            if (selection.projects.size() >= count) {
                return;
            }
            if (taken[idx]) {
                continue;
            }
            const Project& p = entries_[idx];
            if (!allow_excluded && exclude_titles.count(p.title) != 0) {
                continue;
            }
            if (!matches(p, difficulties, cat)) {
                continue;
            }
            taken[idx] = true;
            selection.projects.push_back(p);
        }
    };

    take(constraints.difficulties, category, false);

    if (selection.projects.size() < count && !category.empty()) {
        selection.widened = true;
        selection.notes.push_back("category filter relaxed");
        take(constraints.difficulties, "", false);
    }

    if (selection.projects.size() < count && !constraints.difficulties.empty()) {
        selection.widened = true;
        selection.notes.push_back("difficulty filter relaxed");
        take({}, "", false);
    }

    if (selection.projects.size() < count && !exclude_titles.empty()) {
        take({}, "", true);
    }

    // Catalog smaller than the request: repeat in the same order
    if (selection.projects.size() < count && !selection.projects.empty()) {
        selection.widened = true;
        selection.notes.push_back("catalog smaller than requested count, entries repeated");
        const size_t unique = selection.projects.size();
        for (size_t i = 0; selection.projects.size() < count; ++i) {
            selection.projects.push_back(selection.projects[i % unique]);
        }
    }

    if (selection.widened) {
        Logger::degraded("TemplateCatalog", Degradation::FILTER_WIDENED,
                         "Selected " + std::to_string(selection.projects.size()) + " templates for seed " +
                         seed + " after widening");
    } else {
        LOG_DEBUG("TemplateCatalog", "Selected " + std::to_string(selection.projects.size()) +
                  " templates for seed " + seed);
    }
    return selection;
}

} // namespace dailyd
