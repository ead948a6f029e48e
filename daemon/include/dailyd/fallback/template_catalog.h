/**
 * @file template_catalog.h
 * @brief Deterministic catalog of pre-authored projects
 */

#pragma once

#include "dailyd/models/project.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dailyd {

/**
 * @brief Result of a catalog selection
 */
struct FallbackSelection {
    std::vector<Project> projects;
    bool widened = false;           // filters had to be relaxed
    std::vector<std::string> notes; // which filters were relaxed
};

/**
 * @brief In-process catalog used when generation fails
 *
 * Selection is a seeded permutation of the catalog, so the same seed (the
 * batch date) always produces the same set.
 */
class TemplateCatalog {
public:
    explicit TemplateCatalog(std::vector<Project> entries);

    /**
     * @brief Catalog compiled into the daemon
     */
    static TemplateCatalog builtin();

    /**
     * @brief Load a catalog from a YAML file (list under "projects")
     * @return Catalog if the file parses and every entry is valid
     */
    static std::optional<TemplateCatalog> load(const std::string& path);

    /**
     * @brief Pick count projects matching the constraints
     * @param count Number of projects wanted
     * @param constraints Difficulty / category filters
     * @param seed Selection seed, normally the batch date
     * @param exclude_titles Titles that must not be picked when avoidable
     */
    FallbackSelection sample(size_t count,
                             const GenerationConstraints& constraints,
                             const std::string& seed,
                             const std::set<std::string>& exclude_titles = {}) const;

    size_t size() const { return entries_.size(); }
    const std::vector<Project>& entries() const { return entries_; }

private:
    std::vector<Project> entries_;
};

} // namespace dailyd
