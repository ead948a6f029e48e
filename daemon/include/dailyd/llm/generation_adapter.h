/**
 * @file generation_adapter.h
 * @brief Prompting, timeout, retry and validation around an IdeaGenerator
 */

#pragma once

#include "dailyd/fallback/template_catalog.h"
#include "dailyd/llm/generator.h"
#include "dailyd/models/project.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace dailyd {

/**
 * @brief How a generation ended
 */
enum class GenerationFailure {
    NONE,         // every project came from the generator
    DEGRADED,     // partial parse, padded from the catalog
    UNAVAILABLE   // nothing usable; caller falls back entirely
};

const char* to_string(GenerationFailure failure);

/**
 * @brief Result of GenerationAdapter::generate
 *
 * projects holds exactly the requested count unless failure is UNAVAILABLE,
 * in which case it is empty. Ids and timestamps are left for the caller.
 */
struct GenerationOutcome {
    std::vector<Project> projects;
    GenerationFailure failure = GenerationFailure::NONE;
    std::vector<std::string> notes;
    std::string error;
    int attempts = 0;
    size_t padded = 0;

    bool usable() const { return failure != GenerationFailure::UNAVAILABLE; }
};

/**
 * @brief Drafts extracted from raw generator text
 */
struct ParsedDrafts {
    std::vector<Project> projects;
    size_t rejected = 0;
    std::string error;  // set when no array could be decoded
};

struct AdapterSettings {
    std::chrono::milliseconds timeout{DEFAULT_GENERATION_TIMEOUT_SEC * 1000};
    int max_retries = DEFAULT_GENERATION_RETRIES;
    std::chrono::milliseconds retry_backoff{DEFAULT_RETRY_BACKOFF_MS};
    int max_tokens = 2000;
    float temperature = 0.8f;
};

/**
 * @brief Turns a GenerationRequest into validated projects
 *
 * TIMEOUT and TRANSIENT replies are retried up to max_retries times with a
 * linear backoff. Quota, connectivity and rejection failures, and replies
 * with no valid project, are not retried.
 */
class GenerationAdapter {
public:
    GenerationAdapter(std::shared_ptr<IdeaGenerator> generator,
                      std::shared_ptr<const TemplateCatalog> catalog,
                      AdapterSettings settings = {});

    /**
     * @brief Generate request.count projects
     * @param request Validated request
     * @param seed Catalog seed used for padding (the batch date)
     */
    GenerationOutcome generate(const GenerationRequest& request, const std::string& seed);

    /**
     * @brief Whether the underlying generator can be tried at all
     */
    bool available() const;

    const char* generator_name() const;

    static std::string build_prompt(const GenerationRequest& request, int year);

    /**
     * @brief Extract the outermost JSON array and keep the valid entries
     */
    static ParsedDrafts parse_response(const std::string& text);

private:
    std::shared_ptr<IdeaGenerator> generator_;
    std::shared_ptr<const TemplateCatalog> catalog_;
    AdapterSettings settings_;

    GeneratorReply call_with_timeout(const std::string& prompt,
                                     const GenerationConstraints& constraints);
};

} // namespace dailyd
