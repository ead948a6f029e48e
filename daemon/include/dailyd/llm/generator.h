/**
 * @file generator.h
 * @brief Text generation interface used by the generation adapter
 */

#pragma once

#include "dailyd/models/project.h"
#include <atomic>
#include <memory>
#include <string>

namespace dailyd {

/**
 * @brief Outcome class of a generation call
 */
enum class GeneratorStatus {
    OK,
    TIMEOUT,       // backend did not answer in time
    TRANSIENT,     // temporary failure, worth one retry
    NO_QUOTA,      // backend refuses work until quota resets
    UNREACHABLE,   // backend missing or not loaded
    REJECTED       // request refused (prompt too long, content policy)
};

const char* to_string(GeneratorStatus status);

/**
 * @brief Raw reply from a generator
 */
struct GeneratorReply {
    GeneratorStatus status = GeneratorStatus::OK;
    std::string text;
    std::string error;

    bool ok() const { return status == GeneratorStatus::OK; }

    static GeneratorReply success(std::string text) {
        GeneratorReply r;
        r.text = std::move(text);
        return r;
    }

    static GeneratorReply failure(GeneratorStatus status, std::string error) {
        GeneratorReply r;
        r.status = status;
        r.error = std::move(error);
        return r;
    }
};

/**
 * @brief Sampling options for one completion
 */
struct GeneratorOptions {
    int max_tokens = 2000;
    float temperature = 0.8f;
    float top_p = 0.95f;
    // Set by the caller when it stops waiting; generators poll it
    std::shared_ptr<std::atomic<bool>> cancelled;
};

/**
 * @brief Something that turns a prompt into text
 *
 * Implementations must be safe to call from several threads; a call that
 * outlives the caller's timeout should notice options.cancelled.
 */
class IdeaGenerator {
public:
    virtual ~IdeaGenerator() = default;

    /**
     * @param prompt Full prompt text
     * @param constraints Filters the prompt encodes, for backends that use them directly
     * @param options Sampling options and cancellation flag
     */
    virtual GeneratorReply generate(const std::string& prompt,
                                    const GenerationConstraints& constraints,
                                    const GeneratorOptions& options) = 0;

    virtual const char* name() const = 0;

    /**
     * @brief Whether a call has a chance of succeeding right now
     */
    virtual bool is_available() const = 0;
};

} // namespace dailyd
