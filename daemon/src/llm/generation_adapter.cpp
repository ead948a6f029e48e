/**
 * @file generation_adapter.cpp
 * @brief Generation adapter implementation
 */

#include "dailyd/llm/generation_adapter.h"
#include "dailyd/logger.h"
#include <algorithm>
#include <future>
#include <set>
#include <sstream>
#include <system_error>
#include <thread>

namespace dailyd {

namespace {

const char* SYSTEM_PROMPT =
    "You are a senior software architect and mentor who designs practical, "
    "motivating project ideas for developers of every level.\n"
    "Reply ONLY with a valid JSON array, without any text before or after it.\n\n"
    "Difficulty levels:\n"
    "- beginner: 1-3 days, basic concepts, few technologies\n"
    "- intermediate: 3-7 days, integrating systems, several technologies\n"
    "- advanced: 1-3 weeks, complex architecture, optimization work\n";

const char* CATEGORY_SUGGESTIONS =
    "Web Applications, Mobile Apps, Desktop Tools, APIs & Microservices, "
    "Data Analysis, Automation Tools";

std::string difficulty_mix(const GenerationRequest& request) {
    if (!request.difficulty_preference.empty()) {
        std::string mix = "preferably ";
        bool first = true;
        for (auto level : request.difficulty_preference) {
            if (!first) mix += ", ";
            mix += to_string(level);
            first = false;
        }
        return mix;
    }
    if (request.count == 5) {
        return "1 beginner, 2 intermediate, 2 advanced";
    }
    return "balanced across the " + std::to_string(request.count) + " projects";
}

bool retryable(GeneratorStatus status) {
    return status == GeneratorStatus::TIMEOUT || status == GeneratorStatus::TRANSIENT;
}

int year_of(const std::string& seed) {
    if (is_valid_date(seed)) {
        return std::stoi(seed.substr(0, 4));
    }
    return std::stoi(format_date(std::chrono::system_clock::now()).substr(0, 4));
}

} // namespace

const char* to_string(GenerationFailure failure) {
    switch (failure) {
        case GenerationFailure::NONE: return "none";
        case GenerationFailure::DEGRADED: return "degraded";
        case GenerationFailure::UNAVAILABLE: return "unavailable";
        default: return "unknown";
    }
}

GenerationAdapter::GenerationAdapter(std::shared_ptr<IdeaGenerator> generator,
                                     std::shared_ptr<const TemplateCatalog> catalog,
                                     AdapterSettings settings)
    : generator_(std::move(generator)),
      catalog_(std::move(catalog)),
      settings_(settings) {
}

bool GenerationAdapter::available() const {
    return generator_ && generator_->is_available();
}

const char* GenerationAdapter::generator_name() const {
    return generator_ ? generator_->name() : "none";
}

std::string GenerationAdapter::build_prompt(const GenerationRequest& request, int year) {
    std::ostringstream out;
    out << SYSTEM_PROMPT << "\n";
    out << "Generate exactly " << request.count
        << " unique and creative software project ideas for " << year << ".\n\n";
    out << "DIFFICULTY MIX: " << difficulty_mix(request) << "\n";
    if (request.category_preference && !request.category_preference->empty()) {
        out << "CATEGORY: preferably " << *request.category_preference << "\n";
    } else {
        out << "CATEGORY: vary between " << CATEGORY_SUGGESTIONS << "\n";
    }
    out << "\nEach array element must use exactly this JSON shape:\n"
        << "{\n"
        << "  \"title\": \"short memorable name (5-150 characters)\",\n"
        << "  \"description\": \"2-3 sentences on the problem solved and its value (20-800 characters)\",\n"
        << "  \"difficulty\": \"beginner|intermediate|advanced\",\n"
        << "  \"estimated_time\": \"realistic estimate, e.g. 2-3 days, 1 week\",\n"
        << "  \"category\": \"specific category\",\n"
        << "  \"technologies\": [\n"
        << "    {\"name\": \"technology\", \"kind\": \"frontend|backend|database|devops|mobile|other\","
        << " \"reason\": \"why it fits\"}\n"
        << "  ],\n"
        << "  \"features\": [\"concrete feature 1\", \"concrete feature 2\", \"concrete feature 3\"]\n"
        << "}\n\n"
        << "REQUIREMENTS:\n"
        << "1. Between 2 and 5 technologies per project\n"
        << "2. Features are concrete functionality, not generalities\n"
        << "3. Titles are unique\n"
        << "4. Technologies match the difficulty level\n\n"
        << "ANSWER ONLY WITH THE JSON ARRAY.\n";
    return out.str();
}

ParsedDrafts GenerationAdapter::parse_response(const std::string& text) {
    ParsedDrafts drafts;

    size_t start = text.find('[');
    size_t end = text.rfind(']');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        drafts.error = "no JSON array in response";
        return drafts;
    }

    json items = json::parse(text.substr(start, end - start + 1), nullptr, false);
    if (items.is_discarded() || !items.is_array()) {
        drafts.error = "response array is not valid JSON";
        return drafts;
    }

    std::set<std::string> titles;
    for (size_t i = 0; i < items.size(); ++i) {
        std::string error;
        auto project = Project::from_json(items[i], error);
        if (!project) {
            LOG_DEBUG("GenerationAdapter", "Draft " + std::to_string(i) + " rejected: " + error);
            drafts.rejected++;
            continue;
        }
        if (!titles.insert(project->title).second) {
            LOG_DEBUG("GenerationAdapter", "Draft " + std::to_string(i) + " rejected: duplicate title");
            drafts.rejected++;
            continue;
        }
        project->id.clear();
        project->generated_at = TimePoint{};
        project->source = ProjectSource::AI;
        drafts.projects.push_back(std::move(*project));
    }

    if (drafts.projects.empty()) {
        drafts.error = "no valid project in response";
    }
    return drafts;
}

GeneratorReply GenerationAdapter::call_with_timeout(const std::string& prompt,
                                                    const GenerationConstraints& constraints) {
    GeneratorOptions options;
    options.max_tokens = settings_.max_tokens;
    options.temperature = settings_.temperature;
    options.cancelled = std::make_shared<std::atomic<bool>>(false);

    // The worker owns everything it touches so it may outlive this call
    auto generator = generator_;
    auto task = std::make_shared<std::packaged_task<GeneratorReply()>>(
        [generator, prompt, constraints, options]() {
            return generator->generate(prompt, constraints, options);
        });
    std::future<GeneratorReply> result = task->get_future();
    try {
        std::thread([task]() { (*task)(); }).detach();
    } catch (const std::system_error& e) {
        return GeneratorReply::failure(GeneratorStatus::TRANSIENT,
                                       std::string("cannot start generation worker: ") + e.what());
    }

    if (result.wait_for(settings_.timeout) != std::future_status::ready) {
        options.cancelled->store(true);
        return GeneratorReply::failure(GeneratorStatus::TIMEOUT,
                                       "no reply within " + std::to_string(settings_.timeout.count()) + "ms");
    }

    try {
        return result.get();
    } catch (const std::exception& e) {
        return GeneratorReply::failure(GeneratorStatus::TRANSIENT,
                                       std::string("generator error: ") + e.what());
    }
}

GenerationOutcome GenerationAdapter::generate(const GenerationRequest& request, const std::string& seed) {
    GenerationOutcome outcome;
    const size_t count = static_cast<size_t>(request.count);

    if (!generator_) {
        outcome.failure = GenerationFailure::UNAVAILABLE;
        outcome.error = "no generator configured";
        return outcome;
    }

    const GenerationConstraints constraints = request.constraints();
    const std::string prompt = build_prompt(request, year_of(seed));
    const int max_attempts = 1 + std::max(0, settings_.max_retries);

    GeneratorReply reply;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        outcome.attempts = attempt;
        reply = call_with_timeout(prompt, constraints);
        if (reply.ok() || !retryable(reply.status) || attempt == max_attempts) {
            break;
        }
        LOG_WARN("GenerationAdapter", std::string("Attempt ") + std::to_string(attempt) + " failed (" +
                 to_string(reply.status) + "): " + reply.error + ", retrying");
        std::this_thread::sleep_for(settings_.retry_backoff * attempt);
    }

    if (!reply.ok()) {
        LOG_WARN("GenerationAdapter", std::string("Generation unavailable (") + to_string(reply.status) +
                 "): " + reply.error);
        outcome.failure = GenerationFailure::UNAVAILABLE;
        outcome.error = std::string(to_string(reply.status)) + ": " + reply.error;
        return outcome;
    }

    ParsedDrafts drafts = parse_response(reply.text);
    if (drafts.projects.empty()) {
        LOG_WARN("GenerationAdapter", "Generation unavailable: " + drafts.error);
        outcome.failure = GenerationFailure::UNAVAILABLE;
        outcome.error = drafts.error;
        return outcome;
    }

    if (drafts.projects.size() > count) {
        LOG_DEBUG("GenerationAdapter", "Trimming " + std::to_string(drafts.projects.size() - count) +
                  " surplus drafts");
        drafts.projects.resize(count);
    }
    outcome.projects = std::move(drafts.projects);

    if (outcome.projects.size() < count) {
        const size_t missing = count - outcome.projects.size();
        std::set<std::string> taken;
        for (const auto& p : outcome.projects) {
            taken.insert(p.title);
        }

        FallbackSelection padding = catalog_->sample(missing, constraints, seed, taken);
        for (auto& p : padding.projects) {
            outcome.projects.push_back(std::move(p));
        }
        outcome.padded = missing;
        outcome.failure = GenerationFailure::DEGRADED;
        outcome.notes.push_back(std::to_string(missing) + " of " + std::to_string(count) +
                                " projects padded from templates");
        for (auto& note : padding.notes) {
            outcome.notes.push_back(std::move(note));
        }
        Logger::degraded("GenerationAdapter", Degradation::PADDED,
                         "Partial generation, padded " + std::to_string(missing) + " projects from templates");
    }

    if (drafts.rejected > 0) {
        outcome.notes.push_back(std::to_string(drafts.rejected) + " malformed drafts dropped");
    }

    LOG_INFO("GenerationAdapter", "Generated " + std::to_string(outcome.projects.size()) +
             " projects in " + std::to_string(outcome.attempts) + " attempt(s)");
    return outcome;
}

} // namespace dailyd
