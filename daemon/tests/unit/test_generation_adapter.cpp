/**
 * @file test_generation_adapter.cpp
 * @brief Unit tests for prompting, parsing, retries and padding
 */

#include <gtest/gtest.h>
#include <chrono>
#include "dailyd/llm/generation_adapter.h"
#include "dailyd/logger.h"
#include "test_support.h"

using namespace std::chrono_literals;
using dailyd::GeneratorReply;
using dailyd::GeneratorStatus;
using dailyd::GenerationFailure;
using dailyd::testing::ScriptedGenerator;
using dailyd::testing::project_drafts;

class GenerationAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dailyd::Logger::init(dailyd::LogLevel::CRITICAL, false);
        catalog_ = std::make_shared<const dailyd::TemplateCatalog>(dailyd::TemplateCatalog::builtin());

        settings_.timeout = 500ms;
        settings_.max_retries = 1;
        settings_.retry_backoff = 1ms;
    }

    void TearDown() override {
        dailyd::Logger::shutdown();
    }

    dailyd::GenerationAdapter make_adapter(std::shared_ptr<ScriptedGenerator> generator) {
        return dailyd::GenerationAdapter(generator, catalog_, settings_);
    }

    dailyd::GenerationRequest request(int count) {
        dailyd::GenerationRequest r;
        r.count = count;
        return r;
    }

    std::shared_ptr<const dailyd::TemplateCatalog> catalog_;
    dailyd::AdapterSettings settings_;
};

// ============================================================================
// parse_response()
// ============================================================================

TEST_F(GenerationAdapterTest, ParseExtractsArrayFromSurroundingText) {
    auto drafts = dailyd::GenerationAdapter::parse_response(
        "Sure! Here are your ideas:\n```json\n" + project_drafts(2) + "\n```\nEnjoy.");

    EXPECT_TRUE(drafts.error.empty());
    ASSERT_EQ(drafts.projects.size(), 2u);
    EXPECT_EQ(drafts.projects[0].source, dailyd::ProjectSource::AI);
    EXPECT_TRUE(drafts.projects[0].id.empty());
}

TEST_F(GenerationAdapterTest, ParseDropsInvalidAndDuplicateDrafts) {
    auto items = dailyd::json::parse(project_drafts(3));
    items[1]["difficulty"] = "legendary";
    items.push_back(items[0]);

    auto drafts = dailyd::GenerationAdapter::parse_response(items.dump());
    EXPECT_EQ(drafts.projects.size(), 2u);
    EXPECT_EQ(drafts.rejected, 2u);
}

TEST_F(GenerationAdapterTest, ParseReportsMissingArray) {
    auto drafts = dailyd::GenerationAdapter::parse_response("I cannot help with that.");
    EXPECT_TRUE(drafts.projects.empty());
    EXPECT_FALSE(drafts.error.empty());
}

TEST_F(GenerationAdapterTest, ParseReportsBrokenJson) {
    auto drafts = dailyd::GenerationAdapter::parse_response("[{\"title\": \"unterminated]");
    EXPECT_TRUE(drafts.projects.empty());
    EXPECT_FALSE(drafts.error.empty());
}

// ============================================================================
// build_prompt()
// ============================================================================

TEST_F(GenerationAdapterTest, PromptCarriesCountYearAndMix) {
    auto prompt = dailyd::GenerationAdapter::build_prompt(request(5), 2025);

    EXPECT_NE(prompt.find("exactly 5"), std::string::npos);
    EXPECT_NE(prompt.find("2025"), std::string::npos);
    EXPECT_NE(prompt.find("1 beginner, 2 intermediate, 2 advanced"), std::string::npos);
}

TEST_F(GenerationAdapterTest, PromptCarriesPreferences) {
    auto r = request(3);
    r.difficulty_preference = {dailyd::Difficulty::ADVANCED};
    r.category_preference = "Data Analysis";

    auto prompt = dailyd::GenerationAdapter::build_prompt(r, 2025);
    EXPECT_NE(prompt.find("preferably advanced"), std::string::npos);
    EXPECT_NE(prompt.find("Data Analysis"), std::string::npos);
}

// ============================================================================
// generate()
// ============================================================================

TEST_F(GenerationAdapterTest, FullReplyIsNotDegraded) {
    auto generator = ScriptedGenerator::always(GeneratorReply::success(project_drafts(5)));
    auto adapter = make_adapter(generator);

    auto outcome = adapter.generate(request(5), "2025-03-14");

    EXPECT_EQ(outcome.failure, GenerationFailure::NONE);
    EXPECT_EQ(outcome.projects.size(), 5u);
    EXPECT_EQ(outcome.attempts, 1);
    EXPECT_EQ(outcome.padded, 0u);
    EXPECT_NE(generator->last_prompt().find("2025"), std::string::npos);
}

TEST_F(GenerationAdapterTest, SurplusDraftsAreTrimmed) {
    auto adapter = make_adapter(ScriptedGenerator::always(GeneratorReply::success(project_drafts(7))));

    auto outcome = adapter.generate(request(5), "2025-03-14");
    EXPECT_EQ(outcome.failure, GenerationFailure::NONE);
    EXPECT_EQ(outcome.projects.size(), 5u);
}

TEST_F(GenerationAdapterTest, ShortReplyIsPaddedFromCatalog) {
    auto adapter = make_adapter(ScriptedGenerator::always(GeneratorReply::success(project_drafts(4))));

    auto outcome = adapter.generate(request(5), "2025-03-14");

    EXPECT_EQ(outcome.failure, GenerationFailure::DEGRADED);
    ASSERT_EQ(outcome.projects.size(), 5u);
    EXPECT_EQ(outcome.padded, 1u);
    EXPECT_EQ(outcome.projects[3].source, dailyd::ProjectSource::AI);
    EXPECT_EQ(outcome.projects[4].source, dailyd::ProjectSource::FALLBACK);
    EXPECT_FALSE(outcome.notes.empty());
}

TEST_F(GenerationAdapterTest, TransientFailureIsRetriedOnce) {
    auto generator = std::make_shared<ScriptedGenerator>(std::deque<GeneratorReply>{
        GeneratorReply::failure(GeneratorStatus::TRANSIENT, "decode failed"),
        GeneratorReply::success(project_drafts(5))
    });
    auto adapter = make_adapter(generator);

    auto outcome = adapter.generate(request(5), "2025-03-14");

    EXPECT_EQ(outcome.failure, GenerationFailure::NONE);
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(generator->calls(), 2);
}

TEST_F(GenerationAdapterTest, RetriesAreBounded) {
    auto generator = ScriptedGenerator::always(GeneratorReply::failure(GeneratorStatus::TRANSIENT, "flaky"));
    settings_.max_retries = 2;
    auto adapter = make_adapter(generator);

    auto outcome = adapter.generate(request(5), "2025-03-14");

    EXPECT_EQ(outcome.failure, GenerationFailure::UNAVAILABLE);
    EXPECT_TRUE(outcome.projects.empty());
    EXPECT_EQ(generator->calls(), 3);
}

TEST_F(GenerationAdapterTest, QuotaFailureIsNotRetried) {
    auto generator = ScriptedGenerator::always(GeneratorReply::failure(GeneratorStatus::NO_QUOTA, "quota"));
    auto adapter = make_adapter(generator);

    auto outcome = adapter.generate(request(5), "2025-03-14");

    EXPECT_EQ(outcome.failure, GenerationFailure::UNAVAILABLE);
    EXPECT_EQ(generator->calls(), 1);
    EXPECT_NE(outcome.error.find("no_quota"), std::string::npos);
}

TEST_F(GenerationAdapterTest, UnparseableReplyIsUnavailable) {
    auto generator = ScriptedGenerator::always(GeneratorReply::success("no json here"));
    auto adapter = make_adapter(generator);

    auto outcome = adapter.generate(request(5), "2025-03-14");

    EXPECT_EQ(outcome.failure, GenerationFailure::UNAVAILABLE);
    EXPECT_EQ(generator->calls(), 1);
}

TEST_F(GenerationAdapterTest, SlowGeneratorTimesOutAndIsCancelled) {
    auto generator = ScriptedGenerator::always(GeneratorReply::success(project_drafts(5)), 2000ms);
    settings_.timeout = 50ms;
    settings_.max_retries = 0;
    auto adapter = make_adapter(generator);

    auto started = std::chrono::steady_clock::now();
    auto outcome = adapter.generate(request(5), "2025-03-14");
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.failure, GenerationFailure::UNAVAILABLE);
    EXPECT_NE(outcome.error.find("timeout"), std::string::npos);
    EXPECT_LT(elapsed, 1000ms);

    // The abandoned call notices the cancellation flag
    for (int i = 0; i < 100 && generator->cancelled() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(generator->cancelled(), 1);
}

TEST_F(GenerationAdapterTest, MissingGeneratorIsUnavailable) {
    dailyd::GenerationAdapter adapter(nullptr, catalog_, settings_);

    EXPECT_FALSE(adapter.available());
    EXPECT_STREQ(adapter.generator_name(), "none");
    EXPECT_EQ(adapter.generate(request(5), "2025-03-14").failure, GenerationFailure::UNAVAILABLE);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
