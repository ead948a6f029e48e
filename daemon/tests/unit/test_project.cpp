/**
 * @file test_project.cpp
 * @brief Unit tests for the project data model
 */

#include <gtest/gtest.h>
#include "dailyd/errors.h"
#include "dailyd/logger.h"
#include "dailyd/models/project.h"
#include "test_support.h"

using dailyd::json;

class ProjectTest : public ::testing::Test {
protected:
    void SetUp() override {
        dailyd::Logger::init(dailyd::LogLevel::ERROR, false);
    }

    void TearDown() override {
        dailyd::Logger::shutdown();
    }

    json valid_draft() {
        return json::parse(dailyd::testing::project_drafts(1))[0];
    }
};

// ============================================================================
// Project parsing and validation
// ============================================================================

TEST_F(ProjectTest, ParsesValidDraft) {
    std::string error;
    auto project = dailyd::Project::from_json(valid_draft(), error);

    ASSERT_TRUE(project.has_value()) << error;
    EXPECT_EQ(project->title, "Generated Idea 1");
    EXPECT_EQ(project->difficulty, dailyd::Difficulty::BEGINNER);
    ASSERT_EQ(project->technologies.size(), 2u);
    EXPECT_EQ(project->technologies[0].kind, dailyd::TechnologyKind::FRONTEND);
    EXPECT_EQ(project->features.size(), 3u);
}

TEST_F(ProjectTest, RejectsShortTitle) {
    auto draft = valid_draft();
    draft["title"] = "App";

    std::string error;
    EXPECT_FALSE(dailyd::Project::from_json(draft, error).has_value());
    EXPECT_NE(error.find("title"), std::string::npos);
}

TEST_F(ProjectTest, RejectsUnknownDifficulty) {
    auto draft = valid_draft();
    draft["difficulty"] = "expert";

    std::string error;
    EXPECT_FALSE(dailyd::Project::from_json(draft, error).has_value());
    EXPECT_NE(error.find("difficulty"), std::string::npos);
}

TEST_F(ProjectTest, RejectsMissingTechnologies) {
    auto draft = valid_draft();
    draft["technologies"] = json::array();

    std::string error;
    EXPECT_FALSE(dailyd::Project::from_json(draft, error).has_value());
}

TEST_F(ProjectTest, RejectsNonStringFeature) {
    auto draft = valid_draft();
    draft["features"] = json::array({"ok", 42});

    std::string error;
    EXPECT_FALSE(dailyd::Project::from_json(draft, error).has_value());
}

TEST_F(ProjectTest, UnknownTechnologyKindMapsToOther) {
    auto draft = valid_draft();
    draft["technologies"][0]["kind"] = "framework";

    std::string error;
    auto project = dailyd::Project::from_json(draft, error);
    ASSERT_TRUE(project.has_value()) << error;
    EXPECT_EQ(project->technologies[0].kind, dailyd::TechnologyKind::OTHER);
}

TEST_F(ProjectTest, DifficultyParsingIsCaseInsensitive) {
    EXPECT_EQ(dailyd::difficulty_from_string("Advanced"), dailyd::Difficulty::ADVANCED);
    EXPECT_FALSE(dailyd::difficulty_from_string("hard").has_value());
}

// ============================================================================
// DailyBatch
// ============================================================================

TEST_F(ProjectTest, BatchSurvivesSerialization) {
    std::string error;
    dailyd::DailyBatch batch;
    batch.date = "2025-03-14";
    batch.source = dailyd::ProjectSource::FALLBACK;
    batch.degraded = true;
    batch.notes = {"category filter relaxed"};
    batch.generation_id = "gen-1";
    batch.generated_at = dailyd::testing::fixed_noon();
    batch.projects.push_back(*dailyd::Project::from_json(valid_draft(), error));
    batch.projects[0].id = "2025-03-14-1";

    auto restored = dailyd::DailyBatch::deserialize(batch.serialize(), error);

    ASSERT_TRUE(restored.has_value()) << error;
    EXPECT_EQ(restored->date, "2025-03-14");
    EXPECT_EQ(restored->source, dailyd::ProjectSource::FALLBACK);
    EXPECT_TRUE(restored->degraded);
    EXPECT_EQ(restored->generation_id, "gen-1");
    EXPECT_EQ(restored->generated_at, batch.generated_at);
    ASSERT_EQ(restored->projects.size(), 1u);
    EXPECT_EQ(restored->projects[0].id, "2025-03-14-1");
}

TEST_F(ProjectTest, BatchWithInvalidUtf8StillSerializes) {
    std::string error;
    dailyd::DailyBatch batch;
    batch.date = "2025-03-14";
    batch.generated_at = dailyd::testing::fixed_noon();
    batch.projects.push_back(*dailyd::Project::from_json(valid_draft(), error));
    batch.projects[0].id = "2025-03-14-1";
    batch.projects[0].title = "Broken \xff title";

    std::string payload;
    ASSERT_NO_THROW(payload = batch.serialize());

    auto restored = dailyd::DailyBatch::deserialize(payload, error);
    ASSERT_TRUE(restored.has_value()) << error;
    EXPECT_EQ(restored->projects[0].title.find('\xff'), std::string::npos);
}

TEST_F(ProjectTest, CorruptBatchIsRejected) {
    std::string error;
    EXPECT_FALSE(dailyd::DailyBatch::deserialize("{not json", error).has_value());
    EXPECT_FALSE(dailyd::DailyBatch::deserialize(R"({"date":"2025-03-14","source":"ai","projects":[]})", error)
                     .has_value());
}

TEST_F(ProjectTest, BatchJsonReportsCount) {
    std::string error;
    dailyd::DailyBatch batch;
    batch.date = "2025-03-14";
    batch.projects.push_back(*dailyd::Project::from_json(valid_draft(), error));

    auto j = batch.to_json();
    EXPECT_EQ(j["count"], 1);
    EXPECT_EQ(j["source"], "ai");
}

// ============================================================================
// GenerationRequest
// ============================================================================

TEST_F(ProjectTest, RequestDefaults) {
    auto request = dailyd::GenerationRequest::from_json(json::object());
    EXPECT_EQ(request.count, 5);
    EXPECT_TRUE(request.difficulty_preference.empty());
    EXPECT_FALSE(request.category_preference.has_value());
    EXPECT_FALSE(request.force_regenerate);
}

TEST_F(ProjectTest, RequestParsesPreferences) {
    auto request = dailyd::GenerationRequest::from_json({
        {"count", 3},
        {"difficulty_preference", {"beginner", "advanced"}},
        {"category_preference", "Data Analysis"},
        {"force_regenerate", true}
    });

    EXPECT_EQ(request.count, 3);
    EXPECT_EQ(request.difficulty_preference.size(), 2u);
    EXPECT_EQ(request.category_preference.value_or(""), "Data Analysis");
    EXPECT_TRUE(request.force_regenerate);

    auto constraints = request.constraints();
    EXPECT_EQ(constraints.category, "Data Analysis");
    EXPECT_EQ(constraints.difficulties.count(dailyd::Difficulty::ADVANCED), 1u);
}

TEST_F(ProjectTest, RequestRejectsBadTypes) {
    EXPECT_THROW(dailyd::GenerationRequest::from_json({{"count", "five"}}), dailyd::ValidationError);
    EXPECT_THROW(dailyd::GenerationRequest::from_json({{"difficulty_preference", {"expert"}}}),
                 dailyd::ValidationError);
    EXPECT_THROW(dailyd::GenerationRequest::from_json(json::array()), dailyd::ValidationError);
}

TEST_F(ProjectTest, RequestRejectsCountOutsideIntRange) {
    // Would wrap to 1 if narrowed unchecked
    try {
        dailyd::GenerationRequest::from_json(json::parse(R"({"count": 4294967297})"));
        FAIL() << "count 2^32+1 accepted";
    } catch (const dailyd::ValidationError& e) {
        EXPECT_EQ(e.field(), "count");
    }
    EXPECT_THROW(dailyd::GenerationRequest::from_json({{"count", -4294967295LL}}), dailyd::ValidationError);
    EXPECT_THROW(dailyd::GenerationRequest::from_json({{"count", 2.5}}), dailyd::ValidationError);
}

TEST_F(ProjectTest, CheckedIntAcceptsFullIntRange) {
    EXPECT_EQ(dailyd::checked_int(json(2147483647), "n"), 2147483647);
    EXPECT_EQ(dailyd::checked_int(json(-2147483647LL - 1), "n"), -2147483647 - 1);
    EXPECT_EQ(dailyd::checked_int(json::parse("7"), "n"), 7);
    EXPECT_THROW(dailyd::checked_int(json(2147483648LL), "n"), dailyd::ValidationError);
    EXPECT_THROW(dailyd::checked_int(json::parse("18446744073709551615"), "n"), dailyd::ValidationError);
}

TEST_F(ProjectTest, RequestValidatesCountRange) {
    dailyd::GenerationRequest request;
    request.count = 0;
    try {
        request.validate(10);
        FAIL() << "count 0 accepted";
    } catch (const dailyd::ValidationError& e) {
        EXPECT_EQ(e.field(), "count");
    }

    request.count = 11;
    EXPECT_THROW(request.validate(10), dailyd::ValidationError);

    request.count = 10;
    EXPECT_NO_THROW(request.validate(10));
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(ProjectTest, DateHelpers) {
    EXPECT_TRUE(dailyd::is_valid_date("2024-02-29"));
    EXPECT_FALSE(dailyd::is_valid_date("2025-02-29"));
    EXPECT_FALSE(dailyd::is_valid_date("2025-3-14"));
    EXPECT_EQ(dailyd::shift_date("2025-03-01", -1).value_or(""), "2025-02-28");
    EXPECT_EQ(dailyd::format_date(dailyd::testing::fixed_noon()), "2025-03-14");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
