/**
 * @file test_logger.cpp
 * @brief Unit tests for structured records and degradation counters
 */

#include <gtest/gtest.h>
#include <mutex>
#include <vector>
#include "dailyd/logger.h"

using dailyd::Degradation;
using dailyd::LogFields;
using dailyd::LogLevel;
using dailyd::LogRecord;
using dailyd::Logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init(LogLevel::INFO, false);
        Logger::set_sink([this](const LogRecord& record) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back(record);
        });
    }

    void TearDown() override {
        Logger::shutdown();
    }

    std::vector<LogRecord> records() {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    std::mutex mutex_;
    std::vector<LogRecord> records_;
};

TEST_F(LoggerTest, RecordsBelowLevelAreDropped) {
    LOG_DEBUG("Test", "hidden");
    LOG_INFO("Test", "shown");
    LOG_ERROR("Test", "also shown");

    auto seen = records();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].message, "shown");
    EXPECT_EQ(seen[1].level, LogLevel::ERROR);
    EXPECT_EQ(seen[1].component, "Test");
}

TEST_F(LoggerTest, SetLevelTakesEffectImmediately) {
    Logger::set_level(LogLevel::WARN);
    LOG_INFO("Test", "hidden");
    EXPECT_TRUE(records().empty());
    EXPECT_EQ(Logger::get_level(), LogLevel::WARN);
}

TEST_F(LoggerTest, FieldsTravelWithTheRecord) {
    Logger::log(LogLevel::INFO, "Orchestrator", "published",
                LogFields::for_key("daily:2025-03-14:5").generation("abc-123"));

    auto seen = records();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].fields.cache_key, "daily:2025-03-14:5");
    EXPECT_EQ(seen[0].fields.generation_id, "abc-123");
    EXPECT_TRUE(seen[0].fields.caller.empty());
    EXPECT_FALSE(seen[0].fields.degradation.has_value());
}

TEST_F(LoggerTest, DegradedLogsAtWarnAndCounts) {
    Logger::degraded("RateLimiter", Degradation::RATE_FAIL_OPEN, "store down",
                     LogFields::for_caller("uid:1000"));
    Logger::degraded("RateLimiter", Degradation::RATE_FAIL_OPEN, "store down");
    Logger::degraded("Orchestrator", Degradation::POOL_FALLBACK, "pooled");

    auto seen = records();
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].level, LogLevel::WARN);
    EXPECT_EQ(seen[0].fields.caller, "uid:1000");
    ASSERT_TRUE(seen[0].fields.degradation.has_value());
    EXPECT_EQ(*seen[0].fields.degradation, Degradation::RATE_FAIL_OPEN);

    EXPECT_EQ(Logger::degradation_count(Degradation::RATE_FAIL_OPEN), 2u);
    EXPECT_EQ(Logger::degradation_count(Degradation::POOL_FALLBACK), 1u);
    EXPECT_EQ(Logger::degradation_count(Degradation::CACHE_BYPASS), 0u);

    auto counts = Logger::degradation_counts();
    EXPECT_EQ(counts.size(), dailyd::DEGRADATION_KINDS);
    EXPECT_EQ(counts["rate_fail_open"], 2);
    EXPECT_EQ(counts["pool_fallback"], 1);
    EXPECT_EQ(counts["wait_expired"], 0);
}

TEST_F(LoggerTest, DegradationsAreCountedEvenWhenFiltered) {
    Logger::set_level(LogLevel::ERROR);
    Logger::degraded("Orchestrator", Degradation::CACHE_BYPASS, "no cache");

    EXPECT_TRUE(records().empty());
    EXPECT_EQ(Logger::degradation_count(Degradation::CACHE_BYPASS), 1u);
}

TEST_F(LoggerTest, InitResetsCounters) {
    Logger::degraded("Orchestrator", Degradation::PADDED, "short reply");
    Logger::init(LogLevel::INFO, false);

    EXPECT_EQ(Logger::degradation_count(Degradation::PADDED), 0u);
}

TEST_F(LoggerTest, FormatAppendsOnlySetFields) {
    LogRecord record;
    record.level = LogLevel::WARN;
    record.component = "Orchestrator";
    record.message = "Serving template batch";
    EXPECT_EQ(Logger::format(record), "[WARN] Orchestrator: Serving template batch");

    record.fields = LogFields::for_key("daily:2025-03-14:5");
    record.fields.degradation = Degradation::TEMPLATE_FALLBACK;
    EXPECT_EQ(Logger::format(record),
              "[WARN] Orchestrator: Serving template batch key=daily:2025-03-14:5 degradation=template_fallback");
}

TEST_F(LoggerTest, ShutdownDetachesSink) {
    Logger::shutdown();
    LOG_ERROR("Test", "after shutdown");

    EXPECT_TRUE(records().empty());
}

TEST(LoggerLevelTest, LevelFromIntClampsUnknownValues) {
    EXPECT_EQ(Logger::level_from_int(0), LogLevel::DEBUG);
    EXPECT_EQ(Logger::level_from_int(4), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::level_from_int(-1), LogLevel::INFO);
    EXPECT_EQ(Logger::level_from_int(9), LogLevel::INFO);
    EXPECT_STREQ(Logger::level_name(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(dailyd::to_string(Degradation::FILTER_WIDENED), "filter_widened");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
