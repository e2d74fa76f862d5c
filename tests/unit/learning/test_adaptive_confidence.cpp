//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include "insight/learning/adaptive_confidence.h"
#include <filesystem>
#include <fstream>

using namespace insight::learning;
using namespace insight::core;
namespace fs = std::filesystem;

class AdaptiveConfidenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "insight_adaptive_confidence_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir / "learning");
        config.state_path = (temp_dir / "learning" / "patterns.json").string();
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    fs::path temp_dir;
    LearningConfig config;
    const PatternSignature n_plus_one{"db-n-plus-one", "query-in-loop", {"src/api/users.ts", 42}};
};

TEST_F(AdaptiveConfidenceTest, WithoutStoreReturnsBaseScore) {
    const AdaptiveConfidence adaptive;
    const ConfidenceFactors factors{100, 100, 100};

    const auto result = adaptive.calculate(factors, n_plus_one);
    const auto base = ConfidenceCalculator::calculate(factors);

    EXPECT_FALSE(adaptive.has_store());
    EXPECT_EQ(result.score, base.score);
    EXPECT_EQ(result.explanation, base.explanation);
}

TEST_F(AdaptiveConfidenceTest, UnknownPatternUsesFamilyDefault) {
    PatternStore store(config);
    const AdaptiveConfidence adaptive(store);

    const auto result = adaptive.calculate({90, 80, 72}, n_plus_one);
    const auto expected = ConfidenceCalculator::calculate({90, 80, 72, 85.0});

    EXPECT_TRUE(adaptive.has_store());
    EXPECT_EQ(result.score, 83);
    EXPECT_EQ(result.score, expected.score);
    EXPECT_EQ(result.explanation, expected.explanation);
}

TEST_F(AdaptiveConfidenceTest, ReliablePatternIsBoosted) {
    PatternStore store(config);
    for (int i = 0; i < 20; ++i) {
        store.record_success(n_plus_one, 80.0);
    }
    const AdaptiveConfidence adaptive(store);

    const auto result = adaptive.calculate({70, 70, 70}, n_plus_one);

    EXPECT_EQ(result.score, 88);
    EXPECT_EQ(result.level, ConfidenceLevel::HIGH);
    EXPECT_EQ(result.explanation,
              "88% high: strong pattern match, appropriate context, good code structure, "
              "excellent historical accuracy (adjusted +15% based on 100% historical accuracy)");
}

TEST_F(AdaptiveConfidenceTest, NoisyPatternIsPenalized) {
    PatternStore store(config);
    for (int i = 0; i < 4; ++i) {
        store.record_success(n_plus_one, 70.0);
    }
    for (int i = 0; i < 6; ++i) {
        store.record_failure(n_plus_one, 70.0);
    }
    const AdaptiveConfidence adaptive(store);

    const auto result = adaptive.calculate({90, 90, 90}, n_plus_one);

    EXPECT_EQ(result.score, 60);
    EXPECT_EQ(result.level, ConfidenceLevel::MEDIUM);
    EXPECT_NE(result.explanation.find("(adjusted -25% based on 40% historical accuracy)"), std::string::npos);
}

TEST_F(AdaptiveConfidenceTest, SkippedPatternIsSuppressed) {
    PatternStore store(config);
    for (int i = 0; i < 10; ++i) {
        store.record_failure(n_plus_one, 70.0);
    }
    ASSERT_TRUE(store.get_pattern(n_plus_one)->lifecycle.skip_in_future);
    const AdaptiveConfidence adaptive(store);

    const auto result = adaptive.calculate({100, 100, 100}, n_plus_one);

    EXPECT_EQ(result.score, 0);
    EXPECT_EQ(result.level, ConfidenceLevel::VERY_LOW);
    EXPECT_TRUE(result.explanation.ends_with(" (suppressed: pattern marked to skip)"));
}

TEST_F(AdaptiveConfidenceTest, CorruptStateFallsBackToBaseScore) {
    std::ofstream(config.state_path) << "{ not json";
    PatternStore store(config);
    const AdaptiveConfidence adaptive(store);
    const ConfidenceFactors factors{80, 90, 70, 50.0};

    const auto base = ConfidenceCalculator::calculate(factors);

    const auto first = adaptive.calculate(factors, n_plus_one);
    const auto second = adaptive.calculate(factors, n_plus_one);

    EXPECT_EQ(first.score, base.score);
    EXPECT_EQ(first.explanation, base.explanation);
    EXPECT_EQ(second.score, base.score);
    EXPECT_EQ(second.explanation, base.explanation);
}

TEST_F(AdaptiveConfidenceTest, CorruptStateKeepsBaseScoreAfterLazyLoad) {
    std::ofstream(config.state_path) << "{ not json";
    PatternStore store(config);
    const AdaptiveConfidence adaptive(store);
    const ConfidenceFactors factors{80, 80, 80};

    adaptive.record_outcome(n_plus_one, true, 80.0);
    const auto result = adaptive.calculate(factors, n_plus_one);

    EXPECT_EQ(result.score, ConfidenceCalculator::calculate(factors).score);
    EXPECT_EQ(result.explanation, ConfidenceCalculator::calculate(factors).explanation);
}

TEST_F(AdaptiveConfidenceTest, RecordOutcomeForwardsToStore) {
    PatternStore store(config);
    const AdaptiveConfidence adaptive(store);

    adaptive.record_outcome(n_plus_one, true, 90.0);
    adaptive.record_outcome(n_plus_one, false, 40.0, PatternContext{"express", "api-route", {}, {}, {}});

    const auto record = store.get_pattern(n_plus_one);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->performance.success_count, 1u);
    EXPECT_EQ(record->performance.failure_count, 1u);
    EXPECT_DOUBLE_EQ(record->performance.avg_confidence, 65.0);
    EXPECT_EQ(record->context.framework, "express");
}

TEST_F(AdaptiveConfidenceTest, RecordOutcomeWithoutStoreIsNoOp) {
    const AdaptiveConfidence adaptive;

    adaptive.record_outcome(n_plus_one, true, 90.0);

    EXPECT_FALSE(fs::exists(config.state_path));
}
