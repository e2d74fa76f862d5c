//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include "insight/learning/confidence_calculator.h"

using namespace insight::learning;

TEST(ConfidenceCalculatorTest, PerfectFactors) {
    const auto result = ConfidenceCalculator::calculate({100, 100, 100, 100});

    EXPECT_EQ(result.score, 100);
    EXPECT_EQ(result.level, ConfidenceLevel::VERY_HIGH);
    EXPECT_EQ(result.breakdown.pattern_match, 40);
    EXPECT_EQ(result.breakdown.context, 30);
    EXPECT_EQ(result.breakdown.structure, 20);
    EXPECT_EQ(result.breakdown.historical, 10);
    EXPECT_EQ(result.explanation,
              "100% very-high: exact pattern match, highly appropriate context, "
              "good code structure, excellent historical accuracy");
}

TEST(ConfidenceCalculatorTest, ZeroFactors) {
    const auto result = ConfidenceCalculator::calculate({0, 0, 0, 0.0});

    EXPECT_EQ(result.score, 0);
    EXPECT_EQ(result.level, ConfidenceLevel::VERY_LOW);
}

TEST(ConfidenceCalculatorTest, MissingHistoricalCountsAsDefault) {
    const auto implicit = ConfidenceCalculator::calculate({90, 80, 72});
    const auto explicit_default = ConfidenceCalculator::calculate({90, 80, 72, 75.0});

    EXPECT_EQ(implicit.score, 82);
    EXPECT_EQ(implicit.level, ConfidenceLevel::HIGH);
    EXPECT_EQ(implicit.score, explicit_default.score);
    EXPECT_EQ(implicit.explanation, explicit_default.explanation);
}

TEST(ConfidenceCalculatorTest, FactorsAreClamped) {
    const auto result = ConfidenceCalculator::calculate({150, -20, 100, 200});

    EXPECT_EQ(result.score, 70);
    EXPECT_EQ(result.level, ConfidenceLevel::MEDIUM);
    EXPECT_EQ(result.breakdown.pattern_match, 40);
    EXPECT_EQ(result.breakdown.context, 0);
    EXPECT_EQ(result.breakdown.historical, 10);
}

TEST(ConfidenceCalculatorTest, LevelBands) {
    EXPECT_EQ(ConfidenceCalculator::level_for(90), ConfidenceLevel::VERY_HIGH);
    EXPECT_EQ(ConfidenceCalculator::level_for(89), ConfidenceLevel::HIGH);
    EXPECT_EQ(ConfidenceCalculator::level_for(75), ConfidenceLevel::HIGH);
    EXPECT_EQ(ConfidenceCalculator::level_for(74), ConfidenceLevel::MEDIUM);
    EXPECT_EQ(ConfidenceCalculator::level_for(50), ConfidenceLevel::MEDIUM);
    EXPECT_EQ(ConfidenceCalculator::level_for(49), ConfidenceLevel::LOW);
    EXPECT_EQ(ConfidenceCalculator::level_for(30), ConfidenceLevel::LOW);
    EXPECT_EQ(ConfidenceCalculator::level_for(29), ConfidenceLevel::VERY_LOW);
}

TEST(ConfidenceCalculatorTest, ExplanationForWeakFinding) {
    const auto result = ConfidenceCalculator::calculate({40, 20, 40, 40.0});

    EXPECT_EQ(result.score, 34);
    EXPECT_EQ(result.explanation,
              "34% low: weak pattern match, wrong context - likely false positive, "
              "poor structure, low historical accuracy");
}

TEST(ConfidenceCalculatorTest, ExplanationForMiddleBands) {
    const std::string text = ConfidenceCalculator::explain(60, ConfidenceLevel::MEDIUM, {75, 65, 55, 60.0});

    EXPECT_EQ(text, "60% medium: strong pattern match, appropriate context, "
                    "acceptable structure, moderate historical accuracy");
}

TEST(ConfidenceCalculatorTest, FactorTables) {
    EXPECT_EQ(pattern_strength(PatternStrength::EXACT), 100);
    EXPECT_EQ(pattern_strength(PatternStrength::STRONG), 90);
    EXPECT_EQ(pattern_strength(PatternStrength::MODERATE), 70);
    EXPECT_EQ(pattern_strength(PatternStrength::WEAK), 50);
    EXPECT_EQ(pattern_strength(PatternStrength::VARIABLE_NAME), 40);

    EXPECT_EQ(context_score(CodeContext::API_ROUTE), 95);
    EXPECT_EQ(context_score(CodeContext::SERVER), 90);
    EXPECT_EQ(context_score(CodeContext::COMPONENT), 70);
    EXPECT_EQ(context_score(CodeContext::TEST_FILE), 30);
    EXPECT_EQ(context_score(CodeContext::CLI_SCRIPT), 25);
    EXPECT_EQ(context_score(CodeContext::BUILD_SCRIPT), 20);
    EXPECT_EQ(context_score(CodeContext::CONFIG), 15);
}

TEST(ConfidenceCalculatorTest, LevelNames) {
    EXPECT_EQ(to_string(ConfidenceLevel::VERY_HIGH), "very-high");
    EXPECT_EQ(to_string(ConfidenceLevel::HIGH), "high");
    EXPECT_EQ(to_string(ConfidenceLevel::MEDIUM), "medium");
    EXPECT_EQ(to_string(ConfidenceLevel::LOW), "low");
    EXPECT_EQ(to_string(ConfidenceLevel::VERY_LOW), "very-low");
}
