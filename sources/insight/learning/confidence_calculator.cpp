//
// Created by gregorian on 19/10/2026.
//

#include "insight/learning/confidence_calculator.h"
#include <algorithm>
#include <cmath>

namespace insight::learning {

    namespace {

        double clamp_factor(const double value) {
            return std::clamp(value, 0.0, 100.0);
        }

        const char* describe_pattern(const double value) {
            if (value >= 90) return "exact pattern match";
            if (value >= 70) return "strong pattern match";
            if (value >= 50) return "moderate pattern match";
            return "weak pattern match";
        }

        const char* describe_context(const double value) {
            if (value >= 80) return "highly appropriate context";
            if (value >= 60) return "appropriate context";
            if (value >= 40) return "questionable context";
            return "wrong context - likely false positive";
        }

        const char* describe_structure(const double value) {
            if (value >= 70) return "good code structure";
            if (value >= 50) return "acceptable structure";
            return "poor structure";
        }

        const char* describe_historical(const double value) {
            if (value >= 85) return "excellent historical accuracy";
            if (value >= 70) return "good historical accuracy";
            if (value >= 50) return "moderate historical accuracy";
            return "low historical accuracy";
        }

    }  // namespace

    std::string to_string(const ConfidenceLevel level) {
        switch (level) {
            case ConfidenceLevel::VERY_HIGH: return "very-high";
            case ConfidenceLevel::HIGH: return "high";
            case ConfidenceLevel::MEDIUM: return "medium";
            case ConfidenceLevel::LOW: return "low";
            case ConfidenceLevel::VERY_LOW: return "very-low";
            default: return "unknown";
        }
    }

    int pattern_strength(const PatternStrength strength) {
        switch (strength) {
            case PatternStrength::EXACT: return 100;
            case PatternStrength::STRONG: return 90;
            case PatternStrength::MODERATE: return 70;
            case PatternStrength::WEAK: return 50;
            case PatternStrength::VARIABLE_NAME: return 40;
            default: return 50;
        }
    }

    int context_score(const CodeContext context) {
        switch (context) {
            case CodeContext::API_ROUTE: return 95;
            case CodeContext::SERVER: return 90;
            case CodeContext::COMPONENT: return 70;
            case CodeContext::TEST_FILE: return 30;
            case CodeContext::CLI_SCRIPT: return 25;
            case CodeContext::BUILD_SCRIPT: return 20;
            case CodeContext::CONFIG: return 15;
            default: return 50;
        }
    }

    ConfidenceScore ConfidenceCalculator::calculate(const ConfidenceFactors& factors) {
        ConfidenceFactors clamped;
        clamped.pattern_match = clamp_factor(factors.pattern_match);
        clamped.context = clamp_factor(factors.context);
        clamped.structure = clamp_factor(factors.structure);
        clamped.historical_accuracy = clamp_factor(factors.historical_accuracy.value_or(DEFAULT_HISTORICAL_ACCURACY));

        const double pattern = clamped.pattern_match * PATTERN_WEIGHT;
        const double context = clamped.context * CONTEXT_WEIGHT;
        const double structure = clamped.structure * STRUCTURE_WEIGHT;
        const double historical = *clamped.historical_accuracy * HISTORICAL_WEIGHT;

        ConfidenceScore result;
        result.score = std::clamp(static_cast<int>(std::lround(pattern + context + structure + historical)), 0, 100);
        result.level = level_for(result.score);
        result.breakdown = ConfidenceBreakdown{
            static_cast<int>(std::lround(pattern)),
            static_cast<int>(std::lround(context)),
            static_cast<int>(std::lround(structure)),
            static_cast<int>(std::lround(historical))
        };
        result.explanation = explain(result.score, result.level, clamped);
        return result;
    }

    ConfidenceLevel ConfidenceCalculator::level_for(const int score) {
        if (score >= 90) return ConfidenceLevel::VERY_HIGH;
        if (score >= 75) return ConfidenceLevel::HIGH;
        if (score >= 50) return ConfidenceLevel::MEDIUM;
        if (score >= 30) return ConfidenceLevel::LOW;
        return ConfidenceLevel::VERY_LOW;
    }

    std::string ConfidenceCalculator::explain(const int score,
                                              const ConfidenceLevel level,
                                              const ConfidenceFactors& factors) {
        const double historical = factors.historical_accuracy.value_or(DEFAULT_HISTORICAL_ACCURACY);

        std::string text = std::to_string(score) + "% " + to_string(level) + ": ";
        text += describe_pattern(factors.pattern_match);
        text += ", ";
        text += describe_context(factors.context);
        text += ", ";
        text += describe_structure(factors.structure);
        text += ", ";
        text += describe_historical(historical);
        return text;
    }

}  // namespace insight::learning
