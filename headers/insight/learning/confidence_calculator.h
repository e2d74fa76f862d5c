//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_CONFIDENCE_CALCULATOR_H
#define INSIGHT_CONFIDENCE_CALCULATOR_H

#include <optional>
#include <string>

namespace insight::learning {

    enum class ConfidenceLevel {
        VERY_HIGH,
        HIGH,
        MEDIUM,
        LOW,
        VERY_LOW
    };

    /// "very-high", "high", "medium", "low" or "very-low".
    std::string to_string(ConfidenceLevel level);

    enum class PatternStrength {
        EXACT,
        STRONG,
        MODERATE,
        WEAK,
        VARIABLE_NAME
    };

    enum class CodeContext {
        API_ROUTE,
        SERVER,
        COMPONENT,
        TEST_FILE,
        CLI_SCRIPT,
        BUILD_SCRIPT,
        CONFIG
    };

    /// Pattern-match factor for a kind of match: exact 100 down to variable-name 40.
    int pattern_strength(PatternStrength strength);

    /// Context factor for the kind of file a finding sits in: api-route 95 down to config 15.
    int context_score(CodeContext context);

    /**
     * Raw factor scores, each expected in [0,100]. Values outside are clamped.
     * An unset historical accuracy counts as 75.
     */
    struct ConfidenceFactors {
        double pattern_match = 0.0;
        double context = 0.0;
        double structure = 0.0;
        std::optional<double> historical_accuracy;
    };

    /// Rounded weighted contribution of each factor to the score.
    struct ConfidenceBreakdown {
        int pattern_match = 0;
        int context = 0;
        int structure = 0;
        int historical = 0;
    };

    struct ConfidenceScore {
        int score = 0;
        ConfidenceLevel level = ConfidenceLevel::VERY_LOW;
        ConfidenceBreakdown breakdown;
        std::string explanation;
    };

    /**
     * @class ConfidenceCalculator
     * Weighted combination of the four factors:
     * score = round(0.4 pattern + 0.3 context + 0.2 structure + 0.1 historical).
     */
    class ConfidenceCalculator {
    public:
        static constexpr double PATTERN_WEIGHT = 0.4;
        static constexpr double CONTEXT_WEIGHT = 0.3;
        static constexpr double STRUCTURE_WEIGHT = 0.2;
        static constexpr double HISTORICAL_WEIGHT = 0.1;
        static constexpr double DEFAULT_HISTORICAL_ACCURACY = 75.0;

        static ConfidenceScore calculate(const ConfidenceFactors& factors);

        /// ≥90 very-high, ≥75 high, ≥50 medium, ≥30 low, otherwise very-low.
        static ConfidenceLevel level_for(int score);

        /**
         * "<score>% <level>: " followed by one phrase per factor band, e.g.
         * "92% very-high: exact pattern match, highly appropriate context, ...".
         */
        static std::string explain(int score, ConfidenceLevel level, const ConfidenceFactors& factors);
    };

}  // namespace insight::learning

#endif //INSIGHT_CONFIDENCE_CALCULATOR_H
