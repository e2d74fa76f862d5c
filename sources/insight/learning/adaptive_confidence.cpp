//
// Created by gregorian on 19/10/2026.
//

#include "insight/learning/adaptive_confidence.h"
#include "insight/utils/logger.h"
#include <algorithm>
#include <cmath>
#include <exception>

namespace insight::learning {

    ConfidenceScore AdaptiveConfidence::calculate(const ConfidenceFactors& factors,
                                                  const PatternSignature& signature) const {
        if (!store_) {
            return ConfidenceCalculator::calculate(factors);
        }

        if (const auto loaded = store_->load(); loaded.is_failure()) {
            INSIGHT_LOG_WARNING("AdaptiveConfidence", "Learning unavailable, using base score: " +
                                                      loaded.error().message);
            return ConfidenceCalculator::calculate(factors);
        }
        if (!store_->is_state_usable()) {
            return ConfidenceCalculator::calculate(factors);
        }

        ConfidenceFactors adjusted_factors = factors;
        const auto accuracy = store_->get_pattern_accuracy(signature);
        adjusted_factors.historical_accuracy = accuracy
            ? *accuracy * 100.0
            : static_cast<double>(default_accuracy(signature.family()));

        const auto base = ConfidenceCalculator::calculate(adjusted_factors);
        const double adjusted = store_->adjust_confidence(signature, base.score);

        ConfidenceScore result = base;
        result.score = std::clamp(static_cast<int>(std::lround(adjusted)), 0, 100);
        result.level = ConfidenceCalculator::level_for(result.score);
        result.explanation = ConfidenceCalculator::explain(result.score, result.level, adjusted_factors);

        const auto record = store_->get_pattern(signature);
        const int delta = result.score - base.score;
        if (record && record->lifecycle.skip_in_future) {
            result.explanation += " (suppressed: pattern marked to skip)";
        } else if (delta != 0) {
            const auto historical = std::lround(*adjusted_factors.historical_accuracy);
            result.explanation += " (adjusted " + std::string(delta > 0 ? "+" : "") + std::to_string(delta) +
                                  "% based on " + std::to_string(historical) + "% historical accuracy)";
        }
        return result;
    }

    void AdaptiveConfidence::record_outcome(const PatternSignature& signature,
                                            const bool was_correct,
                                            const double confidence,
                                            const PatternContext& context) const {
        if (!store_) {
            return;
        }
        try {
            if (was_correct) {
                store_->record_success(signature, confidence, context);
            } else {
                store_->record_failure(signature, confidence, context);
            }
        } catch (const std::exception& e) {
            INSIGHT_LOG_WARNING("AdaptiveConfidence", "Failed to record outcome for " +
                                                      generate_pattern_id(signature) + ": " + e.what());
        }
    }

}  // namespace insight::learning
