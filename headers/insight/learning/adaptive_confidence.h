//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_ADAPTIVE_CONFIDENCE_H
#define INSIGHT_ADAPTIVE_CONFIDENCE_H

#include "insight/learning/confidence_calculator.h"
#include "insight/learning/pattern_signature.h"
#include "insight/learning/pattern_store.h"

namespace insight::learning {

    /**
     * @class AdaptiveConfidence
     * ConfidenceCalculator scoring adjusted by what a PatternStore has learned
     * about the finding's signature.
     *
     * The store is optional. Without one, or when its state cannot be loaded,
     * the unadjusted base score is returned: a finding is always scored.
     */
    class AdaptiveConfidence {
    public:
        AdaptiveConfidence() = default;
        explicit AdaptiveConfidence(PatternStore& store) : store_(&store) {}

        /**
         * Score a finding.
         *
         * The historical factor is the pattern's success rate when the store has
         * detections for @p signature, and the detector family's default accuracy
         * otherwise. The level is recomputed from the adjusted score, and a note
         * on the adjustment is appended to the explanation.
         */
        ConfidenceScore calculate(const ConfidenceFactors& factors, const PatternSignature& signature) const;

        /**
         * Feed the verdict on a scored finding back into the store. Never throws.
         */
        void record_outcome(const PatternSignature& signature,
                            bool was_correct,
                            double confidence,
                            const PatternContext& context = {}) const;

        [[nodiscard]] bool has_store() const { return store_ != nullptr; }

    private:
        PatternStore* store_ = nullptr;
    };

}  // namespace insight::learning

#endif //INSIGHT_ADAPTIVE_CONFIDENCE_H
