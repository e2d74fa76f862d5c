//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_PATTERN_STORE_H
#define INSIGHT_PATTERN_STORE_H

/**
 * @file pattern_store.h
 * @brief Persistent memory of how past findings were judged.
 *
 * Every finding is identified by its PatternSignature. The store counts how
 * often a signature was detected, confirmed and rejected, and uses that
 * history to raise, lower or suppress the confidence of later detections.
 *
 * The whole state lives in memory and is written through to a single JSON
 * file (LearningConfig::state_path) after every mutation. There is no file
 * locking: two processes mutating the same file can lose updates.
 */

#include "insight/core/config.h"
#include "insight/core/result.h"
#include "insight/learning/pattern_record.h"
#include "insight/learning/pattern_signature.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace insight::learning {

    /**
     * Partial update of one record, addressed by pattern id. Unset fields are
     * left untouched.
     */
    struct PatternUpdate {
        std::string pattern_id;
        bool record_detection = false;
        bool record_success = false;
        bool record_failure = false;
        std::optional<Correction> add_correction;
        std::optional<std::string> suggested_fix;
        bool deprecate = false;
        std::optional<bool> skip_in_future;
        std::optional<std::string> notes;
    };

    enum class PatternSortKey {
        NONE,
        SUCCESS_RATE,
        DETECTION_COUNT,
        CONFIDENCE,
        LAST_SEEN
    };

    struct PatternQuery {
        std::optional<std::string> detector_id;
        std::optional<std::string> pattern_kind;
        std::optional<std::string> file_path_contains;
        std::optional<std::string> context_tag;
        std::optional<double> min_success_rate;
        std::optional<double> max_false_positive_rate;
        bool active_only = false;              ///< Active and not skipped.
        PatternSortKey sort_by = PatternSortKey::NONE;
        bool descending = false;
        std::optional<std::size_t> limit;
    };

    /**
     * @class PatternStore
     * @brief Learns per-signature accuracy and adjusts confidence with it.
     *
     * The state is loaded lazily on first use. An unreadable or corrupt file
     * leaves the store empty but usable; save failures are logged and never
     * reported to the mutating caller.
     */
    class PatternStore {
    public:
        explicit PatternStore(core::LearningConfig config = {});

        PatternStore(const PatternStore&) = delete;
        PatternStore& operator=(const PatternStore&) = delete;

        /**
         * Read the state file once. Later calls return success without I/O.
         *
         * @return Success, including when no state file exists yet;
         *         FILE_READ_ERROR or STATE_CORRUPT when the file could not be
         *         used. The store is empty and usable in either case.
         */
        core::Result<void> load();

        [[nodiscard]] bool is_loaded() const { return loaded_; }

        /**
         * False from a failed load() until the next successful one. While false the
         * records are not a faithful history and must not steer scoring.
         */
        [[nodiscard]] bool is_state_usable() const { return state_usable_; }
        [[nodiscard]] const core::LearningConfig& config() const { return config_; }

        /**
         * Record a detection that turned out to be correct, creating the record
         * on first sight of the signature.
         */
        void record_success(const PatternSignature& signature,
                            double confidence,
                            const PatternContext& context = {});

        /**
         * Record a detection that turned out to be a false positive. Once the
         * pattern has at least min_detections_for_stability detections and its
         * false-positive rate exceeds auto_skip_threshold, it is marked to skip.
         */
        void record_failure(const PatternSignature& signature,
                            double confidence,
                            const PatternContext& context = {});

        /**
         * Apply a human verdict to an existing pattern. Unknown signatures are
         * logged and ignored.
         */
        void learn_from_correction(const PatternSignature& signature,
                                   bool is_valid,
                                   double confidence,
                                   const std::string& reason = "",
                                   const std::string& user_id = "");

        void update_pattern(const PatternUpdate& update);

        void deprecate_pattern(const PatternSignature& signature);

        void record_auto_fix_outcome(const PatternSignature& signature, bool succeeded);

        /**
         * Final confidence for a detection of @p signature whose unadjusted
         * score is @p base_confidence.
         *
         * @return 0 for a skipped pattern; @p base_confidence while history is
         *         insufficient; otherwise the boosted, penalized or damped score
         *         clamped to [0,100].
         */
        double adjust_confidence(const PatternSignature& signature, double base_confidence);

        /// Success rate in [0,1], or std::nullopt without a record or detections.
        std::optional<double> get_pattern_accuracy(const PatternSignature& signature);

        bool should_suggest_auto_fix(const PatternSignature& signature, double score);

        std::optional<PatternRecord> get_pattern(const PatternSignature& signature);
        std::optional<PatternRecord> get_pattern_by_id(const std::string& pattern_id);

        std::vector<PatternRecord> query(const PatternQuery& query);

        GlobalStats get_global_stats();
        std::optional<DetectorStats> get_detector_stats(const std::string& detector_id);

        PatternDatabase snapshot();

        /**
         * Hard-delete records that are deprecated and were last seen more than
         * deprecate_after_days before @p now.
         *
         * @return Number of removed records.
         */
        std::size_t cleanup_deprecated_patterns(core::timestamp now);

        /// Write the current state and report the outcome.
        core::Result<void> flush();

        /// Drop all in-memory state. The state file is left untouched; the next call reloads it.
        void reset();

        /// flush() followed by reset().
        core::Result<void> close();

    private:
        void ensure_loaded();

        PatternRecord& upsert(const PatternSignature& signature, double confidence, const PatternContext& context);
        PatternRecord* find(const PatternSignature& signature);

        void maybe_auto_skip(PatternRecord& record) const;

        core::Result<void> save();

        /// Recompute statistics and write through. Save failures are logged.
        void commit();

        core::LearningConfig config_;
        PatternDatabase database_;
        bool loaded_ = false;
        bool state_usable_ = true;
    };

}  // namespace insight::learning

#endif //INSIGHT_PATTERN_STORE_H
