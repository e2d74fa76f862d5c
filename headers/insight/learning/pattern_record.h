//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_PATTERN_RECORD_H
#define INSIGHT_PATTERN_RECORD_H

#include "insight/core/result.h"
#include "insight/core/types.h"
#include "insight/learning/pattern_signature.h"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace insight::learning {

    inline constexpr const char* PATTERN_DATABASE_VERSION = "3.0.0";

    /**
     * Outcome counters and running averages of one pattern.
     * success_rate and false_positive_rate are always counter / detection_count.
     */
    struct PatternPerformance {
        std::size_t detection_count = 0;
        std::size_t success_count = 0;
        std::size_t failure_count = 0;
        std::size_t auto_fix_success_count = 0;
        std::size_t auto_fix_failure_count = 0;

        double success_rate = 0.0;
        double false_positive_rate = 0.0;
        double avg_confidence = 0.0;
        double avg_success_confidence = 0.0;
        double avg_failure_confidence = 0.0;

        void recompute_rates();
    };

    /// Human verdict on a finding.
    struct Correction {
        core::timestamp timestamp{};
        bool is_valid = false;
        std::string reason;
        std::string user_id;
        double confidence = 0.0;
    };

    /**
     * Opaque reporting context a detector attaches to a finding. Only used for
     * queries; it never influences scoring.
     */
    struct PatternContext {
        std::string framework;
        std::string file_context;
        std::vector<std::string> code_context;
        std::vector<std::string> imports;
        std::vector<std::string> tags;

        /// Fill empty scalars from @p other and append list entries not yet present.
        void merge(const PatternContext& other);

        /// True when @p tag equals the framework, the file context or one of the tags.
        [[nodiscard]] bool has_tag(const std::string& tag) const;
    };

    struct PatternLifecycle {
        bool active = true;
        bool skip_in_future = false;
        core::timestamp first_detected{};
        core::timestamp last_seen{};
        core::timestamp last_updated{};
    };

    struct PatternRecord {
        std::string id;
        PatternSignature signature;
        std::string signature_hash;
        PatternPerformance performance;
        PatternContext context;
        std::vector<Correction> corrections;
        PatternLifecycle lifecycle;
        std::string notes;
        std::string suggested_fix;
    };

    struct GlobalStats {
        std::size_t total_patterns = 0;
        std::size_t active_patterns = 0;
        std::size_t deprecated_patterns = 0;
        std::size_t total_detections = 0;
        std::size_t total_corrections = 0;
        double overall_success_rate = 0.0;
        double overall_false_positive_rate = 0.0;
    };

    struct DetectorStats {
        std::size_t pattern_count = 0;
        double success_rate = 0.0;
        double false_positive_rate = 0.0;
        double avg_confidence = 0.0;     ///< Weighted by each pattern's detection count.
    };

    /**
     * The whole persisted learning state. Patterns are keyed and ordered by id.
     */
    struct PatternDatabase {
        std::string version = PATTERN_DATABASE_VERSION;
        core::timestamp created{};
        core::timestamp last_updated{};
        std::map<std::string, PatternRecord> patterns;
        GlobalStats global_stats;
        std::map<std::string, DetectorStats> detector_stats;

        /**
         * Rebuild global and per-detector statistics from every record.
         */
        void recompute_statistics();
    };

    /**
     * Pretty-printed JSON document with camelCase keys and ISO-8601 timestamps.
     *
     * @return The document, or STORAGE_ERROR if a string field cannot be encoded.
     */
    core::Result<std::string> serialize_database(const PatternDatabase& database);

    /**
     * Inverse of serialize_database(). Missing fields take their defaults.
     *
     * @return The database, or STATE_CORRUPT when the text is not a JSON object
     *         of the expected shape.
     */
    core::Result<PatternDatabase> deserialize_database(const std::string& json);

}  // namespace insight::learning

#endif //INSIGHT_PATTERN_RECORD_H
