//
// Created by gregorian on 19/10/2026.
//

#include "insight/learning/pattern_record.h"
#include "insight/utils/time_utils.h"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <ranges>

namespace insight::learning {

    namespace {

        void append_missing(std::vector<std::string>& target, const std::vector<std::string>& values) {
            for (const auto& value : values) {
                if (std::ranges::find(target, value) == target.end()) {
                    target.push_back(value);
                }
            }
        }

        core::timestamp read_timestamp(const nlohmann::json& j, const char* key, const core::timestamp fallback) {
            if (!j.contains(key) || !j[key].is_string()) {
                return fallback;
            }
            return utils::parse_timestamp(j[key].get<std::string>()).value_or(fallback);
        }

        std::vector<std::string> read_strings(const nlohmann::json& j, const char* key) {
            return j.value(key, std::vector<std::string>{});
        }

        nlohmann::json serialize_performance(const PatternPerformance& perf) {
            nlohmann::json j;
            j["detectionCount"] = perf.detection_count;
            j["successCount"] = perf.success_count;
            j["failureCount"] = perf.failure_count;
            j["autoFixSuccessCount"] = perf.auto_fix_success_count;
            j["autoFixFailureCount"] = perf.auto_fix_failure_count;
            j["successRate"] = perf.success_rate;
            j["falsePositiveRate"] = perf.false_positive_rate;
            j["avgConfidence"] = perf.avg_confidence;
            j["avgSuccessConfidence"] = perf.avg_success_confidence;
            j["avgFailureConfidence"] = perf.avg_failure_confidence;
            return j;
        }

        PatternPerformance deserialize_performance(const nlohmann::json& j) {
            PatternPerformance perf;
            perf.detection_count = j.value("detectionCount", std::size_t{0});
            perf.success_count = j.value("successCount", std::size_t{0});
            perf.failure_count = j.value("failureCount", std::size_t{0});
            perf.auto_fix_success_count = j.value("autoFixSuccessCount", std::size_t{0});
            perf.auto_fix_failure_count = j.value("autoFixFailureCount", std::size_t{0});
            perf.avg_confidence = j.value("avgConfidence", 0.0);
            perf.avg_success_confidence = j.value("avgSuccessConfidence", 0.0);
            perf.avg_failure_confidence = j.value("avgFailureConfidence", 0.0);
            perf.recompute_rates();
            return perf;
        }

        nlohmann::json serialize_context(const PatternContext& context) {
            nlohmann::json j;
            j["framework"] = context.framework;
            j["fileContext"] = context.file_context;
            j["codeContext"] = context.code_context;
            j["imports"] = context.imports;
            j["tags"] = context.tags;
            return j;
        }

        PatternContext deserialize_context(const nlohmann::json& j) {
            PatternContext context;
            context.framework = j.value("framework", "");
            context.file_context = j.value("fileContext", "");
            context.code_context = read_strings(j, "codeContext");
            context.imports = read_strings(j, "imports");
            context.tags = read_strings(j, "tags");
            return context;
        }

        nlohmann::json serialize_correction(const Correction& correction) {
            nlohmann::json j;
            j["timestamp"] = utils::format_timestamp(correction.timestamp);
            j["isValid"] = correction.is_valid;
            j["confidence"] = correction.confidence;
            if (!correction.reason.empty()) j["reason"] = correction.reason;
            if (!correction.user_id.empty()) j["userId"] = correction.user_id;
            return j;
        }

        Correction deserialize_correction(const nlohmann::json& j, const core::timestamp fallback) {
            Correction correction;
            correction.timestamp = read_timestamp(j, "timestamp", fallback);
            correction.is_valid = j.value("isValid", false);
            correction.confidence = j.value("confidence", j.value("detectedConfidence", 0.0));
            correction.reason = j.value("reason", "");
            correction.user_id = j.value("userId", "");
            return correction;
        }

        nlohmann::json serialize_record(const PatternRecord& record) {
            nlohmann::json j;
            j["id"] = record.id;
            j["signature"] = {
                {"detector", record.signature.detector_id},
                {"patternType", record.signature.pattern_kind},
                {"filePath", record.signature.location.file_path},
                {"line", record.signature.location.line}
            };
            j["signatureHash"] = record.signature_hash;
            j["performance"] = serialize_performance(record.performance);
            j["context"] = serialize_context(record.context);

            nlohmann::json corrections = nlohmann::json::array();
            for (const auto& correction : record.corrections) {
                corrections.push_back(serialize_correction(correction));
            }
            j["corrections"] = corrections;

            j["firstDetected"] = utils::format_timestamp(record.lifecycle.first_detected);
            j["lastUpdated"] = utils::format_timestamp(record.lifecycle.last_updated);
            j["lastSeen"] = utils::format_timestamp(record.lifecycle.last_seen);
            j["active"] = record.lifecycle.active;
            j["skipInFuture"] = record.lifecycle.skip_in_future;
            if (!record.notes.empty()) j["notes"] = record.notes;
            if (!record.suggested_fix.empty()) j["suggestedFix"] = record.suggested_fix;
            return j;
        }

        PatternRecord deserialize_record(const std::string& key, const nlohmann::json& j, const core::timestamp fallback) {
            PatternRecord record;
            record.id = j.value("id", key);

            if (j.contains("signature")) {
                const auto& sig = j["signature"];
                record.signature.detector_id = sig.value("detector", "");
                record.signature.pattern_kind = sig.value("patternType", "");
                record.signature.location.file_path = sig.value("filePath", "");
                record.signature.location.line = sig.value("line", 0);
            }
            record.signature_hash = j.value("signatureHash", generate_signature_hash(record.signature));

            if (j.contains("performance")) {
                record.performance = deserialize_performance(j["performance"]);
            }
            if (j.contains("context")) {
                record.context = deserialize_context(j["context"]);
            }
            if (j.contains("corrections")) {
                for (const auto& cj : j["corrections"]) {
                    record.corrections.push_back(deserialize_correction(cj, fallback));
                }
            }

            record.lifecycle.first_detected = read_timestamp(j, "firstDetected", fallback);
            record.lifecycle.last_updated = read_timestamp(j, "lastUpdated", fallback);
            record.lifecycle.last_seen = read_timestamp(j, "lastSeen", fallback);
            record.lifecycle.active = j.value("active", true);
            record.lifecycle.skip_in_future = j.value("skipInFuture", false);
            record.notes = j.value("notes", "");
            record.suggested_fix = j.value("suggestedFix", "");
            return record;
        }

        nlohmann::json serialize_global_stats(const GlobalStats& stats) {
            nlohmann::json j;
            j["totalPatterns"] = stats.total_patterns;
            j["activePatterns"] = stats.active_patterns;
            j["deprecatedPatterns"] = stats.deprecated_patterns;
            j["totalDetections"] = stats.total_detections;
            j["totalCorrections"] = stats.total_corrections;
            j["overallSuccessRate"] = stats.overall_success_rate;
            j["overallFalsePositiveRate"] = stats.overall_false_positive_rate;
            return j;
        }

        nlohmann::json serialize_detector_stats(const DetectorStats& stats) {
            nlohmann::json j;
            j["patternCount"] = stats.pattern_count;
            j["successRate"] = stats.success_rate;
            j["falsePositiveRate"] = stats.false_positive_rate;
            j["avgConfidence"] = stats.avg_confidence;
            return j;
        }

    }  // namespace

    void PatternPerformance::recompute_rates() {
        if (detection_count == 0) {
            success_rate = 0.0;
            false_positive_rate = 0.0;
            return;
        }
        success_rate = static_cast<double>(success_count) / static_cast<double>(detection_count);
        false_positive_rate = static_cast<double>(failure_count) / static_cast<double>(detection_count);
    }

    void PatternContext::merge(const PatternContext& other) {
        if (framework.empty()) framework = other.framework;
        if (file_context.empty()) file_context = other.file_context;
        append_missing(code_context, other.code_context);
        append_missing(imports, other.imports);
        append_missing(tags, other.tags);
    }

    bool PatternContext::has_tag(const std::string& tag) const {
        return framework == tag || file_context == tag || std::ranges::find(tags, tag) != tags.end();
    }

    void PatternDatabase::recompute_statistics() {
        GlobalStats global;
        std::size_t total_successes = 0;
        std::size_t total_failures = 0;

        struct DetectorTotals {
            std::size_t patterns = 0;
            std::size_t detections = 0;
            std::size_t successes = 0;
            std::size_t failures = 0;
            double confidence_sum = 0.0;
        };
        std::map<std::string, DetectorTotals> per_detector;

        for (const auto& record : patterns | std::views::values) {
            const auto& perf = record.performance;
            global.total_patterns++;
            if (record.lifecycle.active) {
                global.active_patterns++;
            }
            global.total_detections += perf.detection_count;
            global.total_corrections += record.corrections.size();
            total_successes += perf.success_count;
            total_failures += perf.failure_count;

            auto& totals = per_detector[record.signature.detector_id];
            totals.patterns++;
            totals.detections += perf.detection_count;
            totals.successes += perf.success_count;
            totals.failures += perf.failure_count;
            totals.confidence_sum += perf.avg_confidence * static_cast<double>(perf.detection_count);
        }

        global.deprecated_patterns = global.total_patterns - global.active_patterns;
        if (global.total_detections > 0) {
            const auto detections = static_cast<double>(global.total_detections);
            global.overall_success_rate = static_cast<double>(total_successes) / detections;
            global.overall_false_positive_rate = static_cast<double>(total_failures) / detections;
        }
        global_stats = global;

        detector_stats.clear();
        for (const auto& [detector, totals] : per_detector) {
            DetectorStats stats;
            stats.pattern_count = totals.patterns;
            if (totals.detections > 0) {
                const auto detections = static_cast<double>(totals.detections);
                stats.success_rate = static_cast<double>(totals.successes) / detections;
                stats.false_positive_rate = static_cast<double>(totals.failures) / detections;
                stats.avg_confidence = totals.confidence_sum / detections;
            }
            detector_stats[detector] = stats;
        }
    }

    core::Result<std::string> serialize_database(const PatternDatabase& database) {
        try {
            nlohmann::json j;
            j["version"] = database.version;
            j["created"] = utils::format_timestamp(database.created);
            j["lastUpdated"] = utils::format_timestamp(database.last_updated);

            nlohmann::json patterns = nlohmann::json::object();
            for (const auto& [id, record] : database.patterns) {
                patterns[id] = serialize_record(record);
            }
            j["patterns"] = patterns;
            j["globalStats"] = serialize_global_stats(database.global_stats);

            nlohmann::json detectors = nlohmann::json::object();
            for (const auto& [detector, stats] : database.detector_stats) {
                detectors[detector] = serialize_detector_stats(stats);
            }
            j["detectorStats"] = detectors;

            return core::Result<std::string>::success(j.dump(2));
        } catch (const nlohmann::json::exception& e) {
            return core::Result<std::string>::failure(
                core::ErrorCode::STORAGE_ERROR,
                "Failed to serialize learning state: " + std::string(e.what())
            );
        }
    }

    core::Result<PatternDatabase> deserialize_database(const std::string& json) {
        try {
            const auto j = nlohmann::json::parse(json);
            if (!j.is_object()) {
                return core::Result<PatternDatabase>::failure(
                    core::ErrorCode::STATE_CORRUPT,
                    "Learning state root must be a JSON object"
                );
            }

            const auto now = utils::now();
            PatternDatabase database;
            database.version = j.value("version", std::string(PATTERN_DATABASE_VERSION));
            database.created = read_timestamp(j, "created", now);
            database.last_updated = read_timestamp(j, "lastUpdated", now);

            if (j.contains("patterns")) {
                const auto& patterns = j["patterns"];
                if (!patterns.is_object()) {
                    return core::Result<PatternDatabase>::failure(
                        core::ErrorCode::STATE_CORRUPT,
                        "Learning state \"patterns\" must be an object"
                    );
                }
                for (const auto& [key, value] : patterns.items()) {
                    auto record = deserialize_record(key, value, now);
                    database.patterns.emplace(record.id, std::move(record));
                }
            }

            database.recompute_statistics();
            return core::Result<PatternDatabase>::success(std::move(database));
        } catch (const nlohmann::json::exception& e) {
            return core::Result<PatternDatabase>::failure(
                core::ErrorCode::STATE_CORRUPT,
                "Failed to parse learning state: " + std::string(e.what())
            );
        }
    }

}  // namespace insight::learning
