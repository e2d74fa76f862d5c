//
// Created by gregorian on 19/10/2026.
//

#include "insight/learning/pattern_store.h"
#include "insight/utils/file_utils.h"
#include "insight/utils/logger.h"
#include "insight/utils/string_utils.h"
#include "insight/utils/time_utils.h"
#include <algorithm>
#include <chrono>
#include <ranges>

namespace insight::learning {

    namespace {

        constexpr std::size_t BOOST_MIN_DETECTIONS = 20;
        constexpr double BOOST_MIN_SUCCESS_RATE = 0.9;
        constexpr std::size_t PENALTY_MIN_DETECTIONS = 10;
        constexpr double PENALTY_MIN_FALSE_POSITIVE_RATE = 0.5;
        constexpr double NEUTRAL_SUCCESS_RATE = 0.75;
        constexpr double DAMPING_FACTOR = 20.0;

        /// Running mean after the n-th sample @p value, where @p n is already incremented.
        double incremental_mean(const double average, const std::size_t n, const double value) {
            return (average * static_cast<double>(n - 1) + value) / static_cast<double>(n);
        }

        double clamp_score(const double score) {
            return std::clamp(score, 0.0, 100.0);
        }

        void record_outcome(PatternPerformance& perf, const bool success, const double confidence) {
            perf.detection_count++;
            perf.avg_confidence = incremental_mean(perf.avg_confidence, perf.detection_count, confidence);
            if (success) {
                perf.success_count++;
                perf.avg_success_confidence =
                    incremental_mean(perf.avg_success_confidence, perf.success_count, confidence);
            } else {
                perf.failure_count++;
                perf.avg_failure_confidence =
                    incremental_mean(perf.avg_failure_confidence, perf.failure_count, confidence);
            }
            perf.recompute_rates();
        }

        bool matches(const PatternRecord& record, const PatternQuery& query) {
            const auto& perf = record.performance;
            if (query.detector_id && record.signature.detector_id != *query.detector_id) return false;
            if (query.pattern_kind && record.signature.pattern_kind != *query.pattern_kind) return false;
            if (query.file_path_contains &&
                !utils::contains(record.signature.location.file_path, *query.file_path_contains)) {
                return false;
            }
            if (query.context_tag && !record.context.has_tag(*query.context_tag)) return false;
            if (query.min_success_rate && perf.success_rate < *query.min_success_rate) return false;
            if (query.max_false_positive_rate && perf.false_positive_rate > *query.max_false_positive_rate) return false;
            if (query.active_only && (!record.lifecycle.active || record.lifecycle.skip_in_future)) return false;
            return true;
        }

        bool less_by(const PatternSortKey key, const PatternRecord& a, const PatternRecord& b) {
            switch (key) {
                case PatternSortKey::SUCCESS_RATE:
                    return a.performance.success_rate < b.performance.success_rate;
                case PatternSortKey::DETECTION_COUNT:
                    return a.performance.detection_count < b.performance.detection_count;
                case PatternSortKey::CONFIDENCE:
                    return a.performance.avg_confidence < b.performance.avg_confidence;
                case PatternSortKey::LAST_SEEN:
                    return a.lifecycle.last_seen < b.lifecycle.last_seen;
                default:
                    return false;
            }
        }

    }  // namespace

    PatternStore::PatternStore(core::LearningConfig config)
        : config_(std::move(config)) {}

    core::Result<void> PatternStore::load() {
        if (loaded_) {
            return core::Ok();
        }

        loaded_ = true;
        state_usable_ = true;
        const auto now = utils::now();
        database_ = PatternDatabase{};
        database_.created = now;
        database_.last_updated = now;

        if (!utils::file_exists(config_.state_path)) {
            INSIGHT_LOG_DEBUG("PatternStore", "No learning state at " + config_.state_path + ", starting empty");
            return core::Ok();
        }

        const auto content = utils::read_file(config_.state_path);
        if (!content) {
            state_usable_ = false;
            return core::Result<void>::failure(core::ErrorCode::FILE_READ_ERROR,
                                               "Cannot read learning state: " + config_.state_path);
        }

        auto database = deserialize_database(*content);
        if (database.is_failure()) {
            state_usable_ = false;
            return core::Result<void>::failure(database.error());
        }

        database_ = std::move(database).value();
        INSIGHT_LOG_INFO("PatternStore", "Loaded " + std::to_string(database_.patterns.size()) +
                                         " learned patterns from " + config_.state_path);
        return core::Ok();
    }

    void PatternStore::ensure_loaded() {
        if (loaded_) {
            return;
        }
        if (const auto result = load(); result.is_failure()) {
            INSIGHT_LOG_WARNING("PatternStore", "Learning state unusable, continuing with an empty store: " +
                                                result.error().message);
        }
    }

    PatternRecord* PatternStore::find(const PatternSignature& signature) {
        const auto it = database_.patterns.find(generate_pattern_id(signature));
        return it == database_.patterns.end() ? nullptr : &it->second;
    }

    PatternRecord& PatternStore::upsert(const PatternSignature& signature,
                                        const double confidence,
                                        const PatternContext& context) {
        const auto now = utils::now();
        const std::string id = generate_pattern_id(signature);

        auto [it, inserted] = database_.patterns.try_emplace(id);
        auto& record = it->second;
        if (inserted) {
            record.id = id;
            record.signature = signature;
            record.signature_hash = generate_signature_hash(signature);
            record.context = context;
            record.lifecycle.first_detected = now;
            INSIGHT_LOG_DEBUG("PatternStore", "New pattern " + id + " at confidence " +
                                              utils::format_fixed(confidence, 1));
        } else {
            record.context.merge(context);
        }
        record.lifecycle.last_seen = now;
        record.lifecycle.last_updated = now;
        return record;
    }

    void PatternStore::maybe_auto_skip(PatternRecord& record) const {
        const auto& perf = record.performance;
        if (record.lifecycle.skip_in_future) {
            return;
        }
        if (perf.detection_count < static_cast<std::size_t>(config_.min_detections_for_stability) ||
            perf.false_positive_rate <= config_.auto_skip_threshold) {
            return;
        }

        record.lifecycle.skip_in_future = true;
        record.notes = "Auto-skipped: FP rate " + utils::format_fixed(perf.false_positive_rate * 100.0, 1) +
                       "% exceeds threshold";
        INSIGHT_LOG_INFO("PatternStore", "Pattern " + record.id + " auto-skipped after " +
                                         std::to_string(perf.detection_count) + " detections");
    }

    void PatternStore::record_success(const PatternSignature& signature,
                                      const double confidence,
                                      const PatternContext& context) {
        if (!config_.enabled) {
            return;
        }
        ensure_loaded();

        auto& record = upsert(signature, confidence, context);
        record_outcome(record.performance, true, confidence);
        commit();
    }

    void PatternStore::record_failure(const PatternSignature& signature,
                                      const double confidence,
                                      const PatternContext& context) {
        if (!config_.enabled) {
            return;
        }
        ensure_loaded();

        auto& record = upsert(signature, confidence, context);
        record_outcome(record.performance, false, confidence);
        maybe_auto_skip(record);
        commit();
    }

    void PatternStore::learn_from_correction(const PatternSignature& signature,
                                             const bool is_valid,
                                             const double confidence,
                                             const std::string& reason,
                                             const std::string& user_id) {
        if (!config_.enabled) {
            return;
        }
        ensure_loaded();

        auto* record = find(signature);
        if (!record) {
            INSIGHT_LOG_WARNING("PatternStore", "Correction for unknown pattern " +
                                                generate_pattern_id(signature) + " ignored");
            return;
        }

        const auto now = utils::now();
        record->corrections.push_back(Correction{now, is_valid, reason, user_id, confidence});
        record_outcome(record->performance, is_valid, confidence);
        record->lifecycle.last_updated = now;
        commit();
    }

    void PatternStore::update_pattern(const PatternUpdate& update) {
        if (!config_.enabled) {
            return;
        }
        ensure_loaded();

        const auto it = database_.patterns.find(update.pattern_id);
        if (it == database_.patterns.end()) {
            INSIGHT_LOG_WARNING("PatternStore", "Update for unknown pattern " + update.pattern_id + " ignored");
            return;
        }

        auto& record = it->second;
        const auto now = utils::now();

        if (update.record_detection) {
            record.performance.detection_count++;
            record.lifecycle.last_seen = now;
        }
        if (update.record_success) record.performance.success_count++;
        if (update.record_failure) record.performance.failure_count++;
        if (update.add_correction) record.corrections.push_back(*update.add_correction);
        if (update.suggested_fix) record.suggested_fix = *update.suggested_fix;
        if (update.deprecate) record.lifecycle.active = false;
        if (update.skip_in_future) record.lifecycle.skip_in_future = *update.skip_in_future;
        if (update.notes) record.notes = *update.notes;

        record.performance.recompute_rates();
        record.lifecycle.last_updated = now;
        commit();
    }

    void PatternStore::deprecate_pattern(const PatternSignature& signature) {
        PatternUpdate update;
        update.pattern_id = generate_pattern_id(signature);
        update.deprecate = true;
        update_pattern(update);
    }

    void PatternStore::record_auto_fix_outcome(const PatternSignature& signature, const bool succeeded) {
        if (!config_.enabled) {
            return;
        }
        ensure_loaded();

        auto* record = find(signature);
        if (!record) {
            INSIGHT_LOG_WARNING("PatternStore", "Auto-fix outcome for unknown pattern " +
                                                generate_pattern_id(signature) + " ignored");
            return;
        }

        if (succeeded) {
            record->performance.auto_fix_success_count++;
        } else {
            record->performance.auto_fix_failure_count++;
        }
        record->lifecycle.last_updated = utils::now();
        commit();
    }

    double PatternStore::adjust_confidence(const PatternSignature& signature, const double base_confidence) {
        if (!config_.enabled) {
            return base_confidence;
        }
        ensure_loaded();

        const auto* record = find(signature);
        if (!record) {
            return base_confidence;
        }
        if (record->lifecycle.skip_in_future) {
            return 0.0;
        }

        const auto& perf = record->performance;
        if (perf.detection_count < static_cast<std::size_t>(config_.min_detections_for_stability)) {
            return base_confidence;
        }
        if (perf.success_rate >= BOOST_MIN_SUCCESS_RATE && perf.detection_count >= BOOST_MIN_DETECTIONS) {
            return std::min(100.0, base_confidence + config_.confidence_boost * 100.0);
        }
        if (perf.false_positive_rate >= PENALTY_MIN_FALSE_POSITIVE_RATE &&
            perf.detection_count >= PENALTY_MIN_DETECTIONS) {
            return std::max(0.0, base_confidence - config_.confidence_penalty * 100.0);
        }
        return clamp_score(base_confidence + (perf.success_rate - NEUTRAL_SUCCESS_RATE) * DAMPING_FACTOR);
    }

    std::optional<double> PatternStore::get_pattern_accuracy(const PatternSignature& signature) {
        ensure_loaded();
        const auto* record = find(signature);
        if (!record || record->performance.detection_count == 0) {
            return std::nullopt;
        }
        return record->performance.success_rate;
    }

    bool PatternStore::should_suggest_auto_fix(const PatternSignature& signature, const double score) {
        if (!config_.enabled || !config_.enable_auto_fix_suggestions) {
            return false;
        }
        if (score < static_cast<double>(config_.auto_fix_min_confidence)) {
            return false;
        }
        ensure_loaded();
        const auto* record = find(signature);
        return !record || !record->lifecycle.skip_in_future;
    }

    std::optional<PatternRecord> PatternStore::get_pattern(const PatternSignature& signature) {
        ensure_loaded();
        if (const auto* record = find(signature)) {
            return *record;
        }
        return std::nullopt;
    }

    std::optional<PatternRecord> PatternStore::get_pattern_by_id(const std::string& pattern_id) {
        ensure_loaded();
        const auto it = database_.patterns.find(pattern_id);
        if (it == database_.patterns.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<PatternRecord> PatternStore::query(const PatternQuery& query) {
        ensure_loaded();

        std::vector<PatternRecord> results;
        for (const auto& record : database_.patterns | std::views::values) {
            if (matches(record, query)) {
                results.push_back(record);
            }
        }

        if (query.sort_by != PatternSortKey::NONE) {
            const auto key = query.sort_by;
            if (query.descending) {
                std::ranges::stable_sort(results, [key](const PatternRecord& a, const PatternRecord& b) {
                    return less_by(key, b, a);
                });
            } else {
                std::ranges::stable_sort(results, [key](const PatternRecord& a, const PatternRecord& b) {
                    return less_by(key, a, b);
                });
            }
        }

        if (query.limit && results.size() > *query.limit) {
            results.resize(*query.limit);
        }
        return results;
    }

    GlobalStats PatternStore::get_global_stats() {
        ensure_loaded();
        return database_.global_stats;
    }

    std::optional<DetectorStats> PatternStore::get_detector_stats(const std::string& detector_id) {
        ensure_loaded();
        const auto it = database_.detector_stats.find(detector_id);
        if (it == database_.detector_stats.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    PatternDatabase PatternStore::snapshot() {
        ensure_loaded();
        return database_;
    }

    std::size_t PatternStore::cleanup_deprecated_patterns(const core::timestamp now) {
        if (!config_.enabled) {
            return 0;
        }
        ensure_loaded();

        const auto horizon = now - std::chrono::hours(24) * config_.deprecate_after_days;
        const auto removed = std::erase_if(database_.patterns, [horizon](const auto& entry) {
            const auto& lifecycle = entry.second.lifecycle;
            return !lifecycle.active && lifecycle.last_seen < horizon;
        });

        if (removed > 0) {
            INSIGHT_LOG_INFO("PatternStore", "Removed " + std::to_string(removed) + " deprecated patterns");
            commit();
        }
        return removed;
    }

    core::Result<void> PatternStore::save() {
        auto content = serialize_database(database_);
        if (content.is_failure()) {
            return core::Result<void>::failure(content.error());
        }
        if (!utils::write_file_atomic(config_.state_path, content.value())) {
            return core::Result<void>::failure(core::ErrorCode::FILE_WRITE_ERROR,
                                               "Cannot write learning state: " + config_.state_path);
        }
        return core::Ok();
    }

    void PatternStore::commit() {
        database_.recompute_statistics();
        database_.last_updated = utils::now();
        if (const auto result = save(); result.is_failure()) {
            INSIGHT_LOG_WARNING("PatternStore", "Failed to persist learning state: " + result.error().message);
        }
    }

    core::Result<void> PatternStore::flush() {
        ensure_loaded();
        database_.recompute_statistics();
        database_.last_updated = utils::now();
        return save();
    }

    void PatternStore::reset() {
        database_ = PatternDatabase{};
        loaded_ = false;
        state_usable_ = true;
    }

    core::Result<void> PatternStore::close() {
        auto result = flush();
        reset();
        return result;
    }

}  // namespace insight::learning
