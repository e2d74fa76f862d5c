//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_CONFIG_H
#define INSIGHT_CONFIG_H

#include "insight/core/result.h"
#include <string>
#include <vector>

namespace insight::core {

    /**
     * Options of the pattern-learning store and of adaptive confidence scoring.
     */
    struct LearningConfig {
        bool enabled = true;
        int min_detections_for_stability = 10;
        int deprecate_after_days = 90;
        double auto_skip_threshold = 0.7;     ///< False-positive rate above which a stable pattern is skipped.
        double confidence_boost = 0.15;
        double confidence_penalty = 0.25;
        bool enable_auto_fix_suggestions = false;
        int auto_fix_min_confidence = 85;
        std::string state_path = ".insight/learning/patterns.json";
    };

    /**
     * One architectural layer: the node-id globs that belong to it and the layers
     * it may depend on directly.
     */
    struct LayerRule {
        std::string name;
        std::vector<std::string> patterns;
        std::vector<std::string> allowed_dependencies;
    };

    struct ArchitectureConfig {
        int max_coupling = 10;
        std::vector<LayerRule> layers = {
            {"UI", {"**/components/**", "**/pages/**", "**/ui/**"}, {"Services", "Utils"}},
            {"Services", {"**/services/**", "**/api/**"}, {"Data", "Utils"}},
            {"Data", {"**/data/**", "**/models/**", "**/repositories/**"}, {"Utils"}},
            {"Utils", {"**/utils/**", "**/helpers/**", "**/lib/**"}, {}}
        };
    };

    struct LoggingConfig {
        std::string level = "INFO";
        std::string file;
        bool console = true;
        std::string format = "[{timestamp}] [{level}] [{source}] {message}";
    };

    class Config {
    public:
        Config() = default;

        LearningConfig learning;
        ArchitectureConfig architecture;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @param path Filesystem path to the config file.
         * @return The validated Config, FILE_NOT_FOUND, PARSE_ERROR or INVALID_CONFIG.
         */
        static Result<Config> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text. Sections and keys that are absent keep
         * their defaults; unknown keys are ignored.
         */
        static Result<Config> load_from_string(const std::string& content);

        static Config default_config();

        [[nodiscard]] Result<void> save_to_file(const std::string& path) const;

        /**
         * Serialize to TOML that load_from_string() reads back to an equal Config.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Check value ranges and layer references. All problems are reported
         * together in a single INVALID_CONFIG error.
         */
        [[nodiscard]] Result<void> validate() const;
    };

}  // namespace insight::core

#endif //INSIGHT_CONFIG_H
