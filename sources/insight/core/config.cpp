//
// Created by gregorian on 19/10/2026.
//

#include "insight/core/config.h"
#include "insight/utils/file_utils.h"
#include "insight/utils/string_utils.h"
#include <toml++/toml.h>
#include <sstream>
#include <unordered_set>

namespace insight::core
{
    namespace {

        std::vector<std::string> read_string_array(const toml::array* array) {
            std::vector<std::string> values;
            if (array) {
                for (auto& element : *array) {
                    values.emplace_back(element.value_or(std::string{}));
                }
            }
            return values;
        }

        toml::array make_string_array(const std::vector<std::string>& values) {
            toml::array array;
            for (const auto& value : values) {
                array.push_back(value);
            }
            return array;
        }

    }  // namespace

    Result<Config> Config::load_from_file(const std::string& path) {
        const auto content = utils::read_file(path);
        if (!content) {
            return Result<Config>::failure(ErrorCode::FILE_NOT_FOUND,
                                           "Configuration file not found: " + path);
        }
        return load_from_string(*content);
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            for (const char* section : {"learning", "architecture", "logging"}) {
                if (tbl[section] && !tbl[section].is_table()) {
                    return Result<Config>::failure(ErrorCode::INVALID_CONFIG,
                                                   std::string("[") + section + "] must be a table");
                }
            }

            if (auto* learning_table = tbl["learning"].as_table()) {
                auto& learning = *learning_table;
                if (learning["enabled"])
                    config.learning.enabled = learning["enabled"].value_or(true);
                if (learning["min_detections_for_stability"])
                    config.learning.min_detections_for_stability = learning["min_detections_for_stability"].value_or(10);
                if (learning["deprecate_after_days"])
                    config.learning.deprecate_after_days = learning["deprecate_after_days"].value_or(90);
                if (learning["auto_skip_threshold"])
                    config.learning.auto_skip_threshold = learning["auto_skip_threshold"].value_or(0.7);
                if (learning["confidence_boost"])
                    config.learning.confidence_boost = learning["confidence_boost"].value_or(0.15);
                if (learning["confidence_penalty"])
                    config.learning.confidence_penalty = learning["confidence_penalty"].value_or(0.25);
                if (learning["enable_auto_fix_suggestions"])
                    config.learning.enable_auto_fix_suggestions = learning["enable_auto_fix_suggestions"].value_or(false);
                if (learning["auto_fix_min_confidence"])
                    config.learning.auto_fix_min_confidence = learning["auto_fix_min_confidence"].value_or(85);
                if (learning["state_path"])
                    config.learning.state_path = learning["state_path"].value_or(std::string{});
            }

            if (auto* architecture_table = tbl["architecture"].as_table()) {
                auto& architecture = *architecture_table;
                if (architecture["max_coupling"])
                    config.architecture.max_coupling = architecture["max_coupling"].value_or(10);
                if (const auto* layers = architecture["layers"].as_array()) {
                    config.architecture.layers.clear();
                    for (auto& entry : *layers) {
                        const auto* layer_table = entry.as_table();
                        if (!layer_table) {
                            return Result<Config>::failure(ErrorCode::INVALID_CONFIG,
                                                           "architecture.layers entries must be tables");
                        }
                        const auto& layer = *layer_table;
                        LayerRule rule;
                        rule.name = layer["name"].value_or(std::string{});
                        rule.patterns = read_string_array(layer["patterns"].as_array());
                        rule.allowed_dependencies = read_string_array(layer["allowed_dependencies"].as_array());
                        config.architecture.layers.push_back(std::move(rule));
                    }
                }
            }

            if (auto* logging_table = tbl["logging"].as_table()) {
                auto& log = *logging_table;
                if (log["level"])
                    config.logging.level = log["level"].value_or("INFO");
                if (log["file"])
                    config.logging.file = log["file"].value_or("");
                if (log["console"])
                    config.logging.console = log["console"].value_or(true);
                if (log["format"])
                    config.logging.format = log["format"].value_or("[{timestamp}] [{level}] [{source}] {message}");
            }

            if (auto validation_result = config.validate(); !validation_result.is_success()) {
                return Result<Config>::failure(validation_result.error());
            }

            return Result<Config>::success(std::move(config));
        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(ErrorCode::PARSE_ERROR,
                                           "Failed to parse TOML configuration: " + std::string(err.what()));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void> Config::save_to_file(const std::string& path) const {
        if (!utils::write_file(path, to_string())) {
            return Result<void>::failure(ErrorCode::FILE_WRITE_ERROR,
                                         "Failed to write configuration to file: " + path);
        }
        return Result<void>::success();
    }

    std::string Config::to_string() const {
        toml::array layers;
        for (const auto& rule : architecture.layers) {
            layers.push_back(toml::table{
                {"name", rule.name},
                {"patterns", make_string_array(rule.patterns)},
                {"allowed_dependencies", make_string_array(rule.allowed_dependencies)}
            });
        }

        const toml::table tbl{
            {"learning", toml::table{
                {"enabled", learning.enabled},
                {"min_detections_for_stability", learning.min_detections_for_stability},
                {"deprecate_after_days", learning.deprecate_after_days},
                {"auto_skip_threshold", learning.auto_skip_threshold},
                {"confidence_boost", learning.confidence_boost},
                {"confidence_penalty", learning.confidence_penalty},
                {"enable_auto_fix_suggestions", learning.enable_auto_fix_suggestions},
                {"auto_fix_min_confidence", learning.auto_fix_min_confidence},
                {"state_path", learning.state_path}
            }},
            {"architecture", toml::table{
                {"max_coupling", architecture.max_coupling},
                {"layers", std::move(layers)}
            }},
            {"logging", toml::table{
                {"level", logging.level},
                {"file", logging.file},
                {"console", logging.console},
                {"format", logging.format}
            }}
        };

        std::ostringstream ss;
        ss << tbl << "\n";
        return ss.str();
    }

    Result<void> Config::validate() const {
        std::vector<std::string> errors;

        const auto check_fraction = [&errors](const double value, const std::string& name) {
            if (value < 0.0 || value > 1.0) {
                errors.push_back(name + " must be between 0.0 and 1.0");
            }
        };

        if (learning.min_detections_for_stability < 1) {
            errors.emplace_back("min_detections_for_stability must be at least 1");
        }
        if (learning.deprecate_after_days < 0) {
            errors.emplace_back("deprecate_after_days must be non-negative");
        }
        check_fraction(learning.auto_skip_threshold, "auto_skip_threshold");
        check_fraction(learning.confidence_boost, "confidence_boost");
        check_fraction(learning.confidence_penalty, "confidence_penalty");
        if (learning.auto_fix_min_confidence < 0 || learning.auto_fix_min_confidence > 100) {
            errors.emplace_back("auto_fix_min_confidence must be between 0 and 100");
        }
        if (learning.state_path.empty()) {
            errors.emplace_back("state_path must not be empty");
        }

        if (architecture.max_coupling <= 0) {
            errors.emplace_back("max_coupling must be positive");
        }

        std::unordered_set<std::string> layer_names;
        for (const auto& rule : architecture.layers) {
            if (rule.name.empty()) {
                errors.emplace_back("layer name must not be empty");
            } else if (!layer_names.insert(rule.name).second) {
                errors.push_back("duplicate layer name: " + rule.name);
            }
        }
        for (const auto& rule : architecture.layers) {
            for (const auto& allowed : rule.allowed_dependencies) {
                if (!layer_names.contains(allowed)) {
                    errors.push_back("layer " + rule.name + " allows unknown layer: " + allowed);
                }
            }
        }

        if (!errors.empty()) {
            return Result<void>::failure(ErrorCode::INVALID_CONFIG,
                                         "Configuration validation failed:\n  " + utils::join(errors, "\n  "));
        }
        return Result<void>::success();
    }

}  // namespace insight::core
