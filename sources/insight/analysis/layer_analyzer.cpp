//
// Created by gregorian on 19/10/2026.
//

#include "insight/analysis/layer_analyzer.h"
#include "insight/graph/graph_algorithms.h"
#include "insight/utils/string_utils.h"
#include <algorithm>
#include <map>
#include <queue>
#include <ranges>

namespace insight::analysis {

    namespace {

        LayerClassifier make_glob_classifier(const std::vector<core::LayerRule>& layers) {
            return [layers](const std::string& node) -> std::optional<std::string> {
                const std::string normalized = utils::replace_all(node, "\\", "/");
                for (const auto& layer : layers) {
                    for (const auto& pattern : layer.patterns) {
                        if (utils::glob_match(pattern, normalized)) {
                            return layer.name;
                        }
                    }
                }
                return std::nullopt;
            };
        }

        TransitionTable make_transition_table(const std::vector<core::LayerRule>& layers) {
            TransitionTable table;
            for (const auto& layer : layers) {
                table[layer.name] = layer.allowed_dependencies;
            }
            return table;
        }

        int penalty(const IssueSeverity severity) {
            switch (severity) {
                case IssueSeverity::CRITICAL: return 20;
                case IssueSeverity::HIGH: return 10;
                case IssueSeverity::MEDIUM: return 5;
                default: return 0;
            }
        }

        IssueSeverity issue_severity(const core::CycleSeverity severity) {
            switch (severity) {
                case core::CycleSeverity::HIGH: return IssueSeverity::HIGH;
                case core::CycleSeverity::MEDIUM: return IssueSeverity::MEDIUM;
                default: return IssueSeverity::LOW;
            }
        }

    }  // namespace

    LayerAnalyzer::LayerAnalyzer(LayerClassifier classifier, TransitionTable allowed, const int max_coupling)
        : classifier_(std::move(classifier))
        , allowed_(std::move(allowed))
        , max_coupling_(max_coupling) {
        for (const auto& layer : allowed_ | std::views::keys) {
            layer_order_.push_back(layer);
        }
        std::ranges::sort(layer_order_);
        compute_reachability();
    }

    LayerAnalyzer::LayerAnalyzer(const core::ArchitectureConfig& config)
        : classifier_(make_glob_classifier(config.layers))
        , allowed_(make_transition_table(config.layers))
        , max_coupling_(config.max_coupling) {
        for (const auto& layer : config.layers) {
            layer_order_.push_back(layer.name);
        }
        compute_reachability();
    }

    void LayerAnalyzer::compute_reachability() {
        for (const auto& [layer, direct] : allowed_) {
            auto& reachable = reachable_[layer];
            reachable.insert(layer);

            std::queue<std::string> queue;
            for (const auto& next : direct) {
                queue.push(next);
            }

            while (!queue.empty()) {
                const std::string current = queue.front();
                queue.pop();
                if (!reachable.insert(current).second) {
                    continue;
                }
                if (const auto it = allowed_.find(current); it != allowed_.end()) {
                    for (const auto& next : it->second) {
                        queue.push(next);
                    }
                }
            }
        }
    }

    std::optional<std::string> LayerAnalyzer::classify(const std::string& node) const {
        return classifier_ ? classifier_(node) : std::nullopt;
    }

    bool LayerAnalyzer::is_allowed(const std::string& from_layer, const std::string& to_layer) const {
        if (from_layer == to_layer) {
            return true;
        }
        const auto it = reachable_.find(from_layer);
        return it != reachable_.end() && it->second.contains(to_layer);
    }

    std::vector<BoundaryViolation> LayerAnalyzer::boundary_violations(const core::DependencyGraph& graph) const {
        std::vector<BoundaryViolation> violations;
        std::unordered_map<std::string, std::optional<std::string>> layers;

        const auto layer_of = [&](const std::string& node) -> const std::optional<std::string>& {
            auto it = layers.find(node);
            if (it == layers.end()) {
                it = layers.emplace(node, classify(node)).first;
            }
            return it->second;
        };

        for (const auto& node : graph.get_all_nodes()) {
            const auto& from_layer = layer_of(node);
            if (!from_layer) {
                continue;
            }

            for (const auto deps = graph.get_dependencies(node); const auto& dep : deps) {
                const auto& to_layer = layer_of(dep);
                if (to_layer && !is_allowed(*from_layer, *to_layer)) {
                    violations.push_back(BoundaryViolation{node, dep, *from_layer, *to_layer});
                }
            }
        }

        return violations;
    }

    ArchitectureReport LayerAnalyzer::analyze(const core::DependencyGraph& graph) const {
        ArchitectureReport report;
        report.cycles = graph::detect_cycles(graph);
        report.violations = boundary_violations(graph);
        report.hotspots = ImpactAnalyzer::find_coupling_hotspots(graph, max_coupling_);

        std::map<std::string, LayerHealth> health;
        std::vector<std::string> order = layer_order_;
        const auto entry = [&](const std::string& layer) -> LayerHealth& {
            if (!health.contains(layer)) {
                health[layer].layer = layer;
                if (std::ranges::find(order, layer) == order.end()) {
                    order.push_back(layer);
                }
            }
            return health[layer];
        };

        for (const auto& layer : layer_order_) {
            entry(layer);
        }

        std::size_t total_coupling = 0;
        for (const auto& node : graph.get_all_nodes()) {
            total_coupling += graph::fan_in(graph, node) + graph::fan_out(graph, node);
            if (const auto layer = classify(node)) {
                entry(*layer).node_count++;
            }
        }

        for (const auto& violation : report.violations) {
            entry(violation.from_layer).violations++;
        }

        for (const auto& layer : order) {
            auto& layer_health = health[layer];
            layer_health.health = std::max(0, 100 - 10 * static_cast<int>(layer_health.violations));
            report.metrics.layers.push_back(layer_health);
        }

        report.metrics.average_coupling = graph.node_count() == 0
            ? 0.0
            : static_cast<double>(total_coupling) / static_cast<double>(graph.node_count());

        int deductions = 0;
        for (const auto& cycle : report.cycles) {
            deductions += penalty(issue_severity(cycle.severity));
        }
        for (const auto& hotspot : report.hotspots) {
            deductions += penalty(hotspot.severity);
        }
        deductions += penalty(IssueSeverity::HIGH) * static_cast<int>(report.violations.size());

        report.metrics.architecture_score = std::max(0, 100 - deductions);
        return report;
    }

}  // namespace insight::analysis
