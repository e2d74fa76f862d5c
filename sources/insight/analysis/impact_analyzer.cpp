//
// Created by gregorian on 19/10/2026.
//

#include "insight/analysis/impact_analyzer.h"
#include "insight/graph/graph_algorithms.h"
#include "insight/utils/logger.h"
#include <algorithm>

namespace insight::analysis {

    std::string to_string(const IssueSeverity severity) {
        switch (severity) {
            case IssueSeverity::CRITICAL: return "critical";
            case IssueSeverity::HIGH: return "high";
            case IssueSeverity::MEDIUM: return "medium";
            case IssueSeverity::LOW: return "low";
            default: return "unknown";
        }
    }

    std::set<std::string> ImpactAnalyzer::get_affected(
        const std::vector<std::string>& changed_nodes,
        const core::DependencyGraph& graph
    ) {
        for (const auto& node : changed_nodes) {
            if (!graph.has_node(node)) {
                INSIGHT_LOG_DEBUG("ImpactAnalyzer", "Ignoring unknown changed node: " + node);
            }
        }

        const auto dependents = graph::get_transitive_dependents(graph, changed_nodes);
        return {dependents.begin(), dependents.end()};
    }

    core::Result<std::vector<std::string>> ImpactAnalyzer::get_affected_files(
        const std::string& changed_file,
        const core::DependencyGraph& graph
    ) {
        if (!graph.has_node(changed_file)) {
            return core::Result<std::vector<std::string>>::failure(
                core::ErrorCode::INVALID_ARGUMENT,
                "Node not found in dependency graph: " + changed_file
            );
        }

        auto affected = graph::get_transitive_dependents(graph, {changed_file});

        return core::Result<std::vector<std::string>>::success(std::move(affected));
    }

    core::Result<std::vector<std::string>> ImpactAnalyzer::get_dependency_chain(
        const std::string& from,
        const std::string& to,
        const core::DependencyGraph& graph
    ) {
        for (const auto& node : {from, to}) {
            if (!graph.has_node(node)) {
                return core::Result<std::vector<std::string>>::failure(
                    core::ErrorCode::NODE_NOT_FOUND,
                    "Node not found in dependency graph: " + node
                );
            }
        }

        return core::Result<std::vector<std::string>>::success(graph::find_path(graph, from, to));
    }

    std::size_t ImpactAnalyzer::fan_in(const std::string& node, const core::DependencyGraph& graph) {
        return graph::fan_in(graph, node);
    }

    std::size_t ImpactAnalyzer::fan_out(const std::string& node, const core::DependencyGraph& graph) {
        return graph::fan_out(graph, node);
    }

    std::unordered_map<std::string, FanMetrics> ImpactAnalyzer::calculate_fan_metrics(
        const core::DependencyGraph& graph
    ) {
        std::unordered_map<std::string, FanMetrics> metrics;
        metrics.reserve(graph.node_count());

        for (const auto& node : graph.get_all_nodes()) {
            metrics[node] = FanMetrics{graph::fan_in(graph, node), graph::fan_out(graph, node)};
        }

        return metrics;
    }

    std::vector<CouplingIssue> ImpactAnalyzer::find_coupling_hotspots(
        const core::DependencyGraph& graph,
        const int max_coupling
    ) {
        std::vector<CouplingIssue> issues;
        const auto limit = static_cast<std::size_t>(std::max(max_coupling, 0));

        for (const auto& node : graph.get_all_nodes()) {
            const FanMetrics metrics{graph::fan_in(graph, node), graph::fan_out(graph, node)};
            if (metrics.coupling() <= limit) {
                continue;
            }
            issues.push_back(CouplingIssue{
                node,
                metrics,
                metrics.coupling() > 2 * limit ? IssueSeverity::HIGH : IssueSeverity::MEDIUM
            });
        }

        std::ranges::stable_sort(issues, [](const CouplingIssue& a, const CouplingIssue& b) {
            return a.metrics.coupling() > b.metrics.coupling();
        });

        return issues;
    }

    std::size_t ImpactAnalyzer::count_cascading_changes(
        const std::vector<std::string>& changed_nodes,
        const core::DependencyGraph& graph
    ) {
        std::size_t total = 0;
        for (const auto& node : changed_nodes) {
            if (auto affected = get_affected_files(node, graph); affected.is_success()) {
                total += affected.value().size();
            }
        }
        return total;
    }

}  // namespace insight::analysis
