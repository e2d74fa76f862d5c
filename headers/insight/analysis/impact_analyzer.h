//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_IMPACT_ANALYZER_H
#define INSIGHT_IMPACT_ANALYZER_H

#include "insight/core/result.h"
#include "insight/core/types.h"
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace insight::analysis {

    enum class IssueSeverity {
        CRITICAL,
        HIGH,
        MEDIUM,
        LOW
    };

    std::string to_string(IssueSeverity severity);

    struct FanMetrics {
        std::size_t fan_in = 0;
        std::size_t fan_out = 0;

        [[nodiscard]] std::size_t coupling() const { return fan_in + fan_out; }
    };

    /**
     * A node whose combined fan-in and fan-out exceeds the coupling limit.
     */
    struct CouplingIssue {
        std::string node;
        FanMetrics metrics;
        IssueSeverity severity = IssueSeverity::MEDIUM;
    };

    /**
     * @class ImpactAnalyzer
     * Answers "what is touched if these nodes change" and reports per-node
     * coupling over a dependency graph.
     *
     * All methods are stateless; unknown nodes in set-based queries are ignored,
     * single-node queries report them as errors.
     */
    class ImpactAnalyzer {
    public:
        ImpactAnalyzer() = default;

        /**
         * Every node that depends, directly or indirectly, on at least one of
         * @p changed_nodes. Terminates on cyclic graphs.
         *
         * @param changed_nodes Ids of the modified nodes.
         * @param graph The dependency graph.
         * @return The affected node ids. A changed node appears only if it depends on a changed node.
         */
        static std::set<std::string> get_affected(
            const std::vector<std::string>& changed_nodes,
            const core::DependencyGraph& graph
        );

        /**
         * Direct and transitive dependents of one node.
         *
         * @return The dependents in breadth-first order, or INVALID_ARGUMENT if the node is unknown.
         */
        static core::Result<std::vector<std::string>> get_affected_files(
            const std::string& changed_file,
            const core::DependencyGraph& graph
        );

        /**
         * Shortest chain of edges through which @p from depends on @p to.
         *
         * @return The chain (empty when @p to is unreachable), or NODE_NOT_FOUND.
         */
        static core::Result<std::vector<std::string>> get_dependency_chain(
            const std::string& from,
            const std::string& to,
            const core::DependencyGraph& graph
        );

        static std::size_t fan_in(const std::string& node, const core::DependencyGraph& graph);

        static std::size_t fan_out(const std::string& node, const core::DependencyGraph& graph);

        static std::unordered_map<std::string, FanMetrics> calculate_fan_metrics(
            const core::DependencyGraph& graph
        );

        /**
         * Nodes with fan-in + fan-out above @p max_coupling, most coupled first.
         * Above twice the limit the issue is HIGH, otherwise MEDIUM.
         */
        static std::vector<CouplingIssue> find_coupling_hotspots(
            const core::DependencyGraph& graph,
            int max_coupling = 10
        );

        /**
         * Sum over @p changed_nodes of the number of nodes each one affects.
         */
        static std::size_t count_cascading_changes(
            const std::vector<std::string>& changed_nodes,
            const core::DependencyGraph& graph
        );
    };

}  // namespace insight::analysis

#endif //INSIGHT_IMPACT_ANALYZER_H
