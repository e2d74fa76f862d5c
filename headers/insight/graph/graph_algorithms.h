//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_GRAPH_ALGORITHMS_H
#define INSIGHT_GRAPH_ALGORITHMS_H

#include "insight/core/types.h"
#include <string>
#include <unordered_set>
#include <vector>

namespace insight::graph {

    /**
     * Mutable state of one depth-first traversal. Every algorithm below creates
     * its own instance, so traversals over the same graph are independent and
     * may run concurrently.
     */
    struct TraversalState {
        std::unordered_set<std::string> visited;
        std::unordered_set<std::string> on_stack;
        std::vector<std::string> path;
    };

    /**
     * Finds dependency cycles with a depth-first traversal over all edge kinds.
     *
     * Reaching a node that is on the recursion stack yields the path slice from
     * that node's first occurrence to the current node. A cycle is reported once
     * per distinct member set, whichever node the traversal entered it from.
     * Self-loops are cycles of length 1.
     *
     * @param graph The dependency graph to inspect.
     * @return Cycles in discovery order, each with its length and severity.
     */
    std::vector<core::Cycle> detect_cycles(const core::DependencyGraph& graph);

    bool has_cycle(const core::DependencyGraph& graph);

    /**
     * Kahn's algorithm over DEPENDENCY edges only.
     *
     * Nodes that never reach in-degree zero (cycle members and everything that
     * depends on them through DEPENDENCY edges) are left out of the result; that
     * omission is how a cycle shows up here. Zero in-degree nodes are released in
     * insertion order.
     *
     * @param graph The dependency graph to order.
     * @return Node ids such that every DEPENDENCY edge points forward.
     */
    std::vector<std::string> topological_order(const core::DependencyGraph& graph);

    /**
     * Longest chain of nodes connected by edges, measured in node count.
     *
     * Acyclic graphs are solved by dynamic programming over a topological order.
     * Otherwise the graph is condensed into strongly connected components: walks
     * inside a component are searched depth first without re-entering a node on
     * the current path, and components are chained through the condensation DAG.
     * Ties go to the chain that ends (acyclic) or starts (cyclic) earliest in node
     * insertion order.
     *
     * @return The chain from its first to its last node, or an empty vector for an empty graph.
     */
    std::vector<std::string> find_critical_path(const core::DependencyGraph& graph);

    /**
     * Tarjan's strongly connected components. Only components that contain a
     * cycle are returned: two or more nodes, or a single node with a self-loop.
     */
    std::vector<std::vector<std::string>> find_strongly_connected_components(
        const core::DependencyGraph& graph
    );

    /// @return True when the graph has no cycle over any edge kind.
    bool is_dag(const core::DependencyGraph& graph);

    /// Nodes with no incoming edges, in insertion order.
    std::vector<std::string> find_root_nodes(const core::DependencyGraph& graph);

    /// Nodes with no outgoing edges, in insertion order.
    std::vector<std::string> find_leaf_nodes(const core::DependencyGraph& graph);

    std::size_t fan_in(const core::DependencyGraph& graph, const std::string& node);

    std::size_t fan_out(const core::DependencyGraph& graph, const std::string& node);

    /**
     * Everything reachable from @p node along outgoing edges, excluding the node
     * itself unless it sits on a cycle.
     */
    std::vector<std::string> get_transitive_dependencies(
        const core::DependencyGraph& graph,
        const std::string& node
    );

    /**
     * Every node that reaches any of @p nodes along outgoing edges, found by a
     * breadth-first walk over reverse edges. A seed is part of the result only
     * when it depends on another seed (or itself). Unknown seeds are ignored.
     */
    std::vector<std::string> get_transitive_dependents(
        const core::DependencyGraph& graph,
        const std::vector<std::string>& nodes
    );

    /**
     * Shortest chain of dependency edges from @p start to @p end by BFS.
     *
     * @return The chain including both ends, or an empty vector if @p end is unreachable.
     */
    std::vector<std::string> find_path(
        const core::DependencyGraph& graph,
        const std::string& start,
        const std::string& end
    );

}  // namespace insight::graph

#endif //INSIGHT_GRAPH_ALGORITHMS_H
