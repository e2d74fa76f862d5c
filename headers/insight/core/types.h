//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_TYPES_H
#define INSIGHT_TYPES_H

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace insight::core {

    using timestamp = std::chrono::system_clock::time_point;

    enum class NodeKind {
        FILE,
        PACKAGE
    };

    enum class EdgeKind {
        DEPENDENCY,
        DEV_DEPENDENCY
    };

    enum class CycleSeverity {
        HIGH,
        MEDIUM,
        LOW
    };

    struct Node {
        std::string id;
        NodeKind kind = NodeKind::FILE;
        std::unordered_map<std::string, std::string> metadata;
    };

    struct DependencyEdge {
        std::string target;
        EdgeKind kind = EdgeKind::DEPENDENCY;
        double weight = 1.0;

        DependencyEdge() = default;
        explicit DependencyEdge(std::string target,
                                const EdgeKind kind = EdgeKind::DEPENDENCY,
                                const double weight = 1.0)
            : target(std::move(target)), kind(kind), weight(weight) {}
    };

    /**
     * A dependency cycle. @c path lists the member nodes in traversal order
     * without repeating the first node at the end, so @c length == path.size().
     */
    struct Cycle {
        std::vector<std::string> path;
        std::size_t length = 0;
        CycleSeverity severity = CycleSeverity::LOW;
    };

    /**
     * Directed graph of files or packages.
     *
     * Referencing an unknown node in add_edge registers it as a FILE node. Nodes keep
     * their insertion order, which every traversal in insight::graph follows, so the
     * algorithms are deterministic for a given construction sequence. A second edge
     * between the same ordered pair is ignored.
     */
    class DependencyGraph {
    public:
        DependencyGraph() = default;

        /**
         * Register @p id, or update the kind of an already registered node.
         */
        void add_node(const std::string& id, NodeKind kind = NodeKind::FILE);

        void set_node_metadata(const std::string& id, const std::string& key, std::string value);

        /**
         * @return false when an edge from @p source to @p target already existed.
         */
        bool add_edge(const std::string& source, const std::string& target,
                      EdgeKind kind = EdgeKind::DEPENDENCY, double weight = 1.0);

        [[nodiscard]] bool has_node(const std::string& id) const;
        [[nodiscard]] bool has_edge(const std::string& source, const std::string& target) const;

        /// @return The node, or nullptr if @p id is unknown.
        [[nodiscard]] const Node* get_node(const std::string& id) const;

        [[nodiscard]] std::vector<std::string> get_dependencies(const std::string& id) const;
        [[nodiscard]] std::vector<std::string> get_dependencies(const std::string& id, EdgeKind kind) const;
        [[nodiscard]] std::vector<std::string> get_reverse_dependencies(const std::string& id) const;
        [[nodiscard]] std::vector<DependencyEdge> get_edges(const std::string& id) const;

        [[nodiscard]] std::size_t node_count() const;
        [[nodiscard]] std::size_t edge_count() const;

        /// @return Node ids in insertion order.
        [[nodiscard]] const std::vector<std::string>& get_all_nodes() const { return node_order_; }

        void clear();

    private:
        void ensure_node(const std::string& id);

        std::vector<std::string> node_order_{};
        std::unordered_map<std::string, Node> nodes_{};
        std::unordered_map<std::string, std::vector<DependencyEdge>> adjacency_list_{};
        std::unordered_map<std::string, std::vector<std::string>> reverse_adjacency_list_{};
        std::size_t edge_count_{};
    };

    /**
     * Severity of a cycle by member count: one or two nodes is HIGH, three or
     * four MEDIUM, anything longer LOW.
     */
    CycleSeverity cycle_severity_for_length(std::size_t length);

    std::string to_string(NodeKind kind);
    std::string to_string(EdgeKind kind);
    std::string to_string(CycleSeverity severity);

    NodeKind node_kind_from_string(const std::string& str);
    EdgeKind edge_kind_from_string(const std::string& str);
    CycleSeverity cycle_severity_from_string(const std::string& str);

}  // namespace insight::core

#endif //INSIGHT_TYPES_H
