//
// Created by gregorian on 19/10/2026.
//

#include "insight/core/types.h"
#include <algorithm>
#include <stdexcept>

namespace insight::core {

    void DependencyGraph::ensure_node(const std::string& id) {
        if (nodes_.contains(id)) {
            return;
        }
        nodes_.emplace(id, Node{id, NodeKind::FILE, {}});
        adjacency_list_[id] = {};
        reverse_adjacency_list_[id] = {};
        node_order_.push_back(id);
    }

    void DependencyGraph::add_node(const std::string& id, const NodeKind kind) {
        ensure_node(id);
        nodes_.at(id).kind = kind;
    }

    void DependencyGraph::set_node_metadata(const std::string& id, const std::string& key, std::string value) {
        ensure_node(id);
        nodes_.at(id).metadata[key] = std::move(value);
    }

    bool DependencyGraph::add_edge(const std::string& source, const std::string& target,
                                   const EdgeKind kind, const double weight) {
        ensure_node(source);
        ensure_node(target);

        if (has_edge(source, target)) {
            return false;
        }

        adjacency_list_[source].emplace_back(target, kind, weight);
        reverse_adjacency_list_[target].push_back(source);
        ++edge_count_;
        return true;
    }

    bool DependencyGraph::has_node(const std::string& id) const {
        return nodes_.contains(id);
    }

    bool DependencyGraph::has_edge(const std::string& source, const std::string& target) const {
        const auto it = adjacency_list_.find(source);
        if (it == adjacency_list_.end()) {
            return false;
        }

        return std::ranges::any_of(it->second,
                                   [&target](const DependencyEdge& edge) {
                                       return edge.target == target;});
    }

    const Node* DependencyGraph::get_node(const std::string& id) const {
        const auto it = nodes_.find(id);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> DependencyGraph::get_dependencies(const std::string& id) const {
        const auto it = adjacency_list_.find(id);
        if (it == adjacency_list_.end()) {
            return {};
        }

        std::vector<std::string> dependencies;
        dependencies.reserve(it->second.size());

        for (const auto& edge : it->second) {
            dependencies.push_back(edge.target);
        }

        return dependencies;
    }

    std::vector<std::string> DependencyGraph::get_dependencies(const std::string& id, const EdgeKind kind) const {
        const auto it = adjacency_list_.find(id);
        if (it == adjacency_list_.end()) {
            return {};
        }

        std::vector<std::string> dependencies;
        for (const auto& edge : it->second) {
            if (edge.kind == kind) {
                dependencies.push_back(edge.target);
            }
        }

        return dependencies;
    }

    std::vector<std::string> DependencyGraph::get_reverse_dependencies(const std::string& id) const {
        const auto it = reverse_adjacency_list_.find(id);
        if (it == reverse_adjacency_list_.end()) {
            return {};
        }

        return it->second;
    }

    std::vector<DependencyEdge> DependencyGraph::get_edges(const std::string& id) const {
        const auto it = adjacency_list_.find(id);
        if (it == adjacency_list_.end()) {
            return {};
        }

        return it->second;
    }

    std::size_t DependencyGraph::node_count() const {
        return node_order_.size();
    }

    std::size_t DependencyGraph::edge_count() const {
        return edge_count_;
    }

    void DependencyGraph::clear() {
        node_order_.clear();
        nodes_.clear();
        adjacency_list_.clear();
        reverse_adjacency_list_.clear();
        edge_count_ = 0;
    }

    CycleSeverity cycle_severity_for_length(const std::size_t length) {
        if (length <= 2) return CycleSeverity::HIGH;
        if (length <= 4) return CycleSeverity::MEDIUM;
        return CycleSeverity::LOW;
    }

    std::string to_string(const NodeKind kind) {
        switch (kind) {
            case NodeKind::FILE: return "file";
            case NodeKind::PACKAGE: return "package";
            default: return "unknown";
        }
    }

    std::string to_string(const EdgeKind kind) {
        switch (kind) {
            case EdgeKind::DEPENDENCY: return "dependency";
            case EdgeKind::DEV_DEPENDENCY: return "devDependency";
            default: return "unknown";
        }
    }

    std::string to_string(const CycleSeverity severity) {
        switch (severity) {
            case CycleSeverity::HIGH: return "high";
            case CycleSeverity::MEDIUM: return "medium";
            case CycleSeverity::LOW: return "low";
            default: return "unknown";
        }
    }

    NodeKind node_kind_from_string(const std::string& str) {
        if (str == "file") return NodeKind::FILE;
        if (str == "package") return NodeKind::PACKAGE;
        throw std::invalid_argument("Unknown NodeKind: " + str);
    }

    EdgeKind edge_kind_from_string(const std::string& str) {
        if (str == "dependency") return EdgeKind::DEPENDENCY;
        if (str == "devDependency") return EdgeKind::DEV_DEPENDENCY;
        throw std::invalid_argument("Unknown EdgeKind: " + str);
    }

    CycleSeverity cycle_severity_from_string(const std::string& str) {
        if (str == "high") return CycleSeverity::HIGH;
        if (str == "medium") return CycleSeverity::MEDIUM;
        if (str == "low") return CycleSeverity::LOW;
        throw std::invalid_argument("Unknown CycleSeverity: " + str);
    }

}  // namespace insight::core
