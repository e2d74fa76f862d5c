//
// Created by gregorian on 19/10/2026.
//

#include "insight/graph/graph_algorithms.h"
#include <algorithm>
#include <optional>
#include <queue>
#include <set>
#include <stack>
#include <unordered_map>

namespace insight::graph {

    namespace {

        void collect_cycles(const core::DependencyGraph& graph,
                            const std::string& node,
                            TraversalState& state,
                            std::set<std::vector<std::string>>& seen,
                            std::vector<core::Cycle>& cycles) {
            state.visited.insert(node);
            state.on_stack.insert(node);
            state.path.push_back(node);

            for (const auto deps = graph.get_dependencies(node); const auto& dep : deps) {
                if (state.on_stack.contains(dep)) {
                    const auto it = std::ranges::find(state.path, dep);
                    std::vector<std::string> members(it, state.path.end());

                    auto key = members;
                    std::ranges::sort(key);
                    if (seen.insert(std::move(key)).second) {
                        const auto length = members.size();
                        cycles.push_back(core::Cycle{std::move(members), length,
                                                     core::cycle_severity_for_length(length)});
                    }
                } else if (!state.visited.contains(dep)) {
                    collect_cycles(graph, dep, state, seen, cycles);
                }
            }

            state.on_stack.erase(node);
            state.path.pop_back();
        }

        /**
         * Kahn's algorithm; with @p kind set only edges of that kind count.
         */
        std::vector<std::string> kahn_order(const core::DependencyGraph& graph,
                                            const std::optional<core::EdgeKind> kind) {
            const auto& nodes = graph.get_all_nodes();
            const auto targets_of = [&graph, kind](const std::string& node) {
                return kind ? graph.get_dependencies(node, *kind) : graph.get_dependencies(node);
            };

            std::unordered_map<std::string, std::size_t> in_degree;
            for (const auto& node : nodes) {
                in_degree[node] = 0;
            }
            for (const auto& node : nodes) {
                for (const auto& dep : targets_of(node)) {
                    in_degree[dep]++;
                }
            }

            std::queue<std::string> queue;
            for (const auto& node : nodes) {
                if (in_degree[node] == 0) {
                    queue.push(node);
                }
            }

            std::vector<std::string> result;
            result.reserve(nodes.size());
            while (!queue.empty()) {
                std::string node = queue.front();
                queue.pop();

                for (const auto& dep : targets_of(node)) {
                    if (--in_degree[dep] == 0) {
                        queue.push(dep);
                    }
                }
                result.push_back(std::move(node));
            }

            return result;
        }

        std::vector<std::string> longest_path_acyclic(const core::DependencyGraph& graph,
                                                      const std::vector<std::string>& sorted) {
            std::unordered_map<std::string, std::size_t> length;
            std::unordered_map<std::string, std::string> parent;

            for (const auto& node : sorted) {
                length[node] = 1;
            }

            for (const auto& node : sorted) {
                for (const auto deps = graph.get_dependencies(node); const auto& dep : deps) {
                    if (length[dep] < length[node] + 1) {
                        length[dep] = length[node] + 1;
                        parent[dep] = node;
                    }
                }
            }

            std::string last;
            std::size_t best = 0;
            for (const auto& node : sorted) {
                if (length[node] > best) {
                    best = length[node];
                    last = node;
                }
            }

            std::vector<std::string> path;
            for (std::string current = last; !current.empty();) {
                path.push_back(current);
                const auto it = parent.find(current);
                current = it == parent.end() ? std::string{} : it->second;
            }

            std::ranges::reverse(path);
            return path;
        }

        /// Longest chain starting at a node: a walk inside its component, then the chain of @c exit.
        struct Chain {
            std::size_t length = 0;
            std::vector<std::string> prefix;
            std::string exit;
        };

        using ChainTable = std::unordered_map<std::string, Chain>;

        void extend_within_component(const core::DependencyGraph& graph,
                                     const std::string& node,
                                     const std::unordered_map<std::string, std::size_t>& component_of,
                                     const ChainTable& chains,
                                     TraversalState& state,
                                     Chain& best) {
            state.on_stack.insert(node);
            state.path.push_back(node);

            const auto consider = [&state, &best](const std::size_t length, const std::string& exit) {
                if (length > best.length) {
                    best = Chain{length, state.path, exit};
                }
            };
            consider(state.path.size(), {});

            const auto component = component_of.at(node);
            for (const auto deps = graph.get_dependencies(node); const auto& dep : deps) {
                if (component_of.at(dep) != component) {
                    consider(state.path.size() + chains.at(dep).length, dep);
                } else if (!state.on_stack.contains(dep)) {
                    extend_within_component(graph, dep, component_of, chains, state, best);
                }
            }

            state.on_stack.erase(node);
            state.path.pop_back();
        }

        struct TarjanState {
            std::unordered_map<std::string, int> indices;
            std::unordered_map<std::string, int> lowlinks;
            std::unordered_set<std::string> on_stack;
            std::stack<std::string> stack;
            int index = 0;
        };

        void strong_connect(const core::DependencyGraph& graph,
                            const std::string& node,
                            TarjanState& state,
                            std::vector<std::vector<std::string>>& components) {
            state.indices[node] = state.index;
            state.lowlinks[node] = state.index;
            state.index++;
            state.stack.push(node);
            state.on_stack.insert(node);

            for (const auto deps = graph.get_dependencies(node); const auto& dep : deps) {
                if (!state.indices.contains(dep)) {
                    strong_connect(graph, dep, state, components);
                    state.lowlinks[node] = std::min(state.lowlinks[node], state.lowlinks[dep]);
                } else if (state.on_stack.contains(dep)) {
                    state.lowlinks[node] = std::min(state.lowlinks[node], state.indices[dep]);
                }
            }

            if (state.lowlinks[node] != state.indices[node]) {
                return;
            }

            std::vector<std::string> component;
            std::string member;
            do {
                member = state.stack.top();
                state.stack.pop();
                state.on_stack.erase(member);
                component.push_back(member);
            } while (member != node);

            std::ranges::reverse(component);
            components.push_back(std::move(component));
        }

        /// Every component, trivial ones included, sinks first.
        std::vector<std::vector<std::string>> all_components(const core::DependencyGraph& graph) {
            std::vector<std::vector<std::string>> components;
            TarjanState state;

            for (const auto& node : graph.get_all_nodes()) {
                if (!state.indices.contains(node)) {
                    strong_connect(graph, node, state, components);
                }
            }

            return components;
        }

    }  // namespace

    std::vector<core::Cycle> detect_cycles(const core::DependencyGraph& graph) {
        std::vector<core::Cycle> cycles;
        std::set<std::vector<std::string>> seen;
        TraversalState state;

        for (const auto& node : graph.get_all_nodes()) {
            if (!state.visited.contains(node)) {
                collect_cycles(graph, node, state, seen, cycles);
            }
        }

        return cycles;
    }

    bool has_cycle(const core::DependencyGraph& graph) {
        return !is_dag(graph);
    }

    std::vector<std::string> topological_order(const core::DependencyGraph& graph) {
        return kahn_order(graph, core::EdgeKind::DEPENDENCY);
    }

    std::vector<std::string> find_critical_path(const core::DependencyGraph& graph) {
        if (graph.node_count() == 0) {
            return {};
        }

        if (const auto sorted = kahn_order(graph, std::nullopt); sorted.size() == graph.node_count()) {
            return longest_path_acyclic(graph, sorted);
        }

        // Only walks inside a component are enumerated. Components are visited sinks
        // first, so every exit already has its chain.
        const auto components = all_components(graph);
        std::unordered_map<std::string, std::size_t> component_of;
        for (std::size_t i = 0; i < components.size(); ++i) {
            for (const auto& member : components[i]) {
                component_of[member] = i;
            }
        }

        ChainTable chains;
        for (const auto& component : components) {
            for (const auto& member : component) {
                TraversalState state;
                Chain best;
                extend_within_component(graph, member, component_of, chains, state, best);
                chains[member] = std::move(best);
            }
        }

        std::string start;
        std::size_t longest = 0;
        for (const auto& node : graph.get_all_nodes()) {
            if (chains.at(node).length > longest) {
                longest = chains.at(node).length;
                start = node;
            }
        }

        std::vector<std::string> path;
        for (const Chain* chain = &chains.at(start);;) {
            path.insert(path.end(), chain->prefix.begin(), chain->prefix.end());
            if (chain->exit.empty()) {
                break;
            }
            chain = &chains.at(chain->exit);
        }
        return path;
    }

    std::vector<std::vector<std::string>> find_strongly_connected_components(
        const core::DependencyGraph& graph
    ) {
        std::vector<std::vector<std::string>> cyclic;
        for (auto& component : all_components(graph)) {
            if (component.size() > 1 || graph.has_edge(component.front(), component.front())) {
                cyclic.push_back(std::move(component));
            }
        }
        return cyclic;
    }

    bool is_dag(const core::DependencyGraph& graph) {
        return kahn_order(graph, std::nullopt).size() == graph.node_count();
    }

    std::vector<std::string> find_root_nodes(const core::DependencyGraph& graph) {
        std::vector<std::string> roots;
        for (const auto& node : graph.get_all_nodes()) {
            if (graph.get_reverse_dependencies(node).empty()) {
                roots.push_back(node);
            }
        }
        return roots;
    }

    std::vector<std::string> find_leaf_nodes(const core::DependencyGraph& graph) {
        std::vector<std::string> leaves;
        for (const auto& node : graph.get_all_nodes()) {
            if (graph.get_edges(node).empty()) {
                leaves.push_back(node);
            }
        }
        return leaves;
    }

    std::size_t fan_in(const core::DependencyGraph& graph, const std::string& node) {
        return graph.get_reverse_dependencies(node).size();
    }

    std::size_t fan_out(const core::DependencyGraph& graph, const std::string& node) {
        return graph.get_edges(node).size();
    }

    std::vector<std::string> get_transitive_dependencies(
        const core::DependencyGraph& graph,
        const std::string& node
    ) {
        std::vector<std::string> result;
        std::unordered_set<std::string> visited;
        std::queue<std::string> queue;
        queue.push(node);

        while (!queue.empty()) {
            const std::string current = queue.front();
            queue.pop();

            for (const auto deps = graph.get_dependencies(current); const auto& dep : deps) {
                if (visited.insert(dep).second) {
                    result.push_back(dep);
                    queue.push(dep);
                }
            }
        }

        return result;
    }

    std::vector<std::string> get_transitive_dependents(
        const core::DependencyGraph& graph,
        const std::vector<std::string>& nodes
    ) {
        std::vector<std::string> result;
        std::unordered_set<std::string> visited;
        std::queue<std::string> queue;

        for (const auto& node : nodes) {
            if (graph.has_node(node)) {
                queue.push(node);
            }
        }

        while (!queue.empty()) {
            const std::string current = queue.front();
            queue.pop();

            for (const auto dependents = graph.get_reverse_dependencies(current); const auto& dependent : dependents) {
                if (visited.insert(dependent).second) {
                    result.push_back(dependent);
                    queue.push(dependent);
                }
            }
        }

        return result;
    }

    std::vector<std::string> find_path(
        const core::DependencyGraph& graph,
        const std::string& start,
        const std::string& end
    ) {
        if (!graph.has_node(start) || !graph.has_node(end)) {
            return {};
        }
        if (start == end) {
            return {start};
        }

        std::unordered_map<std::string, std::string> parent;
        std::unordered_set<std::string> visited{start};
        std::queue<std::string> queue;
        queue.push(start);

        while (!queue.empty()) {
            const std::string current = queue.front();
            queue.pop();

            for (const auto deps = graph.get_dependencies(current); const auto& dep : deps) {
                if (!visited.insert(dep).second) {
                    continue;
                }
                parent[dep] = current;
                if (dep == end) {
                    std::vector<std::string> path{end};
                    for (std::string step = current; step != start; step = parent[step]) {
                        path.push_back(step);
                    }
                    path.push_back(start);
                    std::ranges::reverse(path);
                    return path;
                }
                queue.push(dep);
            }
        }

        return {};
    }

}  // namespace insight::graph
