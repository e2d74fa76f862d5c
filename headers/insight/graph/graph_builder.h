//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_GRAPH_BUILDER_H
#define INSIGHT_GRAPH_BUILDER_H

#include "insight/core/result.h"
#include "insight/core/types.h"
#include <string>
#include <vector>

namespace insight::graph {

    /**
     * What an external detector learned about one node: its kind and the nodes it
     * imports. Targets need not be described by a fact of their own.
     */
    struct AdjacencyFact {
        std::string node_id;
        std::vector<std::string> dependencies;
        std::vector<std::string> dev_dependencies;
        core::NodeKind kind = core::NodeKind::FILE;
    };

    struct EdgeFact {
        std::string from;
        std::string to;
        core::EdgeKind kind = core::EdgeKind::DEPENDENCY;
        double weight = 1.0;
    };

    /**
     * @class GraphBuilder
     * Turns caller-supplied adjacency facts or edge lists into a DependencyGraph.
     *
     * Construction is permissive: a target that was never described becomes a FILE
     * node, self references are kept as self-loops, and repeated edges collapse
     * onto the first one.
     */
    class GraphBuilder {
    public:
        GraphBuilder() = default;

        /**
         * @param facts Facts in the order their nodes should be registered.
         * @return The graph; construction itself cannot fail.
         */
        [[nodiscard]] core::DependencyGraph build(const std::vector<AdjacencyFact>& facts) const;

        [[nodiscard]] core::DependencyGraph build_from_edges(const std::vector<EdgeFact>& edges) const;

        /**
         * Reads adjacency facts from a JSON file and builds the graph.
         *
         * @return The graph, FILE_NOT_FOUND, JSON_PARSE_ERROR or INVALID_FORMAT.
         */
        [[nodiscard]] core::Result<core::DependencyGraph> load_from_file(const std::string& path) const;

        /**
         * Skip devDependencies when building. They are kept by default.
         */
        void set_include_dev_dependencies(bool include);

    private:
        bool include_dev_dependencies_ = true;
    };

    /**
     * Parse adjacency facts from JSON text, either a top-level array of
     * {"id", "kind", "dependencies", "devDependencies"} objects or an object whose
     * "nodes" member is such an array. Only "id" is required.
     */
    core::Result<std::vector<AdjacencyFact>> parse_adjacency_json(const std::string& json);

}  // namespace insight::graph

#endif //INSIGHT_GRAPH_BUILDER_H
