//
// Created by gregorian on 19/10/2026.
//

#include "insight/graph/graph_builder.h"
#include "insight/utils/file_utils.h"
#include "insight/utils/logger.h"
#include <simdjson.h>
#include <stdexcept>

namespace insight::graph {

    namespace {

        std::vector<std::string> read_targets(simdjson::ondemand::object& obj, const std::string_view key) {
            std::vector<std::string> targets;
            auto field = obj.find_field_unordered(key);
            if (field.error() == simdjson::NO_SUCH_FIELD) {
                return targets;
            }
            for (auto target : field.get_array().value()) {
                targets.emplace_back(target.get_string().value());
            }
            return targets;
        }

        core::Result<std::vector<AdjacencyFact>> read_facts(simdjson::ondemand::array facts_array) {
            std::vector<AdjacencyFact> facts;

            for (auto entry : facts_array) {
                auto obj = entry.get_object().value();
                AdjacencyFact fact;

                auto id = obj.find_field_unordered("id");
                if (id.error() == simdjson::NO_SUCH_FIELD) {
                    return core::Result<std::vector<AdjacencyFact>>::failure(
                        core::ErrorCode::INVALID_FORMAT,
                        "Adjacency fact #" + std::to_string(facts.size()) + " has no \"id\""
                    );
                }
                fact.node_id = std::string(id.get_string().value());

                if (auto kind = obj.find_field_unordered("kind"); kind.error() != simdjson::NO_SUCH_FIELD) {
                    const std::string kind_name(kind.get_string().value());
                    try {
                        fact.kind = core::node_kind_from_string(kind_name);
                    } catch (const std::invalid_argument& e) {
                        return core::Result<std::vector<AdjacencyFact>>::failure(
                            core::ErrorCode::INVALID_FORMAT,
                            "Node " + fact.node_id + ": " + e.what()
                        );
                    }
                }

                fact.dependencies = read_targets(obj, "dependencies");
                fact.dev_dependencies = read_targets(obj, "devDependencies");
                facts.push_back(std::move(fact));
            }

            return core::Result<std::vector<AdjacencyFact>>::success(std::move(facts));
        }

    }  // namespace

    core::DependencyGraph GraphBuilder::build(const std::vector<AdjacencyFact>& facts) const {
        core::DependencyGraph graph;

        for (const auto& fact : facts) {
            graph.add_node(fact.node_id, fact.kind);
        }

        for (const auto& fact : facts) {
            for (const auto& target : fact.dependencies) {
                graph.add_edge(fact.node_id, target, core::EdgeKind::DEPENDENCY);
            }
            if (!include_dev_dependencies_) {
                continue;
            }
            for (const auto& target : fact.dev_dependencies) {
                graph.add_edge(fact.node_id, target, core::EdgeKind::DEV_DEPENDENCY);
            }
        }

        return graph;
    }

    core::DependencyGraph GraphBuilder::build_from_edges(const std::vector<EdgeFact>& edges) const {
        core::DependencyGraph graph;

        for (const auto& edge : edges) {
            if (edge.kind == core::EdgeKind::DEV_DEPENDENCY && !include_dev_dependencies_) {
                graph.add_node(edge.from);
                continue;
            }
            graph.add_edge(edge.from, edge.to, edge.kind, edge.weight);
        }

        return graph;
    }

    core::Result<core::DependencyGraph> GraphBuilder::load_from_file(const std::string& path) const {
        const auto content = utils::read_file(path);
        if (!content) {
            return core::Result<core::DependencyGraph>::failure(
                core::ErrorCode::FILE_NOT_FOUND,
                "Cannot read graph file: " + path
            );
        }

        auto facts = parse_adjacency_json(*content);
        if (facts.is_failure()) {
            INSIGHT_LOG_ERROR("GraphBuilder", "Failed to load " + path + ": " + facts.error().message);
            return core::Result<core::DependencyGraph>::failure(facts.error());
        }

        return core::Result<core::DependencyGraph>::success(build(facts.value()));
    }

    void GraphBuilder::set_include_dev_dependencies(const bool include) {
        include_dev_dependencies_ = include;
    }

    core::Result<std::vector<AdjacencyFact>> parse_adjacency_json(const std::string& json) {
        try {
            simdjson::ondemand::parser parser;
            const simdjson::padded_string padded(json);
            auto doc = parser.iterate(padded);

            switch (doc.type().value()) {
                case simdjson::ondemand::json_type::array:
                    return read_facts(doc.get_array().value());
                case simdjson::ondemand::json_type::object: {
                    auto nodes = doc.find_field_unordered("nodes");
                    if (nodes.error() == simdjson::NO_SUCH_FIELD) {
                        return core::Result<std::vector<AdjacencyFact>>::failure(
                            core::ErrorCode::INVALID_FORMAT,
                            "Graph document object must contain a \"nodes\" array"
                        );
                    }
                    return read_facts(nodes.get_array().value());
                }
                default:
                    return core::Result<std::vector<AdjacencyFact>>::failure(
                        core::ErrorCode::INVALID_FORMAT,
                        "Graph document must be an array or an object"
                    );
            }
        } catch (const simdjson::simdjson_error& e) {
            return core::Result<std::vector<AdjacencyFact>>::failure(
                core::ErrorCode::JSON_PARSE_ERROR,
                "Error parsing graph document: " + std::string(e.what())
            );
        }
    }

}  // namespace insight::graph
