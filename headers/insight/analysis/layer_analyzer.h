//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_LAYER_ANALYZER_H
#define INSIGHT_LAYER_ANALYZER_H

#include "insight/analysis/impact_analyzer.h"
#include "insight/core/config.h"
#include "insight/core/types.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace insight::analysis {

    /// Maps a node id to its layer, or std::nullopt when the node belongs to none.
    using LayerClassifier = std::function<std::optional<std::string>(const std::string&)>;

    /// Layer name to the layers it may depend on directly.
    using TransitionTable = std::unordered_map<std::string, std::vector<std::string>>;

    struct BoundaryViolation {
        std::string from;
        std::string to;
        std::string from_layer;
        std::string to_layer;
    };

    struct LayerHealth {
        std::string layer;
        std::size_t node_count = 0;
        std::size_t violations = 0;     ///< Violating edges that start in this layer.
        int health = 100;
    };

    struct ArchitectureMetrics {
        std::vector<LayerHealth> layers;
        double average_coupling = 0.0;
        int architecture_score = 100;
    };

    struct ArchitectureReport {
        std::vector<core::Cycle> cycles;
        std::vector<BoundaryViolation> violations;
        std::vector<CouplingIssue> hotspots;
        ArchitectureMetrics metrics;
    };

    /**
     * @class LayerAnalyzer
     * Checks dependency edges against an architectural layering.
     *
     * An edge from layer A to layer B is legal when B is reachable from A in the
     * transition table, counting zero steps, so a layer may always use itself.
     * Edges with an unclassified endpoint are never reported.
     */
    class LayerAnalyzer {
    public:
        LayerAnalyzer(LayerClassifier classifier, TransitionTable allowed, int max_coupling = 10);

        /**
         * Uses the configured layers: a node belongs to the first layer with a
         * glob pattern matching its id (backslashes read as '/').
         */
        explicit LayerAnalyzer(const core::ArchitectureConfig& config);

        [[nodiscard]] std::optional<std::string> classify(const std::string& node) const;

        [[nodiscard]] bool is_allowed(const std::string& from_layer, const std::string& to_layer) const;

        /**
         * @return Violating edges, ordered by source node insertion order and then edge order.
         */
        [[nodiscard]] std::vector<BoundaryViolation> boundary_violations(const core::DependencyGraph& graph) const;

        /**
         * Cycles, boundary violations and coupling hotspots together with the
         * metrics derived from them.
         *
         * The architecture score starts at 100 and loses 20 per critical, 10 per
         * high and 5 per medium finding, where every boundary violation counts as
         * high. It never drops below 0.
         */
        [[nodiscard]] ArchitectureReport analyze(const core::DependencyGraph& graph) const;

    private:
        void compute_reachability();

        LayerClassifier classifier_;
        TransitionTable allowed_;
        std::vector<std::string> layer_order_;
        std::unordered_map<std::string, std::unordered_set<std::string>> reachable_;
        int max_coupling_;
    };

}  // namespace insight::analysis

#endif //INSIGHT_LAYER_ANALYZER_H
