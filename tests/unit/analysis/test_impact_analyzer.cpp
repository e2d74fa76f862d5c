//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "insight/analysis/impact_analyzer.h"

using namespace insight::analysis;
using namespace insight::core;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

class ImpactAnalyzerTest : public ::testing::Test {
protected:
    static DependencyGraph create_chain() {
        DependencyGraph graph;
        graph.add_edge("A", "B");
        graph.add_edge("B", "C");
        return graph;
    }

    static DependencyGraph create_hub(const int spokes) {
        DependencyGraph graph;
        for (int i = 0; i < spokes; ++i) {
            graph.add_edge("spoke" + std::to_string(i), "hub");
        }
        return graph;
    }
};

TEST_F(ImpactAnalyzerTest, GetAffected_ReturnsDependents) {
    const auto affected = ImpactAnalyzer::get_affected({"C"}, create_chain());

    EXPECT_EQ(affected, (std::set<std::string>{"A", "B"}));
}

TEST_F(ImpactAnalyzerTest, GetAffected_MultipleSeeds) {
    auto graph = create_chain();
    graph.add_edge("X", "Y");

    const auto affected = ImpactAnalyzer::get_affected({"B", "Y"}, graph);

    EXPECT_EQ(affected, (std::set<std::string>{"A", "X"}));
}

TEST_F(ImpactAnalyzerTest, GetAffected_SeedReachedThroughAnotherSeed) {
    const auto affected = ImpactAnalyzer::get_affected({"B", "C"}, create_chain());

    EXPECT_EQ(affected, (std::set<std::string>{"A", "B"}));
}

TEST_F(ImpactAnalyzerTest, GetAffected_UnknownNodesIgnored) {
    EXPECT_TRUE(ImpactAnalyzer::get_affected({"nope"}, create_chain()).empty());
}

TEST_F(ImpactAnalyzerTest, GetAffected_TerminatesOnCycle) {
    DependencyGraph graph;
    graph.add_edge("A", "B");
    graph.add_edge("B", "A");
    graph.add_edge("C", "A");

    EXPECT_EQ(ImpactAnalyzer::get_affected({"A"}, graph), (std::set<std::string>{"A", "B", "C"}));
}

TEST_F(ImpactAnalyzerTest, GetAffectedFiles) {
    const auto result = ImpactAnalyzer::get_affected_files("C", create_chain());

    ASSERT_TRUE(result.is_success());
    EXPECT_THAT(result.value(), ElementsAre("B", "A"));
}

TEST_F(ImpactAnalyzerTest, GetAffectedFiles_UnknownNode) {
    const auto result = ImpactAnalyzer::get_affected_files("missing", create_chain());

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ImpactAnalyzerTest, DependencyChain) {
    const auto result = ImpactAnalyzer::get_dependency_chain("A", "C", create_chain());

    ASSERT_TRUE(result.is_success());
    EXPECT_THAT(result.value(), ElementsAre("A", "B", "C"));

    const auto reversed = ImpactAnalyzer::get_dependency_chain("C", "A", create_chain());
    ASSERT_TRUE(reversed.is_success());
    EXPECT_TRUE(reversed.value().empty());

    const auto missing = ImpactAnalyzer::get_dependency_chain("A", "Z", create_chain());
    ASSERT_TRUE(missing.is_failure());
    EXPECT_EQ(missing.error().code, ErrorCode::NODE_NOT_FOUND);
}

TEST_F(ImpactAnalyzerTest, FanMetrics) {
    const auto graph = create_chain();

    EXPECT_EQ(ImpactAnalyzer::fan_in("B", graph), 1u);
    EXPECT_EQ(ImpactAnalyzer::fan_out("B", graph), 1u);

    const auto metrics = ImpactAnalyzer::calculate_fan_metrics(graph);
    ASSERT_EQ(metrics.size(), 3u);
    EXPECT_EQ(metrics.at("A").fan_out, 1u);
    EXPECT_EQ(metrics.at("A").fan_in, 0u);
    EXPECT_EQ(metrics.at("C").coupling(), 1u);
}

TEST_F(ImpactAnalyzerTest, CouplingHotspots) {
    const auto issues = ImpactAnalyzer::find_coupling_hotspots(create_hub(4), 3);

    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].node, "hub");
    EXPECT_EQ(issues[0].metrics.fan_in, 4u);
    EXPECT_EQ(issues[0].severity, IssueSeverity::MEDIUM);
}

TEST_F(ImpactAnalyzerTest, CouplingHotspots_HighAboveTwiceTheLimit) {
    const auto issues = ImpactAnalyzer::find_coupling_hotspots(create_hub(7), 3);

    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].severity, IssueSeverity::HIGH);
}

TEST_F(ImpactAnalyzerTest, CouplingHotspots_AtLimitIsFine) {
    EXPECT_TRUE(ImpactAnalyzer::find_coupling_hotspots(create_hub(3), 3).empty());
}

TEST_F(ImpactAnalyzerTest, CascadingChanges) {
    EXPECT_EQ(ImpactAnalyzer::count_cascading_changes({"C", "B", "missing"}, create_chain()), 3u);
}

TEST_F(ImpactAnalyzerTest, SeverityNames) {
    EXPECT_EQ(to_string(IssueSeverity::CRITICAL), "critical");
    EXPECT_EQ(to_string(IssueSeverity::MEDIUM), "medium");
}
