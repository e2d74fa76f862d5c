//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "insight/analysis/impact_analyzer.h"
#include "insight/analysis/layer_analyzer.h"
#include "insight/graph/graph_algorithms.h"
#include "insight/graph/graph_builder.h"
#include "insight/learning/adaptive_confidence.h"
#include <filesystem>
#include <fstream>

using namespace insight;
using namespace insight::learning;
using ::testing::ElementsAre;
namespace fs = std::filesystem;

class LearningLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "insight_learning_loop_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
        config.state_path = (temp_dir / "state" / "patterns.json").string();

        graph_path = (temp_dir / "graph.json").string();
        std::ofstream file(graph_path);
        file << R"({
            "nodes": [
                {"id": "ui/page", "dependencies": ["service/users"]},
                {"id": "service/users", "dependencies": ["data/repo"]},
                {"id": "data/repo", "dependencies": ["service/users"]},
                {"id": "ui/widget", "dependencies": ["ui/page"], "devDependencies": ["fixtures"]}
            ]
        })";
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    static std::optional<std::string> by_prefix(const std::string& node) {
        const auto slash = node.find('/');
        if (slash == std::string::npos) {
            return std::nullopt;
        }
        return node.substr(0, slash);
    }

    static PatternSignature signature_for(const core::Cycle& cycle) {
        return PatternSignature{"architecture-circular", "import-cycle", {cycle.path.front(), 1}};
    }

    fs::path temp_dir;
    std::string graph_path;
    core::LearningConfig config;
};

TEST_F(LearningLoopTest, GraphFindingsFeedTheStore) {
    const auto graph = graph::GraphBuilder().load_from_file(graph_path);
    ASSERT_TRUE(graph.is_success()) << graph.error().to_string();

    const auto cycles = graph::detect_cycles(graph.value());
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_THAT(cycles[0].path, ElementsAre("service/users", "data/repo"));

    const analysis::LayerAnalyzer layers(by_prefix, {
        {"ui", {"service"}},
        {"service", {"data"}},
        {"data", {}}
    });
    const auto violations = layers.boundary_violations(graph.value());
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].from, "data/repo");
    EXPECT_EQ(violations[0].to, "service/users");

    const auto affected = analysis::ImpactAnalyzer::get_affected({"data/repo"}, graph.value());
    EXPECT_EQ(affected, (std::set<std::string>{"data/repo", "service/users", "ui/page", "ui/widget"}));

    const auto signature = signature_for(cycles[0]);
    {
        PatternStore store(config);
        const AdaptiveConfidence adaptive(store);

        const auto first = adaptive.calculate({90, 90, 80}, signature);
        EXPECT_EQ(first.score, ConfidenceCalculator::calculate({90, 90, 80, 70.0}).score);

        for (int i = 0; i < 20; ++i) {
            adaptive.record_outcome(signature, true, first.score);
        }
        ASSERT_TRUE(store.close().is_success());
    }

    PatternStore reloaded(config);
    ASSERT_TRUE(reloaded.load().is_success());
    const auto record = reloaded.get_pattern(signature);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->performance.detection_count, 20u);
    EXPECT_DOUBLE_EQ(record->performance.success_rate, 1.0);
    EXPECT_EQ(reloaded.get_global_stats().total_patterns, 1u);

    const AdaptiveConfidence adaptive(reloaded);
    const auto boosted = adaptive.calculate({90, 90, 80}, signature);
    const auto base = ConfidenceCalculator::calculate({90, 90, 80, 100.0});
    EXPECT_EQ(boosted.score, std::min(100, base.score + 15));
}

TEST_F(LearningLoopTest, FalsePositivesSilenceAFinding) {
    const auto graph = graph::GraphBuilder().load_from_file(graph_path);
    ASSERT_TRUE(graph.is_success());
    const auto signature = signature_for(graph::detect_cycles(graph.value()).at(0));

    PatternStore store(config);
    const AdaptiveConfidence adaptive(store);
    for (int i = 0; i < 10; ++i) {
        adaptive.record_outcome(signature, false, 60.0);
    }

    EXPECT_EQ(adaptive.calculate({100, 100, 100}, signature).score, 0);

    PatternStore reloaded(config);
    const auto record = reloaded.get_pattern(signature);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->lifecycle.skip_in_future);
    EXPECT_EQ(record->notes, "Auto-skipped: FP rate 100.0% exceeds threshold");
}
