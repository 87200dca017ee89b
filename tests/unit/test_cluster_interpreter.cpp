#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "errors.h"
#include "features/feature_builder.h"
#include "interpret/cluster_interpreter.h"
#include "run_fixtures.h"

using runscope::ConfigValue;
using runscope::clustering::ClusteringResult;
using runscope::interpret::Interpret;
using runscope::interpret::InterpretationConfig;
using runscope::interpret::MetricDirection;
using runscope::testing::MakeRun;

namespace {

// Three pairs of runs: strong (rows 0-1), weak (rows 2-3), middling (rows 4-5).
auto SweepMatrix() -> runscope::FeatureMatrix {
    std::vector<runscope::RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.95}, {"loss", 0.05}}, {{"learning_rate", ConfigValue{0.05}}}),
        MakeRun("b", {{"accuracy", 0.93}, {"loss", 0.05}}, {{"learning_rate", ConfigValue{0.05}}}),
        MakeRun("c", {{"accuracy", 0.60}, {"loss", 0.80}}, {{"learning_rate", ConfigValue{0.00005}}}),
        MakeRun("d", {{"accuracy", 0.65}, {"loss", 0.80}}, {{"learning_rate", ConfigValue{0.00005}}}),
        MakeRun("e", {{"accuracy", 0.80}, {"loss", 0.30}}, {{"learning_rate", ConfigValue{0.001}}}),
        MakeRun("f", {{"accuracy", 0.82}, {"loss", 0.30}}, {{"learning_rate", ConfigValue{0.001}}}),
    };
    return runscope::features::FeatureBuilder(runscope::features::FeatureConfig{}).Build(runs);
}

auto ResultFor(const runscope::FeatureMatrix& matrix, std::vector<int> labels) -> ClusteringResult {
    ClusteringResult result;
    result.labels = std::move(labels);
    runscope::clustering::BuildSummaries(matrix, result);
    return result;
}

auto RankedLabels(const runscope::interpret::Interpretation& interp) -> std::vector<int> {
    std::vector<int> out;
    for (const auto& c : interp.ranked) {
        out.push_back(c.label);
    }
    return out;
}

} // namespace

TEST(ClusterInterpreterTest, RanksHigherIsBetter) {
    auto matrix = SweepMatrix();
    auto result = ResultFor(matrix, {0, 0, 1, 1, 2, 2});
    auto interp = Interpret(result, matrix, InterpretationConfig{});

    EXPECT_TRUE(interp.primary_metric_found);
    EXPECT_EQ(RankedLabels(interp), (std::vector<int>{0, 2, 1}));
    EXPECT_EQ(interp.best_label.value(), 0);
    EXPECT_EQ(interp.worst_label.value(), 1);
    EXPECT_EQ(interp.ranked[0].rank, 1u);
    EXPECT_EQ(interp.ranked[2].rank, 3u);
    ASSERT_TRUE(interp.ranked[0].primary_metric_mean.has_value());
    EXPECT_NEAR(*interp.ranked[0].primary_metric_mean, 0.94, 1e-12);
}

TEST(ClusterInterpreterTest, RanksLowerIsBetter) {
    auto matrix = SweepMatrix();
    auto result = ResultFor(matrix, {0, 0, 1, 1, 2, 2});
    InterpretationConfig config;
    config.primary_metric = "loss";
    config.direction = MetricDirection::LOWER_IS_BETTER;
    auto interp = Interpret(result, matrix, config);

    EXPECT_EQ(RankedLabels(interp), (std::vector<int>{0, 2, 1}));
    EXPECT_EQ(interp.direction, MetricDirection::LOWER_IS_BETTER);
}

TEST(ClusterInterpreterTest, RankingIgnoresClusterOrder) {
    auto matrix = SweepMatrix();
    auto result = ResultFor(matrix, {0, 0, 1, 1, 2, 2});
    auto forward = Interpret(result, matrix, InterpretationConfig{});

    std::reverse(result.clusters.begin(), result.clusters.end());
    auto reversed = Interpret(result, matrix, InterpretationConfig{});
    EXPECT_EQ(RankedLabels(forward), RankedLabels(reversed));
}

TEST(ClusterInterpreterTest, TagsAndDescription) {
    auto matrix = SweepMatrix();
    auto result = ResultFor(matrix, {0, 0, 1, 1, 2, 2});
    auto interp = Interpret(result, matrix, InterpretationConfig{});

    const auto& best = interp.ranked[0];
    EXPECT_EQ(best.tags, (std::vector<std::string>{"High accuracy", "Well converged", "High learning rate"}));
    EXPECT_EQ(best.description, "High accuracy, Well converged, High learning rate");

    const auto& middle = interp.ranked[1];
    EXPECT_TRUE(middle.tags.empty());
    EXPECT_EQ(middle.description, "Cluster 2");

    const auto& worst = interp.ranked[2];
    EXPECT_EQ(worst.tags, (std::vector<std::string>{"Low accuracy", "Convergence issues", "Low learning rate"}));
}

TEST(ClusterInterpreterTest, DuplicateTagsAreCollapsed) {
    auto matrix = SweepMatrix();
    auto result = ResultFor(matrix, {0, 0, 1, 1, 2, 2});
    InterpretationConfig config;
    config.tag_rules = {
        {"accuracy", runscope::interpret::TagComparison::GREATER, 0.9, "Strong"},
        {"loss", runscope::interpret::TagComparison::LESS, 0.1, "Strong"},
        {"missing_metric", runscope::interpret::TagComparison::GREATER, 0.0, "Never"},
    };
    auto interp = Interpret(result, matrix, config);
    EXPECT_EQ(interp.ranked[0].tags, (std::vector<std::string>{"Strong"}));
}

TEST(ClusterInterpreterTest, TopFeaturesUseConfigColumnsByDefault) {
    auto matrix = SweepMatrix();
    auto result = ResultFor(matrix, {0, 0, 1, 1, 2, 2});
    auto interp = Interpret(result, matrix, InterpretationConfig{});
    for (const auto& c : interp.ranked) {
        ASSERT_EQ(c.top_features.size(), 1u);
        EXPECT_EQ(c.top_features[0].feature, "config.learning_rate");
    }
    EXPECT_GT(interp.ranked[0].top_features[0].deviation, 0.0);
    EXPECT_NEAR(interp.ranked[0].top_features[0].cluster_mean, 0.05, 1e-12);

    InterpretationConfig all;
    all.config_features_only = false;
    all.top_features = 2;
    auto wide = Interpret(result, matrix, all);
    EXPECT_EQ(wide.ranked[0].top_features.size(), 2u);
    EXPECT_GE(std::abs(wide.ranked[0].top_features[0].deviation), std::abs(wide.ranked[0].top_features[1].deviation));
}

TEST(ClusterInterpreterTest, MissingPrimaryMetricFallsBackToSizeThenLabel) {
    auto matrix = runscope::testing::MakeMatrix({{0.0}, {1.0}, {1.1}, {5.0}, {5.1}, {5.2}, {9.0}, {9.1}, {9.2}});
    auto result = ResultFor(matrix, {0, 1, 1, 2, 2, 2, 3, 3, 3});
    InterpretationConfig config;
    config.primary_metric = "f1_score";
    auto interp = Interpret(result, matrix, config);

    EXPECT_FALSE(interp.primary_metric_found);
    EXPECT_EQ(RankedLabels(interp), (std::vector<int>{2, 3, 1, 0}));
    for (const auto& c : interp.ranked) {
        EXPECT_FALSE(c.primary_metric_mean.has_value());
    }
}

TEST(ClusterInterpreterTest, ClusterWithOnlyImputedPrimaryRanksLast) {
    std::vector<runscope::RunRecord> runs = {
        MakeRun("a", {{"loss", 0.9}}),
        MakeRun("b", {{"loss", 0.8}}),
        MakeRun("c", {{"accuracy", 0.4}, {"loss", 0.1}}),
        MakeRun("d", {{"accuracy", 0.5}, {"loss", 0.2}}),
    };
    auto matrix = runscope::features::FeatureBuilder(runscope::features::FeatureConfig{}).Build(runs);
    auto result = ResultFor(matrix, {0, 0, 1, 1});
    auto interp = Interpret(result, matrix, InterpretationConfig{});

    EXPECT_EQ(RankedLabels(interp), (std::vector<int>{1, 0}));
    EXPECT_FALSE(interp.ranked[1].primary_metric_mean.has_value());
    EXPECT_NEAR(*interp.ranked[0].primary_metric_mean, 0.45, 1e-12);
}

TEST(ClusterInterpreterTest, FlagsDistantMembersAsOutliers) {
    auto matrix = runscope::testing::MakeMatrix({{0.0}, {0.0}, {0.0}, {0.0}, {10.0}});
    auto result = ResultFor(matrix, {0, 0, 0, 0, 0});
    auto interp = Interpret(result, matrix, InterpretationConfig{});
    ASSERT_EQ(interp.ranked.size(), 1u);
    EXPECT_EQ(interp.ranked[0].outlier_ids, (std::vector<std::string>{"run-4"}));

    InterpretationConfig loose;
    loose.outlier_factor = 3.0;
    EXPECT_TRUE(Interpret(result, matrix, loose).ranked[0].outlier_ids.empty());
}

TEST(ClusterInterpreterTest, IdenticalMembersHaveNoOutliers) {
    auto matrix = runscope::testing::MakeMatrix({{1.0}, {1.0}, {1.0}});
    auto result = ResultFor(matrix, {0, 0, 0});
    auto interp = Interpret(result, matrix, InterpretationConfig{});
    EXPECT_TRUE(interp.ranked[0].outlier_ids.empty());
}

TEST(ClusterInterpreterTest, NoiseBucketRanksLastAndIsNeverBest) {
    auto matrix = SweepMatrix();
    // noise holds the two highest-accuracy runs (a, f)
    auto result = ResultFor(matrix, {-1, 0, 1, 1, 0, -1});
    ASSERT_TRUE(result.clusters[2].is_noise);
    auto interp = Interpret(result, matrix, InterpretationConfig{});

    EXPECT_EQ(RankedLabels(interp), (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(interp.best_label.value(), 0);
    EXPECT_EQ(interp.worst_label.value(), 1);

    const auto& noise = interp.ranked.back();
    EXPECT_TRUE(noise.is_noise);
    EXPECT_EQ(noise.rank, 3u);
    EXPECT_NEAR(*noise.primary_metric_mean, 0.885, 1e-12);
    EXPECT_TRUE(noise.outlier_ids.empty());
    EXPECT_TRUE(noise.tags.empty());
    EXPECT_TRUE(noise.top_features.empty());
    EXPECT_EQ(noise.description, "Noise (2 unclustered runs)");
}

TEST(ClusterInterpreterTest, AllNoiseHasNoBestCluster) {
    auto matrix = SweepMatrix();
    auto result = ResultFor(matrix, {-1, -1, -1, -1, -1, -1});
    auto interp = Interpret(result, matrix, InterpretationConfig{});

    ASSERT_EQ(interp.ranked.size(), 1u);
    EXPECT_TRUE(interp.ranked[0].is_noise);
    EXPECT_FALSE(interp.best_label.has_value());
    EXPECT_FALSE(interp.worst_label.has_value());
}

TEST(ClusterInterpreterTest, ParseDirection) {
    EXPECT_EQ(runscope::interpret::ParseMetricDirection("minimize"), MetricDirection::LOWER_IS_BETTER);
    EXPECT_EQ(runscope::interpret::ParseMetricDirection("max"), MetricDirection::HIGHER_IS_BETTER);
    EXPECT_THROW(runscope::interpret::ParseMetricDirection("sideways"), runscope::ConfigurationError);
}
