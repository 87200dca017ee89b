#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "errors.h"
#include "features/feature_builder.h"
#include "run_fixtures.h"

using runscope::ConfigValue;
using runscope::RunRecord;
using runscope::features::FeatureBuilder;
using runscope::features::FeatureConfig;
using runscope::features::MetricAggregation;
using runscope::testing::MakeRun;

namespace {

auto ColumnOf(const runscope::FeatureMatrix& m, const std::string& name) -> size_t {
    auto idx = m.feature_index(name);
    EXPECT_TRUE(idx.has_value()) << "missing feature " << name;
    return idx.value_or(0);
}

} // namespace

TEST(FeatureBuilderTest, EveryRowHasSameWidth) {
    std::vector<RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.9}, {"loss", 0.1}}),
        MakeRun("b", {{"accuracy", 0.8}}),
        MakeRun("c", {{"loss", 0.3}, {"f1", 0.7}}),
    };
    auto m = FeatureBuilder(FeatureConfig{}).Build(runs);

    EXPECT_EQ(m.num_runs(), 3u);
    EXPECT_EQ(m.num_features(), 3u);
    EXPECT_EQ(m.raw.rows, 3u);
    EXPECT_EQ(m.raw.cols, 3u);
    EXPECT_EQ(m.standardized.cols, 3u);
    EXPECT_EQ(m.run_ids, (std::vector<std::string>{"a", "b", "c"}));
    // metric columns are sorted by name
    EXPECT_EQ(m.feature_names(), (std::vector<std::string>{"accuracy", "f1", "loss"}));
}

TEST(FeatureBuilderTest, StandardizesToZeroMeanUnitStd) {
    std::vector<RunRecord> runs;
    for (int i = 0; i < 6; ++i) {
        runs.push_back(MakeRun("r" + std::to_string(i), {{"accuracy", 0.5 + 0.05 * i}, {"loss", 2.0 - 0.3 * i}}));
    }
    auto m = FeatureBuilder(FeatureConfig{}).Build(runs);

    for (size_t c = 0; c < m.num_features(); ++c) {
        double sum = 0.0;
        double sq = 0.0;
        for (size_t r = 0; r < m.num_runs(); ++r) {
            sum += m.standardized(r, c);
            sq += m.standardized(r, c) * m.standardized(r, c);
        }
        double mean = sum / 6.0;
        EXPECT_NEAR(mean, 0.0, 1e-9);
        EXPECT_NEAR(std::sqrt(sq / 6.0 - mean * mean), 1.0, 1e-9);
    }
}

TEST(FeatureBuilderTest, ConstantColumnBecomesZeros) {
    std::vector<RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.9}, {"epochs", 10.0}}),
        MakeRun("b", {{"accuracy", 0.7}, {"epochs", 10.0}}),
        MakeRun("c", {{"accuracy", 0.8}, {"epochs", 10.0}}),
    };
    auto m = FeatureBuilder(FeatureConfig{}).Build(runs);
    size_t c = ColumnOf(m, "epochs");
    for (size_t r = 0; r < 3; ++r) {
        EXPECT_EQ(m.standardized(r, c), 0.0);
        EXPECT_DOUBLE_EQ(m.raw(r, c), 10.0);
    }
    EXPECT_TRUE(std::isfinite(m.standardized(0, ColumnOf(m, "accuracy"))));
}

TEST(FeatureBuilderTest, ImputesColumnMeanAndFlagsCells) {
    std::vector<RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.9}, {"loss", 0.2}}),
        MakeRun("b", {{"accuracy", 0.7}}),
        MakeRun("c", {{"accuracy", 0.8}, {"loss", 0.4}}),
    };
    auto m = FeatureBuilder(FeatureConfig{}).Build(runs);
    size_t loss = ColumnOf(m, "loss");

    EXPECT_TRUE(m.is_imputed(1, loss));
    EXPECT_FALSE(m.is_imputed(0, loss));
    EXPECT_FALSE(m.is_imputed(1, ColumnOf(m, "accuracy")));
    EXPECT_NEAR(m.raw(1, loss), 0.3, 1e-12);
    EXPECT_EQ(m.imputed_count(loss), 1u);
}

TEST(FeatureBuilderTest, OneHotKeepsTopCategoriesAndFoldsRest) {
    FeatureConfig config;
    config.max_categories = 2;
    std::vector<RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.1}}, {{"optimizer", ConfigValue{std::string("adam")}}}),
        MakeRun("b", {{"accuracy", 0.2}}, {{"optimizer", ConfigValue{std::string("adam")}}}),
        MakeRun("c", {{"accuracy", 0.3}}, {{"optimizer", ConfigValue{std::string("sgd")}}}),
        MakeRun("d", {{"accuracy", 0.4}}, {{"optimizer", ConfigValue{std::string("rmsprop")}}}),
        MakeRun("e", {{"accuracy", 0.5}}),
    };
    auto m = FeatureBuilder(config).Build(runs);

    // rmsprop and sgd tie on count; lexical order keeps rmsprop
    EXPECT_EQ(m.feature_names(),
              (std::vector<std::string>{"accuracy", "config.optimizer=adam", "config.optimizer=rmsprop",
                                        "config.optimizer=<other>"}));
    size_t adam = ColumnOf(m, "config.optimizer=adam");
    size_t other = ColumnOf(m, "config.optimizer=<other>");
    EXPECT_DOUBLE_EQ(m.raw(0, adam), 1.0);
    EXPECT_DOUBLE_EQ(m.raw(2, adam), 0.0);
    EXPECT_DOUBLE_EQ(m.raw(2, other), 1.0);
    // run without the key is imputed across all its one-hot columns
    EXPECT_TRUE(m.is_imputed(4, adam));
    EXPECT_TRUE(m.is_imputed(4, other));
    EXPECT_EQ(m.features[adam].kind, runscope::FeatureKind::CONFIG_CATEGORY);
    EXPECT_EQ(m.features[adam].source_key, "optimizer");
}

TEST(FeatureBuilderTest, DropPolicyIgnoresStrings) {
    FeatureConfig config;
    config.categorical = runscope::features::CategoricalPolicy::DROP;
    std::vector<RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.1}}, {{"optimizer", ConfigValue{std::string("adam")}}}),
        MakeRun("b", {{"accuracy", 0.2}}, {{"optimizer", ConfigValue{std::string("sgd")}}}),
    };
    auto m = FeatureBuilder(config).Build(runs);
    EXPECT_EQ(m.feature_names(), (std::vector<std::string>{"accuracy"}));
}

TEST(FeatureBuilderTest, BoolAndMixedTypeConfig) {
    std::vector<RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.1}}, {{"use_bn", ConfigValue{true}}, {"lr", ConfigValue{0.01}}}),
        MakeRun("b", {{"accuracy", 0.2}}, {{"use_bn", ConfigValue{false}}, {"lr", ConfigValue{std::string("auto")}}}),
        MakeRun("c", {{"accuracy", 0.3}}, {{"use_bn", ConfigValue{true}}, {"lr", ConfigValue{0.03}}}),
    };
    auto m = FeatureBuilder(FeatureConfig{}).Build(runs);

    size_t bn = ColumnOf(m, "config.use_bn");
    EXPECT_DOUBLE_EQ(m.raw(0, bn), 1.0);
    EXPECT_DOUBLE_EQ(m.raw(1, bn), 0.0);

    size_t lr = ColumnOf(m, "config.lr");
    EXPECT_TRUE(m.is_imputed(1, lr));
    EXPECT_NEAR(m.raw(1, lr), 0.02, 1e-12);
    EXPECT_FALSE(m.feature_index("config.lr=auto").has_value());
    EXPECT_EQ(m.features[lr].kind, runscope::FeatureKind::CONFIG_NUMERIC);
}

TEST(FeatureBuilderTest, PrivateAndExcludedKeysAreSkipped) {
    FeatureConfig config;
    config.exclude_keys = {"seed"};
    std::vector<RunRecord> runs = {
        MakeRun("a", {{"accuracy", 0.1}, {"_runtime", 50.0}}, {{"seed", ConfigValue{1.0}}, {"_step", ConfigValue{3.0}}}),
        MakeRun("b", {{"accuracy", 0.2}, {"_runtime", 70.0}}, {{"seed", ConfigValue{2.0}}, {"_step", ConfigValue{4.0}}}),
    };
    auto m = FeatureBuilder(config).Build(runs);
    EXPECT_EQ(m.feature_names(), (std::vector<std::string>{"accuracy"}));
}

TEST(FeatureBuilderTest, AggregationModes) {
    std::vector<double> history = {0.5, 0.9, std::numeric_limits<double>::quiet_NaN(), 0.7};
    EXPECT_DOUBLE_EQ(*runscope::features::AggregateHistory(history, MetricAggregation::LAST), 0.7);
    EXPECT_DOUBLE_EQ(*runscope::features::AggregateHistory(history, MetricAggregation::MAX), 0.9);
    EXPECT_DOUBLE_EQ(*runscope::features::AggregateHistory(history, MetricAggregation::MIN), 0.5);
    EXPECT_NEAR(*runscope::features::AggregateHistory(history, MetricAggregation::MEAN), 0.7, 1e-12);
    EXPECT_FALSE(runscope::features::AggregateHistory({}, MetricAggregation::LAST).has_value());
}

TEST(FeatureBuilderTest, PerMetricAggregationOverride) {
    FeatureConfig config;
    config.metric_aggregation["accuracy"] = MetricAggregation::MAX;
    RunRecord a;
    a.run_id = "a";
    a.metrics["accuracy"] = {0.6, 0.95, 0.8};
    a.metrics["loss"] = {0.9, 0.2, 0.4};
    auto m = FeatureBuilder(config).Build({a});
    EXPECT_DOUBLE_EQ(m.raw(0, ColumnOf(m, "accuracy")), 0.95);
    EXPECT_DOUBLE_EQ(m.raw(0, ColumnOf(m, "loss")), 0.4);
}

TEST(FeatureBuilderTest, ParseEnums) {
    EXPECT_EQ(runscope::features::ParseMetricAggregation("mean"), MetricAggregation::MEAN);
    EXPECT_THROW(runscope::features::ParseMetricAggregation("median"), runscope::ConfigurationError);
    EXPECT_THROW(runscope::features::ParseCategoricalPolicy("hash"), runscope::ConfigurationError);
}

TEST(FeatureBuilderTest, RejectsBadInput) {
    FeatureBuilder builder{FeatureConfig{}};
    EXPECT_THROW(builder.Build({}), runscope::ValidationError);
    EXPECT_THROW(builder.Build({MakeRun("a", {{"x", 1.0}}), MakeRun("a", {{"x", 2.0}})}),
                 runscope::ValidationError);
    EXPECT_THROW(builder.Build({MakeRun("", {{"x", 1.0}})}), runscope::ValidationError);

    RunRecord bare;
    bare.run_id = "bare";
    EXPECT_THROW(builder.Build({bare}), runscope::ValidationError);
}
