#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "clustering/cluster_engine.h"
#include "contract.h"

namespace runscope::interpret {

enum class MetricDirection {
    HIGHER_IS_BETTER,
    LOWER_IS_BETTER
};

// Accepts "higher"/"maximize"/"max" and "lower"/"minimize"/"min"; throws ConfigurationError otherwise.
auto ParseMetricDirection(const std::string& value) -> MetricDirection;
auto MetricDirectionToString(MetricDirection direction) -> const char*;

enum class TagComparison {
    GREATER,
    LESS
};

// Emits `tag` for a cluster whose raw mean of `feature` compares against `threshold`.
struct TagRule {
    std::string feature;
    TagComparison comparison = TagComparison::GREATER;
    double threshold = 0.0;
    std::string tag;
};

auto DefaultTagRules() -> std::vector<TagRule>;

struct InterpretationConfig {
    std::string primary_metric = "accuracy";
    MetricDirection direction = MetricDirection::HIGHER_IS_BETTER;
    double outlier_factor = 2.0;
    size_t top_features = 3;
    bool config_features_only = true;
    std::vector<TagRule> tag_rules = DefaultTagRules();
};

struct FeatureDeviation {
    std::string feature;
    double deviation = 0.0; // cluster mean minus global mean, standardized units (signed)
    double cluster_mean = 0.0; // raw units
    double global_mean = 0.0;  // raw units
};

struct ClusterInterpretation {
    int label = 0;
    size_t rank = 0; // 1 is best
    size_t size = 0;
    bool is_noise = false;

    std::optional<double> primary_metric_mean; // over members whose value was observed
    std::vector<std::string> member_ids;
    std::vector<std::string> outlier_ids;
    std::vector<FeatureDeviation> top_features;
    std::vector<std::string> tags;
    std::string description;
};

struct Interpretation {
    std::string primary_metric;
    MetricDirection direction = MetricDirection::HIGHER_IS_BETTER;
    bool primary_metric_found = false;

    std::vector<ClusterInterpretation> ranked; // best first
    std::optional<int> best_label;  // unset when every cluster is noise
    std::optional<int> worst_label;
};

/**
 * @brief Ranks and characterizes the clusters of a clustering result.
 *
 * Clusters are ordered by their primary-metric mean in the configured direction, then by size
 * (larger first), then by label. Clusters without an observed primary-metric value rank after
 * those with one, and a DBSCAN noise bucket always ranks last. The noise bucket is never the
 * best or worst cluster and gets no outliers, tags or top features. The ranking does not depend
 * on the order of ClusteringResult::clusters.
 *
 * Pure: no I/O, no logging, and no failure path for results produced by ClusterEngine.
 */
auto Interpret(const clustering::ClusteringResult& result,
               const FeatureMatrix& matrix,
               const InterpretationConfig& config) -> Interpretation;

} // namespace runscope::interpret
