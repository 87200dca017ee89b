#include "interpret/cluster_interpreter.h"

#include <algorithm>
#include <cmath>

#include "errors.h"

namespace runscope::interpret {

auto ParseMetricDirection(const std::string& value) -> MetricDirection {
    if (value == "higher" || value == "maximize" || value == "max") {
        return MetricDirection::HIGHER_IS_BETTER;
    }
    if (value == "lower" || value == "minimize" || value == "min") {
        return MetricDirection::LOWER_IS_BETTER;
    }
    throw ConfigurationError("Unknown metric direction '" + value + "' (expected higher or lower)");
}

auto MetricDirectionToString(MetricDirection direction) -> const char* {
    return direction == MetricDirection::HIGHER_IS_BETTER ? "higher" : "lower";
}

auto DefaultTagRules() -> std::vector<TagRule> {
    return {
        {"accuracy", TagComparison::GREATER, 0.9, "High accuracy"},
        {"accuracy", TagComparison::LESS, 0.7, "Low accuracy"},
        {"loss", TagComparison::LESS, 0.1, "Well converged"},
        {"loss", TagComparison::GREATER, 0.5, "Convergence issues"},
        {"config.learning_rate", TagComparison::GREATER, 0.01, "High learning rate"},
        {"config.learning_rate", TagComparison::LESS, 0.0001, "Low learning rate"},
    };
}

namespace {

auto PrimaryMetricMean(const clustering::ClusterSummary& cluster,
                       const FeatureMatrix& matrix,
                       size_t col) -> std::optional<double> {
    double sum = 0.0;
    size_t count = 0;
    for (size_t row : cluster.member_rows) {
        if (matrix.is_imputed(row, col)) {
            continue;
        }
        sum += matrix.raw(row, col);
        ++count;
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}

auto TopDeviations(const clustering::ClusterSummary& cluster,
                   const FeatureMatrix& matrix,
                   const linalg::Vector& global_std_mean,
                   const InterpretationConfig& config) -> std::vector<FeatureDeviation> {
    std::vector<FeatureDeviation> all;
    for (size_t j = 0; j < matrix.num_features(); ++j) {
        if (config.config_features_only && !matrix.features[j].is_config()) {
            continue;
        }
        FeatureDeviation dev;
        dev.feature = matrix.features[j].name;
        dev.deviation = cluster.centroid[j] - global_std_mean[j];
        dev.cluster_mean = cluster.feature_mean[j];
        dev.global_mean = matrix.column_mean[j];
        all.push_back(std::move(dev));
    }
    std::sort(all.begin(), all.end(), [](const FeatureDeviation& a, const FeatureDeviation& b) {
        double da = std::abs(a.deviation);
        double db = std::abs(b.deviation);
        if (da != db) {
            return da > db;
        }
        return a.feature < b.feature;
    });
    if (all.size() > config.top_features) {
        all.resize(config.top_features);
    }
    return all;
}

auto ApplyTagRules(const clustering::ClusterSummary& cluster,
                   const FeatureMatrix& matrix,
                   const std::vector<TagRule>& rules) -> std::vector<std::string> {
    std::vector<std::string> tags;
    for (const auto& rule : rules) {
        auto col = matrix.feature_index(rule.feature);
        if (!col.has_value()) {
            continue;
        }
        double mean = cluster.feature_mean[*col];
        bool fires = rule.comparison == TagComparison::GREATER ? mean > rule.threshold : mean < rule.threshold;
        if (fires && std::find(tags.begin(), tags.end(), rule.tag) == tags.end()) {
            tags.push_back(rule.tag);
        }
    }
    return tags;
}

auto JoinTags(const std::vector<std::string>& tags) -> std::string {
    std::string out;
    for (const auto& tag : tags) {
        if (!out.empty()) {
            out += ", ";
        }
        out += tag;
    }
    return out;
}

} // namespace

auto Interpret(const clustering::ClusteringResult& result,
               const FeatureMatrix& matrix,
               const InterpretationConfig& config) -> Interpretation {
    Interpretation out;
    out.primary_metric = config.primary_metric;
    out.direction = config.direction;

    auto primary_col = matrix.feature_index(config.primary_metric);
    out.primary_metric_found = primary_col.has_value();
    auto global_std_mean = linalg::column_means(matrix.standardized);

    for (const auto& cluster : result.clusters) {
        ClusterInterpretation ci;
        ci.label = cluster.label;
        ci.size = cluster.size();
        ci.is_noise = cluster.is_noise;
        ci.member_ids = cluster.member_ids;
        if (primary_col.has_value()) {
            ci.primary_metric_mean = PrimaryMetricMean(cluster, matrix, *primary_col);
        }

        if (cluster.is_noise) {
            ci.description = "Noise (" + std::to_string(ci.size) + " unclustered runs)";
            out.ranked.push_back(std::move(ci));
            continue;
        }

        double limit = config.outlier_factor * cluster.mean_distance;
        for (size_t i = 0; i < cluster.member_ids.size(); ++i) {
            if (cluster.mean_distance > 0.0 && cluster.member_distances[i] > limit) {
                ci.outlier_ids.push_back(cluster.member_ids[i]);
            }
        }

        ci.top_features = TopDeviations(cluster, matrix, global_std_mean, config);
        ci.tags = ApplyTagRules(cluster, matrix, config.tag_rules);
        ci.description = ci.tags.empty() ? "Cluster " + std::to_string(cluster.label) : JoinTags(ci.tags);
        out.ranked.push_back(std::move(ci));
    }

    const bool higher = config.direction == MetricDirection::HIGHER_IS_BETTER;
    std::sort(out.ranked.begin(), out.ranked.end(),
              [higher](const ClusterInterpretation& a, const ClusterInterpretation& b) {
                  if (a.is_noise != b.is_noise) {
                      return b.is_noise;
                  }
                  if (a.primary_metric_mean.has_value() != b.primary_metric_mean.has_value()) {
                      return a.primary_metric_mean.has_value();
                  }
                  if (a.primary_metric_mean.has_value() && *a.primary_metric_mean != *b.primary_metric_mean) {
                      return higher ? *a.primary_metric_mean > *b.primary_metric_mean
                                    : *a.primary_metric_mean < *b.primary_metric_mean;
                  }
                  if (a.size != b.size) {
                      return a.size > b.size;
                  }
                  return a.label < b.label;
              });

    for (size_t i = 0; i < out.ranked.size(); ++i) {
        out.ranked[i].rank = i + 1;
    }
    for (const auto& ci : out.ranked) {
        if (ci.is_noise) {
            continue;
        }
        if (!out.best_label.has_value()) {
            out.best_label = ci.label;
        }
        out.worst_label = ci.label;
    }
    return out;
}

} // namespace runscope::interpret
