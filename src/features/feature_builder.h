#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "contract.h"
#include "types.h"

namespace runscope::features {

// How a metric's training-step history collapses into one scalar.
enum class MetricAggregation {
    LAST,
    MAX,
    MIN,
    MEAN
};

// What happens to string-valued hyperparameters.
enum class CategoricalPolicy {
    ONE_HOT,
    DROP
};

struct FeatureConfig {
    MetricAggregation aggregation = MetricAggregation::LAST;
    std::map<std::string, MetricAggregation> metric_aggregation; // per-metric override

    bool include_config = true;
    CategoricalPolicy categorical = CategoricalPolicy::ONE_HOT;
    size_t max_categories = 5; // most frequent values kept per key, the rest fold into "<other>"

    bool skip_private_keys = true; // keys starting with '_' (e.g. "_runtime", "_step")
    std::vector<std::string> exclude_keys;
};

inline constexpr const char* kOtherCategory = "<other>";
inline constexpr const char* kConfigPrefix = "config.";

auto ParseMetricAggregation(const std::string& value) -> MetricAggregation;
auto MetricAggregationToString(MetricAggregation agg) -> const char*;
auto ParseCategoricalPolicy(const std::string& value) -> CategoricalPolicy;
auto CategoricalPolicyToString(CategoricalPolicy policy) -> const char*;

// Non-finite samples are ignored; returns nullopt when nothing finite is left.
auto AggregateHistory(const std::vector<double>& history, MetricAggregation agg) -> std::optional<double>;

/**
 * @brief Converts a batch of run records into a standardized, fully imputed feature matrix.
 *
 * Missing cells receive the column mean over runs that have the feature (zero when no run
 * has it) and are flagged in FeatureMatrix::imputed. Columns are then standardized with the
 * population standard deviation; constant columns become all zeros.
 *
 * Throws ValidationError when given no runs, duplicate or empty run ids, or when no usable
 * feature remains.
 */
class FeatureBuilder {
public:
    explicit FeatureBuilder(FeatureConfig config);

    [[nodiscard]] auto Build(const std::vector<RunRecord>& runs) const -> FeatureMatrix;

    [[nodiscard]] auto config() const -> const FeatureConfig& { return config_; }

private:
    using Cell = std::optional<double>;
    using Column = std::vector<Cell>;

    [[nodiscard]] auto IsExcluded(const std::string& key) const -> bool;
    [[nodiscard]] auto AggregationFor(const std::string& metric) const -> MetricAggregation;

    void AddMetricColumns(const std::vector<RunRecord>& runs,
                          std::vector<FeatureInfo>& features,
                          std::vector<Column>& columns) const;
    void AddConfigColumns(const std::vector<RunRecord>& runs,
                          std::vector<FeatureInfo>& features,
                          std::vector<Column>& columns) const;

    FeatureConfig config_;
};

} // namespace runscope::features
