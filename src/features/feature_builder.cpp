#include "features/feature_builder.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors.h"
#include "obs/logging.h"

namespace runscope::features {

auto ParseMetricAggregation(const std::string& value) -> MetricAggregation {
    if (value == "last") { return MetricAggregation::LAST; }
    if (value == "max") { return MetricAggregation::MAX; }
    if (value == "min") { return MetricAggregation::MIN; }
    if (value == "mean") { return MetricAggregation::MEAN; }
    throw ConfigurationError("Unknown metric aggregation '" + value + "' (expected last, max, min or mean)");
}

auto MetricAggregationToString(MetricAggregation agg) -> const char* {
    switch (agg) {
        case MetricAggregation::LAST: return "last";
        case MetricAggregation::MAX: return "max";
        case MetricAggregation::MIN: return "min";
        case MetricAggregation::MEAN: return "mean";
    }
    return "last";
}

auto ParseCategoricalPolicy(const std::string& value) -> CategoricalPolicy {
    if (value == "one_hot") { return CategoricalPolicy::ONE_HOT; }
    if (value == "drop") { return CategoricalPolicy::DROP; }
    throw ConfigurationError("Unknown categorical policy '" + value + "' (expected one_hot or drop)");
}

auto CategoricalPolicyToString(CategoricalPolicy policy) -> const char* {
    return policy == CategoricalPolicy::ONE_HOT ? "one_hot" : "drop";
}

auto AggregateHistory(const std::vector<double>& history, MetricAggregation agg) -> std::optional<double> {
    std::optional<double> out;
    size_t count = 0;
    double sum = 0.0;
    for (double v : history) {
        if (!std::isfinite(v)) {
            continue;
        }
        ++count;
        sum += v;
        switch (agg) {
            case MetricAggregation::LAST:
                out = v;
                break;
            case MetricAggregation::MAX:
                out = out.has_value() ? std::max(*out, v) : v;
                break;
            case MetricAggregation::MIN:
                out = out.has_value() ? std::min(*out, v) : v;
                break;
            case MetricAggregation::MEAN:
                break;
        }
    }
    if (agg == MetricAggregation::MEAN && count > 0) {
        out = sum / static_cast<double>(count);
    }
    return out;
}

FeatureBuilder::FeatureBuilder(FeatureConfig config) : config_(std::move(config)) {}

auto FeatureBuilder::IsExcluded(const std::string& key) const -> bool {
    if (config_.skip_private_keys && !key.empty() && key.front() == '_') {
        return true;
    }
    return std::find(config_.exclude_keys.begin(), config_.exclude_keys.end(), key) != config_.exclude_keys.end();
}

auto FeatureBuilder::AggregationFor(const std::string& metric) const -> MetricAggregation {
    auto it = config_.metric_aggregation.find(metric);
    return it == config_.metric_aggregation.end() ? config_.aggregation : it->second;
}

void FeatureBuilder::AddMetricColumns(const std::vector<RunRecord>& runs,
                                      std::vector<FeatureInfo>& features,
                                      std::vector<Column>& columns) const {
    std::set<std::string> names;
    for (const auto& run : runs) {
        for (const auto& kv : run.metrics) {
            if (!IsExcluded(kv.first)) {
                names.insert(kv.first);
            }
        }
    }
    for (const auto& name : names) {
        auto agg = AggregationFor(name);
        Column column(runs.size());
        for (size_t r = 0; r < runs.size(); ++r) {
            auto it = runs[r].metrics.find(name);
            if (it != runs[r].metrics.end()) {
                column[r] = AggregateHistory(it->second, agg);
            }
        }
        features.push_back(FeatureInfo{name, FeatureKind::METRIC, name});
        columns.push_back(std::move(column));
    }
}

void FeatureBuilder::AddConfigColumns(const std::vector<RunRecord>& runs,
                                      std::vector<FeatureInfo>& features,
                                      std::vector<Column>& columns) const {
    // A key is numeric when any run logs a number or bool for it; string occurrences of a
    // numeric key count as missing.
    std::set<std::string> numeric_keys;
    std::set<std::string> string_keys;
    for (const auto& run : runs) {
        for (const auto& [key, value] : run.config) {
            if (IsExcluded(key)) {
                continue;
            }
            if (std::holds_alternative<double>(value) || std::holds_alternative<bool>(value)) {
                numeric_keys.insert(key);
            } else if (std::holds_alternative<std::string>(value)) {
                string_keys.insert(key);
            }
        }
    }

    for (const auto& key : numeric_keys) {
        Column column(runs.size());
        for (size_t r = 0; r < runs.size(); ++r) {
            auto it = runs[r].config.find(key);
            if (it == runs[r].config.end()) {
                continue;
            }
            if (const auto* d = std::get_if<double>(&it->second)) {
                if (std::isfinite(*d)) {
                    column[r] = *d;
                }
            } else if (const auto* b = std::get_if<bool>(&it->second)) {
                column[r] = *b ? 1.0 : 0.0;
            }
        }
        features.push_back(FeatureInfo{kConfigPrefix + key, FeatureKind::CONFIG_NUMERIC, key});
        columns.push_back(std::move(column));
    }

    if (config_.categorical == CategoricalPolicy::DROP) {
        if (!string_keys.empty()) {
            spdlog::debug("Dropping {} categorical config keys", string_keys.size());
        }
        return;
    }

    for (const auto& key : string_keys) {
        if (numeric_keys.count(key) > 0) {
            continue;
        }
        std::map<std::string, size_t> counts;
        for (const auto& run : runs) {
            auto it = run.config.find(key);
            if (it != run.config.end()) {
                if (const auto* s = std::get_if<std::string>(&it->second)) {
                    counts[*s]++;
                }
            }
        }
        std::vector<std::pair<std::string, size_t>> ordered(counts.begin(), counts.end());
        std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
            return a.second > b.second; // map order already breaks ties lexically
        });

        size_t kept = std::min(config_.max_categories, ordered.size());
        bool has_other = ordered.size() > kept;
        std::vector<std::string> categories;
        for (size_t i = 0; i < kept; ++i) {
            categories.push_back(ordered[i].first);
        }

        size_t n_cols = categories.size() + (has_other ? 1 : 0);
        std::vector<Column> key_columns(n_cols, Column(runs.size()));
        for (size_t r = 0; r < runs.size(); ++r) {
            auto it = runs[r].config.find(key);
            if (it == runs[r].config.end()) {
                continue;
            }
            const auto* s = std::get_if<std::string>(&it->second);
            if (s == nullptr) {
                continue;
            }
            auto pos = std::find(categories.begin(), categories.end(), *s);
            size_t hot = pos != categories.end() ? static_cast<size_t>(pos - categories.begin()) : categories.size();
            for (size_t c = 0; c < n_cols; ++c) {
                key_columns[c][r] = (c == hot) ? 1.0 : 0.0;
            }
        }

        for (size_t c = 0; c < categories.size(); ++c) {
            features.push_back(FeatureInfo{fmt::format("{}{}={}", kConfigPrefix, key, categories[c]), FeatureKind::CONFIG_CATEGORY, key});
            columns.push_back(std::move(key_columns[c]));
        }
        if (has_other) {
            features.push_back(FeatureInfo{fmt::format("{}{}={}", kConfigPrefix, key, kOtherCategory), FeatureKind::CONFIG_CATEGORY, key});
            columns.push_back(std::move(key_columns.back()));
        }
    }
}

auto FeatureBuilder::Build(const std::vector<RunRecord>& runs) const -> FeatureMatrix {
    if (runs.empty()) {
        throw ValidationError("Feature builder requires at least one run");
    }
    std::unordered_set<std::string> seen;
    for (const auto& run : runs) {
        if (run.run_id.empty()) {
            throw ValidationError("Run with empty id");
        }
        if (!seen.insert(run.run_id).second) {
            throw ValidationError("Duplicate run id: " + run.run_id);
        }
    }

    std::vector<FeatureInfo> features;
    std::vector<Column> columns;
    AddMetricColumns(runs, features, columns);
    if (config_.include_config) {
        AddConfigColumns(runs, features, columns);
    }

    bool any_usable = std::any_of(columns.begin(), columns.end(), [](const Column& col) {
        return std::any_of(col.begin(), col.end(), [](const Cell& c) { return c.has_value(); });
    });
    if (features.empty() || !any_usable) {
        throw ValidationError("No usable features: runs have no numeric metrics or encodable config values");
    }

    const size_t n = runs.size();
    const size_t d = features.size();

    FeatureMatrix out;
    out.features = std::move(features);
    out.run_ids.reserve(n);
    for (const auto& run : runs) {
        out.run_ids.push_back(run.run_id);
    }
    out.raw = linalg::Matrix(n, d);
    out.imputed.assign(n, std::vector<bool>(d, false));

    size_t imputed_cells = 0;
    for (size_t c = 0; c < d; ++c) {
        double sum = 0.0;
        size_t observed = 0;
        for (const auto& cell : columns[c]) {
            if (cell.has_value()) {
                sum += *cell;
                ++observed;
            }
        }
        double fill = observed > 0 ? sum / static_cast<double>(observed) : 0.0;
        for (size_t r = 0; r < n; ++r) {
            if (columns[c][r].has_value()) {
                out.raw(r, c) = *columns[c][r];
            } else {
                out.raw(r, c) = fill;
                out.imputed[r][c] = true;
                ++imputed_cells;
            }
        }
    }

    out.column_mean = linalg::column_means(out.raw);
    out.column_stddev = linalg::column_stddevs(out.raw, out.column_mean);
    out.standardized = linalg::Matrix(n, d);
    for (size_t c = 0; c < d; ++c) {
        double sd = out.column_stddev[c];
        bool constant = sd <= 1e-12 * std::max(1.0, std::abs(out.column_mean[c]));
        for (size_t r = 0; r < n; ++r) {
            out.standardized(r, c) = constant ? 0.0 : (out.raw(r, c) - out.column_mean[c]) / sd;
        }
    }

    obs::LogEvent(obs::LogLevel::Info, "features_built", "feature_builder",
                  {{"runs", n}, {"features", d}, {"imputed_cells", imputed_cells}});
    return out;
}

} // namespace runscope::features
