#pragma once

#include <optional>
#include <string>
#include <vector>

#include "linalg/matrix.h"

namespace runscope {

enum class FeatureKind {
    METRIC,
    CONFIG_NUMERIC,
    CONFIG_CATEGORY
};

inline auto FeatureKindToString(FeatureKind kind) -> const char* {
    switch (kind) {
        case FeatureKind::METRIC: return "metric";
        case FeatureKind::CONFIG_NUMERIC: return "config_numeric";
        case FeatureKind::CONFIG_CATEGORY: return "config_category";
    }
    return "metric";
}

struct FeatureInfo {
    std::string name;       // column name, e.g. "accuracy", "config.lr", "config.optimizer=adam"
    FeatureKind kind = FeatureKind::METRIC;
    std::string source_key; // metric name or config key the column came from

    [[nodiscard]] auto is_config() const -> bool { return kind != FeatureKind::METRIC; }
};

// Fixed-width numeric encoding of a batch of runs.
// Row i describes run_ids[i]; column j describes features[j]. Every row has features.size() entries.
struct FeatureMatrix {
    std::vector<std::string> run_ids;
    std::vector<FeatureInfo> features;

    linalg::Matrix raw;          // after imputation, original units
    linalg::Matrix standardized; // (raw - mean) / stddev, zero for constant columns

    linalg::Vector column_mean;
    linalg::Vector column_stddev;

    std::vector<std::vector<bool>> imputed; // [row][col]

    [[nodiscard]] auto num_runs() const -> size_t { return run_ids.size(); }
    [[nodiscard]] auto num_features() const -> size_t { return features.size(); }

    [[nodiscard]] auto is_imputed(size_t row, size_t col) const -> bool { return imputed[row][col]; }

    [[nodiscard]] auto feature_names() const -> std::vector<std::string> {
        std::vector<std::string> names;
        names.reserve(features.size());
        for (const auto& f : features) {
            names.push_back(f.name);
        }
        return names;
    }

    [[nodiscard]] auto feature_index(const std::string& name) const -> std::optional<size_t> {
        for (size_t i = 0; i < features.size(); ++i) {
            if (features[i].name == name) {
                return i;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto imputed_count(size_t col) const -> size_t {
        size_t n = 0;
        for (const auto& row : imputed) {
            if (row[col]) {
                ++n;
            }
        }
        return n;
    }
};

} // namespace runscope
