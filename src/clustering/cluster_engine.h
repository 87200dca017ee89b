#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "contract.h"
#include "linalg/matrix.h"

namespace runscope::clustering {

enum class ClusterAlgorithm {
    KMEANS,
    DBSCAN
};

// Throws ClusteringError for anything other than "kmeans" or "dbscan".
auto ParseClusterAlgorithm(const std::string& value) -> ClusterAlgorithm;
auto ClusterAlgorithmToString(ClusterAlgorithm algorithm) -> const char*;

struct ClusteringConfig {
    ClusterAlgorithm algorithm = ClusterAlgorithm::KMEANS;
    int n_clusters = 3;
    bool auto_select_k = false;
    int max_auto_k = 8;
    int n_init = 10;
    int max_iter = 300;
    std::optional<uint64_t> seed;

    double dbscan_eps = 0.5;
    size_t dbscan_min_samples = 2;

    size_t min_runs_for_clustering = 3;
};

enum class ClusteringOutcome {
    CLUSTERED,
    DEGENERATE, // too few runs; everything lands in a single cluster
    ALL_NOISE   // DBSCAN found no dense region; the only cluster is the noise bucket
};

inline auto ClusteringOutcomeToString(ClusteringOutcome outcome) -> const char* {
    switch (outcome) {
        case ClusteringOutcome::CLUSTERED: return "clustered";
        case ClusteringOutcome::DEGENERATE: return "degenerate";
        case ClusteringOutcome::ALL_NOISE: return "all_noise";
    }
    return "unknown";
}

struct ClusterSummary {
    int label = 0;
    std::vector<std::string> member_ids;
    std::vector<size_t> member_rows;

    linalg::Vector centroid; // standardized space

    // Raw (imputed, unstandardized) statistics per feature.
    linalg::Vector feature_mean;
    linalg::Vector feature_stddev;
    linalg::Vector feature_min;
    linalg::Vector feature_max;

    std::vector<double> member_distances; // aligned with member_ids
    double mean_distance = 0.0;
    bool is_noise = false;

    [[nodiscard]] auto size() const -> size_t { return member_ids.size(); }
};

struct ClusteringResult {
    ClusteringOutcome outcome = ClusteringOutcome::CLUSTERED;
    ClusterAlgorithm algorithm = ClusterAlgorithm::KMEANS;

    int requested_k = 0;
    size_t realized_k = 0;

    std::map<std::string, int> assignment; // run id -> label
    std::vector<int> labels;               // aligned with FeatureMatrix rows
    std::vector<ClusterSummary> clusters;  // index == label

    bool converged = true;
    int iterations = 0;
    int restarts = 0;
    double inertia = 0.0;
    std::optional<double> silhouette;
    std::vector<std::pair<int, double>> auto_k_scores; // (k, silhouette) per candidate when auto-selecting

    uint64_t seed_used = 0;
    std::vector<std::string> feature_names;
};

/**
 * @brief Partitions the standardized rows of a FeatureMatrix.
 *
 * Realized k is max(1, min(n_clusters, n_runs)). Fewer than min_runs_for_clustering runs yield
 * a DEGENERATE single-cluster result; k equal to the number of runs yields singletons without
 * iterating. Given the same matrix, k and seed the assignment is identical across calls.
 *
 * Throws ClusteringError on an empty matrix, non-finite values or n_clusters < 1.
 */
class ClusterEngine {
public:
    explicit ClusterEngine(ClusteringConfig config);

    [[nodiscard]] auto Cluster(const FeatureMatrix& matrix) const -> ClusteringResult;

    [[nodiscard]] auto config() const -> const ClusteringConfig& { return config_; }

private:
    void Validate(const FeatureMatrix& matrix) const;

    void ClusterKMeans(const FeatureMatrix& matrix, ClusteringResult& result) const;
    void ClusterDbscan(const FeatureMatrix& matrix, ClusteringResult& result) const;

    ClusteringConfig config_;
};

// Fills ClusteringResult::clusters and ::assignment from ::labels. A negative label marks noise,
// which is gathered into one extra cluster flagged is_noise.
void BuildSummaries(const FeatureMatrix& matrix, ClusteringResult& result);

} // namespace runscope::clustering
