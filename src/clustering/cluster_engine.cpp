#include "clustering/cluster_engine.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "clustering/cluster_quality.h"
#include "clustering/dbscan.h"
#include "clustering/kmeans.h"
#include "errors.h"
#include "obs/logging.h"
#include "obs/metrics.h"

namespace runscope::clustering {

namespace {

auto DrawSeed() -> uint64_t {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

auto ParseClusterAlgorithm(const std::string& value) -> ClusterAlgorithm {
    if (value == "kmeans" || value == "k-means") {
        return ClusterAlgorithm::KMEANS;
    }
    if (value == "dbscan") {
        return ClusterAlgorithm::DBSCAN;
    }
    throw ClusteringError("Unknown clustering algorithm '" + value + "' (expected kmeans or dbscan)");
}

auto ClusterAlgorithmToString(ClusterAlgorithm algorithm) -> const char* {
    return algorithm == ClusterAlgorithm::KMEANS ? "kmeans" : "dbscan";
}

ClusterEngine::ClusterEngine(ClusteringConfig config) : config_(std::move(config)) {}

void ClusterEngine::Validate(const FeatureMatrix& matrix) const {
    if (config_.n_clusters < 1) {
        throw ClusteringError(fmt::format("Requested cluster count must be >= 1, got {}", config_.n_clusters));
    }
    const auto& x = matrix.standardized;
    if (x.empty() || matrix.num_runs() == 0) {
        throw ClusteringError("Cannot cluster an empty feature matrix");
    }
    if (x.rows != matrix.num_runs() || x.cols != matrix.num_features()) {
        throw ClusteringError("Feature matrix shape does not match its run ids and feature list");
    }
    if (!linalg::all_finite(x)) {
        throw ClusteringError("Feature matrix contains non-finite values after imputation");
    }
}

auto ClusterEngine::Cluster(const FeatureMatrix& matrix) const -> ClusteringResult {
    Validate(matrix);

    ClusteringResult result;
    result.algorithm = config_.algorithm;
    result.requested_k = config_.n_clusters;
    result.feature_names = matrix.feature_names();
    result.seed_used = config_.seed.has_value() ? *config_.seed : DrawSeed();
    if (!config_.seed.has_value()) {
        spdlog::info("No clustering seed configured; drew seed {}", result.seed_used);
    }

    const size_t n = matrix.num_runs();
    if (n < config_.min_runs_for_clustering) {
        result.outcome = ClusteringOutcome::DEGENERATE;
        result.labels.assign(n, 0);
        obs::LogEvent(obs::LogLevel::Warn, "clustering_degenerate", "cluster_engine",
                      {{"runs", n}, {"min_runs", config_.min_runs_for_clustering},
                       {"message", "too few runs to cluster; all runs placed in one cluster"}});
    } else if (config_.algorithm == ClusterAlgorithm::DBSCAN) {
        ClusterDbscan(matrix, result);
    } else {
        ClusterKMeans(matrix, result);
    }

    BuildSummaries(matrix, result);

    double inertia = 0.0;
    for (const auto& cluster : result.clusters) {
        if (cluster.is_noise) {
            continue;
        }
        for (double dist : cluster.member_distances) {
            inertia += dist * dist;
        }
    }
    result.inertia = inertia;

    if (result.restarts > 0) {
        obs::EmitCounter("clustering_restarts_total", result.restarts, "count", "cluster_engine",
                         {{"algorithm", ClusterAlgorithmToString(result.algorithm)}});
    }
    nlohmann::json fields = {
        {"outcome", ClusteringOutcomeToString(result.outcome)},
        {"algorithm", ClusterAlgorithmToString(result.algorithm)},
        {"runs", n},
        {"requested_k", result.requested_k},
        {"realized_k", result.realized_k},
        {"converged", result.converged},
        {"iterations", result.iterations},
        {"inertia", result.inertia},
        {"seed", result.seed_used}};
    if (result.silhouette.has_value()) {
        fields["silhouette"] = *result.silhouette;
    }
    obs::LogEvent(obs::LogLevel::Info, "clustering_complete", "cluster_engine", fields);
    return result;
}

void ClusterEngine::ClusterKMeans(const FeatureMatrix& matrix, ClusteringResult& result) const {
    const auto& x = matrix.standardized;
    const size_t n = matrix.num_runs();

    KMeansOptions options;
    options.n_init = config_.n_init;
    options.max_iter = config_.max_iter;
    options.seed = result.seed_used;

    std::optional<KMeansFit> chosen;
    if (config_.auto_select_k) {
        int upper = std::min(config_.max_auto_k, static_cast<int>(n) - 1);
        double best_score = -std::numeric_limits<double>::infinity();
        for (int k = 2; k <= upper; ++k) {
            options.k = static_cast<size_t>(k);
            auto fit = RunKMeans(x, options);
            auto score = Silhouette(x, fit.labels);
            if (!score.has_value()) {
                continue;
            }
            result.auto_k_scores.emplace_back(k, *score);
            if (*score > best_score) {
                best_score = *score;
                result.requested_k = k;
                chosen = std::move(fit);
            }
        }
        if (chosen.has_value()) {
            obs::LogEvent(obs::LogLevel::Info, "auto_k_selected", "cluster_engine",
                          {{"k", result.requested_k}, {"silhouette", best_score},
                           {"candidates", result.auto_k_scores.size()}});
        } else {
            spdlog::warn("Automatic k selection found no scorable candidate; using n_clusters={}", config_.n_clusters);
        }
    }

    size_t k = std::min(static_cast<size_t>(result.requested_k), n);
    if (!chosen.has_value() && k == n) {
        result.labels.resize(n);
        for (size_t i = 0; i < n; ++i) {
            result.labels[i] = static_cast<int>(i);
        }
        result.converged = true;
        result.iterations = 0;
        result.restarts = 0;
        return;
    }

    if (!chosen.has_value()) {
        options.k = k;
        chosen = RunKMeans(x, options);
    }
    result.labels = chosen->labels;
    result.converged = chosen->converged;
    result.iterations = chosen->iterations;
    result.restarts = chosen->restarts;
    result.silhouette = Silhouette(x, result.labels);
    if (!result.converged) {
        spdlog::warn("k-means hit max_iter={} without convergence", config_.max_iter);
    }
}

void ClusterEngine::ClusterDbscan(const FeatureMatrix& matrix, ClusteringResult& result) const {
    DbscanOptions options;
    options.eps = config_.dbscan_eps;
    options.min_samples = config_.dbscan_min_samples;
    result.labels = RunDbscan(matrix.standardized, options);
    result.silhouette = Silhouette(matrix.standardized, result.labels);
    result.converged = true;

    auto noise = static_cast<size_t>(std::count(result.labels.begin(), result.labels.end(), kNoiseLabel));
    if (noise > 0 && noise == result.labels.size()) {
        result.outcome = ClusteringOutcome::ALL_NOISE;
        obs::LogEvent(obs::LogLevel::Warn, "clustering_all_noise", "cluster_engine",
                      {{"runs", noise}, {"eps", options.eps}, {"min_samples", options.min_samples},
                       {"message", "no dense region found; every run is noise"}});
    } else if (noise > 0) {
        spdlog::info("DBSCAN marked {} of {} runs as noise", noise, result.labels.size());
    }
}

void BuildSummaries(const FeatureMatrix& matrix, ClusteringResult& result) {
    const size_t n = matrix.num_runs();
    const size_t d = matrix.num_features();

    int n_real = 0;
    bool has_noise = false;
    for (int l : result.labels) {
        if (l >= 0) {
            n_real = std::max(n_real, l + 1);
        } else {
            has_noise = true;
        }
    }
    const int noise_label = n_real;
    for (int& l : result.labels) {
        if (l < 0) {
            l = noise_label;
        }
    }

    const size_t total = static_cast<size_t>(n_real) + (has_noise ? 1 : 0);
    result.clusters.assign(total, ClusterSummary{});
    for (size_t c = 0; c < total; ++c) {
        result.clusters[c].label = static_cast<int>(c);
        result.clusters[c].is_noise = has_noise && static_cast<int>(c) == noise_label;
    }
    result.assignment.clear();
    for (size_t i = 0; i < n; ++i) {
        auto& cluster = result.clusters[static_cast<size_t>(result.labels[i])];
        cluster.member_rows.push_back(i);
        cluster.member_ids.push_back(matrix.run_ids[i]);
        result.assignment[matrix.run_ids[i]] = result.labels[i];
    }

    for (auto& cluster : result.clusters) {
        auto members_std = linalg::select_rows(matrix.standardized, cluster.member_rows);
        auto members_raw = linalg::select_rows(matrix.raw, cluster.member_rows);
        cluster.centroid = linalg::column_means(members_std);
        cluster.feature_mean = linalg::column_means(members_raw);
        cluster.feature_stddev = linalg::column_stddevs(members_raw, cluster.feature_mean);
        cluster.feature_min = linalg::column_mins(members_raw);
        cluster.feature_max = linalg::column_maxs(members_raw);

        double dist_sum = 0.0;
        for (size_t i = 0; i < members_std.rows; ++i) {
            double dist = linalg::euclidean_distance(members_std.row_ptr(i), cluster.centroid.data(), d);
            cluster.member_distances.push_back(dist);
            dist_sum += dist;
        }
        cluster.mean_distance = members_std.rows > 0 ? dist_sum / static_cast<double>(members_std.rows) : 0.0;
    }
    result.realized_k = total;
}

} // namespace runscope::clustering
