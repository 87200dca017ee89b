#include "clustering/kmeans.h"

#include <algorithm>
#include <limits>
#include <map>
#include <random>

#include <spdlog/spdlog.h>

#include "errors.h"

namespace runscope::clustering {

namespace {

struct SingleFit {
    std::vector<int> labels;
    linalg::Matrix centroids;
    double inertia = 0.0;
    int iterations = 0;
    bool converged = false;
};

auto SeedPlusPlus(const linalg::Matrix& points, size_t k, std::mt19937_64& rng) -> linalg::Matrix {
    const size_t n = points.rows;
    const size_t d = points.cols;
    linalg::Matrix centroids(k, d);

    std::uniform_int_distribution<size_t> pick(0, n - 1);
    size_t first = pick(rng);
    std::copy(points.row_ptr(first), points.row_ptr(first) + d, &centroids(0, 0));

    std::vector<double> closest(n, std::numeric_limits<double>::infinity());
    for (size_t c = 1; c < k; ++c) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double dist = linalg::squared_distance(points.row_ptr(i), centroids.row_ptr(c - 1), d);
            closest[i] = std::min(closest[i], dist);
            total += closest[i];
        }

        size_t chosen = 0;
        if (total <= 0.0) {
            // every point already coincides with a centre
            chosen = pick(rng);
        } else {
            std::uniform_real_distribution<double> unit(0.0, total);
            double target = unit(rng);
            double acc = 0.0;
            chosen = n - 1;
            for (size_t i = 0; i < n; ++i) {
                acc += closest[i];
                if (target < acc && closest[i] > 0.0) {
                    chosen = i;
                    break;
                }
            }
        }
        std::copy(points.row_ptr(chosen), points.row_ptr(chosen) + d, &centroids(c, 0));
    }
    return centroids;
}

auto AssignLabels(const linalg::Matrix& points, const linalg::Matrix& centroids, std::vector<int>& labels) -> bool {
    bool changed = false;
    for (size_t i = 0; i < points.rows; ++i) {
        int nearest = static_cast<int>(NearestCentroid(points.row_ptr(i), centroids));
        if (labels[i] != nearest) {
            labels[i] = nearest;
            changed = true;
        }
    }
    return changed;
}

// Recomputes centroids from the current labels. Returns the number of empty clusters.
auto UpdateCentroids(const linalg::Matrix& points, const std::vector<int>& labels, linalg::Matrix& centroids) -> size_t {
    const size_t d = points.cols;
    std::vector<size_t> counts(centroids.rows, 0);
    linalg::Matrix sums(centroids.rows, d);
    for (size_t i = 0; i < points.rows; ++i) {
        auto c = static_cast<size_t>(labels[i]);
        counts[c]++;
        for (size_t j = 0; j < d; ++j) {
            sums(c, j) += points(i, j);
        }
    }
    size_t empty = 0;
    for (size_t c = 0; c < centroids.rows; ++c) {
        if (counts[c] == 0) {
            ++empty;
            continue;
        }
        for (size_t j = 0; j < d; ++j) {
            centroids(c, j) = sums(c, j) / static_cast<double>(counts[c]);
        }
    }

    if (empty == 0) {
        return 0;
    }

    // Move each empty centroid onto the point farthest from the centroid it is assigned to.
    std::vector<bool> taken(points.rows, false);
    for (size_t c = 0; c < centroids.rows; ++c) {
        if (counts[c] != 0) {
            continue;
        }
        double best = 0.0;
        size_t best_idx = points.rows;
        for (size_t i = 0; i < points.rows; ++i) {
            if (taken[i]) {
                continue;
            }
            double dist = linalg::squared_distance(points.row_ptr(i), centroids.row_ptr(static_cast<size_t>(labels[i])), d);
            if (dist > best) {
                best = dist;
                best_idx = i;
            }
        }
        if (best_idx == points.rows) {
            continue;
        }
        taken[best_idx] = true;
        std::copy(points.row_ptr(best_idx), points.row_ptr(best_idx) + d, &centroids(c, 0));
    }
    return empty;
}

auto FitOnce(const linalg::Matrix& points, size_t k, int max_iter, uint64_t seed) -> SingleFit {
    std::mt19937_64 rng(seed);
    SingleFit fit;
    fit.centroids = SeedPlusPlus(points, k, rng);
    fit.labels.assign(points.rows, -1);

    for (int iter = 1; iter <= max_iter; ++iter) {
        fit.iterations = iter;
        if (!AssignLabels(points, fit.centroids, fit.labels)) {
            fit.converged = true;
            break;
        }
        size_t empty = UpdateCentroids(points, fit.labels, fit.centroids);
        if (empty > 0) {
            spdlog::debug("k-means iteration {}: reseeded {} empty cluster(s)", iter, empty);
        }
    }

    // Compact away empty clusters and compute centroids of the final assignment.
    std::vector<int> labels = CanonicalizeLabels(fit.labels);
    int realized = 0;
    for (int l : labels) {
        realized = std::max(realized, l + 1);
    }
    linalg::Matrix centroids(static_cast<size_t>(realized), points.cols);
    std::vector<size_t> counts(static_cast<size_t>(realized), 0);
    for (size_t i = 0; i < points.rows; ++i) {
        auto c = static_cast<size_t>(labels[i]);
        counts[c]++;
        for (size_t j = 0; j < points.cols; ++j) {
            centroids(c, j) += points(i, j);
        }
    }
    for (size_t c = 0; c < centroids.rows; ++c) {
        for (size_t j = 0; j < points.cols; ++j) {
            centroids(c, j) /= static_cast<double>(counts[c]);
        }
    }

    double inertia = 0.0;
    for (size_t i = 0; i < points.rows; ++i) {
        inertia += linalg::squared_distance(points.row_ptr(i), centroids.row_ptr(static_cast<size_t>(labels[i])), points.cols);
    }

    fit.labels = std::move(labels);
    fit.centroids = std::move(centroids);
    fit.inertia = inertia;
    return fit;
}

} // namespace

auto NearestCentroid(const double* point, const linalg::Matrix& centroids) -> size_t {
    size_t best = 0;
    double best_dist = std::numeric_limits<double>::infinity();
    for (size_t c = 0; c < centroids.rows; ++c) {
        double dist = linalg::squared_distance(point, centroids.row_ptr(c), centroids.cols);
        if (dist < best_dist) {
            best_dist = dist;
            best = c;
        }
    }
    return best;
}

auto CanonicalizeLabels(const std::vector<int>& labels) -> std::vector<int> {
    std::map<int, int> remap;
    std::vector<int> out(labels.size(), -1);
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] < 0) {
            out[i] = labels[i];
            continue;
        }
        auto it = remap.find(labels[i]);
        if (it == remap.end()) {
            it = remap.emplace(labels[i], static_cast<int>(remap.size())).first;
        }
        out[i] = it->second;
    }
    return out;
}

auto RunKMeans(const linalg::Matrix& points, const KMeansOptions& options) -> KMeansFit {
    if (points.empty()) {
        throw ClusteringError("k-means requires a non-empty matrix");
    }
    if (options.k < 1 || options.k > points.rows) {
        throw ClusteringError("k-means requires 1 <= k <= number of points");
    }
    if (options.n_init < 1 || options.max_iter < 1) {
        throw ClusteringError("k-means requires n_init >= 1 and max_iter >= 1");
    }

    KMeansFit best;
    bool have_best = false;
    for (int r = 0; r < options.n_init; ++r) {
        auto fit = FitOnce(points, options.k, options.max_iter, options.seed + static_cast<uint64_t>(r));
        spdlog::debug("k-means restart {}: inertia={} iterations={} converged={}",
                      r, fit.inertia, fit.iterations, fit.converged);
        if (!have_best || fit.inertia < best.inertia) {
            best.labels = std::move(fit.labels);
            best.centroids = std::move(fit.centroids);
            best.inertia = fit.inertia;
            best.iterations = fit.iterations;
            best.converged = fit.converged;
            have_best = true;
        }
    }
    best.restarts = options.n_init;
    if (best.realized_k() < options.k) {
        spdlog::warn("k-means realized {} clusters out of {} requested; the data has too few distinct points",
                     best.realized_k(), options.k);
    }
    return best;
}

} // namespace runscope::clustering
