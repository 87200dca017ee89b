#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "linalg/matrix.h"

namespace runscope::clustering {

struct KMeansOptions {
    size_t k = 3;
    int n_init = 10;
    int max_iter = 300;
    uint64_t seed = 0; // restart r is seeded with seed + r
};

struct KMeansFit {
    std::vector<int> labels;   // canonical: clusters numbered by their lowest-index member
    linalg::Matrix centroids;  // realized_k x d, row i belongs to label i
    double inertia = 0.0;
    int iterations = 0;        // iterations of the winning restart
    bool converged = false;
    int restarts = 0;

    [[nodiscard]] auto realized_k() const -> size_t { return centroids.rows; }
};

// Index of the nearest centroid; equidistant centroids resolve to the lower index.
auto NearestCentroid(const double* point, const linalg::Matrix& centroids) -> size_t;

// k-means++ seeding followed by Lloyd iterations, repeated n_init times; the restart with the
// lowest inertia wins (earliest restart on ties). Clusters that stay empty are dropped, so the
// realized k can be smaller than options.k when the data has fewer distinct points.
auto RunKMeans(const linalg::Matrix& points, const KMeansOptions& options) -> KMeansFit;

// Renumbers labels so cluster ids follow the first appearance in row order. Negative labels
// are left untouched.
auto CanonicalizeLabels(const std::vector<int>& labels) -> std::vector<int>;

} // namespace runscope::clustering
