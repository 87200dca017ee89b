#include "clustering/cluster_quality.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace runscope::clustering {

auto Silhouette(const linalg::Matrix& points, const std::vector<int>& labels) -> std::optional<double> {
    int n_clusters = 0;
    size_t n_labelled = 0;
    for (int l : labels) {
        if (l >= 0) {
            n_clusters = std::max(n_clusters, l + 1);
            ++n_labelled;
        }
    }
    if (n_clusters < 2 || static_cast<size_t>(n_clusters) >= n_labelled) {
        return std::nullopt;
    }

    std::vector<size_t> sizes(static_cast<size_t>(n_clusters), 0);
    for (int l : labels) {
        if (l >= 0) {
            sizes[static_cast<size_t>(l)]++;
        }
    }

    double total = 0.0;
    std::vector<double> dist_sum(static_cast<size_t>(n_clusters), 0.0);
    for (size_t i = 0; i < points.rows; ++i) {
        if (labels[i] < 0) {
            continue;
        }
        auto own = static_cast<size_t>(labels[i]);
        if (sizes[own] <= 1) {
            continue; // contributes 0
        }
        std::fill(dist_sum.begin(), dist_sum.end(), 0.0);
        for (size_t j = 0; j < points.rows; ++j) {
            if (j == i || labels[j] < 0) {
                continue;
            }
            dist_sum[static_cast<size_t>(labels[j])] +=
                linalg::euclidean_distance(points.row_ptr(i), points.row_ptr(j), points.cols);
        }
        double a = dist_sum[own] / static_cast<double>(sizes[own] - 1);
        double b = std::numeric_limits<double>::infinity();
        for (size_t c = 0; c < dist_sum.size(); ++c) {
            if (c != own && sizes[c] > 0) {
                b = std::min(b, dist_sum[c] / static_cast<double>(sizes[c]));
            }
        }
        double denom = std::max(a, b);
        total += denom > 0.0 ? (b - a) / denom : 0.0;
    }
    return total / static_cast<double>(n_labelled);
}

auto Inertia(const linalg::Matrix& points, const std::vector<int>& labels, const linalg::Matrix& centroids) -> double {
    double sum = 0.0;
    for (size_t i = 0; i < points.rows; ++i) {
        if (labels[i] < 0) {
            continue;
        }
        sum += linalg::squared_distance(points.row_ptr(i), centroids.row_ptr(static_cast<size_t>(labels[i])), points.cols);
    }
    return sum;
}

} // namespace runscope::clustering
