#include "clustering/dbscan.h"

#include <deque>

#include "clustering/kmeans.h"
#include "errors.h"

namespace runscope::clustering {

namespace {

auto RegionQuery(const linalg::Matrix& points, size_t idx, double eps_sq) -> std::vector<size_t> {
    std::vector<size_t> out;
    for (size_t j = 0; j < points.rows; ++j) {
        if (linalg::squared_distance(points.row_ptr(idx), points.row_ptr(j), points.cols) <= eps_sq) {
            out.push_back(j);
        }
    }
    return out;
}

} // namespace

auto RunDbscan(const linalg::Matrix& points, const DbscanOptions& options) -> std::vector<int> {
    if (points.empty()) {
        throw ClusteringError("DBSCAN requires a non-empty matrix");
    }
    if (!(options.eps > 0.0) || options.min_samples < 1) {
        throw ClusteringError("DBSCAN requires eps > 0 and min_samples >= 1");
    }

    const double eps_sq = options.eps * options.eps;
    const size_t n = points.rows;
    std::vector<int> labels(n, kNoiseLabel);
    std::vector<bool> visited(n, false);
    int next_label = 0;

    for (size_t i = 0; i < n; ++i) {
        if (visited[i]) {
            continue;
        }
        visited[i] = true;
        auto neighbours = RegionQuery(points, i, eps_sq);
        if (neighbours.size() < options.min_samples) {
            continue;
        }

        int label = next_label++;
        labels[i] = label;
        std::deque<size_t> frontier(neighbours.begin(), neighbours.end());
        while (!frontier.empty()) {
            size_t j = frontier.front();
            frontier.pop_front();
            if (labels[j] == kNoiseLabel) {
                labels[j] = label; // border or not-yet-expanded point
            }
            if (visited[j]) {
                continue;
            }
            visited[j] = true;
            auto reach = RegionQuery(points, j, eps_sq);
            if (reach.size() >= options.min_samples) {
                frontier.insert(frontier.end(), reach.begin(), reach.end());
            }
        }
    }
    return CanonicalizeLabels(labels);
}

} // namespace runscope::clustering
