#pragma once

#include <cstddef>
#include <vector>

#include "linalg/matrix.h"

namespace runscope::clustering {

inline constexpr int kNoiseLabel = -1;

struct DbscanOptions {
    double eps = 0.5;
    size_t min_samples = 2; // neighbourhood size (including the point itself) that makes a core point
};

// Density-based clustering. Labels are canonical (numbered by lowest-index member); points
// reachable from no core point get kNoiseLabel.
auto RunDbscan(const linalg::Matrix& points, const DbscanOptions& options) -> std::vector<int>;

} // namespace runscope::clustering
