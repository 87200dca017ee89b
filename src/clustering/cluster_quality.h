#pragma once

#include <optional>
#include <vector>

#include "linalg/matrix.h"

namespace runscope::clustering {

// Mean silhouette coefficient over rows with a non-negative label. Defined only when there are
// at least two clusters and fewer clusters than labelled rows; singleton members score 0.
auto Silhouette(const linalg::Matrix& points, const std::vector<int>& labels) -> std::optional<double>;

// Sum of squared distances from each labelled row to the centroid (row of `centroids`) of its label.
auto Inertia(const linalg::Matrix& points, const std::vector<int>& labels, const linalg::Matrix& centroids) -> double;

} // namespace runscope::clustering
