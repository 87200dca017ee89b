#pragma once

#include "linalg/matrix.h"

namespace runscope::clustering {

struct Projection {
    linalg::Matrix coords;              // n x 2
    linalg::Matrix components;          // 2 x d, zero rows when fewer than two components exist
    linalg::Vector explained_variance;  // eigenvalues of the two leading components
};

/**
 * @brief Projects the rows of a standardized matrix onto its two leading principal components.
 *
 * Components come from a Jacobi eigendecomposition of the sample covariance and are sign-fixed
 * so their largest-magnitude loading is positive, which keeps plots stable between runs.
 * Fewer than two rows yields all-zero coordinates.
 */
auto ProjectToPlane(const linalg::Matrix& standardized) -> Projection;

} // namespace runscope::clustering
