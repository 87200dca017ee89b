#include "clustering/projection.h"

#include <algorithm>
#include <cmath>

namespace runscope::clustering {

namespace {

constexpr size_t kPlaneDims = 2;

void EnforceComponentSign(linalg::Vector& v) {
    size_t idx = 0;
    double max_abs = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        double abs_val = std::abs(v[i]);
        if (abs_val > max_abs) {
            max_abs = abs_val;
            idx = i;
        }
    }
    if (!v.empty() && v[idx] < 0.0) {
        for (double& val : v) {
            val *= -1.0;
        }
    }
}

} // namespace

auto ProjectToPlane(const linalg::Matrix& standardized) -> Projection {
    const size_t n = standardized.rows;
    const size_t d = standardized.cols;

    Projection out;
    out.coords = linalg::Matrix(n, kPlaneDims);
    out.components = linalg::Matrix(kPlaneDims, d);
    out.explained_variance.assign(kPlaneDims, 0.0);
    if (n < 2 || d == 0) {
        return out;
    }

    auto eig = linalg::eigen_symmetric(linalg::covariance(standardized));

    size_t k = std::min(kPlaneDims, d);
    for (size_t i = 0; i < k; ++i) {
        // Jacobi can leave tiny negative eigenvalues on rank-deficient input
        out.explained_variance[i] = std::max(0.0, eig.values[i]);
        linalg::Vector comp = eig.vectors.column(i);
        EnforceComponentSign(comp);
        std::copy(comp.begin(), comp.end(), out.components.row_ptr(i));
    }

    auto means = linalg::column_means(standardized);
    for (size_t r = 0; r < n; ++r) {
        for (size_t i = 0; i < kPlaneDims; ++i) {
            double acc = 0.0;
            for (size_t c = 0; c < d; ++c) {
                acc += (standardized(r, c) - means[c]) * out.components(i, c);
            }
            out.coords(r, i) = acc;
        }
    }
    return out;
}

} // namespace runscope::clustering
