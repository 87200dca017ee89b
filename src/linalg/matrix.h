#pragma once

#include <cstddef>
#include <vector>

namespace runscope::linalg {

using Vector = std::vector<double>;

// Dense row-major matrix; rows are runs, columns are features.
struct Matrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> data;

    Matrix() = default;
    Matrix(size_t r, size_t c);

    auto operator()(size_t r, size_t c) -> double&;
    auto operator()(size_t r, size_t c) const -> double;

    [[nodiscard]] auto row_ptr(size_t r) const -> const double* { return data.data() + r * cols; }
    [[nodiscard]] auto row_ptr(size_t r) -> double* { return data.data() + r * cols; }
    [[nodiscard]] auto column(size_t c) const -> Vector;
    [[nodiscard]] auto empty() const -> bool { return rows == 0 || cols == 0; }
};

// Eigenpairs of a symmetric matrix, largest eigenvalue first. Column i of `vectors` pairs
// with values[i].
struct EigenPairs {
    Vector values;
    Matrix vectors;
};

// Copies the given rows, in order. Throws std::out_of_range on a bad index.
auto select_rows(const Matrix& m, const std::vector<size_t>& rows) -> Matrix;

auto squared_distance(const double* a, const double* b, size_t dim) -> double;
auto euclidean_distance(const double* a, const double* b, size_t dim) -> double;

auto column_means(const Matrix& m) -> Vector;
// Population (ddof = 0) standard deviation per column.
auto column_stddevs(const Matrix& m, const Vector& means) -> Vector;
auto column_mins(const Matrix& m) -> Vector;
auto column_maxs(const Matrix& m) -> Vector;
// Sample covariance (ddof = 1) of the columns; all zeros with fewer than two rows.
auto covariance(const Matrix& m) -> Matrix;

auto all_finite(const Matrix& m) -> bool;

// Indices that sort v descending; equal values keep index order.
auto argsort_desc(const Vector& v) -> std::vector<size_t>;

// Cyclic Jacobi rotations. Throws std::invalid_argument for a non-square matrix.
auto eigen_symmetric(const Matrix& a, int max_sweeps = 100, double eps = 1e-12) -> EigenPairs;

} // namespace runscope::linalg
