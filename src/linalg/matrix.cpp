#include "linalg/matrix.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace runscope::linalg {

Matrix::Matrix(size_t r, size_t c) : rows(r), cols(c), data(r * c, 0.0) {}

auto Matrix::operator()(size_t r, size_t c) -> double& {
    return data[r * cols + c];
}

auto Matrix::operator()(size_t r, size_t c) const -> double {
    return data[r * cols + c];
}

auto Matrix::column(size_t c) const -> Vector {
    Vector out(rows, 0.0);
    for (size_t r = 0; r < rows; ++r) {
        out[r] = (*this)(r, c);
    }
    return out;
}

auto select_rows(const Matrix& m, const std::vector<size_t>& rows) -> Matrix {
    Matrix out(rows.size(), m.cols);
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i] >= m.rows) {
            throw std::out_of_range("select_rows index out of range");
        }
        std::copy(m.row_ptr(rows[i]), m.row_ptr(rows[i]) + m.cols, out.row_ptr(i));
    }
    return out;
}

auto squared_distance(const double* a, const double* b, size_t dim) -> double {
    double sum = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

auto euclidean_distance(const double* a, const double* b, size_t dim) -> double {
    return std::sqrt(squared_distance(a, b, dim));
}

auto column_means(const Matrix& m) -> Vector {
    Vector means(m.cols, 0.0);
    if (m.rows == 0) {
        return means;
    }
    for (size_t r = 0; r < m.rows; ++r) {
        const double* row = m.row_ptr(r);
        for (size_t c = 0; c < m.cols; ++c) {
            means[c] += row[c];
        }
    }
    for (double& v : means) {
        v /= static_cast<double>(m.rows);
    }
    return means;
}

auto column_stddevs(const Matrix& m, const Vector& means) -> Vector {
    if (means.size() != m.cols) {
        throw std::invalid_argument("column_stddevs dimension mismatch");
    }
    Vector sd(m.cols, 0.0);
    if (m.rows == 0) {
        return sd;
    }
    for (size_t r = 0; r < m.rows; ++r) {
        const double* row = m.row_ptr(r);
        for (size_t c = 0; c < m.cols; ++c) {
            double d = row[c] - means[c];
            sd[c] += d * d;
        }
    }
    for (double& v : sd) {
        v = std::sqrt(v / static_cast<double>(m.rows));
    }
    return sd;
}

auto column_mins(const Matrix& m) -> Vector {
    Vector out(m.cols, std::numeric_limits<double>::infinity());
    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t c = 0; c < m.cols; ++c) {
            out[c] = std::min(out[c], m(r, c));
        }
    }
    return out;
}

auto column_maxs(const Matrix& m) -> Vector {
    Vector out(m.cols, -std::numeric_limits<double>::infinity());
    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t c = 0; c < m.cols; ++c) {
            out[c] = std::max(out[c], m(r, c));
        }
    }
    return out;
}

auto covariance(const Matrix& m) -> Matrix {
    Matrix cov(m.cols, m.cols);
    if (m.rows < 2) {
        return cov;
    }
    auto means = column_means(m);
    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t i = 0; i < m.cols; ++i) {
            double di = m(r, i) - means[i];
            for (size_t j = i; j < m.cols; ++j) {
                cov(i, j) += di * (m(r, j) - means[j]);
            }
        }
    }
    double denom = static_cast<double>(m.rows - 1);
    for (size_t i = 0; i < m.cols; ++i) {
        for (size_t j = i; j < m.cols; ++j) {
            cov(i, j) /= denom;
            cov(j, i) = cov(i, j);
        }
    }
    return cov;
}

auto all_finite(const Matrix& m) -> bool {
    return std::all_of(m.data.begin(), m.data.end(), [](double v) { return std::isfinite(v); });
}

auto argsort_desc(const Vector& v) -> std::vector<size_t> {
    std::vector<size_t> idx(v.size());
    std::iota(idx.begin(), idx.end(), size_t{0});
    std::stable_sort(idx.begin(), idx.end(), [&v](size_t a, size_t b) { return v[a] > v[b]; });
    return idx;
}

namespace {

auto off_diagonal_norm(const Matrix& a) -> double {
    double sum = 0.0;
    for (size_t i = 0; i < a.rows; ++i) {
        for (size_t j = i + 1; j < a.cols; ++j) {
            sum += a(i, j) * a(i, j);
        }
    }
    return std::sqrt(sum);
}

// Zeroes a(p, q) with one Givens rotation, accumulating it into v.
void rotate(Matrix& a, Matrix& v, size_t p, size_t q) {
    const size_t n = a.rows;
    double app = a(p, p);
    double aqq = a(q, q);
    double apq = a(p, q);

    double phi = 0.5 * std::atan2(2.0 * apq, aqq - app);
    double c = std::cos(phi);
    double s = std::sin(phi);

    for (size_t k = 0; k < n; ++k) {
        double akp = a(k, p);
        double akq = a(k, q);
        a(k, p) = c * akp - s * akq;
        a(k, q) = s * akp + c * akq;
    }
    for (size_t k = 0; k < n; ++k) {
        double apk = a(p, k);
        double aqk = a(q, k);
        a(p, k) = c * apk - s * aqk;
        a(q, k) = s * apk + c * aqk;
    }
    a(p, p) = c * c * app - 2.0 * s * c * apq + s * s * aqq;
    a(q, q) = s * s * app + 2.0 * s * c * apq + c * c * aqq;
    a(p, q) = 0.0;
    a(q, p) = 0.0;

    for (size_t k = 0; k < n; ++k) {
        double vkp = v(k, p);
        double vkq = v(k, q);
        v(k, p) = c * vkp - s * vkq;
        v(k, q) = s * vkp + c * vkq;
    }
}

} // namespace

auto eigen_symmetric(const Matrix& a, int max_sweeps, double eps) -> EigenPairs {
    if (a.rows != a.cols) {
        throw std::invalid_argument("eigen_symmetric requires a square matrix");
    }
    const size_t n = a.rows;
    Matrix d = a;
    Matrix v(n, n);
    for (size_t i = 0; i < n; ++i) {
        v(i, i) = 1.0;
    }

    for (int sweep = 0; sweep < max_sweeps && off_diagonal_norm(d) >= eps; ++sweep) {
        for (size_t p = 0; p + 1 < n; ++p) {
            for (size_t q = p + 1; q < n; ++q) {
                if (d(p, q) != 0.0) {
                    rotate(d, v, p, q);
                }
            }
        }
    }

    Vector diag(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        diag[i] = d(i, i);
    }
    auto order = argsort_desc(diag);

    EigenPairs out;
    out.values.resize(n);
    out.vectors = Matrix(n, n);
    for (size_t i = 0; i < n; ++i) {
        out.values[i] = diag[order[i]];
        for (size_t k = 0; k < n; ++k) {
            out.vectors(k, i) = v(k, order[i]);
        }
    }
    return out;
}

} // namespace runscope::linalg
