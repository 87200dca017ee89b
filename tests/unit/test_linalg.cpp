#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "linalg/matrix.h"

using runscope::linalg::Matrix;
using runscope::linalg::Vector;

TEST(LinalgTest, EigenSymmetric2x2) {
    Matrix a(2, 2);
    a(0, 0) = 2.0;
    a(0, 1) = 1.0;
    a(1, 0) = 1.0;
    a(1, 1) = 2.0;

    auto res = runscope::linalg::eigen_symmetric(a);

    ASSERT_EQ(res.values.size(), 2u);
    EXPECT_NEAR(res.values[0], 3.0, 1e-9);
    EXPECT_NEAR(res.values[1], 1.0, 1e-9);

    // leading eigenvector is (1, 1) / sqrt(2) up to sign
    EXPECT_NEAR(std::abs(res.vectors(0, 0)), 1.0 / std::sqrt(2.0), 1e-9);
    EXPECT_NEAR(res.vectors(0, 0), res.vectors(1, 0), 1e-9);

    // columns are orthonormal
    auto c0 = res.vectors.column(0);
    auto c1 = res.vectors.column(1);
    EXPECT_NEAR(c0[0] * c0[0] + c0[1] * c0[1], 1.0, 1e-9);
    EXPECT_NEAR(c0[0] * c1[0] + c0[1] * c1[1], 0.0, 1e-9);
}

TEST(LinalgTest, EigenSymmetric3x3Diagonalizes) {
    Matrix a(3, 3);
    double vals[3][3] = {{4.0, 1.0, 0.5}, {1.0, 3.0, 0.2}, {0.5, 0.2, 1.0}};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            a(i, j) = vals[i][j];
        }
    }
    auto res = runscope::linalg::eigen_symmetric(a);
    EXPECT_GE(res.values[0], res.values[1]);
    EXPECT_GE(res.values[1], res.values[2]);
    EXPECT_NEAR(res.values[0] + res.values[1] + res.values[2], 8.0, 1e-9);

    // A v = lambda v for every pair
    for (size_t k = 0; k < 3; ++k) {
        for (size_t i = 0; i < 3; ++i) {
            double av = 0.0;
            for (size_t j = 0; j < 3; ++j) {
                av += a(i, j) * res.vectors(j, k);
            }
            EXPECT_NEAR(av, res.values[k] * res.vectors(i, k), 1e-8);
        }
    }
}

TEST(LinalgTest, EigenSymmetricRejectsNonSquare) {
    EXPECT_THROW(runscope::linalg::eigen_symmetric(Matrix(2, 3)), std::invalid_argument);
}

TEST(LinalgTest, CovarianceUsesSampleDenominator) {
    Matrix m(3, 2);
    m(0, 0) = 1.0; m(0, 1) = 2.0;
    m(1, 0) = 2.0; m(1, 1) = 4.0;
    m(2, 0) = 3.0; m(2, 1) = 6.0;

    auto cov = runscope::linalg::covariance(m);
    EXPECT_NEAR(cov(0, 0), 1.0, 1e-12);
    EXPECT_NEAR(cov(1, 1), 4.0, 1e-12);
    EXPECT_NEAR(cov(0, 1), 2.0, 1e-12);
    EXPECT_NEAR(cov(1, 0), 2.0, 1e-12);
}

TEST(LinalgTest, CovarianceOfSingleRowIsZero) {
    Matrix m(1, 3);
    m(0, 0) = 5.0;
    auto cov = runscope::linalg::covariance(m);
    for (double v : cov.data) {
        EXPECT_EQ(v, 0.0);
    }
}

TEST(LinalgTest, ColumnStatsArePopulation) {
    Matrix m(4, 1);
    m(0, 0) = 2.0;
    m(1, 0) = 4.0;
    m(2, 0) = 4.0;
    m(3, 0) = 6.0;

    auto means = runscope::linalg::column_means(m);
    auto sd = runscope::linalg::column_stddevs(m, means);
    EXPECT_DOUBLE_EQ(means[0], 4.0);
    EXPECT_NEAR(sd[0], std::sqrt(2.0), 1e-12);
}

TEST(LinalgTest, Distances) {
    Vector a = {0.0, 3.0};
    Vector b = {4.0, 0.0};
    EXPECT_DOUBLE_EQ(runscope::linalg::euclidean_distance(a.data(), b.data(), 2), 5.0);
    EXPECT_DOUBLE_EQ(runscope::linalg::squared_distance(a.data(), b.data(), 2), 25.0);
}

TEST(LinalgTest, SelectRowsAndColumnExtremes) {
    Matrix m(3, 2);
    m(0, 0) = 1.0; m(0, 1) = -4.0;
    m(1, 0) = 7.0; m(1, 1) = 2.0;
    m(2, 0) = 3.0; m(2, 1) = 9.0;

    auto sub = runscope::linalg::select_rows(m, {2, 0});
    ASSERT_EQ(sub.rows, 2u);
    EXPECT_EQ(sub(0, 1), 9.0);
    EXPECT_EQ(sub(1, 0), 1.0);

    EXPECT_EQ(runscope::linalg::column_mins(m), (Vector{1.0, -4.0}));
    EXPECT_EQ(runscope::linalg::column_maxs(m), (Vector{7.0, 9.0}));
    EXPECT_THROW(runscope::linalg::select_rows(m, {3}), std::out_of_range);
    EXPECT_THROW(runscope::linalg::column_stddevs(m, Vector{1.0}), std::invalid_argument);
}

TEST(LinalgTest, AllFiniteDetectsNaN) {
    Matrix m(2, 2);
    EXPECT_TRUE(runscope::linalg::all_finite(m));
    m(1, 1) = std::nan("");
    EXPECT_FALSE(runscope::linalg::all_finite(m));
}

TEST(LinalgTest, ArgsortDescKeepsIndexOrderOnTies) {
    auto idx = runscope::linalg::argsort_desc(Vector{1.0, 3.0, 3.0, 2.0});
    ASSERT_EQ(idx.size(), 4u);
    EXPECT_EQ(idx[0], 1u);
    EXPECT_EQ(idx[1], 2u);
    EXPECT_EQ(idx[2], 3u);
    EXPECT_EQ(idx[3], 0u);
}
