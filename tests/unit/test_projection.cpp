#include <gtest/gtest.h>

#include <cmath>

#include "clustering/projection.h"
#include "run_fixtures.h"

using runscope::clustering::ProjectToPlane;

TEST(ProjectionTest, CollinearPointsLieOnFirstComponent) {
    auto m = runscope::testing::MakeMatrix({{-2.0, -4.0}, {-1.0, -2.0}, {0.0, 0.0}, {1.0, 2.0}, {2.0, 4.0}}).standardized;
    auto p = ProjectToPlane(m);

    ASSERT_EQ(p.coords.rows, 5u);
    ASSERT_EQ(p.coords.cols, 2u);
    EXPECT_NEAR(p.explained_variance[1], 0.0, 1e-9);
    EXPECT_GT(p.explained_variance[0], 0.0);
    for (size_t r = 0; r < 5; ++r) {
        EXPECT_NEAR(p.coords(r, 1), 0.0, 1e-9);
    }
    // sign fix keeps the dominant loading positive, so coordinates increase with x
    EXPECT_LT(p.coords(0, 0), p.coords(4, 0));
    EXPECT_NEAR(p.coords(2, 0), 0.0, 1e-9);
    EXPECT_NEAR(p.coords(4, 0), std::sqrt(20.0), 1e-9);
}

TEST(ProjectionTest, ComponentsAreUnitLength) {
    auto m = runscope::testing::MakeMatrix(runscope::testing::ThreeBlobs()).standardized;
    auto p = ProjectToPlane(m);
    for (size_t i = 0; i < 2; ++i) {
        double norm = 0.0;
        for (size_t c = 0; c < p.components.cols; ++c) {
            norm += p.components(i, c) * p.components(i, c);
        }
        EXPECT_NEAR(norm, 1.0, 1e-9);
    }
    EXPECT_GE(p.explained_variance[0], p.explained_variance[1]);
}

TEST(ProjectionTest, SingleFeatureLeavesSecondAxisZero) {
    auto m = runscope::testing::MakeMatrix({{1.0}, {2.0}, {3.0}}).standardized;
    auto p = ProjectToPlane(m);
    EXPECT_NEAR(p.coords(0, 0), -1.0, 1e-12);
    EXPECT_NEAR(p.coords(2, 0), 1.0, 1e-12);
    EXPECT_EQ(p.coords(1, 1), 0.0);
    EXPECT_EQ(p.explained_variance[1], 0.0);
}

TEST(ProjectionTest, FewerThanTwoRowsIsZero) {
    auto m = runscope::testing::MakeMatrix({{3.0, 4.0}}).standardized;
    auto p = ProjectToPlane(m);
    EXPECT_EQ(p.coords.rows, 1u);
    EXPECT_EQ(p.coords(0, 0), 0.0);
    EXPECT_EQ(p.coords(0, 1), 0.0);
}
