#include <gtest/gtest.h>

#include "StatsUtils.h"

#include <algorithm>
#include <cmath>
#include <vector>

class StatsUtilsTest : public ::testing::Test {};

TEST_F(StatsUtilsTest, MeanOfEmptyIsZero) {
    EXPECT_DOUBLE_EQ(StatsUtils::runningMean({}), 0.0);
    EXPECT_DOUBLE_EQ(StatsUtils::runningMean({1.0, 2.0, 6.0}), 3.0);
}

TEST_F(StatsUtilsTest, PercentileInterpolatesLinearly) {
    const std::vector<double> sorted = {1.0, 2.0, 4.0, 8.0, 16.0};
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 1.0), 16.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 0.5), 4.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 0.625), 6.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted(sorted, 1.5), 16.0);
    EXPECT_DOUBLE_EQ(StatsUtils::percentileSorted({3.0}, 0.2), 3.0);
}

TEST_F(StatsUtilsTest, SampleStdDevUsesBesselCorrection) {
    EXPECT_DOUBLE_EQ(StatsUtils::sampleStdDev({5.0}), 0.0);
    EXPECT_NEAR(StatsUtils::sampleStdDev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), std::sqrt(32.0 / 7.0), 1e-12);
    EXPECT_NEAR(StatsUtils::sampleStdDev({0.3, 0.3, 0.3}), 0.0, 1e-15);
}

TEST_F(StatsUtilsTest, NormalCdfKnownValues) {
    EXPECT_DOUBLE_EQ(StatsUtils::normalCdf(0.0), 0.5);
    EXPECT_NEAR(StatsUtils::normalCdf(1.959963984540054), 0.975, 1e-12);
    EXPECT_NEAR(StatsUtils::normalCdf(-1.0) + StatsUtils::normalCdf(1.0), 1.0, 1e-15);
}

TEST_F(StatsUtilsTest, NormalQuantileInvertsCdf) {
    EXPECT_NEAR(StatsUtils::normalQuantile(0.975), 1.959963984540054, 1e-9);
    EXPECT_NEAR(StatsUtils::normalQuantile(0.5), 0.0, 1e-12);
    for (double p : {1e-6, 0.01, 0.02425, 0.3, 0.7, 0.99, 1.0 - 1e-6}) {
        EXPECT_NEAR(StatsUtils::normalCdf(StatsUtils::normalQuantile(p)), p, 1e-12 * std::max(1.0, 1.0 / p))
            << "p = " << p;
    }
}

TEST_F(StatsUtilsTest, NormalQuantileAtTheEdges) {
    EXPECT_TRUE(std::isinf(StatsUtils::normalQuantile(0.0)));
    EXPECT_LT(StatsUtils::normalQuantile(0.0), 0.0);
    EXPECT_TRUE(std::isinf(StatsUtils::normalQuantile(1.0)));
    EXPECT_GT(StatsUtils::normalQuantile(1.0), 0.0);
    EXPECT_TRUE(std::isnan(StatsUtils::normalQuantile(std::nan(""))));
}
