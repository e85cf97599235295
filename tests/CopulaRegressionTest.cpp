#include <gtest/gtest.h>

#include "CcramExceptions.h"
#include "CopulaRegression.h"

#include <algorithm>
#include <cstddef>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

ContingencyModel makeWorkedExample() {
    return ContingencyModel::fromCounts({5, 3}, {0, 0, 20,
                                                 0, 10, 0,
                                                 20, 0, 0,
                                                 0, 10, 0,
                                                 0, 0, 20});
}

// Irregular 4x3 table with moderate association.
const std::vector<int64_t> kIrregular = {12, 5, 3,
                                         4, 9, 6,
                                         2, 7, 11,
                                         8, 1, 13};

ContingencyModel makeIrregular() {
    return ContingencyModel::fromCounts({4, 3}, kIrregular);
}

std::vector<int64_t> permuteRows(const std::vector<int64_t>& counts, size_t cols, const std::vector<size_t>& order) {
    std::vector<int64_t> out;
    for (size_t r : order) {
        out.insert(out.end(), counts.begin() + static_cast<std::ptrdiff_t>(r * cols),
                   counts.begin() + static_cast<std::ptrdiff_t>((r + 1) * cols));
    }
    return out;
}

std::vector<int64_t> reverseColumns(const std::vector<int64_t>& counts, size_t cols) {
    std::vector<int64_t> out = counts;
    for (size_t r = 0; r < counts.size() / cols; ++r) {
        std::reverse(out.begin() + static_cast<std::ptrdiff_t>(r * cols),
                     out.begin() + static_cast<std::ptrdiff_t>((r + 1) * cols));
    }
    return out;
}

}  // namespace

class CopulaRegressionTest : public ::testing::Test {};

// ===========================================================================
// Regression function and predictions
// ===========================================================================

TEST_F(CopulaRegressionTest, RegressionValuesOfWorkedExample) {
    const auto model = makeWorkedExample();
    const std::vector<double> expected = {0.75, 0.375, 0.125, 0.375, 0.75};
    for (size_t x = 0; x < expected.size(); ++x) {
        EXPECT_NEAR(CopulaRegressionEngine::regressionValue(model, {0}, 1, {x}), expected[x], 1e-12) << "row " << x;
    }
}

TEST_F(CopulaRegressionTest, PredictedCategoriesOfWorkedExample) {
    const auto model = makeWorkedExample();
    const std::vector<size_t> expected = {2, 1, 0, 1, 2};
    for (size_t x = 0; x < expected.size(); ++x) {
        EXPECT_EQ(CopulaRegressionEngine::predictCategory(model, {0}, 1, {x}), expected[x]) << "row " << x;
    }
}

TEST_F(CopulaRegressionTest, ReverseDirectionRegressesToOneHalf) {
    const auto model = makeWorkedExample();
    for (size_t y = 0; y < 3; ++y) {
        EXPECT_NEAR(CopulaRegressionEngine::regressionValue(model, {1}, 0, {y}), 0.5, 1e-12);
    }
}

TEST_F(CopulaRegressionTest, BoundaryTieGoesToIntervalClosedAtIt) {
    // r = 1/2 = u_1 for every row
    const auto model = ContingencyModel::fromCounts({2, 2}, {1, 1, 1, 1});
    EXPECT_DOUBLE_EQ(CopulaRegressionEngine::regressionValue(model, {0}, 1, {0}), 0.5);
    EXPECT_EQ(CopulaRegressionEngine::predictCategory(model, {0}, 1, {0}), 0u);
    EXPECT_EQ(CopulaRegressionEngine::predictUnderIndependence(model, 1), 0u);
}

TEST_F(CopulaRegressionTest, IndependencePredictionOfWorkedExample) {
    // response CDF (0, 1/4, 1/2, 1): 1/2 sits on u_2
    EXPECT_EQ(CopulaRegressionEngine::predictUnderIndependence(makeWorkedExample(), 1), 1u);
}

TEST_F(CopulaRegressionTest, CategoryForValueSkipsZeroWidthIntervals) {
    const std::vector<double> cdf = {0.0, 0.5, 0.5, 1.0};
    EXPECT_EQ(CopulaRegressionEngine::categoryForValue(cdf, 0.5), 0u);
    EXPECT_EQ(CopulaRegressionEngine::categoryForValue(cdf, 0.50001), 2u);
    EXPECT_EQ(CopulaRegressionEngine::categoryForValue(cdf, 0.1), 0u);

    const std::vector<double> leadingGap = {0.0, 0.0, 0.4, 1.0};
    EXPECT_EQ(CopulaRegressionEngine::categoryForValue(leadingGap, 0.2), 1u);
}

TEST_F(CopulaRegressionTest, PredictionNeverLandsOnZeroMassCategory) {
    const auto model = ContingencyModel::fromCounts({2, 3}, {5, 0, 5, 5, 0, 5});
    EXPECT_EQ(CopulaRegressionEngine::predictCategory(model, {0}, 1, {0}), 0u);
    EXPECT_EQ(CopulaRegressionEngine::predictUnderIndependence(model, 1), 0u);
}

TEST_F(CopulaRegressionTest, ZeroMassCombinationIsDegenerate) {
    const auto model = ContingencyModel::fromCounts({3, 2}, {4, 1, 0, 0, 2, 3});
    EXPECT_THROW(CopulaRegressionEngine::regressionValue(model, {0}, 1, {1}), Ccram::DegenerateConditionException);

    const auto table = CopulaRegressionEngine::predictionTable(model, {0}, 1);
    ASSERT_EQ(table.rows.size(), 3u);
    EXPECT_FALSE(table.rows[1].regressionValue.has_value());
    EXPECT_FALSE(table.rows[1].predictedCategory.has_value());
    EXPECT_DOUBLE_EQ(table.rows[1].probability, 0.0);
    EXPECT_TRUE(table.rows[0].predictedCategory.has_value());
}

TEST_F(CopulaRegressionTest, InvalidAxisSpecifications) {
    const auto model = makeWorkedExample();
    EXPECT_THROW(CopulaRegressionEngine::calculateCCRAM(model, {1}, 1), Ccram::InvalidAxisSpecException);
    EXPECT_THROW(CopulaRegressionEngine::calculateCCRAM(model, {}, 1), Ccram::InvalidAxisSpecException);
    EXPECT_THROW(CopulaRegressionEngine::calculateCCRAM(model, {0}, 2), Ccram::InvalidAxisSpecException);
    EXPECT_THROW(CopulaRegressionEngine::regressionValue(model, {0}, 1, {5}), Ccram::InvalidAxisSpecException);

    const auto three = ContingencyModel::fromCounts({2, 2, 2}, {1, 2, 3, 4, 5, 6, 7, 8});
    EXPECT_THROW(CopulaRegressionEngine::calculateCCRAM(three, {0, 0}, 2), Ccram::InvalidAxisSpecException);
}

// ===========================================================================
// CCRAM / SCCRAM
// ===========================================================================

TEST_F(CopulaRegressionTest, WorkedExampleCCRAM) {
    const auto model = makeWorkedExample();
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(model, {0}, 1), 27.0 / 32.0, 1e-12);
    EXPECT_NEAR(CopulaRegressionEngine::calculateSCCRAM(model, {0}, 1), 1.0, 1e-12);
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(model, {1}, 0), 0.0, 1e-12);
    EXPECT_NEAR(CopulaRegressionEngine::calculateSCCRAM(model, {1}, 0), 0.0, 1e-12);
}

TEST_F(CopulaRegressionTest, IndependentTableHasZeroCCRAM) {
    const auto model = ContingencyModel::fromCounts({3, 3}, {2, 4, 6, 1, 2, 3, 3, 6, 9});
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(model, {0}, 1), 0.0, 1e-12);
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(model, {1}, 0), 0.0, 1e-12);
}

TEST_F(CopulaRegressionTest, SCCRAMWithSingleCategoryResponseThrows) {
    const auto model = ContingencyModel::fromCounts({3, 1}, {1, 2, 3});
    EXPECT_THROW(CopulaRegressionEngine::calculateSCCRAM(model, {0}, 1), Ccram::DivisionByZeroException);
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(model, {0}, 1), 0.0, 1e-12);
}

TEST_F(CopulaRegressionTest, SCCRAMIsWithinUnitInterval) {
    const auto model = makeIrregular();
    const double forward = CopulaRegressionEngine::calculateSCCRAM(model, {0}, 1);
    const double backward = CopulaRegressionEngine::calculateSCCRAM(model, {1}, 0);
    EXPECT_GT(forward, 0.0);
    EXPECT_LE(forward, 1.0);
    EXPECT_GE(backward, 0.0);
    EXPECT_LE(backward, 1.0);
}

TEST_F(CopulaRegressionTest, InvariantToRelabelingPredictorCategories) {
    const double base = CopulaRegressionEngine::calculateCCRAM(makeIrregular(), {0}, 1);
    const auto shuffled = ContingencyModel::fromCounts({4, 3}, permuteRows(kIrregular, 3, {2, 0, 3, 1}));
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(shuffled, {0}, 1), base, 1e-12);
}

TEST_F(CopulaRegressionTest, InvariantToReversingResponseOrder) {
    const auto model = makeIrregular();
    const auto reversed = ContingencyModel::fromCounts({4, 3}, reverseColumns(kIrregular, 3));
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(reversed, {0}, 1),
                CopulaRegressionEngine::calculateCCRAM(model, {0}, 1), 1e-12);
    EXPECT_NEAR(CopulaRegressionEngine::calculateSCCRAM(reversed, {0}, 1),
                CopulaRegressionEngine::calculateSCCRAM(model, {0}, 1), 1e-12);
}

TEST_F(CopulaRegressionTest, AddingPredictorNeverLowersCCRAM) {
    std::vector<int64_t> counts = {5, 1, 2, 8, 3, 4, 1, 6, 9, 2, 7, 3};
    const auto model = ContingencyModel::fromCounts({2, 3, 2}, counts);
    const double single = CopulaRegressionEngine::calculateCCRAM(model, {0}, 1);
    const double both = CopulaRegressionEngine::calculateCCRAM(model, {0, 2}, 1);
    EXPECT_GE(both + 1e-12, single);
    // predictor order only changes the enumeration order
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(model, {2, 0}, 1), both, 1e-12);
}

TEST_F(CopulaRegressionTest, UnnamedAxesAreMarginalizedOut) {
    // Leaving axis 2 out must equal the table with axis 2 summed away.
    const auto three = ContingencyModel::fromCounts({2, 2, 2}, {3, 1, 2, 4, 5, 2, 1, 6});
    const auto collapsed = ContingencyModel::fromCounts({2, 2}, {3 + 1, 2 + 4, 5 + 2, 1 + 6});
    EXPECT_NEAR(CopulaRegressionEngine::calculateCCRAM(three, {0}, 1),
                CopulaRegressionEngine::calculateCCRAM(collapsed, {0}, 1), 1e-12);
}

// ===========================================================================
// Tables and matrices
// ===========================================================================

TEST_F(CopulaRegressionTest, PredictionTableRows) {
    const auto table = CopulaRegressionEngine::predictionTable(makeWorkedExample(), {0}, 1);
    ASSERT_EQ(table.rows.size(), 5u);
    EXPECT_EQ(table.independenceCategory, 1u);
    EXPECT_EQ(table.rows[2].categories, (std::vector<size_t>{2}));
    EXPECT_DOUBLE_EQ(table.rows[2].probability, 0.25);
    EXPECT_EQ(*table.rows[0].predictedCategory, 2u);
    EXPECT_EQ(*table.rows[2].predictedCategory, 0u);
    EXPECT_NEAR(*table.rows[1].regressionValue, 0.375, 1e-12);
}

TEST_F(CopulaRegressionTest, PredictionTableEnumeratesCombinationsRowMajor) {
    const auto model = ContingencyModel::fromCounts({2, 3, 2}, std::vector<int64_t>(12, 1));
    const auto table = CopulaRegressionEngine::predictionTable(model, {2, 0}, 1);
    ASSERT_EQ(table.rows.size(), 4u);
    EXPECT_EQ(table.rows[1].categories, (std::vector<size_t>{0, 1}));
    EXPECT_EQ(table.rows[2].categories, (std::vector<size_t>{1, 0}));
}

TEST_F(CopulaRegressionTest, AssociationMatrixOfWorkedExample) {
    const auto matrix = CopulaRegressionEngine::associationMatrix(makeWorkedExample(), true);
    ASSERT_EQ(matrix.values.size(), 2u);
    EXPECT_FALSE(matrix.values[0][0].has_value());
    EXPECT_NEAR(*matrix.values[0][1], 1.0, 1e-12);
    EXPECT_NEAR(*matrix.values[1][0], 0.0, 1e-12);
}

TEST_F(CopulaRegressionTest, AssociationMatrixLeavesUndefinedEntriesEmpty) {
    const auto model = ContingencyModel::fromCounts({3, 1}, {1, 2, 3});
    const auto scaled = CopulaRegressionEngine::associationMatrix(model, true);
    EXPECT_FALSE(scaled.values[0][1].has_value());
    const auto raw = CopulaRegressionEngine::associationMatrix(model, false);
    ASSERT_TRUE(raw.values[0][1].has_value());
    EXPECT_NEAR(*raw.values[0][1], 0.0, 1e-12);
}
