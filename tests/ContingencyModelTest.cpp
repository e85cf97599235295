#include <gtest/gtest.h>

#include "CcramExceptions.h"
#include "ContingencyModel.h"

#include <limits>
#include <numeric>
#include <vector>

// ===========================================================================
// Helpers
// ===========================================================================
namespace {

// 5x3 table with a perfect but non-monotone dependence of axis 1 on axis 0.
ContingencyModel makeWorkedExample() {
    return ContingencyModel::fromCounts({5, 3}, {0, 0, 20,
                                                 0, 10, 0,
                                                 20, 0, 0,
                                                 0, 10, 0,
                                                 0, 0, 20});
}

// 2x3x2 table, every cell distinct.
ContingencyModel makeThreeWay() {
    std::vector<int64_t> counts(12);
    std::iota(counts.begin(), counts.end(), 1);
    return ContingencyModel::fromCounts({2, 3, 2}, counts);
}

}  // namespace

class ContingencyTableTest : public ::testing::Test {};
class ContingencyModelTest : public ::testing::Test {};

// ===========================================================================
// ContingencyTable construction
// ===========================================================================

TEST_F(ContingencyTableTest, StoresShapeAndTotal) {
    ContingencyTable t({2, 3}, {1, 2, 3, 4, 5, 6});
    EXPECT_EQ(t.dimensions(), 2u);
    EXPECT_EQ(t.total(), 21);
    EXPECT_EQ(t.cellCount(), 6u);
    EXPECT_EQ(t.strides(), (std::vector<size_t>{3, 1}));
}

TEST_F(ContingencyTableTest, RejectsNegativeCount) {
    EXPECT_THROW(ContingencyTable({2, 2}, {1, -1, 3, 4}), Ccram::InvalidTableException);
}

TEST_F(ContingencyTableTest, RejectsZeroTotal) {
    EXPECT_THROW(ContingencyTable({2, 2}, {0, 0, 0, 0}), Ccram::InvalidTableException);
}

TEST_F(ContingencyTableTest, RejectsTotalBeyondInt64) {
    const int64_t big = std::numeric_limits<int64_t>::max();
    EXPECT_THROW(ContingencyTable({2}, {big, 1}), Ccram::InvalidTableException);
    EXPECT_THROW(ContingencyTable({3}, {big / 2, big / 2, 2}), Ccram::InvalidTableException);
    ContingencyTable largest({2}, {big - 1, 1});
    EXPECT_EQ(largest.total(), big);
}

TEST_F(ContingencyTableTest, RejectsShapeMismatch) {
    EXPECT_THROW(ContingencyTable({2, 3}, {1, 2, 3, 4}), Ccram::InvalidTableException);
    EXPECT_THROW(ContingencyTable({}, {}), Ccram::InvalidTableException);
    EXPECT_THROW(ContingencyTable({2, 0}, {}), Ccram::InvalidTableException);
}

TEST_F(ContingencyTableTest, FlatIndexAndUnravelAreInverse) {
    ContingencyTable t({2, 3, 4}, std::vector<int64_t>(24, 1));
    for (size_t flat = 0; flat < t.cellCount(); ++flat) {
        EXPECT_EQ(t.flatIndex(t.unravel(flat)), flat);
    }
    EXPECT_EQ(t.flatIndex({1, 2, 3}), 23u);
    EXPECT_THROW(t.flatIndex({2, 0, 0}), Ccram::InvalidAxisSpecException);
    EXPECT_THROW(t.flatIndex({0, 0}), Ccram::InvalidAxisSpecException);
}

TEST_F(ContingencyTableTest, AtReadsRowMajor) {
    ContingencyTable t({2, 3}, {1, 2, 3, 4, 5, 6});
    EXPECT_EQ(t.at({0, 2}), 3);
    EXPECT_EQ(t.at({1, 0}), 4);
}

// ===========================================================================
// Probabilities
// ===========================================================================

TEST_F(ContingencyModelTest, JointProbabilitySumsToOne) {
    const auto model = makeThreeWay();
    const auto p = model.jointProbability();
    EXPECT_NEAR(std::accumulate(p.begin(), p.end(), 0.0), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(p[0], 1.0 / 78.0);
}

TEST_F(ContingencyModelTest, MarginalCDFStartsAtZeroEndsAtOne) {
    const auto model = makeWorkedExample();
    const auto cdf = model.marginalCDF(1);
    ASSERT_EQ(cdf.size(), 4u);
    EXPECT_DOUBLE_EQ(cdf[0], 0.0);
    EXPECT_DOUBLE_EQ(cdf[1], 0.25);
    EXPECT_DOUBLE_EQ(cdf[2], 0.5);
    EXPECT_DOUBLE_EQ(cdf[3], 1.0);

    const auto rows = model.marginalCDF(0);
    ASSERT_EQ(rows.size(), 6u);
    for (size_t i = 1; i < rows.size(); ++i) EXPECT_GT(rows[i], rows[i - 1]);
}

TEST_F(ContingencyModelTest, MarginalCountsFollowCallerAxisOrder) {
    const auto model = makeThreeWay();
    // counts[i][j][k] = 6i + 2j + k + 1
    const auto ik = model.marginalCounts({0, 2});
    EXPECT_EQ(ik, (std::vector<int64_t>{1 + 3 + 5, 2 + 4 + 6, 7 + 9 + 11, 8 + 10 + 12}));
    const auto ki = model.marginalCounts({2, 0});
    EXPECT_EQ(ki, (std::vector<int64_t>{9, 27, 12, 30}));
    EXPECT_THROW(model.marginalCounts({0, 0}), Ccram::InvalidAxisSpecException);
    EXPECT_THROW(model.marginalCounts({3}), Ccram::InvalidAxisSpecException);
}

TEST_F(ContingencyModelTest, MarginalAtMatchesTable) {
    const auto model = makeThreeWay();
    EXPECT_DOUBLE_EQ(model.marginalAt({1, 2}, {0, 1}), (2.0 + 8.0) / 78.0);
    EXPECT_THROW(model.marginalAt({1}, {3}), Ccram::InvalidAxisSpecException);
}

TEST_F(ContingencyModelTest, ConditionalMarginalizesOtherAxes) {
    const auto model = makeThreeWay();
    // P(X2 | X1 = 2): axis 2 summed over axis 1 for i = 1 gives (27, 30)
    const auto cond = model.conditional(2, {0}, {1});
    ASSERT_EQ(cond.size(), 2u);
    EXPECT_DOUBLE_EQ(cond[0], 27.0 / 57.0);
    EXPECT_DOUBLE_EQ(cond[1], 30.0 / 57.0);
}

TEST_F(ContingencyModelTest, ConditionalOnZeroMassIsDegenerate) {
    const auto model = ContingencyModel::fromCounts({3, 2}, {4, 1, 0, 0, 2, 3});
    EXPECT_THROW(model.conditional(1, {0}, {1}), Ccram::DegenerateConditionException);
}

TEST_F(ContingencyModelTest, ConditionalRejectsResponseAmongPredictors) {
    const auto model = makeWorkedExample();
    EXPECT_THROW(model.conditional(1, {1}, {0}), Ccram::InvalidAxisSpecException);
    EXPECT_THROW(model.conditional(1, {0}, {5}), Ccram::InvalidAxisSpecException);
}

// ===========================================================================
// Metadata
// ===========================================================================

TEST_F(ContingencyModelTest, DefaultVariableNames) {
    const auto model = makeThreeWay();
    EXPECT_EQ(model.axisName(0), "X1");
    EXPECT_EQ(model.axisName(2), "X3");
    EXPECT_EQ(model.variable(1).categoryLabel(0), "1");
}

TEST_F(ContingencyModelTest, VariableMetadataMustMatchShape) {
    ContingencyTable t({2, 2}, {1, 2, 3, 4});
    std::vector<Variable> vars(2);
    vars[0].name = "Dose";
    vars[0].categories = 3;
    EXPECT_THROW(ContingencyModel(t, vars), Ccram::InvalidTableException);
    EXPECT_THROW(ContingencyModel(t, std::vector<Variable>(1)), Ccram::InvalidTableException);
}

TEST_F(ContingencyModelTest, DescribeCombinationUsesLabels) {
    ContingencyTable t({2, 2}, {1, 2, 3, 4});
    std::vector<Variable> vars(2);
    vars[0].name = "Dose";
    vars[0].labels = {"low", "high"};
    vars[1].name = "Response";
    const ContingencyModel model(t, vars);
    EXPECT_EQ(model.describeCombination({0, 1}, {1, 0}), "(Dose=high, Response=1)");
}

TEST_F(ContingencyModelTest, WithTableKeepsVariablesAndChecksShape) {
    const auto model = makeWorkedExample();
    const auto other = model.withTable(ContingencyTable({5, 3}, std::vector<int64_t>(15, 1)));
    EXPECT_EQ(other.total(), 15);
    EXPECT_EQ(other.axisName(1), "X2");
    EXPECT_THROW(model.withTable(ContingencyTable({3, 5}, std::vector<int64_t>(15, 1))),
                 Ccram::InvalidTableException);
}
