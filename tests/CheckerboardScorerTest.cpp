#include <gtest/gtest.h>

#include "CcramExceptions.h"
#include "CheckerboardScorer.h"

namespace {
ContingencyModel makeWorkedExample() {
    return ContingencyModel::fromCounts({5, 3}, {0, 0, 20, 0, 10, 0, 20, 0, 0, 0, 10, 0, 0, 0, 20});
}
}  // namespace

class CheckerboardScorerTest : public ::testing::Test {};

TEST_F(CheckerboardScorerTest, MidpointScores) {
    const auto model = makeWorkedExample();
    CheckerboardScorer scorer(model);
    const auto& s = scorer.scores(1);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(*s[0], 0.125);
    EXPECT_DOUBLE_EQ(*s[1], 0.375);
    EXPECT_DOUBLE_EQ(*s[2], 0.75);

    const auto& rows = scorer.scores(0);
    EXPECT_DOUBLE_EQ(*rows[0], 0.125);
    EXPECT_DOUBLE_EQ(*rows[2], 0.5);
    EXPECT_DOUBLE_EQ(*rows[4], 0.875);
}

TEST_F(CheckerboardScorerTest, ScoreVarianceOfWorkedExample) {
    const auto model = makeWorkedExample();
    CheckerboardScorer scorer(model);
    EXPECT_NEAR(scorer.scoreVariance(1), 9.0 / 128.0, 1e-12);
    EXPECT_NEAR(scorer.scoreVariance(0), 0.0791015625, 1e-12);
}

TEST_F(CheckerboardScorerTest, VarianceEqualsSpreadOfScores) {
    const auto model = ContingencyModel::fromCounts({2, 4}, {3, 0, 7, 2, 1, 5, 4, 9});
    CheckerboardScorer scorer(model);
    const auto p = model.marginal(1);
    const auto& s = scorer.scores(1);
    double spread = 0.0;
    for (size_t i = 0; i < p.size(); ++i) spread += (*s[i] - 0.5) * (*s[i] - 0.5) * p[i];
    EXPECT_NEAR(scorer.scoreVariance(1), spread, 1e-12);
}

TEST_F(CheckerboardScorerTest, ZeroWidthStepHasUndefinedScore) {
    const auto model = ContingencyModel::fromCounts({2, 3}, {5, 0, 5, 5, 0, 5});
    CheckerboardScorer scorer(model);
    const auto& s = scorer.scores(1);
    EXPECT_TRUE(s[0].has_value());
    EXPECT_FALSE(s[1].has_value());
    EXPECT_TRUE(s[2].has_value());
    EXPECT_DOUBLE_EQ(*s[2], 0.75);
}

TEST_F(CheckerboardScorerTest, SingleCategoryHasZeroVariance) {
    const auto model = ContingencyModel::fromCounts({3, 1}, {1, 2, 3});
    CheckerboardScorer scorer(model);
    EXPECT_DOUBLE_EQ(scorer.scoreVariance(1), 0.0);
    EXPECT_DOUBLE_EQ(*scorer.scores(1)[0], 0.5);

    const auto concentrated = ContingencyModel::fromCounts({2, 3}, {0, 4, 0, 0, 6, 0});
    CheckerboardScorer other(concentrated);
    EXPECT_DOUBLE_EQ(other.scoreVariance(1), 0.0);
}

TEST_F(CheckerboardScorerTest, ResultsAreMemoized) {
    const auto model = makeWorkedExample();
    CheckerboardScorer scorer(model);
    const auto* first = &scorer.scores(1);
    const auto* second = &scorer.scores(1);
    EXPECT_EQ(first, second);
    EXPECT_EQ(&scorer.marginalCDF(1), &scorer.marginalCDF(1));
}

TEST_F(CheckerboardScorerTest, RejectsOutOfRangeAxis) {
    const auto model = makeWorkedExample();
    CheckerboardScorer scorer(model);
    EXPECT_THROW(scorer.scores(2), Ccram::InvalidAxisSpecException);
}
