#pragma once

#include "CheckerboardScorer.h"
#include "ContingencyModel.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct PredictionRow {
    std::vector<size_t> categories;           // 0-based, in predictor order
    double probability = 0.0;                 // P(predictors = categories)
    std::optional<double> regressionValue;    // empty when the combination was not observed
    std::optional<size_t> predictedCategory;  // empty => not predicted
};

struct PredictionTable {
    std::vector<size_t> predictors;
    size_t response = 0;
    size_t independenceCategory = 0;
    std::vector<PredictionRow> rows;          // row-major over the predictor axes
};

struct AssociationMatrix {
    bool scaled = false;
    // values[predictor][response]; diagonal and undefined entries are empty
    std::vector<std::vector<std::optional<double>>> values;
};

class CopulaRegressionEngine {
public:
    /**
     * @brief Rejects empty or repeated predictors, out-of-range axes and a response listed as predictor.
     * @throws Ccram::InvalidAxisSpecException naming the offending axis.
     */
    static void validateAxes(const ContingencyModel& model,
                             const std::vector<size_t>& predictors,
                             size_t response);

    /**
     * @brief Lowest category i with u_{i-1} < value <= u_i on the given CDF breakpoints.
     * @details A value on an interior breakpoint belongs to the interval closed at that breakpoint.
     *          Zero-width intervals never match.
     */
    static size_t categoryForValue(const std::vector<double>& cdf, double value);

    /**
     * @brief E[S_response | predictors = categories] under the checkerboard copula.
     * @throws Ccram::InvalidAxisSpecException on bad axes or categories.
     * @throws Ccram::DegenerateConditionException when the combination has zero mass.
     */
    static double regressionValue(const ContingencyModel& model,
                                  const std::vector<size_t>& predictors,
                                  size_t response,
                                  const std::vector<size_t>& predictorCategories);

    static size_t predictCategory(const ContingencyModel& model,
                                  const std::vector<size_t>& predictors,
                                  size_t response,
                                  const std::vector<size_t>& predictorCategories);

    /**
     * @brief Category holding the unconditional score mean 1/2.
     */
    static size_t predictUnderIndependence(const ContingencyModel& model, size_t response);

    /**
     * @brief Regression value for every predictor combination, row-major over the predictors.
     * @post Entries for zero-mass combinations are empty.
     */
    static std::vector<std::optional<double>> regressionValues(CheckerboardScorer& scorer,
                                                               const std::vector<size_t>& predictors,
                                                               size_t response);

    static std::vector<std::optional<size_t>> predictAll(CheckerboardScorer& scorer,
                                                         const std::vector<size_t>& predictors,
                                                         size_t response);

    /**
     * @brief 12 * sum_combos (r(combo) - 1/2)^2 * P(combo); divided by 12 * sigma^2 when scaled.
     * @throws Ccram::InvalidAxisSpecException on bad axes.
     * @throws Ccram::DivisionByZeroException when scaled and the response score variance is zero.
     */
    static double calculateCCRAM(const ContingencyModel& model,
                                 const std::vector<size_t>& predictors,
                                 size_t response,
                                 bool scaled = false);
    static double calculateCCRAM(CheckerboardScorer& scorer,
                                 const std::vector<size_t>& predictors,
                                 size_t response,
                                 bool scaled = false);

    static double calculateSCCRAM(const ContingencyModel& model,
                                  const std::vector<size_t>& predictors,
                                  size_t response) {
        return calculateCCRAM(model, predictors, response, true);
    }

    static PredictionTable predictionTable(const ContingencyModel& model,
                                           const std::vector<size_t>& predictors,
                                           size_t response);

    /**
     * @brief Single-predictor CCRAM (or SCCRAM) for every ordered pair of axes.
     */
    static AssociationMatrix associationMatrix(const ContingencyModel& model, bool scaled = false);
};
