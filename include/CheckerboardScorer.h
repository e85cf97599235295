#pragma once

#include "ContingencyModel.h"

#include <optional>
#include <vector>

/**
 * @brief Checkerboard copula scores and score variances for one model snapshot.
 * @details Results are memoized per axis. The scorer holds a reference to the model, so it must
 *          not outlive it; it is not safe to share one scorer between threads.
 */
class CheckerboardScorer {
public:
    explicit CheckerboardScorer(const ContingencyModel& model);

    const ContingencyModel& model() const noexcept { return model_; }

    const std::vector<double>& marginalCDF(size_t axis);

    /**
     * @brief Midpoints s_i = (u_{i-1} + u_i) / 2.
     * @post Categories with a zero-width CDF step carry an empty optional.
     */
    const std::vector<std::optional<double>>& scores(size_t axis);

    /**
     * @brief (1/4) * sum_i u_{i-1} * u_i * p_i.
     * @post >= 0; exactly 0 when all mass sits in a single category.
     */
    double scoreVariance(size_t axis);

private:
    struct AxisScores {
        std::vector<double> cdf;
        std::vector<std::optional<double>> scores;
        double variance = 0.0;
    };

    const AxisScores& compute(size_t axis);

    const ContingencyModel& model_;
    std::vector<std::optional<AxisScores>> cache_;
};
