#include "CheckerboardScorer.h"

CheckerboardScorer::CheckerboardScorer(const ContingencyModel& model)
    : model_(model), cache_(model.dimensions()) {}

const CheckerboardScorer::AxisScores& CheckerboardScorer::compute(size_t axis) {
    model_.checkAxis(axis);
    if (cache_[axis]) return *cache_[axis];

    AxisScores out;
    out.cdf = model_.marginalCDF(axis);
    const size_t categories = out.cdf.size() - 1;
    out.scores.resize(categories);

    double variance = 0.0;
    for (size_t i = 0; i < categories; ++i) {
        const double lo = out.cdf[i];
        const double hi = out.cdf[i + 1];
        const double mass = hi - lo;
        if (mass > 0.0) {
            out.scores[i] = (lo + hi) / 2.0;
        }
        variance += lo * hi * mass;
    }
    out.variance = variance / 4.0;

    cache_[axis] = std::move(out);
    return *cache_[axis];
}

const std::vector<double>& CheckerboardScorer::marginalCDF(size_t axis) {
    return compute(axis).cdf;
}

const std::vector<std::optional<double>>& CheckerboardScorer::scores(size_t axis) {
    return compute(axis).scores;
}

double CheckerboardScorer::scoreVariance(size_t axis) {
    return compute(axis).variance;
}
