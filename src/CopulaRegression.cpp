#include "CopulaRegression.h"
#include "CcramExceptions.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kBoundaryTolerance = 1e-12;

// Counts over (predictors..., response); one row of response counts per predictor combination.
struct CollapsedCounts {
    std::vector<int64_t> counts;
    size_t responseCategories = 0;
    size_t rows = 0;
};

CollapsedCounts collapse(const ContingencyModel& model, const std::vector<size_t>& predictors, size_t response) {
    std::vector<size_t> axes = predictors;
    axes.push_back(response);
    CollapsedCounts out;
    out.counts = model.marginalCounts(axes);
    out.responseCategories = model.shape()[response];
    out.rows = out.counts.size() / out.responseCategories;
    return out;
}

std::vector<size_t> combinationAt(const ContingencyModel& model, const std::vector<size_t>& predictors, size_t row) {
    std::vector<size_t> cats(predictors.size(), 0);
    for (size_t k = predictors.size(); k-- > 0;) {
        const size_t dim = model.shape()[predictors[k]];
        cats[k] = row % dim;
        row /= dim;
    }
    return cats;
}
} // namespace

void CopulaRegressionEngine::validateAxes(const ContingencyModel& model,
                                          const std::vector<size_t>& predictors,
                                          size_t response) {
    model.checkAxis(response);
    if (predictors.empty()) {
        throw Ccram::InvalidAxisSpecException("at least one predictor is required for response '" +
                                              model.axisName(response) + "'");
    }
    for (size_t k = 0; k < predictors.size(); ++k) {
        model.checkAxis(predictors[k]);
        if (predictors[k] == response) {
            throw Ccram::InvalidAxisSpecException("response '" + model.axisName(response) +
                                                  "' is also listed as a predictor");
        }
        if (std::count(predictors.begin(), predictors.end(), predictors[k]) > 1) {
            throw Ccram::InvalidAxisSpecException("predictor '" + model.axisName(predictors[k]) +
                                                  "' listed more than once");
        }
    }
}

size_t CopulaRegressionEngine::categoryForValue(const std::vector<double>& cdf, double value) {
    size_t lastPositive = 0;
    for (size_t i = 1; i < cdf.size(); ++i) {
        if (cdf[i] <= cdf[i - 1]) continue;
        lastPositive = i - 1;
        if (value <= cdf[i] + kBoundaryTolerance) return i - 1;
    }
    return lastPositive;
}

double CopulaRegressionEngine::regressionValue(const ContingencyModel& model,
                                               const std::vector<size_t>& predictors,
                                               size_t response,
                                               const std::vector<size_t>& predictorCategories) {
    validateAxes(model, predictors, response);
    const std::vector<double> cond = model.conditional(response, predictors, predictorCategories);
    CheckerboardScorer scorer(model);
    const auto& scores = scorer.scores(response);

    double value = 0.0;
    for (size_t i = 0; i < cond.size(); ++i) {
        if (cond[i] <= 0.0) continue;
        // positive conditional mass implies positive marginal mass, so the score is defined
        value += cond[i] * scores[i].value_or(0.0);
    }
    return value;
}

size_t CopulaRegressionEngine::predictCategory(const ContingencyModel& model,
                                               const std::vector<size_t>& predictors,
                                               size_t response,
                                               const std::vector<size_t>& predictorCategories) {
    const double value = regressionValue(model, predictors, response, predictorCategories);
    return categoryForValue(model.marginalCDF(response), value);
}

size_t CopulaRegressionEngine::predictUnderIndependence(const ContingencyModel& model, size_t response) {
    model.checkAxis(response);
    return categoryForValue(model.marginalCDF(response), 0.5);
}

std::vector<std::optional<double>> CopulaRegressionEngine::regressionValues(CheckerboardScorer& scorer,
                                                                            const std::vector<size_t>& predictors,
                                                                            size_t response) {
    const ContingencyModel& model = scorer.model();
    validateAxes(model, predictors, response);
    const CollapsedCounts collapsed = collapse(model, predictors, response);
    const auto& scores = scorer.scores(response);

    std::vector<std::optional<double>> values(collapsed.rows);
    for (size_t r = 0; r < collapsed.rows; ++r) {
        const int64_t* row = collapsed.counts.data() + r * collapsed.responseCategories;
        int64_t mass = 0;
        double weighted = 0.0;
        for (size_t i = 0; i < collapsed.responseCategories; ++i) {
            if (row[i] == 0) continue;
            mass += row[i];
            weighted += static_cast<double>(row[i]) * scores[i].value_or(0.0);
        }
        if (mass > 0) values[r] = weighted / static_cast<double>(mass);
    }
    return values;
}

std::vector<std::optional<size_t>> CopulaRegressionEngine::predictAll(CheckerboardScorer& scorer,
                                                                      const std::vector<size_t>& predictors,
                                                                      size_t response) {
    const auto values = regressionValues(scorer, predictors, response);
    const auto& cdf = scorer.marginalCDF(response);
    std::vector<std::optional<size_t>> out(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        if (values[r]) out[r] = categoryForValue(cdf, *values[r]);
    }
    return out;
}

double CopulaRegressionEngine::calculateCCRAM(const ContingencyModel& model,
                                              const std::vector<size_t>& predictors,
                                              size_t response,
                                              bool scaled) {
    CheckerboardScorer scorer(model);
    return calculateCCRAM(scorer, predictors, response, scaled);
}

double CopulaRegressionEngine::calculateCCRAM(CheckerboardScorer& scorer,
                                              const std::vector<size_t>& predictors,
                                              size_t response,
                                              bool scaled) {
    const ContingencyModel& model = scorer.model();
    validateAxes(model, predictors, response);

    double variance = 0.0;
    if (scaled) {
        variance = scorer.scoreVariance(response);
        if (variance <= 0.0) {
            throw Ccram::DivisionByZeroException("SCCRAM is undefined for response '" + model.axisName(response) +
                                                 "': checkerboard score variance is zero (" +
                                                 std::to_string(model.shape()[response]) + " categories)");
        }
    }

    const CollapsedCounts collapsed = collapse(model, predictors, response);
    const auto& scores = scorer.scores(response);
    const double n = static_cast<double>(model.total());

    double sum = 0.0;
    for (size_t r = 0; r < collapsed.rows; ++r) {
        const int64_t* row = collapsed.counts.data() + r * collapsed.responseCategories;
        int64_t mass = 0;
        double weighted = 0.0;
        for (size_t i = 0; i < collapsed.responseCategories; ++i) {
            if (row[i] == 0) continue;
            mass += row[i];
            weighted += static_cast<double>(row[i]) * scores[i].value_or(0.0);
        }
        if (mass == 0) continue;
        const double deviation = weighted / static_cast<double>(mass) - 0.5;
        sum += deviation * deviation * (static_cast<double>(mass) / n);
    }

    const double ccram = 12.0 * sum;
    return scaled ? ccram / (12.0 * variance) : ccram;
}

PredictionTable CopulaRegressionEngine::predictionTable(const ContingencyModel& model,
                                                        const std::vector<size_t>& predictors,
                                                        size_t response) {
    CheckerboardScorer scorer(model);
    const auto values = regressionValues(scorer, predictors, response);
    const auto& cdf = scorer.marginalCDF(response);
    const std::vector<double> combos = model.marginalTable(predictors);

    PredictionTable table;
    table.predictors = predictors;
    table.response = response;
    table.independenceCategory = categoryForValue(cdf, 0.5);
    table.rows.reserve(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        PredictionRow row;
        row.categories = combinationAt(model, predictors, r);
        row.probability = combos[r];
        row.regressionValue = values[r];
        if (values[r]) row.predictedCategory = categoryForValue(cdf, *values[r]);
        table.rows.push_back(std::move(row));
    }
    return table;
}

AssociationMatrix CopulaRegressionEngine::associationMatrix(const ContingencyModel& model, bool scaled) {
    const size_t d = model.dimensions();
    AssociationMatrix out;
    out.scaled = scaled;
    out.values.assign(d, std::vector<std::optional<double>>(d));

    CheckerboardScorer scorer(model);
    for (size_t p = 0; p < d; ++p) {
        for (size_t r = 0; r < d; ++r) {
            if (p == r) continue;
            try {
                out.values[p][r] = calculateCCRAM(scorer, {p}, r, scaled);
            } catch (const Ccram::DivisionByZeroException&) {
                // single-category response: left undefined
            }
        }
    }
    return out;
}
