#include "ResamplingDriver.h"
#include "CcramExceptions.h"
#include "CheckerboardScorer.h"
#include "CopulaRegression.h"
#include "StatsUtils.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <thread>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kTieTolerance = 1e-12;
// below this (per unit of jackknife weight) the replicates are treated as identical
constexpr double kJackknifeFloor = 1e-20;

bool nearlyEqual(double a, double b) {
    return std::abs(a - b) <= kTieTolerance * std::max(1.0, std::abs(b));
}

void validateOptions(const ResamplingOptions& options) {
    if (options.resamples < 1) {
        throw Ccram::ConfigurationException("resamples must be >= 1");
    }
    if (!(options.confidenceLevel > 0.0 && options.confidenceLevel < 1.0)) {
        throw Ccram::ConfigurationException("confidence level must be in (0,1), got " +
                                            std::to_string(options.confidenceLevel));
    }
    if (options.threads < 0) {
        throw Ccram::ConfigurationException("threads must be >= 0");
    }
    if (options.timeoutSeconds < 0.0) {
        throw Ccram::ConfigurationException("timeout must be >= 0");
    }
}

template <typename Result>
struct PipelineOutcome {
    std::vector<std::optional<Result>> slots;
    size_t failed = 0;
    int workers = 1;
    double elapsedSeconds = 0.0;
};

// generate -> apply -> collect, one pre-sized slot per iteration. Recoverable per-resample
// failures leave the slot empty; anything else aborts the run after the join.
template <typename Result, typename Apply>
PipelineOutcome<Result> runPipeline(const ContingencyModel& model,
                                    const ResamplingStrategy& strategy,
                                    const ResamplingOptions& options,
                                    Apply apply) {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    const bool bounded = options.timeoutSeconds > 0.0;
    const auto deadline = start + std::chrono::duration_cast<Clock::duration>(
                                      std::chrono::duration<double>(options.timeoutSeconds));

    PipelineOutcome<Result> out;
    out.slots.resize(options.resamples);
    out.workers = ResamplingDriver::resolveWorkers(options);

    std::atomic<bool> abort{false};
    std::atomic<bool> timedOut{false};
    std::exception_ptr systemic;
    const size_t total = options.resamples;

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic) num_threads(out.workers)
    #endif
    for (size_t b = 0; b < total; ++b) {
        if (abort.load(std::memory_order_relaxed)) continue;
        if (bounded && Clock::now() > deadline) {
            timedOut.store(true);
            abort.store(true);
            continue;
        }
        try {
            std::mt19937_64 rng = ResamplingDriver::iterationEngine(options.seed, b);
            const ContingencyModel resampled = model.withTable(strategy.generate(b, rng));
            out.slots[b] = apply(resampled);
        } catch (const Ccram::DivisionByZeroException&) {
            // slot stays empty
        } catch (const Ccram::DegenerateConditionException&) {
            // slot stays empty
        } catch (...) {
            #ifdef USE_OPENMP
            #pragma omp critical
            #endif
            {
                if (!systemic) systemic = std::current_exception();
            }
            abort.store(true);
        }
    }

    out.elapsedSeconds = std::chrono::duration<double>(Clock::now() - start).count();

    if (systemic) {
        try {
            std::rethrow_exception(systemic);
        } catch (const std::exception& e) {
            throw Ccram::ResamplingException(strategy.name() + " worker failed: " + e.what());
        } catch (...) {
            throw Ccram::ResamplingException(strategy.name() + " worker failed with a non-standard exception");
        }
    }

    size_t completed = 0;
    for (const auto& slot : out.slots) {
        if (slot) ++completed;
    }
    if (timedOut.load()) {
        throw Ccram::ResamplingException(strategy.name() + " timed out after " +
                                         std::to_string(options.timeoutSeconds) + "s with " +
                                         std::to_string(completed) + " of " + std::to_string(total) +
                                         " resamples finished");
    }
    out.failed = total - completed;
    if (completed == 0) {
        throw Ccram::ResamplingException("all " + std::to_string(total) + " " + strategy.name() +
                                         " resamples failed");
    }
    if (out.failed > 0) {
        std::cerr << "[Ccram][Warning] " << out.failed << " of " << total << " " << strategy.name()
                  << " resamples had an undefined statistic and were excluded.\n";
    }
    if (options.verbose) {
        std::ostringstream elapsed;
        elapsed << std::fixed << std::setprecision(3) << out.elapsedSeconds;
        std::cout << "[Ccram][" << strategy.name() << "] " << completed << "/" << total << " resamples on "
                  << out.workers << " worker(s) in " << elapsed.str() << "s\n";
    }
    return out;
}

// Successful values in iteration order, with the resample index of each.
void collectSuccessful(const PipelineOutcome<double>& outcome,
                       std::vector<double>& values,
                       std::vector<size_t>& iterations) {
    values.clear();
    iterations.clear();
    values.reserve(outcome.slots.size() - outcome.failed);
    iterations.reserve(outcome.slots.size() - outcome.failed);
    for (size_t b = 0; b < outcome.slots.size(); ++b) {
        if (!outcome.slots[b]) continue;
        values.push_back(*outcome.slots[b]);
        iterations.push_back(b);
    }
}

std::pair<double, double> bcaInterval(const ContingencyModel& model,
                                      const Statistic& statistic,
                                      const std::vector<double>& sorted,
                                      double observed,
                                      double alpha) {
    const double b = static_cast<double>(sorted.size());
    double below = 0.0;
    for (double v : sorted) {
        if (nearlyEqual(v, observed)) below += 0.5;
        else if (v < observed) below += 1.0;
    }
    // keep z0 finite when the whole distribution lies on one side of the estimate
    const double proportion = std::clamp(below / b, 0.5 / b, 1.0 - 0.5 / b);
    const double z0 = StatsUtils::normalQuantile(proportion);
    const double a = ResamplingDriver::jackknifeAcceleration(model, statistic);

    auto adjusted = [&](double level) {
        const double z = StatsUtils::normalQuantile(level);
        const double denom = 1.0 - a * (z0 + z);
        const double shifted = StatsUtils::normalCdf(z0 + (z0 + z) / denom);
        return std::isfinite(shifted) && denom > 0.0 ? shifted : level;
    };
    return {StatsUtils::percentileSorted(sorted, adjusted(alpha / 2.0)),
            StatsUtils::percentileSorted(sorted, adjusted(1.0 - alpha / 2.0))};
}
} // namespace

std::string ciMethodName(CiMethod method) {
    switch (method) {
        case CiMethod::Percentile: return "percentile";
        case CiMethod::Basic: return "basic";
        case CiMethod::BCa: return "bca";
    }
    return "percentile";
}

std::string alternativeName(Alternative alternative) {
    switch (alternative) {
        case Alternative::Greater: return "greater";
        case Alternative::Less: return "less";
        case Alternative::TwoSided: return "two-sided";
    }
    return "greater";
}

ContingencyTable BootstrapStrategy::generate(size_t, std::mt19937_64& rng) const {
    const auto& counts = observed_.counts();
    std::vector<int64_t> drawn(counts.size(), 0);

    int64_t remainingDraws = observed_.total();
    int64_t remainingMass = observed_.total();
    for (size_t i = 0; i < counts.size() && remainingDraws > 0; ++i) {
        if (counts[i] == 0) continue;
        if (counts[i] >= remainingMass) {
            drawn[i] = remainingDraws;
            break;
        }
        const double p = static_cast<double>(counts[i]) / static_cast<double>(remainingMass);
        std::binomial_distribution<int64_t> binom(remainingDraws, p);
        drawn[i] = binom(rng);
        remainingDraws -= drawn[i];
        remainingMass -= counts[i];
    }
    return ContingencyTable(observed_.shape(), std::move(drawn));
}

PermutationStrategy::PermutationStrategy(const ContingencyTable& observed, size_t response)
    : shape_(observed.shape()), total_(observed.total()) {
    if (response >= shape_.size()) {
        throw Ccram::InvalidAxisSpecException("response axis " + std::to_string(response) + " out of range for " +
                                              std::to_string(shape_.size()) + "-dimensional table");
    }
    responseStride_ = observed.strides()[response];
    responseMargin_.assign(shape_[response], 0);
    const auto& counts = observed.counts();
    for (size_t flat = 0; flat < counts.size(); ++flat) {
        const size_t label = (flat / responseStride_) % shape_[response];
        responseMargin_[label] += counts[flat];
        if (label != 0) continue;

        int64_t size = 0;
        for (size_t k = 0; k < shape_[response]; ++k) size += counts[flat + k * responseStride_];
        if (size == 0) continue;
        groupBase_.push_back(flat);
        groupSize_.push_back(size);
    }
}

ContingencyTable PermutationStrategy::generate(size_t, std::mt19937_64& rng) const {
    std::vector<int64_t> pool = responseMargin_;
    int64_t remaining = total_;

    size_t cells = 1;
    for (size_t dim : shape_) cells *= dim;
    std::vector<int64_t> counts(cells, 0);
    for (size_t g = 0; g < groupBase_.size(); ++g) {
        if (g + 1 == groupBase_.size()) {
            // the last group takes whatever is left in the pool
            for (size_t label = 0; label < pool.size(); ++label) {
                counts[groupBase_[g] + label * responseStride_] = pool[label];
            }
            break;
        }
        for (int64_t k = 0; k < groupSize_[g]; ++k) {
            // label drawn with probability pool[label] / remaining
            std::uniform_int_distribution<int64_t> pick(0, remaining - 1);
            int64_t ticket = pick(rng);
            size_t label = 0;
            while (ticket >= pool[label]) ticket -= pool[label++];
            --pool[label];
            --remaining;
            counts[groupBase_[g] + label * responseStride_] += 1;
        }
    }
    return ContingencyTable(shape_, std::move(counts));
}

double CcramStatistic::evaluate(const ContingencyModel& model) const {
    return CopulaRegressionEngine::calculateCCRAM(model, predictors_, response_, scaled_);
}

std::vector<std::optional<size_t>> PredictionStatistic::evaluate(const ContingencyModel& model) const {
    CheckerboardScorer scorer(model);
    return CopulaRegressionEngine::predictAll(scorer, predictors_, response_);
}

int ResamplingDriver::resolveWorkers(const ResamplingOptions& options) {
    if (!options.parallel) return 1;
    if (options.threads > 0) return options.threads;
    #ifdef USE_OPENMP
    return std::max(1, omp_get_max_threads());
    #else
    return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    #endif
}

std::mt19937_64 ResamplingDriver::iterationEngine(uint64_t seed, size_t iteration) {
    const uint64_t it = static_cast<uint64_t>(iteration);
    std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                      static_cast<uint32_t>(it), static_cast<uint32_t>(it >> 32)};
    return std::mt19937_64(seq);
}

double ResamplingDriver::permutationPValue(const std::vector<double>& distribution,
                                           double observed,
                                           Alternative alternative) {
    size_t atLeast = 0;
    size_t atMost = 0;
    for (double v : distribution) {
        const bool tie = nearlyEqual(v, observed);
        if (tie || v > observed) ++atLeast;
        if (tie || v < observed) ++atMost;
    }
    const double m = static_cast<double>(distribution.size());
    const double greater = (static_cast<double>(atLeast) + 1.0) / (m + 1.0);
    const double less = (static_cast<double>(atMost) + 1.0) / (m + 1.0);
    switch (alternative) {
        case Alternative::Greater: return greater;
        case Alternative::Less: return less;
        case Alternative::TwoSided: return std::min(1.0, 2.0 * std::min(greater, less));
    }
    return greater;
}

double ResamplingDriver::jackknifeAcceleration(const ContingencyModel& model, const Statistic& statistic) {
    const ContingencyTable& table = model.table();
    if (table.total() < 2) return 0.0;

    std::vector<double> replicate;
    std::vector<double> weight;
    const auto& counts = table.counts();
    for (size_t cell = 0; cell < counts.size(); ++cell) {
        if (counts[cell] == 0) continue;
        std::vector<int64_t> reduced = counts;
        reduced[cell] -= 1;
        try {
            replicate.push_back(statistic.evaluate(model.withTable(ContingencyTable(table.shape(), std::move(reduced)))));
            weight.push_back(static_cast<double>(counts[cell]));
        } catch (const Ccram::DivisionByZeroException&) {
            // undefined leave-one-out replicate; dropped
        } catch (const Ccram::DegenerateConditionException&) {
        }
    }

    double totalWeight = 0.0;
    double mean = 0.0;
    for (size_t k = 0; k < replicate.size(); ++k) {
        totalWeight += weight[k];
        mean += weight[k] * replicate[k];
    }
    if (totalWeight <= 0.0) return 0.0;
    mean /= totalWeight;

    double num = 0.0;
    double den = 0.0;
    for (size_t k = 0; k < replicate.size(); ++k) {
        const double d = mean - replicate[k];
        num += weight[k] * d * d * d;
        den += weight[k] * d * d;
    }
    if (den <= kJackknifeFloor * totalWeight) return 0.0;
    return num / (6.0 * std::pow(den, 1.5));
}

std::vector<double> ResamplingDriver::runResamples(const ContingencyModel& model,
                                                   const ResamplingStrategy& strategy,
                                                   const Statistic& statistic,
                                                   const ResamplingOptions& options) {
    validateOptions(options);
    const auto outcome = runPipeline<double>(model, strategy, options, [&](const ContingencyModel& m) {
        return statistic.evaluate(m);
    });
    std::vector<double> values(outcome.slots.size(), std::numeric_limits<double>::quiet_NaN());
    for (size_t b = 0; b < outcome.slots.size(); ++b) {
        if (outcome.slots[b]) values[b] = *outcome.slots[b];
    }
    return values;
}

BootstrapResult ResamplingDriver::bootstrapCCRAM(const ContingencyModel& model,
                                                 const std::vector<size_t>& predictors,
                                                 size_t response,
                                                 const ResamplingOptions& options) {
    validateOptions(options);
    const CcramStatistic statistic(predictors, response, options.scaled);

    BootstrapResult result;
    result.observed = statistic.evaluate(model);
    result.method = options.ciMethod;
    result.confidenceLevel = options.confidenceLevel;

    const BootstrapStrategy strategy(model.table());
    const auto outcome = runPipeline<double>(model, strategy, options, [&](const ContingencyModel& m) {
        return statistic.evaluate(m);
    });
    collectSuccessful(outcome, result.distribution, result.iterations);
    result.failedResamples = outcome.failed;

    std::vector<double> sorted = result.distribution;
    std::sort(sorted.begin(), sorted.end());
    const double alpha = 1.0 - options.confidenceLevel;
    const double qLow = StatsUtils::percentileSorted(sorted, alpha / 2.0);
    const double qHigh = StatsUtils::percentileSorted(sorted, 1.0 - alpha / 2.0);

    switch (options.ciMethod) {
        case CiMethod::Percentile:
            result.ciLower = qLow;
            result.ciUpper = qHigh;
            break;
        case CiMethod::Basic:
            result.ciLower = 2.0 * result.observed - qHigh;
            result.ciUpper = 2.0 * result.observed - qLow;
            break;
        case CiMethod::BCa: {
            const auto interval = bcaInterval(model, statistic, sorted, result.observed, alpha);
            result.ciLower = interval.first;
            result.ciUpper = interval.second;
            break;
        }
    }

    result.standardError = StatsUtils::sampleStdDev(result.distribution);
    result.bias = StatsUtils::runningMean(result.distribution) - result.observed;
    return result;
}

PermutationResult ResamplingDriver::permutationTestCCRAM(const ContingencyModel& model,
                                                         const std::vector<size_t>& predictors,
                                                         size_t response,
                                                         const ResamplingOptions& options) {
    validateOptions(options);
    const CcramStatistic statistic(predictors, response, options.scaled);

    PermutationResult result;
    result.observed = statistic.evaluate(model);
    result.alternative = options.alternative;

    const PermutationStrategy strategy(model.table(), response);
    const auto outcome = runPipeline<double>(model, strategy, options, [&](const ContingencyModel& m) {
        return statistic.evaluate(m);
    });
    collectSuccessful(outcome, result.distribution, result.iterations);
    result.failedResamples = outcome.failed;
    result.pValue = permutationPValue(result.distribution, result.observed, options.alternative);
    return result;
}

PredictionConfidence ResamplingDriver::bootstrapPredictions(const ContingencyModel& model,
                                                            const std::vector<size_t>& predictors,
                                                            size_t response,
                                                            const ResamplingOptions& options) {
    validateOptions(options);
    CopulaRegressionEngine::validateAxes(model, predictors, response);
    const PredictionStatistic statistic(predictors, response);
    const size_t categories = model.shape()[response];

    const BootstrapStrategy strategy(model.table());
    const auto outcome = runPipeline<std::vector<std::optional<size_t>>>(
        model, strategy, options, [&](const ContingencyModel& m) { return statistic.evaluate(m); });

    PredictionConfidence result;
    const PredictionTable layout = CopulaRegressionEngine::predictionTable(model, predictors, response);
    const size_t rows = layout.rows.size();
    result.combinations.reserve(rows);
    for (const auto& row : layout.rows) result.combinations.push_back(row.categories);
    result.matrix.assign(rows, std::vector<double>(categories, 0.0));
    result.notPredicted.assign(rows, 0.0);
    result.failedResamples = outcome.failed;
    result.resamples = outcome.slots.size() - outcome.failed;

    for (const auto& slot : outcome.slots) {
        if (!slot) continue;
        for (size_t r = 0; r < rows; ++r) {
            const auto& predicted = (*slot)[r];
            if (predicted) result.matrix[r][*predicted] += 1.0;
            else result.notPredicted[r] += 1.0;
        }
    }
    const double denom = static_cast<double>(result.resamples);
    for (size_t r = 0; r < rows; ++r) {
        for (double& cell : result.matrix[r]) cell /= denom;
        result.notPredicted[r] /= denom;
    }
    return result;
}
