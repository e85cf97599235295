#pragma once

#include "ContingencyModel.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

enum class CiMethod { Percentile, Basic, BCa };
enum class Alternative { Greater, Less, TwoSided };

std::string ciMethodName(CiMethod method);
std::string alternativeName(Alternative alternative);

struct ResamplingOptions {
    size_t resamples = 9999;
    double confidenceLevel = 0.95;
    CiMethod ciMethod = CiMethod::Percentile;
    Alternative alternative = Alternative::Greater;
    bool scaled = false;
    bool parallel = true;
    int threads = 0;              // 0 = all available cores
    uint64_t seed = 8990;
    double timeoutSeconds = 0.0;  // 0 = no limit
    bool verbose = false;
};

struct BootstrapResult {
    double observed = 0.0;
    double ciLower = 0.0;
    double ciUpper = 0.0;
    double standardError = 0.0;
    double bias = 0.0;
    std::vector<double> distribution;  // successful resamples, in iteration order
    std::vector<size_t> iterations;    // resample index of each distribution entry
    CiMethod method = CiMethod::Percentile;
    double confidenceLevel = 0.95;
    size_t failedResamples = 0;
};

struct PermutationResult {
    double observed = 0.0;
    double pValue = 1.0;
    Alternative alternative = Alternative::Greater;
    std::vector<double> distribution;
    std::vector<size_t> iterations;
    size_t failedResamples = 0;
};

struct PredictionConfidence {
    std::vector<std::vector<size_t>> combinations;  // row-major over the predictor axes
    std::vector<std::vector<double>> matrix;        // rows = combinations, cols = response categories
    std::vector<double> notPredicted;               // per row, fraction of resamples with no prediction
    size_t resamples = 0;
    size_t failedResamples = 0;
};

/**
 * @brief Produces one resampled table per iteration index.
 * @details Implementations must be safe to call concurrently; all per-iteration state lives in
 *          the caller-provided engine.
 */
class ResamplingStrategy {
public:
    virtual ~ResamplingStrategy() = default;
    virtual ContingencyTable generate(size_t iteration, std::mt19937_64& rng) const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief Multinomial(n, P) redraw of the observed table, drawn cell by cell as conditional binomials.
 */
class BootstrapStrategy : public ResamplingStrategy {
public:
    explicit BootstrapStrategy(const ContingencyTable& observed) : observed_(observed) {}
    ContingencyTable generate(size_t iteration, std::mt19937_64& rng) const override;
    std::string name() const override { return "Bootstrap"; }

private:
    const ContingencyTable& observed_;
};

/**
 * @brief Random reassignment of response labels to observations, without replacement. Every
 *        other axis stays attached to its observation, so both margins are preserved exactly.
 * @details Observations are dealt group by group (one group per combination of the non-response
 *          axes) from the pool of response labels. Memory is O(cells), never O(n).
 */
class PermutationStrategy : public ResamplingStrategy {
public:
    PermutationStrategy(const ContingencyTable& observed, size_t response);
    ContingencyTable generate(size_t iteration, std::mt19937_64& rng) const override;
    std::string name() const override { return "Permutation"; }

private:
    std::vector<size_t> shape_;
    size_t responseStride_ = 1;
    std::vector<size_t> groupBase_;       // flat index with the response coordinate set to 0
    std::vector<int64_t> groupSize_;      // observations per group
    std::vector<int64_t> responseMargin_; // label pool, one count per response category
    int64_t total_ = 0;
};

class Statistic {
public:
    virtual ~Statistic() = default;
    virtual double evaluate(const ContingencyModel& model) const = 0;
};

class CcramStatistic : public Statistic {
public:
    CcramStatistic(std::vector<size_t> predictors, size_t response, bool scaled)
        : predictors_(std::move(predictors)), response_(response), scaled_(scaled) {}
    double evaluate(const ContingencyModel& model) const override;

private:
    std::vector<size_t> predictors_;
    size_t response_;
    bool scaled_;
};

class PredictionStatistic {
public:
    PredictionStatistic(std::vector<size_t> predictors, size_t response)
        : predictors_(std::move(predictors)), response_(response) {}
    std::vector<std::optional<size_t>> evaluate(const ContingencyModel& model) const;

private:
    std::vector<size_t> predictors_;
    size_t response_;
};

class ResamplingDriver {
public:
    /**
     * @brief Bootstrap distribution of CCRAM/SCCRAM with a confidence interval.
     * @pre options.resamples >= 1 and 0 < options.confidenceLevel < 1.
     * @throws Ccram::InvalidAxisSpecException / Ccram::DivisionByZeroException from the observed
     *         statistic, before any resampling.
     * @throws Ccram::ResamplingException on timeout, a systemic worker failure, or when every
     *         resample fails.
     */
    static BootstrapResult bootstrapCCRAM(const ContingencyModel& model,
                                          const std::vector<size_t>& predictors,
                                          size_t response,
                                          const ResamplingOptions& options);

    /**
     * @brief Permutation null distribution of CCRAM/SCCRAM and its p-value.
     */
    static PermutationResult permutationTestCCRAM(const ContingencyModel& model,
                                                  const std::vector<size_t>& predictors,
                                                  size_t response,
                                                  const ResamplingOptions& options);

    /**
     * @brief Fraction of bootstrap resamples predicting each response category, per predictor combination.
     * @post Each matrix row plus its notPredicted entry sums to 1.
     */
    static PredictionConfidence bootstrapPredictions(const ContingencyModel& model,
                                                     const std::vector<size_t>& predictors,
                                                     size_t response,
                                                     const ResamplingOptions& options);

    /**
     * @brief Generic pipeline: generate a table per iteration, evaluate the statistic, collect.
     * @post One slot per iteration; failed resamples hold NaN.
     */
    static std::vector<double> runResamples(const ContingencyModel& model,
                                            const ResamplingStrategy& strategy,
                                            const Statistic& statistic,
                                            const ResamplingOptions& options);

    static int resolveWorkers(const ResamplingOptions& options);

    /**
     * @brief Engine for one iteration, derived from (seed, iteration) only.
     */
    static std::mt19937_64 iterationEngine(uint64_t seed, size_t iteration);

    static double permutationPValue(const std::vector<double>& distribution, double observed, Alternative alternative);

    /**
     * @brief Jackknife acceleration for BCa, leaving out one observation at a time.
     * @details Observations in the same cell give identical replicates, so each cell is evaluated
     *          once and weighted by its count.
     */
    static double jackknifeAcceleration(const ContingencyModel& model, const Statistic& statistic);
};
