#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Variable {
    std::string name;
    size_t categories = 0;
    bool ordinal = true;
    std::vector<std::string> labels; // empty, or one label per category

    /**
     * @brief Display label of a 0-based category: the declared label, else the 1-based code.
     */
    std::string categoryLabel(size_t category) const;
};

/**
 * @brief Immutable d-dimensional table of non-negative counts, stored flat in row-major order
 *        (last axis varies fastest).
 */
class ContingencyTable {
public:
    /**
     * @pre counts.size() equals the product of shape.
     * @post total() > 0 and every count >= 0.
     * @throws Ccram::InvalidTableException on empty shape, zero-sized axis, size mismatch,
     *         negative count or zero total.
     */
    ContingencyTable(std::vector<size_t> shape, std::vector<int64_t> counts);

    size_t dimensions() const noexcept { return shape_.size(); }
    const std::vector<size_t>& shape() const noexcept { return shape_; }
    const std::vector<size_t>& strides() const noexcept { return strides_; }
    const std::vector<int64_t>& counts() const noexcept { return counts_; }
    int64_t total() const noexcept { return total_; }
    size_t cellCount() const noexcept { return counts_.size(); }

    size_t flatIndex(const std::vector<size_t>& index) const;
    std::vector<size_t> unravel(size_t flat) const;
    int64_t at(const std::vector<size_t>& index) const;

    bool operator==(const ContingencyTable& other) const {
        return shape_ == other.shape_ && counts_ == other.counts_;
    }

private:
    std::vector<size_t> shape_;
    std::vector<size_t> strides_;
    std::vector<int64_t> counts_;
    int64_t total_ = 0;
};

/**
 * @brief A count table plus per-axis variable metadata, exposing the joint, marginal and
 *        conditional probability structure. Read-only once constructed.
 */
class ContingencyModel {
public:
    explicit ContingencyModel(ContingencyTable table);

    /**
     * @pre variables.size() == table.dimensions() and variables[j].categories == shape[j]
     *      (categories == 0 is filled from the shape).
     * @throws Ccram::InvalidTableException on metadata mismatch.
     */
    ContingencyModel(ContingencyTable table, std::vector<Variable> variables);

    static ContingencyModel fromCounts(std::vector<size_t> shape, std::vector<int64_t> counts);

    /**
     * @brief Same variables over a different table of identical shape (resamples, permutations).
     * @throws Ccram::InvalidTableException when the shapes differ.
     */
    ContingencyModel withTable(ContingencyTable table) const;

    const ContingencyTable& table() const noexcept { return table_; }
    size_t dimensions() const noexcept { return table_.dimensions(); }
    const std::vector<size_t>& shape() const noexcept { return table_.shape(); }
    int64_t total() const noexcept { return table_.total(); }
    const std::vector<Variable>& variables() const noexcept { return variables_; }
    const Variable& variable(size_t axis) const;
    const std::string& axisName(size_t axis) const;

    std::vector<double> jointProbability() const;
    std::vector<double> marginal(size_t axis) const;

    /**
     * @brief Cumulative marginal breakpoints u_0 = 0 <= u_1 <= ... <= u_I = 1 (length I+1).
     */
    std::vector<double> marginalCDF(size_t axis) const;

    /**
     * @brief Counts collapsed onto `axes`, row-major in the given axis order.
     * @throws Ccram::InvalidAxisSpecException on out-of-range or repeated axes.
     */
    std::vector<int64_t> marginalCounts(const std::vector<size_t>& axes) const;

    /**
     * @brief Probabilities of every combination over `axes`, row-major in the given axis order.
     */
    std::vector<double> marginalTable(const std::vector<size_t>& axes) const;

    /**
     * @brief Probability of one sub-combination, e.g. P(X1 = a, X3 = b).
     * @throws Ccram::InvalidAxisSpecException on bad axes or categories.
     */
    double marginalAt(const std::vector<size_t>& axes, const std::vector<size_t>& categories) const;

    /**
     * @brief P(response = . | predictors = categories); axes outside the predictor set are
     *        marginalized out.
     * @throws Ccram::InvalidAxisSpecException when response is among the predictors or an index
     *         is out of range.
     * @throws Ccram::DegenerateConditionException when the combination has zero mass.
     */
    std::vector<double> conditional(size_t responseAxis,
                                    const std::vector<size_t>& predictorAxes,
                                    const std::vector<size_t>& predictorCategories) const;

    void checkAxis(size_t axis) const;
    void checkCombination(const std::vector<size_t>& axes, const std::vector<size_t>& categories) const;

    /**
     * @brief Human-readable "(name=label, ...)" for error messages and reports.
     */
    std::string describeCombination(const std::vector<size_t>& axes,
                                    const std::vector<size_t>& categories) const;

private:
    ContingencyTable table_;
    std::vector<Variable> variables_;
};
