#include "ContingencyModel.h"
#include "CcramExceptions.h"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <numeric>

namespace {
std::string shapeString(const std::vector<size_t>& shape) {
    std::string out = "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) out += "x";
        out += std::to_string(shape[i]);
    }
    return out + ")";
}

std::vector<size_t> rowMajorStrides(const std::vector<size_t>& shape) {
    std::vector<size_t> strides(shape.size(), 1);
    for (size_t j = shape.size(); j-- > 1;) {
        strides[j - 1] = strides[j] * shape[j];
    }
    return strides;
}

std::vector<Variable> defaultVariables(const std::vector<size_t>& shape) {
    std::vector<Variable> vars(shape.size());
    for (size_t j = 0; j < shape.size(); ++j) {
        vars[j].name = "X" + std::to_string(j + 1);
        vars[j].categories = shape[j];
    }
    return vars;
}
} // namespace

std::string Variable::categoryLabel(size_t category) const {
    if (category < labels.size() && !labels[category].empty()) return labels[category];
    return std::to_string(category + 1);
}

ContingencyTable::ContingencyTable(std::vector<size_t> shape, std::vector<int64_t> counts)
    : shape_(std::move(shape)), counts_(std::move(counts)) {
    if (shape_.empty()) {
        throw Ccram::InvalidTableException("table must have at least one axis");
    }
    size_t expected = 1;
    for (size_t j = 0; j < shape_.size(); ++j) {
        if (shape_[j] == 0) {
            throw Ccram::InvalidTableException("axis " + std::to_string(j) + " has no categories");
        }
        expected *= shape_[j];
    }
    if (counts_.size() != expected) {
        throw Ccram::InvalidTableException("shape " + shapeString(shape_) + " expects " + std::to_string(expected) +
                                           " cells but " + std::to_string(counts_.size()) + " counts were given");
    }
    strides_ = rowMajorStrides(shape_);

    auto cellWhere = [this](size_t flat) {
        const std::vector<size_t> idx = unravel(flat);
        std::string where;
        for (size_t j = 0; j < idx.size(); ++j) {
            where += (j ? "," : "") + std::to_string(idx[j]);
        }
        return "cell [" + where + "]";
    };
    for (size_t i = 0; i < counts_.size(); ++i) {
        if (counts_[i] < 0) {
            throw Ccram::InvalidTableException("negative count " + std::to_string(counts_[i]) + " at " + cellWhere(i));
        }
        if (counts_[i] > std::numeric_limits<int64_t>::max() - total_) {
            throw Ccram::InvalidTableException("total count overflows a 64-bit integer at " + cellWhere(i));
        }
        total_ += counts_[i];
    }
    if (total_ <= 0) {
        throw Ccram::InvalidTableException("total count is zero for table of shape " + shapeString(shape_));
    }
}

size_t ContingencyTable::flatIndex(const std::vector<size_t>& index) const {
    if (index.size() != shape_.size()) {
        throw Ccram::InvalidAxisSpecException("index has " + std::to_string(index.size()) +
                                              " coordinates, table has " + std::to_string(shape_.size()) + " axes");
    }
    size_t flat = 0;
    for (size_t j = 0; j < index.size(); ++j) {
        if (index[j] >= shape_[j]) {
            throw Ccram::InvalidAxisSpecException("category " + std::to_string(index[j]) + " out of range for axis " +
                                                  std::to_string(j) + " with " + std::to_string(shape_[j]) + " categories");
        }
        flat += index[j] * strides_[j];
    }
    return flat;
}

std::vector<size_t> ContingencyTable::unravel(size_t flat) const {
    std::vector<size_t> index(shape_.size(), 0);
    for (size_t j = 0; j < shape_.size(); ++j) {
        index[j] = flat / strides_[j];
        flat %= strides_[j];
    }
    return index;
}

int64_t ContingencyTable::at(const std::vector<size_t>& index) const {
    return counts_[flatIndex(index)];
}

ContingencyModel::ContingencyModel(ContingencyTable table)
    : table_(std::move(table)), variables_(defaultVariables(table_.shape())) {}

ContingencyModel::ContingencyModel(ContingencyTable table, std::vector<Variable> variables)
    : table_(std::move(table)), variables_(std::move(variables)) {
    if (variables_.size() != table_.dimensions()) {
        throw Ccram::InvalidTableException("declared " + std::to_string(variables_.size()) + " variables for a " +
                                           std::to_string(table_.dimensions()) + "-dimensional table");
    }
    for (size_t j = 0; j < variables_.size(); ++j) {
        Variable& v = variables_[j];
        if (v.name.empty()) v.name = "X" + std::to_string(j + 1);
        if (v.categories == 0) v.categories = table_.shape()[j];
        if (v.categories != table_.shape()[j]) {
            throw Ccram::InvalidTableException("variable '" + v.name + "' declares " + std::to_string(v.categories) +
                                               " categories but axis " + std::to_string(j) + " has " +
                                               std::to_string(table_.shape()[j]));
        }
        if (!v.labels.empty() && v.labels.size() != v.categories) {
            throw Ccram::InvalidTableException("variable '" + v.name + "' has " + std::to_string(v.labels.size()) +
                                               " labels for " + std::to_string(v.categories) + " categories");
        }
    }
}

ContingencyModel ContingencyModel::fromCounts(std::vector<size_t> shape, std::vector<int64_t> counts) {
    return ContingencyModel(ContingencyTable(std::move(shape), std::move(counts)));
}

ContingencyModel ContingencyModel::withTable(ContingencyTable table) const {
    if (table.shape() != table_.shape()) {
        throw Ccram::InvalidTableException("replacement table shape " + shapeString(table.shape()) +
                                           " differs from " + shapeString(table_.shape()));
    }
    return ContingencyModel(std::move(table), variables_);
}

const Variable& ContingencyModel::variable(size_t axis) const {
    checkAxis(axis);
    return variables_[axis];
}

const std::string& ContingencyModel::axisName(size_t axis) const {
    return variable(axis).name;
}

void ContingencyModel::checkAxis(size_t axis) const {
    if (axis >= dimensions()) {
        throw Ccram::InvalidAxisSpecException("axis " + std::to_string(axis) + " out of range for " +
                                              std::to_string(dimensions()) + "-dimensional table");
    }
}

void ContingencyModel::checkCombination(const std::vector<size_t>& axes, const std::vector<size_t>& categories) const {
    if (axes.size() != categories.size()) {
        throw Ccram::InvalidAxisSpecException("combination gives " + std::to_string(categories.size()) +
                                              " categories for " + std::to_string(axes.size()) + " axes");
    }
    for (size_t k = 0; k < axes.size(); ++k) {
        checkAxis(axes[k]);
        if (std::count(axes.begin(), axes.end(), axes[k]) > 1) {
            throw Ccram::InvalidAxisSpecException("axis '" + variables_[axes[k]].name + "' listed more than once");
        }
        if (categories[k] >= shape()[axes[k]]) {
            throw Ccram::InvalidAxisSpecException("category " + std::to_string(categories[k]) + " out of range for '" +
                                                  variables_[axes[k]].name + "' with " +
                                                  std::to_string(shape()[axes[k]]) + " categories");
        }
    }
}

std::string ContingencyModel::describeCombination(const std::vector<size_t>& axes,
                                                  const std::vector<size_t>& categories) const {
    std::string out = "(";
    for (size_t k = 0; k < axes.size() && k < categories.size(); ++k) {
        if (k > 0) out += ", ";
        if (axes[k] < variables_.size()) {
            out += variables_[axes[k]].name + "=" + variables_[axes[k]].categoryLabel(categories[k]);
        } else {
            out += "axis" + std::to_string(axes[k]) + "=" + std::to_string(categories[k] + 1);
        }
    }
    return out + ")";
}

std::vector<double> ContingencyModel::jointProbability() const {
    const double n = static_cast<double>(total());
    std::vector<double> p(table_.cellCount());
    const auto& counts = table_.counts();
    for (size_t i = 0; i < counts.size(); ++i) {
        p[i] = static_cast<double>(counts[i]) / n;
    }
    return p;
}

std::vector<int64_t> ContingencyModel::marginalCounts(const std::vector<size_t>& axes) const {
    for (size_t k = 0; k < axes.size(); ++k) {
        checkAxis(axes[k]);
        if (std::count(axes.begin(), axes.end(), axes[k]) > 1) {
            throw Ccram::InvalidAxisSpecException("axis '" + variables_[axes[k]].name + "' listed more than once");
        }
    }

    // Target strides in caller order, then mapped back onto table axes.
    const size_t d = dimensions();
    std::vector<size_t> targetStride(d, 0);
    size_t targetSize = 1;
    for (size_t k = axes.size(); k-- > 0;) {
        targetStride[axes[k]] = targetSize;
        targetSize *= shape()[axes[k]];
    }

    std::vector<int64_t> out(targetSize, 0);
    std::vector<size_t> index(d, 0);
    size_t target = 0;
    const auto& counts = table_.counts();
    for (size_t flat = 0; flat < counts.size(); ++flat) {
        out[target] += counts[flat];
        // odometer increment, last axis fastest
        for (size_t j = d; j-- > 0;) {
            if (++index[j] < shape()[j]) {
                target += targetStride[j];
                break;
            }
            target -= targetStride[j] * (shape()[j] - 1);
            index[j] = 0;
        }
    }
    return out;
}

std::vector<double> ContingencyModel::marginalTable(const std::vector<size_t>& axes) const {
    const std::vector<int64_t> counts = marginalCounts(axes);
    const double n = static_cast<double>(total());
    std::vector<double> p(counts.size());
    for (size_t i = 0; i < counts.size(); ++i) p[i] = static_cast<double>(counts[i]) / n;
    return p;
}

std::vector<double> ContingencyModel::marginal(size_t axis) const {
    return marginalTable({axis});
}

std::vector<double> ContingencyModel::marginalCDF(size_t axis) const {
    const std::vector<int64_t> counts = marginalCounts({axis});
    const double n = static_cast<double>(total());
    std::vector<double> cdf(counts.size() + 1, 0.0);
    int64_t running = 0;
    for (size_t i = 0; i < counts.size(); ++i) {
        running += counts[i];
        cdf[i + 1] = static_cast<double>(running) / n;
    }
    // integer accumulation makes the last breakpoint exactly n/n
    cdf.back() = 1.0;
    return cdf;
}

double ContingencyModel::marginalAt(const std::vector<size_t>& axes, const std::vector<size_t>& categories) const {
    checkCombination(axes, categories);
    const std::vector<int64_t> counts = marginalCounts(axes);
    size_t flat = 0;
    for (size_t k = 0; k < axes.size(); ++k) {
        flat = flat * shape()[axes[k]] + categories[k];
    }
    return static_cast<double>(counts[flat]) / static_cast<double>(total());
}

std::vector<double> ContingencyModel::conditional(size_t responseAxis,
                                                  const std::vector<size_t>& predictorAxes,
                                                  const std::vector<size_t>& predictorCategories) const {
    checkAxis(responseAxis);
    if (std::find(predictorAxes.begin(), predictorAxes.end(), responseAxis) != predictorAxes.end()) {
        throw Ccram::InvalidAxisSpecException("response '" + variables_[responseAxis].name +
                                              "' is also listed as a predictor");
    }
    checkCombination(predictorAxes, predictorCategories);

    std::vector<size_t> axes = predictorAxes;
    axes.push_back(responseAxis);
    const std::vector<int64_t> counts = marginalCounts(axes);

    size_t row = 0;
    for (size_t k = 0; k < predictorAxes.size(); ++k) {
        row = row * shape()[predictorAxes[k]] + predictorCategories[k];
    }
    const size_t responseCats = shape()[responseAxis];
    const auto begin = counts.begin() + static_cast<std::ptrdiff_t>(row * responseCats);
    const int64_t mass = std::accumulate(begin, begin + static_cast<std::ptrdiff_t>(responseCats), int64_t{0});
    if (mass == 0) {
        throw Ccram::DegenerateConditionException("combination " + describeCombination(predictorAxes, predictorCategories) +
                                                  " has zero probability; conditional of '" +
                                                  variables_[responseAxis].name + "' is undefined");
    }

    std::vector<double> out(responseCats);
    for (size_t i = 0; i < responseCats; ++i) {
        out[i] = static_cast<double>(*(begin + static_cast<std::ptrdiff_t>(i))) / static_cast<double>(mass);
    }
    return out;
}
