#include "TableLoader.h"
#include "CSVUtils.h"
#include "CcramExceptions.h"
#include "CommonUtils.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace {
size_t cellCountFor(const std::vector<size_t>& shape) {
    if (shape.empty()) throw Ccram::InvalidTableException("shape must name at least one axis");
    size_t cells = 1;
    for (size_t dim : shape) {
        if (dim == 0) throw Ccram::InvalidTableException("every axis needs at least one category");
        cells *= dim;
    }
    return cells;
}

size_t rowMajorOffset(const std::vector<size_t>& index, const std::vector<size_t>& shape) {
    size_t flat = 0;
    for (size_t j = 0; j < shape.size(); ++j) flat = flat * shape[j] + index[j];
    return flat;
}

std::string recordWhere(size_t record, size_t column) {
    return "record " + std::to_string(record + 1) + ", column " + std::to_string(column + 1);
}

// 2^63, the first double outside int64_t
constexpr double kInt64Bound = 9223372036854775808.0;

// Integral numeric field; numpy-style "2.0" is accepted. Values that do not fit int64_t are rejected.
bool parseIntegral(const std::string& raw, int64_t& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v) || std::floor(v) != v) return false;
    if (v < -kInt64Bound || v >= kInt64Bound) return false;
    out = static_cast<int64_t>(v);
    return true;
}

size_t parseCode(const std::string& raw,
                 const std::map<std::string, size_t>* labels,
                 size_t categories,
                 size_t record,
                 size_t column) {
    const std::string field = CommonUtils::trim(raw);
    if (labels) {
        auto it = labels->find(field);
        if (it != labels->end()) return it->second;
    }
    int64_t code = 0;
    if (!parseIntegral(field, code)) {
        throw Ccram::InvalidTableException("unrecognized category '" + field + "' at " + recordWhere(record, column));
    }
    if (code < 1 || static_cast<size_t>(code) > categories) {
        throw Ccram::InvalidTableException("category code " + field + " at " + recordWhere(record, column) +
                                           " outside 1.." + std::to_string(categories));
    }
    return static_cast<size_t>(code);
}

std::vector<Variable> buildVariables(const LoadOptions& options, const std::vector<std::string>& columnNames) {
    const size_t d = options.shape.size();
    std::vector<Variable> vars(d);
    for (size_t j = 0; j < d; ++j) {
        if (j < options.variableNames.size()) vars[j].name = options.variableNames[j];
        else if (options.form != DataForm::TableForm && j < columnNames.size()) vars[j].name = columnNames[j];
        else vars[j].name = "X" + std::to_string(j + 1);
        vars[j].categories = options.shape[j];

        auto it = options.categoryMap.find(vars[j].name);
        if (it == options.categoryMap.end()) continue;
        vars[j].labels.assign(options.shape[j], "");
        for (const auto& entry : it->second) {
            if (entry.second >= 1 && entry.second <= options.shape[j]) {
                vars[j].labels[entry.second - 1] = entry.first;
            }
        }
    }
    return vars;
}
} // namespace

std::string dataFormName(DataForm form) {
    switch (form) {
        case DataForm::CaseForm: return "case_form";
        case DataForm::FrequencyForm: return "frequency_form";
        case DataForm::TableForm: return "table_form";
    }
    return "table_form";
}

DataForm parseDataForm(const std::string& value) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    for (char& c : v) {
        if (c == '-') c = '_';
    }
    if (v == "case_form" || v == "case") return DataForm::CaseForm;
    if (v == "frequency_form" || v == "frequency") return DataForm::FrequencyForm;
    if (v == "table_form" || v == "table") return DataForm::TableForm;
    throw Ccram::ConfigurationException("data form must be case_form, frequency_form or table_form, got '" + value + "'");
}

ContingencyTable TableLoader::fromCaseForm(const std::vector<std::vector<size_t>>& cases,
                                           const std::vector<size_t>& shape) {
    std::vector<int64_t> counts(cellCountFor(shape), 0);
    std::vector<size_t> index(shape.size(), 0);
    for (size_t r = 0; r < cases.size(); ++r) {
        if (cases[r].size() != shape.size()) {
            throw Ccram::InvalidTableException("case " + std::to_string(r + 1) + " has " + std::to_string(cases[r].size()) +
                                               " values for " + std::to_string(shape.size()) + " variables");
        }
        for (size_t j = 0; j < shape.size(); ++j) {
            if (cases[r][j] < 1 || cases[r][j] > shape[j]) {
                throw Ccram::InvalidTableException("case " + std::to_string(r + 1) + " has code " +
                                                   std::to_string(cases[r][j]) + " outside 1.." + std::to_string(shape[j]) +
                                                   " for variable " + std::to_string(j + 1));
            }
            index[j] = cases[r][j] - 1;
        }
        counts[rowMajorOffset(index, shape)] += 1;
    }
    return ContingencyTable(shape, std::move(counts));
}

ContingencyTable TableLoader::fromFrequencyForm(const std::vector<std::vector<size_t>>& combinations,
                                                const std::vector<int64_t>& frequencies,
                                                const std::vector<size_t>& shape) {
    if (combinations.size() != frequencies.size()) {
        throw Ccram::InvalidTableException(std::to_string(combinations.size()) + " combinations but " +
                                           std::to_string(frequencies.size()) + " frequencies");
    }
    std::vector<int64_t> counts(cellCountFor(shape), 0);
    std::vector<size_t> index(shape.size(), 0);
    for (size_t r = 0; r < combinations.size(); ++r) {
        if (combinations[r].size() != shape.size()) {
            throw Ccram::InvalidTableException("row " + std::to_string(r + 1) + " has " +
                                               std::to_string(combinations[r].size()) + " codes for " +
                                               std::to_string(shape.size()) + " variables");
        }
        if (frequencies[r] < 0) {
            throw Ccram::InvalidTableException("row " + std::to_string(r + 1) + " has negative frequency " +
                                               std::to_string(frequencies[r]));
        }
        for (size_t j = 0; j < shape.size(); ++j) {
            if (combinations[r][j] < 1 || combinations[r][j] > shape[j]) {
                throw Ccram::InvalidTableException("row " + std::to_string(r + 1) + " has code " +
                                                   std::to_string(combinations[r][j]) + " outside 1.." +
                                                   std::to_string(shape[j]));
            }
            index[j] = combinations[r][j] - 1;
        }
        int64_t& cell = counts[rowMajorOffset(index, shape)];
        if (frequencies[r] > std::numeric_limits<int64_t>::max() - cell) {
            throw Ccram::InvalidTableException("row " + std::to_string(r + 1) + " overflows its cell count");
        }
        cell += frequencies[r];
    }
    return ContingencyTable(shape, std::move(counts));
}

ContingencyTable TableLoader::fromTableForm(const std::vector<int64_t>& counts, const std::vector<size_t>& shape) {
    return ContingencyTable(shape, counts);
}

ContingencyTable TableLoader::fromIndexedCases(const std::vector<std::vector<size_t>>& cases,
                                               const std::vector<size_t>& shape,
                                               const std::vector<size_t>& axisOrder) {
    std::vector<size_t> order = axisOrder;
    if (order.empty()) {
        for (size_t j = 0; j < shape.size(); ++j) order.push_back(j);
    }
    for (size_t axis : order) {
        if (axis >= shape.size()) {
            throw Ccram::InvalidAxisSpecException("axis order names axis " + std::to_string(axis) + " of a " +
                                                  std::to_string(shape.size()) + "-dimensional table");
        }
    }

    std::vector<int64_t> counts(cellCountFor(shape), 0);
    for (size_t r = 0; r < cases.size(); ++r) {
        if (cases[r].size() != order.size()) {
            throw Ccram::InvalidTableException("case " + std::to_string(r + 1) + " has " + std::to_string(cases[r].size()) +
                                               " values, axis order has " + std::to_string(order.size()));
        }
        std::vector<size_t> index(shape.size(), 0);
        for (size_t k = 0; k < order.size(); ++k) {
            if (cases[r][k] >= shape[order[k]]) {
                throw Ccram::InvalidTableException("case " + std::to_string(r + 1) + " has index " +
                                                   std::to_string(cases[r][k]) + " outside 0.." +
                                                   std::to_string(shape[order[k]] - 1));
            }
            index[order[k]] = cases[r][k];
        }
        counts[rowMajorOffset(index, shape)] += 1;
    }
    return ContingencyTable(shape, std::move(counts));
}

std::vector<std::vector<size_t>> TableLoader::toCaseForm(const ContingencyTable& table) {
    std::vector<std::vector<size_t>> cases;
    cases.reserve(static_cast<size_t>(table.total()));
    const auto& counts = table.counts();
    for (size_t flat = 0; flat < counts.size(); ++flat) {
        if (counts[flat] == 0) continue;
        const std::vector<size_t> index = table.unravel(flat);
        for (int64_t k = 0; k < counts[flat]; ++k) cases.push_back(index);
    }
    return cases;
}

ContingencyModel TableLoader::fromRecords(const std::vector<std::vector<std::string>>& records,
                                          const LoadOptions& options,
                                          const std::vector<std::string>& columnNames) {
    const std::vector<size_t>& shape = options.shape;
    cellCountFor(shape);
    std::vector<Variable> vars = buildVariables(options, columnNames);

    auto labelsFor = [&](size_t j) -> const std::map<std::string, size_t>* {
        auto it = options.categoryMap.find(vars[j].name);
        return it == options.categoryMap.end() ? nullptr : &it->second;
    };

    ContingencyTable table = [&]() {
        if (options.form == DataForm::TableForm) {
            std::vector<int64_t> counts;
            for (size_t r = 0; r < records.size(); ++r) {
                for (size_t c = 0; c < records[r].size(); ++c) {
                    int64_t v = 0;
                    if (!parseIntegral(records[r][c], v)) {
                        throw Ccram::InvalidTableException("non-integer or out-of-range count '" + records[r][c] + "' at " +
                                                           recordWhere(r, c));
                    }
                    counts.push_back(v);
                }
            }
            return fromTableForm(counts, shape);
        }

        const bool frequency = options.form == DataForm::FrequencyForm;
        const size_t width = shape.size() + (frequency ? 1 : 0);
        std::vector<std::vector<size_t>> codes;
        std::vector<int64_t> frequencies;
        codes.reserve(records.size());
        for (size_t r = 0; r < records.size(); ++r) {
            if (records[r].size() != width) {
                throw Ccram::InvalidTableException("record " + std::to_string(r + 1) + " has " +
                                                   std::to_string(records[r].size()) + " fields, expected " +
                                                   std::to_string(width) +
                                                   (frequency ? " (variables + frequency)" : ""));
            }
            std::vector<size_t> row(shape.size());
            for (size_t j = 0; j < shape.size(); ++j) {
                row[j] = parseCode(records[r][j], labelsFor(j), shape[j], r, j);
            }
            codes.push_back(std::move(row));
            if (frequency) {
                int64_t f = 0;
                if (!parseIntegral(records[r].back(), f)) {
                    throw Ccram::InvalidTableException("non-integer or out-of-range frequency '" + records[r].back() + "' at " +
                                                       recordWhere(r, shape.size()));
                }
                frequencies.push_back(f);
            }
        }
        return frequency ? fromFrequencyForm(codes, frequencies, shape) : fromCaseForm(codes, shape);
    }();

    return ContingencyModel(std::move(table), std::move(vars));
}

ContingencyModel TableLoader::loadFile(const std::string& path, const LoadOptions& options) {
    std::ifstream in(path);
    if (!in) {
        throw Ccram::IOException("cannot open data file '" + path + "'");
    }
    CSVUtils::skipBOM(in);

    std::vector<std::string> header;
    std::vector<std::vector<std::string>> records;
    bool first = true;
    while (in.peek() != EOF) {
        bool malformed = false;
        std::vector<std::string> row = CSVUtils::parseCSVLine(in, options.delimiter, &malformed);
        if (malformed) {
            throw Ccram::IOException("unterminated quoted field in '" + path + "'");
        }
        if (row.empty()) continue;
        if (first && options.header) {
            header = CSVUtils::normalizeHeader(row);
        } else {
            records.push_back(std::move(row));
        }
        first = false;
    }
    return fromRecords(records, options, header);
}
