#pragma once

#include "ContingencyModel.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum class DataForm { CaseForm, FrequencyForm, TableForm };

std::string dataFormName(DataForm form);

/**
 * @brief Accepts case_form / case, frequency_form / frequency, table_form / table (any case, '-' or '_').
 * @throws Ccram::ConfigurationException on anything else.
 */
DataForm parseDataForm(const std::string& value);

// variable name -> category label -> 1-based code
using CategoryMap = std::map<std::string, std::map<std::string, size_t>>;

struct LoadOptions {
    DataForm form = DataForm::TableForm;
    std::vector<size_t> shape;
    std::vector<std::string> variableNames;
    CategoryMap categoryMap;
    bool header = false;
    char delimiter = ',';
};

class TableLoader {
public:
    /**
     * @brief One row per observation, one 1-based category code per variable.
     * @throws Ccram::InvalidTableException on a wrong row width or an out-of-range code.
     */
    static ContingencyTable fromCaseForm(const std::vector<std::vector<size_t>>& cases,
                                         const std::vector<size_t>& shape);

    /**
     * @brief 1-based combinations with their frequencies.
     * @details A combination listed more than once accumulates its frequencies; it does not
     *          replace the earlier row.
     * @throws Ccram::InvalidTableException on a negative frequency, a bad code, or a cell total
     *         beyond int64_t.
     */
    static ContingencyTable fromFrequencyForm(const std::vector<std::vector<size_t>>& combinations,
                                              const std::vector<int64_t>& frequencies,
                                              const std::vector<size_t>& shape);

    static ContingencyTable fromTableForm(const std::vector<int64_t>& counts, const std::vector<size_t>& shape);

    /**
     * @brief 0-based case rows whose columns map onto table axes through `axisOrder`.
     * @details Axes not named in `axisOrder` are pinned to category 0. An empty `axisOrder`
     *          means column j is axis j.
     */
    static ContingencyTable fromIndexedCases(const std::vector<std::vector<size_t>>& cases,
                                             const std::vector<size_t>& shape,
                                             const std::vector<size_t>& axisOrder = {});

    /**
     * @brief Expands a table into one 0-based row per observation, cells in row-major order.
     */
    static std::vector<std::vector<size_t>> toCaseForm(const ContingencyTable& table);

    /**
     * @brief Builds a model from already tokenized records (header excluded).
     * @param columnNames header fields, used for variable names when none are configured.
     */
    static ContingencyModel fromRecords(const std::vector<std::vector<std::string>>& records,
                                        const LoadOptions& options,
                                        const std::vector<std::string>& columnNames = {});

    /**
     * @throws Ccram::IOException when the file cannot be opened or has a broken quoted field.
     * @throws Ccram::InvalidTableException on malformed content.
     */
    static ContingencyModel loadFile(const std::string& path, const LoadOptions& options);
};
