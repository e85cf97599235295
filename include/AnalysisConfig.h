#pragma once

#include "ContingencyModel.h"
#include "ResamplingDriver.h"
#include "TableLoader.h"

#include <cstdint>
#include <string>
#include <vector>

struct AnalysisConfig {
    std::string inputPath;

    // Input layout
    std::string dataForm = "table_form";
    std::vector<size_t> dimension;
    char delimiter = ',';
    bool header = false;
    std::vector<std::string> variableNames;
    CategoryMap categoryMap;

    // Axes are given as 1-based positions or variable names; an empty predictor list means
    // every axis except the response.
    std::string response;
    std::vector<std::string> predictors;

    // summary | matrix | bootstrap | permutation | predictions | all
    std::string mode = "summary";
    bool scaled = false;

    size_t resamples = 9999;
    double confidenceLevel = 0.95;
    std::string ciMethod = "percentile";
    std::string alternative = "greater";
    bool parallel = true;
    int threads = 0;
    uint64_t seed = 8990;
    double timeoutSeconds = 0.0;
    bool verbose = false;

    /**
     * @brief argv[1] is the data file; remaining flags override any --config file values.
     * @throws Ccram::ConfigurationException on unknown flags or bad values.
     */
    static AnalysisConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loose `key: value` / JSON-like file; '#' starts a comment line.
     * @details `category.<variable>.<label>: <code>` adds a category label mapping.
     */
    static AnalysisConfig fromFile(const std::string& configPath, const AnalysisConfig& base);
    static AnalysisConfig fromFile(const std::string& configPath) { return fromFile(configPath, AnalysisConfig()); }

    void validate() const;

    LoadOptions loadOptions() const;
    ResamplingOptions resamplingOptions() const;

    size_t resolveResponse(const ContingencyModel& model) const;
    std::vector<size_t> resolvePredictors(const ContingencyModel& model) const;
};
