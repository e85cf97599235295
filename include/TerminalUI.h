#pragma once
#include "ContingencyModel.h"
#include "CopulaRegression.h"
#include "ResamplingDriver.h"
#include <iosfwd>
#include <string>
#include <vector>

class TerminalUI {
public:
    static void printTableSummary(const ContingencyModel& model, std::ostream& os);

    // Checkerboard scores and variances for every axis
    static void printScoreSummary(const ContingencyModel& model, std::ostream& os);

    static void printPredictionTable(const ContingencyModel& model, const PredictionTable& table, std::ostream& os);
    static void printAssociation(const ContingencyModel& model,
                                 const std::vector<size_t>& predictors,
                                 size_t response,
                                 double ccram,
                                 const std::string& sccramText,
                                 std::ostream& os);
    static void printAssociationMatrix(const ContingencyModel& model, const AssociationMatrix& matrix, std::ostream& os);

    // Resampling display
    static void printBootstrapResult(const std::string& label, const BootstrapResult& result, std::ostream& os);
    static void printPermutationResult(const std::string& label, const PermutationResult& result, std::ostream& os);
    static void printPredictionConfidence(const ContingencyModel& model,
                                          const std::vector<size_t>& predictors,
                                          size_t response,
                                          const PredictionConfidence& confidence,
                                          std::ostream& os);

    static std::string relationLabel(const ContingencyModel& model, const std::vector<size_t>& predictors, size_t response);
};
