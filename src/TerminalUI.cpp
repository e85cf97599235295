#include "TerminalUI.h"
#include "CheckerboardScorer.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace {
const std::string kRule(96, '=');

// Restores the caller's format flags and precision when a report block ends.
class StreamStateGuard {
public:
    explicit StreamStateGuard(std::ostream& os) : os_(os), flags_(os.flags()), precision_(os.precision()) {}
    ~StreamStateGuard() {
        os_.flags(flags_);
        os_.precision(precision_);
    }
    StreamStateGuard(const StreamStateGuard&) = delete;
    StreamStateGuard& operator=(const StreamStateGuard&) = delete;

private:
    std::ostream& os_;
    std::ios::fmtflags flags_;
    std::streamsize precision_;
};

void banner(std::ostream& os, const std::string& title) {
    const std::string text = " " + title + " ";
    const size_t pad = kRule.size() > text.size() ? (kRule.size() - text.size()) / 2 : 0;
    std::string line = std::string(pad, '=') + text;
    line += std::string(kRule.size() > line.size() ? kRule.size() - line.size() : 0, '=');
    os << "\n" << line << "\n";
}

std::string combinationText(const ContingencyModel& model, const std::vector<size_t>& axes, const std::vector<size_t>& cats) {
    std::string out;
    for (size_t k = 0; k < axes.size(); ++k) {
        if (k > 0) out += ", ";
        out += model.variable(axes[k]).categoryLabel(cats[k]);
    }
    return out;
}

size_t nameWidth(const ContingencyModel& model) {
    size_t w = 12;
    for (const auto& v : model.variables()) w = std::max(w, v.name.size() + 2);
    return w;
}
} // namespace

std::string TerminalUI::relationLabel(const ContingencyModel& model, const std::vector<size_t>& predictors, size_t response) {
    std::string out = "(";
    for (size_t k = 0; k < predictors.size(); ++k) {
        if (k > 0) out += ", ";
        out += model.axisName(predictors[k]);
    }
    return out + ") -> " + model.axisName(response);
}

void TerminalUI::printTableSummary(const ContingencyModel& model, std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, "CONTINGENCY TABLE");
    os << "Dimensions: " << model.dimensions() << " | Shape: (" << CommonUtils::joinSizes(model.shape(), " x ")
       << ") | Observations: " << model.total() << "\n";
    os << std::string(kRule.size(), '-') << "\n";
    const int w = static_cast<int>(nameWidth(model));
    os << std::left << std::setw(w) << "Variable" << std::setw(12) << "Categories" << "Marginal\n";
    for (size_t j = 0; j < model.dimensions(); ++j) {
        os << std::left << std::setw(w) << model.axisName(j) << std::setw(12) << model.shape()[j];
        const std::vector<double> p = model.marginal(j);
        for (size_t i = 0; i < p.size(); ++i) {
            os << (i ? " " : "") << std::fixed << std::setprecision(4) << p[i];
        }
        os << "\n";
    }
    os << kRule << "\n";
}

void TerminalUI::printScoreSummary(const ContingencyModel& model, std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, "CHECKERBOARD SCORES");
    CheckerboardScorer scorer(model);
    const int w = static_cast<int>(nameWidth(model));
    for (size_t j = 0; j < model.dimensions(); ++j) {
        os << std::left << std::setw(w) << model.axisName(j) << "scores:";
        for (const auto& s : scorer.scores(j)) {
            if (s) os << " " << std::fixed << std::setprecision(4) << *s;
            else os << " undefined";
        }
        os << " | variance: " << std::setprecision(6) << scorer.scoreVariance(j) << "\n";
    }
    os << kRule << "\n";
}

void TerminalUI::printPredictionTable(const ContingencyModel& model, const PredictionTable& table, std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, "CATEGORY PREDICTIONS " + relationLabel(model, table.predictors, table.response));
    const Variable& response = model.variable(table.response);

    std::string header;
    for (size_t k = 0; k < table.predictors.size(); ++k) {
        header += (k ? ", " : "") + model.axisName(table.predictors[k]);
    }
    const int w = static_cast<int>(std::max<size_t>(header.size() + 2, 16));
    os << std::left << std::setw(w) << header << std::setw(12) << "P(combo)" << std::setw(14) << "Regression"
       << "Predicted " << response.name << "\n";
    os << std::string(kRule.size(), '-') << "\n";

    for (const auto& row : table.rows) {
        os << std::left << std::setw(w) << combinationText(model, table.predictors, row.categories)
           << std::setw(12) << std::fixed << std::setprecision(4) << row.probability;
        if (row.regressionValue) os << std::setw(14) << std::setprecision(6) << *row.regressionValue;
        else os << std::setw(14) << "-";
        if (row.predictedCategory) os << response.categoryLabel(*row.predictedCategory);
        else os << "not predicted";
        os << "\n";
    }
    os << std::string(kRule.size(), '-') << "\n";
    os << "Under independence every combination predicts " << response.name << " = "
       << response.categoryLabel(table.independenceCategory) << "\n";
    os << kRule << "\n";
}

void TerminalUI::printAssociation(const ContingencyModel& model,
                                  const std::vector<size_t>& predictors,
                                  size_t response,
                                  double ccram,
                                  const std::string& sccramText,
                                  std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, "ASSOCIATION");
    os << std::left << std::setw(10) << "Relation" << relationLabel(model, predictors, response) << "\n"
       << std::setw(10) << "CCRAM" << std::fixed << std::setprecision(6) << ccram << "\n"
       << std::setw(10) << "SCCRAM" << sccramText << "\n";
    os << kRule << "\n";
}

void TerminalUI::printAssociationMatrix(const ContingencyModel& model, const AssociationMatrix& matrix, std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, matrix.scaled ? "SCCRAM MATRIX (row predicts column)" : "CCRAM MATRIX (row predicts column)");
    const int w = static_cast<int>(nameWidth(model));
    os << std::setw(w) << " ";
    for (size_t j = 0; j < model.dimensions(); ++j) os << std::right << std::setw(w) << model.axisName(j);
    os << "\n" << std::string(kRule.size(), '-') << "\n";
    for (size_t i = 0; i < model.dimensions(); ++i) {
        os << std::left << std::setw(w) << model.axisName(i) << std::right;
        for (size_t j = 0; j < model.dimensions(); ++j) {
            if (matrix.values[i][j]) os << std::setw(w) << std::fixed << std::setprecision(4) << *matrix.values[i][j];
            else os << std::setw(w) << "-";
        }
        os << "\n";
    }
    os << kRule << "\n";
}

void TerminalUI::printBootstrapResult(const std::string& label, const BootstrapResult& result, std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, "BOOTSTRAP " + label);
    const size_t ok = result.distribution.size();
    os << std::left << std::fixed << std::setprecision(6)
       << std::setw(22) << "Observed" << result.observed << "\n"
       << std::setw(22) << "Confidence interval" << "[" << result.ciLower << ", " << result.ciUpper << "] ("
       << std::setprecision(1) << 100.0 * result.confidenceLevel << "%, " << ciMethodName(result.method) << ")\n"
       << std::setprecision(6)
       << std::setw(22) << "Standard error" << result.standardError << "\n"
       << std::setw(22) << "Bias" << result.bias << "\n"
       << std::setw(22) << "Resamples" << ok << " used, " << result.failedResamples << " failed\n";
    os << kRule << "\n";
}

void TerminalUI::printPermutationResult(const std::string& label, const PermutationResult& result, std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, "PERMUTATION TEST " + label);
    double nullMean = 0.0;
    for (double v : result.distribution) nullMean += v;
    if (!result.distribution.empty()) nullMean /= static_cast<double>(result.distribution.size());

    os << std::left << std::fixed << std::setprecision(6)
       << std::setw(22) << "Observed" << result.observed << "\n"
       << std::setw(22) << "Null mean" << nullMean << "\n"
       << std::setw(22) << "p-value" << result.pValue << " (" << alternativeName(result.alternative) << ")"
       << (result.pValue < 0.05 ? " (*)" : "") << "\n"
       << std::setw(22) << "Permutations" << result.distribution.size() << " used, " << result.failedResamples
       << " failed\n";
    os << kRule << "\n";
}

void TerminalUI::printPredictionConfidence(const ContingencyModel& model,
                                           const std::vector<size_t>& predictors,
                                           size_t response,
                                           const PredictionConfidence& confidence,
                                           std::ostream& os) {
    const StreamStateGuard guard(os);
    banner(os, "PREDICTION CONFIDENCE " + relationLabel(model, predictors, response));
    const Variable& r = model.variable(response);
    std::string header;
    for (size_t k = 0; k < predictors.size(); ++k) header += (k ? ", " : "") + model.axisName(predictors[k]);
    const int w = static_cast<int>(std::max<size_t>(header.size() + 2, 16));

    os << std::left << std::setw(w) << header << std::right;
    for (size_t c = 0; c < r.categories; ++c) os << std::setw(10) << (r.name + "=" + r.categoryLabel(c));
    os << std::setw(10) << "none" << "\n";
    os << std::string(kRule.size(), '-') << "\n";
    for (size_t row = 0; row < confidence.matrix.size(); ++row) {
        os << std::left << std::setw(w) << combinationText(model, predictors, confidence.combinations[row]) << std::right;
        for (double cell : confidence.matrix[row]) {
            os << std::setw(9) << std::fixed << std::setprecision(1) << 100.0 * cell << "%";
        }
        os << std::setw(9) << 100.0 * confidence.notPredicted[row] << "%\n";
    }
    os << std::string(kRule.size(), '-') << "\n";
    os << confidence.resamples << " bootstrap resamples (" << confidence.failedResamples << " failed)\n";
    os << kRule << "\n";
}
