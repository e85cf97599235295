#include "AnalysisConfig.h"
#include "CcramExceptions.h"
#include "CopulaRegression.h"
#include "ResamplingDriver.h"
#include "TableLoader.h"
#include "TerminalUI.h"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace {
void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <data-file> [options]\n"
              << "Options:\n"
              << "  --config <path>                   Load options from a key: value file (flags override it)\n"
              << "  --form <table_form|case_form|frequency_form>  Layout of the data file (default: table_form)\n"
              << "  --dimension <5,3>                 Categories per variable (required)\n"
              << "  --delimiter <char|tab|space>      Field separator (default: ,)\n"
              << "  --header <true/false>             First row holds variable names (default: false)\n"
              << "  --names <a,b,c>                   Variable names\n"
              << "  --category <var.label=code>       Map a category label to its 1-based code (repeatable)\n"
              << "  --response <axis>                 Response variable: name or 1-based position\n"
              << "  --predictors <a,b>                Predictor variables (default: every other axis)\n"
              << "  --mode <summary|matrix|bootstrap|permutation|predictions|all>  (default: summary)\n"
              << "  --scaled                          Use SCCRAM for resampling modes\n"
              << "  --resamples <N>                   Bootstrap/permutation resamples (default: 9999)\n"
              << "  --confidence <0..1>               Confidence level (default: 0.95)\n"
              << "  --ci-method <percentile|basic|bca>  Bootstrap interval (default: percentile)\n"
              << "  --alternative <greater|less|two-sided>  Permutation alternative (default: greater)\n"
              << "  --parallel <true/false>           Run resamples on a worker pool (default: true)\n"
              << "  --threads <N>                     Worker count, 0 = all cores (default: 0)\n"
              << "  --seed <N>                        Random seed (default: 8990)\n"
              << "  --timeout <seconds>               Abort resampling after this long, 0 = never\n"
              << "  --verbose                         Enable detailed logs\n"
              << "  --help                            Show this help message\n";
}

bool wants(const AnalysisConfig& config, const std::string& mode) {
    return config.mode == mode || config.mode == "all";
}

void runSummary(const ContingencyModel& model, const std::vector<size_t>& predictors, size_t response) {
    const PredictionTable table = CopulaRegressionEngine::predictionTable(model, predictors, response);
    TerminalUI::printPredictionTable(model, table, std::cout);

    const double ccram = CopulaRegressionEngine::calculateCCRAM(model, predictors, response, false);
    std::string sccramText;
    try {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(6) << CopulaRegressionEngine::calculateSCCRAM(model, predictors, response);
        sccramText = ss.str();
    } catch (const Ccram::DivisionByZeroException& e) {
        std::cerr << "[Ccram][Warning] " << e.what() << "\n";
        sccramText = "undefined (single-category response)";
    }
    TerminalUI::printAssociation(model, predictors, response, ccram, sccramText, std::cout);
}
} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
    }

    AnalysisConfig config;
    try {
        config = AnalysisConfig::fromArgs(argc, argv);
    } catch (const Ccram::CcramException& e) {
        std::cerr << "[Ccram Error] " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        if (config.verbose) {
            std::cout << "[Ccram][Load] Reading " << config.inputPath << " as " << config.dataForm << "...\n";
        }
        const ContingencyModel model = TableLoader::loadFile(config.inputPath, config.loadOptions());
        TerminalUI::printTableSummary(model, std::cout);
        if (config.verbose) TerminalUI::printScoreSummary(model, std::cout);

        if (wants(config, "matrix")) {
            TerminalUI::printAssociationMatrix(model, CopulaRegressionEngine::associationMatrix(model, false), std::cout);
            TerminalUI::printAssociationMatrix(model, CopulaRegressionEngine::associationMatrix(model, true), std::cout);
            if (config.mode == "matrix") return 0;
        }

        const size_t response = config.resolveResponse(model);
        const std::vector<size_t> predictors = config.resolvePredictors(model);
        const ResamplingOptions options = config.resamplingOptions();
        const std::string measure = options.scaled ? "SCCRAM" : "CCRAM";
        const std::string label = measure + " " + TerminalUI::relationLabel(model, predictors, response);

        if (wants(config, "summary")) {
            runSummary(model, predictors, response);
        }
        if (wants(config, "bootstrap")) {
            std::cout << "[Ccram][Bootstrap] " << options.resamples << " resamples of " << label << "...\n";
            const BootstrapResult result = ResamplingDriver::bootstrapCCRAM(model, predictors, response, options);
            TerminalUI::printBootstrapResult(label, result, std::cout);
        }
        if (wants(config, "permutation")) {
            std::cout << "[Ccram][Permutation] " << options.resamples << " permutations of " << label << "...\n";
            const PermutationResult result = ResamplingDriver::permutationTestCCRAM(model, predictors, response, options);
            TerminalUI::printPermutationResult(label, result, std::cout);
        }
        if (wants(config, "predictions")) {
            std::cout << "[Ccram][Predictions] " << options.resamples << " bootstrap resamples of category predictions...\n";
            const PredictionConfidence confidence = ResamplingDriver::bootstrapPredictions(model, predictors, response, options);
            TerminalUI::printPredictionConfidence(model, predictors, response, confidence, std::cout);
        }
    } catch (const Ccram::CcramException& e) {
        std::cerr << "[Ccram Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Ccram Exception] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
