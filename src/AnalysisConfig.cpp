#include "AnalysisConfig.h"
#include "CcramExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Ccram::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Ccram::CcramException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Ccram::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        value, key, "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Ccram::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint64_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value[0] == '-') {
        throw Ccram::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value, key, "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    return static_cast<uint64_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        value, key, "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Ccram::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Ccram::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value) {
    const std::string v = CommonUtils::toLower(value);
    if (v == "tab" || v == "\\t") return '\t';
    if (v == "space" || v == "whitespace") return ' ';
    if (value.size() != 1) throw Ccram::ConfigurationException("delimiter expects a single character, 'tab' or 'space'");
    return value[0];
}

// "5,3" or "5x3"
std::vector<size_t> parseDimension(const std::string& value, const std::string& key) {
    std::string v = value;
    std::replace(v.begin(), v.end(), 'x', ',');
    std::replace(v.begin(), v.end(), 'X', ',');
    std::vector<size_t> out;
    for (const std::string& token : CommonUtils::splitList(v)) {
        out.push_back(static_cast<size_t>(parseIntStrict(token, key, 1)));
    }
    return out;
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') out.erase(lastNonSpace, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        else if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string stripBrackets(const std::string& value) {
    std::string v = CommonUtils::trim(value);
    if (v.size() >= 2 && v.front() == '[' && v.back() == ']') v = v.substr(1, v.size() - 2);
    return v;
}

// JSON-style lists arrive as [a, "b"]; strip the brackets and element quotes.
std::vector<std::string> parseList(const std::string& value) {
    std::vector<std::string> out;
    for (const std::string& token : CommonUtils::splitList(stripBrackets(value))) out.push_back(maybeUnquote(token));
    return out;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    while (!key.empty() && key[0] == '-') key.erase(0, 1);
    const std::string lowered = CommonUtils::toLower(key);
    // category.<variable>.<label> keeps the case of variable and label
    if (lowered.rfind("category.", 0) == 0) return "category." + key.substr(9);
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void addCategoryLabel(AnalysisConfig& config, const std::string& target, const std::string& code, const std::string& key) {
    const size_t dot = target.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= target.size()) {
        throw Ccram::ConfigurationException(key + " expects category.<variable>.<label>");
    }
    config.categoryMap[target.substr(0, dot)][target.substr(dot + 1)] =
        static_cast<size_t>(parseIntStrict(code, key, 1));
}

void assignKeyValue(AnalysisConfig& config, const std::string& key, const std::string& value) {
    if (key.rfind("category.", 0) == 0) {
        addCategoryLabel(config, key.substr(9), value, key);
    } else if (key == "input" || key == "data" || key == "dataset") {
        config.inputPath = value;
    } else if (key == "form" || key == "data_form") {
        config.dataForm = dataFormName(parseDataForm(value));
    } else if (key == "dimension" || key == "shape") {
        config.dimension = parseDimension(stripBrackets(value), key);
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value);
    } else if (key == "header" || key == "named") {
        config.header = parseBoolStrict(value, key);
    } else if (key == "names" || key == "variables" || key == "var_list") {
        config.variableNames = parseList(value);
    } else if (key == "response") {
        config.response = value;
    } else if (key == "predictors") {
        config.predictors = parseList(value);
    } else if (key == "mode") {
        config.mode = CommonUtils::toLower(value);
    } else if (key == "scaled") {
        config.scaled = parseBoolStrict(value, key);
    } else if (key == "resamples" || key == "n_resamples") {
        config.resamples = static_cast<size_t>(parseIntStrict(value, key, 1));
    } else if (key == "confidence" || key == "confidence_level") {
        config.confidenceLevel = parseDoubleStrict(value, key, 0.0);
    } else if (key == "ci_method" || key == "method") {
        config.ciMethod = CommonUtils::toLower(value);
    } else if (key == "alternative") {
        config.alternative = CommonUtils::toLower(value);
        std::replace(config.alternative.begin(), config.alternative.end(), '_', '-');
    } else if (key == "parallel") {
        config.parallel = parseBoolStrict(value, key);
    } else if (key == "threads") {
        config.threads = parseIntStrict(value, key, 0);
    } else if (key == "seed" || key == "random_state") {
        config.seed = parseUIntStrict(value, key);
    } else if (key == "timeout" || key == "timeout_seconds") {
        config.timeoutSeconds = parseDoubleStrict(value, key, 0.0);
    } else if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
    } else {
        throw Ccram::ConfigurationException("Unknown option: " + key);
    }
}

bool isFlagWithoutValue(const std::string& key) {
    return key == "scaled" || key == "verbose" || key == "header" || key == "parallel";
}

size_t resolveAxisToken(const std::string& token, const ContingencyModel& model, const std::string& role) {
    const std::string t = CommonUtils::trim(token);
    for (size_t j = 0; j < model.dimensions(); ++j) {
        if (model.variable(j).name == t) return j;
    }
    if (!t.empty() && std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        const size_t position = static_cast<size_t>(std::stoul(t));
        if (position >= 1 && position <= model.dimensions()) return position - 1;
    }
    throw Ccram::InvalidAxisSpecException(role + " '" + t + "' is neither a variable name nor an axis in 1.." +
                                          std::to_string(model.dimensions()));
}
} // namespace

AnalysisConfig AnalysisConfig::fromFile(const std::string& configPath, const AnalysisConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Ccram::ConfigurationException("Could not open config file: " + configPath);

    AnalysisConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Ccram::CcramException& ex) {
            throw Ccram::ConfigurationException("Config parse error at line " + std::to_string(lineNo) + ": '" + line +
                                                "' -> " + ex.what());
        }
    }
    return config;
}

AnalysisConfig AnalysisConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Ccram::ConfigurationException(
            "Usage: ccram <data-file> [--config path] [--form table_form|case_form|frequency_form] "
            "[--dimension 5,3] [--delimiter ,|tab|space] [--header true|false] [--names a,b,c] "
            "[--category var.label=code] [--response axis] [--predictors a,b] "
            "[--mode summary|matrix|bootstrap|permutation|predictions|all] [--scaled] [--resamples N] "
            "[--confidence 0..1] [--ci-method percentile|basic|bca] [--alternative greater|less|two-sided] "
            "[--parallel true|false] [--threads N] [--seed N] [--timeout seconds] [--verbose]");
    }

    AnalysisConfig config;
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            config = fromFile(argv[i + 1], config);
            break;
        }
    }
    config.inputPath = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Ccram::ConfigurationException("Unexpected argument: " + arg);
        }
        const std::string key = normalizeConfigKey(arg);
        if (key == "config") {
            ++i;
            continue;
        }
        const bool hasValue = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
        if (!hasValue) {
            if (!isFlagWithoutValue(key)) throw Ccram::ConfigurationException(arg + " expects a value");
            assignKeyValue(config, key, "true");
            continue;
        }
        const std::string value = argv[++i];
        if (key == "category") {
            const size_t eq = value.find('=');
            if (eq == std::string::npos) throw Ccram::ConfigurationException("--category expects var.label=code");
            addCategoryLabel(config, value.substr(0, eq), value.substr(eq + 1), arg);
            continue;
        }
        assignKeyValue(config, key, value);
    }

    config.validate();
    return config;
}

void AnalysisConfig::validate() const {
    if (inputPath.empty()) {
        throw Ccram::ConfigurationException("input path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(mode, {"summary", "matrix", "bootstrap", "permutation", "predictions", "all"})) {
        throw Ccram::ConfigurationException("mode must be one of: summary, matrix, bootstrap, permutation, predictions, all");
    }
    if (!isIn(ciMethod, {"percentile", "basic", "bca"})) {
        throw Ccram::ConfigurationException("ci_method must be one of: percentile, basic, bca");
    }
    if (!isIn(alternative, {"greater", "less", "two-sided"})) {
        throw Ccram::ConfigurationException("alternative must be one of: greater, less, two-sided");
    }
    parseDataForm(dataForm);
    if (dimension.empty()) {
        throw Ccram::ConfigurationException("dimension is required (e.g. --dimension 5,3)");
    }
    if (!variableNames.empty() && variableNames.size() != dimension.size()) {
        throw Ccram::ConfigurationException(std::to_string(variableNames.size()) + " variable names for " +
                                            std::to_string(dimension.size()) + " dimensions");
    }
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0)) {
        throw Ccram::ConfigurationException("confidence_level must be in (0,1)");
    }
    if (resamples < 1) {
        throw Ccram::ConfigurationException("resamples must be >= 1");
    }
    if (mode != "matrix" && response.empty()) {
        throw Ccram::ConfigurationException("response is required for mode '" + mode + "'");
    }
}

LoadOptions AnalysisConfig::loadOptions() const {
    LoadOptions options;
    options.form = parseDataForm(dataForm);
    options.shape = dimension;
    options.variableNames = variableNames;
    options.categoryMap = categoryMap;
    options.header = header;
    options.delimiter = delimiter;
    return options;
}

ResamplingOptions AnalysisConfig::resamplingOptions() const {
    ResamplingOptions options;
    options.resamples = resamples;
    options.confidenceLevel = confidenceLevel;
    options.ciMethod = ciMethod == "bca" ? CiMethod::BCa : (ciMethod == "basic" ? CiMethod::Basic : CiMethod::Percentile);
    options.alternative = alternative == "less" ? Alternative::Less
                        : (alternative == "two-sided" ? Alternative::TwoSided : Alternative::Greater);
    options.scaled = scaled;
    options.parallel = parallel;
    options.threads = threads;
    options.seed = seed;
    options.timeoutSeconds = timeoutSeconds;
    options.verbose = verbose;
    return options;
}

size_t AnalysisConfig::resolveResponse(const ContingencyModel& model) const {
    return resolveAxisToken(response, model, "response");
}

std::vector<size_t> AnalysisConfig::resolvePredictors(const ContingencyModel& model) const {
    const size_t r = resolveResponse(model);
    std::vector<size_t> out;
    if (predictors.empty()) {
        for (size_t j = 0; j < model.dimensions(); ++j) {
            if (j != r) out.push_back(j);
        }
        return out;
    }
    for (const std::string& token : predictors) out.push_back(resolveAxisToken(token, model, "predictor"));
    return out;
}
