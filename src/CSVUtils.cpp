#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    static const unsigned char kBom[] = {0xEF, 0xBB, 0xBF};

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3) return;
    is.clear(is.rdstate() & ~std::ios::eofbit);
    while (matched-- > 0) is.unget();
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    const bool blankSeparated = delimiter == ' ';
    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawData = false;
    char c;

    auto pushField = [&]() {
        std::string field = fieldQuoted ? val : trimUnquotedField(val);
        if (!(blankSeparated && field.empty() && !fieldQuoted)) row.push_back(std::move(field));
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (c == '"') {
            if (!inQuotes && trimUnquotedField(val).empty()) {
                val.clear();
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                val += c;
            }
            sawData = true;
        } else if (inQuotes) {
            if (c == '\r' && is.peek() == '\n') is.get();
            val += (c == '\r') ? '\n' : c;
        } else if (c == delimiter || (blankSeparated && c == '\t')) {
            pushField();
            sawData = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            val += c;
            if (c != ' ' && c != '\t') sawData = true;
        }
    }

    if (inQuotes && malformed) *malformed = true;
    if (!sawData) return {};
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);

        const std::string original = out[i];
        if (seen.count(out[i]) > 0) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix)) > 0) ++suffix;
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}
}
