#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Delimited-text tokenization for count and case files. No type inference here.
std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one record, honoring double-quoted fields (with "" escapes) that may span lines.
 * @details Unquoted fields are trimmed. When the delimiter is a space, runs of blanks separate
 *          fields and empty fields are dropped. A blank line yields an empty record.
 * @post *malformed is set when the record ends inside an open quote.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

// Fills empty names with column_<n> and suffixes duplicates with _2, _3, ...
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
