#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Splits on `sep`, trimming tokens and dropping empty ones.
inline std::vector<std::string> splitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(std::move(t));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(std::move(t));
    return out;
}

inline std::string joinSizes(const std::vector<size_t>& values, std::string_view sep = ",") {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out.append(sep);
        out += std::to_string(values[i]);
    }
    return out;
}

} // namespace CommonUtils
