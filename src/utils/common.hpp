#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace codeteam::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string Trim(const std::string& value, const std::string& chars = " \t\r\n") {
    const auto first = value.find_first_not_of(chars);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(chars);
    return value.substr(first, last - first + 1);
}

inline bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

// Splits on a literal separator, keeping empty pieces.
inline std::vector<std::string> Split(const std::string& value, const std::string& separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = value.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(value.substr(start));
            break;
        }
        parts.push_back(value.substr(start, pos - start));
        start = pos + separator.size();
    }
    return parts;
}

inline std::vector<std::string> SplitLines(const std::string& value) {
    std::vector<std::string> lines;
    std::istringstream stream(value);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

}  // namespace codeteam::utils
