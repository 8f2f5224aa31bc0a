#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace string_utils {

inline std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

inline std::string trim_ascii_whitespace_copy(const std::string& input) {
    const size_t begin = input.find_first_not_of(" \t\n\r\f\v");
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = input.find_last_not_of(" \t\n\r\f\v");
    return input.substr(begin, end - begin + 1);
}

inline bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// Splits on every occurrence of delimiter. An empty delimiter splits into
// single characters.
inline std::vector<std::string> split(const std::string& text, const std::string& delimiter) {
    std::vector<std::string> parts;
    if (delimiter.empty()) {
        for (char c : text) {
            parts.emplace_back(1, c);
        }
        return parts;
    }

    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    return parts;
}

inline std::string replace_all(const std::string& text, const std::string& search,
                               const std::string& replacement) {
    if (search.empty()) {
        return text;
    }
    std::string result;
    result.reserve(text.size());
    size_t start = 0;
    size_t pos;
    while ((pos = text.find(search, start)) != std::string::npos) {
        result.append(text, start, pos - start);
        result += replacement;
        start = pos + search.size();
    }
    result.append(text, start, std::string::npos);
    return result;
}

// Trimmed, non-empty lines.
inline std::vector<std::string> split_statement_lines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& raw : split(text, "\n")) {
        std::string line = trim_ascii_whitespace_copy(raw);
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

}  // namespace string_utils
