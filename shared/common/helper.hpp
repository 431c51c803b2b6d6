#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

inline std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

inline std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

// "a, b,,c" -> {"a", "b", "c"}
inline std::vector<std::string> splitList(const std::string& value, char separator = ',') {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (start <= value.size()) {
        auto pos = value.find(separator, start);
        if (pos == std::string::npos) pos = value.size();
        auto item = trim(value.substr(start, pos - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = pos + 1;
    }
    return out;
}
