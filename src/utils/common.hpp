#pragma once

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pyexec::utils {

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

inline std::string Trim(const std::string& value) {
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

inline std::string TrimRight(const std::string& value) {
    std::size_t end = value.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(0, end);
}

// Accepts an optional sign followed by decimal digits only; anything else is rejected.
inline bool ParseStrictInt(const std::string& value, int& out) {
    const auto trimmed = Trim(value);
    if (trimmed.empty()) {
        return false;
    }
    std::size_t pos = 0;
    if (trimmed[0] == '-' || trimmed[0] == '+') {
        pos = 1;
    }
    if (pos == trimmed.size()) {
        return false;
    }
    for (std::size_t i = pos; i < trimmed.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            return false;
        }
    }
    try {
        out = std::stoi(trimmed);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

}  // namespace pyexec::utils
