#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace cronkeeper::utils {

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

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto first = std::find_if(value.begin(), value.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
    const auto last = std::find_if(value.rbegin(), value.rend(), [](unsigned char c) {
        return !std::isspace(c);
    }).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

inline std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> parts;
    std::istringstream stream(value);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

inline bool ParseBool(const std::string& value, bool fallback = false) {
    if (value.empty()) {
        return fallback;
    }
    const auto lowered = ToLower(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "y" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "n" || lowered == "off") {
        return false;
    }
    return fallback;
}

inline long long SystemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace cronkeeper::utils
