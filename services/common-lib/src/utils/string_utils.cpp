/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "fiscid/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace fiscid {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    // All whitespace
    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool isBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string removeChars(const std::string& str, const std::string& chars) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (chars.find(c) == std::string::npos) {
            result += c;
        }
    }
    return result;
}

} // namespace utils
} // namespace fiscid
