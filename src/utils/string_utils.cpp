/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "renju/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace renju {
namespace utils {

// Trim whitespace from both ends
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Split by any whitespace
std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// Truncate with suffix
std::string StringUtils::Truncate(const std::string& str, std::size_t max_length,
                                  const std::string& suffix) {
    if (str.size() <= max_length) {
        return str;
    }
    return str.substr(0, max_length) + suffix;
}

} // namespace utils
} // namespace renju
