/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "codesmarty/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace codesmarty {
namespace utils {

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream line_stream(str);

    while (std::getline(line_stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
}

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

std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

std::string StringUtils::ShellQuote(const std::string& str) {
    return "'" + ReplaceAll(str, "'", "'\\''") + "'";
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace codesmarty
