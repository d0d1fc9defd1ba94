/**
 * @file string_utils.hpp
 * @brief String helpers shared by the analyzers, executors and reporters
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace codesmarty {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto lines = StringUtils::SplitLines(code);
 * auto answer = StringUtils::ToLower(StringUtils::Trim(raw_answer));
 * std::string cmd = "cd /code && " + StringUtils::ShellQuote(file_name);
 * @endcode
 */
class StringUtils {
public:
    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split by delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split into lines, keeping empty lines and dropping '\r'
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /// Case-insensitive substring search
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Quote a word for POSIX sh (single quotes, embedded quotes escaped)
     */
    static std::string ShellQuote(const std::string& str);

    /**
     * @brief Truncate to @p max_length characters, appending @p suffix when cut
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace codesmarty
