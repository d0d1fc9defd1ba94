/**
 * @file json_reporter.hpp
 * @brief Wire-format serialization of analysis results
 *
 * **Single Result**:
 * ```json
 * {
 *   "language": "python",
 *   "issues": { "conceptual_errors": "...", "pylint": "...", "mypy": "..." },
 *   "runtime": "...",
 *   "suggestions": "...",
 *   "metadata": { "submission_id": "...", "execution_mode": "sandboxed", ... }
 * }
 * ```
 *
 * **Repository Result**: `{ "<relative path>": <single result> | {"error": "..."} }`
 *
 * `issues` keeps FindingSet order.
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/analysis_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <filesystem>

namespace codesmarty {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Output options
 */
struct JsonReporterConfig {
    bool pretty_print{true};                               ///< Indent output
    int indent_size{2};                                    ///< Spaces per level
    bool include_metadata{true};                           ///< Add the "metadata" object
    std::filesystem::path output_directory{"./reports"};   ///< Where report files go
};

/**
 * @class JsonReporter
 * @brief Serializes AnalysisResult / RepositoryResult and writes report files
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::string body = reporter.GenerateJsonString(result);      // HTTP response
 * auto path = reporter.GenerateReport(result);                 // CLI report file
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    nlohmann::ordered_json ToJson(const core::AnalysisResult& result) const;
    nlohmann::ordered_json ToJson(const core::RepositoryResult& result) const;

    std::string GenerateJsonString(const core::AnalysisResult& result) const;
    std::string GenerateJsonString(const core::RepositoryResult& result) const;

    /**
     * @brief Save a single-result report as `<id>_<timestamp>.json`
     * @return Path of the written file, or an empty path on failure
     */
    std::filesystem::path GenerateReport(const core::AnalysisResult& result) const;

    /**
     * @brief Save a repository report as `repo_<id>_<timestamp>.json`
     * @param reference Repository reference (hashed into the file name)
     * @return Path of the written file, or an empty path on failure
     */
    std::filesystem::path GenerateReport(const core::RepositoryResult& result,
                                         const std::string& reference) const;

private:
    std::string Dump(const nlohmann::ordered_json& j) const;
    std::filesystem::path SaveJson(const std::string& content, const std::string& stem) const;

    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace codesmarty
