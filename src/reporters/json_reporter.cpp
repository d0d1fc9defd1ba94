/**
 * @file json_reporter.cpp
 * @brief Wire-format serialization of analysis results
 *
 * @date 2025
 */

#include "codesmarty/reporters/json_reporter.hpp"
#include "codesmarty/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>

namespace codesmarty {
namespace reporters {

using json = nlohmann::ordered_json;

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

// ============================================================================
// SERIALIZATION
// ============================================================================

json JsonReporter::ToJson(const core::AnalysisResult& result) const {
    json j;
    j["language"] = core::LanguageToString(result.language);

    json issues = json::object();
    for (const auto& finding : result.findings.Entries()) {
        issues[finding.source] = finding.report;
    }
    j["issues"] = issues;

    j["runtime"] = result.runtime.output;
    j["suggestions"] = result.suggestions.text;

    if (config_.include_metadata) {
        j["metadata"] = {
            {"submission_id", result.submission_id},
            {"execution_mode", core::ExecutionModeToString(result.runtime.mode)},
            {"execution_success", result.runtime.success},
            {"exit_code", result.runtime.exit_code},
            {"timed_out", result.runtime.timed_out},
            {"suggestions_provenance", core::ProvenanceToString(result.suggestions.provenance)}
        };
    }
    return j;
}

json JsonReporter::ToJson(const core::RepositoryResult& result) const {
    json j = json::object();
    for (const auto& [path, analysis] : result) {
        if (analysis.IsError()) {
            j[path] = {{"error", analysis.error->message}};
        } else if (analysis.result) {
            j[path] = ToJson(*analysis.result);
        }
    }
    return j;
}

std::string JsonReporter::GenerateJsonString(const core::AnalysisResult& result) const {
    return Dump(ToJson(result));
}

std::string JsonReporter::GenerateJsonString(const core::RepositoryResult& result) const {
    return Dump(ToJson(result));
}

std::string JsonReporter::Dump(const json& j) const {
    // Tool output may carry invalid UTF-8; replace rather than throw
    return config_.pretty_print
        ? j.dump(config_.indent_size, ' ', false, json::error_handler_t::replace)
        : j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// REPORT FILES
// ============================================================================

std::filesystem::path JsonReporter::GenerateReport(const core::AnalysisResult& result) const {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("GENERATING JSON REPORT");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    return SaveJson(GenerateJsonString(result), utils::HashUtils::ShortId(result.submission_id));
}

std::filesystem::path JsonReporter::GenerateReport(const core::RepositoryResult& result,
                                                   const std::string& reference) const {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("GENERATING REPOSITORY JSON REPORT");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    return SaveJson(GenerateJsonString(result),
                    "repo_" + utils::HashUtils::ShortId(utils::HashUtils::ComputeSHA256(reference)));
}

std::filesystem::path JsonReporter::SaveJson(const std::string& content, const std::string& stem) const {
    try {
        if (!std::filesystem::exists(config_.output_directory)) {
            std::filesystem::create_directories(config_.output_directory);
        }

        auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        auto output_path = config_.output_directory / (stem + "_" + std::to_string(timestamp) + ".json");

        std::ofstream file(output_path);
        if (!file) {
            spdlog::error("Failed to open file for writing: {}", output_path.string());
            return {};
        }
        file << content;
        file.close();
        if (!file) {
            spdlog::error("Failed to write report: {}", output_path.string());
            return {};
        }

        spdlog::info("✓ Report saved: {}", output_path.string());
        return output_path;
    }
    catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to save JSON report: {}", e.what());
        return {};
    }
}

} // namespace reporters
} // namespace codesmarty
