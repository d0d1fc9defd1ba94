/**
 * @file static_analyzer.hpp
 * @brief Per-language static analysis dispatch
 *
 * Aggregates the rule engine and whatever external analyzers the host
 * provides into one FindingSet. Every tool gets an entry: its raw
 * diagnostics, "No issues found", or "Tool not available". A missing or
 * failing tool never prevents the others from running.
 *
 * **Strategies**:
 * - PYTHON: conceptual rules, pylint, mypy
 * - C / CPP: conceptual rules, cppcheck, clang/clang++ -fsyntax-only,
 *   valgrind memcheck of a debug build
 * - JAVA / UNKNOWN: no static analysis (empty FindingSet)
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/analysis_types.hpp"
#include "codesmarty/core/tool_outcome.hpp"
#include "codesmarty/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

namespace codesmarty {
namespace analyzers {

/**
 * @class StaticAnalyzer
 * @brief Runs the static-analysis strategy of a resolved language
 *
 * **Thread Safety**: Analyze() may be called concurrently; each call
 * works on its own temporary files.
 *
 * **Usage Example**:
 * @code
 * utils::SystemCommandRunner runner;
 * StaticAnalyzer analyzer(runner);
 * auto findings = analyzer.Analyze(code, core::Language::C);
 * for (const auto& finding : findings.Entries()) {
 *     std::cout << finding.source << ": " << finding.report << std::endl;
 * }
 * @endcode
 */
class StaticAnalyzer {
public:
    /**
     * @struct Config
     * @brief Tool bounds
     */
    struct Config {
        std::chrono::seconds tool_timeout{60};       ///< Linters and compilers
        std::chrono::seconds valgrind_timeout{5};    ///< Memcheck run of the compiled binary
    };

    explicit StaticAnalyzer(utils::CommandRunner& runner);
    StaticAnalyzer(utils::CommandRunner& runner, Config config);

    /**
     * @brief Analyze @p code as @p language
     * @throws std::runtime_error only if temporary files cannot be created
     */
    core::FindingSet Analyze(const std::string& code, core::Language language);

private:
    core::FindingSet AnalyzePython(const std::string& code);
    core::FindingSet AnalyzeCFamily(const std::string& code, core::Language language);

    /// Run an external tool, Unavailable if it is not on PATH
    core::ToolOutcome<utils::CommandResult> RunTool(const std::vector<std::string>& argv,
                                                    std::chrono::milliseconds timeout,
                                                    const std::filesystem::path& working_dir = {});

    /// Compile with debug info and run the binary under valgrind
    std::string RunMemoryCheck(const std::filesystem::path& source, core::Language language);

    utils::CommandRunner& runner_;
    Config config_;
};

/**
 * @brief Conceptual-scan report: formatted matches, or the no-issues sentinel
 */
std::string ConceptualReport(const std::string& code, core::Language language);

} // namespace analyzers
} // namespace codesmarty
