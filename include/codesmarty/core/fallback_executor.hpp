/**
 * @file fallback_executor.hpp
 * @brief Static approximation of execution when no container engine is usable
 *
 * The fallback never runs the submitted code. It reports what a run would
 * most likely have tripped over and labels the payload so no consumer can
 * mistake it for real output.
 *
 * **Per-Language Behavior**:
 * - PYTHON: syntax check (python3 ast.parse when available, otherwise a
 *   delimiter/quote balance check) plus resource and shell-call warnings
 * - C / CPP: runtime-risk subset of the conceptual rules
 * - JAVA: null-safety anti-patterns
 * - UNKNOWN: "Unsupported language" (mode unsupported)
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/analysis_types.hpp"
#include "codesmarty/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <chrono>

namespace codesmarty {
namespace core {

/**
 * @class FallbackExecutor
 * @brief Produces fallback-simulated ExecutionOutcomes
 */
class FallbackExecutor {
public:
    explicit FallbackExecutor(utils::CommandRunner& runner,
                              std::chrono::seconds syntax_check_timeout = std::chrono::seconds(60));

    /**
     * @brief Simulate execution of @p code
     *
     * The payload always starts with kSimulatedLabel (except for UNKNOWN).
     */
    ExecutionOutcome Execute(const std::string& code, Language language);

    /**
     * @brief Unbalanced (), [], {} and unterminated string literals
     *
     * Understands '#' comments and single/triple-quoted strings.
     * @return One message per problem, empty when balanced
     */
    static std::vector<std::string> CheckDelimiterBalance(const std::string& code);

private:
    /// Syntax problems of a Python submission (empty when none)
    std::vector<std::string> CheckPythonSyntax(const std::string& code, std::string& method);

    utils::CommandRunner& runner_;
    std::chrono::seconds syntax_check_timeout_;
};

} // namespace core
} // namespace codesmarty
