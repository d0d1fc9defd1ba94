/**
 * @file pattern_rules.hpp
 * @brief Data-driven regex rule tables for detection and conceptual scanning
 *
 * One engine serves two consumers: the language detector asks which table
 * has any match, the static analyzer and the fallback executor collect
 * every match of a conceptual table. Rules are plain data; the engine only
 * knows how to apply them.
 *
 * **Matching Model**:
 * - Patterns are ECMAScript regexes applied line by line
 * - A rule fires when every entry of `patterns` matches some line and
 *   `absent_pattern` (if set) matches no line
 * - A few rules need more than regexes (use after free, literal index out
 *   of bounds, uninitialized scalars); they name a RuleCheck instead
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/language.hpp"

#include <cstddef>
#include <string>
#include <vector>
#include <optional>

namespace codesmarty {
namespace analyzers {

/**
 * @enum RuleCheck
 * @brief How a rule is evaluated
 */
enum class RuleCheck {
    PATTERN,                ///< Regex presence/absence
    UNINITIALIZED_SCALAR,   ///< Declared scalar not assigned by the next statement
    USE_AFTER_FREE,         ///< Pointer used after free()/delete
    LITERAL_INDEX_BOUNDS    ///< Constant index >= declared constant array size
};

/**
 * @struct PatternRule
 * @brief One entry of a rule table
 */
struct PatternRule {
    std::string rule_id;                     ///< Stable identifier (e.g. "C_MEMORY_LEAK")
    std::string finding;                     ///< Message reported on match
    std::vector<std::string> patterns;       ///< All must match some line
    std::string absent_pattern;              ///< Rule suppressed if this matches any line
    RuleCheck check{RuleCheck::PATTERN};     ///< Evaluation strategy
    bool runtime_risk{false};                ///< Part of the fallback executor's subset
};

/**
 * @struct RuleMatch
 * @brief A rule that fired, with the first line that triggered it
 */
struct RuleMatch {
    std::string rule_id;
    std::string finding;
    int line{0};   ///< 1-based line number
};

/**
 * @class PatternRuleEngine
 * @brief Stateless rule application over the built-in tables
 *
 * **Usage Example**:
 * @code
 * auto matches = PatternRuleEngine::Apply(code, PatternRuleEngine::CFamilyConceptualRules());
 * std::string report = PatternRuleEngine::FormatMatches(matches);
 * @endcode
 *
 * **Thread Safety**: All methods are thread-safe; tables are immutable
 * after first use.
 */
class PatternRuleEngine {
public:
    // ========================================================================
    // Rule Application
    // ========================================================================

    /**
     * @brief Evaluate every rule and collect those that fire, in table order
     */
    static std::vector<RuleMatch> Apply(const std::string& code,
                                        const std::vector<PatternRule>& rules);

    /**
     * @brief First rule (in table order) that fires
     */
    static std::optional<RuleMatch> FirstMatch(const std::string& code,
                                               const std::vector<PatternRule>& rules);

    /**
     * @brief "Line N: finding" per match, newline separated
     */
    static std::string FormatMatches(const std::vector<RuleMatch>& matches);

    /// Number of patterns held in the process-wide compiled-regex cache
    static std::size_t CompiledPatternCount();

    // ========================================================================
    // Rule Tables
    // ========================================================================

    /**
     * @brief Detection signatures for one language (empty for UNKNOWN)
     */
    static const std::vector<PatternRule>& DetectionRules(core::Language language);

    /// Languages in detection priority order: python, java, cpp, c
    static const std::vector<core::Language>& DetectionOrder();

    /// Null deref, leaks, uninitialized scalars, unsafe copies, loops, UAF, OOB
    static const std::vector<PatternRule>& CFamilyConceptualRules();

    /// Subset of the C/C++ table that predicts runtime failures
    static const std::vector<PatternRule>& CFamilyRuntimeRiskRules();

    /// Unclosed files, bare except, mutable defaults, eval/exec, shell calls
    static const std::vector<PatternRule>& PythonConceptualRules();

    /// Subset of the Python table reported by the fallback executor
    static const std::vector<PatternRule>& PythonRuntimeRiskRules();

    /// Java null-safety anti-patterns
    static const std::vector<PatternRule>& JavaNullSafetyRules();
};

} // namespace analyzers
} // namespace codesmarty
