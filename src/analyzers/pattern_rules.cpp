/**
 * @file pattern_rules.cpp
 * @brief Rule tables and the line-oriented rule engine
 *
 * Patterns are matched against single lines so that no regex ever walks
 * a whole file; std::regex backtracks recursively and long inputs would
 * exhaust the stack.
 *
 * @date 2025
 */

#include "codesmarty/analyzers/pattern_rules.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <regex>
#include <algorithm>

namespace codesmarty {
namespace analyzers {

using core::Language;
using utils::StringUtils;

namespace {

constexpr const char* kScalarDeclaration =
    R"(\b(?:int|float|double|char|long|short|unsigned)\s+(\w+)\s*;)";
constexpr const char* kReleaseStatement =
    R"(\bfree\s*\(\s*(\w+)\s*\)|\bdelete\b\s*(?:\[\s*\]\s*)?(\w+)\s*;)";
constexpr const char* kArrayDeclaration =
    R"(\b(?:int|char|float|double|long|short|unsigned|bool|size_t)\s+(\w+)\s*\[\s*(\d+)\s*\])";
constexpr const char* kIndexedAccess = R"(\b(\w+)\s*\[\s*(\d+)\s*\])";
constexpr const char* kTypeBeforeName =
    R"(\b(?:int|char|float|double|long|short|unsigned|bool|size_t)\s*$)";

// ============================================================================
// REGEX CACHE
// ============================================================================
// Only rule-table and fixed structural patterns are cached. Patterns built
// from identifiers in submitted code are compiled per check and discarded.

std::mutex g_cache_mutex;
std::map<std::string, std::regex> g_cache;

const std::regex& Compiled(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(g_cache_mutex);
    auto it = g_cache.find(pattern);
    if (it == g_cache.end()) {
        it = g_cache.emplace(pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::optimize)).first;
    }
    return it->second;
}

/// 1-based number of the first line matching @p pattern, or 0
int FirstMatchingLine(const std::vector<std::string>& lines, const std::string& pattern) {
    const auto& re = Compiled(pattern);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (std::regex_search(lines[i], re)) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

// ============================================================================
// STRUCTURAL CHECKS
// ============================================================================

std::optional<RuleMatch> CheckPatterns(const PatternRule& rule, const std::vector<std::string>& lines) {
    if (rule.patterns.empty()) {
        return std::nullopt;
    }

    int first_line = 0;
    for (const auto& pattern : rule.patterns) {
        int line = FirstMatchingLine(lines, pattern);
        if (line == 0) {
            return std::nullopt;
        }
        if (first_line == 0) {
            first_line = line;
        }
    }

    if (!rule.absent_pattern.empty() && FirstMatchingLine(lines, rule.absent_pattern) != 0) {
        return std::nullopt;
    }

    return RuleMatch{rule.rule_id, rule.finding, first_line};
}

/// Text following a declaration, up to the first non-blank line
std::string NextStatementText(const std::vector<std::string>& lines, std::size_t line_index,
                              std::size_t column) {
    std::string rest = lines[line_index].substr(column);
    for (std::size_t i = line_index + 1; StringUtils::Trim(rest).empty() && i < lines.size(); ++i) {
        rest = lines[i];
    }
    return rest;
}

std::optional<RuleMatch> CheckUninitializedScalar(const PatternRule& rule,
                                                  const std::vector<std::string>& lines) {
    const auto& declaration = Compiled(kScalarDeclaration);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        for (std::sregex_iterator it(lines[i].begin(), lines[i].end(), declaration), end; it != end; ++it) {
            const std::string name = (*it)[1].str();
            std::size_t column = static_cast<std::size_t>(it->position(0) + it->length(0));
            std::string next = NextStatementText(lines, i, column);

            const std::regex assignment(R"(^\s*)" + name + R"(\s*=[^=])");
            if (!std::regex_search(next, assignment)) {
                return RuleMatch{rule.rule_id, rule.finding + ": '" + name + "'", static_cast<int>(i) + 1};
            }
        }
    }
    return std::nullopt;
}

std::optional<RuleMatch> CheckUseAfterFree(const PatternRule& rule, const std::vector<std::string>& lines) {
    const auto& release = Compiled(kReleaseStatement);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        for (std::sregex_iterator it(lines[i].begin(), lines[i].end(), release), end; it != end; ++it) {
            const std::string name = (*it)[1].matched ? (*it)[1].str() : (*it)[2].str();
            const std::regex use(R"(\*\s*)" + name + R"(\b|\b)" + name +
                                 R"(\s*(->|\[)|[(,]\s*)" + name + R"(\s*[,)])");
            const std::regex reassignment(R"(\b)" + name + R"(\s*=[^=])");

            std::size_t column = static_cast<std::size_t>(it->position(0) + it->length(0));
            for (std::size_t j = i; j < lines.size(); ++j) {
                std::string text = (j == i) ? lines[j].substr(column) : lines[j];
                if (j != i && StringUtils::StartsWith(text, "}")) {
                    break;  // end of the enclosing function
                }
                if (std::regex_search(text, reassignment)) {
                    break;
                }
                if (std::regex_search(text, use)) {
                    return RuleMatch{rule.rule_id, rule.finding + ": '" + name + "'", static_cast<int>(j) + 1};
                }
            }
        }
    }
    return std::nullopt;
}

std::optional<RuleMatch> CheckLiteralIndexBounds(const PatternRule& rule,
                                                 const std::vector<std::string>& lines) {
    // Pass 1: constant array sizes
    std::map<std::string, unsigned long long> sizes;
    const auto& declaration = Compiled(kArrayDeclaration);
    for (const auto& line : lines) {
        for (std::sregex_iterator it(line.begin(), line.end(), declaration), end; it != end; ++it) {
            std::string digits = (*it)[2].str();
            if (digits.size() <= 18) {
                sizes[(*it)[1].str()] = std::stoull(digits);
            }
        }
    }
    if (sizes.empty()) {
        return std::nullopt;
    }

    // Pass 2: constant indices that are not the declarations themselves
    const auto& access = Compiled(kIndexedAccess);
    const auto& type_before = Compiled(kTypeBeforeName);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        for (std::sregex_iterator it(line.begin(), line.end(), access), end; it != end; ++it) {
            auto size = sizes.find((*it)[1].str());
            if (size == sizes.end()) {
                continue;
            }
            std::string prefix = line.substr(0, static_cast<std::size_t>(it->position(0)));
            if (std::regex_search(prefix, type_before)) {
                continue;
            }
            std::string digits = (*it)[2].str();
            bool out_of_bounds = digits.size() > 18 || std::stoull(digits) >= size->second;
            if (out_of_bounds) {
                return RuleMatch{rule.rule_id,
                                 rule.finding + ": '" + it->str(0) + "' on array of size " +
                                     std::to_string(size->second),
                                 static_cast<int>(i) + 1};
            }
        }
    }
    return std::nullopt;
}

std::optional<RuleMatch> Evaluate(const PatternRule& rule, const std::vector<std::string>& lines) {
    switch (rule.check) {
        case RuleCheck::PATTERN: return CheckPatterns(rule, lines);
        case RuleCheck::UNINITIALIZED_SCALAR: return CheckUninitializedScalar(rule, lines);
        case RuleCheck::USE_AFTER_FREE: return CheckUseAfterFree(rule, lines);
        case RuleCheck::LITERAL_INDEX_BOUNDS: return CheckLiteralIndexBounds(rule, lines);
    }
    return std::nullopt;
}

// ============================================================================
// TABLE CONSTRUCTION
// ============================================================================

PatternRule Signature(const std::string& id, const std::string& pattern) {
    PatternRule rule;
    rule.rule_id = id;
    rule.finding = "Signature " + id;
    rule.patterns = {pattern};
    return rule;
}

std::vector<PatternRule> BuildPythonDetection() {
    return {
        Signature("PY_DEF", R"(^\s*def\s+\w+\s*\(.*\)\s*(->.*)?:)"),
        Signature("PY_FROM_IMPORT", R"(^\s*from\s+[\w.]+\s+import\s+)"),
        Signature("PY_IMPORT", R"(^\s*import\s+[\w.]+\s*(as\s+\w+\s*)?$)"),
        Signature("PY_CLASS", R"(^\s*class\s+\w+\s*(\(.*\))?\s*:\s*$)"),
        Signature("PY_PRINT", R"(^\s*print\s*\()"),
        Signature("PY_MAIN_GUARD", R"(__name__\s*==\s*['"]__main__['"])"),
        Signature("PY_CONTROL", R"(^\s*(elif|except|with)\b.*:\s*$)"),
        Signature("PY_SELF", R"(\bself\.\w+)"),
    };
}

std::vector<PatternRule> BuildJavaDetection() {
    return {
        Signature("JAVA_CLASS", R"(\bpublic\s+(final\s+|abstract\s+)?(class|interface|enum)\s+\w+)"),
        Signature("JAVA_MAIN", R"(public\s+static\s+void\s+main\s*\(\s*String)"),
        Signature("JAVA_PRINTLN", R"(\bSystem\.(out|err)\.print)"),
        Signature("JAVA_IMPORT", R"(^\s*import\s+java(x)?\.[\w.*]+\s*;)"),
        Signature("JAVA_PACKAGE", R"(^\s*package\s+[\w.]+\s*;)"),
    };
}

std::vector<PatternRule> BuildCppDetection() {
    return {
        Signature("CPP_STD_HEADER",
                  R"(#\s*include\s*<(iostream|vector|string|map|memory|algorithm|unordered_map|sstream|fstream)>)"),
        Signature("CPP_STD_NAMESPACE", R"(\bstd::\w+)"),
        Signature("CPP_USING_NAMESPACE", R"(\busing\s+namespace\s+\w+\s*;)"),
        Signature("CPP_STREAMS", R"(\b(cout|cerr)\s*<<|\bcin\s*>>)"),
        Signature("CPP_TEMPLATE", R"(\btemplate\s*<)"),
        Signature("CPP_CLASS", R"(^\s*class\s+\w+\s*(:\s*(public|private|protected)\s+\w+\s*)?\{?\s*$)"),
    };
}

std::vector<PatternRule> BuildCDetection() {
    return {
        Signature("C_HEADER", R"(#\s*include\s*<\w+\.h>)"),
        Signature("C_PRINTF", R"(\b(printf|scanf|fprintf)\s*\()"),
        Signature("C_MAIN", R"(\bint\s+main\s*\()"),
        Signature("C_ALLOC", R"(\b(malloc|calloc|realloc)\s*\()"),
    };
}

std::vector<PatternRule> BuildCFamilyConceptual() {
    std::vector<PatternRule> rules;

    // Rule: NULL assignment followed by a dereference
    {
        PatternRule rule;
        rule.rule_id = "C_NULL_DEREFERENCE";
        rule.finding = "Potential NULL pointer dereference detected";
        rule.patterns = {R"(\w+\s*=\s*(NULL|nullptr)\s*;)", R"(\*\w+\s*=|\w+\s*->)"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: heap allocation without a release
    {
        PatternRule rule;
        rule.rule_id = "C_MEMORY_LEAK";
        rule.finding = "Potential memory leak - malloc used without corresponding free";
        rule.patterns = {R"(\b(malloc|calloc)\s*\()"};
        rule.absent_pattern = R"(\bfree\s*\()";
        rules.push_back(rule);
    }

    // Rule: new without delete or a smart pointer
    {
        PatternRule rule;
        rule.rule_id = "CPP_NEW_WITHOUT_DELETE";
        rule.finding = "Potential memory leak - new used without corresponding delete";
        rule.patterns = {R"(\bnew\s+\w+)"};
        rule.absent_pattern = R"(\bdelete\b|_ptr\s*<)";
        rules.push_back(rule);
    }

    // Rule: scalar declared without initialization
    {
        PatternRule rule;
        rule.rule_id = "C_UNINITIALIZED_VARIABLE";
        rule.finding = "Potentially uninitialized variable";
        rule.check = RuleCheck::UNINITIALIZED_SCALAR;
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: unbounded string copy/concatenation
    {
        PatternRule rule;
        rule.rule_id = "C_UNSAFE_STRING_COPY";
        rule.finding = "Potential buffer overflow risk - using strcpy/strcat without bounds checking";
        rule.patterns = {R"(\b(strcpy|strcat)\s*\(\s*\w+\s*,)"};
        rule.absent_pattern = R"(\bstrn(cpy|cat)\b)";
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: gets() cannot be bounded at all
    {
        PatternRule rule;
        rule.rule_id = "C_GETS";
        rule.finding = "Use of gets() - input length is unbounded, use fgets() instead";
        rule.patterns = {R"(\bgets\s*\()"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: for loop without a condition
    {
        PatternRule rule;
        rule.rule_id = "C_INFINITE_LOOP";
        rule.finding = "Potential infinite loop - missing loop condition";
        rule.patterns = {R"(\bfor\s*\(\s*.*;\s*;)"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: pointer used after it was released
    {
        PatternRule rule;
        rule.rule_id = "C_USE_AFTER_FREE";
        rule.finding = "Potential use after free of pointer";
        rule.check = RuleCheck::USE_AFTER_FREE;
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: constant index past a constant-sized array
    {
        PatternRule rule;
        rule.rule_id = "C_INDEX_OUT_OF_BOUNDS";
        rule.finding = "Array index out of bounds";
        rule.check = RuleCheck::LITERAL_INDEX_BOUNDS;
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    return rules;
}

std::vector<PatternRule> BuildPythonConceptual() {
    std::vector<PatternRule> rules;

    // Rule: open() outside a with-block and never closed
    {
        PatternRule rule;
        rule.rule_id = "PY_UNCLOSED_FILE";
        rule.finding = "File opened without a 'with' block or close() - the handle may leak";
        rule.patterns = {R"(^(?!\s*with\b).*(^|[^\w.])open\s*\()"};
        rule.absent_pattern = R"(\.close\s*\(\s*\))";
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: bare except
    {
        PatternRule rule;
        rule.rule_id = "PY_BARE_EXCEPT";
        rule.finding = "Bare 'except:' catches SystemExit and KeyboardInterrupt - catch specific exceptions";
        rule.patterns = {R"(^\s*except\s*:)"};
        rules.push_back(rule);
    }

    // Rule: mutable default argument
    {
        PatternRule rule;
        rule.rule_id = "PY_MUTABLE_DEFAULT";
        rule.finding = "Mutable default argument - the default is shared between calls";
        rule.patterns = {R"(^\s*def\s+\w+\s*\(.*=\s*(\[\s*\]|\{\s*\}|set\(\s*\)|list\(\s*\)|dict\(\s*\)))"};
        rules.push_back(rule);
    }

    // Rule: dynamic code evaluation
    {
        PatternRule rule;
        rule.rule_id = "PY_EVAL_EXEC";
        rule.finding = "Use of eval()/exec() - executing dynamic code is unsafe";
        rule.patterns = {R"((^|[^\w.])(eval|exec)\s*\()"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: shell command execution
    {
        PatternRule rule;
        rule.rule_id = "PY_UNSAFE_SYSTEM_CALL";
        rule.finding = "Unsafe system call - os.system() or shell=True allows command injection";
        rule.patterns = {R"(\bos\.(system|popen)\s*\(|\bshell\s*=\s*True\b)"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    return rules;
}

std::vector<PatternRule> BuildJavaNullSafety() {
    std::vector<PatternRule> rules;

    // Rule: null assignment and a method call in the same unit
    {
        PatternRule rule;
        rule.rule_id = "JAVA_NULL_DEREFERENCE";
        rule.finding = "Variable assigned null may be dereferenced - check for null before use";
        rule.patterns = {R"(\b\w+\s*=\s*null\s*;)", R"(\b[a-z]\w*\.\w+\s*\()"};
        rule.absent_pattern = R"(!=\s*null|null\s*!=|Objects\.requireNonNull|Optional\.)";
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: equals() invoked on a variable with a literal argument
    {
        PatternRule rule;
        rule.rule_id = "JAVA_EQUALS_ON_VARIABLE";
        rule.finding = "equals() called on a possibly null variable - prefer \"literal\".equals(variable)";
        rule.patterns = {R"(\b[a-z]\w*\.equals\s*\(\s*")"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: Map.get() result dereferenced directly
    {
        PatternRule rule;
        rule.rule_id = "JAVA_UNCHECKED_GET";
        rule.finding = "Result of get() dereferenced without a null check";
        rule.patterns = {R"(\.get\s*\([^()]+\)\s*\.\w+\s*\()"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    // Rule: returning null
    {
        PatternRule rule;
        rule.rule_id = "JAVA_RETURN_NULL";
        rule.finding = "Method returns null - callers may dereference it, consider Optional";
        rule.patterns = {R"(\breturn\s+null\s*;)"};
        rule.runtime_risk = true;
        rules.push_back(rule);
    }

    return rules;
}

std::vector<PatternRule> RuntimeRiskSubset(const std::vector<PatternRule>& rules) {
    std::vector<PatternRule> subset;
    std::copy_if(rules.begin(), rules.end(), std::back_inserter(subset),
                 [](const PatternRule& rule) { return rule.runtime_risk; });
    return subset;
}

} // anonymous namespace

// ============================================================================
// RULE APPLICATION
// ============================================================================

std::vector<RuleMatch> PatternRuleEngine::Apply(const std::string& code,
                                                const std::vector<PatternRule>& rules) {
    std::vector<RuleMatch> matches;
    auto lines = StringUtils::SplitLines(code);

    for (const auto& rule : rules) {
        if (auto match = Evaluate(rule, lines)) {
            spdlog::debug("Rule {} matched at line {}", rule.rule_id, match->line);
            matches.push_back(std::move(*match));
        }
    }
    return matches;
}

std::optional<RuleMatch> PatternRuleEngine::FirstMatch(const std::string& code,
                                                       const std::vector<PatternRule>& rules) {
    auto lines = StringUtils::SplitLines(code);
    for (const auto& rule : rules) {
        if (auto match = Evaluate(rule, lines)) {
            return match;
        }
    }
    return std::nullopt;
}

std::string PatternRuleEngine::FormatMatches(const std::vector<RuleMatch>& matches) {
    std::vector<std::string> lines;
    lines.reserve(matches.size());
    for (const auto& match : matches) {
        lines.push_back("Line " + std::to_string(match.line) + ": " + match.finding);
    }
    return StringUtils::Join(lines, "\n");
}

std::size_t PatternRuleEngine::CompiledPatternCount() {
    std::lock_guard<std::mutex> lock(g_cache_mutex);
    return g_cache.size();
}

// ============================================================================
// RULE TABLES
// ============================================================================

const std::vector<PatternRule>& PatternRuleEngine::DetectionRules(Language language) {
    static const std::vector<PatternRule> python = BuildPythonDetection();
    static const std::vector<PatternRule> java = BuildJavaDetection();
    static const std::vector<PatternRule> cpp = BuildCppDetection();
    static const std::vector<PatternRule> c = BuildCDetection();
    static const std::vector<PatternRule> none;

    switch (language) {
        case Language::PYTHON: return python;
        case Language::JAVA: return java;
        case Language::CPP: return cpp;
        case Language::C: return c;
        case Language::UNKNOWN: return none;
    }
    return none;
}

const std::vector<Language>& PatternRuleEngine::DetectionOrder() {
    static const std::vector<Language> order = {
        Language::PYTHON, Language::JAVA, Language::CPP, Language::C
    };
    return order;
}

const std::vector<PatternRule>& PatternRuleEngine::CFamilyConceptualRules() {
    static const std::vector<PatternRule> rules = BuildCFamilyConceptual();
    return rules;
}

const std::vector<PatternRule>& PatternRuleEngine::CFamilyRuntimeRiskRules() {
    static const std::vector<PatternRule> rules = RuntimeRiskSubset(CFamilyConceptualRules());
    return rules;
}

const std::vector<PatternRule>& PatternRuleEngine::PythonConceptualRules() {
    static const std::vector<PatternRule> rules = BuildPythonConceptual();
    return rules;
}

const std::vector<PatternRule>& PatternRuleEngine::PythonRuntimeRiskRules() {
    static const std::vector<PatternRule> rules = RuntimeRiskSubset(PythonConceptualRules());
    return rules;
}

const std::vector<PatternRule>& PatternRuleEngine::JavaNullSafetyRules() {
    static const std::vector<PatternRule> rules = BuildJavaNullSafety();
    return rules;
}

} // namespace analyzers
} // namespace codesmarty
