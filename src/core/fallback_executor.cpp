/**
 * @file fallback_executor.cpp
 * @brief Static approximation of execution
 *
 * @date 2025
 */

#include "codesmarty/core/fallback_executor.hpp"
#include "codesmarty/analyzers/pattern_rules.hpp"
#include "codesmarty/utils/string_utils.hpp"
#include "codesmarty/utils/temp_resource.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace codesmarty {
namespace core {

using analyzers::PatternRuleEngine;
using analyzers::RuleMatch;
using utils::StringUtils;

namespace {

// Parses without compiling or executing; prints "line N: message" on error
constexpr const char* kAstCheckScript =
    "import ast, sys\n"
    "try:\n"
    "    ast.parse(open(sys.argv[1], encoding='utf-8').read(), 'main.py')\n"
    "except SyntaxError as e:\n"
    "    print('line %s: %s' % (e.lineno, e.msg))\n"
    "    sys.exit(1)\n";

constexpr int kSyntaxErrorExit = 1;

std::vector<std::string> FormatWarnings(const std::vector<RuleMatch>& matches) {
    std::vector<std::string> lines;
    for (const auto& match : matches) {
        lines.push_back("Warning (line " + std::to_string(match.line) + "): " + match.finding);
    }
    return lines;
}

ExecutionOutcome Simulated(std::vector<std::string> lines, bool success) {
    lines.insert(lines.begin(), kSimulatedLabel);

    ExecutionOutcome outcome;
    outcome.mode = ExecutionMode::FALLBACK_SIMULATED;
    outcome.output = StringUtils::Join(lines, "\n");
    outcome.success = success;
    return outcome;
}

ExecutionOutcome RuleSimulation(const std::string& code, const std::vector<analyzers::PatternRule>& rules,
                                const std::string& clean_message) {
    auto warnings = FormatWarnings(PatternRuleEngine::Apply(code, rules));
    bool clean = warnings.empty();
    if (clean) {
        warnings.push_back(clean_message);
    }
    return Simulated(std::move(warnings), clean);
}

} // anonymous namespace

FallbackExecutor::FallbackExecutor(utils::CommandRunner& runner, std::chrono::seconds syntax_check_timeout)
    : runner_(runner)
    , syntax_check_timeout_(syntax_check_timeout) {
}

ExecutionOutcome FallbackExecutor::Execute(const std::string& code, Language language) {
    spdlog::info("Fallback execution ({}): code will not be run", LanguageToString(language));

    switch (language) {
        case Language::PYTHON: {
            std::string method;
            auto problems = CheckPythonSyntax(code, method);
            auto warnings = FormatWarnings(
                PatternRuleEngine::Apply(code, PatternRuleEngine::PythonRuntimeRiskRules()));

            std::vector<std::string> lines;
            if (problems.empty()) {
                lines.push_back("Syntax check (" + method + "): no syntax errors found.");
            } else {
                for (const auto& problem : problems) {
                    lines.push_back("Syntax error (" + method + "): " + problem);
                }
            }
            lines.insert(lines.end(), warnings.begin(), warnings.end());
            return Simulated(std::move(lines), problems.empty() && warnings.empty());
        }

        case Language::C:
        case Language::CPP:
            return RuleSimulation(code, PatternRuleEngine::CFamilyRuntimeRiskRules(),
                                  "No runtime risks detected.");

        case Language::JAVA:
            return RuleSimulation(code, PatternRuleEngine::JavaNullSafetyRules(),
                                  "No null-safety issues detected.");

        case Language::UNKNOWN: {
            ExecutionOutcome outcome;
            outcome.mode = ExecutionMode::UNSUPPORTED;
            outcome.output = "Unsupported language";
            outcome.success = false;
            return outcome;
        }
    }

    ExecutionOutcome outcome;
    outcome.mode = ExecutionMode::UNSUPPORTED;
    outcome.output = "Unsupported language";
    return outcome;
}

// ============================================================================
// PYTHON SYNTAX CHECK
// ============================================================================

std::vector<std::string> FallbackExecutor::CheckPythonSyntax(const std::string& code, std::string& method) {
    if (runner_.IsAvailable("python3")) {
        utils::TempFile source(code, ".py");

        utils::CommandSpec spec;
        spec.argv = {"python3", "-c", kAstCheckScript, source.Path().string()};
        spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(syntax_check_timeout_);

        auto result = runner_.Run(spec);
        if (result.Succeeded()) {
            method = "python3 ast";
            return {};
        }
        if (result.launched && !result.timed_out && result.exit_code == kSyntaxErrorExit) {
            method = "python3 ast";
            auto message = StringUtils::Trim(result.output);
            return {message.empty() ? "invalid syntax" : message};
        }
        spdlog::warn("python3 syntax check unusable (exit {}), using balance check", result.exit_code);
    }

    method = "delimiter balance";
    return CheckDelimiterBalance(code);
}

std::vector<std::string> FallbackExecutor::CheckDelimiterBalance(const std::string& code) {
    std::vector<std::string> problems;
    std::vector<std::pair<char, int>> open;   // delimiter, line

    char quote = 0;          // active string quote, 0 = none
    bool triple = false;
    int string_line = 0;
    int line = 1;

    for (std::size_t i = 0; i < code.size(); ++i) {
        char c = code[i];

        if (quote != 0) {
            if (c == '\\') {
                if (i + 1 < code.size() && code[i + 1] == '\n') {
                    ++line;
                }
                ++i;
                continue;
            }
            if (c == '\n') {
                if (!triple) {
                    problems.push_back("Unterminated string literal at line " + std::to_string(string_line));
                    quote = 0;
                }
                ++line;
                continue;
            }
            if (c == quote) {
                if (!triple) {
                    quote = 0;
                } else if (i + 2 < code.size() && code[i + 1] == quote && code[i + 2] == quote) {
                    quote = 0;
                    i += 2;
                }
            }
            continue;
        }

        switch (c) {
            case '\n':
                ++line;
                break;
            case '#':
                while (i + 1 < code.size() && code[i + 1] != '\n') {
                    ++i;
                }
                break;
            case '\'':
            case '"':
                quote = c;
                string_line = line;
                triple = (i + 2 < code.size() && code[i + 1] == c && code[i + 2] == c);
                if (triple) {
                    i += 2;
                }
                break;
            case '(':
            case '[':
            case '{':
                open.emplace_back(c, line);
                break;
            case ')':
            case ']':
            case '}': {
                char expected = (c == ')') ? '(' : (c == ']') ? '[' : '{';
                if (open.empty() || open.back().first != expected) {
                    problems.push_back("Unmatched '" + std::string(1, c) + "' at line " + std::to_string(line));
                } else {
                    open.pop_back();
                }
                break;
            }
            default:
                break;
        }
    }

    if (quote != 0) {
        problems.push_back("Unterminated string literal at line " + std::to_string(string_line));
    }
    for (const auto& [delimiter, opened_at] : open) {
        problems.push_back("Unclosed '" + std::string(1, delimiter) + "' opened at line " +
                           std::to_string(opened_at));
    }
    return problems;
}

} // namespace core
} // namespace codesmarty
