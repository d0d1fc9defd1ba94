/**
 * @file suggestion_synthesizer.cpp
 * @brief Remediation report from findings and runtime output
 *
 * @date 2025
 */

#include "codesmarty/analyzers/suggestion_synthesizer.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace codesmarty {
namespace analyzers {

using core::Language;
using utils::StringUtils;

namespace {

constexpr std::size_t kPromptCodeLimit = 12000;
constexpr std::size_t kPromptRuntimeLimit = 4000;

/// Tools whose output the fallback report quotes, per language
std::vector<std::string> LanguageTools(Language language) {
    switch (language) {
        case Language::PYTHON: return {"pylint", "mypy"};
        case Language::C: return {"cppcheck", "clang", "valgrind"};
        case Language::CPP: return {"cppcheck", "clang++", "valgrind"};
        case Language::JAVA: return {};
        case Language::UNKNOWN: return {};
    }
    return {};
}

std::string LanguageDisplayName(Language language) {
    switch (language) {
        case Language::PYTHON: return "Python";
        case Language::JAVA: return "Java";
        case Language::C: return "C";
        case Language::CPP: return "C++";
        case Language::UNKNOWN: return "source";
    }
    return "source";
}

std::string LanguageRecommendation(Language language) {
    switch (language) {
        case Language::PYTHON:
            return "- Use context managers for files and sockets, and catch specific exceptions.";
        case Language::JAVA:
            return "- Check values that can be null before dereferencing them, or use Optional.";
        case Language::C:
            return "- Pair every allocation with a free and bound every buffer write.";
        case Language::CPP:
            return "- Prefer RAII types and standard containers over manual new/delete and raw arrays.";
        case Language::UNKNOWN:
            return "- Make sure the code is written in a supported language.";
    }
    return "";
}

bool RuntimeNeedsAttention(const core::ExecutionOutcome& runtime) {
    return !runtime.success ||
           StringUtils::ContainsIgnoreCase(runtime.output, "error") ||
           StringUtils::ContainsIgnoreCase(runtime.output, "warning") ||
           StringUtils::ContainsIgnoreCase(runtime.output, "exception");
}

} // anonymous namespace

SuggestionSynthesizer::SuggestionSynthesizer(clients::GenerativeBackend& backend, int max_output_tokens)
    : backend_(backend)
    , max_output_tokens_(max_output_tokens) {
}

core::SuggestionReport SuggestionSynthesizer::Synthesize(const std::string& code,
                                                         const core::FindingSet& findings,
                                                         const core::ExecutionOutcome& runtime,
                                                         Language language) const {
    clients::GenerationRequest request;
    request.prompt = BuildPrompt(code, findings, runtime, language);
    request.max_output_tokens = max_output_tokens_;

    auto generated = clients::GenerateOrFail(backend_, request);
    if (generated.IsOk() && !StringUtils::Trim(generated.Value()).empty()) {
        spdlog::info("Suggestions generated ({} chars)", generated.Value().size());
        return {generated.Value(), core::Provenance::GENERATED};
    }

    spdlog::warn("Suggestion backend failed ({}), using fallback template",
                 generated.IsOk() ? "empty reply" : generated.Reason());
    return {BuildFallbackReport(findings, runtime, language), core::Provenance::FALLBACK_TEMPLATE};
}

// ============================================================================
// PROMPT
// ============================================================================

std::string SuggestionSynthesizer::BuildPrompt(const std::string& code,
                                               const core::FindingSet& findings,
                                               const core::ExecutionOutcome& runtime,
                                               Language language) {
    const std::string name = LanguageDisplayName(language);

    std::ostringstream prompt;
    prompt << "You are an expert " << name << " code reviewer. Analyze the following "
           << name << " code together with the static-analysis findings and the runtime output.\n\n";

    prompt << "Code:\n```" << LanguageToString(language) << "\n"
           << StringUtils::Truncate(code, kPromptCodeLimit, "\n...") << "\n```\n\n";

    prompt << "Static analysis findings:\n";
    if (findings.Empty()) {
        prompt << "(static analysis not available for this language)\n";
    }
    for (const auto& finding : findings.Entries()) {
        prompt << "[" << finding.source << "]\n" << finding.report << "\n";
    }

    prompt << "\nRuntime output (" << core::ExecutionModeToString(runtime.mode) << "):\n"
           << StringUtils::Truncate(runtime.output, kPromptRuntimeLimit, "\n...") << "\n\n";

    prompt << "Write a report with exactly these four sections:\n"
           << "1. Conceptual Issues: logical and resource-safety problems\n"
           << "2. Complexity Analysis: time and space complexity of the main logic\n"
           << "3. Suggested Improvements: concrete fixes, with corrected code where useful\n"
           << "4. Best Practices Evaluation: how well the code follows " << name << " conventions\n";

    return prompt.str();
}

// ============================================================================
// FALLBACK TEMPLATE
// ============================================================================

std::string SuggestionSynthesizer::BuildFallbackReport(const core::FindingSet& findings,
                                                       const core::ExecutionOutcome& runtime,
                                                       Language language) {
    std::ostringstream report;
    report << "# Code Analysis Report\n";
    report << "Automated suggestions are unavailable; this report was assembled from the analysis results.\n";

    auto conceptual = findings.Get(core::kConceptualErrorsKey);
    if (conceptual && !StringUtils::Trim(*conceptual).empty() && *conceptual != core::kNoConceptualIssues) {
        report << "\n## Conceptual Issues\n" << *conceptual << "\n";
    }

    if (RuntimeNeedsAttention(runtime)) {
        report << "\n## Runtime Issues\n" << StringUtils::Trim(runtime.output) << "\n";
    }

    bool tools_header = false;
    for (const auto& tool : LanguageTools(language)) {
        auto output = findings.Get(tool);
        if (!output || *output == core::kNoIssuesFound) {
            continue;
        }
        if (!tools_header) {
            report << "\n## Tool Findings\n";
            tools_header = true;
        }
        report << "### " << tool << "\n" << *output << "\n";
    }

    report << "\n## General Recommendations\n"
           << "- Fix the issues listed above, starting with those that can crash the program.\n"
           << "- Validate all external input before using it.\n"
           << "- Handle error return values and exceptions explicitly.\n"
           << "- Keep functions small and give variables descriptive names.\n"
           << "- Add tests that cover edge cases and failure paths.\n"
           << LanguageRecommendation(language) << "\n";

    return report.str();
}

} // namespace analyzers
} // namespace codesmarty
