/**
 * @file static_analyzer.cpp
 * @brief Per-language static analysis dispatch
 *
 * @date 2025
 */

#include "codesmarty/analyzers/static_analyzer.hpp"
#include "codesmarty/analyzers/pattern_rules.hpp"
#include "codesmarty/utils/string_utils.hpp"
#include "codesmarty/utils/temp_resource.hpp"

#include <spdlog/spdlog.h>

namespace codesmarty {
namespace analyzers {

using core::FindingSet;
using core::Language;
using core::ToolOutcome;
using utils::CommandResult;
using utils::StringUtils;

namespace {

constexpr const char* kCompiledBinary = "a.out";

/// Map a tool outcome to its FindingSet report
std::string ToolReport(const ToolOutcome<CommandResult>& outcome, const std::filesystem::path& scratch) {
    switch (outcome.Kind()) {
        case core::OutcomeKind::UNAVAILABLE:
            return core::kToolNotAvailable;
        case core::OutcomeKind::FAILED:
            return "Tool failed: " + outcome.Reason();
        case core::OutcomeKind::OK:
            break;
    }

    const auto& result = outcome.Value();
    // Diagnostics mention the scratch directory; report bare file names
    std::string output = StringUtils::Trim(
        StringUtils::ReplaceAll(result.output, scratch.string() + "/", ""));

    if (result.timed_out) {
        return "Timed out after " + std::to_string(result.duration.count()) + " ms" +
               (output.empty() ? "" : "\n" + output);
    }
    if (output.empty()) {
        return result.exit_code == 0 ? core::kNoIssuesFound
                                     : "Exited with code " + std::to_string(result.exit_code);
    }
    return output;
}

} // anonymous namespace

std::string ConceptualReport(const std::string& code, Language language) {
    std::vector<RuleMatch> matches;
    switch (language) {
        case Language::PYTHON:
            matches = PatternRuleEngine::Apply(code, PatternRuleEngine::PythonConceptualRules());
            break;
        case Language::C:
        case Language::CPP:
            matches = PatternRuleEngine::Apply(code, PatternRuleEngine::CFamilyConceptualRules());
            break;
        case Language::JAVA:
            matches = PatternRuleEngine::Apply(code, PatternRuleEngine::JavaNullSafetyRules());
            break;
        case Language::UNKNOWN:
            break;
    }

    if (matches.empty()) {
        return core::kNoConceptualIssues;
    }
    return PatternRuleEngine::FormatMatches(matches);
}

StaticAnalyzer::StaticAnalyzer(utils::CommandRunner& runner)
    : StaticAnalyzer(runner, Config{}) {
}

StaticAnalyzer::StaticAnalyzer(utils::CommandRunner& runner, Config config)
    : runner_(runner), config_(config) {
}

// ============================================================================
// DISPATCH
// ============================================================================

FindingSet StaticAnalyzer::Analyze(const std::string& code, Language language) {
    spdlog::info("Static analysis ({})", core::LanguageToString(language));

    FindingSet findings;
    switch (language) {
        case Language::PYTHON:
            findings = AnalyzePython(code);
            break;
        case Language::C:
        case Language::CPP:
            findings = AnalyzeCFamily(code, language);
            break;
        case Language::JAVA:
        case Language::UNKNOWN:
            spdlog::info("Static analysis not supported for {}", core::LanguageToString(language));
            break;
    }

    spdlog::info("Static analysis produced {} report(s)", findings.Size());
    return findings;
}

// ============================================================================
// PYTHON
// ============================================================================

FindingSet StaticAnalyzer::AnalyzePython(const std::string& code) {
    FindingSet findings;
    findings.Set(core::kConceptualErrorsKey, ConceptualReport(code, Language::PYTHON));

    utils::TempDirectory scratch("codesmarty_lint_");
    auto source = scratch.WriteFile("main.py", code);
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.tool_timeout);

    // Linter
    auto pylint = RunTool({"pylint", "--output-format=text", "--score=n", "--reports=n",
                           source.string()}, timeout, scratch.Path());
    findings.Set("pylint", ToolReport(pylint, scratch.Path()));

    // Type checker
    auto mypy = RunTool({"mypy", "--ignore-missing-imports", "--no-error-summary",
                         "--no-incremental", "--cache-dir=/dev/null", source.string()},
                        timeout, scratch.Path());
    findings.Set("mypy", ToolReport(mypy, scratch.Path()));

    return findings;
}

// ============================================================================
// C / C++
// ============================================================================

FindingSet StaticAnalyzer::AnalyzeCFamily(const std::string& code, Language language) {
    const bool is_cpp = (language == Language::CPP);

    FindingSet findings;

    // Layer 1: conceptual rules
    findings.Set(core::kConceptualErrorsKey, ConceptualReport(code, language));

    utils::TempDirectory scratch("codesmarty_lint_");
    auto source = scratch.WriteFile(is_cpp ? "main.cpp" : "main.c", code);
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.tool_timeout);

    // Layer 2: cppcheck
    auto cppcheck = RunTool({"cppcheck",
                             "--enable=warning,style,performance,portability",
                             "--inconclusive",
                             "--quiet",
                             is_cpp ? "--language=c++" : "--language=c",
                             "--template={file}:{line}: {severity}: {message} [{id}]",
                             source.string()}, timeout, scratch.Path());
    findings.Set("cppcheck", ToolReport(cppcheck, scratch.Path()));

    // Layer 3: clang syntax check
    const std::string clang = is_cpp ? "clang++" : "clang";
    std::vector<std::string> clang_argv = {clang, "-fsyntax-only", "-Wall", "-Wextra"};
    if (is_cpp) {
        clang_argv.push_back("-std=c++17");
    }
    clang_argv.push_back(source.string());
    auto syntax = RunTool(clang_argv, timeout, scratch.Path());
    findings.Set(clang, ToolReport(syntax, scratch.Path()));

    // Layer 4: valgrind
    findings.Set("valgrind", RunMemoryCheck(source, language));

    return findings;
}

std::string StaticAnalyzer::RunMemoryCheck(const std::filesystem::path& source, Language language) {
    if (utils::IsWindowsHost() || !runner_.IsAvailable("valgrind")) {
        return core::kToolNotAvailable;
    }

    const bool is_cpp = (language == Language::CPP);
    const std::string compiler = is_cpp ? "g++" : "gcc";
    const auto work_dir = source.parent_path();
    const auto binary = work_dir / kCompiledBinary;
    auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.tool_timeout);

    std::vector<std::string> compile_argv = {compiler, "-g", "-O0"};
    if (is_cpp) {
        compile_argv.push_back("-std=c++17");
    }
    compile_argv.insert(compile_argv.end(), {"-o", binary.string(), source.string()});

    auto build = RunTool(compile_argv, timeout, work_dir);
    if (!build.IsOk()) {
        spdlog::warn("Memory check skipped: {} {}", compiler,
                     build.IsUnavailable() ? "not available" : build.Reason());
        return core::kToolNotAvailable;
    }
    if (!build.Value().Succeeded()) {
        return "Compilation failed, memory check skipped:\n" + ToolReport(build, work_dir);
    }

    auto memcheck = RunTool({"valgrind",
                             "--leak-check=full",
                             "--show-leak-kinds=all",
                             "--track-origins=yes",
                             "--error-exitcode=1",
                             binary.string()},
                            std::chrono::duration_cast<std::chrono::milliseconds>(config_.valgrind_timeout),
                            work_dir);
    return ToolReport(memcheck, work_dir);
}

// ============================================================================
// TOOL EXECUTION
// ============================================================================

ToolOutcome<CommandResult> StaticAnalyzer::RunTool(const std::vector<std::string>& argv,
                                                   std::chrono::milliseconds timeout,
                                                   const std::filesystem::path& working_dir) {
    if (!runner_.IsAvailable(argv.front())) {
        spdlog::warn("{} not available on this host", argv.front());
        return ToolOutcome<CommandResult>::Unavailable(argv.front() + " not found on PATH");
    }

    utils::CommandSpec spec;
    spec.argv = argv;
    spec.timeout = timeout;
    spec.working_directory = working_dir;

    auto result = runner_.Run(spec);
    if (!result.launched) {
        spdlog::warn("{} could not be launched: {}", argv.front(), result.error);
        return ToolOutcome<CommandResult>::Failed(result.error);
    }

    spdlog::debug("{} finished with code {}", argv.front(), result.exit_code);
    return ToolOutcome<CommandResult>::Ok(std::move(result));
}

} // namespace analyzers
} // namespace codesmarty
