#include "codesmarty/analyzers/suggestion_synthesizer.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace codesmarty::analyzers;
using namespace codesmarty::core;
using codesmarty::test_support::FakeGenerativeBackend;

namespace {

FindingSet CFindings() {
    FindingSet findings;
    findings.Set(kConceptualErrorsKey, "Line 3: Potential memory leak - malloc used without corresponding free");
    findings.Set("cppcheck", "main.c:3: error: Memory leak: p [memleak]");
    findings.Set("clang", kNoIssuesFound);
    findings.Set("valgrind", kToolNotAvailable);
    return findings;
}

ExecutionOutcome CleanRun() {
    ExecutionOutcome outcome;
    outcome.mode = ExecutionMode::SANDBOXED;
    outcome.output = "done\n";
    outcome.success = true;
    outcome.exit_code = 0;
    return outcome;
}

} // namespace

TEST(SuggestionSynthesizerTest, GeneratedReportIsUsedVerbatim) {
    FakeGenerativeBackend backend;
    backend.Queue(ToolOutcome<std::string>::Ok("## Conceptual Issues\nNone."));
    SuggestionSynthesizer synthesizer(backend);

    auto report = synthesizer.Synthesize("int main() {}", CFindings(), CleanRun(), Language::C);
    EXPECT_EQ(report.provenance, Provenance::GENERATED);
    EXPECT_EQ(report.text, "## Conceptual Issues\nNone.");
}

TEST(SuggestionSynthesizerTest, PromptCarriesFindingsAndRequestedSections) {
    FakeGenerativeBackend backend;
    SuggestionSynthesizer synthesizer(backend);
    synthesizer.Synthesize("int main() {}", CFindings(), CleanRun(), Language::C);

    ASSERT_EQ(backend.Prompts().size(), 1u);
    const auto& prompt = backend.Prompts()[0];
    for (const auto* expected : {"int main() {}", "[cppcheck]", "Memory leak: p", "done",
                                 "Conceptual Issues", "Complexity Analysis",
                                 "Suggested Improvements", "Best Practices Evaluation"}) {
        EXPECT_NE(prompt.find(expected), std::string::npos) << expected;
    }
}

TEST(SuggestionSynthesizerTest, BackendFailureUsesFallbackTemplate) {
    FakeGenerativeBackend backend;
    backend.SetDefault(ToolOutcome<std::string>::Failed("HTTP 503"));
    SuggestionSynthesizer synthesizer(backend);

    auto report = synthesizer.Synthesize("int main() {}", CFindings(), CleanRun(), Language::C);
    EXPECT_EQ(report.provenance, Provenance::FALLBACK_TEMPLATE);
    EXPECT_EQ(report.text, SuggestionSynthesizer::BuildFallbackReport(CFindings(), CleanRun(), Language::C));
}

TEST(SuggestionSynthesizerTest, BlankReplyUsesFallbackTemplate) {
    FakeGenerativeBackend backend;
    backend.Queue(ToolOutcome<std::string>::Ok("  \n"));
    SuggestionSynthesizer synthesizer(backend);

    auto report = synthesizer.Synthesize("x", FindingSet{}, CleanRun(), Language::JAVA);
    EXPECT_EQ(report.provenance, Provenance::FALLBACK_TEMPLATE);
    EXPECT_FALSE(report.text.empty());
}

TEST(SuggestionSynthesizerTest, FallbackSectionsFollowTheFindings) {
    auto text = SuggestionSynthesizer::BuildFallbackReport(CFindings(), CleanRun(), Language::C);

    EXPECT_EQ(text.rfind("# Code Analysis Report\n", 0), 0u);
    EXPECT_NE(text.find("## Conceptual Issues\nLine 3: Potential memory leak"), std::string::npos);
    EXPECT_EQ(text.find("## Runtime Issues"), std::string::npos);
    EXPECT_NE(text.find("### cppcheck\nmain.c:3: error: Memory leak"), std::string::npos);
    EXPECT_EQ(text.find("### clang\n"), std::string::npos);
    EXPECT_NE(text.find("## General Recommendations"), std::string::npos);
}

TEST(SuggestionSynthesizerTest, FallbackReportsFailedRuns) {
    ExecutionOutcome failed;
    failed.mode = ExecutionMode::SANDBOXED;
    failed.output = "Traceback (most recent call last):\nZeroDivisionError: division by zero\n";
    failed.exit_code = 1;
    failed.success = false;

    FindingSet findings;
    findings.Set(kConceptualErrorsKey, kNoConceptualIssues);

    auto text = SuggestionSynthesizer::BuildFallbackReport(findings, failed, Language::PYTHON);
    EXPECT_EQ(text.find("## Conceptual Issues"), std::string::npos);
    EXPECT_NE(text.find("## Runtime Issues\nTraceback"), std::string::npos);
}

TEST(SuggestionSynthesizerTest, FallbackIsByteIdenticalForIdenticalInput) {
    EXPECT_EQ(SuggestionSynthesizer::BuildFallbackReport(CFindings(), CleanRun(), Language::C),
              SuggestionSynthesizer::BuildFallbackReport(CFindings(), CleanRun(), Language::C));
}

TEST(SuggestionSynthesizerTest, NonUtf8SourceGetsTemplateReport) {
    FakeGenerativeBackend backend;
    backend.EncodePromptsStrictly();
    backend.Queue(ToolOutcome<std::string>::Ok("should not be used"));
    SuggestionSynthesizer synthesizer(backend);

    const std::string latin1 = "/* (c) J\xfcrgen */\nint main() { return 0; }\n";
    SuggestionReport report;
    EXPECT_NO_THROW(report = synthesizer.Synthesize(latin1, CFindings(), CleanRun(), Language::C));
    EXPECT_EQ(report.provenance, Provenance::FALLBACK_TEMPLATE);
    EXPECT_EQ(report.text, SuggestionSynthesizer::BuildFallbackReport(CFindings(), CleanRun(), Language::C));
}
