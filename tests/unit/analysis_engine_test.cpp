#include "codesmarty/core/analysis_engine.hpp"
#include "codesmarty/core/errors.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace codesmarty::core;
using codesmarty::test_support::FakeCommandRunner;
using codesmarty::test_support::FakeGenerativeBackend;

namespace {

void WriteFile(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << contents;
}

class AnalysisEngineTest : public ::testing::Test {
protected:
    AnalysisEngineTest()
        : capabilities_([] { return false; })
        , engine_(config_, runner_, backend_, capabilities_) {
    }

    AppConfig config_;
    FakeCommandRunner runner_;
    FakeGenerativeBackend backend_;
    CapabilityContext capabilities_;
    AnalysisEngine engine_;
};

} // namespace

TEST_F(AnalysisEngineTest, PythonSnippetRunsTheWholePipeline) {
    auto result = engine_.AnalyzeCode("def hello():\n print('hi')");

    EXPECT_EQ(result.language, Language::PYTHON);
    EXPECT_EQ(*result.findings.Get(kConceptualErrorsKey), kNoConceptualIssues);
    EXPECT_EQ(*result.findings.Get("pylint"), kToolNotAvailable);
    EXPECT_EQ(result.runtime.mode, ExecutionMode::FALLBACK_SIMULATED);
    EXPECT_NE(result.runtime.output.find("no syntax errors found"), std::string::npos);
    EXPECT_TRUE(result.runtime.success);
    EXPECT_FALSE(result.suggestions.text.empty());
    EXPECT_EQ(result.suggestions.provenance, Provenance::FALLBACK_TEMPLATE);
    EXPECT_FALSE(result.submission_id.empty());
}

TEST_F(AnalysisEngineTest, LocalFileSubmissionKeepsItsPath) {
    CodeSubmission submission("def main():\n    print('cli')\n", SubmissionOrigin::LOCAL_FILE, "scripts/tool.py");
    EXPECT_EQ(SubmissionOriginToString(submission.Origin()), "file");

    auto result = engine_.AnalyzeSubmission(submission);
    EXPECT_EQ(result.origin_path, "scripts/tool.py");
    EXPECT_EQ(result.language, Language::PYTHON);
    EXPECT_EQ(result.submission_id, submission.Id());
}

TEST_F(AnalysisEngineTest, BlankCodeIsRejected) {
    EXPECT_THROW(engine_.AnalyzeCode(""), InputError);
    EXPECT_THROW(engine_.AnalyzeCode(" \n\t "), InputError);
    EXPECT_TRUE(backend_.Prompts().empty());
}

TEST_F(AnalysisEngineTest, UnknownLanguageIsRejected) {
    backend_.Queue(ToolOutcome<std::string>::Ok("unknown"));
    EXPECT_THROW(engine_.AnalyzeCode("lorem ipsum"), InputError);
}

TEST_F(AnalysisEngineTest, GeneratedSuggestionsAreKept) {
    backend_.Queue(ToolOutcome<std::string>::Ok("c"));
    backend_.Queue(ToolOutcome<std::string>::Ok("## Conceptual Issues\nLeak."));

    auto result = engine_.AnalyzeCode("int main() {\n    char *p = malloc(4);\n    return 0;\n}\n");
    EXPECT_EQ(result.language, Language::C);
    EXPECT_EQ(result.findings.Size(), 4u);
    EXPECT_EQ(result.suggestions.provenance, Provenance::GENERATED);
    EXPECT_EQ(result.suggestions.text, "## Conceptual Issues\nLeak.");
}

TEST_F(AnalysisEngineTest, Latin1SourceStillProducesAResult) {
    backend_.EncodePromptsStrictly();

    const std::string code = "#include <stdio.h>\n/* (c) J\xfcrgen */\nint main() { printf(\"x\"); return 0; }\n";
    AnalysisResult result;
    EXPECT_NO_THROW(result = engine_.AnalyzeCode(code));
    EXPECT_EQ(result.language, Language::C);
    EXPECT_EQ(result.suggestions.provenance, Provenance::FALLBACK_TEMPLATE);
    EXPECT_FALSE(result.suggestions.text.empty());
}

TEST_F(AnalysisEngineTest, RepositoryFailuresAreIsolatedPerFile) {
    std::filesystem::path workspace;
    runner_.AddExecutable("git");
    runner_.OnRun("git", [&workspace](const codesmarty::utils::CommandSpec& spec) {
        workspace = spec.argv.back();
        WriteFile(workspace / "app.py", "def main():\n    print('app')\n");
        WriteFile(workspace / "lib" / "util.c", "#include <stdio.h>\nint main() { printf(\"hi\"); return 0; }\n");
        WriteFile(workspace / "empty.py", "   \n");
        WriteFile(workspace / "README.md", "# docs\n");
        WriteFile(workspace / ".git" / "config.py", "x = 1\n");
    });

    auto result = engine_.AnalyzeRepository("owner/repo");

    ASSERT_EQ(result.size(), 3u);
    ASSERT_TRUE(result.count("app.py"));
    ASSERT_TRUE(result.count("lib/util.c"));
    ASSERT_TRUE(result.count("empty.py"));

    EXPECT_FALSE(result.at("app.py").IsError());
    EXPECT_EQ(result.at("app.py").result->language, Language::PYTHON);
    EXPECT_EQ(result.at("app.py").result->origin_path, "app.py");
    EXPECT_FALSE(result.at("lib/util.c").IsError());
    EXPECT_EQ(result.at("lib/util.c").result->language, Language::C);

    ASSERT_TRUE(result.at("empty.py").IsError());
    EXPECT_EQ(result.at("empty.py").error->message, "No code provided");

    auto clones = runner_.CallsTo("git");
    ASSERT_EQ(clones.size(), 1u);
    EXPECT_EQ(clones[0].argv[clones[0].argv.size() - 2], "https://github.com/owner/repo.git");

    // The clone workspace does not outlive the request
    EXPECT_FALSE(workspace.empty());
    EXPECT_FALSE(std::filesystem::exists(workspace));
}

TEST_F(AnalysisEngineTest, RepositoryReferenceErrors) {
    EXPECT_THROW(engine_.AnalyzeRepository("definitely not a repository"), InputError);
    // git is not installed on the fake host
    EXPECT_THROW(engine_.AnalyzeRepository("https://github.com/owner/repo"), CloneError);
}
