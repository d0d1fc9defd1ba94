#include "codesmarty/reporters/json_reporter.hpp"
#include "codesmarty/utils/temp_resource.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>

using namespace codesmarty::core;
using namespace codesmarty::reporters;
using json = nlohmann::ordered_json;

namespace {

AnalysisResult SampleResult() {
    AnalysisResult result;
    result.submission_id = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    result.language = Language::PYTHON;
    result.findings.Set(kConceptualErrorsKey, kNoConceptualIssues);
    result.findings.Set("pylint", kToolNotAvailable);
    result.findings.Set("mypy", kNoIssuesFound);
    result.runtime.mode = ExecutionMode::SANDBOXED;
    result.runtime.output = "hi\n";
    result.runtime.success = true;
    result.suggestions = {"## Conceptual Issues\nNone.", Provenance::GENERATED};
    return result;
}

} // namespace

TEST(JsonReporterTest, SingleResultWireShape) {
    JsonReporter reporter;
    auto j = reporter.ToJson(SampleResult());

    std::vector<std::string> keys;
    for (const auto& item : j.items()) {
        keys.push_back(item.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"language", "issues", "runtime", "suggestions", "metadata"}));

    EXPECT_EQ(j["language"], "python");
    EXPECT_EQ(j["runtime"], "hi\n");
    EXPECT_EQ(j["suggestions"], "## Conceptual Issues\nNone.");
    EXPECT_EQ(j["metadata"]["execution_mode"], "sandboxed");
    EXPECT_EQ(j["metadata"]["suggestions_provenance"], "generated");

    std::vector<std::string> tools;
    for (const auto& item : j["issues"].items()) {
        tools.push_back(item.key());
    }
    EXPECT_EQ(tools, (std::vector<std::string>{"conceptual_errors", "pylint", "mypy"}));
    EXPECT_EQ(j["issues"]["pylint"], "Tool not available");
}

TEST(JsonReporterTest, MetadataCanBeOmitted) {
    JsonReporterConfig config;
    config.include_metadata = false;
    JsonReporter reporter(config);
    EXPECT_FALSE(reporter.ToJson(SampleResult()).contains("metadata"));
}

TEST(JsonReporterTest, RepositoryResultMixesResultsAndErrors) {
    RepositoryResult repository;
    repository["src/app.py"].result = SampleResult();
    repository["src/empty.py"].error = ErrorEntry{"No code provided"};

    JsonReporter reporter;
    auto j = reporter.ToJson(repository);
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j["src/app.py"]["language"], "python");
    EXPECT_EQ(j["src/empty.py"], (json{{"error", "No code provided"}}));
}

TEST(JsonReporterTest, InvalidUtf8IsReplacedNotThrown) {
    auto result = SampleResult();
    result.runtime.output = std::string("bad byte: \xff\n");

    JsonReporter reporter;
    std::string body;
    EXPECT_NO_THROW(body = reporter.GenerateJsonString(result));
    EXPECT_NE(body.find("bad byte"), std::string::npos);
}

TEST(JsonReporterTest, ReportFileIsWritten) {
    codesmarty::utils::TempDirectory dir;
    JsonReporterConfig config;
    config.output_directory = dir.Path() / "reports";
    JsonReporter reporter(config);

    auto path = reporter.GenerateReport(SampleResult());
    ASSERT_FALSE(path.empty());
    EXPECT_EQ(path.filename().string().rfind("ba7816bf8f01_", 0), 0u);
    EXPECT_EQ(path.extension(), ".json");

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(json::parse(contents)["language"], "python");
}
