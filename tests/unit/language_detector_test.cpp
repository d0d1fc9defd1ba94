#include "codesmarty/analyzers/language_detector.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace codesmarty::analyzers;
using codesmarty::core::Language;
using codesmarty::core::ToolOutcome;
using codesmarty::test_support::FakeGenerativeBackend;

TEST(LanguageDetectorTest, UsesClassifierAnswer) {
    FakeGenerativeBackend backend;
    backend.Queue(ToolOutcome<std::string>::Ok("java\n"));
    LanguageDetector detector(backend);

    EXPECT_EQ(detector.Detect("def f():\n    pass\n"), Language::JAVA);
    ASSERT_EQ(backend.Prompts().size(), 1u);
    EXPECT_NE(backend.Prompts()[0].find("python, java, c, cpp, unknown"), std::string::npos);
}

TEST(LanguageDetectorTest, NormalizesDecoratedAnswers) {
    EXPECT_EQ(LanguageDetector::NormalizeAnswer("`C++`"), Language::CPP);
    EXPECT_EQ(LanguageDetector::NormalizeAnswer("  Python.\n"), Language::PYTHON);
    EXPECT_EQ(LanguageDetector::NormalizeAnswer("\"cpp\""), Language::CPP);
    EXPECT_EQ(LanguageDetector::NormalizeAnswer("C"), Language::C);
    EXPECT_EQ(LanguageDetector::NormalizeAnswer("Rust"), Language::UNKNOWN);
    EXPECT_EQ(LanguageDetector::NormalizeAnswer("The language is Python"), Language::UNKNOWN);
}

TEST(LanguageDetectorTest, ClassifierUnknownIsKept) {
    FakeGenerativeBackend backend;
    backend.Queue(ToolOutcome<std::string>::Ok("unknown"));
    LanguageDetector detector(backend);
    EXPECT_EQ(detector.Detect("def f():\n    pass\n"), Language::UNKNOWN);
}

TEST(LanguageDetectorTest, FallsBackToRulesWhenBackendFails) {
    FakeGenerativeBackend backend;
    backend.SetDefault(ToolOutcome<std::string>::Failed("HTTP 500"));
    LanguageDetector detector(backend);

    EXPECT_EQ(detector.Detect("def hello():\n    print('hi')\n"), Language::PYTHON);
    EXPECT_EQ(detector.Detect("public class Main {\n  public static void main(String[] a) {}\n}\n"),
              Language::JAVA);
    EXPECT_EQ(detector.Detect("#include <iostream>\nint main() { std::cout << 1; }\n"), Language::CPP);
    EXPECT_EQ(detector.Detect("#include <stdio.h>\nint main() { printf(\"x\"); return 0; }\n"),
              Language::C);
}

TEST(LanguageDetectorTest, NonUtf8SourceFallsBackToRules) {
    FakeGenerativeBackend backend;
    backend.EncodePromptsStrictly();
    backend.Queue(ToolOutcome<std::string>::Ok("java"));
    LanguageDetector detector(backend);

    const std::string latin1 = "#include <stdio.h>\n/* (c) J\xfcrgen */\nint main() { printf(\"x\"); return 0; }\n";
    Language language = Language::UNKNOWN;
    EXPECT_NO_THROW(language = detector.Detect(latin1));
    EXPECT_EQ(language, Language::C);
}

TEST(LanguageDetectorTest, UnmatchedCodeDefaultsToPython) {
    FakeGenerativeBackend backend;
    LanguageDetector detector(backend);
    EXPECT_EQ(detector.Detect("lorem ipsum dolor sit amet"), Language::PYTHON);
}

TEST(LanguageDetectorTest, UnmatchedDefaultIsConfigurable) {
    FakeGenerativeBackend backend;
    LanguageDetector detector(backend, Language::UNKNOWN);
    EXPECT_EQ(detector.Detect("lorem ipsum dolor sit amet"), Language::UNKNOWN);
}

TEST(LanguageDetectorTest, FallbackIsDeterministic) {
    FakeGenerativeBackend backend;
    LanguageDetector detector(backend);
    const std::string code = "x := 1\nfmt.Println(x)\n";
    EXPECT_EQ(detector.Detect(code), detector.Detect(code));
}
