#include "codesmarty/analyzers/pattern_rules.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace codesmarty::analyzers;
using codesmarty::core::Language;

namespace {

bool Fired(const std::vector<RuleMatch>& matches, const std::string& rule_id) {
    return std::any_of(matches.begin(), matches.end(),
                       [&](const RuleMatch& m) { return m.rule_id == rule_id; });
}

const RuleMatch& Find(const std::vector<RuleMatch>& matches, const std::string& rule_id) {
    return *std::find_if(matches.begin(), matches.end(),
                         [&](const RuleMatch& m) { return m.rule_id == rule_id; });
}

std::vector<RuleMatch> ScanC(const std::string& code) {
    return PatternRuleEngine::Apply(code, PatternRuleEngine::CFamilyConceptualRules());
}

} // namespace

TEST(PatternRulesTest, MallocWithoutFreeIsALeak) {
    const std::string leaking =
        "#include <stdlib.h>\n"
        "int main() {\n"
        "    int *p = malloc(sizeof(int) * 4);\n"
        "    return 0;\n"
        "}\n";
    auto matches = ScanC(leaking);
    ASSERT_TRUE(Fired(matches, "C_MEMORY_LEAK"));
    EXPECT_EQ(Find(matches, "C_MEMORY_LEAK").line, 3);
    EXPECT_EQ(Find(matches, "C_MEMORY_LEAK").finding,
              "Potential memory leak - malloc used without corresponding free");

    const std::string released =
        "#include <stdlib.h>\n"
        "int main() {\n"
        "    int *p = malloc(sizeof(int) * 4);\n"
        "    free(p);\n"
        "    return 0;\n"
        "}\n";
    EXPECT_FALSE(Fired(ScanC(released), "C_MEMORY_LEAK"));
}

TEST(PatternRulesTest, ForWithoutConditionIsAnInfiniteLoop) {
    EXPECT_TRUE(Fired(ScanC("int main() {\n    for (;;) {\n    }\n}\n"), "C_INFINITE_LOOP"));
    EXPECT_FALSE(Fired(ScanC("int main() {\n    for (int i = 0; i < 10; i++) {\n    }\n}\n"),
                       "C_INFINITE_LOOP"));
}

TEST(PatternRulesTest, UseAfterFreeReportsTheUse) {
    const std::string code =
        "#include <stdlib.h>\n"
        "void f() {\n"
        "    char *buf = malloc(8);\n"
        "    free(buf);\n"
        "    buf[0] = 'x';\n"
        "}\n";
    auto matches = ScanC(code);
    ASSERT_TRUE(Fired(matches, "C_USE_AFTER_FREE"));
    EXPECT_EQ(Find(matches, "C_USE_AFTER_FREE").line, 5);
    EXPECT_EQ(Find(matches, "C_USE_AFTER_FREE").finding, "Potential use after free of pointer: 'buf'");
}

TEST(PatternRulesTest, ReassignmentAfterFreeIsNotAUse) {
    const std::string code =
        "void f() {\n"
        "    char *buf = malloc(8);\n"
        "    free(buf);\n"
        "    buf = malloc(16);\n"
        "    buf[0] = 'x';\n"
        "    free(buf);\n"
        "}\n";
    EXPECT_FALSE(Fired(ScanC(code), "C_USE_AFTER_FREE"));
}

TEST(PatternRulesTest, ConstantIndexPastTheEnd) {
    auto matches = ScanC("int main() {\n    int arr[5];\n    arr[5] = 1;\n    return 0;\n}\n");
    ASSERT_TRUE(Fired(matches, "C_INDEX_OUT_OF_BOUNDS"));
    EXPECT_EQ(Find(matches, "C_INDEX_OUT_OF_BOUNDS").line, 3);
    EXPECT_EQ(Find(matches, "C_INDEX_OUT_OF_BOUNDS").finding,
              "Array index out of bounds: 'arr[5]' on array of size 5");

    EXPECT_FALSE(Fired(ScanC("int main() {\n    int arr[5];\n    arr[4] = 1;\n    return 0;\n}\n"),
                       "C_INDEX_OUT_OF_BOUNDS"));
}

TEST(PatternRulesTest, SubmittedIdentifiersDoNotGrowTheRegexCache) {
    auto snippet = [](int n) {
        const std::string id = std::to_string(n);
        return "void f() {\n"
               "    int count_" + id + ";\n"
               "    printf(\"%d\", count_" + id + ");\n"
               "    char *buf_" + id + " = malloc(8);\n"
               "    free(buf_" + id + ");\n"
               "    buf_" + id + "[0] = 'x';\n"
               "}\n";
    };

    auto first = ScanC(snippet(0));
    ASSERT_TRUE(Fired(first, "C_UNINITIALIZED_VARIABLE"));
    ASSERT_TRUE(Fired(first, "C_USE_AFTER_FREE"));
    const std::size_t cached = PatternRuleEngine::CompiledPatternCount();

    for (int n = 1; n <= 200; ++n) {
        ScanC(snippet(n));
    }
    EXPECT_EQ(PatternRuleEngine::CompiledPatternCount(), cached);
}

TEST(PatternRulesTest, UninitializedScalar) {
    auto matches = ScanC("int main() {\n    int count;\n    printf(\"%d\", count);\n}\n");
    ASSERT_TRUE(Fired(matches, "C_UNINITIALIZED_VARIABLE"));
    EXPECT_EQ(Find(matches, "C_UNINITIALIZED_VARIABLE").finding,
              "Potentially uninitialized variable: 'count'");
    EXPECT_EQ(Find(matches, "C_UNINITIALIZED_VARIABLE").line, 2);

    EXPECT_FALSE(Fired(ScanC("int main() {\n    int count;\n    count = 3;\n}\n"),
                       "C_UNINITIALIZED_VARIABLE"));
}

TEST(PatternRulesTest, NullDereferenceAndUnsafeCopies) {
    auto matches = ScanC(
        "int main() {\n"
        "    int *p = NULL;\n"
        "    *p = 1;\n"
        "    char dst[4];\n"
        "    strcpy(dst, \"overflowing\");\n"
        "    gets(dst);\n"
        "}\n");
    EXPECT_TRUE(Fired(matches, "C_NULL_DEREFERENCE"));
    EXPECT_TRUE(Fired(matches, "C_UNSAFE_STRING_COPY"));
    EXPECT_TRUE(Fired(matches, "C_GETS"));
}

TEST(PatternRulesTest, NewWithoutDeleteUnlessSmartPointer) {
    EXPECT_TRUE(Fired(ScanC("int main() {\n    int *p = new int(3);\n    return *p;\n}\n"),
                      "CPP_NEW_WITHOUT_DELETE"));
    EXPECT_FALSE(Fired(ScanC("std::unique_ptr<int> p(new int(3));\n"), "CPP_NEW_WITHOUT_DELETE"));
}

TEST(PatternRulesTest, MatchesFollowTableOrder) {
    auto matches = ScanC(
        "void f() {\n"
        "    for (;;) {}\n"
        "    char *p = malloc(4);\n"
        "}\n");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].rule_id, "C_MEMORY_LEAK");
    EXPECT_EQ(matches[1].rule_id, "C_INFINITE_LOOP");

    EXPECT_EQ(PatternRuleEngine::FormatMatches(matches),
              "Line 3: Potential memory leak - malloc used without corresponding free\n"
              "Line 2: Potential infinite loop - missing loop condition");
}

TEST(PatternRulesTest, RuntimeRiskSubsetExcludesLeaks) {
    const auto& subset = PatternRuleEngine::CFamilyRuntimeRiskRules();
    EXPECT_FALSE(subset.empty());
    for (const auto& rule : subset) {
        EXPECT_TRUE(rule.runtime_risk) << rule.rule_id;
        EXPECT_NE(rule.rule_id, "C_MEMORY_LEAK");
    }
}

TEST(PatternRulesTest, PythonConceptualRules) {
    auto matches = PatternRuleEngine::Apply(
        "def add(item, items=[]):\n"
        "    items.append(item)\n"
        "    f = open('data.txt')\n"
        "    try:\n"
        "        eval(f.read())\n"
        "    except:\n"
        "        pass\n",
        PatternRuleEngine::PythonConceptualRules());
    EXPECT_TRUE(Fired(matches, "PY_MUTABLE_DEFAULT"));
    EXPECT_TRUE(Fired(matches, "PY_UNCLOSED_FILE"));
    EXPECT_TRUE(Fired(matches, "PY_EVAL_EXEC"));
    EXPECT_TRUE(Fired(matches, "PY_BARE_EXCEPT"));

    auto clean = PatternRuleEngine::Apply(
        "with open('data.txt') as f:\n"
        "    print(f.read())\n",
        PatternRuleEngine::PythonConceptualRules());
    EXPECT_TRUE(clean.empty());
}

TEST(PatternRulesTest, JavaNullSafetyRules) {
    auto matches = PatternRuleEngine::Apply(
        "public class Main {\n"
        "    static String find() { return null; }\n"
        "    public static void main(String[] args) {\n"
        "        String name = find();\n"
        "        if (name.equals(\"x\")) {}\n"
        "    }\n"
        "}\n",
        PatternRuleEngine::JavaNullSafetyRules());
    EXPECT_TRUE(Fired(matches, "JAVA_RETURN_NULL"));
    EXPECT_TRUE(Fired(matches, "JAVA_EQUALS_ON_VARIABLE"));
}

TEST(PatternRulesTest, DetectionTablesRecognizeEachLanguage) {
    auto first = [](const std::string& code, Language language) {
        return PatternRuleEngine::FirstMatch(code, PatternRuleEngine::DetectionRules(language)).has_value();
    };
    EXPECT_TRUE(first("def hello():\n    print('hi')\n", Language::PYTHON));
    EXPECT_TRUE(first("public class Main {}\n", Language::JAVA));
    EXPECT_TRUE(first("#include <iostream>\nint main() { std::cout << 1; }\n", Language::CPP));
    EXPECT_TRUE(first("#include <stdio.h>\nint main() { printf(\"x\"); }\n", Language::C));
    EXPECT_TRUE(PatternRuleEngine::DetectionRules(Language::UNKNOWN).empty());

    EXPECT_EQ(PatternRuleEngine::DetectionOrder(),
              (std::vector<Language>{Language::PYTHON, Language::JAVA, Language::CPP, Language::C}));
}

TEST(PatternRulesTest, LongInputsAreScannedLineByLine) {
    std::string code;
    for (int i = 0; i < 20000; ++i) {
        code += "x = x + 1\n";
    }
    code += "for (;;) {}\n";
    auto matches = ScanC(code);
    ASSERT_TRUE(Fired(matches, "C_INFINITE_LOOP"));
    EXPECT_EQ(Find(matches, "C_INFINITE_LOOP").line, 20001);
}
