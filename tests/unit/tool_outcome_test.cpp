#include "codesmarty/core/tool_outcome.hpp"

#include <gtest/gtest.h>

using codesmarty::core::ToolOutcome;

TEST(ToolOutcomeTest, OkCarriesValue) {
    auto outcome = ToolOutcome<std::string>::Ok("report");
    EXPECT_TRUE(outcome.IsOk());
    EXPECT_EQ(outcome.Value(), "report");
    EXPECT_TRUE(outcome.Reason().empty());
}

TEST(ToolOutcomeTest, ValueOnFailureThrows) {
    auto outcome = ToolOutcome<std::string>::Failed("boom");
    EXPECT_TRUE(outcome.IsFailed());
    EXPECT_THROW(outcome.Value(), std::logic_error);
    EXPECT_EQ(outcome.ValueOr("fallback"), "fallback");
}

TEST(ToolOutcomeTest, MapPreservesKind) {
    auto length = [](const std::string& s) { return s.size(); };

    auto ok = ToolOutcome<std::string>::Ok("abcd").Map(length);
    ASSERT_TRUE(ok.IsOk());
    EXPECT_EQ(ok.Value(), 4u);

    auto missing = ToolOutcome<std::string>::Unavailable("no key").Map(length);
    EXPECT_TRUE(missing.IsUnavailable());
    EXPECT_EQ(missing.Reason(), "no key");
}

TEST(ToolOutcomeTest, OrElseReceivesReason) {
    std::string seen;
    auto value = ToolOutcome<int>::Failed("timeout").OrElse([&](const std::string& reason) {
        seen = reason;
        return -1;
    });
    EXPECT_EQ(value, -1);
    EXPECT_EQ(seen, "timeout");

    EXPECT_EQ(ToolOutcome<int>::Ok(7).OrElse([](const std::string&) { return -1; }), 7);
}
