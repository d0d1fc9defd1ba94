#include "codesmarty/clients/gemini_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using codesmarty::clients::GeminiClient;
using codesmarty::clients::GenerationRequest;
using json = nlohmann::json;

TEST(GeminiClientTest, RequestBodyCarriesPromptAndBounds) {
    GenerationRequest request;
    request.prompt = "Identify the language";
    request.max_output_tokens = 10;

    auto body = json::parse(GeminiClient::BuildRequestBody(request));
    EXPECT_EQ(body["contents"][0]["role"], "user");
    EXPECT_EQ(body["contents"][0]["parts"][0]["text"], "Identify the language");
    EXPECT_EQ(body["generationConfig"]["maxOutputTokens"], 10);
}

TEST(GeminiClientTest, ParsesCandidateText) {
    auto outcome = GeminiClient::ParseResponseBody(R"({
        "candidates": [{
            "content": {"parts": [{"text": "py"}, {"text": "thon"}], "role": "model"},
            "finishReason": "STOP"
        }]
    })");
    ASSERT_TRUE(outcome.IsOk());
    EXPECT_EQ(outcome.Value(), "python");
}

TEST(GeminiClientTest, RepliesWithoutTextFail) {
    EXPECT_TRUE(GeminiClient::ParseResponseBody("<html>").IsFailed());
    EXPECT_TRUE(GeminiClient::ParseResponseBody(R"({"candidates": []})").IsFailed());
    EXPECT_TRUE(GeminiClient::ParseResponseBody(
        R"({"candidates": [{"finishReason": "SAFETY"}]})").IsFailed());

    auto blocked = GeminiClient::ParseResponseBody(R"({"promptFeedback": {"blockReason": "OTHER"}})");
    ASSERT_TRUE(blocked.IsFailed());
    EXPECT_NE(blocked.Reason().find("blockReason"), std::string::npos);
}

TEST(GeminiClientTest, MissingKeyIsUnavailableWithoutNetwork) {
    GeminiClient client("generativelanguage.googleapis.com", "gemini-1.5-flash", "");
    auto outcome = client.Generate(GenerationRequest{"hello", 10});
    EXPECT_TRUE(outcome.IsUnavailable());
}

TEST(GeminiClientTest, NonUtf8PromptIsEncodedWithReplacement) {
    GenerationRequest request;
    request.prompt = "/* (c) J\xfcrgen */ int main(){}";

    std::string encoded;
    EXPECT_NO_THROW(encoded = GeminiClient::BuildRequestBody(request));
    auto body = json::parse(encoded);
    auto text = body["contents"][0]["parts"][0]["text"].get<std::string>();
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_EQ(text.find('\xfc'), std::string::npos);
    EXPECT_NE(text.find("rgen */ int main(){}"), std::string::npos);
}

TEST(GeminiClientTest, OddlyTypedRepliesFailWithoutThrowing) {
    auto numeric_reason = GeminiClient::ParseResponseBody(
        R"({"candidates": [{"finishReason": 3}]})");
    ASSERT_TRUE(numeric_reason.IsFailed());
    EXPECT_NE(numeric_reason.Reason().find("finishReason: unknown"), std::string::npos);

    EXPECT_TRUE(GeminiClient::ParseResponseBody(R"({"candidates": ["text"]})").IsFailed());
    EXPECT_TRUE(GeminiClient::ParseResponseBody(R"({"candidates": [{"content": {"parts": [1, 2]}}]})").IsFailed());
    EXPECT_TRUE(GeminiClient::ParseResponseBody(R"([1, 2, 3])").IsFailed());
}
