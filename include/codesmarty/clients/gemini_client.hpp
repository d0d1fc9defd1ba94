/**
 * @file gemini_client.hpp
 * @brief GenerativeBackend over the Gemini generateContent REST endpoint
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/clients/generative_backend.hpp"

#include <string>
#include <chrono>

namespace codesmarty {
namespace clients {

/**
 * @class GeminiClient
 * @brief POST https://{host}/v1beta/models/{model}:generateContent
 *
 * A fresh HTTPS connection is opened per call, so one instance can be
 * shared by all request workers.
 */
class GeminiClient : public GenerativeBackend {
public:
    GeminiClient(std::string host,
                 std::string model,
                 std::string api_key,
                 std::chrono::seconds timeout = std::chrono::seconds(60));

    core::ToolOutcome<std::string> Generate(const GenerationRequest& request) override;

    /// Request body for @p request (exposed for tests)
    static std::string BuildRequestBody(const GenerationRequest& request);

    /**
     * @brief Concatenated text parts of the first candidate
     * @return Ok(text), or Failed when the reply carries no text
     */
    static core::ToolOutcome<std::string> ParseResponseBody(const std::string& body);

private:
    std::string host_;
    std::string model_;
    std::string api_key_;
    std::chrono::seconds timeout_;
};

} // namespace clients
} // namespace codesmarty
