/**
 * @file gemini_client.cpp
 * @brief GenerativeBackend over the Gemini generateContent REST endpoint
 *
 * @date 2025
 */

#include "codesmarty/clients/gemini_client.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <httplib.h>

namespace codesmarty {
namespace clients {

using json = nlohmann::json;
using core::ToolOutcome;

namespace {
constexpr double kTemperature = 0.2;
constexpr std::size_t kLoggedBodyLimit = 300;

ToolOutcome<std::string> ExtractCandidateText(const json& reply) {
    if (!reply.is_object()) {
        return ToolOutcome<std::string>::Failed("Reply is not a JSON object");
    }

    if (!reply.contains("candidates") || !reply["candidates"].is_array() ||
        reply["candidates"].empty()) {
        std::string reason = "Reply has no candidates";
        if (reply.contains("promptFeedback")) {
            reason += " (" + reply["promptFeedback"].dump(-1, ' ', false, json::error_handler_t::replace) + ")";
        }
        return ToolOutcome<std::string>::Failed(reason);
    }

    const auto& candidate = reply["candidates"][0];
    if (!candidate.is_object()) {
        return ToolOutcome<std::string>::Failed("Reply candidate is not an object");
    }

    std::string text;
    if (candidate.contains("content") && candidate["content"].is_object() &&
        candidate["content"].contains("parts") && candidate["content"]["parts"].is_array()) {
        for (const auto& part : candidate["content"]["parts"]) {
            if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
    }

    if (utils::StringUtils::Trim(text).empty()) {
        std::string finish_reason = "unknown";
        if (candidate.contains("finishReason") && candidate["finishReason"].is_string()) {
            finish_reason = candidate["finishReason"].get<std::string>();
        }
        return ToolOutcome<std::string>::Failed("Reply has no text (finishReason: " + finish_reason + ")");
    }
    return ToolOutcome<std::string>::Ok(text);
}

} // anonymous namespace

GeminiClient::GeminiClient(std::string host,
                           std::string model,
                           std::string api_key,
                           std::chrono::seconds timeout)
    : host_(std::move(host))
    , model_(std::move(model))
    , api_key_(std::move(api_key))
    , timeout_(timeout) {
}

ToolOutcome<std::string> GeminiClient::Generate(const GenerationRequest& request) {
    if (api_key_.empty()) {
        return ToolOutcome<std::string>::Unavailable("No API key configured");
    }

    httplib::Client cli("https://" + host_);
    cli.set_connection_timeout(static_cast<time_t>(timeout_.count()), 0);
    cli.set_read_timeout(static_cast<time_t>(timeout_.count()), 0);
    cli.set_write_timeout(static_cast<time_t>(timeout_.count()), 0);

    httplib::Headers headers = {
        {"x-goog-api-key", api_key_}
    };

    const std::string path = "/v1beta/models/" + model_ + ":generateContent";
    spdlog::debug("POST https://{}{} ({} prompt chars)", host_, path, request.prompt.size());

    std::string payload;
    try {
        payload = BuildRequestBody(request);
    }
    catch (const json::exception& e) {
        spdlog::warn("Cannot encode generation request: {}", e.what());
        return ToolOutcome<std::string>::Failed(std::string("Request encoding failed: ") + e.what());
    }

    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) {
        std::string reason = "Connection to " + host_ + " failed (httplib error " +
                             std::to_string(static_cast<int>(res.error())) + ")";
        spdlog::warn("Generative backend unavailable: {}", reason);
        return ToolOutcome<std::string>::Unavailable(reason);
    }

    if (res->status != 200) {
        std::string reason = "HTTP " + std::to_string(res->status) + ": " +
                             utils::StringUtils::Truncate(res->body, kLoggedBodyLimit);
        spdlog::warn("Generative backend error: {}", reason);
        return ToolOutcome<std::string>::Failed(reason);
    }

    return ParseResponseBody(res->body);
}

std::string GeminiClient::BuildRequestBody(const GenerationRequest& request) {
    json body = {
        {"contents", json::array({
            {{"role", "user"}, {"parts", json::array({{{"text", request.prompt}}})}}
        })},
        {"generationConfig", {
            {"maxOutputTokens", request.max_output_tokens},
            {"temperature", kTemperature}
        }}
    };
    // Source files may carry Latin-1 or other non-UTF-8 bytes
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

ToolOutcome<std::string> GeminiClient::ParseResponseBody(const std::string& body) {
    try {
        return ExtractCandidateText(json::parse(body));
    }
    catch (const json::exception& e) {
        return ToolOutcome<std::string>::Failed(std::string("Malformed reply: ") + e.what());
    }
}

} // namespace clients
} // namespace codesmarty
