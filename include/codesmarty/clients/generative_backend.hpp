/**
 * @file generative_backend.hpp
 * @brief Abstract text-generation interface
 *
 * The language detector and the suggestion synthesizer talk to a
 * GenerativeBackend. Network trouble, quota errors and malformed replies
 * come back as ToolOutcome values so both callers can fall back to their
 * deterministic paths.
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/tool_outcome.hpp"

#include <exception>
#include <string>

namespace codesmarty {
namespace clients {

/**
 * @struct GenerationRequest
 * @brief One prompt and its output bound
 */
struct GenerationRequest {
    std::string prompt;
    int max_output_tokens{2048};
};

/**
 * @class GenerativeBackend
 * @brief Prompt in, text out
 *
 * Implementations must be safe to call from several request workers at
 * once.
 */
class GenerativeBackend {
public:
    virtual ~GenerativeBackend() = default;

    /**
     * @brief Generate text for a prompt
     * @return Ok(text), Unavailable(reason) when the backend cannot be
     *         reached, Failed(reason) when it answered with an error
     */
    virtual core::ToolOutcome<std::string> Generate(const GenerationRequest& request) = 0;
};

/**
 * @brief Call @p backend, reporting an escaped exception as Failed
 *
 * Callers fall back to their deterministic paths on any non-Ok outcome.
 */
inline core::ToolOutcome<std::string> GenerateOrFail(GenerativeBackend& backend,
                                                     const GenerationRequest& request) {
    try {
        return backend.Generate(request);
    }
    catch (const std::exception& e) {
        return core::ToolOutcome<std::string>::Failed(std::string("Backend error: ") + e.what());
    }
}

} // namespace clients
} // namespace codesmarty
