/**
 * @file suggestion_synthesizer.hpp
 * @brief Remediation report from findings and runtime output
 *
 * The generative backend writes the report when it can. Otherwise a
 * deterministic report is assembled from the same inputs, so identical
 * inputs always give byte-identical fallback text.
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/analysis_types.hpp"
#include "codesmarty/clients/generative_backend.hpp"

#include <string>

namespace codesmarty {
namespace analyzers {

/**
 * @class SuggestionSynthesizer
 * @brief Prompted suggestions with a fixed-template fallback
 *
 * **Prompt Sections**: Conceptual Issues, Complexity Analysis, Suggested
 * Improvements, Best Practices Evaluation.
 */
class SuggestionSynthesizer {
public:
    explicit SuggestionSynthesizer(clients::GenerativeBackend& backend, int max_output_tokens = 2048);

    /**
     * @brief Produce the suggestion report for one submission
     *
     * Never throws for backend problems; provenance tells which path
     * produced the text.
     */
    core::SuggestionReport Synthesize(const std::string& code,
                                      const core::FindingSet& findings,
                                      const core::ExecutionOutcome& runtime,
                                      core::Language language) const;

    static std::string BuildPrompt(const std::string& code,
                                   const core::FindingSet& findings,
                                   const core::ExecutionOutcome& runtime,
                                   core::Language language);

    /**
     * @brief Deterministic report used when the backend fails
     */
    static std::string BuildFallbackReport(const core::FindingSet& findings,
                                           const core::ExecutionOutcome& runtime,
                                           core::Language language);

private:
    clients::GenerativeBackend& backend_;
    int max_output_tokens_;
};

} // namespace analyzers
} // namespace codesmarty
