/**
 * @file language_detector.hpp
 * @brief Resolve a code blob to one of the supported languages
 *
 * **Detection Workflow**:
 * 1. Ask the generative backend to classify the code with a single word
 * 2. Normalize the answer (trim, lower-case, strip backticks and punctuation)
 * 3. If the backend is unavailable or failed, walk the detection tables in
 *    priority order (python, java, cpp, c)
 * 4. No table matches → the configured default (python)
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/language.hpp"
#include "codesmarty/clients/generative_backend.hpp"

#include <string>

namespace codesmarty {
namespace analyzers {

/**
 * @class LanguageDetector
 * @brief Generative classification with a deterministic rule fallback
 */
class LanguageDetector {
public:
    /**
     * @param backend Classifier (borrowed, must outlive the detector)
     * @param unmatched_default Result when no detection rule matches
     */
    explicit LanguageDetector(clients::GenerativeBackend& backend,
                              core::Language unmatched_default = core::Language::PYTHON);

    /**
     * @brief Resolve the language of @p code
     *
     * Never throws for backend problems. May return UNKNOWN when the
     * backend answers with something outside the supported set.
     */
    core::Language Detect(const std::string& code) const;

    /**
     * @brief Rule-table detection only (no backend call)
     */
    core::Language DetectWithRules(const std::string& code) const;

    /**
     * @brief Map a raw classifier answer to a Language (UNKNOWN if unrecognized)
     */
    static core::Language NormalizeAnswer(const std::string& answer);

    /// Classification prompt sent to the backend
    static std::string BuildPrompt(const std::string& code);

private:
    clients::GenerativeBackend& backend_;
    core::Language unmatched_default_;
};

} // namespace analyzers
} // namespace codesmarty
