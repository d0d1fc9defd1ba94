/**
 * @file language_detector.cpp
 * @brief Generative classification with a deterministic rule fallback
 *
 * @date 2025
 */

#include "codesmarty/analyzers/language_detector.hpp"
#include "codesmarty/analyzers/pattern_rules.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace codesmarty {
namespace analyzers {

using core::Language;
using utils::StringUtils;

namespace {
constexpr int kClassifierMaxTokens = 10;
constexpr std::size_t kPromptCodeLimit = 8000;
}

LanguageDetector::LanguageDetector(clients::GenerativeBackend& backend, Language unmatched_default)
    : backend_(backend)
    , unmatched_default_(unmatched_default) {
}

Language LanguageDetector::Detect(const std::string& code) const {
    clients::GenerationRequest request;
    request.prompt = BuildPrompt(code);
    request.max_output_tokens = kClassifierMaxTokens;

    auto language = clients::GenerateOrFail(backend_, request)
        .Map(NormalizeAnswer)
        .OrElse([&](const std::string& reason) {
            spdlog::warn("Language classifier unavailable ({}), using detection rules", reason);
            return DetectWithRules(code);
        });

    spdlog::info("Detected language: {}", core::LanguageToString(language));
    return language;
}

Language LanguageDetector::DetectWithRules(const std::string& code) const {
    for (Language candidate : PatternRuleEngine::DetectionOrder()) {
        auto match = PatternRuleEngine::FirstMatch(code, PatternRuleEngine::DetectionRules(candidate));
        if (match) {
            spdlog::debug("Detection rule {} matched (line {})", match->rule_id, match->line);
            return candidate;
        }
    }

    spdlog::debug("No detection rule matched, defaulting to {}",
                  core::LanguageToString(unmatched_default_));
    return unmatched_default_;
}

Language LanguageDetector::NormalizeAnswer(const std::string& answer) {
    std::string word = StringUtils::ToLower(StringUtils::Trim(answer));

    // Strip surrounding backticks, quotes and punctuation, keeping '+' for "c++"
    auto is_noise = [](char c) {
        return c != '+' && (std::ispunct(static_cast<unsigned char>(c)) ||
                            std::isspace(static_cast<unsigned char>(c)));
    };
    while (!word.empty() && is_noise(word.front())) {
        word.erase(word.begin());
    }
    while (!word.empty() && is_noise(word.back())) {
        word.pop_back();
    }

    return core::ParseLanguage(word).value_or(Language::UNKNOWN);
}

std::string LanguageDetector::BuildPrompt(const std::string& code) {
    return "Identify the programming language of the following code. "
           "Answer with exactly one word from this list: python, java, c, cpp, unknown.\n\n"
           "Code:\n" + StringUtils::Truncate(code, kPromptCodeLimit, "\n...");
}

} // namespace analyzers
} // namespace codesmarty
