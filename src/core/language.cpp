/**
 * @file language.cpp
 * @brief Language name and extension mapping
 *
 * @date 2025
 */

#include "codesmarty/core/language.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <map>

namespace codesmarty {
namespace core {

std::string LanguageToString(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::JAVA: return "java";
        case Language::C: return "c";
        case Language::CPP: return "cpp";
        case Language::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::optional<Language> ParseLanguage(const std::string& name) {
    static const std::map<std::string, Language> kNames = {
        {"python", Language::PYTHON},
        {"py", Language::PYTHON},
        {"python3", Language::PYTHON},
        {"java", Language::JAVA},
        {"c", Language::C},
        {"cpp", Language::CPP},
        {"c++", Language::CPP},
        {"cxx", Language::CPP},
        {"unknown", Language::UNKNOWN}
    };

    auto it = kNames.find(utils::StringUtils::ToLower(utils::StringUtils::Trim(name)));
    if (it == kNames.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string SourceExtension(Language language) {
    switch (language) {
        case Language::PYTHON: return ".py";
        case Language::JAVA: return ".java";
        case Language::C: return ".c";
        case Language::CPP: return ".cpp";
        case Language::UNKNOWN: return ".txt";
    }
    return ".txt";
}

std::optional<Language> LanguageFromExtension(const std::string& extension) {
    static const std::map<std::string, Language> kExtensions = {
        {".py", Language::PYTHON},
        {".java", Language::JAVA},
        {".c", Language::C},
        {".h", Language::C},
        {".cpp", Language::CPP},
        {".cc", Language::CPP},
        {".cxx", Language::CPP},
        {".hpp", Language::CPP}
    };

    auto it = kExtensions.find(utils::StringUtils::ToLower(extension));
    if (it == kExtensions.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace core
} // namespace codesmarty
