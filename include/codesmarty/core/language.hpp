/**
 * @file language.hpp
 * @brief Closed set of source languages understood by the analysis pipeline
 *
 * Every component that branches on the submission language switches over
 * Language without a default arm, so adding a language is a change the
 * compiler walks you through (-Werror=switch).
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>

namespace codesmarty {
namespace core {

/**
 * @enum Language
 * @brief Resolved language of a code submission
 */
enum class Language {
    PYTHON,   ///< Python 3 source
    JAVA,     ///< Java source
    C,        ///< ISO C source
    CPP,      ///< C++ source
    UNKNOWN   ///< Could not be resolved (rejected by the orchestrator)
};

/**
 * @brief Wire name of a language ("python", "java", "c", "cpp", "unknown")
 */
std::string LanguageToString(Language language);

/**
 * @brief Parse a wire name or common alias ("c++", "py") into a Language
 * @return Parsed language, or nullopt when the name is not recognized
 */
std::optional<Language> ParseLanguage(const std::string& name);

/**
 * @brief Source file extension used when materializing code on disk
 *
 * Java returns ".java"; UNKNOWN returns ".txt".
 */
std::string SourceExtension(Language language);

/**
 * @brief Map a file extension (with dot, any case) to a language
 *
 * Used by the repository walk to decide which files are analyzed.
 * Headers (.h, .hpp) map to C and CPP respectively.
 */
std::optional<Language> LanguageFromExtension(const std::string& extension);

} // namespace core
} // namespace codesmarty
