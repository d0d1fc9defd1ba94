/**
 * @file repository_manager.hpp
 * @brief Repository reference normalization, shallow clone and source walk
 *
 * @date 2025
 */

#pragma once

#include "codesmarty/core/language.hpp"
#include "codesmarty/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

namespace codesmarty {
namespace core {

/**
 * @struct SourceFile
 * @brief Analyzable file discovered in a cloned repository
 */
struct SourceFile {
    std::string relative_path;            ///< Key in the RepositoryResult ('/' separated)
    std::filesystem::path absolute_path;  ///< Location inside the workspace
};

/**
 * @class RepositoryManager
 * @brief Turns a repository reference into files on disk
 *
 * **Accepted References**:
 * - `https://host/owner/repo[.git]` (any http(s) URL with a path)
 * - `git@host:owner/repo[.git]`
 * - `owner/repo` (GitHub shorthand)
 *
 * **Usage Example**:
 * @code
 * RepositoryManager repos(runner);
 * auto url = RepositoryManager::NormalizeRepositoryUrl("octocat/Hello-World");
 * utils::TempDirectory workspace("codesmarty_clone_");
 * repos.Clone(url, workspace.Path());
 * for (const auto& file : RepositoryManager::CollectSourceFiles(workspace.Path())) { ... }
 * @endcode
 */
class RepositoryManager {
public:
    struct Config {
        std::chrono::seconds clone_timeout{300};
    };

    explicit RepositoryManager(utils::CommandRunner& runner);
    RepositoryManager(utils::CommandRunner& runner, Config config);

    /**
     * @brief Canonical clone URL for a reference (".git" appended)
     * @throws InputError if the reference is malformed
     */
    static std::string NormalizeRepositoryUrl(const std::string& reference);

    /**
     * @brief `git clone --depth 1` into @p destination (must be empty)
     * @throws CloneError if git is missing, fails or times out
     */
    void Clone(const std::string& url, const std::filesystem::path& destination);

    /**
     * @brief Supported source files under @p root, sorted by relative path
     *
     * Skips .git and symbolic links. Extensions: .py .java .c .h .cpp .cc
     * .cxx .hpp (case-insensitive).
     */
    static std::vector<SourceFile> CollectSourceFiles(const std::filesystem::path& root);

private:
    utils::CommandRunner& runner_;
    Config config_;
};

} // namespace core
} // namespace codesmarty
