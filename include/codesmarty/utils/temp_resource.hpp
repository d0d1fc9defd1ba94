/**
 * @file temp_resource.hpp
 * @brief Scoped temporary files and directories
 *
 * Temporary artifacts belong to the operation that created them and are
 * removed when the guard leaves scope, whether the operation returned
 * normally, a tool failed, or an exception unwound the stack.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace codesmarty {
namespace utils {

/**
 * @class TempDirectory
 * @brief Uniquely named directory removed recursively on destruction
 *
 * **Usage Example**:
 * @code
 * {
 *     TempDirectory workspace("codesmarty_clone_");
 *     CloneInto(workspace.Path());
 *     Walk(workspace.Path());
 * }   // workspace and everything in it is gone here
 * @endcode
 */
class TempDirectory {
public:
    /**
     * @brief Create a directory under the system temp path
     * @param prefix Leading part of the directory name
     * @throws std::filesystem::filesystem_error if creation fails
     */
    explicit TempDirectory(const std::string& prefix = "codesmarty_");

    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;

    const std::filesystem::path& Path() const { return path_; }

    /**
     * @brief Write @p contents to a file inside the directory
     * @return Path of the written file
     * @throws std::runtime_error if the file cannot be written
     */
    std::filesystem::path WriteFile(const std::string& name, const std::string& contents) const;

private:
    void Remove() noexcept;

    std::filesystem::path path_;
};

/**
 * @class TempFile
 * @brief Uniquely named file (with a chosen extension) removed on destruction
 *
 * Linters pick their mode from the extension, so the suffix matters:
 * cppcheck treats ".c" and ".cpp" differently.
 */
class TempFile {
public:
    /**
     * @brief Create the file and write @p contents into it
     * @param suffix File extension including the dot (".py", ".cpp")
     * @throws std::runtime_error if the file cannot be written
     */
    TempFile(const std::string& contents, const std::string& suffix);

    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;

    const std::filesystem::path& Path() const { return path_; }

private:
    void Remove() noexcept;

    std::filesystem::path path_;
};

/**
 * @brief Generate a collision-resistant name: prefix + pid + time + random
 */
std::string UniqueName(const std::string& prefix);

} // namespace utils
} // namespace codesmarty
