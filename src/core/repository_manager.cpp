/**
 * @file repository_manager.cpp
 * @brief Repository reference normalization, shallow clone and source walk
 *
 * @date 2025
 */

#include "codesmarty/core/repository_manager.hpp"
#include "codesmarty/core/errors.hpp"
#include "codesmarty/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

namespace codesmarty {
namespace core {

using utils::StringUtils;

namespace {

const std::regex kHttpUrl(R"(^https?://[A-Za-z0-9.-]+(:[0-9]+)?(/[A-Za-z0-9._~-]+){2,}$)");
const std::regex kSshUrl(R"(^git@[A-Za-z0-9.-]+:[A-Za-z0-9._~-]+(/[A-Za-z0-9._~-]+)+$)");
const std::regex kShorthand(R"(^[A-Za-z0-9_][A-Za-z0-9._-]*/[A-Za-z0-9_][A-Za-z0-9._-]*$)");

std::string WithGitSuffix(std::string url) {
    while (StringUtils::EndsWith(url, "/")) {
        url.pop_back();
    }
    if (!StringUtils::EndsWith(url, ".git")) {
        url += ".git";
    }
    return url;
}

} // anonymous namespace

RepositoryManager::RepositoryManager(utils::CommandRunner& runner)
    : RepositoryManager(runner, Config{}) {
}

RepositoryManager::RepositoryManager(utils::CommandRunner& runner, Config config)
    : runner_(runner), config_(config) {
}

std::string RepositoryManager::NormalizeRepositoryUrl(const std::string& reference) {
    std::string trimmed = StringUtils::Trim(reference);
    std::string stripped = trimmed;
    while (StringUtils::EndsWith(stripped, "/")) {
        stripped.pop_back();
    }

    if (std::regex_match(stripped, kHttpUrl) || std::regex_match(stripped, kSshUrl)) {
        return WithGitSuffix(stripped);
    }
    if (std::regex_match(stripped, kShorthand)) {
        return WithGitSuffix("https://github.com/" + stripped);
    }

    throw InputError("Malformed repository URL: '" + trimmed +
                     "' (expected https://host/owner/repo, git@host:owner/repo or owner/repo)");
}

void RepositoryManager::Clone(const std::string& url, const std::filesystem::path& destination) {
    spdlog::info("Cloning {} (depth 1)", url);

    if (!runner_.IsAvailable("git")) {
        throw CloneError("git is not installed on the analysis host");
    }

    utils::CommandSpec spec;
    spec.argv = {"git", "clone", "--depth", "1", "--quiet", "--", url, destination.string()};
    spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.clone_timeout);

    auto result = runner_.Run(spec);
    if (!result.launched) {
        throw CloneError("Failed to run git: " + result.error);
    }
    if (result.timed_out) {
        throw CloneError("Cloning " + url + " timed out after " +
                         std::to_string(config_.clone_timeout.count()) + " seconds");
    }
    if (result.exit_code != 0) {
        throw CloneError("Failed to clone " + url + ": " + StringUtils::Trim(result.output));
    }

    spdlog::info("✓ Clone complete ({} ms)", result.duration.count());
}

std::vector<SourceFile> RepositoryManager::CollectSourceFiles(const std::filesystem::path& root) {
    std::vector<SourceFile> files;

    namespace fs = std::filesystem;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied);
    for (auto end = fs::recursive_directory_iterator(); it != end; ++it) {
        const auto& entry = *it;

        if (entry.is_symlink()) {
            if (entry.is_directory()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_directory()) {
            if (entry.path().filename() == ".git") {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file()) {
            continue;
        }
        if (!LanguageFromExtension(entry.path().extension().string())) {
            continue;
        }

        files.push_back({fs::relative(entry.path(), root).generic_string(), entry.path()});
    }

    std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
        return a.relative_path < b.relative_path;
    });

    spdlog::info("Found {} analyzable file(s)", files.size());
    return files;
}

} // namespace core
} // namespace codesmarty
