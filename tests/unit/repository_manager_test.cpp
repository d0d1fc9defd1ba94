#include "codesmarty/core/repository_manager.hpp"
#include "codesmarty/core/errors.hpp"
#include "codesmarty/utils/temp_resource.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace codesmarty::core;
using codesmarty::test_support::FakeCommandRunner;

TEST(RepositoryManagerTest, NormalizesAcceptedReferences) {
    EXPECT_EQ(RepositoryManager::NormalizeRepositoryUrl("https://github.com/owner/repo"),
              "https://github.com/owner/repo.git");
    EXPECT_EQ(RepositoryManager::NormalizeRepositoryUrl("https://github.com/owner/repo.git"),
              "https://github.com/owner/repo.git");
    EXPECT_EQ(RepositoryManager::NormalizeRepositoryUrl("  https://gitlab.example.com/group/sub/repo/  "),
              "https://gitlab.example.com/group/sub/repo.git");
    EXPECT_EQ(RepositoryManager::NormalizeRepositoryUrl("http://localhost:3000/owner/repo"),
              "http://localhost:3000/owner/repo.git");
    EXPECT_EQ(RepositoryManager::NormalizeRepositoryUrl("git@github.com:owner/repo"),
              "git@github.com:owner/repo.git");
    EXPECT_EQ(RepositoryManager::NormalizeRepositoryUrl("owner/repo"),
              "https://github.com/owner/repo.git");
}

TEST(RepositoryManagerTest, RejectsMalformedReferences) {
    for (const auto* reference : {"", "not a url", "https://github.com/owner", "ftp://host/a/b",
                                  "owner", "https://github.com/owner/repo; rm -rf /"}) {
        EXPECT_THROW(RepositoryManager::NormalizeRepositoryUrl(reference), InputError) << reference;
    }
}

TEST(RepositoryManagerTest, ClonesShallowly) {
    FakeCommandRunner runner;
    runner.AddExecutable("git");
    RepositoryManager manager(runner);

    manager.Clone("https://github.com/owner/repo.git", "/tmp/dest");

    auto calls = runner.CallsTo("git");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].argv, (std::vector<std::string>{"git", "clone", "--depth", "1", "--quiet", "--",
                                                        "https://github.com/owner/repo.git", "/tmp/dest"}));
    EXPECT_EQ(calls[0].timeout, std::chrono::milliseconds(300000));
}

TEST(RepositoryManagerTest, CloneFailuresRaiseCloneError) {
    FakeCommandRunner no_git;
    EXPECT_THROW(RepositoryManager(no_git).Clone("https://github.com/a/b.git", "/tmp/x"), CloneError);

    FakeCommandRunner denied;
    denied.AddExecutable("git");
    denied.Script("git", FakeCommandRunner::Exited(128, "fatal: repository not found\n"));
    try {
        RepositoryManager(denied).Clone("https://github.com/a/b.git", "/tmp/x");
        FAIL() << "expected CloneError";
    }
    catch (const CloneError& e) {
        EXPECT_NE(std::string(e.what()).find("repository not found"), std::string::npos);
    }

    FakeCommandRunner slow;
    slow.AddExecutable("git");
    slow.Script("git", FakeCommandRunner::TimedOut());
    EXPECT_THROW(RepositoryManager(slow).Clone("https://github.com/a/b.git", "/tmp/x"), CloneError);
}

TEST(RepositoryManagerTest, CollectsSupportedFilesAndSkipsGitMetadata) {
    codesmarty::utils::TempDirectory root;
    namespace fs = std::filesystem;
    fs::create_directories(root.Path() / "src" / "nested");
    fs::create_directories(root.Path() / ".git" / "hooks");

    root.WriteFile("main.py", "print('hi')\n");
    root.WriteFile("README.md", "# readme\n");
    root.WriteFile("src/util.c", "int x;\n");
    root.WriteFile("src/nested/Widget.java", "class Widget {}\n");
    root.WriteFile("src/nested/widget.hpp", "#pragma once\n");
    root.WriteFile(".git/hooks/hook.py", "print('hook')\n");

    auto files = RepositoryManager::CollectSourceFiles(root.Path());
    std::vector<std::string> paths;
    for (const auto& file : files) {
        paths.push_back(file.relative_path);
        EXPECT_TRUE(fs::exists(file.absolute_path)) << file.relative_path;
    }
    EXPECT_EQ(paths, (std::vector<std::string>{"main.py", "src/nested/Widget.java",
                                                "src/nested/widget.hpp", "src/util.c"}));
}
