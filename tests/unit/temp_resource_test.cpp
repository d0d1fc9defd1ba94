#include "codesmarty/utils/temp_resource.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>

using namespace codesmarty::utils;

namespace {

std::string Slurp(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(TempDirectoryTest, RemovedWithContentsOnDestruction) {
    std::filesystem::path kept;
    {
        TempDirectory dir("codesmarty_test_");
        kept = dir.Path();
        ASSERT_TRUE(std::filesystem::is_directory(kept));

        auto file = dir.WriteFile("main.py", "print('hi')\n");
        EXPECT_EQ(Slurp(file), "print('hi')\n");
        std::filesystem::create_directories(kept / "nested" / "deeper");
    }
    EXPECT_FALSE(std::filesystem::exists(kept));
}

TEST(TempDirectoryTest, MoveTransfersOwnership) {
    std::filesystem::path kept;
    {
        TempDirectory outer("codesmarty_test_");
        kept = outer.Path();
        {
            TempDirectory inner(std::move(outer));
            EXPECT_EQ(inner.Path(), kept);
            EXPECT_TRUE(outer.Path().empty());
        }
        EXPECT_FALSE(std::filesystem::exists(kept));
    }
}

TEST(TempFileTest, KeepsSuffixAndIsRemoved) {
    std::filesystem::path kept;
    {
        TempFile file("int main() { return 0; }\n", ".cpp");
        kept = file.Path();
        EXPECT_EQ(kept.extension(), ".cpp");
        EXPECT_EQ(Slurp(kept), "int main() { return 0; }\n");
    }
    EXPECT_FALSE(std::filesystem::exists(kept));
}

TEST(UniqueNameTest, NamesDiffer) {
    EXPECT_NE(UniqueName("x_"), UniqueName("x_"));
    EXPECT_EQ(UniqueName("codesmarty_").rfind("codesmarty_", 0), 0u);
}
