#include "codesmarty/utils/hash_utils.hpp"

#include <gtest/gtest.h>

using codesmarty::utils::HashUtils;

TEST(HashUtilsTest, KnownDigests) {
    EXPECT_EQ(HashUtils::ComputeSHA256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, ShortIdIsTwelveCharacters) {
    auto id = HashUtils::ShortId(HashUtils::ComputeSHA256("abc"));
    EXPECT_EQ(id, "ba7816bf8f01");
}
