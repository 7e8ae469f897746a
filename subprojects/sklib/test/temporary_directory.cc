#include <filesystem>
#include <gmock/gmock-matchers.h>
#include <gtest/gtest.h>
#include <sklib/temporary_directory.hh>
#include <string>

using ::testing::MatchesRegex;

// NOLINTNEXTLINE
TEST(temporary_directory, TemporaryDirectory) {
    TemporaryDirectory tmp_dir;
    EXPECT_EQ(tmp_dir.path(), "");
    EXPECT_FALSE(tmp_dir.exists());

    tmp_dir = TemporaryDirectory("/tmp/sklib-test.XXXXXX");
    EXPECT_THAT(tmp_dir.path(), MatchesRegex("/tmp/sklib-test\\..{6}/"));
    EXPECT_TRUE(tmp_dir.exists());
    EXPECT_TRUE(std::filesystem::is_directory(tmp_dir.path()));

    std::string path_to_test;
    {
        TemporaryDirectory other("/tmp/sklib-test2.XXXXXX");
        static_assert(not std::is_convertible_v<const char*, TemporaryDirectory>);
        std::string path = tmp_dir.path();
        std::string other_path = other.path();
        tmp_dir = std::move(other);

        EXPECT_FALSE(other.exists()); // NOLINT(bugprone-use-after-move)
        EXPECT_FALSE(std::filesystem::exists(path));
        EXPECT_EQ(tmp_dir.path(), other_path);

        other = std::move(tmp_dir);
        path_to_test = other_path;
        EXPECT_TRUE(std::filesystem::is_directory(path_to_test));
    }
    EXPECT_FALSE(std::filesystem::exists(path_to_test));
}
