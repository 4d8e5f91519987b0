#include <gtest/gtest.h>
#include "../src/utils.hpp"
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include "fakes.hpp"

#include <filesystem>

namespace fs = std::filesystem;

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trim("  hello  "), "hello");
    EXPECT_EQ(trim("\thello\n"), "hello");
    EXPECT_EQ(trim("hello"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(UtilsTest, ToLower) {
    EXPECT_EQ(to_lower("MSI"), "msi");
    EXPECT_EQ(to_lower("Inno-5"), "inno-5");
}

TEST(UtilsTest, ReplaceAll) {
    EXPECT_EQ(replace_all("/x {key} /l {key}", "{key}", "{ABC}"), "/x {ABC} /l {ABC}");
    EXPECT_EQ(replace_all("aaa", "a", "aa"), "aaaaaa");
    EXPECT_EQ(replace_all("text", "", "x"), "text");
}

TEST(UtilsTest, SplitCommandLine) {
    EXPECT_TRUE(split_command_line("").empty());
    EXPECT_TRUE(split_command_line("   ").empty());

    auto tokens = split_command_line(R"(/i "/tmp/my dir/setup.msi"  /qn)");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "/i");
    EXPECT_EQ(tokens[1], "/tmp/my dir/setup.msi");
    EXPECT_EQ(tokens[2], "/qn");
}

TEST(UtilsTest, SplitCommandLineQuotesInsideToken) {
    auto tokens = split_command_line(R"(/DIR="/opt/foo bar" "" "say \"hi\"")");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "/DIR=/opt/foo bar");
    EXPECT_EQ(tokens[1], "");
    EXPECT_EQ(tokens[2], "say \"hi\"");
}

TEST(UtilsTest, SplitCommandLineUnbalancedQuotesThrow) {
    load_test_strings();
    EXPECT_THROW(split_command_line(R"(/LOG="/tmp/x.log)"), SetupctlException);
}

TEST(UtilsTest, TmpDirManagerRemovesDirectory) {
    fs::path dir;
    {
        TmpDirManager tmp;
        dir = tmp.path();
        EXPECT_EQ(dir, get_tmp_dir());
        EXPECT_TRUE(fs::is_directory(dir));
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST(UtilsTest, SplitFieldsKeepsEmptyFields) {
    EXPECT_EQ(split_fields("a\tb", '\t'), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_fields("a\t\tc\t", '\t'), (std::vector<std::string>{"a", "", "c", ""}));
    EXPECT_EQ(split_fields("", '\t'), (std::vector<std::string>{""}));
}
