#include <gtest/gtest.h>
#include "../src/matcher.hpp"

namespace {

InstalledRecord record(const std::string& id, const std::string& package_id, const std::string& name) {
    return {id, package_id, "msi", name, "1.0", std::nullopt};
}

} // namespace

TEST(MatcherTest, NormalizeName) {
    EXPECT_EQ(normalize_name("Foo-Bar 2.0"), "foobar20");
    EXPECT_EQ(normalize_name("  "), "");
}

TEST(MatcherTest, MatchesPackageIdOrDisplayNamePrefix) {
    NameRecordMatcher matcher;
    std::vector<InstalledRecord> records = {
        record("1", "", "Foo"),
        record("2", "", "Foo-Beta"),
        record("3", "", "Bar"),
        record("4", "foo", "Something Else"),
    };

    auto matches = matcher.match_for(records, "foo");
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].id, "1");
    EXPECT_EQ(matches[1].id, "2");
    EXPECT_EQ(matches[2].id, "4");
}

TEST(MatcherTest, CaseAndPunctuationIgnored) {
    NameRecordMatcher matcher;
    std::vector<InstalledRecord> records = {record("1", "", "My App (x64)")};
    EXPECT_EQ(matcher.match_for(records, "my-app").size(), 1u);
    EXPECT_TRUE(matcher.match_for(records, "other").empty());
}

TEST(MatcherTest, EmptyTargetMatchesNothing) {
    NameRecordMatcher matcher;
    std::vector<InstalledRecord> records = {record("1", "foo", "Foo")};
    EXPECT_TRUE(matcher.match_for(records, "--").empty());
}
