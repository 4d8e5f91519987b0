#include <gtest/gtest.h>
#include "../src/selector.hpp"
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include "fakes.hpp"

class SelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        load_test_strings();
        set_architecture("x64");
    }

    void TearDown() override {
        set_architecture("");
    }
};

TEST_F(SelectorTest, PrefersHostArchitecture) {
    std::vector<InstallerDescriptor> candidates = {
        {"foo-any.exe", "", "any"},
        {"foo-x86.exe", "", "x86"},
        {"foo-x64.exe", "", "x64"},
    };
    ArchitectureInstallerSelector selector;
    EXPECT_EQ(selector.best_installer(candidates).location, "foo-x64.exe");
}

TEST_F(SelectorTest, FallsBackToNeutralThenFirst) {
    ArchitectureInstallerSelector selector;

    std::vector<InstallerDescriptor> neutral = {{"foo-arm64.exe", "", "arm64"}, {"foo.exe", "", ""}};
    EXPECT_EQ(selector.best_installer(neutral).location, "foo.exe");

    std::vector<InstallerDescriptor> foreign = {{"foo-arm64.exe", "", "arm64"}, {"foo-x86.exe", "", "x86"}};
    EXPECT_EQ(selector.best_installer(foreign).location, "foo-arm64.exe");
}

TEST_F(SelectorTest, NoCandidatesThrows) {
    ArchitectureInstallerSelector selector;
    EXPECT_THROW(selector.best_installer({}), SetupctlException);
}
