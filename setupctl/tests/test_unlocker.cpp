#include <gtest/gtest.h>
#include "../src/unlocker.hpp"
#include "fakes.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class UnlockerTest : public ::testing::Test {
protected:
    fs::path install_dir;

    void SetUp() override {
        load_test_strings();
        install_dir = fs::absolute("tmp_unlocker_test");
        if (fs::exists(install_dir)) fs::remove_all(install_dir);
        fs::create_directories(install_dir / "bin");
        std::ofstream(install_dir / "bin" / "foo") << "binary";
        std::ofstream(install_dir / "readme.txt") << "text";
    }

    void TearDown() override {
        if (fs::exists(install_dir)) {
            fs::permissions(install_dir, fs::perms::owner_all, fs::perm_options::add);
            fs::permissions(install_dir / "bin", fs::perms::owner_all, fs::perm_options::add);
            fs::remove_all(install_dir);
        }
    }

    static bool owner_writable(const fs::path& p) {
        return (fs::status(p).permissions() & fs::perms::owner_write) != fs::perms::none;
    }
};

TEST_F(UnlockerTest, MakesInstallationWritable) {
    fs::permissions(install_dir / "bin" / "foo", fs::perms::owner_write, fs::perm_options::remove);
    fs::permissions(install_dir / "readme.txt", fs::perms::owner_write, fs::perm_options::remove);
    fs::permissions(install_dir / "bin", fs::perms::owner_write, fs::perm_options::remove);

    FolderUnlocker unlocker;
    unlocker.unlock(install_dir, "inno");

    EXPECT_TRUE(owner_writable(install_dir / "bin"));
    EXPECT_TRUE(owner_writable(install_dir / "bin" / "foo"));
    EXPECT_TRUE(owner_writable(install_dir / "readme.txt"));
}

TEST_F(UnlockerTest, Idempotent) {
    FolderUnlocker unlocker;
    unlocker.unlock(install_dir, "msi");
    unlocker.unlock(install_dir, "msi");
    EXPECT_TRUE(owner_writable(install_dir / "readme.txt"));
}

TEST_F(UnlockerTest, MissingPathIsNotAnError) {
    FolderUnlocker unlocker;
    EXPECT_NO_THROW(unlocker.unlock(install_dir / "gone", "msi"));
}
