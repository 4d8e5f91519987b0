#include <gtest/gtest.h>
#include "../src/hash.hpp"
#include "../src/exception.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class HashTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        work_dir = fs::absolute("tmp_hash_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }

    fs::path create_dummy_file(const std::string& name, const std::string& content) {
        fs::path p = work_dir / name;
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p;
    }
};

TEST_F(HashTest, CalculateSHA256) {
    // echo -n "hello world" | sha256sum
    fs::path path = create_dummy_file("test.txt", "hello world");
    EXPECT_EQ(calculate_sha256(path), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashTest, EmptyFile) {
    fs::path path = create_dummy_file("empty.txt", "");
    EXPECT_EQ(calculate_sha256(path), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, LargerThanOneBuffer) {
    fs::path path = create_dummy_file("big.bin", std::string(20000, 'a'));
    fs::path same = create_dummy_file("big2.bin", std::string(20000, 'a'));
    fs::path other = create_dummy_file("big3.bin", std::string(19999, 'a') + "b");
    EXPECT_EQ(calculate_sha256(path), calculate_sha256(same));
    EXPECT_NE(calculate_sha256(path), calculate_sha256(other));
    EXPECT_EQ(calculate_sha256(path).size(), 64u);
}

TEST_F(HashTest, MissingFileThrows) {
    EXPECT_THROW(calculate_sha256(work_dir / "missing"), SetupctlException);
}

TEST_F(HashTest, IncrementalDigestMatchesWholeFile) {
    fs::path path = create_dummy_file("test.txt", "hello world");
    Sha256Digest digest;
    digest.update("hello", 5);
    digest.update(" ", 1);
    digest.update("world", 5);
    EXPECT_EQ(digest.hex_digest(), calculate_sha256(path));
}

TEST_F(HashTest, DeclaredDigestComparison) {
    const std::string actual = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";
    EXPECT_TRUE(sha256_matches(actual, "B94D27B9934D3E08A52E52D7DA7DABFAC484EFE37A5380EE9088F7ACE2EFCDE9"));
    EXPECT_TRUE(sha256_matches(actual, " " + actual + "\n"));
    EXPECT_FALSE(sha256_matches(actual, actual.substr(1)));
}
