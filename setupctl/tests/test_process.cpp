#include <gtest/gtest.h>
#include "../src/process.hpp"
#include "../src/exception.hpp"
#include "../src/utils.hpp"
#include "fakes.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class ProcessTest : public ::testing::Test {
protected:
    fs::path work_dir;
    PosixProcessController controller;

    void SetUp() override {
        work_dir = fs::absolute("tmp_process_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }

    fs::path write_script(const std::string& name, const std::string& body, bool executable = true) {
        fs::path script = work_dir / name;
        std::ofstream f(script);
        f << "#!/bin/sh\n" << body << "\n";
        f.close();
        if (executable) {
            fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
        }
        return script;
    }
};

TEST_F(ProcessTest, ReturnsExitCodeUnmodified) {
    EXPECT_EQ(run_process(controller, "/bin/sh", "-c \"exit 0\""), 0);
    EXPECT_EQ(run_process(controller, "/bin/sh", "-c \"exit 3\""), 3);
    EXPECT_EQ(run_process(controller, "/bin/sh", "-c \"exit 200\""), 200);
}

TEST_F(ProcessTest, LooksUpBareNamesInPath) {
    EXPECT_EQ(run_process(controller, "sh", "-c \"exit 7\""), 7);
}

TEST_F(ProcessTest, PassesQuotedArgumentsAsSingleTokens) {
    fs::path out = work_dir / "args.txt";
    fs::path script = write_script("echo_args.sh", "for a in \"$@\"; do echo \"$a\"; done > \"" + out.string() + "\"");

    EXPECT_EQ(run_process(controller, script, "/S /LOG=\"/var/log/my app.log\" --flag"), 0);

    std::ifstream in(out);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) lines.push_back(line);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "/S");
    EXPECT_EQ(lines[1], "/LOG=/var/log/my app.log");
    EXPECT_EQ(lines[2], "--flag");
}

TEST_F(ProcessTest, MissingExecutableIsLaunchFailure) {
    try {
        run_process(controller, work_dir / "does-not-exist.exe", "/S");
        FAIL() << "expected LaunchFailureException";
    } catch (const LaunchFailureException& e) {
        EXPECT_EQ(e.error_number(), ENOENT);
        EXPECT_EQ(e.executable(), work_dir / "does-not-exist.exe");
    }
}

TEST_F(ProcessTest, NonExecutableFileIsLaunchFailure) {
    fs::path script = write_script("not_executable.sh", "exit 0", false);
    fs::permissions(script, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::remove);
    EXPECT_THROW(run_process(controller, script, ""), LaunchFailureException);
}

TEST_F(ProcessTest, FakeControllerLaunchFailurePropagates) {
    FakeProcessController fake;
    fake.fail_launch = true;
    EXPECT_THROW(run_process(fake, "setup.exe", "/S"), LaunchFailureException);
    EXPECT_EQ(fake.starts.size(), 1u);
}
