#pragma once

#include <sys/types.h>

#include <filesystem>
#include <string>

struct ProcessHandle {
    pid_t pid = -1;
    std::filesystem::path executable;
};

class ProcessController {
public:
    virtual ~ProcessController() = default;

    // Throws LaunchFailureException if the process cannot be started.
    virtual ProcessHandle start(const std::filesystem::path& path, const std::string& arguments) = 0;
    // Blocks until the process exits and returns its exit code.
    virtual int wait_for_exit(ProcessHandle& handle) = 0;
};

// fork/exec based controller. Bare executable names are looked up in PATH.
class PosixProcessController : public ProcessController {
public:
    ProcessHandle start(const std::filesystem::path& path, const std::string& arguments) override;
    int wait_for_exit(ProcessHandle& handle) override;
};

// Starts the installer and waits for it. No retry and no timeout.
int run_process(ProcessController& controller, const std::filesystem::path& path, const std::string& arguments);
