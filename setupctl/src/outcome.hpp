#pragma once

#include "whisperer.hpp"

#include <filesystem>
#include <optional>
#include <string>

struct RunResult {
    int exit_code = 0;
    std::string reason;
    std::optional<std::filesystem::path> log_file;

    bool succeeded() const { return exit_code == 0; }
};

// Maps an exit code through the adapter's table. The log file is only kept
// for failures, and only if logging arguments were applied for the run.
RunResult classify_outcome(int exit_code, const InstallerAdapter& adapter,
                           const std::optional<std::filesystem::path>& log_file);
