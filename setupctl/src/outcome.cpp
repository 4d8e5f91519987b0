#include "outcome.hpp"

RunResult classify_outcome(int exit_code, const InstallerAdapter& adapter,
                           const std::optional<std::filesystem::path>& log_file) {
    RunResult result;
    result.exit_code = exit_code;
    if (exit_code == 0) {
        return result;
    }

    if (auto it = adapter.exit_codes.find(exit_code); it != adapter.exit_codes.end()) {
        result.reason = it->second;
    }
    result.log_file = log_file;
    return result;
}
