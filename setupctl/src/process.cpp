#include "process.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

namespace {

LaunchFailureException launch_failure(const fs::path& path, int err) {
    return LaunchFailureException(path, err, string_format("error.launch_failed", path.string(), std::strerror(err)));
}

} // anonymous namespace

ProcessHandle PosixProcessController::start(const fs::path& path, const std::string& arguments) {
    std::vector<std::string> args = {path.string()};
    for (auto& token : split_command_line(arguments)) {
        args.push_back(std::move(token));
    }

    std::vector<char*> c_args;
    for (auto& arg : args) c_args.push_back(arg.data());
    c_args.push_back(nullptr);

    // The child reports a failed exec through this pipe; it closes on a successful exec.
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        throw launch_failure(path, errno);
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        throw launch_failure(path, err);
    }

    if (pid == 0) {
        close(status_pipe[0]);
        execvp(c_args[0], c_args.data());
        int err = errno;
        ssize_t written = write(status_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        throw launch_failure(path, child_errno);
    }

    return ProcessHandle{pid, path};
}

int PosixProcessController::wait_for_exit(ProcessHandle& handle) {
    int status = 0;
    while (waitpid(handle.pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw SetupctlException(string_format("error.wait_failed", handle.executable.string(), std::strerror(errno)));
        }
    }
    handle.pid = -1;

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

int run_process(ProcessController& controller, const fs::path& path, const std::string& arguments) {
    log_info(string_format("info.starting_process", path.string(), arguments));
    ProcessHandle handle = controller.start(path, arguments);
    log_info(get_string("info.waiting_for_installer"));
    return controller.wait_for_exit(handle);
}
