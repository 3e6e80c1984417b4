/**
 * \file process/PosixProcessInvoker.cpp
 * \brief fork/execve handler spawning with exec error reporting.
 */
#include "PosixProcessInvoker.hpp"

#include <processUtils.hpp>

#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Hare::Process {

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

/// Read the exec errno written by the child; 0 bytes means exec succeeded.
ssize_t read_exec_errno(int fd, int& child_errno) {
    ssize_t n;
    do {
        n = ::read(fd, &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    return n;
}

/// execve cannot carry a NUL, and a '=' in a name moves the split point.
bool representable(const Dispatch::EnvironmentOverlay& overlay) {
    for (const auto& [name, value] : overlay) {
        if (name.empty() || name.find_first_of(std::string("=\0", 2)) != std::string::npos) return false;
        if (value.find('\0') != std::string::npos) return false;
    }
    return true;
}

} // namespace

std::vector<std::string> PosixProcessInvoker::merge_environment(const Dispatch::EnvironmentOverlay& overlay) {
    std::vector<std::string> merged;
    for (auto& entry : ProcessUtils::environment_snapshot()) {
        if (overlay.find(ProcessUtils::environment_name(entry)) == overlay.end()) {
            merged.push_back(std::move(entry));
        }
    }
    for (const auto& [name, value] : overlay) {
        merged.push_back(name + "=" + value);
    }
    return merged;
}

ExitStatus PosixProcessInvoker::invoke(const std::filesystem::path& executable,
                                       const Dispatch::EnvironmentOverlay& overlay,
                                       std::error_code& ec) {
    ec.clear();
    if (!representable(overlay)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return {};
    }

    // Everything the child touches is prepared before fork; after fork the
    // child only calls execve, write and _exit.
    const std::string exe = executable.string();
    std::vector<std::string> env_entries = merge_environment(overlay);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
    std::string argv0 = exe;
    char* argv[] = {argv0.data(), nullptr};

    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        ec = last_error();
        return {};
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        ec = last_error();
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return {};
    }

    if (pid == 0) {
        ::close(exec_pipe[0]);
        ::execve(exe.c_str(), argv, envp.data());
        int err = errno;
        ssize_t written = ::write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    ::close(exec_pipe[1]);
    int child_errno = 0;
    ssize_t n = read_exec_errno(exec_pipe[0], child_errno);
    ::close(exec_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            ec = last_error();
            return {};
        }
    }

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ec = std::error_code(child_errno, std::generic_category());
        return {};
    }
    if (WIFSIGNALED(status)) {
        return ExitStatus::killed(WTERMSIG(status));
    }
    return ExitStatus::exited(WEXITSTATUS(status));
}

} // namespace Hare::Process
