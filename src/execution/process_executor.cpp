#include "execution/process_executor.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/path_resolver.hpp"

namespace minsh {

namespace {

[[nodiscard]] std::vector<char *> build_argv(const Command &command) {
    std::vector<char *> argv;
    argv.reserve(command.args.size() + 2);

    argv.push_back(const_cast<char *>(command.name.c_str()));
    for (const auto &arg : command.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    return argv;
}

void close_if_open(int &fd) noexcept {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

} // namespace

ExecutionResult ProcessExecutor::run(const ResolvedExecutable &executable, const Command &command) const {
    std::array<int, 2> stdout_pipe{-1, -1};
    std::array<int, 2> stderr_pipe{-1, -1};

    if (pipe(stdout_pipe.data()) == -1) {
        throw std::runtime_error("pipe failed");
    }

    if (pipe(stderr_pipe.data()) == -1) {
        close_if_open(stdout_pipe[0]);
        close_if_open(stdout_pipe[1]);
        throw std::runtime_error("pipe failed");
    }

    const pid_t pid = fork();
    if (pid == -1) {
        close_if_open(stdout_pipe[0]);
        close_if_open(stdout_pipe[1]);
        close_if_open(stderr_pipe[0]);
        close_if_open(stderr_pipe[1]);
        throw std::runtime_error("fork failed");
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        exec_in_child(executable, command, stdout_pipe[1], stderr_pipe[1]);
    }

    close_if_open(stdout_pipe[1]);
    close_if_open(stderr_pipe[1]);

    ExecutionResult result;
    try {
        drain(stdout_pipe[0], stderr_pipe[0], result);
    } catch (...) {
        // Reap the child and release the pipes before the failure propagates.
        close_if_open(stdout_pipe[0]);
        close_if_open(stderr_pipe[0]);
        (void)wait_for_process(pid);
        throw;
    }

    close_if_open(stdout_pipe[0]);
    close_if_open(stderr_pipe[0]);

    result.exit_status = wait_for_process(pid);
    return result;
}

void ProcessExecutor::exec_in_child(
    const ResolvedExecutable &executable, const Command &command, int stdout_fd, int stderr_fd) noexcept {
    if (dup2(stdout_fd, STDOUT_FILENO) == -1 || dup2(stderr_fd, STDERR_FILENO) == -1) {
        _exit(1);
    }

    close(stdout_fd);
    close(stderr_fd);

    auto argv = build_argv(command);
    execv(executable.absolute_path().c_str(), argv.data());
    std::perror("exec failed");
    _exit(1);
}

// Reads both pipes until each reaches end of file. Polling both keeps a child
// that fills one pipe from blocking while the other is being read.
void ProcessExecutor::drain(int stdout_fd, int stderr_fd, ExecutionResult &result) {
    std::array<pollfd, 2> fds{{
        {.fd = stdout_fd, .events = POLLIN, .revents = 0},
        {.fd = stderr_fd, .events = POLLIN, .revents = 0},
    }};
    const std::array<std::string *, 2> sinks{&result.stdout_data, &result.stderr_data};

    std::array<char, 4096> buffer{};
    std::size_t open_streams = fds.size();

    while (open_streams > 0) {
        if (poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR) {
                continue;
            }

            throw std::runtime_error("poll failed");
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            const ssize_t count = read(fds[i].fd, buffer.data(), buffer.size());
            if (count == -1) {
                if (errno == EINTR) {
                    continue;
                }

                throw std::runtime_error("read failed");
            }

            if (count == 0) {
                // Negative descriptors are ignored by poll; the caller closes the real one.
                fds[i].fd = -1;
                --open_streams;
                continue;
            }

            sinks[i]->append(buffer.data(), static_cast<std::size_t>(count));
        }
    }
}

int ProcessExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error("waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

int ProcessExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

} // namespace minsh
