#pragma once

#include <sys/types.h>

#include "core/command.hpp"

namespace minsh {

class ResolvedExecutable;

class ProcessExecutor {
  public:
    // Runs `executable` with `command.args`, blocking until it exits. The child
    // inherits stdin and the working directory; its stdout and stderr are
    // captured separately.
    [[nodiscard]] ExecutionResult run(const ResolvedExecutable &executable, const Command &command) const;

  private:
    [[noreturn]] static void exec_in_child(
        const ResolvedExecutable &executable, const Command &command, int stdout_fd, int stderr_fd) noexcept;
    static void drain(int stdout_fd, int stderr_fd, ExecutionResult &result);

    [[nodiscard]] static int wait_for_process(pid_t pid);
    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace minsh
