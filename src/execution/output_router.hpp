#pragma once

#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "core/command.hpp"

namespace minsh {

struct RedirectionSyscalls {
    int (*open_fn)(const char *path, int flags, unsigned int mode);
    long (*write_fn)(int fd, const void *data, unsigned long size);
    int (*close_fn)(int fd);
};

// Sends a command's captured output either to its redirection targets or to
// the shell's own streams.
class OutputRouter {
  public:
    OutputRouter(std::ostream &out, std::ostream &err, const RedirectionSyscalls *syscalls = nullptr);

    // Creates or truncates every target named by `command`, including ones a
    // later operator overrides. Runs before the command is dispatched.
    [[nodiscard]] std::expected<void, std::string> prepare(const Command &command) const;

    [[nodiscard]] std::expected<void, std::string> route(const Command &command, const ExecutionResult &result) const;

  private:
    std::ostream &out_;
    std::ostream &err_;
    const RedirectionSyscalls *syscalls_;

    [[nodiscard]] std::expected<void, std::string> route_stream(
        const std::optional<std::string> &target, std::string_view data, std::ostream &fallback) const;
    [[nodiscard]] std::expected<void, std::string> write_file(const std::string &path, std::string_view data) const;
};

} // namespace minsh
