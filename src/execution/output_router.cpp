#include "execution/output_router.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <ostream>
#include <unistd.h>

namespace minsh {

namespace {

int posix_open(const char *path, int flags, unsigned int mode) { return open(path, flags, mode); }

long posix_write(int fd, const void *data, unsigned long size) { return write(fd, data, size); }

int posix_close(int fd) { return close(fd); }

const RedirectionSyscalls default_syscalls{
    .open_fn = &posix_open,
    .write_fn = &posix_write,
    .close_fn = &posix_close,
};

constexpr int truncate_flags = O_WRONLY | O_CREAT | O_TRUNC;
constexpr unsigned int target_mode = 0644;

} // namespace

OutputRouter::OutputRouter(std::ostream &out, std::ostream &err, const RedirectionSyscalls *syscalls)
    : out_(out), err_(err), syscalls_(syscalls != nullptr ? syscalls : &default_syscalls) {}

std::expected<void, std::string> OutputRouter::prepare(const Command &command) const {
    for (const auto &redirection : command.redirections) {
        const int fd = syscalls_->open_fn(redirection.target.c_str(), truncate_flags, target_mode);
        if (fd == -1) {
            return std::unexpected(std::format("failed to open '{}': {}", redirection.target, std::strerror(errno)));
        }

        syscalls_->close_fn(fd);
    }

    return {};
}

std::expected<void, std::string> OutputRouter::route(const Command &command, const ExecutionResult &result) const {
    auto stdout_routed = route_stream(command.stdout_target(), result.stdout_data, out_);
    auto stderr_routed = route_stream(command.stderr_target(), result.stderr_data, err_);

    if (!stdout_routed.has_value() && !stderr_routed.has_value()) {
        return std::unexpected(std::format("{}\n{}", stdout_routed.error(), stderr_routed.error()));
    }

    if (!stdout_routed.has_value()) {
        return stdout_routed;
    }

    return stderr_routed;
}

std::expected<void, std::string> OutputRouter::route_stream(
    const std::optional<std::string> &target, std::string_view data, std::ostream &fallback) const {
    if (target.has_value()) {
        return write_file(*target, data);
    }

    fallback << data << std::flush;
    return {};
}

std::expected<void, std::string> OutputRouter::write_file(const std::string &path, std::string_view data) const {
    const int fd = syscalls_->open_fn(path.c_str(), truncate_flags, target_mode);
    if (fd == -1) {
        return std::unexpected(std::format("failed to open '{}': {}", path, std::strerror(errno)));
    }

    std::size_t written = 0;
    while (written < data.size()) {
        const long count = syscalls_->write_fn(fd, data.data() + written, data.size() - written);
        if (count == -1) {
            if (errno == EINTR) {
                continue;
            }

            const int saved_errno = errno;
            syscalls_->close_fn(fd);
            return std::unexpected(std::format("failed to write '{}': {}", path, std::strerror(saved_errno)));
        }

        written += static_cast<std::size_t>(count);
    }

    syscalls_->close_fn(fd);
    return {};
}

} // namespace minsh
