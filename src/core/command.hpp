#pragma once

#include <optional>
#include <string>
#include <vector>

namespace minsh {

enum class RedirectionStream {
    Stdout,
    Stderr,
};

struct Redirection {
    RedirectionStream stream;
    std::string target;
};

// One parsed input line. `redirections` keeps every operator in input order so
// that overwritten targets are still created; the effective target of a stream
// is the last one recorded for it.
struct Command {
    std::string name;
    std::vector<std::string> args;
    std::vector<Redirection> redirections;

    [[nodiscard]] std::optional<std::string> target_for(RedirectionStream stream) const {
        std::optional<std::string> target;
        for (const auto &redirection : redirections) {
            if (redirection.stream == stream) {
                target = redirection.target;
            }
        }

        return target;
    }

    [[nodiscard]] std::optional<std::string> stdout_target() const { return target_for(RedirectionStream::Stdout); }
    [[nodiscard]] std::optional<std::string> stderr_target() const { return target_for(RedirectionStream::Stderr); }
};

struct ExecutionResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_status{0};
};

} // namespace minsh
