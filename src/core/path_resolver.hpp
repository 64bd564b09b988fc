#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace minsh {

class PathResolver;

// A command name resolved against PATH. Only PathResolver creates these.
class ResolvedExecutable {
  public:
    [[nodiscard]] const std::string &absolute_path() const noexcept { return absolute_path_; }

  private:
    friend class PathResolver;

    explicit ResolvedExecutable(std::string absolute_path) : absolute_path_(std::move(absolute_path)) {}

    std::string absolute_path_;
};

class PathResolver {
  public:
    // Reads PATH on every call; the first directory holding a regular file
    // named exactly `command` wins. No execute-permission check is made.
    [[nodiscard]] std::optional<ResolvedExecutable> find_command(std::string_view command) const;
};

} // namespace minsh
