#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace minsh {

class PathResolver;

class BuiltinRegistry {
  public:
    using BuiltinFunc = std::function<int(const std::vector<std::string> &, std::ostream &, std::ostream &)>;

    explicit BuiltinRegistry(const PathResolver &path_resolver);

    [[nodiscard]] bool is_builtin(std::string_view command) const;
    int execute(std::string_view command, const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

    [[nodiscard]] bool exit_requested() const noexcept;
    [[nodiscard]] int exit_status() const noexcept;

  private:
    const PathResolver &path_resolver_;
    bool exit_requested_{false};
    int exit_status_{0};
    std::unordered_map<std::string, BuiltinFunc> registry_;

    void register_builtins();

    // Reports "<name>: invalid number of arguments" unless exactly one argument was given.
    [[nodiscard]] static bool require_one_argument(
        std::string_view name, const std::vector<std::string> &args, std::ostream &err);

    int builtin_cd(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int builtin_echo(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int builtin_pwd(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int builtin_type(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
    int builtin_exit(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);
};

} // namespace minsh
