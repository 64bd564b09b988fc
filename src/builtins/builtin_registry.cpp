#include "builtins/builtin_registry.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <ostream>
#include <string>
#include <system_error>

#include "core/path_resolver.hpp"

namespace minsh {

namespace fs = std::filesystem;

namespace {

// Larger values would be truncated by the OS to their low byte.
constexpr int max_exit_status = 255;

} // namespace

BuiltinRegistry::BuiltinRegistry(const PathResolver &path_resolver) : path_resolver_(path_resolver) {
    register_builtins();
}

bool BuiltinRegistry::is_builtin(std::string_view command) const {
    return registry_.contains(std::string(command));
}

int BuiltinRegistry::execute(
    std::string_view command, const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    auto it = registry_.find(std::string(command));
    if (it == registry_.end()) {
        return 1;
    }

    return it->second(args, out, err);
}

bool BuiltinRegistry::exit_requested() const noexcept { return exit_requested_; }

int BuiltinRegistry::exit_status() const noexcept { return exit_status_; }

void BuiltinRegistry::register_builtins() {
    registry_["cd"] = [this](const auto &args, auto &out, auto &err) { return builtin_cd(args, out, err); };
    registry_["echo"] = [this](const auto &args, auto &out, auto &err) { return builtin_echo(args, out, err); };
    registry_["pwd"] = [this](const auto &args, auto &out, auto &err) { return builtin_pwd(args, out, err); };
    registry_["type"] = [this](const auto &args, auto &out, auto &err) { return builtin_type(args, out, err); };
    registry_["exit"] = [this](const auto &args, auto &out, auto &err) { return builtin_exit(args, out, err); };
}

bool BuiltinRegistry::require_one_argument(
    std::string_view name, const std::vector<std::string> &args, std::ostream &err) {
    if (args.size() == 1) {
        return true;
    }

    err << name << ": invalid number of arguments" << std::endl;
    return false;
}

int BuiltinRegistry::builtin_cd(const std::vector<std::string> &args, std::ostream & /*out*/, std::ostream &err) {
    if (!require_one_argument("cd", args, err)) {
        return 1;
    }

    std::string target = args.front();
    if (const char *home = std::getenv("HOME"); home != nullptr) {
        const std::string home_dir(home);
        for (auto pos = target.find('~'); pos != std::string::npos; pos = target.find('~', pos + home_dir.size())) {
            target.replace(pos, 1, home_dir);
        }
    }

    std::error_code ec;
    fs::current_path(target, ec);
    if (ec) {
        err << "cd: " << target << ": " << ec.message() << std::endl;
        return 1;
    }

    return 0;
}

int BuiltinRegistry::builtin_echo(const std::vector<std::string> &args, std::ostream &out, std::ostream & /*err*/) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }

        out << args[i];
    }

    out << std::endl;
    return 0;
}

int BuiltinRegistry::builtin_pwd(const std::vector<std::string> & /*args*/, std::ostream &out, std::ostream &err) {
    std::error_code ec;
    const auto cwd = fs::current_path(ec);
    if (ec) {
        err << "pwd: " << ec.message() << std::endl;
        return 1;
    }

    out << cwd.string() << std::endl;
    return 0;
}

int BuiltinRegistry::builtin_type(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    if (!require_one_argument("type", args, err)) {
        return 1;
    }

    const auto &name = args.front();
    if (is_builtin(name)) {
        out << name << " is a shell builtin" << std::endl;
        return 0;
    }

    if (const auto executable = path_resolver_.find_command(name); executable.has_value()) {
        out << name << " is " << executable->absolute_path() << std::endl;
        return 0;
    }

    err << name << ": not found" << std::endl;
    return 1;
}

int BuiltinRegistry::builtin_exit(const std::vector<std::string> &args, std::ostream & /*out*/, std::ostream &err) {
    if (args.empty()) {
        exit_status_ = 0;
        exit_requested_ = true;
        return 0;
    }

    if (!require_one_argument("exit", args, err)) {
        return 1;
    }

    const auto &token = args.front();
    const char *first = token.data();
    const char *last = token.data() + token.size();

    int status = 0;
    auto [ptr, ec] = std::from_chars(first, last, status);
    if (ec != std::errc{} || ptr != last || status < 0 || status > max_exit_status) {
        err << "exit: " << token << ": numeric argument required" << std::endl;
        return 1;
    }

    exit_status_ = status;
    exit_requested_ = true;
    return 0;
}

} // namespace minsh
