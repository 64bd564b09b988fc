#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"

using minsh::BuiltinRegistry;
using minsh::PathResolver;

namespace {

namespace fs = std::filesystem;

class EnvVarGuard {
  public:
    explicit EnvVarGuard(const char *name) : name_(name) {
        const char *value = std::getenv(name_.c_str());
        if (value != nullptr) {
            had_value_ = true;
            value_ = value;
        }
    }

    ~EnvVarGuard() {
        if (had_value_) {
            setenv(name_.c_str(), value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

  private:
    std::string name_;
    bool had_value_{false};
    std::string value_;
};

class CurrentPathGuard {
  public:
    CurrentPathGuard() : previous_(fs::current_path()) {}
    ~CurrentPathGuard() {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

  private:
    fs::path previous_;
};

std::string make_temp_dir() {
    std::string pattern = "/tmp/minsh_builtin_registry_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return created;
}

void reset(std::ostringstream &stream) {
    stream.str("");
    stream.clear();
}

void test_registry_is_an_exact_allow_list() {
    PathResolver resolver;
    BuiltinRegistry registry(resolver);

    for (const char *name : {"exit", "echo", "type", "pwd", "cd"}) {
        assert(registry.is_builtin(name));
    }

    assert(!registry.is_builtin("Echo"));
    assert(!registry.is_builtin("history"));
    assert(!registry.is_builtin("register_builtins"));
    assert(!registry.is_builtin("builtin_echo"));
    assert(!registry.is_builtin(""));

    std::ostringstream out;
    std::ostringstream err;
    assert(registry.execute("definitely_missing_builtin", {}, out, err) == 1);
    assert(out.str().empty());
}

void test_echo_joins_arguments() {
    PathResolver resolver;
    BuiltinRegistry registry(resolver);

    std::ostringstream out;
    std::ostringstream err;

    assert(registry.execute("echo", {"a", "b", "c"}, out, err) == 0);
    assert(out.str() == "a b c\n");

    reset(out);
    assert(registry.execute("echo", {}, out, err) == 0);
    assert(out.str() == "\n");

    reset(out);
    assert(registry.execute("echo", {"spaced  words", ""}, out, err) == 0);
    assert(out.str() == "spaced  words \n");
    assert(err.str().empty());
}

void test_pwd_and_cd() {
    EnvVarGuard home_guard("HOME");
    CurrentPathGuard cwd_guard;

    const std::string home_dir = make_temp_dir();
    const std::string other_dir = make_temp_dir();
    fs::create_directory(fs::path(home_dir) / "projects");
    setenv("HOME", home_dir.c_str(), 1);

    PathResolver resolver;
    BuiltinRegistry registry(resolver);

    std::ostringstream out;
    std::ostringstream err;

    assert(registry.execute("cd", {other_dir}, out, err) == 0);
    assert(fs::current_path() == fs::path(other_dir));

    assert(registry.execute("pwd", {}, out, err) == 0);
    assert(out.str() == other_dir + "\n");

    assert(registry.execute("cd", {"~"}, out, err) == 0);
    assert(fs::current_path() == fs::path(home_dir));

    assert(registry.execute("cd", {"~/projects"}, out, err) == 0);
    assert(fs::current_path() == fs::path(home_dir) / "projects");

    assert(registry.execute("cd", {".."}, out, err) == 0);
    assert(fs::current_path() == fs::path(home_dir));
    assert(err.str().empty());

    const auto before = fs::current_path();
    assert(registry.execute("cd", {"/definitely/no/such/dir"}, out, err) == 1);
    assert(err.str() == "cd: /definitely/no/such/dir: No such file or directory\n");
    assert(fs::current_path() == before);

    reset(err);
    assert(registry.execute("cd", {"~/missing"}, out, err) == 1);
    assert(err.str() == "cd: " + home_dir + "/missing: No such file or directory\n");

    reset(out);
    assert(registry.execute("pwd", {"ignored"}, out, err) == 0);
    assert(out.str() == before.string() + "\n");

    std::error_code ec;
    fs::remove_all(home_dir, ec);
    fs::remove_all(other_dir, ec);
}

void test_cd_requires_exactly_one_argument() {
    CurrentPathGuard cwd_guard;

    PathResolver resolver;
    BuiltinRegistry registry(resolver);

    std::ostringstream out;
    std::ostringstream err;
    const auto before = fs::current_path();

    assert(registry.execute("cd", {}, out, err) == 1);
    assert(err.str() == "cd: invalid number of arguments\n");

    reset(err);
    assert(registry.execute("cd", {"/", "/tmp"}, out, err) == 1);
    assert(err.str() == "cd: invalid number of arguments\n");
    assert(fs::current_path() == before);
    assert(out.str().empty());
}

void test_type_for_all_branches() {
    EnvVarGuard path_guard("PATH");

    const std::string dir = make_temp_dir();
    const fs::path exe = fs::path(dir) / "custom_type_exe";

    {
        std::ofstream file(exe);
        assert(file.is_open());
        file << "#!/bin/sh\necho ok\n";
    }

    setenv("PATH", dir.c_str(), 1);

    PathResolver resolver;
    BuiltinRegistry registry(resolver);

    std::ostringstream out;
    std::ostringstream err;

    assert(registry.execute("type", {}, out, err) == 1);
    assert(err.str() == "type: invalid number of arguments\n");

    reset(err);
    assert(registry.execute("type", {"echo", "pwd"}, out, err) == 1);
    assert(err.str() == "type: invalid number of arguments\n");
    assert(out.str().empty());

    reset(err);
    assert(registry.execute("type", {"exit"}, out, err) == 0);
    assert(out.str() == "exit is a shell builtin\n");

    reset(out);
    assert(registry.execute("type", {"custom_type_exe"}, out, err) == 0);
    assert(out.str() == "custom_type_exe is " + exe.string() + "\n");

    reset(out);
    assert(registry.execute("type", {"nonexistent_cmd_xyz"}, out, err) == 1);
    assert(out.str().empty());
    assert(err.str() == "nonexistent_cmd_xyz: not found\n");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_exit_variants() {
    PathResolver resolver;

    std::ostringstream out;
    std::ostringstream err;

    {
        BuiltinRegistry registry(resolver);
        assert(!registry.exit_requested());
        assert(registry.execute("exit", {}, out, err) == 0);
        assert(registry.exit_requested());
        assert(registry.exit_status() == 0);
    }

    {
        BuiltinRegistry registry(resolver);
        assert(registry.execute("exit", {"0"}, out, err) == 0);
        assert(registry.exit_requested());
        assert(registry.exit_status() == 0);
    }

    {
        BuiltinRegistry registry(resolver);
        assert(registry.execute("exit", {"7"}, out, err) == 0);
        assert(registry.exit_requested());
        assert(registry.exit_status() == 7);
    }

    {
        BuiltinRegistry registry(resolver);
        assert(registry.execute("exit", {"255"}, out, err) == 0);
        assert(registry.exit_requested());
        assert(registry.exit_status() == 255);
    }

    {
        BuiltinRegistry registry(resolver);
        assert(registry.execute("exit", {"1", "2"}, out, err) == 1);
        assert(!registry.exit_requested());
        assert(err.str() == "exit: invalid number of arguments\n");
    }

    for (const char *bad : {"abc", "-1", "3x", "", "256", "99999999999"}) {
        BuiltinRegistry registry(resolver);
        reset(err);
        assert(registry.execute("exit", {bad}, out, err) == 1);
        assert(!registry.exit_requested());
        assert(err.str() == std::string("exit: ") + bad + ": numeric argument required\n");
    }

    assert(out.str().empty());
}

} // namespace

int main() {
    test_registry_is_an_exact_allow_list();
    test_echo_joins_arguments();
    test_pwd_and_cd();
    test_cd_requires_exactly_one_argument();
    test_type_for_all_branches();
    test_exit_variants();

    return 0;
}
