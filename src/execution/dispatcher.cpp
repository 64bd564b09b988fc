#include "execution/dispatcher.hpp"

#include <format>
#include <sstream>

#include "builtins/builtin_registry.hpp"
#include "core/path_resolver.hpp"
#include "execution/process_executor.hpp"

namespace minsh {

Dispatcher::Dispatcher(
    const PathResolver &path_resolver, BuiltinRegistry &builtin_registry, const ProcessExecutor &process_executor)
    : path_resolver_(path_resolver), builtin_registry_(builtin_registry), process_executor_(process_executor) {}

ExecutionResult Dispatcher::dispatch(const Command &command) {
    if (builtin_registry_.is_builtin(command.name)) {
        std::ostringstream out;
        std::ostringstream err;

        ExecutionResult result;
        result.exit_status = builtin_registry_.execute(command.name, command.args, out, err);
        result.stdout_data = out.str();
        result.stderr_data = err.str();
        return result;
    }

    const auto executable = path_resolver_.find_command(command.name);
    if (!executable.has_value()) {
        return ExecutionResult{
            .stdout_data = {},
            .stderr_data = std::format("{}: command not found\n", command.name),
            .exit_status = 127,
        };
    }

    return process_executor_.run(*executable, command);
}

} // namespace minsh
