#pragma once

#include "core/command.hpp"

namespace minsh {

class BuiltinRegistry;
class PathResolver;
class ProcessExecutor;

class Dispatcher {
  public:
    Dispatcher(const PathResolver &path_resolver, BuiltinRegistry &builtin_registry, const ProcessExecutor &process_executor);

    // Runs exactly one of: the matching builtin, the program found on PATH, or
    // nothing with a "command not found" diagnostic on the error stream.
    [[nodiscard]] ExecutionResult dispatch(const Command &command);

  private:
    const PathResolver &path_resolver_;
    BuiltinRegistry &builtin_registry_;
    const ProcessExecutor &process_executor_;
};

} // namespace minsh
