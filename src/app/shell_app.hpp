#pragma once

#include <iosfwd>
#include <string_view>

#include "app/shell_options.hpp"
#include "builtins/builtin_registry.hpp"
#include "core/parser.hpp"
#include "core/path_resolver.hpp"
#include "core/tokenizer.hpp"
#include "execution/dispatcher.hpp"
#include "execution/output_router.hpp"
#include "execution/process_executor.hpp"

namespace minsh {

class ShellApp {
  public:
    explicit ShellApp(ShellOptions options = {});
    ShellApp(ShellOptions options, std::ostream &out, std::ostream &err);

    // Reads lines with readline until `exit` or end of input. Returns the
    // status given to `exit`, or 0 at end of input.
    int run();

    // Tokenizes, parses, dispatches and routes one input line. Returns false
    // once `exit` has been accepted.
    bool execute_line(std::string_view line);

    [[nodiscard]] int exit_status() const noexcept;

  private:
    ShellOptions options_;
    std::ostream &out_;
    std::ostream &err_;

    PathResolver path_resolver_;
    BuiltinRegistry builtin_registry_;
    Tokenizer tokenizer_;
    Parser parser_;
    ProcessExecutor process_executor_;
    Dispatcher dispatcher_;
    OutputRouter output_router_;

    void trace_command(const Command &command) const;
    void trace_result(const Command &command, const ExecutionResult &result, bool routed) const;
};

} // namespace minsh
