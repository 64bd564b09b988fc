#include "app/shell_app.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <readline/readline.h>

namespace minsh {

ShellApp::ShellApp(ShellOptions options) : ShellApp(options, std::cout, std::cerr) {}

ShellApp::ShellApp(ShellOptions options, std::ostream &out, std::ostream &err)
    : options_(options),
      out_(out),
      err_(err),
      path_resolver_(),
      builtin_registry_(path_resolver_),
      tokenizer_(),
      parser_(),
      process_executor_(),
      dispatcher_(path_resolver_, builtin_registry_, process_executor_),
      output_router_(out_, err_) {}

int ShellApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    while (true) {
        char *line = readline("$ ");
        if (line == nullptr) {
            out_ << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        if (!execute_line(input)) {
            break;
        }
    }

    return exit_status();
}

bool ShellApp::execute_line(std::string_view line) {
    const auto tokens = tokenizer_.tokenize(line);
    if (tokens.empty()) {
        return true;
    }

    auto command_result = parser_.parse(tokens);
    if (!command_result.has_value()) {
        err_ << command_result.error().message << std::endl;
        return true;
    }

    const Command &command = command_result.value();
    trace_command(command);

    if (auto prepared = output_router_.prepare(command); !prepared.has_value()) {
        err_ << prepared.error() << std::endl;
        return true;
    }

    try {
        const auto result = dispatcher_.dispatch(command);

        const auto routed = output_router_.route(command, result);
        if (!routed.has_value()) {
            err_ << routed.error() << std::endl;
        }

        trace_result(command, result, routed.has_value());
    } catch (const std::runtime_error &error) {
        err_ << "minsh: " << error.what() << std::endl;
    }

    return !builtin_registry_.exit_requested();
}

int ShellApp::exit_status() const noexcept { return builtin_registry_.exit_status(); }

void ShellApp::trace_command(const Command &command) const {
    if (!options_.trace) {
        return;
    }

    err_ << "[minsh] command=" << command.name << " arguments=[";
    for (std::size_t i = 0; i < command.args.size(); ++i) {
        if (i > 0) {
            err_ << ", ";
        }
        err_ << command.args[i];
    }

    err_ << "] stdout=" << command.stdout_target().value_or("-") << " stderr=" << command.stderr_target().value_or("-")
         << std::endl;
}

void ShellApp::trace_result(const Command &command, const ExecutionResult &result, bool routed) const {
    if (!options_.trace) {
        return;
    }

    if (const auto target = command.stdout_target(); routed && target.has_value()) {
        err_ << "[minsh] wrote " << result.stdout_data.size() << " bytes to '" << *target << "'" << std::endl;
    }

    if (const auto target = command.stderr_target(); routed && target.has_value()) {
        err_ << "[minsh] wrote " << result.stderr_data.size() << " bytes to '" << *target << "'" << std::endl;
    }

    if (!builtin_registry_.is_builtin(command.name)) {
        err_ << "[minsh] " << command.name << " exited with status " << result.exit_status << std::endl;
    }
}

} // namespace minsh
