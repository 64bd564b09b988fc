#pragma once

#include <expected>
#include <span>
#include <string>
#include <vector>

#include "core/command.hpp"

namespace minsh {

enum class ParseErrorKind {
    InvalidRedirection,
};

struct ParseError {
    ParseErrorKind kind;
    std::string message;
};

class Parser {
  public:
    // `tokens` must not be empty. The first token is always the command name;
    // redirection operators are only recognised among the arguments.
    [[nodiscard]] std::expected<Command, ParseError> parse(std::span<const std::string> tokens) const;
};

} // namespace minsh
