#include "core/parser.hpp"

#include <format>
#include <optional>
#include <string_view>
#include <utility>

namespace minsh {

namespace {

[[nodiscard]] std::optional<RedirectionStream> redirection_from_token(std::string_view token) {
    if (token == ">" || token == "1>") {
        return RedirectionStream::Stdout;
    }

    if (token == "2>") {
        return RedirectionStream::Stderr;
    }

    return std::nullopt;
}

} // namespace

std::expected<Command, ParseError> Parser::parse(std::span<const std::string> tokens) const {
    Command command;
    if (tokens.empty()) {
        return command;
    }

    command.name = tokens.front();

    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto &token = tokens[i];

        const auto stream = redirection_from_token(token);
        if (!stream.has_value()) {
            command.args.push_back(token);
            continue;
        }

        if (i + 1 >= tokens.size() || redirection_from_token(tokens[i + 1]).has_value()) {
            return std::unexpected(ParseError{
                .kind = ParseErrorKind::InvalidRedirection,
                .message = std::format("minsh: syntax error: redirection '{}' is missing a target file", token),
            });
        }

        command.redirections.push_back(Redirection{.stream = *stream, .target = tokens[i + 1]});
        ++i;
    }

    return command;
}

} // namespace minsh
