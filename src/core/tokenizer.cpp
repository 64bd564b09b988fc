#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace minsh {

namespace {

[[nodiscard]] bool escapable_in_double_quotes(char c) { return c == '"' || c == '\\' || c == '$' || c == '`'; }

} // namespace

std::vector<std::string> Tokenizer::tokenize(std::string_view input) const {
    std::vector<std::string> tokens;
    std::string token;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;
    // Set once a quote is opened so that '' and "" still produce a word.
    bool in_word = false;

    auto flush_token = [&]() {
        if (in_word) {
            tokens.push_back(std::move(token));
            token.clear();
            in_word = false;
        }
    };

    for (const char current : input) {
        if (escaped) {
            if (double_quoted && !escapable_in_double_quotes(current)) {
                token.push_back('\\');
            }
            token.push_back(current);
            escaped = false;
            continue;
        }

        if (single_quoted) {
            if (current == '\'') {
                single_quoted = false;
            } else {
                token.push_back(current);
            }
            continue;
        }

        if (current == '\\') {
            escaped = true;
            in_word = true;
            continue;
        }

        if (current == '"') {
            double_quoted = !double_quoted;
            in_word = true;
            continue;
        }

        if (double_quoted) {
            token.push_back(current);
            continue;
        }

        if (current == '\'') {
            single_quoted = true;
            in_word = true;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(current))) {
            flush_token();
            continue;
        }

        token.push_back(current);
        in_word = true;
    }

    // A dangling backslash has nothing to escape and is kept as written.
    if (escaped) {
        token.push_back('\\');
    }

    flush_token();
    return tokens;
}

} // namespace minsh
