#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace minsh {

class Tokenizer {
  public:
    // Splits one line (without its trailing newline) into words. Quote
    // characters are consumed; an unterminated quote runs to end of line.
    [[nodiscard]] std::vector<std::string> tokenize(std::string_view input) const;
};

} // namespace minsh
