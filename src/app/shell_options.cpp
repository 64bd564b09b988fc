#include "app/shell_options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace minsh {

ShellOptions ShellOptions::from_environment() {
    ShellOptions options;

    if (const char *debug = std::getenv("MINSH_DEBUG"); debug != nullptr) {
        options.trace = parse_switch(debug).value_or(false);
    }

    return options;
}

std::optional<bool> ShellOptions::parse_switch(std::string_view value) {
    std::string lowered(value);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "on" || lowered == "true" || lowered == "1") {
        return true;
    }

    if (lowered.empty() || lowered == "off" || lowered == "false" || lowered == "0") {
        return false;
    }

    return std::nullopt;
}

} // namespace minsh
