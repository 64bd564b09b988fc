#pragma once

#include <optional>
#include <string_view>

namespace minsh {

struct ShellOptions {
    bool trace{false};

    // Reads MINSH_DEBUG. Unset or unrecognised values leave tracing off.
    [[nodiscard]] static ShellOptions from_environment();

    [[nodiscard]] static std::optional<bool> parse_switch(std::string_view value);
};

} // namespace minsh
