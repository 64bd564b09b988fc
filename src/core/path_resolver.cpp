#include "core/path_resolver.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace minsh {

namespace fs = std::filesystem;

std::optional<ResolvedExecutable> PathResolver::find_command(std::string_view command) const {
    if (command.empty()) {
        return std::nullopt;
    }

    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    // Split by hand so that a trailing ':' still yields an empty entry.
    const std::string_view path_list(path_env);
    for (std::size_t start = 0; start <= path_list.size();) {
        const std::size_t end = std::min(path_list.find(':', start), path_list.size());
        const std::string dir(path_list.substr(start, end - start));
        start = end + 1;

        std::error_code ec;

        // An empty entry stands for the current directory.
        fs::path candidate = dir.empty() ? fs::current_path(ec) : fs::path(dir);
        if (ec) {
            continue;
        }
        candidate /= command;

        if (!fs::is_regular_file(candidate, ec) || ec) {
            continue;
        }

        const fs::path absolute = fs::absolute(candidate, ec);
        if (ec) {
            continue;
        }

        return ResolvedExecutable(absolute.string());
    }

    return std::nullopt;
}

} // namespace minsh
