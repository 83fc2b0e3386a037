#include "rro/platform.hpp"

#include <sstream>

namespace rro {

std::vector<std::string> split_search_path(const std::string& path_env) {
    std::vector<std::string> dirs;
    std::string current;
    std::istringstream ss(path_env);
    while (std::getline(ss, current, ':')) {
        if (!current.empty()) {
            dirs.push_back(current);
        }
    }
    return dirs;
}

std::optional<std::string> find_in_search_path(const std::string& name,
                                               const std::string& path_env) {
    for (const auto& dir : split_search_path(path_env)) {
        std::string candidate = join_path(dir, name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_executable(const std::string& name) {
    auto path_env = get_env("PATH");
    if (!path_env || path_env->empty()) {
        return std::nullopt;
    }
    return find_in_search_path(name, *path_env);
}

} // namespace rro
