#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream

#include "reflow/shell.hpp"

namespace reflow {

namespace {

constexpr auto shell_env_name = "SHELL";
constexpr auto path_env_name = "PATH";
constexpr auto command_option = "-c";

}

auto fallback_shells() -> const std::vector<std::string>&
{
    static const auto shells = std::vector<std::string>{"bash", "sh"};
    return shells;
}

auto resolve_shell(const environment_map& env) -> std::filesystem::path
{
    const auto path = find_value(env, path_env_name).value_or("");
    if (const auto shell = find_value(env, shell_env_name)) {
        const auto shell_path = std::filesystem::path{*shell};
        if (shell_path.has_parent_path()) {
            return shell_path;
        }
        if (const auto found = find_file(shell_path, path)) {
            return *found;
        }
        std::ostringstream os;
        os << "shell " << std::quoted(*shell) << " not found in PATH";
        throw shell_not_found{os.str()};
    }
    for (auto&& name: fallback_shells()) {
        if (const auto found = find_file(name, path)) {
            return *found;
        }
    }
    throw shell_not_found{"shell not found"};
}

auto make_shell_arguments(const std::filesystem::path& shell,
                          const std::string& command)
    -> std::vector<std::string>
{
    return {shell.string(), command_option, command};
}

}
