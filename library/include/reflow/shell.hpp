#ifndef reflow_shell_hpp
#define reflow_shell_hpp

#include <filesystem>
#include <stdexcept> // for std::runtime_error
#include <string>
#include <vector>

#include "reflow/environment_map.hpp"

namespace reflow {

struct shell_not_found: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// @brief Names of shells probed for in <code>PATH</code>, most preferred
///   first, when <code>SHELL</code> isn't usable.
auto fallback_shells() -> const std::vector<std::string>&;

/// @brief Resolves the interpreter used to run commands.
/// @note A non-empty <code>SHELL</code> wins. If it names a bare file, it's
///   looked up in <code>PATH</code>. Otherwise <code>PATH</code> is probed
///   for each of <code>fallback_shells()</code> in order.
/// @throws shell_not_found if no interpreter can be resolved.
auto resolve_shell(const environment_map& env) -> std::filesystem::path;

/// @brief Makes the argument vector for running the given command line
///   through the given shell.
auto make_shell_arguments(const std::filesystem::path& shell,
                          const std::string& command)
    -> std::vector<std::string>;

}

#endif /* reflow_shell_hpp */
