#ifndef reflow_environment_map_hpp
#define reflow_environment_map_hpp

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace reflow {

using environment_map = std::map<std::string, std::string>;

auto operator<<(std::ostream& os, const environment_map& value)
    -> std::ostream&;

/// @brief Gets the calling process's environment.
auto get_environ() -> environment_map;

/// @brief Gets the value of the named variable if set and non-empty.
auto find_value(const environment_map& env, const std::string& name)
    -> std::optional<std::string>;

/// @note This is NOT an "async-signal-safe" function. So, it's not suitable
/// for forked child to call.
/// @see https://man7.org/linux/man-pages/man7/signal-safety.7.html
auto make_arg_bufs(const environment_map& envars)
    -> std::vector<std::string>;

/// @brief Finds the given file within the colon separated directory list.
/// @return Path to the first regular file found that's executable by the
///   caller, or empty if none found.
auto find_file(const std::filesystem::path& file, std::string_view path)
    -> std::optional<std::filesystem::path>;

}

#endif /* reflow_environment_map_hpp */
