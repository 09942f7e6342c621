#include <unistd.h> // for ::access

#include <cstring> // for std::strchr
#include <system_error> // for std::error_code
#include <utility> // for std::move

#include "reflow/environment_map.hpp"

extern char **environ; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

namespace reflow {

namespace {

constexpr auto env_separator = '=';
constexpr auto path_delimiter = ':';

auto is_executable_file(const std::filesystem::path& path) -> bool
{
    auto ec = std::error_code{};
    return is_regular_file(path, ec) && !ec
        && (::access(path.c_str(), X_OK) == 0);
}

}

auto operator<<(std::ostream& os, const environment_map& value)
    -> std::ostream&
{
    os << "{";
    auto prefix = "";
    for (auto&& entry: value) {
        os << prefix << entry.first << env_separator << entry.second;
        prefix = ",";
    }
    os << "}";
    return os;
}

auto get_environ() -> environment_map
{
    environment_map result;
    for (auto env = ::environ; env && *env; ++env) {
        const auto found = std::strchr(*env, env_separator);
        const auto name = found? std::string{*env, found}: std::string{*env};
        const auto value = found? std::string{found + 1}: std::string{};
        result[name] = value;
    }
    return result;
}

auto find_value(const environment_map& env, const std::string& name)
    -> std::optional<std::string>
{
    if (const auto it = env.find(name); it != env.end()) {
        if (!it->second.empty()) {
            return it->second;
        }
    }
    return {};
}

auto make_arg_bufs(const environment_map& envars)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    for (const auto& entry: envars) {
        auto string = entry.first;
        string += env_separator;
        string += entry.second;
        result.push_back(std::move(string));
    }
    return result;
}

auto find_file(const std::filesystem::path& file, std::string_view path)
    -> std::optional<std::filesystem::path>
{
    auto last = std::size_t{};
    for (;;) {
        const auto next = path.find(path_delimiter, last);
        const auto dir = path.substr(last, (next == std::string_view::npos)?
                                     std::string_view::npos: next - last);
        if (!dir.empty()) {
            const auto full_path = std::filesystem::path{dir} / file;
            if (is_executable_file(full_path)) {
                return full_path;
            }
        }
        if (next == std::string_view::npos) {
            break;
        }
        last = next + 1u;
    }
    return {};
}

}
