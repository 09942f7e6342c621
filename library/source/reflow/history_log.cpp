#include <iomanip> // for std::quoted
#include <utility> // for std::move

#include "reflow/history_log.hpp"

namespace reflow {

auto history_log::append(std::string command) -> void
{
    entries.push_back(std::move(command));
    position = entries.size();
}

auto history_log::prev() -> std::optional<std::string>
{
    if (entries.empty()) {
        return {};
    }
    if (position > 0u) {
        --position;
    }
    return entries[position];
}

auto history_log::next() -> std::optional<std::string>
{
    if (entries.empty()) {
        return {};
    }
    if (position >= entries.size()) {
        return entries.back();
    }
    return entries[position++];
}

auto operator<<(std::ostream& os, const history_log& value) -> std::ostream&
{
    os << "{";
    auto prefix = "";
    for (auto i = std::size_t{}; i < value.size(); ++i) {
        os << prefix;
        if (i == value.cursor()) {
            os << "^";
        }
        os << std::quoted(value.at(i));
        prefix = ",";
    }
    if (value.cursor() == value.size()) {
        os << "^";
    }
    os << "}";
    return os;
}

}
