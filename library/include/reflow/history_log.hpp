#ifndef reflow_history_log_hpp
#define reflow_history_log_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace reflow {

/// @brief Ordered log of submitted commands with a navigation cursor.
/// @note The cursor sits between entries, from just before the first to
///   just past the last. Moving it is clamped at both ends, never wraps,
///   and entries are never removed.
struct history_log
{
    /// @brief Adds the command to the end and moves the cursor just past it.
    auto append(std::string command) -> void;

    /// @brief Moves the cursor back over one entry.
    /// @return Entry moved over, or the first entry if already before it.
    ///   Empty if the log is.
    auto prev() -> std::optional<std::string>;

    /// @brief Moves the cursor forward over one entry.
    /// @return Entry moved over, or the last entry if already past it.
    ///   Empty if the log is.
    auto next() -> std::optional<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return entries.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return entries.empty();
    }

    /// @brief Entry at the given position.
    /// @throws std::out_of_range if there's no such entry.
    [[nodiscard]] auto at(std::size_t position) const -> const std::string&
    {
        return entries.at(position);
    }

    /// @brief Position of the cursor, from 0 to <code>size()</code>.
    [[nodiscard]] auto cursor() const noexcept -> std::size_t
    {
        return position;
    }

private:
    std::vector<std::string> entries;
    std::size_t position{};
};

auto operator<<(std::ostream& os, const history_log& value) -> std::ostream&;

}

#endif /* reflow_history_log_hpp */
