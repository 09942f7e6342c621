#ifndef reflow_wait_status_hpp
#define reflow_wait_status_hpp

#include <compare> // for std::strong_ordering
#include <concepts> // for std::regular.
#include <ostream>

#include "reflow/variant.hpp" // for <variant>, reflow::variant, + ostream support

namespace reflow {

/// @brief Status of a child that hasn't been reaped (yet).
struct wait_unknown_status {
    constexpr auto operator<=>(const wait_unknown_status&) const noexcept = default;
};

auto operator<<(std::ostream& os, const wait_unknown_status& value)
    -> std::ostream&;

/// @brief The child exited on its own with the given code.
struct wait_exit_status {
    int value{};
    constexpr auto operator<=>(const wait_exit_status& other) const = default;
};

auto operator<<(std::ostream& os, const wait_exit_status& value)
    -> std::ostream&;

/// @brief The child was terminated by the given signal.
struct wait_signaled_status {
    int signal{};
    bool core_dumped{};
    constexpr auto operator<=>(const wait_signaled_status& other) const = default;
};

auto operator<<(std::ostream& os, const wait_signaled_status& value)
    -> std::ostream&;

/// @note Stop and continue notifications aren't asked for, so children are
///   only ever seen as not reaped yet, exited, or signaled.
using wait_status = variant<
    wait_unknown_status,
    wait_exit_status,
    wait_signaled_status
>;

static_assert(std::regular<wait_status>);

/// @brief Whether the status is one a process can never leave.
constexpr auto is_terminal(const wait_status& status) noexcept -> bool
{
    return !std::holds_alternative<wait_unknown_status>(status);
}

/// @brief Decodes a status word as reported by <code>waitpid</code>.
auto to_wait_status(int status) noexcept -> wait_status;

}

#endif /* reflow_wait_status_hpp */
