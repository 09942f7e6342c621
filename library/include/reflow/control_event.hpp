#ifndef reflow_control_event_hpp
#define reflow_control_event_hpp

#include <ostream>
#include <string>

#include "reflow/variant.hpp" // for <variant>, reflow::variant, plus ostream support

namespace reflow {

struct submit_event {
    std::string text;
    auto operator<=>(const submit_event&) const = default;
};

struct navigate_prev_event {
    constexpr auto operator<=>(const navigate_prev_event&) const noexcept =
        default;
};

struct navigate_next_event {
    constexpr auto operator<=>(const navigate_next_event&) const noexcept =
        default;
};

struct quit_event {
    constexpr auto operator<=>(const quit_event&) const noexcept = default;
};

auto operator<<(std::ostream& os, const submit_event& value)
    -> std::ostream&;
auto operator<<(std::ostream& os, const navigate_prev_event&)
    -> std::ostream&;
auto operator<<(std::ostream& os, const navigate_next_event&)
    -> std::ostream&;
auto operator<<(std::ostream& os, const quit_event&)
    -> std::ostream&;

/// @brief Control events handled by the run coordinator.
using control_event = variant<
    submit_event,
    navigate_prev_event,
    navigate_next_event,
    quit_event
>;

}

#endif /* reflow_control_event_hpp */
